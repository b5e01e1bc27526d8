#include "engine/DownloadManager.hpp"
#include "engine/EventBus.hpp"
#include "engine/Events.hpp"
#include "engine/HistoryStore.hpp"
#include "utils/StateStore.hpp"

#include "TestSupport.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <doctest/doctest.h>

using namespace std::chrono_literals;
using rt::engine::DownloadManager;
using rt::engine::EngineCounters;
using rt::engine::EventBus;
using rt::engine::HistoryStatus;
using rt::engine::HistoryStore;
using rt::engine::ResultCode;
using rt::engine::TransferStatus;
using rt::test::FakeEngine;
using rt::test::kHashA;
using rt::test::kHashB;
using rt::test::magnet_for;

namespace
{

class RecordingPublisher final : public rt::engine::StreamPublisher
{
  public:
    std::shared_ptr<rt::engine::StreamEndpoint>
    publish(std::shared_ptr<rt::engine::TransferHandle> handle,
            rt::engine::EngineFile const &file) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        published_.push_back(file);
        rt::engine::StreamLocator locator;
        locator.host = "127.0.0.1";
        locator.port = 8080;
        locator.path = "/stream/" + handle->id() + "/token";
        return std::make_shared<FixedEndpoint>(std::move(locator));
    }

    void revoke(std::string const &transfer_id) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        revoked_.push_back(transfer_id);
    }

    std::vector<rt::engine::EngineFile> published() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return published_;
    }

    std::vector<std::string> revoked() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return revoked_;
    }

  private:
    class FixedEndpoint final : public rt::engine::StreamEndpoint
    {
      public:
        explicit FixedEndpoint(rt::engine::StreamLocator locator)
            : locator_(std::move(locator))
        {
        }

        rt::engine::StreamLocator const &locator() const noexcept override
        {
            return locator_;
        }

      private:
        rt::engine::StreamLocator locator_;
    };

    mutable std::mutex mutex_;
    std::vector<rt::engine::EngineFile> published_;
    std::vector<std::string> revoked_;
};

rt::engine::ManagerSettings make_settings(std::chrono::milliseconds poll,
                                         std::chrono::milliseconds operation)
{
    rt::engine::ManagerSettings settings;
    settings.poll_interval = poll;
    settings.engine_start_timeout = 2s;
    settings.operation_timeout = operation;
    return settings;
}

// Owns a manager wired to a fake engine and a manual clock. The default poll
// interval is long enough that ticks only happen through
// poll_now_for_testing().
struct ManagerHarness
{
    explicit ManagerHarness(std::string_view tag,
                            std::chrono::milliseconds poll = 1h,
                            std::chrono::milliseconds operation = 5s)
        : root(rt::test::make_temp_root(tag)), db(root / "state.db"),
          history(&db, &bus),
          manager(&engine, &history, &bus, &publisher,
                  make_settings(poll, operation),
                  [this] { return clock.now(); })
    {
    }

    ~ManagerHarness()
    {
        manager.stop();
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
    }

    bool start()
    {
        manager.start();
        return rt::test::wait_until([this] { return manager.engine_ready(); });
    }

    std::string add(std::string const &hash)
    {
        auto result = manager.add(magnet_for(hash));
        REQUIRE(result.ok());
        REQUIRE(result.transfer);
        return result.transfer->id;
    }

    rt::engine::Transfer tick_and_get(std::string const &id)
    {
        REQUIRE(manager.poll_now_for_testing());
        auto transfer = manager.get(id);
        REQUIRE(transfer);
        return *transfer;
    }

    std::filesystem::path root;
    rt::storage::Database db;
    EventBus bus;
    HistoryStore history;
    FakeEngine engine;
    RecordingPublisher publisher;
    rt::test::ManualClock clock;
    DownloadManager manager;
};

EngineCounters downloading(std::uint64_t bytes, std::uint64_t rate = 2048,
                           int peers = 5)
{
    EngineCounters counters;
    counters.ready = true;
    counters.name = "Big.Buck.Bunny";
    counters.bytes_downloaded = bytes;
    counters.total_bytes = 10'000;
    counters.download_rate = rate;
    counters.peer_count = peers;
    counters.progress = static_cast<double>(bytes) / 10'000.0;
    return counters;
}

} // namespace

TEST_CASE("DownloadManager add is idempotent per content id")
{
    ManagerHarness harness("manager-idempotent");
    REQUIRE(harness.start());
    std::atomic<int> added{0};
    harness.bus.subscribe<rt::engine::TransferAddedEvent>(
        [&](rt::engine::TransferAddedEvent const &) { ++added; });

    auto first = harness.manager.add(magnet_for(kHashA), "Bunny", "ext-1");
    REQUIRE(first.ok());
    REQUIRE(first.transfer);
    CHECK(first.transfer->id == kHashA);
    CHECK(first.transfer->status == TransferStatus::Metadata);
    CHECK(first.transfer->display_name == std::optional<std::string>("Bunny"));
    CHECK(first.transfer->added_at == harness.clock.now());

    harness.clock.advance(5s);
    auto again = harness.manager.add(magnet_for(kHashA));
    REQUIRE(again.ok());
    CHECK(again.transfer->id == kHashA);
    CHECK(again.transfer->added_at == first.transfer->added_at);

    std::string upper = kHashA;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char ch)
                   { return static_cast<char>(std::toupper(ch)); });
    CHECK(harness.manager.add(upper).ok());

    CHECK(harness.engine.start_calls() == 1);
    CHECK(harness.manager.list().size() == 1);
    CHECK(added.load() == 1);

    auto records = harness.history.list();
    REQUIRE(records.size() == 1);
    CHECK(records.front().id == kHashA);
    CHECK(records.front().status == HistoryStatus::Active);
    CHECK(records.front().display_name == "Bunny");
    CHECK(records.front().external_id == std::optional<std::string>("ext-1"));
}

TEST_CASE("DownloadManager rejects locators the engine cannot parse")
{
    ManagerHarness harness("manager-invalid");
    REQUIRE(harness.start());

    auto result = harness.manager.add("http://example.com/not-a-transfer");
    CHECK(result.code == ResultCode::InvalidLocator);
    CHECK_FALSE(result.transfer);
    CHECK(harness.manager.list().empty());
    CHECK(harness.history.list().empty());
    CHECK(harness.engine.start_calls() == 0);
}

TEST_CASE("DownloadManager reports EngineUnavailable when the engine refuses")
{
    ManagerHarness harness("manager-refused");
    REQUIRE(harness.start());
    harness.engine.refuse_transfers = true;

    auto result = harness.manager.add(magnet_for(kHashA));
    CHECK(result.code == ResultCode::EngineUnavailable);
    CHECK_FALSE(result.message.empty());
    CHECK(harness.manager.list().empty());
    CHECK(harness.history.list().empty());
}

TEST_CASE("DownloadManager reports EngineUnavailable when the engine fails to start")
{
    ManagerHarness harness("manager-start-failed");
    harness.engine.fail_start = true;
    harness.manager.start();

    auto result = harness.manager.add(magnet_for(kHashA));
    CHECK(result.code == ResultCode::EngineUnavailable);
    CHECK_FALSE(harness.manager.engine_ready());
    CHECK(harness.history.list().empty());
}

TEST_CASE("DownloadManager waits a bounded time for a slow engine")
{
    SUBCASE("start finishes within the timeout")
    {
        ManagerHarness harness("manager-slow-start");
        harness.engine.start_delay = 200ms;
        harness.manager.start();
        CHECK(harness.manager.add(magnet_for(kHashA)).ok());
    }
    SUBCASE("start outlasts the timeout")
    {
        ManagerHarness harness("manager-stuck-start");
        harness.engine.start_delay = 2500ms;
        harness.manager.start();
        auto result = harness.manager.add(magnet_for(kHashA));
        CHECK(result.code == ResultCode::EngineUnavailable);
    }
}

TEST_CASE("DownloadManager follows a transfer from metadata to done")
{
    ManagerHarness harness("manager-lifecycle");
    REQUIRE(harness.start());
    std::atomic<int> done_events{0};
    std::atomic<int> progress_events{0};
    harness.bus.subscribe<rt::engine::TransferDoneEvent>(
        [&](rt::engine::TransferDoneEvent const &) { ++done_events; });
    harness.bus.subscribe<rt::engine::TransferProgressEvent>(
        [&](rt::engine::TransferProgressEvent const &) { ++progress_events; });

    auto id = harness.add(kHashA);
    auto handle = harness.engine.handle(id);
    REQUIRE(handle);

    auto transfer = harness.tick_and_get(id);
    CHECK(transfer.status == TransferStatus::Metadata);
    CHECK(progress_events.load() == 1);

    harness.clock.advance(1s);
    handle->set_counters(downloading(2'500));
    transfer = harness.tick_and_get(id);
    CHECK(transfer.status == TransferStatus::Downloading);
    CHECK(transfer.bytes_downloaded == 2'500);
    CHECK(transfer.total_bytes == std::optional<std::uint64_t>(10'000));
    CHECK(transfer.peer_count == 5);
    CHECK(transfer.name == "Big.Buck.Bunny");
    CHECK(transfer.last_progress_at == harness.clock.now());
    CHECK_FALSE(transfer.degraded_reason);

    harness.clock.advance(1s);
    auto finished = downloading(10'000, 0, 2);
    finished.done = true;
    finished.progress = 1.0;
    handle->set_counters(finished);
    auto const completed_at = harness.clock.now();
    transfer = harness.tick_and_get(id);
    CHECK(transfer.status == TransferStatus::Done);
    CHECK(done_events.load() == 1);

    auto record = harness.history.find(id);
    REQUIRE(record);
    CHECK(record->status == HistoryStatus::Completed);
    CHECK(record->completed_at == completed_at);
    CHECK(record->size_bytes == std::optional<std::uint64_t>(10'000));
    CHECK(record->display_name == "Big.Buck.Bunny");

    harness.clock.advance(1s);
    finished.upload_rate = 4096;
    handle->set_counters(finished);
    transfer = harness.tick_and_get(id);
    CHECK(transfer.status == TransferStatus::Seeding);
    harness.clock.advance(1s);
    REQUIRE(harness.manager.poll_now_for_testing());

    CHECK(done_events.load() == 1);
    CHECK(harness.history.find(id)->completed_at == completed_at);
    CHECK(progress_events.load() == 5);
}

TEST_CASE("DownloadManager starts the stall clock when metadata arrives")
{
    ManagerHarness harness("manager-slow-metadata");
    REQUIRE(harness.start());
    auto id = harness.add(kHashA);
    auto handle = harness.engine.handle(id);

    for (int i = 0; i < 4; ++i)
    {
        harness.clock.advance(10s);
        CHECK(harness.tick_and_get(id).status == TransferStatus::Metadata);
    }

    handle->set_counters(downloading(0, 0, 3));
    auto transfer = harness.tick_and_get(id);
    CHECK(transfer.status == TransferStatus::Downloading);
    CHECK(transfer.last_progress_at == harness.clock.now());
    CHECK(harness.history.find(id)->status == HistoryStatus::Active);

    harness.clock.advance(29s);
    CHECK(harness.tick_and_get(id).status == TransferStatus::Downloading);
    harness.clock.advance(2s);
    CHECK(harness.tick_and_get(id).status == TransferStatus::Stalled);
}

TEST_CASE("DownloadManager records stalls and recovery in history")
{
    ManagerHarness harness("manager-stall");
    REQUIRE(harness.start());
    auto id = harness.add(kHashA);
    auto handle = harness.engine.handle(id);

    handle->set_counters(downloading(100, 0, 2));
    auto transfer = harness.tick_and_get(id);
    CHECK(transfer.status == TransferStatus::Downloading);

    harness.clock.advance(29s);
    CHECK(harness.tick_and_get(id).status == TransferStatus::Downloading);

    harness.clock.advance(2s);
    transfer = harness.tick_and_get(id);
    CHECK(transfer.status == TransferStatus::Stalled);
    REQUIRE(transfer.degraded_reason);
    CHECK_FALSE(transfer.degraded_reason->empty());
    CHECK(harness.history.find(id)->status == HistoryStatus::Stalled);

    harness.clock.advance(1s);
    handle->set_counters(downloading(300, 1024, 2));
    transfer = harness.tick_and_get(id);
    CHECK(transfer.status == TransferStatus::Downloading);
    CHECK_FALSE(transfer.degraded_reason);
    CHECK(harness.history.find(id)->status == HistoryStatus::Active);
}

TEST_CASE("DownloadManager reports no peers once the timeout passes")
{
    ManagerHarness harness("manager-no-peers");
    REQUIRE(harness.start());
    auto id = harness.add(kHashA);
    auto handle = harness.engine.handle(id);
    handle->set_counters(downloading(0, 0, 0));

    harness.clock.advance(59s);
    CHECK(harness.tick_and_get(id).status == TransferStatus::Downloading);

    harness.clock.advance(2s);
    auto transfer = harness.tick_and_get(id);
    CHECK(transfer.status == TransferStatus::NoPeers);
    REQUIRE(transfer.degraded_reason);
    CHECK_FALSE(transfer.degraded_reason->empty());
    CHECK(harness.history.find(id)->status == HistoryStatus::Stalled);
}

TEST_CASE("DownloadManager drops a call that timed out before it ran")
{
    ManagerHarness harness("manager-timeout", 1h, 300ms);
    REQUIRE(harness.start());

    // Holds the actor inside the added handler of the first transfer.
    std::promise<void> release;
    auto released = release.get_future().share();
    std::atomic<bool> blocking{false};
    harness.bus.subscribe<rt::engine::TransferAddedEvent>(
        [&, released](rt::engine::TransferAddedEvent const &event)
        {
            if (event.transfer.id == kHashA)
            {
                blocking = true;
                released.wait_for(5s);
            }
        });

    auto first = std::async(std::launch::async,
                            [&] { return harness.manager.add(magnet_for(kHashA)); });
    REQUIRE(rt::test::wait_until([&] { return blocking.load(); }));

    auto second = harness.manager.add(magnet_for(kHashB));
    CHECK(second.code == ResultCode::EngineUnavailable);
    CHECK_FALSE(second.transfer);

    release.set_value();
    // Already running when its wait expired, so the caller gets the outcome.
    auto first_result = first.get();
    CHECK(first_result.ok());

    REQUIRE(harness.manager.poll_now_for_testing());
    CHECK_FALSE(harness.manager.get(kHashB));
    CHECK_FALSE(harness.history.find(kHashB));
    CHECK(harness.engine.start_calls() == 1);
    CHECK(harness.manager.list().size() == 1);

    auto retried = harness.manager.add(magnet_for(kHashB));
    CHECK(retried.ok());
    CHECK(harness.manager.get(kHashB));
}

TEST_CASE("DownloadManager remove then add starts a fresh transfer")
{
    ManagerHarness harness("manager-readd");
    REQUIRE(harness.start());
    std::vector<std::string> removed;
    std::mutex removed_mutex;
    harness.bus.subscribe<rt::engine::TransferRemovedEvent>(
        [&](rt::engine::TransferRemovedEvent const &event)
        {
            std::lock_guard<std::mutex> lock(removed_mutex);
            removed.push_back(event.id);
        });

    auto id = harness.add(kHashA);
    auto original_added = harness.history.find(id)->added_at;

    CHECK(harness.manager.remove(id));
    CHECK_FALSE(harness.manager.get(id));
    CHECK(harness.manager.list().empty());
    CHECK(harness.engine.remove_calls() == 1);
    auto revoked = harness.publisher.revoked();
    CHECK(std::find(revoked.begin(), revoked.end(), id) != revoked.end());
    {
        std::lock_guard<std::mutex> lock(removed_mutex);
        REQUIRE(removed.size() == 1);
        CHECK(removed.front() == id);
    }
    CHECK(harness.history.find(id)->status == HistoryStatus::Removed);

    CHECK_FALSE(harness.manager.remove(id));
    CHECK(harness.engine.remove_calls() == 1);

    harness.clock.advance(10min);
    auto again = harness.manager.add(magnet_for(kHashA));
    REQUIRE(again.ok());
    CHECK(again.transfer->added_at == harness.clock.now());
    CHECK(again.transfer->status == TransferStatus::Metadata);
    CHECK(harness.engine.start_calls() == 2);

    auto records = harness.history.list();
    REQUIRE(records.size() == 1);
    CHECK(records.front().status == HistoryStatus::Active);
    CHECK(records.front().added_at == original_added);
}

TEST_CASE("DownloadManager redownload re-adds a history entry")
{
    ManagerHarness harness("manager-redownload");
    REQUIRE(harness.start());
    auto id = harness.add(kHashB);
    REQUIRE(harness.manager.remove(id));

    auto result = harness.manager.redownload(id);
    REQUIRE(result.ok());
    CHECK(result.transfer->id == id);
    CHECK(harness.manager.list().size() == 1);

    CHECK(harness.manager.redownload("unknown").code ==
          ResultCode::InvalidLocator);
}

TEST_CASE("DownloadManager keeps a removal made from an event handler")
{
    ManagerHarness harness("manager-reentrant");
    REQUIRE(harness.start());
    harness.bus.subscribe<rt::engine::TransferDoneEvent>(
        [&](rt::engine::TransferDoneEvent const &event)
        { harness.manager.remove(event.transfer.id); });

    auto id = harness.add(kHashA);
    auto finished = downloading(10'000, 0);
    finished.done = true;
    harness.engine.handle(id)->set_counters(finished);

    REQUIRE(harness.manager.poll_now_for_testing());
    CHECK_FALSE(harness.manager.get(id));
    auto record = harness.history.find(id);
    REQUIRE(record);
    CHECK(record->status == HistoryStatus::Removed);
    CHECK(record->completed_at);

    REQUIRE(harness.manager.poll_now_for_testing());
    CHECK(harness.history.find(id)->status == HistoryStatus::Removed);
}

TEST_CASE("DownloadManager never reports a transfer after its removal")
{
    ManagerHarness harness("manager-concurrent", 5ms);
    REQUIRE(harness.start());
    auto a = harness.add(kHashA);
    auto b = harness.add(kHashB);
    harness.engine.handle(a)->set_counters(downloading(1'000));
    harness.engine.handle(b)->set_counters(downloading(1'000));

    // Both handlers run on the manager's actor thread.
    bool a_removed = false;
    std::atomic<int> late_progress{0};
    std::atomic<int> b_progress{0};
    harness.bus.subscribe<rt::engine::TransferRemovedEvent>(
        [&](rt::engine::TransferRemovedEvent const &event)
        {
            if (event.id == a)
            {
                a_removed = true;
            }
        });
    harness.bus.subscribe<rt::engine::TransferProgressEvent>(
        [&](rt::engine::TransferProgressEvent const &event)
        {
            if (event.transfer.id == a && a_removed)
            {
                ++late_progress;
            }
            if (event.transfer.id == b)
            {
                ++b_progress;
            }
        });

    REQUIRE(rt::test::wait_until([&] { return b_progress.load() >= 3; }));
    std::atomic<bool> removed_ok{false};
    std::thread remover([&] { removed_ok = harness.manager.remove(a); });
    remover.join();
    CHECK(removed_ok.load());
    auto const seen = b_progress.load();
    REQUIRE(rt::test::wait_until([&] { return b_progress.load() >= seen + 3; }));

    CHECK(late_progress.load() == 0);
    CHECK_FALSE(harness.manager.get(a));
    CHECK(harness.manager.get(b));
    CHECK(harness.history.find(a)->status == HistoryStatus::Removed);
    CHECK(harness.engine.pump_calls.load() > 0);
}

TEST_CASE("DownloadManager marks engine faults as sticky errors")
{
    ManagerHarness harness("manager-fault");
    REQUIRE(harness.start());
    std::atomic<int> errors{0};
    std::string last_message;
    harness.bus.subscribe<rt::engine::TransferErrorEvent>(
        [&](rt::engine::TransferErrorEvent const &event)
        {
            last_message = event.message;
            ++errors;
        });

    auto id = harness.add(kHashA);
    harness.engine.handle(id)->set_counters(downloading(500));
    harness.engine.emit_fault(id, "disk full");
    harness.engine.emit_fault("ffffffffffffffffffffffffffffffffffffffff",
                              "ignored");

    REQUIRE(rt::test::wait_until(
        [&]
        {
            auto transfer = harness.manager.get(id);
            return transfer && transfer->status == TransferStatus::Error;
        }));
    auto transfer = harness.tick_and_get(id);
    CHECK(transfer.status == TransferStatus::Error);
    CHECK(transfer.last_error == std::optional<std::string>("disk full"));
    CHECK(transfer.bytes_downloaded == 500);

    harness.engine.emit_fault(id, "disk full");
    REQUIRE(harness.manager.poll_now_for_testing());
    CHECK(errors.load() == 1);
    CHECK(last_message == "disk full");

    auto record = harness.history.find(id);
    REQUIRE(record);
    CHECK(record->status == HistoryStatus::Error);
    CHECK(record->last_error == std::optional<std::string>("disk full"));
}

TEST_CASE("DownloadManager treats an engine error reading as a fault")
{
    ManagerHarness harness("manager-counter-error");
    REQUIRE(harness.start());
    auto id = harness.add(kHashA);
    auto counters = downloading(0);
    counters.error = "tracker rejected the transfer";
    harness.engine.handle(id)->set_counters(counters);

    auto transfer = harness.tick_and_get(id);
    CHECK(transfer.status == TransferStatus::Error);
    CHECK(harness.history.find(id)->status == HistoryStatus::Error);

    harness.engine.handle(id)->set_counters(downloading(100));
    CHECK(harness.tick_and_get(id).status == TransferStatus::Error);
}

TEST_CASE("DownloadManager pause and resume")
{
    ManagerHarness harness("manager-pause");
    REQUIRE(harness.start());
    auto id = harness.add(kHashA);
    auto handle = harness.engine.handle(id);
    handle->set_counters(downloading(0, 0, 2));
    CHECK(harness.tick_and_get(id).status == TransferStatus::Downloading);

    CHECK(harness.manager.pause(id));
    CHECK_FALSE(harness.manager.pause(id));
    CHECK(handle->pause_calls() == 1);
    CHECK(harness.history.find(id)->status == HistoryStatus::Paused);

    harness.clock.advance(2min);
    auto transfer = harness.tick_and_get(id);
    CHECK(transfer.status == TransferStatus::Paused);
    CHECK(transfer.paused);

    CHECK(harness.manager.resume(id));
    CHECK_FALSE(harness.manager.resume(id));
    CHECK(handle->resume_calls() == 1);
    CHECK(harness.history.find(id)->status == HistoryStatus::Active);

    // The paused minutes do not count as a stall.
    transfer = harness.tick_and_get(id);
    CHECK(transfer.status == TransferStatus::Downloading);
    CHECK_FALSE(transfer.paused);

    CHECK_FALSE(harness.manager.pause("unknown"));
    CHECK_FALSE(harness.manager.resume("unknown"));
}

TEST_CASE("DownloadManager streams the largest file once metadata is known")
{
    ManagerHarness harness("manager-stream");
    REQUIRE(harness.start());
    auto id = harness.add(kHashA);
    auto handle = harness.engine.handle(id);

    CHECK(harness.manager.stream_largest_file(id).code == ResultCode::NotReady);
    CHECK(harness.manager.stream_largest_file("unknown").code ==
          ResultCode::NotReady);
    CHECK(harness.publisher.published().empty());

    handle->add_file_entry("Show/info.nfo", 10);
    handle->add_file_entry("Show/episode.mkv", 700);
    handle->add_file_entry("Show/sample.mkv", 700);
    handle->add_file_entry("Show/extras.mp4", 50);

    auto result = harness.manager.stream_largest_file(id);
    REQUIRE(result.ok());
    REQUIRE(result.file);
    CHECK(result.file->path == "Show/episode.mkv");
    CHECK(result.file->index == 1);
    REQUIRE(result.endpoint);
    CHECK(result.endpoint->locator().url() ==
          "http://127.0.0.1:8080/stream/" + id + "/token");
    CHECK(harness.publisher.published().size() == 1);
}

TEST_CASE("DownloadManager without a publisher cannot stream")
{
    auto root = rt::test::make_temp_root("manager-no-publisher");
    {
        rt::storage::Database db(root / "state.db");
        EventBus bus;
        HistoryStore history(&db, &bus);
        FakeEngine engine;
        DownloadManager manager(&engine, &history, &bus, nullptr,
                                make_settings(1h, 5s));
        manager.start();
        auto added = manager.add(magnet_for(kHashA));
        REQUIRE(added.ok());
        engine.handle(kHashA)->add_file_entry("movie.mkv", 100);
        CHECK(manager.stream_largest_file(kHashA).code == ResultCode::NotReady);
    }
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
}

TEST_CASE("DownloadManager polls on its own schedule")
{
    ManagerHarness harness("manager-schedule", 20ms);
    REQUIRE(harness.start());
    auto id = harness.add(kHashA);
    harness.engine.handle(id)->set_counters(downloading(1'000));

    CHECK(rt::test::wait_until(
        [&]
        {
            auto transfer = harness.manager.get(id);
            return transfer && transfer->status == TransferStatus::Downloading;
        }));
    CHECK(harness.engine.pump_calls.load() > 0);
}

TEST_CASE("DownloadManager stop shuts the engine down and rejects calls")
{
    ManagerHarness harness("manager-stop");
    REQUIRE(harness.start());
    auto id = harness.add(kHashA);

    harness.manager.stop();
    CHECK_FALSE(harness.manager.is_running());
    CHECK(harness.engine.shut_down.load());
    auto revoked = harness.publisher.revoked();
    CHECK(std::find(revoked.begin(), revoked.end(), id) != revoked.end());

    CHECK(harness.manager.add(magnet_for(kHashB)).code ==
          ResultCode::EngineUnavailable);
    CHECK(harness.manager.list().empty());
    CHECK_FALSE(harness.manager.pause(id));
    CHECK_FALSE(harness.manager.poll_now_for_testing());
}
