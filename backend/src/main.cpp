#include "engine/ConfigurationService.hpp"
#include "engine/Core.hpp"
#include "engine/DownloadManager.hpp"
#include "engine/EventBus.hpp"
#include "engine/Events.hpp"
#include "utils/FS.hpp"
#include "utils/Log.hpp"
#include "utils/Shutdown.hpp"
#include "utils/StateStore.hpp"
#include "utils/Version.hpp"

#include <chrono>
#include <exception>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace
{

struct CommandLine
{
    std::optional<std::filesystem::path> data_dir;
    int run_seconds = 0;
    bool stream = false;
    std::vector<std::string> locators;
};

std::optional<int> parse_seconds(std::string const &value)
{
    try
    {
        return std::stoi(value);
    }
    catch (std::exception const &)
    {
        return std::nullopt;
    }
}

CommandLine parse_command_line(int argc, char *argv[])
{
    CommandLine options;
    for (int index = 1; index < argc; ++index)
    {
        if (argv[index] == nullptr)
        {
            continue;
        }
        std::string arg = argv[index];
        if (arg.rfind("--run-seconds=", 0) == 0)
        {
            options.run_seconds = parse_seconds(arg.substr(14)).value_or(5);
        }
        else if (arg == "--run-seconds")
        {
            if (index + 1 < argc && argv[index + 1] != nullptr &&
                argv[index + 1][0] != '-')
            {
                options.run_seconds = parse_seconds(argv[++index]).value_or(5);
            }
            else
            {
                options.run_seconds = 5;
            }
        }
        else if (arg.rfind("--data-dir=", 0) == 0)
        {
            options.data_dir = std::filesystem::path(arg.substr(11));
        }
        else if (arg == "--data-dir" && index + 1 < argc)
        {
            options.data_dir = std::filesystem::path(argv[++index]);
        }
        else if (arg == "--stream")
        {
            options.stream = true;
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            RT_LOG_WARN("ignoring unknown option {}", arg);
        }
        else
        {
            options.locators.push_back(std::move(arg));
        }
    }
    return options;
}

std::string label_of(rt::engine::Transfer const &transfer)
{
    if (transfer.display_name)
    {
        return *transfer.display_name;
    }
    return transfer.name.empty() ? transfer.id : transfer.name;
}

} // namespace

int main(int argc, char *argv[])
{
    try
    {
        rt::runtime::install_signal_handlers();
        auto options = parse_command_line(argc, argv);

        auto root = options.data_dir.value_or(rt::utils::data_root());
        if (!rt::utils::ensure_directory(root))
        {
            RT_LOG_ERROR("cannot create data directory {}", root.string());
            return 1;
        }
        rt::log::set_log_file(root / "reeltorrent.log");
        RT_LOG_INFO("{} starting; state in {}", rt::version::kDisplayVersion,
                    root.string());

        rt::engine::CoreSettings defaults;
        defaults.state_path = root / "reeltorrent.db";
        defaults.engine.download_path = (root / "downloads").string();
        rt::engine::CoreSettings settings;
        {
            rt::storage::Database db(defaults.state_path);
            rt::engine::ConfigurationService config(&db, defaults);
            settings = config.load();
        }

        auto core = rt::engine::Core::create(settings);
        auto &bus = core->events();
        auto &downloads = core->downloads();

        std::mutex endpoints_mutex;
        std::unordered_map<std::string,
                           std::shared_ptr<rt::engine::StreamEndpoint>>
            endpoints;

        std::vector<rt::engine::Subscription> subscriptions;
        subscriptions.emplace_back(
            &bus, bus.subscribe<rt::engine::TransferProgressEvent>(
                      [&](rt::engine::TransferProgressEvent const &event)
                      {
                          auto const &t = event.transfer;
                          RT_LOG_DEBUG(
                              "{} {} {:.1f}% down {} B/s up {} B/s peers {}",
                              label_of(t), rt::engine::to_string(t.status),
                              t.progress * 100.0, t.download_rate,
                              t.upload_rate, t.peer_count);
                          if (!options.stream ||
                              t.status == rt::engine::TransferStatus::Metadata)
                          {
                              return;
                          }
                          {
                              std::lock_guard<std::mutex> lock(endpoints_mutex);
                              if (endpoints.contains(t.id))
                              {
                                  return;
                              }
                          }
                          auto result = downloads.stream_largest_file(t.id);
                          if (!result.ok())
                          {
                              return;
                          }
                          rt::log::print_status(
                              "{}: streaming {} at {}", label_of(t),
                              result.file->path,
                              result.endpoint->locator().url());
                          std::lock_guard<std::mutex> lock(endpoints_mutex);
                          endpoints.emplace(t.id, std::move(result.endpoint));
                      }));
        subscriptions.emplace_back(
            &bus, bus.subscribe<rt::engine::TransferDoneEvent>(
                      [](rt::engine::TransferDoneEvent const &event)
                      {
                          rt::log::print_status("{}: download complete",
                                                label_of(event.transfer));
                      }));
        subscriptions.emplace_back(
            &bus, bus.subscribe<rt::engine::TransferErrorEvent>(
                      [](rt::engine::TransferErrorEvent const &event)
                      {
                          rt::log::print_status("{}: error: {}",
                                                label_of(event.transfer),
                                                event.message);
                      }));
        subscriptions.emplace_back(
            &bus, bus.subscribe<rt::engine::HistoryChangedEvent>(
                      [](rt::engine::HistoryChangedEvent const &event)
                      {
                          if (!event.persisted)
                          {
                              RT_LOG_WARN("history not saved: {}", event.error);
                          }
                      }));

        if (!core->start())
        {
            RT_LOG_WARN("streaming is unavailable for this session");
        }

        for (auto const &locator : options.locators)
        {
            auto result = downloads.add(locator);
            if (!result.ok())
            {
                RT_LOG_ERROR("cannot add {}: {} ({})", locator,
                             rt::engine::to_string(result.code),
                             result.message);
                continue;
            }
            rt::log::print_status("added {}", result.transfer->id);
        }

        auto const deadline =
            std::chrono::steady_clock::now() +
            std::chrono::seconds(options.run_seconds);
        rt::log::print_status("{} running; CTRL+C to stop.",
                              rt::version::kDisplayVersion);
        while (!rt::runtime::should_shutdown())
        {
            if (options.run_seconds > 0 &&
                std::chrono::steady_clock::now() >= deadline)
            {
                RT_LOG_INFO("run-seconds={} reached, shutting down",
                            options.run_seconds);
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        {
            std::lock_guard<std::mutex> lock(endpoints_mutex);
            endpoints.clear();
        }
        core->stop();
        subscriptions.clear();
        RT_LOG_INFO("shutdown complete");
        return 0;
    }
    catch (std::exception const &ex)
    {
        RT_LOG_ERROR("fatal: {}", ex.what());
        return 1;
    }
}
