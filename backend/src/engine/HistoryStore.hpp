#pragma once

#include "engine/Types.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace rt::storage
{
class Database;
}

namespace rt::engine
{

class EventBus;

inline constexpr char const kDefaultHistoryNamespace[] = "download_history_v2";

// Durable list of download records, newest first. Every mutation is written
// through to the database before returning and then announced with a
// HistoryChangedEvent. If a write fails the in-memory list stays
// authoritative and the next successful write persists it.
class HistoryStore
{
  public:
    HistoryStore(storage::Database *database, EventBus *bus,
                 std::string ns = kDefaultHistoryNamespace);
    HistoryStore(HistoryStore const &) = delete;
    HistoryStore &operator=(HistoryStore const &) = delete;

    // Inserts at the front, or merges into the existing record for the id.
    // On merge, completed_at only changes when the new status is Completed,
    // and optional fields only change when the new record carries a value.
    // Returns whether the write reached the database.
    bool upsert(HistoryRecord const &record);
    std::vector<HistoryRecord> list() const;
    std::optional<HistoryRecord> find(std::string const &id) const;
    bool remove_one(std::string const &id);
    bool clear_all();

    std::string const &ns() const noexcept { return ns_; }

  private:
    void load();
    // Caller holds mutex_. Returns the error text, empty on success.
    std::string persist_locked();
    void announce(std::string const &error) const;

    storage::Database *database_ = nullptr;
    EventBus *bus_ = nullptr;
    std::string ns_;
    mutable std::mutex mutex_;
    std::vector<HistoryRecord> records_;
};

} // namespace rt::engine
