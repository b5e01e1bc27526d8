#include "engine/HistoryStore.hpp"

#include "engine/EventBus.hpp"
#include "engine/Events.hpp"
#include "utils/Json.hpp"
#include "utils/Log.hpp"
#include "utils/StateStore.hpp"

#include <algorithm>
#include <utility>

#include <yyjson.h>

namespace rt::engine
{

namespace
{

std::optional<std::string> serialize(std::vector<HistoryRecord> const &records)
{
    json::MutableDocument doc;
    if (!doc.is_valid())
    {
        return std::nullopt;
    }
    auto *native = doc.doc();
    auto *root = yyjson_mut_arr(native);
    doc.set_root(root);
    for (auto const &record : records)
    {
        auto *entry = yyjson_mut_arr_add_obj(native, root);
        yyjson_mut_obj_add_strncpy(native, entry, "id", record.id.data(),
                                   record.id.size());
        yyjson_mut_obj_add_strncpy(native, entry, "contentLocator",
                                   record.content_locator.data(),
                                   record.content_locator.size());
        yyjson_mut_obj_add_strncpy(native, entry, "displayName",
                                   record.display_name.data(),
                                   record.display_name.size());
        if (record.external_id)
        {
            yyjson_mut_obj_add_strncpy(native, entry, "externalId",
                                       record.external_id->data(),
                                       record.external_id->size());
        }
        yyjson_mut_obj_add_sint(native, entry, "addedAt",
                                to_unix_millis(record.added_at));
        if (record.completed_at)
        {
            yyjson_mut_obj_add_sint(native, entry, "completedAt",
                                    to_unix_millis(*record.completed_at));
        }
        if (record.size_bytes)
        {
            yyjson_mut_obj_add_uint(native, entry, "sizeBytes",
                                    *record.size_bytes);
        }
        auto const status = to_string(record.status);
        yyjson_mut_obj_add_strncpy(native, entry, "status", status.data(),
                                   status.size());
        if (record.last_error)
        {
            yyjson_mut_obj_add_strncpy(native, entry, "lastError",
                                       record.last_error->data(),
                                       record.last_error->size());
        }
    }
    return doc.write();
}

std::optional<HistoryRecord> parse_record(yyjson_val *entry)
{
    if (entry == nullptr || !yyjson_is_obj(entry))
    {
        return std::nullopt;
    }
    auto id = json::string_field(entry, "id");
    auto status_text = json::string_field(entry, "status");
    if (!id || id->empty() || !status_text)
    {
        return std::nullopt;
    }
    auto status = parse_history_status(*status_text);
    if (!status)
    {
        return std::nullopt;
    }
    HistoryRecord record;
    record.id = std::move(*id);
    record.status = *status;
    record.content_locator =
        json::string_field(entry, "contentLocator").value_or(std::string{});
    record.display_name =
        json::string_field(entry, "displayName").value_or(record.id);
    record.external_id = json::string_field(entry, "externalId");
    if (auto added = json::int_field(entry, "addedAt"))
    {
        record.added_at = from_unix_millis(*added);
    }
    if (auto completed = json::int_field(entry, "completedAt"))
    {
        record.completed_at = from_unix_millis(*completed);
    }
    if (auto size = json::int_field(entry, "sizeBytes"); size && *size >= 0)
    {
        record.size_bytes = static_cast<std::uint64_t>(*size);
    }
    record.last_error = json::string_field(entry, "lastError");
    return record;
}

std::optional<std::vector<HistoryRecord>> parse(std::string const &payload)
{
    auto doc = json::Document::parse(payload);
    if (!doc.is_valid())
    {
        return std::nullopt;
    }
    auto *root = doc.root();
    if (root == nullptr || !yyjson_is_arr(root))
    {
        return std::nullopt;
    }
    std::vector<HistoryRecord> records;
    size_t idx, limit;
    yyjson_val *entry = nullptr;
    yyjson_arr_foreach(root, idx, limit, entry)
    {
        auto record = parse_record(entry);
        if (!record)
        {
            RT_LOG_WARN("skipping malformed history entry #{}", idx);
            continue;
        }
        auto duplicate = std::any_of(records.begin(), records.end(),
                                     [&](HistoryRecord const &existing)
                                     { return existing.id == record->id; });
        if (duplicate)
        {
            RT_LOG_WARN("skipping duplicate history entry {}", record->id);
            continue;
        }
        records.push_back(std::move(*record));
    }
    return records;
}

void merge_into(HistoryRecord &existing, HistoryRecord const &update)
{
    existing.status = update.status;
    if (update.status == HistoryStatus::Completed && update.completed_at)
    {
        existing.completed_at = update.completed_at;
    }
    if (update.last_error)
    {
        existing.last_error = update.last_error;
    }
    if (update.size_bytes)
    {
        existing.size_bytes = update.size_bytes;
    }
    if (!update.display_name.empty())
    {
        existing.display_name = update.display_name;
    }
    if (update.external_id && !update.external_id->empty())
    {
        existing.external_id = update.external_id;
    }
    if (!update.content_locator.empty())
    {
        existing.content_locator = update.content_locator;
    }
}

} // namespace

HistoryStore::HistoryStore(storage::Database *database, EventBus *bus,
                           std::string ns)
    : database_(database), bus_(bus), ns_(std::move(ns))
{
    load();
}

void HistoryStore::load()
{
    if (database_ == nullptr || !database_->is_valid())
    {
        RT_LOG_WARN("history store '{}' has no database; starting empty", ns_);
        return;
    }
    auto payload = database_->load_document(ns_);
    if (!payload)
    {
        RT_LOG_DEBUG("no persisted history under '{}'", ns_);
        return;
    }
    auto parsed = parse(*payload);
    if (!parsed)
    {
        RT_LOG_WARN("persisted history under '{}' is unreadable ({} bytes); "
                    "starting empty",
                    ns_, payload->size());
        return;
    }
    records_ = std::move(*parsed);
    RT_LOG_INFO("loaded {} history records", records_.size());
}

bool HistoryStore::upsert(HistoryRecord const &record)
{
    if (record.id.empty())
    {
        return false;
    }
    std::string error;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(records_.begin(), records_.end(),
                               [&](HistoryRecord const &existing)
                               { return existing.id == record.id; });
        if (it != records_.end())
        {
            merge_into(*it, record);
        }
        else
        {
            auto inserted = record;
            if (inserted.status != HistoryStatus::Completed)
            {
                inserted.completed_at.reset();
            }
            if (inserted.display_name.empty())
            {
                inserted.display_name = inserted.id;
            }
            records_.insert(records_.begin(), std::move(inserted));
        }
        error = persist_locked();
    }
    announce(error);
    return error.empty();
}

std::vector<HistoryRecord> HistoryStore::list() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

std::optional<HistoryRecord> HistoryStore::find(std::string const &id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto const &record : records_)
    {
        if (record.id == id)
        {
            return record;
        }
    }
    return std::nullopt;
}

bool HistoryStore::remove_one(std::string const &id)
{
    std::string error;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(records_.begin(), records_.end(),
                               [&](HistoryRecord const &existing)
                               { return existing.id == id; });
        if (it == records_.end())
        {
            return true;
        }
        records_.erase(it);
        error = persist_locked();
    }
    announce(error);
    return error.empty();
}

bool HistoryStore::clear_all()
{
    std::string error;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.clear();
        error = persist_locked();
    }
    announce(error);
    return error.empty();
}

std::string HistoryStore::persist_locked()
{
    if (database_ == nullptr || !database_->is_valid())
    {
        RT_LOG_ERROR("history write skipped: database unavailable");
        return "database unavailable";
    }
    auto payload = serialize(records_);
    if (!payload)
    {
        RT_LOG_ERROR("history serialization failed");
        return "history serialization failed";
    }
    if (!database_->store_document(ns_, *payload))
    {
        auto error = database_->last_error();
        if (error.empty())
        {
            error = "history write failed";
        }
        RT_LOG_ERROR("history write failed: {}", error);
        return error;
    }
    return {};
}

void HistoryStore::announce(std::string const &error) const
{
    if (bus_ == nullptr)
    {
        return;
    }
    HistoryChangedEvent event;
    event.persisted = error.empty();
    event.error = error;
    bus_->publish(event);
}

} // namespace rt::engine
