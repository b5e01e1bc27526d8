#pragma once

#include <any>
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

namespace rt::engine
{

using SubscriptionId = std::uint64_t;

class EventBus
{
  public:
    template <typename T> using Handler = std::function<void(T const &)>;

    template <typename T> SubscriptionId subscribe(Handler<T> handler)
    {
        auto const id = next_id_.fetch_add(1, std::memory_order_relaxed);
        std::unique_lock lock(handlers_mutex_);
        auto &handlers = handlers_[std::type_index(typeid(T))];
        handlers.push_back(
            {id, [handler = std::move(handler)](std::any const &event)
             { handler(std::any_cast<T const &>(event)); }});
        return id;
    }

    // Unknown or already removed ids are ignored.
    void unsubscribe(SubscriptionId id)
    {
        std::unique_lock lock(handlers_mutex_);
        for (auto it = handlers_.begin(); it != handlers_.end(); ++it)
        {
            auto &entries = it->second;
            for (auto entry = entries.begin(); entry != entries.end(); ++entry)
            {
                if (entry->id == id)
                {
                    entries.erase(entry);
                    if (entries.empty())
                    {
                        handlers_.erase(it);
                    }
                    return;
                }
            }
        }
    }

    template <typename T> void publish(T const &event) const
    {
        // Handlers run outside the lock so they may subscribe or unsubscribe.
        std::vector<Entry> handlers_copy;
        {
            std::shared_lock lock(handlers_mutex_);
            auto it = handlers_.find(std::type_index(typeid(T)));
            if (it != handlers_.end())
            {
                handlers_copy = it->second;
            }
        }
        if (handlers_copy.empty())
        {
            return;
        }
        std::any const boxed(event);
        for (auto const &entry : handlers_copy)
        {
            entry.handler(boxed);
        }
    }

    std::size_t subscriber_count() const
    {
        std::shared_lock lock(handlers_mutex_);
        std::size_t total = 0;
        for (auto const &[type, entries] : handlers_)
        {
            total += entries.size();
        }
        return total;
    }

  private:
    struct Entry
    {
        SubscriptionId id = 0;
        std::function<void(std::any const &)> handler;
    };

    std::unordered_map<std::type_index, std::vector<Entry>> handlers_;
    mutable std::shared_mutex handlers_mutex_;
    std::atomic<SubscriptionId> next_id_{1};
};

// Owns one subscription and drops it on destruction.
class Subscription
{
  public:
    Subscription() = default;
    Subscription(EventBus *bus, SubscriptionId id) : bus_(bus), id_(id) {}
    Subscription(Subscription &&other) noexcept
        : bus_(std::exchange(other.bus_, nullptr)),
          id_(std::exchange(other.id_, 0))
    {
    }
    Subscription &operator=(Subscription &&other) noexcept
    {
        if (this != &other)
        {
            reset();
            bus_ = std::exchange(other.bus_, nullptr);
            id_ = std::exchange(other.id_, 0);
        }
        return *this;
    }
    Subscription(Subscription const &) = delete;
    Subscription &operator=(Subscription const &) = delete;
    ~Subscription() { reset(); }

    void reset()
    {
        if (bus_ != nullptr)
        {
            bus_->unsubscribe(id_);
            bus_ = nullptr;
            id_ = 0;
        }
    }

  private:
    EventBus *bus_ = nullptr;
    SubscriptionId id_ = 0;
};

} // namespace rt::engine
