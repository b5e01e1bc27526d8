#include "engine/ConfigurationService.hpp"

#include "utils/FS.hpp"
#include "utils/Log.hpp"
#include "utils/StateStore.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <mutex>

namespace rt::engine
{

namespace
{

constexpr std::chrono::milliseconds kMinPollInterval{100};
constexpr std::chrono::milliseconds kMinTimeout{1000};
constexpr std::chrono::milliseconds kMinWait{100};

std::optional<std::string> read_env(char const *key)
{
    auto const *value = std::getenv(key);
    if (value == nullptr || *value == '\0')
    {
        return std::nullopt;
    }
    return std::string(value);
}

std::optional<long long> parse_int_value(std::optional<std::string> const &value)
{
    if (!value)
    {
        return std::nullopt;
    }
    long long parsed = 0;
    auto const *end = value->data() + value->size();
    auto [ptr, ec] = std::from_chars(value->data(), end, parsed);
    if (ec != std::errc() || ptr != end)
    {
        RT_LOG_WARN("ignoring non-numeric setting value '{}'", *value);
        return std::nullopt;
    }
    return parsed;
}

std::optional<bool> parse_bool_value(std::optional<std::string> const &value)
{
    if (!value)
    {
        return std::nullopt;
    }
    if (*value == "1" || *value == "true" || *value == "True")
    {
        return true;
    }
    if (*value == "0" || *value == "false" || *value == "False")
    {
        return false;
    }
    return std::nullopt;
}

} // namespace

ConfigurationService::ConfigurationService(storage::Database *database,
                                           CoreSettings defaults)
    : database_(database), settings_(std::move(defaults))
{
}

CoreSettings ConfigurationService::get() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return settings_;
}

std::optional<std::string> ConfigurationService::read(char const *key) const
{
    if (database_ == nullptr || !database_->is_valid())
    {
        return std::nullopt;
    }
    return database_->get_setting(key);
}

void ConfigurationService::write(char const *key, std::string const &value)
{
    if (database_ == nullptr || !database_->is_valid())
    {
        return;
    }
    if (!database_->set_setting(key, value))
    {
        RT_LOG_WARN("failed to persist setting {}", key);
    }
}

CoreSettings ConfigurationService::load()
{
    auto settings = get();
    auto &manager = settings.manager;
    auto &engine = settings.engine;

    if (auto value = parse_int_value(read("pollIntervalMs")))
    {
        manager.poll_interval = std::chrono::milliseconds(*value);
    }
    if (auto value = parse_int_value(read("stallTimeoutSeconds")))
    {
        manager.policy.stall_timeout = std::chrono::seconds(*value);
    }
    if (auto value = parse_int_value(read("noPeersTimeoutSeconds")))
    {
        manager.policy.no_peers_timeout = std::chrono::seconds(*value);
    }
    if (auto value = parse_int_value(read("engineStartTimeoutMs")))
    {
        manager.engine_start_timeout = std::chrono::milliseconds(*value);
    }
    if (auto value = parse_int_value(read("operationTimeoutMs")))
    {
        manager.operation_timeout = std::chrono::milliseconds(*value);
    }
    if (auto value = read("historyNamespace"))
    {
        settings.history_namespace = *value;
    }
    if (auto value = read("downloadPath"))
    {
        engine.download_path = *value;
    }
    if (auto value = read("listenInterface"))
    {
        engine.listen_interface = *value;
    }
    if (auto value = parse_bool_value(read("dhtEnabled")))
    {
        engine.dht_enabled = *value;
    }
    if (auto value = parse_bool_value(read("lsdEnabled")))
    {
        engine.lsd_enabled = *value;
    }
    if (auto value = read("streamBindUrl"))
    {
        settings.stream_bind_url = *value;
    }

    if (auto env = read_env("RT_PEER_INTERFACE"))
    {
        engine.listen_interface = *env;
    }
    if (auto env = read_env("RT_STREAM_BIND"))
    {
        settings.stream_bind_url = *env;
    }
    if (auto env = read_env("RT_DOWNLOAD_DIR"))
    {
        engine.download_path = *env;
    }

    settings = normalize(std::move(settings));
    persist(settings);
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        settings_ = settings;
    }
    RT_LOG_INFO("settings: poll {} ms, stall {} s, no-peers {} s, downloads "
                "in {}",
                settings.manager.poll_interval.count(),
                std::chrono::duration_cast<std::chrono::seconds>(
                    settings.manager.policy.stall_timeout)
                    .count(),
                std::chrono::duration_cast<std::chrono::seconds>(
                    settings.manager.policy.no_peers_timeout)
                    .count(),
                settings.engine.download_path);
    return settings;
}

CoreSettings ConfigurationService::normalize(CoreSettings settings)
{
    auto &manager = settings.manager;
    manager.poll_interval = std::max(manager.poll_interval, kMinPollInterval);
    manager.policy.stall_timeout =
        std::max(manager.policy.stall_timeout, kMinTimeout);
    manager.policy.no_peers_timeout =
        std::max(manager.policy.no_peers_timeout, kMinTimeout);
    manager.engine_start_timeout =
        std::max(manager.engine_start_timeout, kMinWait);
    manager.operation_timeout = std::max(manager.operation_timeout, kMinWait);
    if (settings.history_namespace.empty())
    {
        settings.history_namespace = kDefaultHistoryNamespace;
    }
    if (settings.engine.download_path.empty())
    {
        settings.engine.download_path =
            (rt::utils::data_root() / "downloads").string();
    }
    if (settings.engine.listen_interface.empty())
    {
        settings.engine.listen_interface = "0.0.0.0:6881";
    }
    if (settings.stream_bind_url.empty())
    {
        settings.stream_bind_url = "http://127.0.0.1:0";
    }
    return settings;
}

void ConfigurationService::persist(CoreSettings const &settings)
{
    auto const &manager = settings.manager;
    write("pollIntervalMs", std::to_string(manager.poll_interval.count()));
    write("stallTimeoutSeconds",
          std::to_string(std::chrono::duration_cast<std::chrono::seconds>(
                             manager.policy.stall_timeout)
                             .count()));
    write("noPeersTimeoutSeconds",
          std::to_string(std::chrono::duration_cast<std::chrono::seconds>(
                             manager.policy.no_peers_timeout)
                             .count()));
    write("engineStartTimeoutMs",
          std::to_string(manager.engine_start_timeout.count()));
    write("operationTimeoutMs",
          std::to_string(manager.operation_timeout.count()));
    write("historyNamespace", settings.history_namespace);
    write("downloadPath", settings.engine.download_path);
    write("listenInterface", settings.engine.listen_interface);
    write("dhtEnabled", settings.engine.dht_enabled ? "1" : "0");
    write("lsdEnabled", settings.engine.lsd_enabled ? "1" : "0");
    write("streamBindUrl", settings.stream_bind_url);
}

} // namespace rt::engine
