#pragma once

#include "engine/Core.hpp"

#include <optional>
#include <shared_mutex>
#include <string>

namespace rt::storage
{
class Database;
}

namespace rt::engine
{

// Daemon settings kept in the database's settings table. Loading reads every
// key, applies RT_* environment overrides, clamps values into their valid
// range, and writes the effective values back so the table documents them.
class ConfigurationService
{
  public:
    ConfigurationService(storage::Database *database, CoreSettings defaults);

    CoreSettings load();
    CoreSettings get() const;

    static CoreSettings normalize(CoreSettings settings);

  private:
    std::optional<std::string> read(char const *key) const;
    void write(char const *key, std::string const &value);
    void persist(CoreSettings const &settings);

    storage::Database *database_;
    mutable std::shared_mutex mutex_;
    CoreSettings settings_;
};

} // namespace rt::engine
