#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace sessiondb {

/**
 * Session storage contract used by a host session framework.
 *
 * Values are arbitrary JSON documents. A value is readable until its ttl
 * elapses; absent and expired keys both read as std::nullopt.
 */
class Store {
public:
  virtual ~Store() = default;

  // Creates or replaces the value stored under key
  virtual void set(const std::string &key, const nlohmann::json &value,
                   std::int64_t ttlSeconds) = 0;

  virtual std::optional<nlohmann::json> get(const std::string &key) = 0;

  // Removing a missing key is not an error
  virtual void remove(const std::string &key) = 0;
};

} // namespace sessiondb
