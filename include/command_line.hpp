#pragma once

#include "config_manager.hpp"
#include <iosfwd>
#include <string>
#include <vector>

namespace sessiondb {

/**
 * The sessiondb command-line tool.
 *
 *   sessiondb [--config FILE] set KEY JSON TTL_SECONDS
 *   sessiondb [--config FILE] get KEY
 *   sessiondb [--config FILE] remove KEY
 *
 * Values are printed to `out`; diagnostics go to `err` and the logger.
 */
class CommandLine {
public:
  static constexpr int EXIT_OK = 0;
  static constexpr int EXIT_NOT_FOUND = 1;
  static constexpr int EXIT_ERROR = 2;
  static constexpr int EXIT_USAGE = 64;

  CommandLine(std::ostream &out, std::ostream &err);

  // args excludes the program name
  int run(const std::vector<std::string> &args);

  static std::string usage();

private:
  std::ostream &out_;
  std::ostream &err_;

  bool loadConfiguration(ConfigManager &config, const std::string &path,
                         bool explicitPath);
  int execute(const std::string &command,
              const std::vector<std::string> &operands);
};

// DATABASE_HOST, DATABASE_PORT, DATABASE_NAME, DATABASE_USER and
// DATABASE_PASSWORD take precedence over the "database" section
void applyEnvironmentOverrides(nlohmann::json &document);

} // namespace sessiondb
