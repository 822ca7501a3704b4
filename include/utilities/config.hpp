#ifndef MERKLEDROP_CONFIG_HPP
#define MERKLEDROP_CONFIG_HPP

#include "utilities/logger.h"
#include <string>

namespace merkledrop {

/**
 * @brief Settings read from merkledrop_config.yaml and the environment.
 */
struct RuntimeOptions {
  std::string varDir; ///< Defaults to getVarDir()
  LogLevel logLevel = LogLevel::INFO;
  long long logMaxSize = 10 * 1024 * 1024;
  int logBackups = 5;
  unsigned defaultDecimals = 9;
};

/**
 * @brief Load options from a YAML file, then apply environment overrides.
 *
 * The file is named by MERKLEDROP_CONFIG (default merkledrop_config.yaml);
 * a missing file leaves the defaults in place. MERKLEDROP_VAR_DIR,
 * MERKLEDROP_LOG_LEVEL and MERKLEDROP_DECIMALS override the file.
 * @throws InvalidInputError for a present but malformed file or value.
 */
RuntimeOptions loadRuntimeOptions();

/// Same as loadRuntimeOptions() with an explicit file path.
RuntimeOptions loadRuntimeOptions(const std::string &path);

/// Case-insensitive level name ("debug", "WARN", ...).
LogLevel parseLogLevel(const std::string &name);

} // namespace merkledrop

#endif // MERKLEDROP_CONFIG_HPP
