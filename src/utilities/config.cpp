#include "utilities/config.hpp"
#include "utilities/campaign_csv.hpp"
#include "utilities/errors.hpp"
#include "utilities/var_dir.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace merkledrop {

LogLevel parseLogLevel(const std::string &name) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  if (upper == "TRACE")
    return LogLevel::TRACE;
  if (upper == "DEBUG")
    return LogLevel::DEBUG;
  if (upper == "INFO")
    return LogLevel::INFO;
  if (upper == "WARN" || upper == "WARNING")
    return LogLevel::WARN;
  if (upper == "ERROR")
    return LogLevel::ERROR;
  if (upper == "FATAL")
    return LogLevel::FATAL;
  throw InvalidInputError("Unknown log level '" + name + "'");
}

static unsigned parseDecimals(const std::string &text) {
  // stoull would accept a sign and wrap "-1" around.
  if (text.empty() ||
      text.find_first_not_of("0123456789") != std::string::npos) {
    throw InvalidInputError("Invalid decimals value '" + text + "'");
  }
  unsigned long long value = 0;
  try {
    value = std::stoull(text);
  } catch (const std::out_of_range &e) {
    throw InvalidInputError("Invalid decimals value '" + text +
                            "': " + e.what());
  }
  if (value > MAX_DECIMALS) {
    throw InvalidInputError("Invalid decimals value '" + text +
                            "': must be between 0 and " +
                            std::to_string(MAX_DECIMALS));
  }
  return static_cast<unsigned>(value);
}

RuntimeOptions loadRuntimeOptions(const std::string &path) {
  RuntimeOptions opts;
  opts.varDir = getVarDir();
  if (std::filesystem::exists(path)) {
    try {
      YAML::Node node = YAML::LoadFile(path);
      if (node["var_dir"])
        opts.varDir = node["var_dir"].as<std::string>();
      if (node["log_level"])
        opts.logLevel = parseLogLevel(node["log_level"].as<std::string>());
      if (node["log_max_size"])
        opts.logMaxSize = node["log_max_size"].as<long long>();
      if (node["log_backups"])
        opts.logBackups = node["log_backups"].as<int>();
      if (node["default_decimals"])
        opts.defaultDecimals =
            parseDecimals(node["default_decimals"].as<std::string>());
    } catch (const YAML::Exception &e) {
      throw InvalidInputError("Invalid configuration file " + path + ": " +
                              e.what());
    }
  }

  if (const char *env = std::getenv("MERKLEDROP_VAR_DIR"); env && env[0])
    opts.varDir = env;
  if (const char *env = std::getenv("MERKLEDROP_LOG_LEVEL"); env && env[0])
    opts.logLevel = parseLogLevel(env);
  if (const char *env = std::getenv("MERKLEDROP_DECIMALS"); env && env[0])
    opts.defaultDecimals = parseDecimals(env);
  return opts;
}

RuntimeOptions loadRuntimeOptions() {
  const char *cfg = std::getenv("MERKLEDROP_CONFIG");
  if (!cfg || cfg[0] == '\0')
    cfg = "merkledrop_config.yaml";
  return loadRuntimeOptions(cfg);
}

} // namespace merkledrop
