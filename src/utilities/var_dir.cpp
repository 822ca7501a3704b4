#include "utilities/var_dir.hpp"

#include <cstdlib>
#include <filesystem>

namespace merkledrop {

static std::string varDir = [] {
  const char *env = std::getenv("MERKLEDROP_VAR_DIR");
  if (env && env[0] != '\0') {
    return std::string(env);
  }
  if (std::filesystem::exists("/var/merkledrop"))
    return std::string("/var/merkledrop");
  return std::string("var/merkledrop");
}();

void setVarDir(const std::string &dir) { varDir = dir; }

const std::string &getVarDir() { return varDir; }

std::string logsDir() { return getVarDir() + "/logs"; }

std::string campaignsDir() { return getVarDir() + "/campaigns"; }

} // namespace merkledrop
