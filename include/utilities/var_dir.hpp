#pragma once

#include <string>

namespace merkledrop {

void setVarDir(const std::string &dir);
const std::string &getVarDir();

std::string logsDir();
std::string campaignsDir();

} // namespace merkledrop
