#ifndef MERKLEDROP_JSON_UTILS_HPP
#define MERKLEDROP_JSON_UTILS_HPP

#include <jsoncpp/json/json.h>
#include <string>

namespace merkledrop::utils {

/// Serialize without indentation or trailing newline.
std::string write_compact_json(const Json::Value &value);

/**
 * @brief Parse @p text into a Json::Value.
 * @param what Name used in the error message (e.g. "snapshot").
 * @throws merkledrop::InvalidInputError on syntax errors.
 */
Json::Value parse_json(const std::string &text, const std::string &what);

} // namespace merkledrop::utils

#endif // MERKLEDROP_JSON_UTILS_HPP
