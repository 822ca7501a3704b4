#include "utilities/json_utils.hpp"
#include "utilities/errors.hpp"
#include <memory>

namespace merkledrop::utils {

std::string write_compact_json(const Json::Value &value) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, value);
}

Json::Value parse_json(const std::string &text, const std::string &what) {
  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  builder["rejectDupKeys"] = true;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value root;
  std::string errors;
  if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
    throw InvalidInputError("Failed to parse " + what + ": " + errors);
  }
  return root;
}

} // namespace merkledrop::utils
