#include "utilities/campaign_csv.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"
#include "utilities/merkle_leaf.hpp"
#include <algorithm>
#include <cctype>
#include <limits>
#include <regex>
#include <sstream>
#include <unordered_map>

namespace merkledrop {

namespace {

std::string trim(const std::string &s) {
  size_t begin = 0;
  size_t end = s.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(s[begin])))
    ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1])))
    --end;
  return s.substr(begin, end - begin);
}

std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

bool isBlank(const std::string &line) { return trim(line).empty(); }

} // namespace

std::vector<std::string> CampaignCsvParser::splitLine(const std::string &line) {
  std::vector<std::string> cells;
  std::string cell;
  bool quoted = false;
  for (size_t i = 0; i < line.size(); ++i) {
    char c = line[i];
    if (c == '"') {
      if (quoted && i + 1 < line.size() && line[i + 1] == '"') {
        cell += '"';
        ++i;
      } else {
        quoted = !quoted;
      }
    } else if (c == ',' && !quoted) {
      cells.push_back(trim(cell));
      cell.clear();
    } else {
      cell += c;
    }
  }
  cells.push_back(trim(cell));
  return cells;
}

std::optional<uint64_t> CampaignCsvParser::toBaseUnits(const std::string &cell,
                                                       unsigned decimals) {
  if (decimals > MAX_DECIMALS) {
    return std::nullopt;
  }
  const std::regex pattern("^[+]?([0-9]*)\\.?([0-9]{0," +
                           std::to_string(decimals) + "})$");
  std::smatch match;
  if (!std::regex_match(cell, match, pattern)) {
    return std::nullopt;
  }
  const std::string whole = match[1].str();
  std::string fraction = match[2].str();
  if (whole.empty() && fraction.empty()) {
    return std::nullopt;
  }
  fraction.append(decimals - fraction.size(), '0');

  constexpr uint64_t kMax = std::numeric_limits<uint64_t>::max();
  uint64_t value = 0;
  for (char c : whole + fraction) {
    uint64_t digit = static_cast<uint64_t>(c - '0');
    if (value > (kMax - digit) / 10) {
      return std::nullopt;
    }
    value = value * 10 + digit;
  }
  return value;
}

CampaignCsvParsed CampaignCsvParser::parse(const std::string &csvText,
                                           unsigned decimals) {
  CampaignCsvParsed result;
  if (decimals > MAX_DECIMALS) {
    result.validation_errors.push_back(
        {0, "Decimals must be between 0 and " + std::to_string(MAX_DECIMALS)});
    return result;
  }

  std::istringstream in(csvText);
  std::string line;
  size_t row = 0;

  // Header
  bool haveHeader = false;
  while (std::getline(in, line)) {
    ++row;
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (isBlank(line))
      continue;
    haveHeader = true;
    auto header = splitLine(line);
    if (header.size() < 1 || toLower(header[0]) != "address") {
      result.validation_errors.push_back(
          {row, "CSV header invalid. The csv header should be `address` "
                "column. The address column is missing"});
    }
    if (header.size() < 2 || toLower(header[1]) != "amount") {
      result.validation_errors.push_back(
          {row, "CSV header invalid. The csv header should contain `amount` "
                "column. The amount column is missing"});
    }
    if (header.size() > 2) {
      result.validation_errors.push_back(
          {row, "CSV header invalid. Only the `address` and `amount` columns "
                "are allowed"});
    }
    break;
  }
  if (!haveHeader) {
    result.validation_errors.push_back({1, "The CSV file is empty"});
    return result;
  }
  if (!result.validation_errors.empty()) {
    return result;
  }

  std::unordered_map<std::string, size_t> seen;
  bool totalOverflow = false;
  while (std::getline(in, line)) {
    ++row;
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (isBlank(line))
      continue;

    auto cells = splitLine(line);
    if (cells.size() != 2) {
      result.validation_errors.push_back(
          {row, "Row has " + std::to_string(cells.size()) +
                    " columns, expected 2 (address,amount)"});
      continue;
    }

    const std::string &address = cells[0];
    bool rowOk = true;
    try {
      MerkleLeaf::parseIdentity(address);
    } catch (const InvalidInputError &) {
      result.validation_errors.push_back({row, "Invalid Solana address"});
      rowOk = false;
    }

    auto amount = toBaseUnits(cells[1], decimals);
    if (!amount) {
      result.validation_errors.push_back(
          {row, "Amounts should be positive, in normal notation, with an "
                "optional decimal point and a maximum number of decimals as "
                "provided by the query parameter."});
      rowOk = false;
    } else if (*amount == 0) {
      result.validation_errors.push_back({row, "The amount cannot be 0"});
      rowOk = false;
    }

    if (rowOk) {
      auto [it, inserted] = seen.emplace(toLower(address), row);
      if (!inserted) {
        result.validation_errors.push_back(
            {row, "Duplicated address, first seen at row " +
                      std::to_string(it->second)});
        rowOk = false;
      }
    }
    if (!rowOk)
      continue;

    if (result.total_amount >
        std::numeric_limits<uint64_t>::max() - *amount) {
      totalOverflow = true;
    } else {
      result.total_amount += *amount;
    }
    result.records.push_back({address, *amount});
  }

  if (totalOverflow) {
    result.validation_errors.push_back(
        {0, "The total amount does not fit in an unsigned 64-bit integer"});
  }
  if (result.records.empty() && result.validation_errors.empty()) {
    result.validation_errors.push_back(
        {0, "The CSV file does not contain any recipient"});
  }
  result.number_of_recipients = result.records.size();

  Logger::getInstance().log(
      LogLevel::DEBUG, "Parsed campaign CSV: " +
                           std::to_string(result.number_of_recipients) +
                           " recipients, " +
                           std::to_string(result.validation_errors.size()) +
                           " validation errors");
  return result;
}

} // namespace merkledrop
