#ifndef MERKLEDROP_CAMPAIGN_CSV_HPP
#define MERKLEDROP_CAMPAIGN_CSV_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace merkledrop {

/// Largest decimals value for which 10^decimals fits in uint64_t.
inline constexpr unsigned MAX_DECIMALS = 19;

/**
 * @brief A problem found while validating a campaign CSV.
 *
 * @c row is the 1-based line in the file (the header is row 1); 0 marks a
 * problem with the file or the request as a whole.
 */
struct ValidationError {
  size_t row;
  std::string message;
};

/// One accepted recipient, amount already scaled to base units.
struct CampaignRecord {
  std::string address;
  uint64_t amount;
};

struct CampaignCsvParsed {
  std::vector<CampaignRecord> records;
  std::vector<ValidationError> validation_errors;
  uint64_t total_amount{0};
  size_t number_of_recipients{0};

  bool ok() const { return validation_errors.empty() && !records.empty(); }
};

/**
 * @brief Validates "address,amount" CSV uploads.
 *
 * Addresses must be base-58 strings decoding to 32 bytes and must be unique
 * (case-insensitive). Amounts are positive decimal numbers with at most
 * @c decimals fractional digits and are converted to base units.
 * Problems are collected in validation_errors rather than thrown.
 */
class CampaignCsvParser {
public:
  static CampaignCsvParsed parse(const std::string &csvText, unsigned decimals);

  /**
   * @brief Convert a decimal amount to base units.
   * @return std::nullopt if @p cell is not a plain non-negative decimal with
   *         at most @p decimals fractional digits, or if it overflows.
   */
  static std::optional<uint64_t> toBaseUnits(const std::string &cell,
                                             unsigned decimals);

  /// Split one CSV line into trimmed cells, honouring double quotes.
  static std::vector<std::string> splitLine(const std::string &line);
};

} // namespace merkledrop

#endif // MERKLEDROP_CAMPAIGN_CSV_HPP
