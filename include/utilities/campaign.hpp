#ifndef MERKLEDROP_CAMPAIGN_HPP
#define MERKLEDROP_CAMPAIGN_HPP

#include "utilities/campaign_csv.hpp"
#include "utilities/merkle_tree.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace merkledrop {

struct RecipientEntry {
  std::string address;
  std::string amount; ///< Base units, decimal string

  bool operator==(const RecipientEntry &) const = default;
};

/**
 * @brief Document published for a campaign.
 *
 * JSON members: root, total_amount, number_of_recipients, merkle_tree (the
 * MerkleSnapshot text as a string) and recipients in tree order.
 */
struct CampaignDocument {
  std::string root;
  std::string totalAmount;
  size_t numberOfRecipients{0};
  std::string merkleTree;
  std::vector<RecipientEntry> recipients;

  /**
   * @brief Build the tree for a validated CSV and assemble the document.
   * @throws InvalidInputError if @p parsed carries validation errors or no
   *         records.
   */
  static CampaignDocument fromParsed(const CampaignCsvParsed &parsed);

  std::string toJson() const;

  /// @throws InvalidInputError for malformed documents.
  static CampaignDocument fromJson(const std::string &text);

  /// Load the embedded snapshot.
  MerkleTree tree() const;

  bool operator==(const CampaignDocument &) const = default;
};

} // namespace merkledrop

#endif // MERKLEDROP_CAMPAIGN_HPP
