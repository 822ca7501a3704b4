#ifndef MERKLEDROP_ELIGIBILITY_HPP
#define MERKLEDROP_ELIGIBILITY_HPP

#include "utilities/campaign.hpp"
#include "utilities/campaign_store.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace merkledrop {

/// What a recipient needs to claim: its leaf fields and the sibling path.
struct EligibilityProof {
  uint32_t index{0};
  std::vector<std::string> proof;
  std::string address;
  std::string amount;

  std::string toJson() const;
};

enum class EligibilityStatus { Eligible, NotEligible, CampaignNotFound };

struct EligibilityResult {
  EligibilityStatus status{EligibilityStatus::NotEligible};
  std::optional<EligibilityProof> proof;
};

/**
 * @brief Look up @p address (case-insensitive) in a campaign.
 * @return std::nullopt when the address is not a recipient.
 * @throws InvalidInputError if the document's tree is malformed or does not
 *         cover its recipient list.
 */
std::optional<EligibilityProof> findEligibility(const CampaignDocument &doc,
                                                const std::string &address);

/**
 * @brief Load campaign @p cid from @p store and look up @p address.
 * @throws InvalidInputError if the stored document is malformed.
 */
EligibilityResult checkEligibility(const CampaignStore &store,
                                   const std::string &cid,
                                   const std::string &address);

} // namespace merkledrop

#endif // MERKLEDROP_ELIGIBILITY_HPP
