#include "utilities/eligibility.hpp"
#include "utilities/errors.hpp"
#include "utilities/json_utils.hpp"
#include "utilities/logger.h"
#include <algorithm>
#include <cctype>
#include <utility>

namespace merkledrop {

namespace {

bool equalsIgnoreCase(const std::string &a, const std::string &b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

} // namespace

std::string EligibilityProof::toJson() const {
  Json::Value obj(Json::objectValue);
  obj["index"] = index;
  Json::Value list(Json::arrayValue);
  for (const auto &p : proof) {
    list.append(p);
  }
  obj["proof"] = list;
  obj["address"] = address;
  obj["amount"] = amount;
  return utils::write_compact_json(obj);
}

std::optional<EligibilityProof> findEligibility(const CampaignDocument &doc,
                                                const std::string &address) {
  auto it = std::find_if(doc.recipients.begin(), doc.recipients.end(),
                         [&](const RecipientEntry &r) {
                           return equalsIgnoreCase(r.address, address);
                         });
  if (it == doc.recipients.end()) {
    return std::nullopt;
  }
  size_t index = static_cast<size_t>(it - doc.recipients.begin());

  MerkleTree tree = doc.tree();
  if (tree.leafCount() != doc.recipients.size()) {
    throw InvalidInputError("Campaign tree has " +
                            std::to_string(tree.leafCount()) +
                            " leaves but the document lists " +
                            std::to_string(doc.recipients.size()) +
                            " recipients");
  }
  auto proof = tree.getProofHex(index);
  if (!proof) {
    throw InvalidInputError("No proof for recipient index " +
                            std::to_string(index));
  }

  EligibilityProof result;
  result.index = static_cast<uint32_t>(index);
  result.proof = std::move(*proof);
  result.address = it->address;
  result.amount = it->amount;
  return result;
}

EligibilityResult checkEligibility(const CampaignStore &store,
                                   const std::string &cid,
                                   const std::string &address) {
  EligibilityResult result;
  auto raw = store.get(cid);
  if (!raw) {
    Logger::getInstance().log(LogLevel::WARN,
                              "Eligibility query for unknown campaign " + cid);
    result.status = EligibilityStatus::CampaignNotFound;
    return result;
  }

  CampaignDocument doc = CampaignDocument::fromJson(*raw);
  result.proof = findEligibility(doc, address);
  result.status = result.proof ? EligibilityStatus::Eligible
                               : EligibilityStatus::NotEligible;
  Logger::getInstance().log(
      LogLevel::DEBUG, "Eligibility query campaign=" + cid + " address=" +
                           address + " eligible=" +
                           (result.proof ? "true" : "false"));
  return result;
}

} // namespace merkledrop
