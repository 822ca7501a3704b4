#include "utilities/campaign.hpp"
#include "utilities/errors.hpp"
#include "utilities/json_utils.hpp"
#include "utilities/logger.h"
#include "utilities/merkle_snapshot.hpp"
#include <limits>

namespace merkledrop {

CampaignDocument CampaignDocument::fromParsed(const CampaignCsvParsed &parsed) {
  if (!parsed.validation_errors.empty()) {
    throw InvalidInputError("Campaign CSV has " +
                            std::to_string(parsed.validation_errors.size()) +
                            " validation errors");
  }
  if (parsed.records.empty()) {
    throw InvalidInputError("Campaign CSV does not contain any recipient");
  }
  if (parsed.records.size() > std::numeric_limits<uint32_t>::max()) {
    throw InvalidInputError("Too many recipients for a 32-bit leaf index");
  }

  std::vector<MerkleLeaf> leaves;
  leaves.reserve(parsed.records.size());
  CampaignDocument doc;
  doc.recipients.reserve(parsed.records.size());
  for (size_t i = 0; i < parsed.records.size(); ++i) {
    const auto &record = parsed.records[i];
    leaves.push_back(MerkleLeaf::fromAddress(static_cast<uint32_t>(i),
                                             record.address, record.amount));
    doc.recipients.push_back({record.address, std::to_string(record.amount)});
  }

  MerkleTree tree = MerkleTree::build(leaves);
  doc.root = tree.rootHex();
  doc.merkleTree = MerkleSnapshot::dump(tree);
  doc.totalAmount = std::to_string(parsed.total_amount);
  doc.numberOfRecipients = parsed.records.size();

  Logger::getInstance().log(LogLevel::INFO,
                            "Built campaign tree: root=" + doc.root +
                                " recipients=" +
                                std::to_string(doc.numberOfRecipients) +
                                " height=" + std::to_string(tree.height()));
  return doc;
}

std::string CampaignDocument::toJson() const {
  Json::Value obj(Json::objectValue);
  obj["root"] = root;
  obj["total_amount"] = totalAmount;
  obj["number_of_recipients"] = static_cast<Json::UInt64>(numberOfRecipients);
  obj["merkle_tree"] = merkleTree;
  Json::Value list(Json::arrayValue);
  for (const auto &r : recipients) {
    Json::Value entry(Json::objectValue);
    entry["address"] = r.address;
    entry["amount"] = r.amount;
    list.append(entry);
  }
  obj["recipients"] = list;
  return utils::write_compact_json(obj);
}

CampaignDocument CampaignDocument::fromJson(const std::string &text) {
  Json::Value obj = utils::parse_json(text, "campaign document");
  if (!obj.isObject() || !obj["root"].isString() ||
      !obj["total_amount"].isString() ||
      !obj["number_of_recipients"].isUInt64() ||
      !obj["merkle_tree"].isString() || !obj["recipients"].isArray()) {
    throw InvalidInputError("Campaign document is missing required members");
  }

  CampaignDocument doc;
  doc.root = obj["root"].asString();
  doc.totalAmount = obj["total_amount"].asString();
  doc.numberOfRecipients =
      static_cast<size_t>(obj["number_of_recipients"].asUInt64());
  doc.merkleTree = obj["merkle_tree"].asString();
  for (const auto &entry : obj["recipients"]) {
    if (!entry.isObject() || !entry["address"].isString() ||
        !entry["amount"].isString()) {
      throw InvalidInputError("Campaign document has a malformed recipient");
    }
    doc.recipients.push_back(
        {entry["address"].asString(), entry["amount"].asString()});
  }
  return doc;
}

MerkleTree CampaignDocument::tree() const {
  return MerkleSnapshot::load(merkleTree);
}

} // namespace merkledrop
