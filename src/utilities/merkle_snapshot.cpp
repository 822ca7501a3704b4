#include "utilities/merkle_snapshot.hpp"
#include "utilities/errors.hpp"
#include "utilities/hex_utils.hpp"
#include "utilities/json_utils.hpp"

namespace merkledrop {

std::string MerkleSnapshot::dump(const MerkleTree &tree) {
  Json::Value doc(Json::objectValue);
  doc["root"] = tree.rootHex();
  Json::Value levels(Json::arrayValue);
  for (const auto &level : tree.levels()) {
    Json::Value nodes(Json::arrayValue);
    for (const auto &node : level) {
      nodes.append(utils::digest_to_hex(node));
    }
    levels.append(nodes);
  }
  doc["tree"] = levels;
  return utils::write_compact_json(doc);
}

MerkleTree MerkleSnapshot::load(const std::string &text) {
  Json::Value doc = utils::parse_json(text, "merkle tree snapshot");
  if (!doc.isObject() || !doc["root"].isString() || !doc["tree"].isArray()) {
    throw InvalidInputError(
        "Merkle tree snapshot must be an object with 'root' and 'tree'");
  }

  std::vector<MerkleTree::Level> levels;
  levels.reserve(doc["tree"].size());
  for (const auto &level : doc["tree"]) {
    if (!level.isArray()) {
      throw InvalidInputError("Merkle tree snapshot level is not an array");
    }
    MerkleTree::Level nodes;
    nodes.reserve(level.size());
    for (const auto &node : level) {
      if (!node.isString()) {
        throw InvalidInputError("Merkle tree snapshot node is not a string");
      }
      nodes.push_back(utils::hex_to_digest(node.asString()));
    }
    levels.push_back(std::move(nodes));
  }

  MerkleTree tree = MerkleTree::fromLevels(std::move(levels));
  if (tree.root() != utils::hex_to_digest(doc["root"].asString())) {
    throw InvalidInputError(
        "Merkle tree snapshot root does not match its top level");
  }
  return tree;
}

} // namespace merkledrop
