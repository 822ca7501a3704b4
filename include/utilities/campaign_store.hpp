#ifndef MERKLEDROP_CAMPAIGN_STORE_HPP
#define MERKLEDROP_CAMPAIGN_STORE_HPP

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace merkledrop {

/**
 * @brief Content-addressed document store backed by a directory.
 *
 * Documents are kept as <dir>/<cid>.json where cid is the CIDv1 of the
 * document's SHA-256 digest. Reads re-hash the file so a modified document is
 * never returned under its old address.
 */
class CampaignStore {
public:
  explicit CampaignStore(std::string directory);

  /**
   * @brief Store a document.
   * @return The document's content identifier.
   * @throws std::runtime_error if the file cannot be written.
   */
  std::string put(const std::string &document);

  /**
   * @brief Check if a document exists.
   * @param cid Identifier returned by @ref put.
   */
  bool has(const std::string &cid) const;

  /**
   * @brief Retrieve a document by CID.
   * @return The document, or std::nullopt if it is missing or its contents no
   *         longer hash to @p cid.
   */
  std::optional<std::string> get(const std::string &cid) const;

  /// CIDs of all stored documents, sorted.
  std::vector<std::string> list() const;

  const std::string &directory() const { return directory_; }

private:
  std::string pathFor(const std::string &cid) const;

  std::string directory_;
  mutable std::mutex mutex_;
};

} // namespace merkledrop

#endif // MERKLEDROP_CAMPAIGN_STORE_HPP
