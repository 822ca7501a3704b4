#include "airdrop_fixtures.hpp"
#include "utilities/campaign_csv.hpp"
#include "utilities/cid_utils.hpp"
#include "utilities/eligibility.hpp"
#include "utilities/errors.hpp"
#include "utilities/json_utils.hpp"
#include "utilities/merkle_tree.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <gtest/gtest.h>
#include <memory>
#include <string>

using namespace merkledrop;
using namespace merkledrop::test_fixtures;
namespace fs = std::filesystem;

/**
 * @brief End-to-end flow: CSV upload, stored document, eligibility lookup and
 * proof verification.
 */
class EligibilityTest : public ::testing::Test {
protected:
  fs::path dir_;
  std::unique_ptr<CampaignStore> store_;
  CampaignDocument doc_;
  std::string cid_;

  void SetUp() override {
    dir_ = fs::temp_directory_path() / "merkledrop_eligibility_store";
    fs::remove_all(dir_);
    store_ = std::make_unique<CampaignStore>(dir_.string());

    std::string csv = "address,amount\n";
    for (const auto &address : fixtureAddresses()) {
      csv += address + ",0.1\n";
    }
    csv += "11111111111111111111111111111114,0.0000005\n";
    CampaignCsvParsed parsed = CampaignCsvParser::parse(csv, 9);
    ASSERT_TRUE(parsed.ok());
    doc_ = CampaignDocument::fromParsed(parsed);
    cid_ = store_->put(doc_.toJson());
  }

  void TearDown() override { fs::remove_all(dir_); }
};

TEST_F(EligibilityTest, StoredCampaignMatchesKnownRoot) {
  EXPECT_EQ(doc_.root, FIVE_LEAF_ROOT);
  EXPECT_EQ(doc_.totalAmount, "400000500");
}

TEST_F(EligibilityTest, EligibleRecipientGetsVerifiableProof) {
  for (size_t i = 0; i < doc_.recipients.size(); ++i) {
    const auto &recipient = doc_.recipients[i];
    EligibilityResult result =
        checkEligibility(*store_, cid_, recipient.address);
    ASSERT_EQ(result.status, EligibilityStatus::Eligible);
    ASSERT_TRUE(result.proof.has_value());
    EXPECT_EQ(result.proof->index, i);
    EXPECT_EQ(result.proof->amount, recipient.amount);

    MerkleLeaf leaf = MerkleLeaf::fromAddress(
        result.proof->index, result.proof->address,
        std::stoull(result.proof->amount));
    EXPECT_TRUE(MerkleTree::verifyProof(leaf, doc_.root, result.proof->proof));
  }
}

TEST_F(EligibilityTest, ProofJsonLayout) {
  auto proof = findEligibility(doc_, fixtureAddresses()[0]);
  ASSERT_TRUE(proof.has_value());

  Json::Value obj = utils::parse_json(proof->toJson(), "eligibility proof");
  EXPECT_EQ(obj["index"].asUInt(), 0u);
  EXPECT_EQ(obj["address"].asString(), fixtureAddresses()[0]);
  EXPECT_EQ(obj["amount"].asString(), "100000000");
  ASSERT_TRUE(obj["proof"].isArray());
  ASSERT_EQ(obj["proof"].size(), 3u);
  EXPECT_EQ(obj["proof"][0].asString(),
            "1f605d6b20676921f61532c385082aae4619ba91dfb83c71bf1bc43678626119");
}

TEST_F(EligibilityTest, AddressMatchIgnoresCase) {
  std::string upper = fixtureAddresses()[3];
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  auto proof = findEligibility(doc_, upper);
  ASSERT_TRUE(proof.has_value());
  EXPECT_EQ(proof->index, 3u);
  // The stored spelling is returned
  EXPECT_EQ(proof->address, fixtureAddresses()[3]);
}

TEST_F(EligibilityTest, UnknownAddressIsNotEligible) {
  EligibilityResult result =
      checkEligibility(*store_, cid_, "11111111111111111111111111111115");
  EXPECT_EQ(result.status, EligibilityStatus::NotEligible);
  EXPECT_FALSE(result.proof.has_value());
}

TEST_F(EligibilityTest, UnknownCampaign) {
  EligibilityResult result = checkEligibility(
      *store_, utils::compute_cid("missing"), fixtureAddresses()[0]);
  EXPECT_EQ(result.status, EligibilityStatus::CampaignNotFound);

  result = checkEligibility(*store_, "not-a-cid", fixtureAddresses()[0]);
  EXPECT_EQ(result.status, EligibilityStatus::CampaignNotFound);
}

TEST_F(EligibilityTest, TreeMustCoverRecipients) {
  CampaignDocument broken = doc_;
  broken.recipients.push_back({"11111111111111111111111111111115", "1"});
  EXPECT_THROW(findEligibility(broken, fixtureAddresses()[0]),
               InvalidInputError);
}
