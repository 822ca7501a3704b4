#include "utilities/campaign.hpp"
#include "utilities/campaign_csv.hpp"
#include "utilities/campaign_store.hpp"
#include "utilities/config.hpp"
#include "utilities/eligibility.hpp"
#include "utilities/errors.hpp"
#include "utilities/json_utils.hpp"
#include "utilities/logger.h"
#include "utilities/merkle_tree.hpp"
#include "utilities/var_dir.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <cstdint>
#include <iterator>
#include <limits>
#include <string>
#include <vector>

using namespace merkledrop;

static void usage() {
  std::cout << "Usage: merkledrop_ctl create <csv_file> [decimals]\n"
            << "       merkledrop_ctl eligibility <cid> <address>\n"
            << "       merkledrop_ctl verify <index> <address> <amount> <root> "
               "[proof...]\n"
            << "       merkledrop_ctl snapshot <cid>\n"
            << "       merkledrop_ctl list\n";
}

static int create_command(const std::string &csvPath, unsigned decimals) {
  std::ifstream in(csvPath, std::ios::binary);
  if (!in.is_open()) {
    std::cout << "CSV file not found: " << csvPath << std::endl;
    return 1;
  }
  std::string csv((std::istreambuf_iterator<char>(in)),
                  std::istreambuf_iterator<char>());

  CampaignCsvParsed parsed = CampaignCsvParser::parse(csv, decimals);
  if (!parsed.validation_errors.empty()) {
    Json::Value obj(Json::objectValue);
    obj["status"] = "Invalid csv file.";
    Json::Value errors(Json::arrayValue);
    for (const auto &e : parsed.validation_errors) {
      Json::Value entry(Json::objectValue);
      entry["row"] = static_cast<Json::UInt64>(e.row);
      entry["message"] = e.message;
      errors.append(entry);
    }
    obj["errors"] = errors;
    std::cout << utils::write_compact_json(obj) << std::endl;
    Logger::getInstance().log(LogLevel::WARN,
                              "Rejected campaign CSV " + csvPath);
    return 1;
  }

  CampaignDocument doc = CampaignDocument::fromParsed(parsed);
  CampaignStore store(campaignsDir());
  std::string cid = store.put(doc.toJson());

  Json::Value obj(Json::objectValue);
  obj["status"] = "Upload successful";
  obj["total"] = doc.totalAmount;
  obj["recipients"] = std::to_string(doc.numberOfRecipients);
  obj["root"] = doc.root;
  obj["cid"] = cid;
  std::cout << utils::write_compact_json(obj) << std::endl;
  return 0;
}

static int eligibility_command(const std::string &cid,
                               const std::string &address) {
  CampaignStore store(campaignsDir());
  EligibilityResult result = checkEligibility(store, cid, address);
  switch (result.status) {
  case EligibilityStatus::Eligible:
    std::cout << result.proof->toJson() << std::endl;
    return 0;
  case EligibilityStatus::CampaignNotFound:
    std::cout << "Campaign not found: " << cid << std::endl;
    return 1;
  default:
    std::cout << "The provided address is not eligible for this campaign"
              << std::endl;
    return 1;
  }
}

static uint64_t parse_unsigned(const std::string &text, const char *what) {
  if (text.empty() ||
      text.find_first_not_of("0123456789") != std::string::npos) {
    throw InvalidInputError(std::string(what) + " must be a decimal integer: " +
                            text);
  }
  return std::stoull(text);
}

static int verify_command(int argc, char **argv) {
  uint64_t index = parse_unsigned(argv[2], "Leaf index");
  if (index > std::numeric_limits<uint32_t>::max()) {
    throw InvalidInputError("Leaf index out of range: " +
                            std::string(argv[2]));
  }
  std::string address = argv[3];
  uint64_t amount = parse_unsigned(argv[4], "Amount");
  std::string root = argv[5];
  std::vector<std::string> proof(argv + 6, argv + argc);

  MerkleLeaf leaf =
      MerkleLeaf::fromAddress(static_cast<uint32_t>(index), address, amount);
  Logger::trace("verify leaf %u against %s with %zu proof entries",
                leaf.index, root.c_str(), proof.size());
  bool ok = MerkleTree::verifyProof(leaf, root, proof);
  std::cout << (ok ? "Verification succeeded" : "Verification FAILED")
            << std::endl;
  return ok ? 0 : 1;
}

static int snapshot_command(const std::string &cid) {
  CampaignStore store(campaignsDir());
  auto raw = store.get(cid);
  if (!raw) {
    std::cout << "Campaign not found: " << cid << std::endl;
    return 1;
  }
  CampaignDocument doc = CampaignDocument::fromJson(*raw);
  std::cout << doc.merkleTree << std::endl;
  return 0;
}

static int list_command() {
  CampaignStore store(campaignsDir());
  for (const auto &cid : store.list()) {
    std::cout << cid << std::endl;
  }
  return 0;
}

int main(int argc, char **argv) {
  if (argc < 2) {
    usage();
    return 1;
  }

  RuntimeOptions opts;
  try {
    opts = loadRuntimeOptions();
  } catch (const std::exception &e) {
    std::cerr << "FATAL: " << e.what() << std::endl;
    return 1;
  }
  setVarDir(opts.varDir);
  std::error_code ec;
  std::filesystem::create_directories(logsDir(), ec);
  Logger::init(ec ? Logger::CONSOLE_ONLY_OUTPUT
                  : logsDir() + "/merkledrop.log",
               opts.logLevel, opts.logMaxSize, opts.logBackups);

  std::string cmd = argv[1];
  try {
    if (cmd == "create" && (argc == 3 || argc == 4)) {
      unsigned decimals = opts.defaultDecimals;
      if (argc == 4) {
        uint64_t requested = parse_unsigned(argv[3], "Decimals");
        if (requested > MAX_DECIMALS) {
          throw InvalidInputError("Decimals must be between 0 and " +
                                  std::to_string(MAX_DECIMALS));
        }
        decimals = static_cast<unsigned>(requested);
      }
      return create_command(argv[2], decimals);
    } else if (cmd == "eligibility" && argc == 4) {
      return eligibility_command(argv[2], argv[3]);
    } else if (cmd == "verify" && argc >= 6) {
      return verify_command(argc, argv);
    } else if (cmd == "snapshot" && argc == 3) {
      return snapshot_command(argv[2]);
    } else if (cmd == "list" && argc == 2) {
      return list_command();
    }
  } catch (const InvalidInputError &e) {
    Logger::getInstance().log(LogLevel::ERROR,
                              "Command '" + cmd + "' failed: " + e.what());
    std::cout << "Invalid input: " << e.what() << std::endl;
    return 2;
  } catch (const std::invalid_argument &e) {
    std::cout << "Invalid number argument: " << e.what() << std::endl;
    return 2;
  } catch (const std::out_of_range &e) {
    std::cout << "Number argument out of range: " << e.what() << std::endl;
    return 2;
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::ERROR,
                              "Command '" + cmd + "' failed: " + e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  usage();
  return 1;
}
