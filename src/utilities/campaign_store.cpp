#include "utilities/campaign_store.hpp"
#include "utilities/cid_utils.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;

namespace merkledrop {

namespace {

const std::string kExtension = ".json";

bool isValidCid(const std::string &cid) {
  try {
    utils::cid_to_digest(cid);
    return true;
  } catch (const InvalidInputError &) {
    return false;
  }
}

} // namespace

CampaignStore::CampaignStore(std::string directory)
    : directory_(std::move(directory)) {}

std::string CampaignStore::pathFor(const std::string &cid) const {
  return (fs::path(directory_) / (cid + kExtension)).string();
}

std::string CampaignStore::put(const std::string &document) {
  std::string cid = utils::compute_cid(document);

  std::lock_guard<std::mutex> lock(mutex_);
  std::error_code ec;
  fs::create_directories(directory_, ec);
  if (ec) {
    throw std::runtime_error("Cannot create campaign directory " + directory_ +
                             ": " + ec.message());
  }

  const std::string finalPath = pathFor(cid);
  const std::string tmpPath = finalPath + ".tmp";
  {
    std::ofstream out(tmpPath, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      throw std::runtime_error("Cannot open " + tmpPath + " for writing");
    }
    out.write(document.data(), static_cast<std::streamsize>(document.size()));
    if (!out) {
      throw std::runtime_error("Failed writing campaign document " + tmpPath);
    }
  }
  fs::rename(tmpPath, finalPath, ec);
  if (ec) {
    fs::remove(tmpPath, ec);
    throw std::runtime_error("Cannot move campaign document into place: " +
                             finalPath);
  }

  Logger::getInstance().log(LogLevel::INFO,
                            "Stored campaign document " + cid + " (" +
                                std::to_string(document.size()) + " bytes)");
  return cid;
}

bool CampaignStore::has(const std::string &cid) const {
  if (!isValidCid(cid)) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  return fs::is_regular_file(pathFor(cid));
}

std::optional<std::string> CampaignStore::get(const std::string &cid) const {
  if (!isValidCid(cid)) {
    Logger::getInstance().log(LogLevel::WARN,
                              "Rejected malformed campaign CID: " + cid);
    return std::nullopt;
  }

  std::string content;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ifstream in(pathFor(cid), std::ios::binary);
    if (!in.is_open()) {
      return std::nullopt;
    }
    content.assign(std::istreambuf_iterator<char>(in),
                   std::istreambuf_iterator<char>());
  }

  if (utils::compute_cid(content) != cid) {
    Logger::getInstance().log(LogLevel::ERROR,
                              "Campaign document " + cid +
                                  " does not match its content address");
    return std::nullopt;
  }
  return content;
}

std::vector<std::string> CampaignStore::list() const {
  std::vector<std::string> cids;
  std::lock_guard<std::mutex> lock(mutex_);
  std::error_code ec;
  if (!fs::is_directory(directory_, ec)) {
    return cids;
  }
  for (const auto &entry : fs::directory_iterator(directory_, ec)) {
    if (!entry.is_regular_file() || entry.path().extension() != kExtension)
      continue;
    std::string name = entry.path().stem().string();
    if (isValidCid(name))
      cids.push_back(name);
  }
  std::sort(cids.begin(), cids.end());
  return cids;
}

} // namespace merkledrop
