#include "Config.hpp"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace labxfer {

namespace {

constexpr int64_t KiB = 1024;
constexpr int64_t MiB = 1024 * KiB;
constexpr int64_t GiB = 1024 * MiB;

template <typename T>
void clampValue(T &value, T lo, T hi, const std::string &name,
                std::vector<std::string> &warnings) {
  if (value < lo || value > hi) {
    T clamped = std::min(std::max(value, lo), hi);
    warnings.push_back(name + " out of range, using " +
                       std::to_string(clamped));
    value = clamped;
  }
}

template <typename Rep, typename Period>
void clampDuration(std::chrono::duration<Rep, Period> &value,
                   std::chrono::duration<Rep, Period> lo,
                   std::chrono::duration<Rep, Period> hi,
                   const std::string &name,
                   std::vector<std::string> &warnings) {
  Rep raw = value.count();
  clampValue(raw, lo.count(), hi.count(), name, warnings);
  value = std::chrono::duration<Rep, Period>(raw);
}

} // namespace

std::vector<ChunkTier> PipelineConfig::defaultChunkTiers() {
  return {{1 * MiB, 32 * KiB},
          {100 * MiB, 256 * KiB},
          {1 * GiB, 1 * MiB},
          {10 * GiB, 4 * MiB},
          {std::numeric_limits<int64_t>::max(), 8 * MiB}};
}

int64_t PipelineConfig::chunkSizeFor(int64_t fileSize) const {
  for (const auto &tier : chunkTiers) {
    if (fileSize <= tier.maxFileSize)
      return tier.chunkSize;
  }
  return chunkTiers.empty() ? 256 * KiB : chunkTiers.back().chunkSize;
}

std::vector<std::string> PipelineConfig::validate() {
  using namespace std::chrono;
  std::vector<std::string> warnings;

  clampDuration(stabilityWindow, milliseconds(100), milliseconds(600000),
                "stability_window_ms", warnings);
  clampDuration(stabilityPollInterval, milliseconds(10), milliseconds(10000),
                "stability_poll_ms", warnings);
  if (rescanInterval.count() != 0)
    clampDuration(rescanInterval, seconds(10), seconds(86400),
                  "rescan_interval_s", warnings);

  clampDuration(lockRetry.initialWait, milliseconds(0),
                milliseconds(86400LL * 1000), "lock_initial_wait_s",
                warnings);
  clampDuration(lockRetry.retryInterval, milliseconds(1000),
                milliseconds(3600LL * 1000), "lock_retry_interval_s",
                warnings);
  clampValue(lockRetry.maxAttempts, 1, 1000, "lock_max_attempts", warnings);

  clampValue(rangeUploadThreshold, 1 * MiB, 4096 * MiB,
             "range_upload_threshold_mb", warnings);
  clampValue(chunkRetries, 0, 20, "chunk_retries", warnings);
  clampValue(progressStepPercent, 1, 100, "progress_step_percent", warnings);
  clampValue(verifyPrefixBytes, int64_t{1}, 1 * MiB, "verify_prefix_bytes",
             warnings);

  clampValue(cacheCapacity, std::size_t{10}, std::size_t{1000000},
             "checksum_cache_capacity", warnings);
  clampValue(cacheEvictBatch, std::size_t{1}, cacheCapacity,
             "checksum_cache_evict_batch", warnings);
  clampDuration(persistInterval, seconds(5), seconds(86400),
                "persist_interval_s", warnings);

  bool tiersValid = !chunkTiers.empty();
  for (std::size_t i = 0; tiersValid && i < chunkTiers.size(); ++i) {
    if (chunkTiers[i].chunkSize <= 0)
      tiersValid = false;
    if (i > 0 && (chunkTiers[i].maxFileSize <= chunkTiers[i - 1].maxFileSize ||
                  chunkTiers[i].chunkSize < chunkTiers[i - 1].chunkSize))
      tiersValid = false;
  }
  if (!tiersValid) {
    warnings.push_back("chunk_tiers not monotonic, using defaults");
    chunkTiers = defaultChunkTiers();
  }

  if (authType != "basic" && authType != "digest") {
    warnings.push_back("webdav_auth_type '" + authType +
                       "' unknown, using basic");
    authType = "basic";
  }
  if (remotePath.empty() || remotePath.front() != '/')
    remotePath = "/" + remotePath;

  return warnings;
}

std::optional<ConflictPolicy> parseConflictPolicy(const std::string &value) {
  if (value == "ask")
    return ConflictPolicy::AskExternal;
  if (value == "upload" || value == "overwrite")
    return ConflictPolicy::AlwaysUpload;
  if (value == "skip")
    return ConflictPolicy::AlwaysSkip;
  if (value == "newer")
    return ConflictPolicy::PreferNewer;
  return std::nullopt;
}

std::string defaultStateDirectory() {
  const char *home = std::getenv("HOME");
  fs::path base = home ? fs::path(home) : fs::current_path();
  return (base / ".labxfer").generic_string();
}

std::optional<PipelineConfig> loadConfig(const std::string &path) {
  using namespace std::chrono;
  PipelineConfig config;
  config.stateDirectory = fs::path(path).parent_path().generic_string();

  std::ifstream ifs(path);
  if (!ifs) {
    std::cout << "[Config] No configuration at " << path
              << ", using defaults" << std::endl;
    return config;
  }

  try {
    auto j = json::parse(ifs);
    config.localDirectory = j.value("local_directory", config.localDirectory);
    config.remotePath = j.value("remote_path", config.remotePath);
    config.recursive = j.value("monitor_subdirs", config.recursive);
    config.preserveStructure =
        j.value("preserve_structure", config.preserveStructure);
    if (j.contains("extensions")) {
      // The original settings stored a comma separated string
      if (j["extensions"].is_string()) {
        config.extensions.clear();
        std::string raw = j["extensions"];
        std::size_t start = 0;
        while (start <= raw.size()) {
          auto comma = raw.find(',', start);
          std::string ext = raw.substr(start, comma - start);
          ext.erase(0, ext.find_first_not_of(" \t"));
          ext.erase(ext.find_last_not_of(" \t") + 1);
          if (!ext.empty())
            config.extensions.push_back(ext);
          if (comma == std::string::npos)
            break;
          start = comma + 1;
        }
      } else {
        config.extensions = j["extensions"].get<std::vector<std::string>>();
      }
    }

    config.stabilityWindow = milliseconds(
        j.value("stability_window_ms", config.stabilityWindow.count()));
    config.stabilityPollInterval = milliseconds(
        j.value("stability_poll_ms", config.stabilityPollInterval.count()));
    config.rescanInterval =
        seconds(j.value("rescan_interval_s", config.rescanInterval.count()));

    config.lockRetry.initialWait = seconds(j.value(
        "lock_initial_wait_s",
        duration_cast<seconds>(config.lockRetry.initialWait).count()));
    config.lockRetry.retryInterval = seconds(j.value(
        "lock_retry_interval_s",
        duration_cast<seconds>(config.lockRetry.retryInterval).count()));
    config.lockRetry.maxAttempts =
        j.value("lock_max_attempts", config.lockRetry.maxAttempts);

    if (j.contains("chunk_tiers")) {
      config.chunkTiers.clear();
      for (const auto &tier : j["chunk_tiers"]) {
        ChunkTier t;
        t.maxFileSize = tier.value("max_file_size",
                                   std::numeric_limits<int64_t>::max());
        t.chunkSize = tier.value("chunk_size", int64_t{0});
        config.chunkTiers.push_back(t);
      }
    }
    config.rangeUploadThreshold =
        j.value("range_upload_threshold_mb",
                config.rangeUploadThreshold / MiB) *
        MiB;
    config.chunkRetries = j.value("chunk_retries", config.chunkRetries);
    config.progressStepPercent =
        j.value("progress_step_percent", config.progressStepPercent);
    config.verifyPrefixBytes =
        j.value("verify_prefix_bytes", config.verifyPrefixBytes);
    config.verifyRemoteOnStart =
        j.value("verify_remote_on_start", config.verifyRemoteOnStart);

    std::string policy =
        j.value("conflict_resolution", toString(config.conflictPolicy));
    if (auto parsed = parseConflictPolicy(policy)) {
      config.conflictPolicy = *parsed;
    } else {
      std::cerr << "[Config] Unknown conflict_resolution '" << policy
                << "', using ask" << std::endl;
    }

    config.cacheCapacity =
        j.value("checksum_cache_capacity", config.cacheCapacity);
    config.cacheEvictBatch =
        j.value("checksum_cache_evict_batch", config.cacheEvictBatch);
    config.persistInterval =
        seconds(j.value("persist_interval_s", config.persistInterval.count()));

    config.webdavUrl = j.value("webdav_url", config.webdavUrl);
    config.authType = j.value("webdav_auth_type", config.authType);
    config.username = j.value("webdav_username", config.username);
  } catch (const std::exception &e) {
    std::cerr << "[Config] Failed to parse " << path << ": " << e.what()
              << std::endl;
    return std::nullopt;
  }

  for (const auto &warning : config.validate()) {
    std::cout << "[Config] " << warning << std::endl;
  }
  return config;
}

bool saveConfig(const PipelineConfig &config, const std::string &path) {
  using namespace std::chrono;
  json j;
  j["local_directory"] = config.localDirectory;
  j["remote_path"] = config.remotePath;
  j["monitor_subdirs"] = config.recursive;
  j["extensions"] = config.extensions;
  j["preserve_structure"] = config.preserveStructure;
  j["stability_window_ms"] = config.stabilityWindow.count();
  j["stability_poll_ms"] = config.stabilityPollInterval.count();
  j["rescan_interval_s"] = config.rescanInterval.count();
  j["lock_initial_wait_s"] =
      duration_cast<seconds>(config.lockRetry.initialWait).count();
  j["lock_retry_interval_s"] =
      duration_cast<seconds>(config.lockRetry.retryInterval).count();
  j["lock_max_attempts"] = config.lockRetry.maxAttempts;
  j["chunk_tiers"] = json::array();
  for (const auto &tier : config.chunkTiers) {
    json t;
    if (tier.maxFileSize != std::numeric_limits<int64_t>::max())
      t["max_file_size"] = tier.maxFileSize;
    t["chunk_size"] = tier.chunkSize;
    j["chunk_tiers"].push_back(t);
  }
  j["range_upload_threshold_mb"] = config.rangeUploadThreshold / MiB;
  j["chunk_retries"] = config.chunkRetries;
  j["progress_step_percent"] = config.progressStepPercent;
  j["verify_prefix_bytes"] = config.verifyPrefixBytes;
  j["verify_remote_on_start"] = config.verifyRemoteOnStart;
  j["conflict_resolution"] = toString(config.conflictPolicy);
  j["checksum_cache_capacity"] = config.cacheCapacity;
  j["checksum_cache_evict_batch"] = config.cacheEvictBatch;
  j["persist_interval_s"] = config.persistInterval.count();
  j["webdav_url"] = config.webdavUrl;
  j["webdav_auth_type"] = config.authType;
  j["webdav_username"] = config.username;

  try {
    auto dir = fs::path(path).parent_path();
    if (!dir.empty())
      fs::create_directories(dir);
    std::ofstream ofs(path, std::ios::trunc);
    if (!ofs)
      return false;
    ofs << j.dump(2) << std::endl;
    return static_cast<bool>(ofs);
  } catch (const std::exception &e) {
    std::cerr << "[Config] Failed to save " << path << ": " << e.what()
              << std::endl;
    return false;
  }
}

} // namespace labxfer
