#pragma once

#include "types.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace labxfer {

struct ChunkTier {
  int64_t maxFileSize; // inclusive upper bound; the last tier is open-ended
  int64_t chunkSize;
};

struct LockRetrySettings {
  std::chrono::milliseconds initialWait{std::chrono::minutes(30)};
  std::chrono::milliseconds retryInterval{std::chrono::seconds(30)};
  int maxAttempts = 20;
};

/**
 * PipelineConfig enumerates every tunable of the transfer pipeline.
 * Loaded from config.json; see validate() for the accepted ranges.
 */
struct PipelineConfig {
  std::string localDirectory;
  std::string remotePath = "/";
  bool recursive = true;
  std::vector<std::string> extensions{"raw", "wiff", "wiff2", "sld", "mzML"};
  bool preserveStructure = true;

  std::chrono::milliseconds stabilityWindow{1000};
  std::chrono::milliseconds stabilityPollInterval{250};
  std::chrono::seconds rescanInterval{0}; // 0 disables the secondary rescan

  LockRetrySettings lockRetry;

  std::vector<ChunkTier> chunkTiers = defaultChunkTiers();
  int64_t rangeUploadThreshold = 10LL * 1024 * 1024;
  int chunkRetries = 3;
  int progressStepPercent = 25;

  int64_t verifyPrefixBytes = 8192;
  bool verifyRemoteOnStart = true; // check upload history against the server
  ConflictPolicy conflictPolicy = ConflictPolicy::AskExternal;

  std::size_t cacheCapacity = 1000;
  std::size_t cacheEvictBatch = 100;
  std::chrono::seconds persistInterval{300};

  std::string webdavUrl;
  std::string authType = "basic";
  std::string username;

  std::string stateDirectory;

  static std::vector<ChunkTier> defaultChunkTiers();

  // Clamps out-of-range values; returns one warning per adjustment.
  std::vector<std::string> validate();

  int64_t chunkSizeFor(int64_t fileSize) const;
};

std::optional<ConflictPolicy> parseConflictPolicy(const std::string &value);

std::string defaultStateDirectory();

// Missing file yields defaults; a malformed file is reported and yields
// std::nullopt.
std::optional<PipelineConfig> loadConfig(const std::string &path);
bool saveConfig(const PipelineConfig &config, const std::string &path);

} // namespace labxfer
