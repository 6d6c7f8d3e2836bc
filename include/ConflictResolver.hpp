#pragma once
#include "types.hpp"
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace labxfer {

/**
 * ConflictResolver decides what happens when local and remote content
 * diverge. Precedence: a per-file override, then the configured policy,
 * with the apply-to-all override answering anything that would otherwise
 * be deferred to the external party.
 */
class ConflictResolver {
public:
  // Timestamps closer than this are treated as equal by PreferNewer
  static constexpr int64_t kMtimeToleranceSeconds = 2;

  explicit ConflictResolver(ConflictPolicy policy);

  ConflictAction resolve(const std::string &path, const std::string &localDigest,
                         const std::string &remoteIdentifier,
                         ConflictPolicy policy,
                         std::optional<int64_t> remoteMtime = std::nullopt);
  ConflictAction resolve(const std::string &path, const std::string &localDigest,
                         const std::string &remoteIdentifier,
                         std::optional<int64_t> remoteMtime = std::nullopt);

  // One-shot decision for a single file, consumed by the next resolve().
  void setOverride(const std::string &path, ConflictAction action);
  void clearOverride(const std::string &path);

  void applyToAll(ConflictAction action);
  void clearApplyToAll();
  std::optional<ConflictAction> batchOverride() const;

  ConflictPolicy policy() const;
  void setPolicy(ConflictPolicy policy);

  static std::string renamedPath(const std::string &remotePath,
                                 int64_t unixSeconds);

private:
  ConflictPolicy m_policy;
  std::map<std::string, ConflictAction> m_overrides;
  std::optional<ConflictAction> m_applyToAll;
  mutable std::mutex m_mutex;
};

} // namespace labxfer
