#pragma once
#include "Config.hpp"
#include "RemoteStore.hpp"
#include "types.hpp"
#include <optional>
#include <string>

namespace labxfer {

enum class IdentityMatch { Equal, Different, Inconclusive };

/**
 * IntegrityVerifier confirms a remote object against the local file without
 * downloading it. Checks run cheapest first:
 *
 *  1. size via PROPFIND; a mismatch fails immediately
 *  2. strong identity: the ETag, then the <file>.checksum sidecar. Only an
 *     identifier of the same length as the local digest is conclusive, and
 *     the reason names the source that decided.
 *  3. accessibility: a ranged GET of the first bytes. This proves existence
 *     and readability, not content, and says so in its reason.
 */
class IntegrityVerifier {
public:
  IntegrityVerifier(RemoteStore &store, const PipelineConfig &config);

  VerifyResult verify(const std::string &localPath,
                      const std::string &remotePath,
                      const std::string &expectedDigest);

  // Checks an object already known to exist against an expected size and
  // digest, such as an upload history record.
  VerifyResult verifyExisting(const std::string &remotePath,
                              const RemoteFileInfo &remote,
                              int64_t expectedSize,
                              const std::string &expectedDigest);

  // Pre-upload comparison against an object that already exists. A size
  // difference counts as divergence here; no prefix read is made and an
  // inconclusive identity is reported as Accessible.
  VerifyResult compareExisting(const std::string &localPath,
                               const std::string &remotePath,
                               const std::string &localDigest,
                               const RemoteFileInfo &remote);

  static std::string cleanIdentifier(const std::string &raw);
  static IdentityMatch compareIdentifier(const std::string &remoteId,
                                         const std::string &localDigest);

private:
  RemoteStore &m_store;
  const PipelineConfig &m_config;

  std::optional<VerifyResult> checkIdentity(const std::string &remotePath,
                                            const RemoteFileInfo &remote,
                                            const std::string &digest);
  std::optional<VerifyResult> matchIdentifier(const std::string &source,
                                              const std::string &identifier,
                                              const RemoteFileInfo &remote,
                                              const std::string &digest) const;
  VerifyResult checkAccessible(const std::string &remotePath,
                               const RemoteFileInfo &remote);
};

} // namespace labxfer
