#include "IntegrityVerifier.hpp"
#include "FileSystemScanner.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <utility>
#include <vector>

namespace labxfer {

namespace {

std::string lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

VerifyResult makeResult(VerifyOutcome outcome, std::string reason) {
  VerifyResult result;
  result.outcome = outcome;
  result.reason = std::move(reason);
  return result;
}

} // namespace

IntegrityVerifier::IntegrityVerifier(RemoteStore &store,
                                     const PipelineConfig &config)
    : m_store(store), m_config(config) {}

std::string IntegrityVerifier::cleanIdentifier(const std::string &raw) {
  std::string value = raw;
  value.erase(0, value.find_first_not_of(" \t\r\n"));
  if (value.compare(0, 2, "W/") == 0)
    value.erase(0, 2);
  value.erase(std::remove(value.begin(), value.end(), '"'), value.end());
  // A sha256sum style line carries the file name after the digest
  auto space = value.find_first_of(" \t\r\n");
  if (space != std::string::npos)
    value.erase(space);
  return lower(value);
}

IdentityMatch IntegrityVerifier::compareIdentifier(const std::string &remoteId,
                                                   const std::string &localDigest) {
  std::string remote = cleanIdentifier(remoteId);
  std::string local = lower(localDigest);
  if (remote.empty() || remote.size() != local.size())
    return IdentityMatch::Inconclusive;
  return remote == local ? IdentityMatch::Equal : IdentityMatch::Different;
}

std::optional<VerifyResult>
IntegrityVerifier::checkIdentity(const std::string &remotePath,
                                 const RemoteFileInfo &remote,
                                 const std::string &digest) {
  // Server-computed ETag first; the sidecar only when the ETag is not comparable
  if (!remote.etag.empty()) {
    if (auto result = matchIdentifier("ETag", remote.etag, remote, digest))
      return result;
  }

  RemoteResponse sidecar = m_store.getText(remotePath + ".checksum");
  if (sidecar.ok())
    return matchIdentifier("stored checksum", sidecar.body, remote, digest);
  if (sidecar.status != 404)
    std::cout << "[Verify] Sidecar for " << remotePath
              << " unavailable: " << sidecar.describe() << std::endl;
  return std::nullopt;
}

std::optional<VerifyResult>
IntegrityVerifier::matchIdentifier(const std::string &source,
                                   const std::string &identifier,
                                   const RemoteFileInfo &remote,
                                   const std::string &digest) const {
  IdentityMatch match = compareIdentifier(identifier, digest);
  if (match == IdentityMatch::Inconclusive) {
    std::cout << "[Verify] " << source << " '" << cleanIdentifier(identifier)
              << "' not comparable with local digest" << std::endl;
    return std::nullopt;
  }

  VerifyResult result;
  result.remoteIdentifier = cleanIdentifier(identifier);
  result.remoteMtime = remote.lastModified;
  if (match == IdentityMatch::Equal) {
    result.outcome = VerifyOutcome::Verified;
    result.reason = "checksum verified via " + source;
  } else {
    result.outcome = VerifyOutcome::Divergent;
    result.reason = "remote content differs (" + source + " " +
                    result.remoteIdentifier.substr(0, 8) + "... vs local " +
                    digest.substr(0, 8) + "...)";
  }
  return result;
}

VerifyResult IntegrityVerifier::checkAccessible(const std::string &remotePath,
                                                const RemoteFileInfo &remote) {
  if (remote.size == 0) {
    return makeResult(VerifyOutcome::Accessible,
                      "remote file exists and is empty (existence only, "
                      "content not compared)");
  }

  int64_t length = std::min(m_config.verifyPrefixBytes, remote.size);
  RemoteResponse head = m_store.getRange(remotePath, 0, length);
  if (!head.ok() || head.body.empty()) {
    return makeResult(VerifyOutcome::Failed,
                      "remote file not readable: " + head.describe());
  }
  return makeResult(VerifyOutcome::Accessible,
                    "remote file accessible (" + std::to_string(remote.size) +
                        " bytes, size matched, first " +
                        std::to_string(head.body.size()) +
                        " bytes readable; content not compared)");
}

VerifyResult IntegrityVerifier::verify(const std::string &localPath,
                                       const std::string &remotePath,
                                       const std::string &expectedDigest) {
  auto local = FileSystemScanner::statFile(localPath);
  if (!local)
    return makeResult(VerifyOutcome::Failed, "local file not found");

  auto remote = m_store.stat(remotePath);
  if (!remote)
    return makeResult(VerifyOutcome::Failed, "remote metadata unavailable");
  if (!remote->exists)
    return makeResult(VerifyOutcome::Failed, "remote file not found");

  return verifyExisting(remotePath, *remote, local->size, expectedDigest);
}

VerifyResult IntegrityVerifier::verifyExisting(const std::string &remotePath,
                                               const RemoteFileInfo &remote,
                                               int64_t expectedSize,
                                               const std::string &expectedDigest) {
  if (remote.size != expectedSize) {
    VerifyResult result = makeResult(
        VerifyOutcome::SizeMismatch,
        "size mismatch: local=" + std::to_string(expectedSize) +
            ", remote=" + std::to_string(remote.size) + " bytes");
    result.remoteMtime = remote.lastModified;
    return result;
  }

  if (auto identity = checkIdentity(remotePath, remote, expectedDigest))
    return *identity;

  VerifyResult result = checkAccessible(remotePath, remote);
  result.remoteMtime = remote.lastModified;
  return result;
}

VerifyResult IntegrityVerifier::compareExisting(const std::string &localPath,
                                                const std::string &remotePath,
                                                const std::string &localDigest,
                                                const RemoteFileInfo &remote) {
  auto local = FileSystemScanner::statFile(localPath);
  if (!local)
    return makeResult(VerifyOutcome::Failed, "local file not found");

  if (remote.size != local->size) {
    VerifyResult result = makeResult(
        VerifyOutcome::Divergent,
        "remote file has different size: local=" +
            std::to_string(local->size) + ", remote=" +
            std::to_string(remote.size) + " bytes");
    if (auto identity = checkIdentity(remotePath, remote, localDigest))
      result.remoteIdentifier = identity->remoteIdentifier;
    else
      result.remoteIdentifier = cleanIdentifier(remote.etag);
    result.remoteMtime = remote.lastModified;
    return result;
  }

  if (auto identity = checkIdentity(remotePath, remote, localDigest))
    return *identity;

  VerifyResult result = makeResult(
      VerifyOutcome::Accessible,
      "remote file exists with the same size; no comparable identifier");
  result.remoteMtime = remote.lastModified;
  return result;
}

} // namespace labxfer
