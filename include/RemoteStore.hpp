#pragma once
#include "types.hpp"
#include <cstddef>
#include <istream>
#include <optional>
#include <string>

namespace labxfer {

struct RemoteResponse {
  int status = -1; // -1 when no HTTP response arrived
  std::string body;
  std::string error;

  bool ok() const { return status >= 200 && status < 300; }

  // Worth retrying: connection level failures, throttling and server side
  // errors other than insufficient storage.
  bool transient() const {
    if (status < 0)
      return true;
    if (status == 408 || status == 425 || status == 429)
      return true;
    return status >= 500 && status != 507;
  }

  std::string describe() const {
    if (status < 0)
      return error.empty() ? "no response" : error;
    return "HTTP " + std::to_string(status) + (error.empty() ? "" : ": " + error);
  }
};

/**
 * RemoteStore is the file protocol seam between the pipeline and the
 * server. WebDavClient implements it over HTTP.
 */
class RemoteStore {
public:
  virtual ~RemoteStore() = default;

  // std::nullopt when the request itself failed; exists == false on 404.
  virtual std::optional<RemoteFileInfo> stat(const std::string &path) = 0;
  virtual RemoteResponse makeCollection(const std::string &path) = 0;
  virtual RemoteResponse putStream(const std::string &path, std::istream &in,
                                   int64_t size) = 0;
  virtual RemoteResponse putRange(const std::string &path, const char *data,
                                  std::size_t length, int64_t offset,
                                  int64_t total) = 0;
  virtual RemoteResponse getRange(const std::string &path, int64_t offset,
                                  int64_t length) = 0;
  virtual RemoteResponse getText(const std::string &path) = 0;
  virtual RemoteResponse putText(const std::string &path,
                                 const std::string &text) = 0;
};

} // namespace labxfer
