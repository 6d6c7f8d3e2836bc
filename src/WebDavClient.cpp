#include "WebDavClient.hpp"
#include "httplib.h"
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace labxfer {

namespace {

// Percent-encodes one path, keeping '/' separators
std::string urlEncodePath(const std::string &value) {
  std::ostringstream escaped;
  escaped.fill('0');
  escaped << std::hex;

  for (auto i = value.begin(), n = value.end(); i != n; ++i) {
    std::string::value_type c = (*i);
    // Keep alphanumeric and other safe characters
    if (isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' ||
        c == '.' || c == '~' || c == '/') {
      escaped << c;
      continue;
    }
    // Any other characters are percent-encoded
    escaped << std::uppercase;
    escaped << '%' << std::setw(2) << int((unsigned char)c);
    escaped << std::nouppercase;
  }

  return escaped.str();
}

std::string xmlUnescape(std::string value) {
  const std::pair<const char *, const char *> entities[] = {
      {"&quot;", "\""}, {"&apos;", "'"}, {"&lt;", "<"}, {"&gt;", ">"},
      {"&amp;", "&"}};
  for (const auto &entity : entities) {
    std::string from = entity.first;
    std::size_t pos = 0;
    while ((pos = value.find(from, pos)) != std::string::npos) {
      value.replace(pos, from.size(), entity.second);
      pos += 1;
    }
  }
  return value;
}

RemoteResponse fromResult(const httplib::Result &res) {
  RemoteResponse response;
  if (!res) {
    response.error = httplib::to_string(res.error());
    return response;
  }
  response.status = res->status;
  response.body = res->body;
  if (!response.ok())
    response.error = res->reason;
  return response;
}

const char *kPropfindBody = R"(<?xml version="1.0" encoding="utf-8"?>
<propfind xmlns="DAV:">
  <prop>
    <resourcetype/>
    <getcontentlength/>
    <getlastmodified/>
    <getetag/>
  </prop>
</propfind>)";

} // namespace

struct WebDavClient::Impl {
  httplib::Client client;
  Impl(const std::string &hostUrl) : client(hostUrl) {
    // https without OpenSSL support leaves the client without a backend
    if (!client.is_valid())
      throw std::invalid_argument("unsupported WebDAV URL: " + hostUrl);
    client.set_connection_timeout(30, 0);
    client.set_read_timeout(60, 0);
    client.set_write_timeout(60, 0);
    client.set_follow_location(true);
    client.set_keep_alive(true);
  }
};

WebDavClient::WebDavClient(const std::string &url, const std::string &username,
                           const std::string &password,
                           const std::string &authType) {
  auto schemeEnd = url.find("://");
  auto pathStart = url.find('/', schemeEnd == std::string::npos ? 0 : schemeEnd + 3);
  if (pathStart == std::string::npos) {
    m_hostUrl = url;
  } else {
    m_hostUrl = url.substr(0, pathStart);
    m_basePath = url.substr(pathStart);
  }
  while (!m_basePath.empty() && m_basePath.back() == '/')
    m_basePath.pop_back();

  m_impl = std::make_unique<Impl>(m_hostUrl);
  if (authType == "digest") {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    m_impl->client.set_digest_auth(username, password);
#else
    std::cerr << "[DAV] Digest auth needs cpp-httplib with OpenSSL, using basic"
              << std::endl;
    m_impl->client.set_basic_auth(username, password);
#endif
  } else if (!username.empty()) {
    m_impl->client.set_basic_auth(username, password);
  }
}

WebDavClient::~WebDavClient() = default;

std::string WebDavClient::urlFor(const std::string &path) const {
  std::string normalized = path.empty() || path.front() != '/' ? "/" + path : path;
  return urlEncodePath(m_basePath + normalized);
}

bool WebDavClient::testConnection() {
  auto tryBase = [this](const std::string &basePath) {
    httplib::Request req;
    req.method = "OPTIONS";
    req.path = urlEncodePath(basePath.empty() ? "/" : basePath);
    auto res = m_impl->client.send(req);
    int status = res ? res->status : -1;
    std::cout << "[DAV] OPTIONS " << m_hostUrl << req.path << " returned "
              << status << std::endl;
    return status == 200 || status == 204 || status == 207;
  };

  try {
    if (tryBase(m_basePath))
      return true;

    const std::string suffix = "/webdav";
    if (m_basePath.size() < suffix.size() ||
        m_basePath.compare(m_basePath.size() - suffix.size(), suffix.size(),
                           suffix) != 0) {
      std::string candidate = m_basePath + suffix;
      if (tryBase(candidate)) {
        std::cout << "[DAV] Connection successful, using endpoint "
                  << m_hostUrl << candidate << std::endl;
        m_basePath = candidate;
        return true;
      }
    }
  } catch (const std::exception &e) {
    std::cerr << "[DAV] Connection test failed: " << e.what() << std::endl;
  }
  std::cerr << "[DAV] No valid WebDAV endpoint found at " << m_hostUrl
            << m_basePath << std::endl;
  return false;
}

std::optional<std::string> WebDavClient::extractProp(const std::string &xml,
                                                     const std::string &name) {
  // Matches <name>, <d:name>, <D:name attr="..."> regardless of prefix
  std::regex pattern("<(?:[A-Za-z0-9_.-]+:)?" + name +
                         R"((?:\s[^>]*)?>([^<]*)</(?:[A-Za-z0-9_.-]+:)?)" +
                         name + R"(\s*>)",
                     std::regex::icase);
  std::smatch match;
  if (!std::regex_search(xml, match, pattern))
    return std::nullopt;
  std::string value = xmlUnescape(match[1].str());
  value.erase(0, value.find_first_not_of(" \t\r\n"));
  value.erase(value.find_last_not_of(" \t\r\n") + 1);
  return value;
}

std::optional<int64_t> WebDavClient::parseHttpDate(const std::string &value) {
  std::tm tm{};
  std::istringstream in(value);
  in.imbue(std::locale::classic());
  in >> std::get_time(&tm, "%a, %d %b %Y %H:%M:%S");
  if (in.fail())
    return std::nullopt;
  return static_cast<int64_t>(timegm(&tm));
}

std::optional<RemoteFileInfo>
WebDavClient::parsePropfind(const std::string &xml) {
  RemoteFileInfo info;
  info.exists = true;
  if (auto length = extractProp(xml, "getcontentlength")) {
    try {
      info.size = length->empty() ? 0 : std::stoll(*length);
    } catch (const std::exception &) {
      return std::nullopt;
    }
  }
  if (auto etag = extractProp(xml, "getetag"))
    info.etag = *etag;
  if (auto modified = extractProp(xml, "getlastmodified"))
    info.lastModified = parseHttpDate(*modified);
  return info;
}

std::optional<RemoteFileInfo> WebDavClient::stat(const std::string &path) {
  httplib::Request req;
  req.method = "PROPFIND";
  req.path = urlFor(path);
  req.headers = {{"Depth", "0"}};
  req.body = kPropfindBody;
  req.set_header("Content-Type", "application/xml");

  auto res = m_impl->client.send(req);
  if (!res) {
    std::cerr << "[DAV] PROPFIND " << path
              << " failed: " << httplib::to_string(res.error()) << std::endl;
    return std::nullopt;
  }
  if (res->status == 404) {
    RemoteFileInfo missing;
    missing.exists = false;
    return missing;
  }
  if (res->status != 207 && res->status != 200) {
    std::cerr << "[DAV] PROPFIND " << path << " returned " << res->status
              << std::endl;
    return std::nullopt;
  }
  auto info = parsePropfind(res->body);
  if (!info)
    std::cerr << "[DAV] Unparsable PROPFIND response for " << path << std::endl;
  return info;
}

RemoteResponse WebDavClient::makeCollection(const std::string &path) {
  httplib::Request req;
  req.method = "MKCOL";
  req.path = urlFor(path);
  auto response = fromResult(m_impl->client.send(req));
  std::cout << "[DAV] MKCOL " << path << " -> " << response.status
            << std::endl;
  return response;
}

RemoteResponse WebDavClient::putStream(const std::string &path,
                                       std::istream &in, int64_t size) {
  if (size == 0) {
    return fromResult(
        m_impl->client.Put(urlFor(path), std::string(), "application/octet-stream"));
  }

  std::vector<char> buffer(256 * 1024);
  auto res = m_impl->client.Put(
      urlFor(path), static_cast<size_t>(size),
      [&](size_t offset, size_t length, httplib::DataSink &sink) {
        in.clear();
        in.seekg(static_cast<std::streamoff>(offset));
        size_t want = std::min(length, buffer.size());
        in.read(buffer.data(), static_cast<std::streamsize>(want));
        auto got = in.gcount();
        if (got <= 0)
          return false;
        return sink.write(buffer.data(), static_cast<size_t>(got));
      },
      "application/octet-stream");
  return fromResult(res);
}

RemoteResponse WebDavClient::putRange(const std::string &path, const char *data,
                                      std::size_t length, int64_t offset,
                                      int64_t total) {
  int64_t last = offset + static_cast<int64_t>(length) - 1;
  httplib::Headers headers = {
      {"Content-Range", "bytes " + std::to_string(offset) + "-" +
                            std::to_string(last) + "/" + std::to_string(total)}};
  return fromResult(m_impl->client.Put(urlFor(path), headers,
                                       std::string(data, length),
                                       "application/octet-stream"));
}

RemoteResponse WebDavClient::getRange(const std::string &path, int64_t offset,
                                      int64_t length) {
  httplib::Headers headers = {
      {"Range", "bytes=" + std::to_string(offset) + "-" +
                    std::to_string(offset + length - 1)}};
  std::string body;
  auto limit = static_cast<std::size_t>(length);
  auto res = m_impl->client.Get(
      urlFor(path), headers, [&](const char *data, size_t dataLength) {
        // Servers that ignore Range would stream the whole object
        body.append(data, std::min(dataLength, limit - body.size()));
        return body.size() < limit;
      });

  RemoteResponse response;
  if (res) {
    response.status = res->status;
    if (!response.ok())
      response.error = res->reason;
  } else if (res.error() == httplib::Error::Canceled && !body.empty()) {
    response.status = 206;
  } else {
    response.error = httplib::to_string(res.error());
  }
  response.body = std::move(body);
  return response;
}

RemoteResponse WebDavClient::getText(const std::string &path) {
  return fromResult(m_impl->client.Get(urlFor(path)));
}

RemoteResponse WebDavClient::putText(const std::string &path,
                                     const std::string &text) {
  return fromResult(m_impl->client.Put(urlFor(path), text, "text/plain"));
}

} // namespace labxfer
