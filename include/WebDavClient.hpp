#pragma once

#include "RemoteStore.hpp"
#include <memory>
#include <optional>
#include <string>

namespace labxfer {

    /**
     * WebDavClient talks to the WebDAV server.
     * Uses cpp-httplib for networking; PROPFIND, MKCOL and ranged requests
     * are sent as raw httplib requests.
     */
    class WebDavClient : public RemoteStore {
    public:
        WebDavClient(const std::string& url, const std::string& username,
                     const std::string& password, const std::string& authType = "basic");
        ~WebDavClient() override;

        // OPTIONS on the configured URL, then on <url>/webdav.
        bool testConnection();

        std::optional<RemoteFileInfo> stat(const std::string& path) override;
        RemoteResponse makeCollection(const std::string& path) override;
        RemoteResponse putStream(const std::string& path, std::istream& in,
                                 int64_t size) override;
        RemoteResponse putRange(const std::string& path, const char* data,
                                std::size_t length, int64_t offset,
                                int64_t total) override;
        RemoteResponse getRange(const std::string& path, int64_t offset,
                                int64_t length) override;
        RemoteResponse getText(const std::string& path) override;
        RemoteResponse putText(const std::string& path, const std::string& text) override;

        const std::string& basePath() const { return m_basePath; }

        // Helpers exposed for the PROPFIND parser
        static std::optional<std::string> extractProp(const std::string& xml,
                                                      const std::string& name);
        static std::optional<int64_t> parseHttpDate(const std::string& value);
        static std::optional<RemoteFileInfo> parsePropfind(const std::string& xml);

    private:
        struct Impl;
        std::unique_ptr<Impl> m_impl;
        std::string m_hostUrl;  // scheme://host[:port]
        std::string m_basePath; // path prefix of the DAV root, no trailing '/'

        std::string urlFor(const std::string& path) const;
    };

} // namespace labxfer
