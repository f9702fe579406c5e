//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPFetcher.hpp
// Purpose: Outbound HTTP/HTTPS GET client (Boost.Beast) used by the fetch tool
//==========================================================================================================

#pragma once

#include <memory>
#include <string>

#include <boost/asio/awaitable.hpp>

namespace ssehost {

//==========================================================================================================
// HTTPFetcher
// Purpose: Issues GET requests on the calling coroutine's executor, following redirects.
// Notes:
//   - https:// targets use TLS 1.2+ with peer verification against the system trust store and SNI.
//   - Any non-2xx final status raises errors::FetchError carrying that status; transport failures
//     raise errors::FetchError with status 0.
//==========================================================================================================
class HTTPFetcher {
public:
    struct Options {
        std::string userAgent{"ModelContextProtocol/1.0 (ssehost fetch tool)"};
        int maxRedirects{20};
        int connectTimeoutMs{10000};
        int readTimeoutMs{30000};
        std::size_t bodyLimit{16u * 1024u * 1024u};
        // Optional CA overrides for https (empty means system defaults)
        std::string caFile;
        std::string caPath;
    };

    struct Response {
        unsigned int status{0};
        std::string body;
        std::string contentType;
        std::string finalUrl;
        int redirects{0};
    };

    HTTPFetcher();
    explicit HTTPFetcher(const Options& opts);
    ~HTTPFetcher();

    HTTPFetcher(const HTTPFetcher&) = delete;
    HTTPFetcher& operator=(const HTTPFetcher&) = delete;

    const Options& GetOptions() const;

    boost::asio::awaitable<Response> Get(std::string url);

    //==========================================================================================================
    // Resolves a Location header against the URL that produced it (absolute, scheme-relative,
    // absolute-path and relative-path forms).
    //==========================================================================================================
    static std::string ResolveLocation(const std::string& baseUrl, const std::string& location);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace ssehost
