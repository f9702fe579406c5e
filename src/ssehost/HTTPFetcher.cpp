//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/ssehost/HTTPFetcher.cpp
// Purpose: HTTP/HTTPS GET with redirect following using Boost.Beast coroutines
//==========================================================================================================

#include <cctype>
#include <chrono>
#include <format>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include "logging/Logger.h"
#include "ssehost/HTTPFetcher.hpp"
#include "ssehost/errors/Errors.h"

namespace ssehost {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

struct UrlParts {
    std::string scheme;
    std::string host;       // without IPv6 brackets
    std::string port;
    std::string authority;  // host[:port] as written, used for the Host header
    std::string target;     // path + query
};

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;
    const std::size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw errors::FetchError(url, 0, "Request URL is missing an 'http://' or 'https://' protocol.");
    }
    parts.scheme = url.substr(0, schemeEnd);
    for (auto& c : parts.scheme) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (parts.scheme != "http" && parts.scheme != "https") {
        throw errors::FetchError(url, 0, "Request URL has an unsupported protocol '" + parts.scheme + "://'.");
    }

    std::size_t pos = schemeEnd + 3;
    std::size_t end = url.find_first_of("/?#", pos);
    std::string hostPort = url.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
    std::string rest = end == std::string::npos ? std::string() : url.substr(end);

    // Drop userinfo
    const std::size_t at = hostPort.rfind('@');
    if (at != std::string::npos) {
        hostPort = hostPort.substr(at + 1);
    }

    if (!hostPort.empty() && hostPort.front() == '[') {
        const std::size_t close = hostPort.find(']');
        if (close == std::string::npos) {
            throw errors::FetchError(url, 0, "Invalid IPv6 host in URL");
        }
        parts.host = hostPort.substr(1, close - 1);
        if (close + 1 < hostPort.size() && hostPort[close + 1] == ':') {
            parts.port = hostPort.substr(close + 2);
        }
    } else {
        const std::size_t colon = hostPort.find(':');
        parts.host = hostPort.substr(0, colon);
        if (colon != std::string::npos) {
            parts.port = hostPort.substr(colon + 1);
        }
    }
    if (parts.host.empty()) {
        throw errors::FetchError(url, 0, "Request URL is missing a host");
    }
    if (parts.port.empty()) {
        parts.port = parts.scheme == "https" ? "443" : "80";
    }
    parts.authority = hostPort;

    const std::size_t hash = rest.find('#');
    if (hash != std::string::npos) {
        rest.erase(hash);
    }
    if (rest.empty() || rest.front() != '/') {
        rest.insert(0, "/");
    }
    parts.target = rest;
    return parts;
}

bool isRedirect(http::status s) {
    switch (s) {
        case http::status::moved_permanently:
        case http::status::found:
        case http::status::see_other:
        case http::status::temporary_redirect:
        case http::status::permanent_redirect:
            return true;
        default:
            return false;
    }
}

// Removes "." and ".." segments from the path part of a target, keeping any query intact.
std::string removeDotSegments(const std::string& target) {
    const std::size_t q = target.find('?');
    const std::string path = target.substr(0, q);
    const std::string query = q == std::string::npos ? std::string() : target.substr(q);

    if (path.empty() || path.front() != '/') {
        return "/" + path + query;
    }

    std::vector<std::string> segments;
    bool trailingSlash = false;
    std::size_t pos = 1;
    for (;;) {
        const std::size_t slash = path.find('/', pos);
        const bool last = slash == std::string::npos;
        const std::string seg = path.substr(pos, last ? std::string::npos : slash - pos);
        if (seg == "..") {
            if (!segments.empty()) segments.pop_back();
            trailingSlash = last;
        } else if (seg == ".") {
            trailingSlash = last;
        } else if (last) {
            if (seg.empty()) {
                trailingSlash = true;
            } else {
                segments.push_back(seg);
            }
        } else {
            segments.push_back(seg);
        }
        if (last) break;
        pos = slash + 1;
    }
    std::string out;
    for (const auto& seg : segments) {
        out += "/" + seg;
    }
    if (out.empty() || trailingSlash) {
        out += "/";
    }
    return out + query;
}

std::string statusFailureMessage(unsigned int code, const std::string& reason, const std::string& url) {
    const char* kind = "Error";
    if (code < 200) {
        kind = "Informational response";
    } else if (code < 400) {
        kind = "Redirect response";
    } else if (code < 500) {
        kind = "Client error";
    } else {
        kind = "Server error";
    }
    return std::format("{} '{} {}' for url '{}'", kind, code, reason, url);
}

} // namespace

class HTTPFetcher::Impl {
public:
    HTTPFetcher::Options opts;
    ssl::context sslCtx{ssl::context::tls_client};

    explicit Impl(const HTTPFetcher::Options& o) : opts(o) {
        ::SSL_CTX_set_min_proto_version(sslCtx.native_handle(), TLS1_2_VERSION);
        ::ERR_clear_error();
        if (!opts.caFile.empty() || !opts.caPath.empty()) {
            if (!opts.caFile.empty()) { sslCtx.load_verify_file(opts.caFile); }
            if (!opts.caPath.empty()) { sslCtx.add_verify_path(opts.caPath); }
        } else {
            boost::system::error_code ec;
            sslCtx.set_default_verify_paths(ec);
            if (ec) {
                LOG_DEBUG("HTTPS: set_default_verify_paths failed: {}", ec.message());
            }
        }
        sslCtx.set_verify_mode(ssl::verify_peer);
    }

    http::request<http::empty_body> makeRequest(const UrlParts& u) const {
        http::request<http::empty_body> req{http::verb::get, u.target, 11};
        req.set(http::field::host, u.authority);
        req.set(http::field::user_agent, opts.userAgent);
        req.set(http::field::accept, "*/*");
        req.set(http::field::connection, "close");
        return req;
    }

    template <class Stream>
    net::awaitable<http::response<http::string_body>> exchange(Stream& stream, boost::beast::tcp_stream& lowest,
                                                              const UrlParts& u) {
        auto req = makeRequest(u);
        lowest.expires_after(std::chrono::milliseconds(opts.readTimeoutMs));
        co_await http::async_write(stream, req, net::use_awaitable);
        boost::beast::flat_buffer buffer;
        http::response_parser<http::string_body> parser;
        parser.body_limit(opts.bodyLimit);
        co_await http::async_read(stream, buffer, parser, net::use_awaitable);
        co_return parser.release();
    }

    net::awaitable<http::response<http::string_body>> request(const UrlParts& u) {
        auto ex = co_await net::this_coro::executor;
        tcp::resolver resolver(ex);
        auto results = co_await resolver.async_resolve(u.host, u.port, net::use_awaitable);

        if (u.scheme == "https") {
            boost::beast::ssl_stream<boost::beast::tcp_stream> stream(ex, sslCtx);
            if (!::SSL_set_tlsext_host_name(stream.native_handle(), u.host.c_str()) ||
                !::SSL_set1_host(stream.native_handle(), u.host.c_str())) {
                throw boost::system::system_error(
                    boost::system::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()),
                    "failed to set TLS hostname");
            }
            stream.next_layer().expires_after(std::chrono::milliseconds(opts.connectTimeoutMs));
            co_await stream.next_layer().async_connect(results, net::use_awaitable);
            co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);
            auto res = co_await exchange(stream, stream.next_layer(), u);
            boost::system::error_code ec;
            stream.next_layer().socket().shutdown(tcp::socket::shutdown_both, ec);
            co_return res;
        }

        boost::beast::tcp_stream stream(ex);
        stream.expires_after(std::chrono::milliseconds(opts.connectTimeoutMs));
        co_await stream.async_connect(results, net::use_awaitable);
        auto res = co_await exchange(stream, stream, u);
        boost::system::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        co_return res;
    }

    net::awaitable<HTTPFetcher::Response> get(std::string url) {
        HTTPFetcher::Response out;
        for (;;) {
            const UrlParts u = parseUrl(url);
            http::response<http::string_body> res;
            std::string transportError;
            try {
                res = co_await request(u);
            } catch (const boost::system::system_error& e) {
                transportError = e.what();
            }
            if (!transportError.empty()) {
                LOG_DEBUG("GET {} failed: {}", url, transportError);
                throw errors::FetchError(url, 0, "GET " + url + " failed: " + transportError);
            }

            const unsigned int code = res.result_int();
            LOG_DEBUG("GET {} -> {}", url, code);
            if (isRedirect(res.result())) {
                auto loc = res.find(http::field::location);
                if (loc != res.end() && !loc->value().empty()) {
                    if (out.redirects >= opts.maxRedirects) {
                        throw errors::FetchError(url, code, "Exceeded maximum allowed redirects.");
                    }
                    ++out.redirects;
                    url = HTTPFetcher::ResolveLocation(url, std::string(loc->value()));
                    continue;
                }
            }

            if (code < 200 || code >= 300) {
                throw errors::FetchError(url, code, statusFailureMessage(code, std::string(http::obsolete_reason(res.result())), url));
            }

            out.status = code;
            out.finalUrl = url;
            auto ct = res.find(http::field::content_type);
            if (ct != res.end()) {
                out.contentType = std::string(ct->value());
            }
            out.body = std::move(res.body());
            co_return out;
        }
    }
};

HTTPFetcher::HTTPFetcher() : HTTPFetcher(Options{}) {}

HTTPFetcher::HTTPFetcher(const Options& opts) : pImpl(std::make_unique<Impl>(opts)) {}

HTTPFetcher::~HTTPFetcher() = default;

const HTTPFetcher::Options& HTTPFetcher::GetOptions() const {
    return pImpl->opts;
}

net::awaitable<HTTPFetcher::Response> HTTPFetcher::Get(std::string url) {
    return pImpl->get(std::move(url));
}

std::string HTTPFetcher::ResolveLocation(const std::string& baseUrl, const std::string& location) {
    if (location.find("://") != std::string::npos) {
        return location;
    }
    const UrlParts base = parseUrl(baseUrl);
    if (location.rfind("//", 0) == 0) {
        return base.scheme + ":" + location;
    }
    std::string origin = base.scheme + "://" + base.authority;
    if (!location.empty() && location.front() == '/') {
        return origin + removeDotSegments(location);
    }
    if (!location.empty() && location.front() == '?') {
        const std::size_t q = base.target.find('?');
        return origin + base.target.substr(0, q) + location;
    }
    std::string dir = base.target.substr(0, base.target.find('?'));
    dir.erase(dir.rfind('/') + 1);
    return origin + removeDotSegments(dir + location);
}

} // namespace ssehost
