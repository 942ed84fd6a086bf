#include "infra/http/TlsHttpClient.hpp"

#include <cctype>
#include <chrono>
#include <string>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/rfc2818_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/err.h>

#include "domain/Errors.h"

namespace infra::http {
namespace {

namespace beast = boost::beast;
namespace bhttp = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;

constexpr const char* kUserAgent = "tickwatch/0.1";

// Settings must be in place before the stream creates its SSL handle.
ssl::context verifyingContext(const HttpsRequest& request) {
    ssl::context context(ssl::context::tls_client);
    context.set_default_verify_paths();
    if (!request.caFile.empty()) {
        beast::error_code ec;
        context.load_verify_file(request.caFile, ec);
        if (ec) {
            throw domain::UpstreamError("cannot load CA file " + request.caFile + ": " + ec.message());
        }
    }
    context.set_verify_mode(ssl::verify_peer);
    return context;
}

// One request/response over its own TLS connection. Every step is bounded by the same timeout.
class TlsExchange {
public:
    explicit TlsExchange(const HttpsRequest& request)
        : request_(request), tls_(verifyingContext(request)), stream_(ioc_, tls_) {}

    bhttp::response<bhttp::string_body> run() {
        connect_();
        send_();
        auto response = receive_();
        close_();
        return response;
    }

private:
    [[noreturn]] void fail_(const std::string& step, const std::string& detail, unsigned status = 0U) const {
        throw domain::UpstreamError(
            "GET https://" + request_.host + request_.target + " " + step + ": " + detail, status);
    }

    void check_(const beast::error_code& ec, const char* step) const {
        if (ec) {
            fail_(step, ec.message());
        }
    }

    void arm_() {
        beast::get_lowest_layer(stream_).expires_after(std::chrono::seconds(request_.timeoutSec));
    }

    void connect_() {
        // SNI is required by most virtual-hosted API gateways.
        if (SSL_set_tlsext_host_name(stream_.native_handle(), request_.host.c_str()) != 1) {
            const unsigned long code = ::ERR_get_error();
            fail_("sni", code != 0 ? ::ERR_reason_error_string(code) : "rejected host name");
        }
        // The certificate must name the host the token is about to be sent to.
        stream_.set_verify_callback(ssl::rfc2818_verification(request_.host));

        beast::error_code ec;
        net::ip::tcp::resolver resolver(ioc_);
        const auto endpoints = resolver.resolve(request_.host, request_.port, ec);
        check_(ec, "resolve");

        arm_();
        beast::get_lowest_layer(stream_).connect(endpoints, ec);
        check_(ec, "connect");

        arm_();
        stream_.handshake(ssl::stream_base::client, ec);
        check_(ec, "handshake");
    }

    void send_() {
        bhttp::request<bhttp::empty_body> req{bhttp::verb::get, request_.target, 11};
        req.set(bhttp::field::host, request_.host);
        req.set(bhttp::field::user_agent, kUserAgent);
        req.set(bhttp::field::accept, "application/json");
        req.set(bhttp::field::connection, "close");
        for (const auto& header : request_.headers) {
            req.set(header.first, header.second);
        }

        beast::error_code ec;
        arm_();
        bhttp::write(stream_, req, ec);
        check_(ec, "write");
    }

    bhttp::response<bhttp::string_body> receive_() {
        beast::flat_buffer buffer;
        bhttp::response<bhttp::string_body> response;
        beast::error_code ec;
        arm_();
        bhttp::read(stream_, buffer, response, ec);
        check_(ec, "read");
        return response;
    }

    void close_() {
        beast::error_code ec;
        arm_();
        stream_.shutdown(ec);
        // Peers that drop the socket without close_notify are not an error for a completed read.
        if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
            fail_("shutdown", ec.message());
        }
    }

    const HttpsRequest& request_;
    net::io_context ioc_;
    ssl::context tls_;
    ssl::stream<beast::tcp_stream> stream_;
};

}  // namespace

std::string https_get_body(const HttpsRequest& request) {
    if (request.host.empty()) {
        throw domain::UpstreamError("HTTPS GET requires a host");
    }
    if (request.timeoutSec <= 0) {
        throw domain::UpstreamError("HTTPS GET to " + request.host + " needs a positive timeout");
    }

    HttpsRequest normalized = request;
    if (normalized.target.empty() || normalized.target.front() != '/') {
        normalized.target.insert(normalized.target.begin(), '/');
    }

    auto response = TlsExchange(normalized).run();
    const unsigned status = response.result_int();
    if (status / 100U == 2U) {
        return std::move(response.body());
    }

    std::string detail = "HTTP " + std::to_string(status);
    const auto retryAfter = response.base().find(bhttp::field::retry_after);
    if (status == 429U && retryAfter != response.base().end()) {
        detail += " retry-after " + std::string(retryAfter->value());
    }
    throw domain::UpstreamError("GET https://" + normalized.host + normalized.target + " returned " + detail, status);
}

std::string url_encode(const std::string& value) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size() * 3);
    for (const unsigned char c : value) {
        if (std::isalnum(c) != 0 || c == '-' || c == '_' || c == '.' || c == '~' || c == ',') {
            out.push_back(static_cast<char>(c));
            continue;
        }
        out.push_back('%');
        out.push_back(kHex[c >> 4]);
        out.push_back(kHex[c & 0x0F]);
    }
    return out;
}

}  // namespace infra::http
