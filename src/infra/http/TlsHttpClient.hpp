#pragma once

#include <string>
#include <utility>
#include <vector>

namespace infra::http {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct HttpsRequest {
    std::string host;
    std::string port = "443";
    std::string target = "/";
    HeaderList headers;
    int timeoutSec = 10;
    // PEM trust anchors added to the system store; empty uses the system store only.
    std::string caFile;
};

// Blocking HTTPS GET over a fresh connection. The peer certificate must chain to a trusted
// root and name `host`. Returns the body of a 2xx response. Throws domain::UpstreamError:
// status 0 for transport or TLS failures, the HTTP status otherwise. Redirects are not followed.
std::string https_get_body(const HttpsRequest& request);

// Percent-encodes a query parameter value. Commas are kept for symbol lists.
std::string url_encode(const std::string& value);

}  // namespace infra::http
