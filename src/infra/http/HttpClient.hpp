#pragma once

#include <string>
#include <string_view>

namespace lmv::infra::http {

struct Endpoint {
    std::string host;
    std::string port{"443"};
    bool tls{true};
};

enum class Method { Get, Post };

struct JsonResponse {
    unsigned status = 0U;
    std::string body;
    std::string final_target;
};

// Single request expecting a JSON payload. Follows same-origin redirects.
// Throws domain::TransportError on network errors.
JsonResponse request_json(const Endpoint& endpoint,
                          Method method,
                          const std::string& target,
                          const std::string& body = {},
                          int timeout_sec = 10);

// As request_json, but also throws domain::TransportError for HTTP status >= 400.
std::string get_json(const Endpoint& endpoint, const std::string& target, int timeout_sec = 10);
std::string post_json(const Endpoint& endpoint, const std::string& target, const std::string& body, int timeout_sec = 10);

std::string url_encode(std::string_view value);

}  // namespace lmv::infra::http
