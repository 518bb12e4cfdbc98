#pragma once

#include <string>

namespace vidingest::http {

/// @brief Per-request metadata used for logging, error responses and rate-limit identity.
struct RequestContext {
    std::string request_id;
    std::string method;
    std::string target;
    // host:port of the peer.
    std::string remote;
    // Peer address without the port.
    std::string remote_host;
};

}  // namespace vidingest::http
