#pragma once

/**
 * @file http_client.h
 * @brief Blocking libcurl helpers for request/response and streamed bodies
 */

#include "core/types.h"
#include <functional>
#include <string>
#include <vector>

namespace parley {
namespace http {

struct Request {
    std::string url;
    std::string method = "GET";
    std::string body;
    std::vector<std::string> headers;   ///< "Name: value"
    long timeout_ms = 15000;
    long connect_timeout_ms = 5000;
    size_t max_bytes = 0;               ///< 0 = unlimited; larger bodies fail the request

    /// Polled while the transfer runs; returning true aborts it
    std::function<bool()> cancelled;
};

struct Response {
    long status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

/// Called per received chunk; return false to abort the transfer
using ChunkCallback = std::function<bool(const char* data, size_t size)>;

/**
 * @brief Perform a request and collect the whole body
 * @return Response (any HTTP status), or an error for transport failures
 */
Result<Response> perform(const Request& request);

/**
 * @brief Perform a request and hand the body to on_chunk as it arrives
 * @return HTTP status, or an error for transport failures or aborts
 */
Result<long> perform_streaming(const Request& request, const ChunkCallback& on_chunk);

} // namespace http
} // namespace parley
