// Copyright (c) 2025 The pgprobe developers
// Distributed under the MIT software license

#pragma once

#include "network/rpc_transport.hpp"

#include <cstddef>
#include <string>

namespace pgprobe {
namespace network {

// HttpTransport - JSON-RPC over HTTP/1.1 using asio TCP sockets.
// Every call runs on its own io_context so that the deadline (io_context::run_for)
// covers resolve, connect, write and read together. Requests carry
// "Connection: close"; the node's endpoint object is shared, the socket is not.
class HttpTransport : public RpcTransport {
public:
  HttpTransport() = default;
  ~HttpTransport() override = default;

  HttpTransport(const HttpTransport&) = delete;
  HttpTransport& operator=(const HttpTransport&) = delete;

  TransportResponse Post(const Endpoint& endpoint, const std::string& body,
                         std::chrono::milliseconds timeout) override;

  std::optional<std::string> Probe(const Endpoint& endpoint, std::chrono::milliseconds timeout) override;

  // Responses larger than this are treated as transport failures
  static constexpr size_t MAX_RESPONSE_SIZE = 10 * 1024 * 1024;
};

// True once raw holds a complete HTTP response (Content-Length satisfied or
// terminating chunk seen). Responses without framing complete only at EOF.
bool IsCompleteHttpResponse(const std::string& raw);

// Split a raw HTTP/1.1 response into status code and decoded body
// (Content-Length, chunked, or read-until-close framing).
// Returns false with error set when the response is malformed.
bool ParseHttpResponse(const std::string& raw, int& status, std::string& body, std::string& error);

}  // namespace network
}  // namespace pgprobe
