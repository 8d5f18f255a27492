// Copyright (c) 2025 The pgprobe developers
// Distributed under the MIT software license

#include "network/http_transport.hpp"

#include "util/logging.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <functional>

#include <asio.hpp>

namespace pgprobe {
namespace network {

namespace {

struct ResponseHead {
  int status{0};
  size_t body_offset{0};
  std::optional<size_t> content_length;
  bool chunked{false};
};

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::string Trim(const std::string& s) {
  size_t b = s.find_first_not_of(" \t");
  if (b == std::string::npos)
    return "";
  size_t e = s.find_last_not_of(" \t");
  return s.substr(b, e - b + 1);
}

// Returns nullopt while the header block is incomplete. Sets error if it is malformed.
std::optional<ResponseHead> ParseHead(const std::string& raw, std::string& error) {
  size_t end = raw.find("\r\n\r\n");
  if (end == std::string::npos) {
    return std::nullopt;
  }

  ResponseHead head;
  head.body_offset = end + 4;

  size_t line_end = raw.find("\r\n");
  std::string status_line = raw.substr(0, line_end);
  // "HTTP/1.1 200 OK"
  if (!status_line.starts_with("HTTP/")) {
    error = "malformed status line";
    return std::nullopt;
  }
  size_t sp = status_line.find(' ');
  if (sp == std::string::npos || sp + 4 > status_line.size()) {
    error = "malformed status line";
    return std::nullopt;
  }
  const char* code_begin = status_line.data() + sp + 1;
  auto [ptr, ec] = std::from_chars(code_begin, code_begin + 3, head.status);
  if (ec != std::errc() || ptr != code_begin + 3) {
    error = "malformed status code";
    return std::nullopt;
  }

  size_t pos = line_end + 2;
  while (pos < end) {
    size_t next = raw.find("\r\n", pos);
    std::string line = raw.substr(pos, next - pos);
    pos = next + 2;

    size_t colon = line.find(':');
    if (colon == std::string::npos)
      continue;
    std::string name = ToLower(Trim(line.substr(0, colon)));
    std::string value = Trim(line.substr(colon + 1));

    if (name == "content-length") {
      size_t length = 0;
      auto [p, e] = std::from_chars(value.data(), value.data() + value.size(), length);
      if (e != std::errc() || p != value.data() + value.size()) {
        error = "malformed Content-Length";
        return std::nullopt;
      }
      head.content_length = length;
    } else if (name == "transfer-encoding" && ToLower(value).find("chunked") != std::string::npos) {
      head.chunked = true;
    }
  }

  return head;
}

bool DecodeChunked(const std::string& raw, size_t offset, std::string& body, std::string& error) {
  size_t pos = offset;
  while (true) {
    size_t line_end = raw.find("\r\n", pos);
    if (line_end == std::string::npos) {
      error = "truncated chunk header";
      return false;
    }
    std::string size_str = raw.substr(pos, line_end - pos);
    size_t semi = size_str.find(';');
    if (semi != std::string::npos)
      size_str = size_str.substr(0, semi);

    size_t chunk_size = 0;
    auto [p, e] = std::from_chars(size_str.data(), size_str.data() + size_str.size(), chunk_size, 16);
    if (e != std::errc() || size_str.empty()) {
      error = "malformed chunk size";
      return false;
    }
    pos = line_end + 2;
    if (chunk_size == 0) {
      return true;
    }
    if (pos + chunk_size + 2 > raw.size()) {
      error = "truncated chunk";
      return false;
    }
    body.append(raw, pos, chunk_size);
    pos += chunk_size + 2;
  }
}

std::string BuildRequest(const Endpoint& endpoint, const std::string& body) {
  std::string request;
  request.reserve(body.size() + 256);
  request += "POST " + endpoint.path + " HTTP/1.1\r\n";
  request += "Host: " + endpoint.host + ":" + std::to_string(endpoint.port) + "\r\n";
  request += "Content-Type: application/json\r\n";
  request += "Accept: application/json\r\n";
  request += "Content-Length: " + std::to_string(body.size()) + "\r\n";
  request += "Connection: close\r\n\r\n";
  request += body;
  return request;
}

}  // namespace

bool IsCompleteHttpResponse(const std::string& raw) {
  std::string error;
  auto head = ParseHead(raw, error);
  if (!head) {
    return false;
  }
  if (head->chunked) {
    return raw.find("\r\n0\r\n\r\n", head->body_offset - 2) != std::string::npos;
  }
  if (head->content_length) {
    return raw.size() - head->body_offset >= *head->content_length;
  }
  return false;
}

bool ParseHttpResponse(const std::string& raw, int& status, std::string& body, std::string& error) {
  auto head = ParseHead(raw, error);
  if (!head) {
    if (error.empty())
      error = "incomplete response headers";
    return false;
  }

  status = head->status;
  body.clear();

  if (head->chunked) {
    return DecodeChunked(raw, head->body_offset, body, error);
  }
  if (head->content_length) {
    if (raw.size() - head->body_offset < *head->content_length) {
      error = "truncated body (" + std::to_string(raw.size() - head->body_offset) + " of " +
              std::to_string(*head->content_length) + " bytes)";
      return false;
    }
    body = raw.substr(head->body_offset, *head->content_length);
    return true;
  }
  body = raw.substr(head->body_offset);
  return true;
}

TransportResponse HttpTransport::Post(const Endpoint& endpoint, const std::string& body,
                                      std::chrono::milliseconds timeout) {
  using asio::ip::tcp;

  TransportResponse response;
  asio::io_context io;
  tcp::resolver resolver(io);
  tcp::socket socket(io);

  const std::string request = BuildRequest(endpoint, body);
  std::string raw;
  std::array<char, 8192> buf{};
  std::string stage = "resolve";
  asio::error_code failure;
  bool finished = false;

  std::function<void()> read_more = [&]() {
    socket.async_read_some(asio::buffer(buf), [&](const asio::error_code& ec, size_t n) {
      raw.append(buf.data(), n);
      if (raw.size() > MAX_RESPONSE_SIZE) {
        stage = "read (response exceeds " + std::to_string(MAX_RESPONSE_SIZE) + " bytes)";
        failure = asio::error::message_size;
        return;
      }
      if (ec == asio::error::eof || (!ec && IsCompleteHttpResponse(raw))) {
        finished = true;
        return;
      }
      if (ec) {
        failure = ec;
        return;
      }
      read_more();
    });
  };

  resolver.async_resolve(endpoint.host, std::to_string(endpoint.port),
                         [&](const asio::error_code& ec, tcp::resolver::results_type results) {
                           if (ec) {
                             failure = ec;
                             return;
                           }
                           stage = "connect";
                           asio::async_connect(socket, results, [&](const asio::error_code& ec2, const tcp::endpoint&) {
                             if (ec2) {
                               failure = ec2;
                               return;
                             }
                             stage = "write";
                             asio::async_write(socket, asio::buffer(request), [&](const asio::error_code& ec3, size_t) {
                               if (ec3) {
                                 failure = ec3;
                                 return;
                               }
                               stage = "read";
                               read_more();
                             });
                           });
                         });

  io.run_for(timeout);
  if (!io.stopped()) {
    // Deadline hit with operations still pending: abort them and drain handlers
    asio::error_code ignored;
    resolver.cancel();
    socket.close(ignored);
    io.run();
    response.error = stage + " timed out after " + std::to_string(timeout.count()) + "ms";
    LOG_RPC_DEBUG("POST {} failed: {}", endpoint.ToString(), response.error);
    return response;
  }

  if (!finished) {
    response.error = stage + " failed: " + (failure ? failure.message() : std::string("connection closed"));
    LOG_RPC_DEBUG("POST {} failed: {}", endpoint.ToString(), response.error);
    return response;
  }

  asio::error_code ignored;
  socket.shutdown(tcp::socket::shutdown_both, ignored);
  socket.close(ignored);

  std::string parse_error;
  if (!ParseHttpResponse(raw, response.http_status, response.body, parse_error)) {
    response.error = "malformed HTTP response: " + parse_error;
    return response;
  }

  response.ok = true;
  return response;
}

std::optional<std::string> HttpTransport::Probe(const Endpoint& endpoint, std::chrono::milliseconds timeout) {
  using asio::ip::tcp;

  asio::io_context io;
  tcp::resolver resolver(io);
  tcp::socket socket(io);
  asio::error_code failure;
  bool connected = false;
  std::string stage = "resolve";

  resolver.async_resolve(endpoint.host, std::to_string(endpoint.port),
                         [&](const asio::error_code& ec, tcp::resolver::results_type results) {
                           if (ec) {
                             failure = ec;
                             return;
                           }
                           stage = "connect";
                           asio::async_connect(socket, results, [&](const asio::error_code& ec2, const tcp::endpoint&) {
                             if (ec2) {
                               failure = ec2;
                               return;
                             }
                             connected = true;
                           });
                         });

  io.run_for(timeout);
  if (!io.stopped()) {
    asio::error_code ignored;
    resolver.cancel();
    socket.close(ignored);
    io.run();
    return stage + " to " + endpoint.ToString() + " timed out after " + std::to_string(timeout.count()) + "ms";
  }

  asio::error_code ignored;
  socket.close(ignored);

  if (!connected) {
    return stage + " to " + endpoint.ToString() + " failed: " +
           (failure ? failure.message() : std::string("unknown error"));
  }
  return std::nullopt;
}

}  // namespace network
}  // namespace pgprobe
