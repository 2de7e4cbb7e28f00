// core/docker_client.hpp - Docker Engine API over the Unix socket
#pragma once

#include "orchestrator.hpp"
#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <string>

namespace sparkbox {

struct HttpResponse {
  int status = 0;
  std::map<std::string, std::string> headers; // lower-case names
  std::string body;

  std::string header(const std::string &name) const;
};

// Parses "HTTP/1.1 200 OK\r\nName: value\r\n..." (without the blank line).
bool parse_http_head(const std::string &head, int &status,
                     std::map<std::string, std::string> &headers);

// Incremental Transfer-Encoding: chunked decoder.
class ChunkedDecoder {
public:
  // Appends decoded payload to out. Returns false on malformed input.
  bool feed(const char *data, size_t len, std::string &out);
  bool done() const { return state_ == State::Done; }

private:
  enum class State { Size, Data, DataEnd, Trailer, Done };
  State state_ = State::Size;
  size_t remaining_ = 0;
  std::string line_;
};

// Splits the engine's multiplexed stdout/stderr framing
// ([stream][0][0][0][size:be32][payload]) into payloads.
class FrameDecoder {
public:
  explicit FrameDecoder(bool multiplexed) : multiplexed_(multiplexed) {}
  void feed(const std::string &data, std::deque<std::string> &out);

private:
  bool multiplexed_;
  std::string buffer_;
};

std::string decode_chunked(const std::string &body);

class DockerClient {
public:
  explicit DockerClient(std::string socket_path);

  bool available() const;

  HttpResponse request(const std::string &method, const std::string &target,
                       const std::string &body = "") const;

  // Opens a streaming GET and returns once the response head was read.
  // Non-2xx responses are returned through status with no stream.
  std::unique_ptr<LogStream> open_stream(const std::string &target,
                                         bool multiplexed, int &status) const;

private:
  int connect_socket(int timeout_sec) const;
  std::string socket_path_;
};

} // namespace sparkbox
