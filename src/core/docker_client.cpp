// core/docker_client.cpp - Docker Engine API client implementation
#include "docker_client.hpp"
#include "../defs.hpp"
#include "../utils.hpp"
#include "errors.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

namespace sparkbox {

static std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::string HttpResponse::header(const std::string &name) const {
  auto it = headers.find(to_lower(name));
  return it == headers.end() ? "" : it->second;
}

bool parse_http_head(const std::string &head, int &status,
                     std::map<std::string, std::string> &headers) {
  std::istringstream ss(head);
  std::string line;
  if (!std::getline(ss, line))
    return false;
  if (!line.empty() && line.back() == '\r')
    line.pop_back();

  // HTTP/1.1 200 OK
  auto sp = line.find(' ');
  if (sp == std::string::npos || !starts_with(line, "HTTP/"))
    return false;
  try {
    status = std::stoi(line.substr(sp + 1, 3));
  } catch (const std::exception &) {
    return false;
  }

  while (std::getline(ss, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (line.empty())
      break;
    auto colon = line.find(':');
    if (colon == std::string::npos)
      continue;
    headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
  }
  return true;
}

bool ChunkedDecoder::feed(const char *data, size_t len, std::string &out) {
  size_t i = 0;
  while (i < len) {
    switch (state_) {
    case State::Size:
    case State::DataEnd:
    case State::Trailer: {
      char c = data[i++];
      if (c != '\n') {
        line_ += c;
        if (line_.size() > 1024)
          return false;
        break;
      }
      if (!line_.empty() && line_.back() == '\r')
        line_.pop_back();

      if (state_ == State::Size) {
        std::string size_str = line_.substr(0, line_.find(';'));
        size_str = trim(size_str);
        if (size_str.empty() || size_str.size() > 15 ||
            size_str.find_first_not_of("0123456789abcdefABCDEF") !=
                std::string::npos)
          return false;
        remaining_ = std::stoul(size_str, nullptr, 16);
        state_ = remaining_ == 0 ? State::Trailer : State::Data;
      } else if (state_ == State::DataEnd) {
        if (!line_.empty())
          return false;
        state_ = State::Size;
      } else if (line_.empty()) {
        state_ = State::Done;
      }
      line_.clear();
      break;
    }
    case State::Data: {
      size_t take = std::min(remaining_, len - i);
      out.append(data + i, take);
      i += take;
      remaining_ -= take;
      if (remaining_ == 0)
        state_ = State::DataEnd;
      break;
    }
    case State::Done:
      return true;
    }
  }
  return true;
}

std::string decode_chunked(const std::string &body) {
  ChunkedDecoder decoder;
  std::string out;
  if (!decoder.feed(body.data(), body.size(), out)) {
    throw RuntimeError("Malformed chunked response from container engine");
  }
  return out;
}

void FrameDecoder::feed(const std::string &data, std::deque<std::string> &out) {
  if (!multiplexed_) {
    if (!data.empty())
      out.push_back(data);
    return;
  }

  buffer_ += data;
  while (buffer_.size() >= 8) {
    const auto *hdr = reinterpret_cast<const unsigned char *>(buffer_.data());
    size_t size = (static_cast<size_t>(hdr[4]) << 24) |
                  (static_cast<size_t>(hdr[5]) << 16) |
                  (static_cast<size_t>(hdr[6]) << 8) |
                  static_cast<size_t>(hdr[7]);
    if (buffer_.size() < 8 + size)
      break;
    if (size > 0)
      out.push_back(buffer_.substr(8, size));
    buffer_.erase(0, 8 + size);
  }
}

namespace {

class DockerLogStream : public LogStream {
public:
  DockerLogStream(int fd, const std::string &initial, bool chunked,
                  bool multiplexed)
      : fd_(fd), chunked_(chunked), frames_(multiplexed) {
    if (!initial.empty())
      consume(initial.data(), initial.size());
  }

  ~DockerLogStream() override {
    close();
    ::close(fd_);
  }

  bool read(std::string &chunk) override {
    while (pending_.empty()) {
      if (closed_ || ended_)
        return false;

      char buf[8192];
      ssize_t n = recv(fd_, buf, sizeof(buf), 0);
      if (n < 0 && errno == EINTR)
        continue;
      if (n <= 0) {
        ended_ = true;
        return false;
      }
      consume(buf, static_cast<size_t>(n));
    }

    chunk = std::move(pending_.front());
    pending_.pop_front();
    return true;
  }

  void close() override {
    if (!closed_.exchange(true)) {
      shutdown(fd_, SHUT_RDWR);
    }
  }

private:
  void consume(const char *data, size_t len) {
    if (!chunked_) {
      frames_.feed(std::string(data, len), pending_);
      return;
    }
    std::string decoded;
    if (!chunked_decoder_.feed(data, len, decoded)) {
      LOG_WARN("Malformed chunked log stream, closing");
      ended_ = true;
    }
    frames_.feed(decoded, pending_);
    if (chunked_decoder_.done())
      ended_ = true;
  }

  int fd_;
  bool chunked_;
  bool ended_ = false;
  std::atomic<bool> closed_{false};
  ChunkedDecoder chunked_decoder_;
  FrameDecoder frames_;
  std::deque<std::string> pending_;
};

} // namespace

DockerClient::DockerClient(std::string socket_path)
    : socket_path_(std::move(socket_path)) {}

bool DockerClient::available() const {
  struct stat st;
  return stat(socket_path_.c_str(), &st) == 0 && S_ISSOCK(st.st_mode);
}

int DockerClient::connect_socket(int timeout_sec) const {
  if (socket_path_.size() >= sizeof(sockaddr_un::sun_path)) {
    throw RuntimeError("Docker socket path too long: " + socket_path_);
  }

  int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    throw RuntimeError("socket() failed: " + std::string(strerror(errno)));
  }

  if (timeout_sec > 0) {
    struct timeval tv {};
    tv.tv_sec = timeout_sec;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
  }

  sockaddr_un addr{};
  addr.sun_family = AF_UNIX;
  std::strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

  if (connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
    int err = errno;
    ::close(fd);
    throw RuntimeError("Cannot connect to container engine at " +
                       socket_path_ + ": " + strerror(err));
  }
  return fd;
}

static void send_all(int fd, const std::string &data) {
  size_t sent = 0;
  while (sent < data.size()) {
    ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      throw RuntimeError("send() to container engine failed: " +
                         std::string(strerror(errno)));
    }
    sent += static_cast<size_t>(n);
  }
}

static std::string build_request(const std::string &method,
                                 const std::string &target,
                                 const std::string &body) {
  std::string req = method + " /" + DOCKER_API_VERSION + target +
                    " HTTP/1.1\r\n"
                    "Host: docker\r\n"
                    "User-Agent: sparkbox\r\n"
                    "Connection: close\r\n";
  if (!body.empty()) {
    req += "Content-Type: application/json\r\n";
  }
  req += "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n";
  req += body;
  return req;
}

HttpResponse DockerClient::request(const std::string &method,
                                   const std::string &target,
                                   const std::string &body) const {
  int fd = connect_socket(120);

  std::string raw;
  try {
    send_all(fd, build_request(method, target, body));

    char buf[16384];
    while (true) {
      ssize_t n = recv(fd, buf, sizeof(buf), 0);
      if (n > 0) {
        raw.append(buf, static_cast<size_t>(n));
      } else if (n < 0 && errno == EINTR) {
        continue;
      } else if (n < 0) {
        throw RuntimeError("recv() from container engine failed: " +
                           std::string(strerror(errno)));
      } else {
        break;
      }
    }
  } catch (...) {
    ::close(fd);
    throw;
  }
  ::close(fd);

  auto head_end = raw.find("\r\n\r\n");
  if (head_end == std::string::npos) {
    throw RuntimeError("Truncated response from container engine");
  }

  HttpResponse response;
  if (!parse_http_head(raw.substr(0, head_end), response.status,
                       response.headers)) {
    throw RuntimeError("Malformed response from container engine");
  }

  response.body = raw.substr(head_end + 4);
  if (to_lower(response.header("transfer-encoding")) == "chunked") {
    response.body = decode_chunked(response.body);
  }

  LOG_DEBUG(method + " " + target + " -> " + std::to_string(response.status));
  return response;
}

std::unique_ptr<LogStream> DockerClient::open_stream(const std::string &target,
                                                     bool multiplexed,
                                                     int &status) const {
  int fd = connect_socket(30);

  std::string raw;
  size_t head_end = std::string::npos;
  try {
    send_all(fd, build_request("GET", target, ""));

    char buf[4096];
    while (head_end == std::string::npos) {
      ssize_t n = recv(fd, buf, sizeof(buf), 0);
      if (n < 0 && errno == EINTR)
        continue;
      if (n <= 0)
        throw RuntimeError("Container engine closed the log stream");
      raw.append(buf, static_cast<size_t>(n));
      head_end = raw.find("\r\n\r\n");
      if (head_end == std::string::npos && raw.size() > 65536)
        throw RuntimeError("Oversized response head from container engine");
    }
  } catch (...) {
    ::close(fd);
    throw;
  }

  std::map<std::string, std::string> headers;
  if (!parse_http_head(raw.substr(0, head_end), status, headers)) {
    ::close(fd);
    throw RuntimeError("Malformed response from container engine");
  }

  if (status < 200 || status >= 300) {
    ::close(fd);
    return nullptr;
  }

  // Following a log never times out
  struct timeval tv {};
  setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

  auto te = headers.find("transfer-encoding");
  bool chunked = te != headers.end() && to_lower(te->second) == "chunked";

  auto ct = headers.find("content-type");
  if (ct != headers.end() &&
      ct->second.find("multiplexed-stream") != std::string::npos) {
    multiplexed = true;
  }

  return std::make_unique<DockerLogStream>(fd, raw.substr(head_end + 4),
                                           chunked, multiplexed);
}

} // namespace sparkbox
