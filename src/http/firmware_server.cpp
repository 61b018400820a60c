#include "firmware_server.h"

#include <string.h>
#include <errno.h>
#include <unistd.h>
#include <poll.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>

#include <algorithm>

#include <spdlog/spdlog.h>

#include "config/gridlink_config.h"
#include "http/http_message.h"
#include "storage/artifact_writer.h"

namespace gridlink {
namespace http {

namespace {

constexpr int ACCEPT_POLL_MS = 200;
constexpr int LISTEN_BACKLOG = 8;
constexpr time_t RECV_TIMEOUT_S = 5;
constexpr time_t SEND_TIMEOUT_S = 30;

void setTimeout(int fd, int option, time_t seconds) {
  struct timeval tv;
  tv.tv_sec = seconds;
  tv.tv_usec = 0;
  if (setsockopt(fd, SOL_SOCKET, option, &tv, sizeof(tv)) != 0) {
    spdlog::debug("setsockopt timeout failed: {}", strerror(errno));
  }
}

}  // namespace

std::string detectLocalAddress() {
  const std::string fallback = "127.0.0.1";
  const int fd = socket(AF_INET, SOCK_DGRAM, 0);
  if (fd < 0) {
    return fallback;
  }

  struct sockaddr_in remote;
  memset(&remote, 0, sizeof(remote));
  remote.sin_family = AF_INET;
  remote.sin_port = htons(80);
  inet_pton(AF_INET, "8.8.8.8", &remote.sin_addr);

  std::string result = fallback;
  if (connect(fd, reinterpret_cast<struct sockaddr*>(&remote), sizeof(remote)) == 0) {
    struct sockaddr_in local;
    socklen_t len = sizeof(local);
    char text[INET_ADDRSTRLEN];
    if (getsockname(fd, reinterpret_cast<struct sockaddr*>(&local), &len) == 0 &&
        inet_ntop(AF_INET, &local.sin_addr, text, sizeof(text)) != nullptr) {
      result = text;
    }
  }
  close(fd);
  return result;
}

FirmwareServer::FirmwareServer(const std::string& image_path, uint16_t port)
  : _image_path(image_path)
  , _port(port)
  , _image()
  , _listen_fd(-1)
  , _running(false)
  , _served(0)
  , _acceptor()
  , _workers_mutex()
  , _workers()
{
}

FirmwareServer::~FirmwareServer() {
  stop();
}

bool FirmwareServer::start(Error& error) {
  if (_running.load()) {
    return true;
  }
  if (!storage::readFile(_image_path, _image, error)) {
    return false;
  }

  _listen_fd = socket(AF_INET, SOCK_STREAM, 0);
  if (_listen_fd < 0) {
    error = Error(ErrorCode::IO, std::string("socket: ") + strerror(errno));
    return false;
  }
  const int reuse = 1;
  if (setsockopt(_listen_fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) != 0) {
    spdlog::debug("SO_REUSEADDR failed: {}", strerror(errno));
  }

  struct sockaddr_in addr;
  memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  addr.sin_port = htons(_port);
  if (bind(_listen_fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0 ||
      listen(_listen_fd, LISTEN_BACKLOG) != 0) {
    error = Error(ErrorCode::IO, "cannot listen on port " + std::to_string(_port) + ": " +
                                     strerror(errno));
    close(_listen_fd);
    _listen_fd = -1;
    return false;
  }

  socklen_t len = sizeof(addr);
  if (getsockname(_listen_fd, reinterpret_cast<struct sockaddr*>(&addr), &len) == 0) {
    _port = ntohs(addr.sin_port);
  }

  _running.store(true);
  _acceptor = std::thread(&FirmwareServer::acceptLoop, this);
  spdlog::info("HTTP server started on port {} serving {} ({} bytes)", _port, _image_path,
               _image.size());
  return true;
}

void FirmwareServer::stop() {
  const bool was_running = _running.exchange(false);
  if (_acceptor.joinable()) {
    _acceptor.join();
  }
  if (_listen_fd >= 0) {
    close(_listen_fd);
    _listen_fd = -1;
  }

  std::vector<std::thread> workers;
  {
    std::lock_guard<std::mutex> lock(_workers_mutex);
    workers.swap(_workers);
  }
  for (size_t i = 0; i < workers.size(); ++i) {
    if (workers[i].joinable()) {
      workers[i].join();
    }
  }
  if (was_running) {
    spdlog::info("HTTP server stopped");
  }
}

std::string FirmwareServer::url(const std::string& host) const {
  return "http://" + host + ":" + std::to_string(_port) + FIRMWARE_PATH;
}

void FirmwareServer::acceptLoop() {
  while (_running.load()) {
    struct pollfd pfd;
    pfd.fd = _listen_fd;
    pfd.events = POLLIN;
    pfd.revents = 0;
    const int ready = poll(&pfd, 1, ACCEPT_POLL_MS);
    if (ready <= 0) {
      continue;
    }

    struct sockaddr_in peer;
    socklen_t len = sizeof(peer);
    const int fd = accept(_listen_fd, reinterpret_cast<struct sockaddr*>(&peer), &len);
    if (fd < 0) {
      if (errno != EINTR && errno != EAGAIN) {
        spdlog::warn("accept failed: {}", strerror(errno));
      }
      continue;
    }

    char text[INET_ADDRSTRLEN] = "?";
    inet_ntop(AF_INET, &peer.sin_addr, text, sizeof(text));
    setTimeout(fd, SO_RCVTIMEO, RECV_TIMEOUT_S);
    setTimeout(fd, SO_SNDTIMEO, SEND_TIMEOUT_S);

    std::lock_guard<std::mutex> lock(_workers_mutex);
    _workers.push_back(std::thread(&FirmwareServer::handleConnection, this, fd, std::string(text)));
  }
}

bool FirmwareServer::sendAll(int fd, const char* data, size_t length) {
  size_t sent = 0;
  while (sent < length) {
    const size_t step = std::min<size_t>(length - sent, GRIDLINK_HTTP_IO_CHUNK_BYTES);
    const ssize_t n = send(fd, data + sent, step, MSG_NOSIGNAL);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      return false;
    }
    sent += static_cast<size_t>(n);
  }
  return true;
}

void FirmwareServer::replyAndClose(int fd, int status, const std::string& extra_headers) {
  const std::string reply = responseHead(status, 0, extra_headers);
  if (!sendAll(fd, reply.data(), reply.size())) {
    spdlog::debug("Could not send {} reply: {}", status, strerror(errno));
  }
  close(fd);
}

void FirmwareServer::handleConnection(int fd, const std::string& peer) {
  std::string head;
  char buf[1024];
  size_t end = std::string::npos;
  while ((end = head.find("\r\n\r\n")) == std::string::npos) {
    if (head.size() > GRIDLINK_HTTP_MAX_REQUEST_BYTES) {
      replyAndClose(fd, 431, "");
      return;
    }
    const ssize_t n = recv(fd, buf, sizeof(buf), 0);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      close(fd);
      return;
    }
    head.append(buf, static_cast<size_t>(n));
  }
  head.erase(end);

  Request request;
  if (!parseRequestHead(head, request)) {
    replyAndClose(fd, 400, "");
    return;
  }
  if (request.method != "GET" && request.method != "HEAD") {
    replyAndClose(fd, 405, "Allow: GET, HEAD\r\n");
    return;
  }
  if (request.path != FIRMWARE_PATH) {
    spdlog::debug("404 for {} from {}", request.path, peer);
    replyAndClose(fd, 404, "");
    return;
  }

  const uint64_t size = _image.size();
  int status = 200;
  ByteRange range;
  range.first = 0;
  range.last = size == 0 ? 0 : size - 1;
  uint64_t length = size;
  std::string extra = "Content-Type: application/octet-stream\r\nAccept-Ranges: bytes\r\n";

  if (request.range.has_value()) {
    ByteRange wanted;
    switch (parseByteRange(request.range.value(), size, wanted)) {
      case RangeParse::OK:
        status = 206;
        range = wanted;
        length = range.length();
        extra += "Content-Range: bytes " + std::to_string(range.first) + "-" +
                 std::to_string(range.last) + "/" + std::to_string(size) + "\r\n";
        break;
      case RangeParse::UNSATISFIABLE: {
        replyAndClose(fd, 416, "Content-Range: bytes */" + std::to_string(size) + "\r\n");
        return;
      }
      case RangeParse::MALFORMED:
        spdlog::debug("Ignoring unsupported Range '{}' from {}", request.range.value(), peer);
        break;
    }
  }

  const std::string reply = responseHead(status, length, extra);
  bool ok = sendAll(fd, reply.data(), reply.size());
  if (ok && request.method == "GET" && length > 0) {
    ok = sendAll(fd, reinterpret_cast<const char*>(_image.data()) + range.first,
                 static_cast<size_t>(length));
  }
  if (!ok) {
    spdlog::warn("Firmware download by {} interrupted: {}", peer, strerror(errno));
    close(fd);
    return;
  }
  // Counted before close so a client that saw EOF sees the count.
  if (request.method == "GET") {
    _served++;
  }
  close(fd);
  if (request.method == "GET") {
    spdlog::info("Served firmware to {} ({} bytes{})", peer, length, status == 206 ? ", partial" : "");
  }
}

}  // namespace http
}  // namespace gridlink
