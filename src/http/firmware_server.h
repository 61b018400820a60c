/**
 * @file firmware_server.h
 * @brief Minimal HTTP/1.1 server publishing one firmware image
 *
 * Serves GET and HEAD for /firmware.bin only; every other path is 404.
 * A single "Range: bytes=a-b" is honoured with 206. The image is read
 * once at start() and served from memory.
 *
 * The accept loop runs on its own thread and every connection gets a
 * short-lived worker thread, so the device can download while the session
 * consumer processes messages.
 */
#ifndef GRIDLINK_FIRMWARE_SERVER_H
#define GRIDLINK_FIRMWARE_SERVER_H

#include <stdint.h>
#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "gridlink_error.h"

namespace gridlink {
namespace http {

constexpr const char FIRMWARE_PATH[] = "/firmware.bin";

// Address other hosts on the LAN can reach us at; "127.0.0.1" when no
// route is available. Uses a connected UDP socket, sends nothing.
std::string detectLocalAddress();

class FirmwareServer {
 public:
  // Port 0 binds an ephemeral port; port() reports the one chosen.
  FirmwareServer(const std::string& image_path, uint16_t port);
  ~FirmwareServer();

  bool start(Error& error);
  void stop();

  bool isRunning() const { return _running.load(); }
  uint16_t port() const { return _port; }
  uint64_t imageSize() const { return _image.size(); }

  // http://<host>:<port>/firmware.bin
  std::string url(const std::string& host) const;

  uint32_t downloadsServed() const { return _served.load(); }

 private:
  FirmwareServer(const FirmwareServer&);
  FirmwareServer& operator=(const FirmwareServer&);

  void acceptLoop();
  void handleConnection(int fd, const std::string& peer);
  bool sendAll(int fd, const char* data, size_t length);
  void replyAndClose(int fd, int status, const std::string& extra_headers);

  std::string _image_path;
  uint16_t _port;
  std::vector<uint8_t> _image;
  int _listen_fd;
  std::atomic<bool> _running;
  std::atomic<uint32_t> _served;
  std::thread _acceptor;

  // Joined by stop(); a firmware push sees only a handful of connections.
  std::mutex _workers_mutex;
  std::vector<std::thread> _workers;
};

}  // namespace http
}  // namespace gridlink

#endif  // GRIDLINK_FIRMWARE_SERVER_H
