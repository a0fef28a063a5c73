#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace mcplink {
namespace test {

/**
 * Minimal blocking HTTP/1.1 server for tests.
 *
 * Every connection is served by its own thread and closed after one
 * exchange, so handlers may block (for example to keep an event stream
 * open) without holding up other requests. Handlers must return once
 * stopping() is true.
 */
class TestHttpServer {
 public:
  struct Request {
    std::string method;
    std::string target;  // Path and query as sent
    std::map<std::string, std::string> headers;  // Lower-case names
    std::string body;

    std::string header(const std::string& name) const {
      auto it = headers.find(name);
      return it == headers.end() ? std::string() : it->second;
    }
  };

  class Exchange {
   public:
    explicit Exchange(int fd) : fd_(fd) {}

    void respond(int status,
                 const std::string& content_type,
                 const std::string& body,
                 const std::map<std::string, std::string>& extra = {}) {
      std::ostringstream out;
      out << "HTTP/1.1 " << status << " " << reason(status) << "\r\n";
      if (!content_type.empty()) {
        out << "Content-Type: " << content_type << "\r\n";
      }
      for (const auto& header : extra) {
        out << header.first << ": " << header.second << "\r\n";
      }
      out << "Content-Length: " << body.size() << "\r\n";
      out << "Connection: close\r\n\r\n";
      out << body;
      write(out.str());
    }

    // Response without a length; the body runs until the connection closes
    bool beginStream(int status, const std::string& content_type) {
      std::ostringstream out;
      out << "HTTP/1.1 " << status << " " << reason(status) << "\r\n";
      out << "Content-Type: " << content_type << "\r\n";
      out << "Cache-Control: no-cache\r\n";
      out << "Connection: close\r\n\r\n";
      return write(out.str());
    }

    bool write(const std::string& data) {
      size_t sent = 0;
      while (sent < data.size()) {
        ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent,
                           MSG_NOSIGNAL);
        if (n <= 0) {
          return false;
        }
        sent += static_cast<size_t>(n);
      }
      return true;
    }

    // True once the peer has closed its side
    bool peerClosed() const {
      pollfd pfd{fd_, POLLIN, 0};
      if (::poll(&pfd, 1, 0) <= 0) {
        return false;
      }
      char c;
      return ::recv(fd_, &c, 1, MSG_PEEK | MSG_DONTWAIT) == 0;
    }

   private:
    static const char* reason(int status) {
      switch (status) {
        case 200:
          return "OK";
        case 202:
          return "Accepted";
        case 400:
          return "Bad Request";
        case 404:
          return "Not Found";
        case 405:
          return "Method Not Allowed";
        default:
          return "Error";
      }
    }

    int fd_;
  };

  using Handler = std::function<void(const Request&, Exchange&)>;

  explicit TestHttpServer(Handler handler) : handler_(std::move(handler)) {}

  ~TestHttpServer() { stop(); }

  bool start() {
    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd_ < 0) {
      return false;
    }
    int yes = 1;
    ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) !=
            0 ||
        ::listen(listen_fd_, 16) != 0) {
      return false;
    }
    socklen_t len = sizeof(addr);
    ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
    port_ = ntohs(addr.sin_port);

    accept_thread_ = std::thread([this]() { acceptLoop(); });
    return true;
  }

  void stop() {
    if (stopping_.exchange(true)) {
      return;
    }
    if (listen_fd_ >= 0) {
      ::shutdown(listen_fd_, SHUT_RDWR);
    }
    if (accept_thread_.joinable()) {
      accept_thread_.join();
    }
    if (listen_fd_ >= 0) {
      ::close(listen_fd_);
      listen_fd_ = -1;
    }

    std::vector<std::thread> workers;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (int fd : open_fds_) {
        ::shutdown(fd, SHUT_RDWR);
      }
      workers.swap(workers_);
    }
    for (auto& worker : workers) {
      worker.join();
    }
  }

  bool stopping() const { return stopping_; }
  int port() const { return port_; }

  std::string url(const std::string& path) const {
    return "http://127.0.0.1:" + std::to_string(port_) + path;
  }

 private:
  void acceptLoop() {
    while (!stopping_) {
      pollfd pfd{listen_fd_, POLLIN, 0};
      int ready = ::poll(&pfd, 1, 50);
      if (ready <= 0) {
        continue;
      }
      int fd = ::accept(listen_fd_, nullptr, nullptr);
      if (fd < 0) {
        continue;
      }
      std::lock_guard<std::mutex> lock(mutex_);
      open_fds_.push_back(fd);
      workers_.emplace_back([this, fd]() { serve(fd); });
    }
  }

  void serve(int fd) {
    Request request;
    if (readRequest(fd, request)) {
      Exchange exchange(fd);
      handler_(request, exchange);
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      open_fds_.erase(std::remove(open_fds_.begin(), open_fds_.end(), fd),
                      open_fds_.end());
    }
    ::close(fd);
  }

  static bool readRequest(int fd, Request& request) {
    std::string data;
    size_t header_end = std::string::npos;
    char buffer[4096];
    while (header_end == std::string::npos) {
      ssize_t n = ::recv(fd, buffer, sizeof(buffer), 0);
      if (n <= 0) {
        return false;
      }
      data.append(buffer, static_cast<size_t>(n));
      header_end = data.find("\r\n\r\n");
    }

    std::istringstream head(data.substr(0, header_end));
    std::string line;
    std::getline(head, line);
    std::istringstream request_line(line);
    request_line >> request.method >> request.target;

    while (std::getline(head, line)) {
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      auto colon = line.find(':');
      if (colon == std::string::npos) {
        continue;
      }
      std::string name = line.substr(0, colon);
      std::transform(name.begin(), name.end(), name.begin(),
                     [](unsigned char c) { return std::tolower(c); });
      std::string value = line.substr(colon + 1);
      value.erase(0, value.find_first_not_of(' '));
      request.headers[name] = value;
    }

    size_t length = 0;
    auto it = request.headers.find("content-length");
    if (it != request.headers.end()) {
      length = std::stoul(it->second);
    }
    request.body = data.substr(header_end + 4);
    while (request.body.size() < length) {
      ssize_t n = ::recv(fd, buffer, sizeof(buffer), 0);
      if (n <= 0) {
        return false;
      }
      request.body.append(buffer, static_cast<size_t>(n));
    }
    return true;
  }

  Handler handler_;
  int listen_fd_{-1};
  int port_{0};
  std::atomic<bool> stopping_{false};
  std::thread accept_thread_;
  std::mutex mutex_;
  std::vector<int> open_fds_;
  std::vector<std::thread> workers_;
};

}  // namespace test
}  // namespace mcplink
