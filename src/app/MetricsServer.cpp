#include "app/MetricsServer.hpp"
#include <liburing.h>
#include <sys/socket.h>
#include <sys/eventfd.h>
#include <sys/uio.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <charconv>

namespace glustat::app {

// Tags for distinguishing CQE sources
enum class UringTag : uint64_t { ListenPoll = 1, StopPoll = 2 };

static std::string http_headers(const char* status, const char* content_type, size_t body_len) {
  std::string headers = "HTTP/1.1 ";
  headers += status;
  headers += "\r\nContent-Type: ";
  headers += content_type;
  headers += "\r\nConnection: close\r\nContent-Length: ";
  char len_buf[24];
  auto [ptr, ec] = std::to_chars(len_buf, len_buf + sizeof(len_buf), body_len);
  headers.append(len_buf, ptr);
  headers += "\r\n\r\n";
  return headers;
}

MetricsServer::MetricsServer(const SnapshotBuffers& buffers, uint16_t port)
    : buffers_(buffers), port_(port) {}

MetricsServer::~MetricsServer() { stop(); }

void MetricsServer::start() {
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void MetricsServer::stop() {
  if (stop_eventfd_ >= 0) {
    uint64_t val = 1;
    (void)::write(stop_eventfd_, &val, sizeof(val));
  }
  if (thread_.joinable()) {
    thread_.request_stop();
    thread_.join();
  }
}

void MetricsServer::run(std::stop_token st) {
  listen_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0);
  if (listen_fd_ < 0) {
    std::fprintf(stderr, "glustat: metrics server: socket() failed: %s\n", std::strerror(errno));
    return;
  }

  int optval = 1;
  (void)::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));

  struct sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port_);
  addr.sin_addr.s_addr = INADDR_ANY;

  if (::bind(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
    std::fprintf(stderr, "glustat: metrics server: bind(:%d) failed: %s\n", port_, std::strerror(errno));
    ::close(listen_fd_);
    listen_fd_ = -1;
    return;
  }

  if (::listen(listen_fd_, 4) < 0) {
    std::fprintf(stderr, "glustat: metrics server: listen() failed: %s\n", std::strerror(errno));
    ::close(listen_fd_);
    listen_fd_ = -1;
    return;
  }

  // eventfd lets stop() wake the ring
  stop_eventfd_ = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
  if (stop_eventfd_ < 0) {
    std::fprintf(stderr, "glustat: metrics server: eventfd() failed: %s\n", std::strerror(errno));
    ::close(listen_fd_);
    listen_fd_ = -1;
    return;
  }

  struct io_uring ring{};
  if (int rc = io_uring_queue_init(16, &ring, 0); rc < 0) {
    std::fprintf(stderr, "glustat: metrics server: io_uring_queue_init() failed: %s\n", std::strerror(-rc));
    ::close(stop_eventfd_);
    stop_eventfd_ = -1;
    ::close(listen_fd_);
    listen_fd_ = -1;
    return;
  }

  auto submit_poll = [&](int fd, UringTag tag) {
    struct io_uring_sqe* sqe = io_uring_get_sqe(&ring);
    io_uring_prep_poll_add(sqe, fd, POLLIN);
    io_uring_sqe_set_data64(sqe, static_cast<uint64_t>(tag));
  };

  submit_poll(listen_fd_, UringTag::ListenPoll);
  submit_poll(stop_eventfd_, UringTag::StopPoll);
  io_uring_submit(&ring);

  std::fprintf(stderr, "glustat: metrics server listening on :%d\n", port_);

  while (!st.stop_requested()) {
    struct io_uring_cqe* cqe = nullptr;
    int ret = io_uring_wait_cqe(&ring, &cqe);
    if (ret < 0) {
      if (ret == -EINTR) continue;
      std::fprintf(stderr, "glustat: metrics server: io_uring_wait_cqe() failed: %s\n", std::strerror(-ret));
      break;
    }

    auto tag = static_cast<UringTag>(io_uring_cqe_get_data64(cqe));
    int res = cqe->res;
    io_uring_cqe_seen(&ring, cqe);

    if (tag == UringTag::StopPoll || st.stop_requested()) {
      break;
    }

    if (tag == UringTag::ListenPoll && res >= 0) {
      int client_fd = ::accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
      if (client_fd >= 0) {
        handle_client(client_fd);
        ::close(client_fd);
      }
      submit_poll(listen_fd_, UringTag::ListenPoll);
      io_uring_submit(&ring);
    }
  }

  io_uring_queue_exit(&ring);
  if (stop_eventfd_ >= 0) { ::close(stop_eventfd_); stop_eventfd_ = -1; }
  if (listen_fd_ >= 0) { ::close(listen_fd_); listen_fd_ = -1; }
}

void MetricsServer::handle_client(int fd) {
  // Slow clients must not stall the loop
  struct timeval tv{.tv_sec = 5, .tv_usec = 0};
  (void)::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  (void)::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
  int one = 1;
  (void)::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

  char reqbuf[4096];
  ssize_t nr = ::recv(fd, reqbuf, sizeof(reqbuf) - 1, 0);
  if (nr <= 0) return;
  reqbuf[nr] = '\0';

  std::string_view req(reqbuf, static_cast<size_t>(nr));
  auto line_end = req.find('\r');
  if (line_end == std::string_view::npos) line_end = req.find('\n');
  std::string_view request_line = req.substr(0, line_end);

  std::string headers;
  std::string body;

  if (request_line.starts_with("GET /metrics")) {
    body = snapshot_to_prometheus(buffers_.front());
    headers = http_headers("200 OK", "text/plain; version=0.0.4; charset=utf-8", body.size());
  } else if (request_line.starts_with("GET / ") || request_line == "GET /") {
    body = "glustat: use /metrics\n";
    headers = http_headers("200 OK", "text/plain", body.size());
  } else {
    body = "404 Not Found\n";
    headers = http_headers("404 Not Found", "text/plain", body.size());
  }

  // headers + body in one sendmsg
  struct iovec iov[2] = {
    {.iov_base = headers.data(), .iov_len = headers.size()},
    {.iov_base = body.data(), .iov_len = body.size()}
  };
  struct msghdr msg{};
  msg.msg_iov = iov;
  msg.msg_iovlen = 2;
  (void)::sendmsg(fd, &msg, MSG_NOSIGNAL);
}

} // namespace glustat::app
