#include "linkshare_tcp_channel.h"
#include "linkshare_log.h"

#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <linux/sockios.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

namespace linkshare {

namespace net {

namespace {

const char kGreeting[] = "LSH1\n";
constexpr std::size_t kGreetingLen = sizeof(kGreeting) - 1;

bool sendAll(int fd, const void* data, size_t len) {
    const char* p = static_cast<const char*>(data);
    size_t off = 0;
    while (off < len) {
        ssize_t n = ::send(fd, p + off, len - off, MSG_NOSIGNAL);
        if (n < 0) { if (errno == EINTR) continue; return false; }
        if (n == 0) return false;
        off += static_cast<size_t>(n);
    }
    return true;
}

bool recvAll(int fd, void* data, size_t len) {
    char* p = static_cast<char*>(data);
    size_t off = 0;
    while (off < len) {
        ssize_t n = ::recv(fd, p + off, len - off, 0);
        if (n < 0) { if (errno == EINTR) continue; return false; }
        if (n == 0) return false;
        off += static_cast<size_t>(n);
    }
    return true;
}

void set_err(std::string* err, const std::string& what) {
    if (err) *err = what + ": " + std::strerror(errno);
}

int accept_one(int port, std::string* err) {
    int listen_fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (listen_fd < 0) { set_err(err, "socket"); return -1; }
    int opt = 1;
    ::setsockopt(listen_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
    sockaddr_in a{};
    a.sin_family = AF_INET;
    a.sin_addr.s_addr = INADDR_ANY;
    a.sin_port = htons(static_cast<uint16_t>(port));
    if (::bind(listen_fd, reinterpret_cast<sockaddr*>(&a), sizeof(a)) != 0 || ::listen(listen_fd, 1) != 0) {
        set_err(err, "bind/listen on port " + std::to_string(port));
        ::close(listen_fd);
        return -1;
    }
    log_out("CHANNEL") << "role=m1: waiting for peer on port " << port << "..." << std::endl;
    int fd = -1;
    do {
        fd = ::accept4(listen_fd, nullptr, nullptr, SOCK_CLOEXEC);
    } while (fd < 0 && errno == EINTR);
    if (fd < 0) set_err(err, "accept");
    ::close(listen_fd);
    return fd;
}

int connect_with_retry(const std::string& peer_ip, int peer_port, int attempts, std::string* err) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(peer_port));
    if (::inet_pton(AF_INET, peer_ip.c_str(), &addr.sin_addr) != 1) {
        if (err) *err = "invalid peer address " + peer_ip;
        return -1;
    }
    log_out("CHANNEL") << "role=m2: connecting to peer " << peer_ip << ":" << peer_port << "..." << std::endl;
    for (int i = 0; attempts <= 0 || i < attempts; ++i) {
        int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (fd < 0) { set_err(err, "socket"); return -1; }
        if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0) return fd;
        ::close(fd);
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    if (err) *err = "peer " + peer_ip + ":" + std::to_string(peer_port) + " unreachable";
    return -1;
}

} // namespace

Bytes encode_frame(FrameKind kind, const std::uint8_t* data, std::size_t n) {
    Bytes frame(kFrameHeader + n);
    uint32_t nlen = htonl(static_cast<uint32_t>(n));
    std::memcpy(frame.data(), &nlen, sizeof(nlen));
    frame[4] = kind;
    if (n) std::memcpy(frame.data() + kFrameHeader, data, n);
    return frame;
}

int establish_link(int my_port, int peer_port, const std::string& peer_ip, const std::string& role,
                   int attempts, std::string* err) {
    int fd = role == "m1" ? accept_one(my_port, err) : connect_with_retry(peer_ip, peer_port, attempts, err);
    if (fd < 0) return -1;

    int one = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

    char buf[kGreetingLen] = {};
    if (!sendAll(fd, kGreeting, kGreetingLen) || !recvAll(fd, buf, kGreetingLen)) {
        set_err(err, "greeting exchange");
        ::close(fd);
        return -1;
    }
    if (std::memcmp(buf, kGreeting, kGreetingLen) != 0) {
        if (err) *err = "peer is not a LinkShare endpoint";
        ::close(fd);
        return -1;
    }
    log_out("CHANNEL") << "Link established (fd=" << fd << ")" << std::endl;
    return fd;
}

} // namespace net

TcpChannel::TcpChannel(EventLoop& loop, int fd, std::uint64_t queue_limit)
    : loop_(loop), fd_(fd), queue_limit_(queue_limit) {}

TcpChannel::~TcpChannel() { shutdown_socket(); }

bool TcpChannel::start() {
    if (fd_ < 0) return false;
    int flags = ::fcntl(fd_, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd_, F_SETFL, flags | O_NONBLOCK) != 0) {
        log_err("CHANNEL") << "fcntl(O_NONBLOCK) failed: " << std::strerror(errno) << std::endl;
        return false;
    }
    open_ = true;
    loop_.watch(fd_, POLLIN, [this](short revents) { on_events(revents); });
    emit_open();
    return true;
}

bool TcpChannel::send(const ControlMessage& m) {
    std::string text = encode_control(m);
    log_debug("CHANNEL") << "-> " << text << std::endl;
    return enqueue(net::kText, reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
}

bool TcpChannel::send(const Bytes& chunk) {
    return enqueue(net::kBinary, chunk.data(), chunk.size());
}

bool TcpChannel::enqueue(net::FrameKind kind, const std::uint8_t* data, std::size_t n) {
    if (!open_) return false;
    if (n > net::kMaxFramePayload) {
        log_err("CHANNEL") << "refusing " << n << " byte frame" << std::endl;
        return false;
    }
    // a single frame larger than the limit still goes out on an empty queue
    if (queued_ > 0 && queued_ + n + net::kFrameHeader > queue_limit_) return false;

    out_.push_back(net::encode_frame(kind, data, n));
    queued_ += n + net::kFrameHeader;
    ++frames_out_;
    loop_.update(fd_, POLLIN | POLLOUT);
    return true;
}

std::uint64_t TcpChannel::pending_bytes() const {
    std::uint64_t pending = queued_;
    if (fd_ >= 0) {
        int unsent = 0;
        if (::ioctl(fd_, SIOCOUTQ, &unsent) == 0 && unsent > 0) pending += static_cast<std::uint64_t>(unsent);
    }
    return pending;
}

void TcpChannel::on_events(short revents) {
    if (!open_) return;
    if (revents & (POLLERR | POLLNVAL)) {
        fail("socket error");
        return;
    }
    if (revents & POLLOUT) {
        flush_out();
        if (!open_) return;
    }
    if (revents & (POLLIN | POLLHUP)) read_in();
}

void TcpChannel::flush_out() {
    while (!out_.empty()) {
        const Bytes& front = out_.front();
        ssize_t n = ::send(fd_, front.data() + out_offset_, front.size() - out_offset_, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return;
            fail(std::string("send: ") + std::strerror(errno));
            return;
        }
        out_offset_ += static_cast<std::size_t>(n);
        queued_ -= static_cast<std::uint64_t>(n);
        if (out_offset_ == front.size()) {
            out_.pop_front();
            out_offset_ = 0;
        }
    }
    loop_.update(fd_, POLLIN);
}

void TcpChannel::read_in() {
    std::uint8_t buf[64 * 1024];
    for (;;) {
        ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) break;
            fail(std::string("recv: ") + std::strerror(errno));
            return;
        }
        if (n == 0) {
            parse_frames();
            if (open_) fail("peer closed the connection");
            return;
        }
        in_.insert(in_.end(), buf, buf + n);
        parse_frames();
        if (!open_) return;
    }
}

void TcpChannel::parse_frames() {
    while (open_ && in_.size() - in_offset_ >= net::kFrameHeader) {
        const std::uint8_t* p = in_.data() + in_offset_;
        uint32_t nlen = 0;
        std::memcpy(&nlen, p, sizeof(nlen));
        const uint32_t len = ntohl(nlen);
        const std::uint8_t kind = p[4];
        if (len > net::kMaxFramePayload) {
            fail("inbound frame of " + std::to_string(len) + " bytes exceeds limit");
            return;
        }
        if (in_.size() - in_offset_ < net::kFrameHeader + len) break;

        const std::uint8_t* payload = p + net::kFrameHeader;
        in_offset_ += net::kFrameHeader + len;
        ++frames_in_;

        if (kind == net::kBinary) {
            emit_message(InboundEvent{Bytes(payload, payload + len)});
        } else if (kind == net::kText) {
            std::string err;
            auto m = decode_control(std::string(reinterpret_cast<const char*>(payload), len), &err);
            if (!m) {
                ++malformed_;
                log_err("CHANNEL") << "dropped malformed control frame: " << err << std::endl;
                continue;
            }
            emit_message(InboundEvent{std::move(*m)});
        } else {
            ++malformed_;
            log_err("CHANNEL") << "dropped frame of unknown kind " << static_cast<int>(kind) << std::endl;
        }
    }
    if (in_offset_ > 0 && (in_offset_ == in_.size() || in_offset_ > (1u << 20))) {
        in_.erase(in_.begin(), in_.begin() + static_cast<std::ptrdiff_t>(in_offset_));
        in_offset_ = 0;
    }
}

void TcpChannel::close() {
    if (!open_) return;
    log_out("CHANNEL") << "closing link" << std::endl;
    shutdown_socket();
}

void TcpChannel::fail(const std::string& why) {
    if (!open_) return;
    log_err("CHANNEL") << why << std::endl;
    shutdown_socket();
    emit_close();
}

void TcpChannel::shutdown_socket() {
    open_ = false;
    if (fd_ >= 0) {
        loop_.unwatch(fd_);
        ::close(fd_);
        fd_ = -1;
    }
    out_.clear();
    out_offset_ = 0;
    queued_ = 0;
}

} // namespace linkshare
