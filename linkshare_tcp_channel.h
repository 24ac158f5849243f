// Framed TCP implementation of Channel
#pragma once

#include "linkshare_channel.h"
#include "linkshare_event_loop.h"

#include <cstdint>
#include <deque>
#include <string>

namespace linkshare {

namespace net {

// Frame kinds on the wire: [u32 payload length, network order][u8 kind][payload]
enum FrameKind : std::uint8_t { kText = 0, kBinary = 1 };

constexpr std::size_t kFrameHeader = 5;
constexpr std::uint32_t kMaxFramePayload = 64u * 1024 * 1024;

// Header + payload for one frame.
Bytes encode_frame(FrameKind kind, const std::uint8_t* data, std::size_t n);

// Blocking TCP setup done before the loop starts: m1 accepts on `my_port`,
// m2 connects to peer_ip:peer_port, retrying until `attempts` run out.
// Both sides then swap a short greeting. Returns the connected fd or -1.
int establish_link(int my_port, int peer_port, const std::string& peer_ip, const std::string& role,
                   int attempts, std::string* err = nullptr);

} // namespace net

// Channel over one nonblocking TCP socket driven by the EventLoop.
//
// Outbound frames queue in user space and are written when the socket is
// writable; pending_bytes() adds the kernel's unsent byte count (SIOCOUTQ)
// to the queued bytes. send() rejects frames once the queue holds
// `queue_limit` bytes. Malformed inbound control frames are logged and
// dropped; oversized frames close the channel.
class TcpChannel : public Channel {
public:
    TcpChannel(EventLoop& loop, int fd, std::uint64_t queue_limit);
    ~TcpChannel() override;

    TcpChannel(const TcpChannel&) = delete;
    TcpChannel& operator=(const TcpChannel&) = delete;

    // Registers with the loop and fires the open handler. False if the socket cannot be set up.
    bool start();

    bool is_open() const override { return open_; }
    bool send(const ControlMessage& m) override;
    bool send(const Bytes& chunk) override;
    std::uint64_t pending_bytes() const override;
    void close() override;

    std::uint64_t queued_bytes() const { return queued_; }
    std::uint64_t malformed_frames() const { return malformed_; }
    std::uint64_t frames_sent() const { return frames_out_; }
    std::uint64_t frames_received() const { return frames_in_; }

private:
    bool enqueue(net::FrameKind kind, const std::uint8_t* data, std::size_t n);
    void on_events(short revents);
    void flush_out();
    void read_in();
    void parse_frames();
    void fail(const std::string& why);
    void shutdown_socket();

    EventLoop& loop_;
    int fd_;
    std::uint64_t queue_limit_;
    bool open_ = false;

    std::deque<Bytes> out_;
    std::size_t out_offset_ = 0;
    std::uint64_t queued_ = 0;

    Bytes in_;
    std::size_t in_offset_ = 0;

    std::uint64_t malformed_ = 0;
    std::uint64_t frames_out_ = 0;
    std::uint64_t frames_in_ = 0;
};

} // namespace linkshare
