// Ordered message channel between two endpoints
#pragma once

#include "linkshare_protocol.h"

#include <cstdint>
#include <functional>
#include <utility>

namespace linkshare {

// Duplex, ordered, message-framed transport between the two endpoints.
// Control messages and binary chunks are distinct frame kinds; chunks carry no envelope.
class Channel {
public:
    using MessageHandler = std::function<void(InboundEvent&&)>;
    using StateHandler = std::function<void()>;

    virtual ~Channel() = default;

    virtual bool is_open() const = 0;

    // Returns false when the channel rejects the frame (closed, or its outbound queue is full).
    virtual bool send(const ControlMessage& m) = 0;
    virtual bool send(const Bytes& chunk) = 0;

    // Advisory count of bytes accepted by send() but not yet flushed to the peer.
    virtual std::uint64_t pending_bytes() const = 0;

    virtual void close() = 0;

    void on_message(MessageHandler h) { message_handler_ = std::move(h); }
    void on_open(StateHandler h) { open_handler_ = std::move(h); }
    void on_close(StateHandler h) { close_handler_ = std::move(h); }

protected:
    void emit_message(InboundEvent&& ev) { if (message_handler_) message_handler_(std::move(ev)); }
    void emit_open() { if (open_handler_) open_handler_(); }
    void emit_close() { if (close_handler_) close_handler_(); }

private:
    MessageHandler message_handler_;
    StateHandler open_handler_;
    StateHandler close_handler_;
};

} // namespace linkshare
