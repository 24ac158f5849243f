// One side of a link: sender, receiver and queue behind one dispatcher
#pragma once

#include "linkshare_channel.h"
#include "linkshare_config.h"
#include "linkshare_event_loop.h"
#include "linkshare_queue.h"
#include "linkshare_receiver.h"
#include "linkshare_sender.h"

#include <cstdint>
#include <functional>

namespace linkshare {

// One side of a LinkShare connection: a Channel plus the sending and
// receiving engines and the outgoing queue.
//
// The endpoint is the only message handler on the channel and stays
// attached for the channel's lifetime, so a ReadyToReceive can never
// arrive before anyone is listening for it.
class Endpoint {
public:
    Endpoint(Channel& channel, Scheduler& sched, const Config& cfg);
    ~Endpoint();

    Endpoint(const Endpoint&) = delete;
    Endpoint& operator=(const Endpoint&) = delete;

    SenderEngine& sender() { return sender_; }
    ReceiverEngine& receiver() { return receiver_; }
    QueueCoordinator& queue() { return queue_; }
    const SenderEngine& sender() const { return sender_; }
    const ReceiverEngine& receiver() const { return receiver_; }
    const QueueCoordinator& queue() const { return queue_; }
    Channel& channel() { return channel_; }

    void handle(InboundEvent&& ev);

    // Runs after both engines have dropped their sessions for a closed channel.
    void set_disconnect_handler(std::function<void()> h) { disconnected_ = std::move(h); }

    std::uint64_t control_messages() const { return control_messages_; }
    std::uint64_t chunks_received() const { return chunks_received_; }

private:
    void handle_control(const ControlMessage& m);
    void on_closed();

    Channel& channel_;
    SenderEngine sender_;
    ReceiverEngine receiver_;
    QueueCoordinator queue_;

    std::uint64_t control_messages_ = 0;
    std::uint64_t chunks_received_ = 0;
    std::function<void()> disconnected_;
};

} // namespace linkshare
