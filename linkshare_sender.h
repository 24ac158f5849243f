// Outgoing side of a file transfer
#pragma once

#include "linkshare_byte_source.h"
#include "linkshare_channel.h"
#include "linkshare_config.h"
#include "linkshare_digest.h"
#include "linkshare_event_loop.h"
#include "linkshare_flow_control.h"
#include "linkshare_session.h"

#include <cstdint>
#include <functional>
#include <string>

namespace linkshare {

enum class SenderState { Idle, AwaitingReady, Pumping, AwaitingAck };

const char* to_string(SenderState s);

// Drives one outgoing file at a time:
// Meta -> wait for ReadyToReceive -> chunk pump under flow control -> End -> wait for ack.
//
// The pump runs on a single re-armable timer which also carries the
// backpressure re-poll and the send-retry delay, so at most one step of the
// loop is ever scheduled and at most one source read is outstanding.
class SenderEngine {
public:
    using FinishedHandler = std::function<void(const TransferResult&)>;
    using ProgressHandler = std::function<void(const TelemetrySnapshot&)>;

    SenderEngine(Channel& channel, Scheduler& sched, const Config& cfg);

    SenderEngine(const SenderEngine&) = delete;
    SenderEngine& operator=(const SenderEngine&) = delete;

    // Sends Meta for `source` and waits for the peer. Returns false (nothing sent)
    // when busy or when the channel is not open. `source` must outlive the session.
    bool announce(ByteSource& source);

    // Replies carry the id of the offer they answer; a mismatch is ignored.
    void on_ready_to_receive(std::uint64_t offer_id);
    void on_transfer_complete_ack(std::uint64_t offer_id);
    void on_remote_cancelled(const std::string& reason);
    void on_channel_closed();

    // Aborts the current file and tells the peer; false when idle.
    bool cancel(const std::string& reason = "cancelled by sender");

    // Called once per announced file, after the settle delay for completed files.
    void set_finished_handler(FinishedHandler h) { finished_ = std::move(h); }
    void set_progress_handler(ProgressHandler h) { progress_ = std::move(h); }

    SenderState state() const { return state_; }
    // Id of the most recent announcement, 0 before the first
    std::uint64_t offer_id() const { return offer_id_; }
    const TransferSession& session() const { return session_; }
    std::uint64_t offset() const { return offset_; }
    std::uint64_t chunks_sent() const { return chunks_sent_; }
    const FlowController& flow() const { return flow_; }

private:
    void schedule_pump(std::chrono::milliseconds delay);
    void pump();
    void on_chunk_read(std::uint64_t generation, bool ok, Bytes data);
    void try_send_chunk();
    void begin_end();
    void try_send_end();
    bool retry_later(const char* what);
    void on_handshake_timeout();
    void send_cancel(const std::string& reason);
    void finish(TransferStatus status, TransferError err);
    void emit_progress();

    Channel& channel_;
    Scheduler& sched_;
    Config cfg_;

    FlowController flow_;
    TransferSession session_;
    Sha256 digest_;

    Timer pump_timer_;
    Timer handshake_timer_;
    Timer settle_timer_;

    SenderState state_ = SenderState::Idle;
    ByteSource* source_ = nullptr;
    std::uint64_t generation_ = 0;
    std::uint64_t offer_id_ = 0;
    std::uint64_t next_offer_id_ = 1;
    std::uint64_t offset_ = 0;
    std::uint64_t chunks_sent_ = 0;
    bool read_in_flight_ = false;

    Bytes pending_chunk_;
    bool chunk_pending_ = false;
    bool end_pending_ = false;
    int send_attempts_ = 0;
    std::string end_digest_;

    FinishedHandler finished_;
    ProgressHandler progress_;
};

} // namespace linkshare
