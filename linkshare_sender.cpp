#include "linkshare_sender.h"
#include "linkshare_log.h"

#include <algorithm>

namespace linkshare {

const char* to_string(SenderState s) {
    switch (s) {
        case SenderState::Idle:          return "idle";
        case SenderState::AwaitingReady: return "awaiting-ready";
        case SenderState::Pumping:       return "pumping";
        case SenderState::AwaitingAck:   return "awaiting-ack";
    }
    return "unknown";
}

SenderEngine::SenderEngine(Channel& channel, Scheduler& sched, const Config& cfg)
    : channel_(channel),
      sched_(sched),
      cfg_(cfg),
      flow_(cfg.high_watermark, cfg.low_watermark),
      session_(cfg.telemetry_interval, cfg.eta_window),
      pump_timer_(sched),
      handshake_timer_(sched),
      settle_timer_(sched) {}

bool SenderEngine::announce(ByteSource& source) {
    if (state_ != SenderState::Idle) {
        log_err("SEND") << "announce(" << source.name() << ") while " << to_string(state_) << ", refused" << std::endl;
        return false;
    }
    if (!channel_.is_open()) {
        log_err("SEND") << "channel not open, cannot announce " << source.name() << std::endl;
        return false;
    }

    FileDescriptor d = source.descriptor();
    if (!channel_.send(ControlMessage{msg::Meta{d, next_offer_id_}})) {
        log_err("SEND") << "channel rejected meta for " << d.name << std::endl;
        return false;
    }

    offer_id_ = next_offer_id_++;
    ++generation_;
    source_ = &source;
    offset_ = 0;
    chunks_sent_ = 0;
    read_in_flight_ = false;
    chunk_pending_ = false;
    end_pending_ = false;
    pending_chunk_.clear();
    end_digest_.clear();
    flow_.reset();
    digest_.reset();
    settle_timer_.cancel();
    session_.begin(d, sched_.now());
    state_ = SenderState::AwaitingReady;
    handshake_timer_.arm(cfg_.handshake_timeout, [this] { on_handshake_timeout(); });

    log_out("SEND") << "Offering: " << d.name << " (" << d.size << " bytes, " << d.media_type << ")" << std::endl;
    return true;
}

void SenderEngine::on_ready_to_receive(std::uint64_t offer_id) {
    if (state_ != SenderState::AwaitingReady) {
        log_debug("SEND") << "ready_to_receive while " << to_string(state_) << ", ignored" << std::endl;
        return;
    }
    if (offer_id != offer_id_) {
        log_err("SEND") << "ready_to_receive for offer " << offer_id << " while offer " << offer_id_
                        << " is open, ignored" << std::endl;
        return;
    }
    handshake_timer_.cancel();
    state_ = SenderState::Pumping;
    session_.restart_clock(sched_.now());
    log_out("SEND") << "Peer ready, sending " << session_.descriptor().name << std::endl;
    schedule_pump(std::chrono::milliseconds(0));
}

void SenderEngine::schedule_pump(std::chrono::milliseconds delay) {
    pump_timer_.arm(delay, [this] { pump(); });
}

void SenderEngine::pump() {
    if (state_ != SenderState::Pumping) return;
    if (chunk_pending_) { try_send_chunk(); return; }
    if (end_pending_) { try_send_end(); return; }
    if (read_in_flight_) return;

    const std::uint64_t size = source_->size();
    if (offset_ >= size) {
        begin_end();
        return;
    }

    const std::uint64_t pending = channel_.pending_bytes();
    const bool was_paused = flow_.paused();
    if (flow_.decide(pending) == FlowDecision::Wait) {
        if (!was_paused) log_debug("FLOW") << "paused at " << pending << " pending bytes" << std::endl;
        schedule_pump(cfg_.poll_interval);
        return;
    }
    if (was_paused) log_debug("FLOW") << "resumed at " << pending << " pending bytes" << std::endl;

    const std::size_t len = static_cast<std::size_t>(std::min<std::uint64_t>(cfg_.chunk_size, size - offset_));
    const std::uint64_t gen = generation_;
    read_in_flight_ = true;
    source_->read(offset_, len, [this, gen](bool ok, Bytes data) { on_chunk_read(gen, ok, std::move(data)); });
}

void SenderEngine::on_chunk_read(std::uint64_t generation, bool ok, Bytes data) {
    if (generation != generation_) return;
    read_in_flight_ = false;
    if (state_ != SenderState::Pumping) return;

    const std::uint64_t expected = std::min<std::uint64_t>(cfg_.chunk_size, source_->size() - offset_);
    if (!ok || data.size() != expected) {
        log_err("SEND") << "reading " << source_->name() << " at offset " << offset_ << " failed" << std::endl;
        send_cancel("source read failed");
        finish(TransferStatus::Failed, TransferError::SourceReadFailed);
        return;
    }
    pending_chunk_ = std::move(data);
    chunk_pending_ = true;
    send_attempts_ = 0;
    try_send_chunk();
}

bool SenderEngine::retry_later(const char* what) {
    if (!channel_.is_open()) {
        log_err("SEND") << "channel closed while sending " << what << std::endl;
        finish(TransferStatus::Failed, TransferError::ChannelClosed);
        return false;
    }
    if (++send_attempts_ > cfg_.send_retry_limit) {
        log_err("SEND") << "giving up on " << what << " after " << cfg_.send_retry_limit << " retries" << std::endl;
        send_cancel("send failed");
        finish(TransferStatus::Failed, TransferError::SendFailed);
        return false;
    }
    log_debug("SEND") << what << " rejected, retry " << send_attempts_ << std::endl;
    schedule_pump(cfg_.send_retry_delay);
    return true;
}

void SenderEngine::try_send_chunk() {
    if (!channel_.send(pending_chunk_)) {
        retry_later("chunk");
        return;
    }
    const std::size_t n = pending_chunk_.size();
    if (cfg_.compute_digest) digest_.update(pending_chunk_.data(), n);
    offset_ += n;
    ++chunks_sent_;
    chunk_pending_ = false;
    pending_chunk_.clear();
    if (session_.add_bytes(n, sched_.now())) emit_progress();

    if (offset_ >= source_->size()) {
        begin_end();
    } else {
        schedule_pump(std::chrono::milliseconds(0));
    }
}

void SenderEngine::begin_end() {
    end_digest_ = cfg_.compute_digest ? digest_.final_hex() : std::string();
    end_pending_ = true;
    send_attempts_ = 0;
    try_send_end();
}

void SenderEngine::try_send_end() {
    if (!channel_.send(ControlMessage{msg::End{end_digest_}})) {
        retry_later("end");
        return;
    }
    end_pending_ = false;
    state_ = SenderState::AwaitingAck;
    session_.complete();
    emit_progress();
    log_out("SEND") << "All " << chunks_sent_ << " chunks of " << session_.descriptor().name
                    << " sent, waiting for ack" << std::endl;
}

void SenderEngine::on_transfer_complete_ack(std::uint64_t offer_id) {
    if (state_ != SenderState::AwaitingAck) {
        log_debug("SEND") << "ack while " << to_string(state_) << ", ignored" << std::endl;
        return;
    }
    if (offer_id != offer_id_) {
        log_err("SEND") << "ack for offer " << offer_id << " while offer " << offer_id_ << " is open, ignored"
                        << std::endl;
        return;
    }
    state_ = SenderState::Idle;
    source_ = nullptr;
    TransferResult r = session_.make_result(TransferDirection::Send, TransferStatus::Completed, TransferError::None,
                                            sched_.now());
    r.digest_hex = end_digest_;
    log_out("SEND") << "Delivered: " << r.descriptor.name << " (" << r.bytes << " bytes, "
                    << format_mb(static_cast<std::uint64_t>(r.average_throughput)) << "/s)" << std::endl;
    // let the channel drain before the next Meta goes out
    settle_timer_.arm(cfg_.settle_delay, [this, r] {
        if (finished_) finished_(r);
    });
}

void SenderEngine::on_handshake_timeout() {
    if (state_ != SenderState::AwaitingReady) return;
    log_err("SEND") << "no ready_to_receive for " << session_.descriptor().name << " within "
                    << cfg_.handshake_timeout.count() << " ms" << std::endl;
    send_cancel("handshake timeout");
    finish(TransferStatus::Failed, TransferError::HandshakeTimeout);
}

void SenderEngine::on_remote_cancelled(const std::string& reason) {
    if (state_ == SenderState::Idle) return;
    log_out("SEND") << "Peer cancelled " << session_.descriptor().name
                    << (reason.empty() ? std::string() : " (" + reason + ")") << std::endl;
    finish(TransferStatus::Cancelled, TransferError::RemoteCancelled);
}

bool SenderEngine::cancel(const std::string& reason) {
    if (state_ == SenderState::Idle) return false;
    send_cancel(reason);
    finish(TransferStatus::Cancelled, TransferError::LocalCancelled);
    return true;
}

void SenderEngine::on_channel_closed() {
    if (state_ == SenderState::Idle) return;
    finish(TransferStatus::Failed, TransferError::ChannelClosed);
}

void SenderEngine::send_cancel(const std::string& reason) {
    if (!channel_.send(ControlMessage{msg::Cancelled{msg::CancelOrigin::Sender, reason}})) {
        log_err("SEND") << "could not deliver cancel (" << reason << ") to peer" << std::endl;
    }
}

void SenderEngine::finish(TransferStatus status, TransferError err) {
    pump_timer_.cancel();
    handshake_timer_.cancel();
    ++generation_;
    read_in_flight_ = false;
    chunk_pending_ = false;
    end_pending_ = false;
    pending_chunk_.clear();
    source_ = nullptr;
    state_ = SenderState::Idle;
    TransferResult r = session_.make_result(TransferDirection::Send, status, err, sched_.now());
    log_out("SEND") << r.descriptor.name << " " << to_string(status) << ": " << to_string(err) << std::endl;
    if (finished_) finished_(r);
}

void SenderEngine::emit_progress() {
    if (progress_) progress_(session_.snapshot());
}

} // namespace linkshare
