#include "linkshare_receiver.h"
#include "linkshare_log.h"

namespace linkshare {

const char* to_string(ReceiverState s) {
    switch (s) {
        case ReceiverState::Idle:                 return "idle";
        case ReceiverState::MetaReceived:         return "meta-received";
        case ReceiverState::AwaitingConfirmation: return "awaiting-confirmation";
        case ReceiverState::MotorActive:          return "motor-active";
        case ReceiverState::FallbackActive:       return "fallback-active";
        case ReceiverState::Flushing:             return "flushing";
        case ReceiverState::Complete:             return "complete";
    }
    return "unknown";
}

ReceiverEngine::ReceiverEngine(Channel& channel, Scheduler& sched, const Config& cfg)
    : channel_(channel), sched_(sched), cfg_(cfg), session_(cfg.telemetry_interval, cfg.eta_window) {}

bool ReceiverEngine::session_open() const {
    return state_ != ReceiverState::Idle && state_ != ReceiverState::Complete;
}

bool ReceiverEngine::offer_pending() const {
    return state_ == ReceiverState::MetaReceived || state_ == ReceiverState::AwaitingConfirmation;
}

void ReceiverEngine::on_meta(const FileDescriptor& d, std::uint64_t offer_id) {
    if (session_open()) {
        log_err("RECV") << "new offer " << d.name << " while " << session_.descriptor().name << " is "
                        << to_string(state_) << ", dropping the old one" << std::endl;
        abort_session(TransferStatus::Cancelled, TransferError::Superseded);
    }

    ++generation_;
    offer_id_ = offer_id;
    strategy_.reset();
    digest_.reset();
    expected_digest_.clear();
    dropped_ = 0;
    overrun_reported_ = false;
    session_.begin(d, sched_.now());
    state_ = ReceiverState::MetaReceived;
    log_out("RECV") << "Incoming: " << d.name << " (" << d.size << " bytes, " << d.media_type << ")" << std::endl;

    const std::uint64_t gen = generation_;
    if (offer_) offer_(d);
    if (gen == generation_ && state_ == ReceiverState::MetaReceived) state_ = ReceiverState::AwaitingConfirmation;
}

bool ReceiverEngine::confirm(std::unique_ptr<DiskSink> sink) {
    if (!offer_pending()) {
        log_err("RECV") << "confirm while " << to_string(state_) << ", ignored" << std::endl;
        return false;
    }
    const FileDescriptor& d = session_.descriptor();

    if (sink) {
        const std::uint64_t gen = generation_;
        log_out("RECV") << "Streaming " << d.name << " to " << sink->describe() << std::endl;
        strategy_.reset(new StreamingSink(std::move(sink), cfg_.flush_threshold,
                                          [this, gen](const std::string& err, std::uint64_t committed) {
            if (gen != generation_) return;
            on_degraded(err, committed);
        }));
        state_ = ReceiverState::MotorActive;
    } else {
        if (d.size > cfg_.memory_limit) {
            log_err("RECV") << d.name << " is " << format_mb(d.size) << ", over the in-memory limit of "
                            << format_mb(cfg_.memory_limit) << std::endl;
            send_cancel("file too large for in-memory receive");
            abort_session(TransferStatus::Failed, TransferError::FileTooLarge);
            return false;
        }
        log_out("RECV") << "Receiving " << d.name << " in memory" << std::endl;
        strategy_.reset(new MemorySink);
        state_ = ReceiverState::FallbackActive;
        notice("no disk target, " + d.name + " is buffered in memory");
    }

    if (!channel_.send(ControlMessage{msg::ReadyToReceive{offer_id_}})) {
        log_err("RECV") << "channel rejected ready_to_receive" << std::endl;
        abort_session(TransferStatus::Failed, TransferError::ChannelClosed);
        return false;
    }
    session_.restart_clock(sched_.now());
    return true;
}

void ReceiverEngine::on_degraded(const std::string& err, std::uint64_t committed) {
    const FileDescriptor& d = session_.descriptor();
    const std::uint64_t tail = d.size > committed ? d.size - committed : 0;
    if (tail > cfg_.memory_limit) {
        log_err("RECV") << "disk write for " << d.name << " failed (" << err << ") and the remaining "
                        << format_mb(tail) << " exceed the in-memory limit of " << format_mb(cfg_.memory_limit)
                        << std::endl;
        send_cancel("file too large for in-memory receive");
        abort_session(TransferStatus::Failed, TransferError::FileTooLarge);
        return;
    }
    if (state_ == ReceiverState::MotorActive) state_ = ReceiverState::FallbackActive;
    notice("disk write failed (" + err + "), receiving the rest of the file in memory");
}

bool ReceiverEngine::decline(const std::string& reason) {
    if (!offer_pending()) return false;
    log_out("RECV") << "Declined " << session_.descriptor().name << std::endl;
    send_cancel(reason);
    abort_session(TransferStatus::Cancelled, TransferError::Declined);
    return true;
}

bool ReceiverEngine::cancel(const std::string& reason) {
    if (!session_open()) return false;
    send_cancel(reason);
    abort_session(TransferStatus::Cancelled, TransferError::LocalCancelled);
    return true;
}

void ReceiverEngine::on_chunk(Bytes chunk) {
    if (state_ != ReceiverState::MotorActive && state_ != ReceiverState::FallbackActive) {
        dropped_ += chunk.size();
        log_err("RECV") << "dropped " << chunk.size() << " bytes received while " << to_string(state_) << std::endl;
        return;
    }
    const std::size_t n = chunk.size();
    if (n == 0) return;
    if (!overrun_reported_ && session_.bytes_transferred() + n > session_.descriptor().size) {
        overrun_reported_ = true;
        log_err("RECV") << "peer sent more than the announced " << session_.descriptor().size << " bytes" << std::endl;
    }
    if (cfg_.compute_digest) digest_.update(chunk.data(), n);
    strategy_->append(std::move(chunk));
    if (session_.add_bytes(n, sched_.now()) && progress_) progress_(session_.snapshot());
}

void ReceiverEngine::on_end(const std::string& sha256) {
    if (state_ != ReceiverState::MotorActive && state_ != ReceiverState::FallbackActive) {
        log_debug("RECV") << "end while " << to_string(state_) << ", ignored" << std::endl;
        return;
    }
    expected_digest_ = sha256;
    state_ = ReceiverState::Flushing;
    const std::uint64_t gen = generation_;
    strategy_->finish([this, gen](bool ok, ReceivedArtifact artifact, const std::string& err) {
        on_finished(gen, ok, std::move(artifact), err);
    });
}

void ReceiverEngine::on_finished(std::uint64_t generation, bool ok, ReceivedArtifact artifact,
                                 const std::string& err) {
    if (generation != generation_ || state_ != ReceiverState::Flushing) return;
    const FileDescriptor& d = session_.descriptor();

    if (!ok) {
        log_err("RECV") << "finalizing " << d.name << " failed: " << err << std::endl;
        send_cancel("receiver could not finalize file");
        abort_session(TransferStatus::Failed, TransferError::SinkCloseFailed);
        return;
    }

    if (session_.bytes_transferred() != d.size) {
        log_err("RECV") << d.name << ": received " << session_.bytes_transferred() << " of " << d.size
                        << " announced bytes" << std::endl;
        send_cancel("size mismatch");
        abort_session(TransferStatus::Failed, TransferError::SizeMismatch);
        return;
    }

    TransferResult r = session_.make_result(TransferDirection::Receive, TransferStatus::Completed,
                                            TransferError::None, sched_.now());
    r.degraded = artifact.degraded;
    if (cfg_.compute_digest) {
        r.digest_hex = digest_.final_hex();
        if (!expected_digest_.empty())
            r.integrity = r.digest_hex == expected_digest_ ? Integrity::Verified : Integrity::Mismatch;
    }
    if (r.integrity == Integrity::Mismatch) {
        log_err("RECV") << d.name << ": sha256 mismatch, expected " << expected_digest_ << " got " << r.digest_hex
                        << std::endl;
    }

    // no ack until the application has stored the artifact
    if (complete_ && !complete_(r, artifact)) {
        if (generation != generation_) return;
        log_err("RECV") << d.name << " could not be stored" << std::endl;
        send_cancel("receiver could not store file");
        abort_session(TransferStatus::Failed, TransferError::SinkCloseFailed);
        return;
    }
    if (generation != generation_) return;

    state_ = ReceiverState::Complete;
    session_.complete();
    if (progress_) progress_(session_.snapshot());
    log_out("RECV") << "Received: " << d.name << " (" << r.bytes << " bytes"
                    << (r.degraded ? ", partly in memory" : "") << ")" << std::endl;
    if (!channel_.send(ControlMessage{msg::TransferCompleteAck{offer_id_}})) {
        log_err("RECV") << "could not send ack for " << d.name << std::endl;
    }
}

void ReceiverEngine::on_cancelled(const std::string& reason) {
    if (!session_open()) {
        log_debug("RECV") << "cancel while " << to_string(state_) << ", ignored" << std::endl;
        return;
    }
    log_out("RECV") << "Peer cancelled " << session_.descriptor().name
                    << (reason.empty() ? std::string() : " (" + reason + ")") << std::endl;
    abort_session(TransferStatus::Cancelled, TransferError::RemoteCancelled);
}

void ReceiverEngine::on_channel_closed() {
    if (!session_open()) return;
    abort_session(TransferStatus::Failed, TransferError::ChannelClosed);
}

void ReceiverEngine::abort_session(TransferStatus status, TransferError err) {
    ++generation_;
    // the strategy may be the caller; it is released on the next offer
    if (strategy_) strategy_->abort();
    state_ = ReceiverState::Idle;
    TransferResult r = session_.make_result(TransferDirection::Receive, status, err, sched_.now());
    log_out("RECV") << r.descriptor.name << " " << to_string(status) << ": " << to_string(err) << std::endl;
    if (aborted_) aborted_(r);
}

void ReceiverEngine::send_cancel(const std::string& reason) {
    if (!channel_.send(ControlMessage{msg::Cancelled{msg::CancelOrigin::Receiver, reason}})) {
        log_err("RECV") << "could not deliver cancel (" << reason << ") to peer" << std::endl;
    }
}

void ReceiverEngine::notice(const std::string& text) {
    log_out("RECV") << text << std::endl;
    if (notice_) notice_(text);
}

} // namespace linkshare
