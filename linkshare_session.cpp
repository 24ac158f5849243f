#include "linkshare_session.h"

#include <algorithm>
#include <nlohmann/json.hpp>
#include <numeric>

namespace linkshare {

const char* to_string(TransferDirection d) {
    return d == TransferDirection::Send ? "send" : "receive";
}

const char* to_string(TransferStatus s) {
    switch (s) {
        case TransferStatus::Completed: return "completed";
        case TransferStatus::Cancelled: return "cancelled";
        case TransferStatus::Failed:    return "failed";
        case TransferStatus::Skipped:   return "skipped";
    }
    return "unknown";
}

const char* to_string(TransferError e) {
    switch (e) {
        case TransferError::None:             return "none";
        case TransferError::ChannelClosed:    return "channel closed";
        case TransferError::HandshakeTimeout: return "handshake timeout";
        case TransferError::SendFailed:       return "send failed";
        case TransferError::SourceReadFailed: return "source read failed";
        case TransferError::SinkCloseFailed:  return "sink close failed";
        case TransferError::FileTooLarge:     return "file too large";
        case TransferError::Declined:         return "declined";
        case TransferError::RemoteCancelled:  return "cancelled by peer";
        case TransferError::LocalCancelled:   return "cancelled";
        case TransferError::Superseded:       return "superseded by a new file";
        case TransferError::SizeMismatch:     return "size mismatch";
    }
    return "unknown";
}

const char* to_string(Integrity i) {
    switch (i) {
        case Integrity::Verified: return "verified";
        case Integrity::Mismatch: return "mismatch";
        default:                  return "unchecked";
    }
}

void to_json(nlohmann::json& j, const TelemetrySnapshot& t) {
    j = nlohmann::json{{"name", t.name},
                       {"bytes_transferred", t.bytes_transferred},
                       {"total_bytes", t.total_bytes},
                       {"progress_percent", t.progress_percent},
                       {"throughput", t.throughput},
                       {"peak_throughput", t.peak_throughput},
                       {"eta_seconds", t.eta_seconds},
                       {"complete", t.complete}};
}

void to_json(nlohmann::json& j, const TransferResult& r) {
    j = nlohmann::json{{"name", r.descriptor.name},
                       {"size", r.descriptor.size},
                       {"type", r.descriptor.media_type},
                       {"direction", to_string(r.direction)},
                       {"status", to_string(r.status)},
                       {"error", to_string(r.error)},
                       {"bytes", r.bytes},
                       {"elapsed_seconds", r.elapsed_seconds},
                       {"average_throughput", r.average_throughput},
                       {"peak_throughput", r.peak_throughput},
                       {"sha256", r.digest_hex},
                       {"integrity", to_string(r.integrity)},
                       {"degraded", r.degraded}};
}

TransferSession::TransferSession(std::chrono::milliseconds sample_interval, std::size_t eta_window)
    : interval_(sample_interval), eta_window_(eta_window == 0 ? 1 : eta_window) {}

void TransferSession::begin(const FileDescriptor& d, Clock::time_point now) {
    reset();
    descriptor_ = d;
    active_ = true;
    start_ = now;
    last_sample_time_ = now;
}

void TransferSession::restart_clock(Clock::time_point now) {
    start_ = now;
    last_sample_time_ = now;
    last_sample_bytes_ = bytes_;
}

void TransferSession::reset() {
    descriptor_ = FileDescriptor{};
    active_ = false;
    completed_ = false;
    bytes_ = 0;
    start_ = last_sample_time_ = Clock::time_point{};
    last_sample_bytes_ = 0;
    throughput_ = 0.0;
    peak_ = 0.0;
    progress_ = 0;
    samples_.clear();
}

bool TransferSession::add_bytes(std::uint64_t n, Clock::time_point now) {
    bytes_ += n;
    if (now - last_sample_time_ < interval_) return false;
    take_sample(now);
    recompute_progress();
    return true;
}

void TransferSession::take_sample(Clock::time_point now) {
    double dt = std::chrono::duration<double>(now - last_sample_time_).count();
    if (dt <= 0.0) return;
    throughput_ = static_cast<double>(bytes_ - last_sample_bytes_) / dt;
    peak_ = std::max(peak_, throughput_);
    samples_.push_back(throughput_);
    while (samples_.size() > eta_window_) samples_.pop_front();
    last_sample_time_ = now;
    last_sample_bytes_ = bytes_;
}

void TransferSession::recompute_progress() {
    int pct = 0;
    if (completed_) {
        pct = 100;
    } else if (descriptor_.size > 0) {
        std::uint64_t p = std::min<std::uint64_t>(bytes_, descriptor_.size) * 100 / descriptor_.size;
        pct = static_cast<int>(std::min<std::uint64_t>(p, 99));
    }
    progress_ = std::max(progress_, pct);
}

void TransferSession::complete() {
    completed_ = true;
    recompute_progress();
}

double TransferSession::eta_seconds() const {
    if (completed_) return 0.0;
    if (samples_.empty()) return -1.0;
    double avg = std::accumulate(samples_.begin(), samples_.end(), 0.0) / samples_.size();
    if (avg <= 0.0) return -1.0;
    std::uint64_t remaining = descriptor_.size > bytes_ ? descriptor_.size - bytes_ : 0;
    return remaining / avg;
}

TelemetrySnapshot TransferSession::snapshot() const {
    TelemetrySnapshot t;
    t.name = descriptor_.name;
    t.bytes_transferred = bytes_;
    t.total_bytes = descriptor_.size;
    t.progress_percent = progress_;
    t.throughput = throughput_;
    t.peak_throughput = peak_;
    t.eta_seconds = eta_seconds();
    t.complete = completed_;
    return t;
}

TransferResult TransferSession::make_result(TransferDirection dir, TransferStatus status, TransferError err,
                                            Clock::time_point now) const {
    TransferResult r;
    r.descriptor = descriptor_;
    r.direction = dir;
    r.status = status;
    r.error = err;
    r.bytes = bytes_;
    r.elapsed_seconds = active_ ? std::chrono::duration<double>(now - start_).count() : 0.0;
    r.average_throughput = r.elapsed_seconds > 0.0 ? bytes_ / r.elapsed_seconds : 0.0;
    r.peak_throughput = peak_;
    return r;
}

} // namespace linkshare
