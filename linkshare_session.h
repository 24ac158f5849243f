// Per-file counters, telemetry and results
#pragma once

#include "linkshare_event_loop.h"
#include "linkshare_protocol.h"

#include <chrono>
#include <cstdint>
#include <deque>
#include <nlohmann/json_fwd.hpp>
#include <string>

namespace linkshare {

enum class TransferDirection { Send, Receive };

enum class TransferStatus { Completed, Cancelled, Failed, Skipped };

enum class TransferError {
    None,
    ChannelClosed,
    HandshakeTimeout,
    SendFailed,
    SourceReadFailed,
    SinkCloseFailed,
    FileTooLarge,
    Declined,
    RemoteCancelled,
    LocalCancelled,
    Superseded,
    SizeMismatch,
};

enum class Integrity { Unchecked, Verified, Mismatch };

const char* to_string(TransferDirection d);
const char* to_string(TransferStatus s);
const char* to_string(TransferError e);
const char* to_string(Integrity i);

struct TelemetrySnapshot {
    std::string name;
    std::uint64_t bytes_transferred{};
    std::uint64_t total_bytes{};
    int progress_percent{};
    double throughput{};      // bytes/sec over the last sample interval
    double peak_throughput{};
    double eta_seconds{-1.0}; // -1 while unknown
    bool complete{};
};

struct TransferResult {
    FileDescriptor descriptor;
    TransferDirection direction{TransferDirection::Send};
    TransferStatus status{TransferStatus::Completed};
    TransferError error{TransferError::None};
    std::uint64_t bytes{};
    double elapsed_seconds{};
    double average_throughput{};
    double peak_throughput{};
    std::string digest_hex;
    Integrity integrity{Integrity::Unchecked};
    bool degraded{}; // receiver fell back to memory after a sink write failure
};

void to_json(nlohmann::json& j, const TelemetrySnapshot& t);
void to_json(nlohmann::json& j, const TransferResult& r);

// Bookkeeping for exactly one file in one direction: byte counter,
// throughput samples and the derived progress/ETA.
//
// Throughput and progress are recomputed at most once per sample interval.
// progress_percent() never decreases and only reads 100 after complete().
class TransferSession {
public:
    TransferSession(std::chrono::milliseconds sample_interval, std::size_t eta_window);

    void begin(const FileDescriptor& d, Clock::time_point now);
    // Restarts the throughput clock without touching the byte count (sender: on ReadyToReceive).
    void restart_clock(Clock::time_point now);
    void reset();

    // Returns true when this call took a new throughput sample.
    bool add_bytes(std::uint64_t n, Clock::time_point now);
    void complete();

    TelemetrySnapshot snapshot() const;
    TransferResult make_result(TransferDirection dir, TransferStatus status, TransferError err,
                               Clock::time_point now) const;

    bool active() const { return active_; }
    bool completed() const { return completed_; }
    const FileDescriptor& descriptor() const { return descriptor_; }
    std::uint64_t bytes_transferred() const { return bytes_; }
    int progress_percent() const { return progress_; }
    double throughput() const { return throughput_; }
    double peak_throughput() const { return peak_; }
    double eta_seconds() const;
    Clock::time_point start_time() const { return start_; }

private:
    void take_sample(Clock::time_point now);
    void recompute_progress();

    std::chrono::milliseconds interval_;
    std::size_t eta_window_;

    FileDescriptor descriptor_;
    bool active_ = false;
    bool completed_ = false;
    std::uint64_t bytes_ = 0;
    Clock::time_point start_{};
    Clock::time_point last_sample_time_{};
    std::uint64_t last_sample_bytes_ = 0;
    double throughput_ = 0.0;
    double peak_ = 0.0;
    int progress_ = 0;
    std::deque<double> samples_;
};

} // namespace linkshare
