// Sends queued files one after another
#pragma once

#include "linkshare_byte_source.h"
#include "linkshare_config.h"
#include "linkshare_sender.h"
#include "linkshare_session.h"

#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace linkshare {

enum class QueueState { Idle, Running, Terminal };

const char* to_string(QueueState s);

// Feeds the sender one file at a time. The next file is announced only
// after the sender reports the current one finished, which for a
// successful file means the peer's ack plus the settle delay.
//
// A handshake timeout re-announces the same file up to
// Config::handshake_retries times before it is recorded as skipped.
class QueueCoordinator {
public:
    using ResultHandler = std::function<void(const TransferResult&)>;
    using DrainedHandler = std::function<void(const std::vector<TransferResult>&)>;

    QueueCoordinator(SenderEngine& sender, const Config& cfg);

    QueueCoordinator(const QueueCoordinator&) = delete;
    QueueCoordinator& operator=(const QueueCoordinator&) = delete;

    // Appends a source. A terminal queue restarts immediately.
    void enqueue(std::unique_ptr<ByteSource> source);
    // Announces the first pending file. False when already running or empty.
    bool start();
    // Drops every pending file and cancels the one in flight.
    void cancel_all(const std::string& reason = "queue cancelled");

    void set_result_handler(ResultHandler h) { result_ = std::move(h); }
    void set_drained_handler(DrainedHandler h) { drained_ = std::move(h); }

    QueueState state() const { return state_; }
    std::size_t pending() const { return pending_.size(); }
    const ByteSource* current() const { return current_.get(); }
    const std::vector<TransferResult>& results() const { return results_; }

private:
    void advance();
    void on_sender_finished(TransferResult r);
    void record(TransferResult r);

    SenderEngine& sender_;
    int handshake_retries_;

    QueueState state_ = QueueState::Idle;
    std::deque<std::unique_ptr<ByteSource>> pending_;
    std::unique_ptr<ByteSource> current_;
    int attempts_ = 0;
    std::vector<TransferResult> results_;

    ResultHandler result_;
    DrainedHandler drained_;
};

} // namespace linkshare
