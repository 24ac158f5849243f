// Application-side helpers shared by main and the control API
#pragma once

#include "linkshare_config.h"
#include "linkshare_endpoint.h"
#include "linkshare_event_loop.h"
#include "linkshare_receive_sink.h"
#include "linkshare_session.h"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

namespace linkshare {

enum class ConfirmMode { Motor, Fallback };

// Request bodies of the control API. Each returns nullopt with `err` set on bad input.
std::optional<std::string> parse_send_request(const std::string& body, std::string* err = nullptr);
std::optional<ConfirmMode> parse_confirm_request(const std::string& body, std::string* err = nullptr);
std::optional<TransferDirection> parse_cancel_request(const std::string& body, std::string* err = nullptr);

// Where a received file named `name` is written: <out_dir>/<sanitized name>
std::string output_path(const Config& cfg, const std::string& name);

// Confirms the receiver's pending offer. Motor mode opens the output file and
// falls back to memory (with a notice) when that fails.
bool confirm_offer(Endpoint& ep, Scheduler& sched, const Config& cfg, ConfirmMode mode, std::string* err = nullptr);

// Queues a local file on the endpoint and starts the queue.
bool send_path(Endpoint& ep, Scheduler& sched, const std::string& path, std::string* err = nullptr);

// Puts a finished receive on disk when part or all of it is still in memory.
// Returns the path holding the file.
bool store_artifact(const Config& cfg, const TransferResult& r, const ReceivedArtifact& a, std::string& path,
                    std::string* err = nullptr);

// {sending, receiving, queue} view of the endpoint
nlohmann::json status_json(const Endpoint& ep);

// Latest status document, written by the loop thread and read by the API thread.
class StatusBoard {
public:
    void publish(std::string doc) {
        std::lock_guard<std::mutex> lk(m_);
        doc_ = std::move(doc);
    }
    std::string read() const {
        std::lock_guard<std::mutex> lk(m_);
        return doc_;
    }

private:
    mutable std::mutex m_;
    std::string doc_ = "{}";
};

// Bounded log of JSON events (offers, progress, results) for the
// server-sent event stream. Producers run on the loop thread, readers on
// the HTTP threads. Cursors count every event ever pushed, so they stay
// valid when the oldest events are dropped.
class EventFeed {
public:
    explicit EventFeed(std::size_t capacity = 1024) : capacity_(capacity == 0 ? 1 : capacity) {}

    void push(std::string event);

    // Copies events after `cursor` into `out` and advances the cursor. A cursor
    // older than the retained window skips to its start.
    // Waits up to `wait` for one to arrive; false on timeout or after close().
    bool wait_next(std::size_t& cursor, std::vector<std::string>& out, std::chrono::milliseconds wait);

    // Cursor a new reader starts from
    std::size_t end_cursor() const;
    std::size_t retained() const;
    bool closed() const;
    void close();

private:
    mutable std::mutex m_;
    std::condition_variable cv_;
    std::size_t capacity_;
    std::deque<std::string> events_;
    std::size_t base_ = 0; // cursor of events_.front()
    bool closed_ = false;
};

// One step of a server-sent event stream: forwards the events after `cursor`
// through `write`, or a heartbeat comment when none arrives within `wait`.
// False once the feed is closed or a write fails (the client went away).
bool stream_events(EventFeed& feed, std::size_t& cursor, const std::function<bool(const std::string&)>& write,
                   std::chrono::milliseconds wait);

} // namespace linkshare
