#include "linkshare_control.h"
#include "linkshare_byte_source.h"
#include "linkshare_disk_sink.h"
#include "linkshare_log.h"

#include <nlohmann/json.hpp>

namespace linkshare {

namespace {

std::optional<nlohmann::json> parse_object(const std::string& body, std::string* err) {
    try {
        auto j = nlohmann::json::parse(body);
        if (j.is_object()) return j;
        if (err) *err = "expected a JSON object";
    } catch (const nlohmann::json::parse_error& ex) {
        if (err) *err = std::string("invalid JSON: ") + ex.what();
    }
    return std::nullopt;
}

std::optional<std::string> string_field(const nlohmann::json& j, const char* key, std::string* err) {
    if (!j.contains(key) || !j[key].is_string()) {
        if (err) *err = std::string("missing '") + key + "' field";
        return std::nullopt;
    }
    return j[key].get<std::string>();
}

} // namespace

std::optional<std::string> parse_send_request(const std::string& body, std::string* err) {
    auto j = parse_object(body, err);
    if (!j) return std::nullopt;
    auto path = string_field(*j, "path", err);
    if (path && path->empty()) {
        if (err) *err = "'path' is empty";
        return std::nullopt;
    }
    return path;
}

std::optional<ConfirmMode> parse_confirm_request(const std::string& body, std::string* err) {
    // an empty body means motor mode
    if (body.empty()) return ConfirmMode::Motor;
    auto j = parse_object(body, err);
    if (!j) return std::nullopt;
    if (!j->contains("mode")) return ConfirmMode::Motor;
    auto mode = string_field(*j, "mode", err);
    if (!mode) return std::nullopt;
    if (*mode == "motor") return ConfirmMode::Motor;
    if (*mode == "fallback") return ConfirmMode::Fallback;
    if (err) *err = "mode must be 'motor' or 'fallback'";
    return std::nullopt;
}

std::optional<TransferDirection> parse_cancel_request(const std::string& body, std::string* err) {
    auto j = parse_object(body, err);
    if (!j) return std::nullopt;
    auto dir = string_field(*j, "direction", err);
    if (!dir) return std::nullopt;
    if (*dir == "send") return TransferDirection::Send;
    if (*dir == "receive") return TransferDirection::Receive;
    if (err) *err = "direction must be 'send' or 'receive'";
    return std::nullopt;
}

std::string output_path(const Config& cfg, const std::string& name) {
    std::string dir = cfg.out_dir.empty() ? std::string(".") : cfg.out_dir;
    if (dir.back() != '/') dir += '/';
    return dir + sanitize_filename(name);
}

bool confirm_offer(Endpoint& ep, Scheduler& sched, const Config& cfg, ConfirmMode mode, std::string* err) {
    ReceiverEngine& rx = ep.receiver();
    if (!rx.offer_pending()) {
        if (err) *err = "no file is waiting for confirmation";
        return false;
    }
    std::unique_ptr<DiskSink> sink;
    if (mode == ConfirmMode::Motor) {
        const std::string path = output_path(cfg, rx.session().descriptor().name);
        std::string open_err;
        sink = FileDiskSink::open(sched, path, &open_err);
        if (!sink) log_err("RECV") << open_err << ", falling back to memory" << std::endl;
    }
    if (!rx.confirm(std::move(sink))) {
        if (err) *err = "offer could not be accepted";
        return false;
    }
    return true;
}

bool send_path(Endpoint& ep, Scheduler& sched, const std::string& path, std::string* err) {
    auto src = FileByteSource::open(sched, path, err);
    if (!src) return false;
    ep.queue().enqueue(std::move(src));
    ep.queue().start();
    return true;
}

bool store_artifact(const Config& cfg, const TransferResult& r, const ReceivedArtifact& a, std::string& path,
                    std::string* err) {
    if (!a.sink_label.empty()) {
        path = a.sink_label;
        // fully streamed: already on disk
        if (!a.degraded) return true;
    } else {
        path = output_path(cfg, r.descriptor.name);
    }
    return persist_artifact(path, a, err);
}

nlohmann::json status_json(const Endpoint& ep) {
    const SenderEngine& tx = ep.sender();
    const ReceiverEngine& rx = ep.receiver();
    const QueueCoordinator& q = ep.queue();

    nlohmann::json sending = tx.session().snapshot();
    sending["state"] = to_string(tx.state());
    sending["paused"] = tx.flow().paused();

    nlohmann::json receiving = rx.session().snapshot();
    receiving["state"] = to_string(rx.state());
    receiving["in_memory"] = rx.strategy() && !rx.strategy()->streaming();

    nlohmann::json results = nlohmann::json::array();
    for (const auto& r : q.results()) results.push_back(r);

    return nlohmann::json{{"sending", sending},
                          {"receiving", receiving},
                          {"queue", {{"state", to_string(q.state())},
                                     {"pending", q.pending()},
                                     {"current", q.current() ? q.current()->name() : std::string()},
                                     {"results", results}}}};
}

void EventFeed::push(std::string event) {
    {
        std::lock_guard<std::mutex> lk(m_);
        events_.push_back(std::move(event));
        while (events_.size() > capacity_) {
            events_.pop_front();
            ++base_;
        }
    }
    cv_.notify_all();
}

bool EventFeed::wait_next(std::size_t& cursor, std::vector<std::string>& out, std::chrono::milliseconds wait) {
    std::unique_lock<std::mutex> lk(m_);
    if (!cv_.wait_for(lk, wait, [&] { return base_ + events_.size() > cursor || closed_; })) return false;
    if (closed_) return false;
    if (cursor < base_) cursor = base_;
    for (std::size_t i = cursor - base_; i < events_.size(); ++i) out.push_back(events_[i]);
    cursor = base_ + events_.size();
    return true;
}

std::size_t EventFeed::end_cursor() const {
    std::lock_guard<std::mutex> lk(m_);
    return base_ + events_.size();
}

std::size_t EventFeed::retained() const {
    std::lock_guard<std::mutex> lk(m_);
    return events_.size();
}

bool EventFeed::closed() const {
    std::lock_guard<std::mutex> lk(m_);
    return closed_;
}

void EventFeed::close() {
    {
        std::lock_guard<std::mutex> lk(m_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool stream_events(EventFeed& feed, std::size_t& cursor, const std::function<bool(const std::string&)>& write,
                   std::chrono::milliseconds wait) {
    std::vector<std::string> batch;
    if (!feed.wait_next(cursor, batch, wait)) {
        if (feed.closed()) return false;
        return write(": ping\n\n");
    }
    for (const auto& ev : batch) {
        if (!write("data: " + ev + "\n\n")) return false;
    }
    return true;
}

} // namespace linkshare
