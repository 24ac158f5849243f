#include "linkshare_api.h"
#include "linkshare_log.h"

#include "httplib.h"
#include <chrono>
#include <future>
#include <nlohmann/json.hpp>

namespace linkshare {

namespace {

void cors(httplib::Response& res, const char* methods) {
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_header("Access-Control-Allow-Methods", methods);
}

void preflight(httplib::Server& svr, const char* path, const char* methods) {
    svr.Options(path, [methods](const httplib::Request& req, httplib::Response& res) {
        cors(res, methods);
        auto req_headers = req.get_header_value("Access-Control-Request-Headers");
        res.set_header("Access-Control-Allow-Headers", req_headers.empty() ? "content-type" : req_headers.c_str());
        res.status = 204;
    });
}

void reply_error(httplib::Response& res, int status, const std::string& why) {
    res.status = status;
    res.set_content(nlohmann::json{{"error", why}}.dump(), "application/json");
}

void reply_ok(httplib::Response& res) {
    res.set_content(R"({"status":"ok"})", "application/json");
}

} // namespace

ControlApi::ControlApi(EventLoop& loop, Endpoint& ep, const Config& cfg, StatusBoard& board, EventFeed& feed,
                       DBConfig db)
    : loop_(loop), ep_(ep), cfg_(cfg), board_(board), feed_(feed), db_(std::move(db)),
      svr_(new httplib::Server) {
    install_routes();
}

ControlApi::~ControlApi() { stop(); }

bool ControlApi::start(int port) {
    if (running_.exchange(true)) return false;
    if (!svr_->bind_to_port("0.0.0.0", port)) {
        log_err("API") << "cannot bind port " << port << std::endl;
        running_.store(false);
        return false;
    }
    thread_ = std::thread([this, port] {
        log_out("API") << "Listening on port " << port << "..." << std::endl;
        if (!svr_->listen_after_bind()) log_err("API") << "server on port " << port << " stopped with an error" << std::endl;
    });
    return true;
}

void ControlApi::stop() {
    if (!running_.exchange(false)) return;
    feed_.close();
    svr_->stop();
    if (thread_.joinable()) thread_.join();
}

bool ControlApi::on_loop(std::function<bool(std::string*)> fn, std::string& err) {
    auto done = std::make_shared<std::promise<std::pair<bool, std::string>>>();
    auto answer = done->get_future();
    loop_.dispatch([fn = std::move(fn), done] {
        std::string e;
        bool ok = fn(&e);
        done->set_value({ok, e});
    });
    if (answer.wait_for(std::chrono::seconds(5)) != std::future_status::ready) {
        err = "event loop did not answer";
        return false;
    }
    auto result = answer.get();
    err = result.second;
    return result.first;
}

void ControlApi::install_routes() {
    httplib::Server& svr = *svr_;

    preflight(svr, "/status", "GET, OPTIONS");
    preflight(svr, "/events", "GET, OPTIONS");
    preflight(svr, "/history", "GET, OPTIONS");
    preflight(svr, "/send", "POST, OPTIONS");
    preflight(svr, "/confirm", "POST, OPTIONS");
    preflight(svr, "/decline", "POST, OPTIONS");
    preflight(svr, "/cancel", "POST, OPTIONS");

    svr.Get("/status", [this](const httplib::Request&, httplib::Response& res) {
        cors(res, "GET, OPTIONS");
        res.set_content(board_.read(), "application/json");
    });

    svr.Get("/history", [this](const httplib::Request& req, httplib::Response& res) {
        cors(res, "GET, OPTIONS");
        std::size_t limit = 50;
        if (req.has_param("limit")) limit = std::strtoul(req.get_param_value("limit").c_str(), nullptr, 10);
        if (limit == 0 || limit > 1000) limit = 50;
        TransferHistory history(db_);
        nlohmann::json rows;
        std::string err;
        if (!history.recent(limit, rows, &err)) {
            log_err("DB") << "history query failed: " << err << std::endl;
            reply_error(res, 503, "history unavailable");
            return;
        }
        res.set_content(nlohmann::json{{"status", "ok"}, {"transfers", rows}}.dump(), "application/json");
    });

    svr.Post("/send", [this](const httplib::Request& req, httplib::Response& res) {
        cors(res, "POST, OPTIONS");
        std::string err;
        auto path = parse_send_request(req.body, &err);
        if (!path) { reply_error(res, 400, err); return; }
        const std::string p = *path;
        if (!on_loop([this, p](std::string* e) { return send_path(ep_, loop_, p, e); }, err)) {
            reply_error(res, 409, err);
            return;
        }
        log_out("API") << "queued " << p << std::endl;
        reply_ok(res);
    });

    svr.Post("/confirm", [this](const httplib::Request& req, httplib::Response& res) {
        cors(res, "POST, OPTIONS");
        std::string err;
        auto mode = parse_confirm_request(req.body, &err);
        if (!mode) { reply_error(res, 400, err); return; }
        const ConfirmMode m = *mode;
        if (!on_loop([this, m](std::string* e) { return confirm_offer(ep_, loop_, cfg_, m, e); }, err)) {
            reply_error(res, 409, err);
            return;
        }
        reply_ok(res);
    });

    svr.Post("/decline", [this](const httplib::Request&, httplib::Response& res) {
        cors(res, "POST, OPTIONS");
        std::string err;
        bool ok = on_loop([this](std::string* e) {
            if (ep_.receiver().decline()) return true;
            *e = "no file is waiting for confirmation";
            return false;
        }, err);
        if (!ok) { reply_error(res, 409, err); return; }
        reply_ok(res);
    });

    svr.Post("/cancel", [this](const httplib::Request& req, httplib::Response& res) {
        cors(res, "POST, OPTIONS");
        std::string err;
        auto dir = parse_cancel_request(req.body, &err);
        if (!dir) { reply_error(res, 400, err); return; }
        const TransferDirection d = *dir;
        bool ok = on_loop([this, d](std::string* e) {
            if (d == TransferDirection::Send) {
                if (ep_.queue().state() == QueueState::Running) {
                    ep_.queue().cancel_all();
                    return true;
                }
                *e = "nothing is being sent";
                return false;
            }
            if (ep_.receiver().cancel()) return true;
            *e = "nothing is being received";
            return false;
        }, err);
        if (!ok) { reply_error(res, 409, err); return; }
        reply_ok(res);
    });

    svr.Get("/events", [this](const httplib::Request&, httplib::Response& res) {
        cors(res, "GET, OPTIONS");
        res.set_header("Cache-Control", "no-cache");
        res.set_header("Connection", "keep-alive");
        const std::size_t start_idx = feed_.end_cursor();
        res.set_chunked_content_provider(
            "text/event-stream",
            [this, idx = start_idx](size_t, httplib::DataSink& sink) mutable {
                auto write = [&sink](const std::string& text) { return sink.write(text.data(), text.size()); };
                return stream_events(feed_, idx, write, std::chrono::seconds(30)) && running_.load();
            },
            [](bool) {});
    });
}

} // namespace linkshare
