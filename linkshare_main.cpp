#include "linkshare_api.h"
#include "linkshare_config.h"
#include "linkshare_control.h"
#include "linkshare_endpoint.h"
#include "linkshare_event_loop.h"
#include "linkshare_history.h"
#include "linkshare_log.h"
#include "linkshare_tcp_channel.h"

#include <csignal>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using namespace linkshare;

namespace {

EventLoop* g_loop = nullptr;

void on_signal(int) {
    if (g_loop) g_loop->stop();
}

void print_progress(const char* tag, const TelemetrySnapshot& t) {
    std::cout << "\r[" << tag << "] Progress: " << t.progress_percent << "% ("
              << format_mb(t.bytes_transferred) << "/" << format_mb(t.total_bytes) << ")";
    if (t.complete) std::cout << std::endl;
    else std::cout << std::flush;
}

nlohmann::json event(const char* kind, const char* direction) {
    return nlohmann::json{{"event", kind}, {"direction", direction}, {"time", now_hms()}};
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 6) {
        std::cout << "Usage: ./linkshare <my_port> <peer_port> <peer_ip> <role:m1|m2> <api_port> [files...]\n";
        std::cout << "Example (terminal1): ./linkshare 7000 8000 127.0.0.1 m1 8080\n";
        std::cout << "Example (terminal2): ./linkshare 8000 7000 127.0.0.1 m2 8081 movie.mkv notes.pdf\n";
        return 1;
    }
    const int my_port = std::atoi(argv[1]);
    const int peer_port = std::atoi(argv[2]);
    const std::string peer_ip = argv[3];
    const std::string role = argv[4];
    const int api_port = std::atoi(argv[5]);
    std::vector<std::string> files(argv + 6, argv + argc);

    if (role != "m1" && role != "m2") {
        std::cerr << "role must be m1 or m2" << std::endl;
        return 1;
    }

    Config cfg;
    apply_env(cfg);
    std::string err;
    if (const char* path = std::getenv("LINKSHARE_CONFIG")) {
        if (!load_config_file(path, cfg, &err)) {
            log_err("CONFIG") << err << std::endl;
            return 1;
        }
        log_out("CONFIG") << "Loaded " << path << std::endl;
    }
    if (!validate(cfg, &err)) {
        log_err("CONFIG") << err << std::endl;
        return 1;
    }
    log_out("CONFIG") << "chunk " << cfg.chunk_size << " B, watermarks " << format_mb(cfg.high_watermark) << "/"
                      << format_mb(cfg.low_watermark) << ", flush " << format_mb(cfg.flush_threshold)
                      << ", out_dir " << cfg.out_dir << std::endl;

    DBConfig db_cfg;
    apply_db_env(db_cfg);
    if (db_cfg.database.empty()) log_out("DB") << "LINKSHARE_DB_NAME not set, transfer history disabled" << std::endl;
    else log_out("DB") << "Recording transfers in database '" << db_cfg.database << "'" << std::endl;

    int fd = net::establish_link(my_port, peer_port, peer_ip, role, 0, &err);
    if (fd < 0) {
        log_err("CHANNEL") << err << std::endl;
        return 1;
    }

    EventLoop loop;
    g_loop = &loop;
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    std::signal(SIGPIPE, SIG_IGN);

    TcpChannel channel(loop, fd, cfg.high_watermark + 4 * cfg.chunk_size);
    Endpoint ep(channel, loop, cfg);
    StatusBoard board;
    EventFeed feed;
    HistoryRecorder recorder(db_cfg);
    const bool history_on = !db_cfg.database.empty();
    if (history_on) recorder.start();

    auto publish = [&] { board.publish(status_json(ep).dump()); };
    auto keep = [&](const TransferResult& r) {
        if (history_on) recorder.submit(r);
        nlohmann::json e = event("result", to_string(r.direction));
        e["result"] = r;
        feed.push(e.dump());
        publish();
    };

    ep.sender().set_progress_handler([&](const TelemetrySnapshot& t) {
        print_progress("SEND", t);
        nlohmann::json e = event("progress", "send");
        e["telemetry"] = t;
        feed.push(e.dump());
    });
    ep.receiver().set_progress_handler([&](const TelemetrySnapshot& t) {
        print_progress("RECV", t);
        nlohmann::json e = event("progress", "receive");
        e["telemetry"] = t;
        feed.push(e.dump());
    });

    ep.receiver().set_offer_handler([&](const FileDescriptor& d) {
        nlohmann::json e = event("offer", "receive");
        e["meta"] = {{"name", d.name}, {"size", d.size}, {"type", d.media_type}};
        feed.push(e.dump());
        publish();
        if (cfg.auto_accept.empty()) {
            log_out("RECV") << "POST /confirm {\"mode\":\"motor\"|\"fallback\"} or /decline on port " << api_port
                            << " to answer" << std::endl;
            return;
        }
        const ConfirmMode mode = cfg.auto_accept == "motor" ? ConfirmMode::Motor : ConfirmMode::Fallback;
        std::string confirm_err;
        if (!confirm_offer(ep, loop, cfg, mode, &confirm_err)) log_err("RECV") << confirm_err << std::endl;
    });

    ep.receiver().set_notice_handler([&](const std::string& text) {
        nlohmann::json e = event("notice", "receive");
        e["message"] = text;
        feed.push(e.dump());
    });

    ep.receiver().set_complete_handler([&](const TransferResult& r, ReceivedArtifact& a) {
        std::string path, store_err;
        if (!store_artifact(cfg, r, a, path, &store_err)) {
            // the receiver reports the failure through the abort handler
            log_err("RECV") << "saving " << path << ": " << store_err << std::endl;
            return false;
        }
        log_out("RECV") << "Saved " << r.descriptor.name << " to " << path << std::endl;
        keep(r);
        return true;
    });
    ep.receiver().set_abort_handler(keep);
    ep.queue().set_result_handler(keep);
    ep.queue().set_drained_handler([&](const std::vector<TransferResult>& results) {
        std::size_t ok = 0;
        for (const auto& r : results) if (r.status == TransferStatus::Completed) ++ok;
        log_out("QUEUE") << ok << "/" << results.size() << " file(s) delivered" << std::endl;
        publish();
    });

    ep.set_disconnect_handler([&] {
        publish();
        loop.stop();
    });

    if (!channel.start()) {
        log_err("CHANNEL") << "could not start the link" << std::endl;
        return 1;
    }

    ControlApi api(loop, ep, cfg, board, feed, db_cfg);
    if (!api.start(api_port)) log_err("API") << "control API disabled" << std::endl;

    for (const auto& path : files) {
        if (!send_path(ep, loop, path, &err)) log_err("SEND") << err << std::endl;
    }

    Timer status_timer(loop);
    std::function<void()> tick = [&] {
        publish();
        status_timer.arm(cfg.telemetry_interval, tick);
    };
    tick();

    log_out("MAIN") << "Ready (role=" << role << ", api port " << api_port << "). Ctrl+C to quit." << std::endl;
    loop.run();

    log_out("MAIN") << "Shutting down..." << std::endl;
    status_timer.cancel();
    api.stop();
    if (ep.queue().state() == QueueState::Running) ep.queue().cancel_all("sender shutting down");
    if (ep.receiver().session_open()) ep.receiver().cancel("receiver shutting down");
    // give the cancel frames a chance to leave
    for (int i = 0; i < 10 && channel.is_open() && channel.queued_bytes() > 0; ++i) loop.run_once(20);
    channel.close();
    recorder.stop();
    g_loop = nullptr;
    log_out("MAIN") << "Goodbye!" << std::endl;
    return 0;
}
