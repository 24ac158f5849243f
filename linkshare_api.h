// Local HTTP/JSON control surface for a presentation layer
#pragma once

#include "linkshare_config.h"
#include "linkshare_control.h"
#include "linkshare_endpoint.h"
#include "linkshare_event_loop.h"
#include "linkshare_history.h"

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace httplib { class Server; }

namespace linkshare {

// cpp-httplib server on its own thread. Handlers never touch the engines
// directly: commands are dispatched to the loop and awaited, status comes
// from the StatusBoard the loop publishes.
//
//   GET  /status   GET /events (SSE)   GET /history
//   POST /send {"path"}   POST /confirm {"mode"}   POST /decline   POST /cancel {"direction"}
class ControlApi {
public:
    ControlApi(EventLoop& loop, Endpoint& ep, const Config& cfg, StatusBoard& board, EventFeed& feed, DBConfig db);
    ~ControlApi();

    ControlApi(const ControlApi&) = delete;
    ControlApi& operator=(const ControlApi&) = delete;

    bool start(int port);
    void stop();

private:
    void install_routes();
    // Runs `fn` on the loop thread and waits for its answer.
    bool on_loop(std::function<bool(std::string*)> fn, std::string& err);

    EventLoop& loop_;
    Endpoint& ep_;
    Config cfg_;
    StatusBoard& board_;
    EventFeed& feed_;
    DBConfig db_;

    std::unique_ptr<httplib::Server> svr_;
    std::thread thread_;
    std::atomic<bool> running_{false};
};

} // namespace linkshare
