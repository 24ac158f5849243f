// MySQL-backed record of finished transfers
#pragma once

#include "blocking_queue.h"
#include "linkshare_session.h"

#include <atomic>
#include <cstddef>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <thread>
#include <vector>

// Opaque MySQL C API handle
struct st_mysql;
typedef struct st_mysql MYSQL;

namespace linkshare {

struct DBConfig {
    std::string host = "127.0.0.1";
    unsigned int port = 3306;
    std::string user = "root";
    std::string password;
    std::string database;     // empty disables the history
    std::string unix_socket;  // empty -> TCP
    unsigned long client_flags = 0;
};

// LINKSHARE_DB_HOST, _PORT, _USER, _PASS, _NAME, _SOCKET
void apply_db_env(DBConfig& cfg);

// RAII wrapper around MYSQL*
class DB {
public:
    DB() = default;
    ~DB();

    DB(const DB&) = delete;
    DB& operator=(const DB&) = delete;
    DB(DB&&) noexcept;
    DB& operator=(DB&&) noexcept;

    bool connect(const DBConfig& cfg, std::string* err = nullptr);
    bool connected() const { return conn_ != nullptr; }

    // Statement without a result set
    bool exec(const std::string& sql, std::string* err = nullptr);

    // Every row of a result set as strings (NULL -> "")
    bool query_rows(const std::string& sql, std::vector<std::vector<std::string>>& rows,
                    std::string* err = nullptr);

    // Quoted SQL string literal for `s`
    std::string quote(const std::string& s) const;

private:
    MYSQL* conn_ = nullptr;
};

class TransferHistory {
public:
    explicit TransferHistory(DBConfig cfg) : cfg_(std::move(cfg)) {}

    // Connects (if needed) and creates the table.
    bool open(std::string* err = nullptr);
    bool record(const TransferResult& r, std::string* err = nullptr);
    // Newest first, as a JSON array of result objects
    bool recent(std::size_t limit, nlohmann::json& out, std::string* err = nullptr);

private:
    DBConfig cfg_;
    DB db_;
};

// Writes results on its own thread so the event loop never waits on MySQL.
// A failed write is logged and dropped.
class HistoryRecorder {
public:
    explicit HistoryRecorder(DBConfig cfg);
    ~HistoryRecorder();

    HistoryRecorder(const HistoryRecorder&) = delete;
    HistoryRecorder& operator=(const HistoryRecorder&) = delete;

    void start();
    void stop();
    void submit(TransferResult r);

private:
    void run();

    TransferHistory history_;
    BlockingQueue<TransferResult> queue_;
    std::atomic<bool> running_{false};
    std::thread worker_;
};

} // namespace linkshare
