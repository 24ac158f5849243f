#include "linkshare_history.h"
#include "linkshare_log.h"

#include <cstdlib>
#include <mysql/mysql.h>
#include <nlohmann/json.hpp>
#include <sstream>

namespace linkshare {

void apply_db_env(DBConfig& cfg) {
    if (const char* v = std::getenv("LINKSHARE_DB_HOST"))   cfg.host = v;
    if (const char* v = std::getenv("LINKSHARE_DB_PORT"))   { int p = std::atoi(v); if (p > 0 && p < 65536) cfg.port = (unsigned)p; }
    if (const char* v = std::getenv("LINKSHARE_DB_USER"))   cfg.user = v;
    if (const char* v = std::getenv("LINKSHARE_DB_PASS"))   cfg.password = v;
    if (const char* v = std::getenv("LINKSHARE_DB_NAME"))   cfg.database = v;
    if (const char* v = std::getenv("LINKSHARE_DB_SOCKET")) cfg.unix_socket = v;
}

// ---- DB ----

DB::~DB() {
    if (conn_) {
        mysql_close(conn_);
        conn_ = nullptr;
    }
}

DB::DB(DB&& other) noexcept : conn_(other.conn_) { other.conn_ = nullptr; }

DB& DB::operator=(DB&& other) noexcept {
    if (this != &other) {
        if (conn_) mysql_close(conn_);
        conn_ = other.conn_;
        other.conn_ = nullptr;
    }
    return *this;
}

bool DB::connect(const DBConfig& cfg, std::string* err) {
    if (conn_) { mysql_close(conn_); conn_ = nullptr; }
    conn_ = mysql_init(nullptr);
    if (!conn_) { if (err) *err = "mysql_init failed"; return false; }
    unsigned int timeout = 5;
    mysql_options(conn_, MYSQL_OPT_CONNECT_TIMEOUT, &timeout);
    if (!mysql_real_connect(conn_,
                            cfg.host.c_str(),
                            cfg.user.c_str(),
                            cfg.password.c_str(),
                            cfg.database.empty() ? nullptr : cfg.database.c_str(),
                            cfg.port,
                            cfg.unix_socket.empty() ? nullptr : cfg.unix_socket.c_str(),
                            cfg.client_flags)) {
        if (err) *err = mysql_error(conn_);
        mysql_close(conn_);
        conn_ = nullptr;
        return false;
    }
    return true;
}

bool DB::exec(const std::string& sql, std::string* err) {
    if (!conn_) { if (err) *err = "not connected"; return false; }
    if (mysql_query(conn_, sql.c_str()) != 0) {
        if (err) *err = mysql_error(conn_);
        return false;
    }
    // drain a stray result set so the connection stays usable
    if (MYSQL_RES* res = mysql_store_result(conn_)) mysql_free_result(res);
    return true;
}

bool DB::query_rows(const std::string& sql, std::vector<std::vector<std::string>>& rows, std::string* err) {
    if (!conn_) { if (err) *err = "not connected"; return false; }
    if (mysql_query(conn_, sql.c_str()) != 0) { if (err) *err = mysql_error(conn_); return false; }
    MYSQL_RES* res = mysql_store_result(conn_);
    if (!res) {
        if (mysql_field_count(conn_) == 0) return true;
        if (err) *err = mysql_error(conn_);
        return false;
    }
    unsigned int cols = mysql_num_fields(res);
    MYSQL_ROW row;
    while ((row = mysql_fetch_row(res))) {
        unsigned long* lengths = mysql_fetch_lengths(res);
        std::vector<std::string> r;
        r.reserve(cols);
        for (unsigned int i = 0; i < cols; ++i) r.emplace_back(row[i] ? std::string(row[i], lengths[i]) : std::string());
        rows.push_back(std::move(r));
    }
    mysql_free_result(res);
    return true;
}

std::string DB::quote(const std::string& s) const {
    std::string out(s.size() * 2 + 1, '\0');
    unsigned long n = conn_ ? mysql_real_escape_string(conn_, &out[0], s.data(), s.size())
                            : mysql_escape_string(&out[0], s.data(), s.size());
    out.resize(n);
    return "'" + out + "'";
}

// ---- TransferHistory ----

namespace {

const char* kCreateTable =
    "CREATE TABLE IF NOT EXISTS linkshare_transfers ("
    " id BIGINT AUTO_INCREMENT PRIMARY KEY,"
    " name VARCHAR(255) NOT NULL,"
    " size BIGINT UNSIGNED NOT NULL,"
    " media_type VARCHAR(128),"
    " direction VARCHAR(16) NOT NULL,"
    " status VARCHAR(16) NOT NULL,"
    " error VARCHAR(64),"
    " bytes BIGINT UNSIGNED NOT NULL,"
    " elapsed_seconds DOUBLE,"
    " average_throughput DOUBLE,"
    " peak_throughput DOUBLE,"
    " sha256 CHAR(64),"
    " integrity VARCHAR(16),"
    " degraded TINYINT(1) NOT NULL DEFAULT 0,"
    " created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP)";

} // namespace

bool TransferHistory::open(std::string* err) {
    if (db_.connected()) return true;
    if (cfg_.database.empty()) {
        if (err) *err = "no database configured";
        return false;
    }
    if (!db_.connect(cfg_, err)) return false;
    return db_.exec(kCreateTable, err);
}

bool TransferHistory::record(const TransferResult& r, std::string* err) {
    if (!open(err)) return false;
    std::ostringstream oss;
    oss << "INSERT INTO linkshare_transfers (name, size, media_type, direction, status, error, bytes,"
           " elapsed_seconds, average_throughput, peak_throughput, sha256, integrity, degraded) VALUES ("
        << db_.quote(r.descriptor.name) << ", " << r.descriptor.size << ", " << db_.quote(r.descriptor.media_type)
        << ", '" << to_string(r.direction) << "', '" << to_string(r.status) << "', '" << to_string(r.error)
        << "', " << r.bytes << ", " << r.elapsed_seconds << ", " << r.average_throughput << ", "
        << r.peak_throughput << ", " << (r.digest_hex.empty() ? std::string("NULL") : db_.quote(r.digest_hex))
        << ", '" << to_string(r.integrity) << "', " << (r.degraded ? 1 : 0) << ")";
    return db_.exec(oss.str(), err);
}

bool TransferHistory::recent(std::size_t limit, nlohmann::json& out, std::string* err) {
    if (!open(err)) return false;
    std::vector<std::vector<std::string>> rows;
    std::ostringstream oss;
    oss << "SELECT name, size, direction, status, error, bytes, average_throughput, sha256, integrity,"
           " degraded, created_at FROM linkshare_transfers ORDER BY id DESC LIMIT " << limit;
    if (!db_.query_rows(oss.str(), rows, err)) return false;
    out = nlohmann::json::array();
    for (const auto& r : rows) {
        if (r.size() < 11) continue;
        out.push_back({{"name", r[0]},
                       {"size", std::strtoull(r[1].c_str(), nullptr, 10)},
                       {"direction", r[2]},
                       {"status", r[3]},
                       {"error", r[4]},
                       {"bytes", std::strtoull(r[5].c_str(), nullptr, 10)},
                       {"average_throughput", std::strtod(r[6].c_str(), nullptr)},
                       {"sha256", r[7]},
                       {"integrity", r[8]},
                       {"degraded", r[9] == "1"},
                       {"created_at", r[10]}});
    }
    return true;
}

// ---- HistoryRecorder ----

HistoryRecorder::HistoryRecorder(DBConfig cfg) : history_(std::move(cfg)) {}

HistoryRecorder::~HistoryRecorder() { stop(); }

void HistoryRecorder::start() {
    if (running_.exchange(true)) return;
    worker_ = std::thread(&HistoryRecorder::run, this);
}

void HistoryRecorder::stop() {
    if (!running_.exchange(false)) return;
    queue_.notify_all();
    if (worker_.joinable()) worker_.join();
}

void HistoryRecorder::submit(TransferResult r) {
    queue_.push(std::move(r));
}

void HistoryRecorder::run() {
    TransferResult r;
    while (queue_.wait_pop(r, running_)) {
        std::string err;
        if (!history_.record(r, &err)) {
            log_err("DB") << "could not record " << r.descriptor.name << ": " << err << std::endl;
            continue;
        }
        log_debug("DB") << "recorded " << r.descriptor.name << " (" << to_string(r.status) << ")" << std::endl;
    }
}

} // namespace linkshare
