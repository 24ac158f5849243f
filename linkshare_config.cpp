#include "linkshare_config.h"
#include "linkshare_log.h"
#include "linkshare_tcp_channel.h"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>

namespace linkshare {

namespace {

bool parse_u64(const char* v, std::uint64_t& out) {
    if (!v || !*v || *v == '-') return false;
    errno = 0;
    char* end = nullptr;
    unsigned long long n = std::strtoull(v, &end, 10);
    if (errno != 0 || *end != '\0') return false;
    out = n;
    return true;
}

template<typename T>
void env_number(const char* name, T& field) {
    const char* v = std::getenv(name);
    if (!v) return;
    std::uint64_t n = 0;
    if (!parse_u64(v, n)) {
        log_err("CONFIG") << name << "='" << v << "' is not a non-negative integer, ignored" << std::endl;
        return;
    }
    field = static_cast<T>(n);
}

void env_ms(const char* name, std::chrono::milliseconds& field) {
    std::uint64_t n = static_cast<std::uint64_t>(field.count());
    env_number(name, n);
    field = std::chrono::milliseconds(n);
}

template<typename T>
void json_number(const nlohmann::json& j, const char* key, T& field) {
    if (j.contains(key) && j[key].is_number_unsigned()) field = j[key].get<T>();
}

void json_ms(const nlohmann::json& j, const char* key, std::chrono::milliseconds& field) {
    if (j.contains(key) && j[key].is_number_unsigned()) field = std::chrono::milliseconds(j[key].get<std::uint64_t>());
}

} // namespace

void apply_env(Config& c) {
    env_number("LINKSHARE_CHUNK_SIZE", c.chunk_size);
    env_number("LINKSHARE_HIGH_WATERMARK", c.high_watermark);
    env_number("LINKSHARE_LOW_WATERMARK", c.low_watermark);
    env_ms("LINKSHARE_POLL_INTERVAL_MS", c.poll_interval);
    env_number("LINKSHARE_FLUSH_THRESHOLD", c.flush_threshold);
    env_number("LINKSHARE_MEMORY_LIMIT", c.memory_limit);
    env_ms("LINKSHARE_TELEMETRY_INTERVAL_MS", c.telemetry_interval);
    env_number("LINKSHARE_ETA_WINDOW", c.eta_window);
    env_ms("LINKSHARE_HANDSHAKE_TIMEOUT_MS", c.handshake_timeout);
    env_number("LINKSHARE_HANDSHAKE_RETRIES", c.handshake_retries);
    env_ms("LINKSHARE_SETTLE_DELAY_MS", c.settle_delay);
    env_ms("LINKSHARE_SEND_RETRY_DELAY_MS", c.send_retry_delay);
    env_number("LINKSHARE_SEND_RETRY_LIMIT", c.send_retry_limit);
    if (const char* v = std::getenv("LINKSHARE_DIGEST")) c.compute_digest = std::string(v) != "0";
    if (const char* v = std::getenv("LINKSHARE_OUT_DIR")) c.out_dir = v;
    if (const char* v = std::getenv("LINKSHARE_AUTO_ACCEPT")) c.auto_accept = v;
}

bool load_config_file(const std::string& path, Config& c, std::string* err) {
    std::ifstream in(path);
    if (!in) {
        if (err) *err = "cannot open " + path;
        return false;
    }
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& ex) {
        if (err) *err = path + ": " + ex.what();
        return false;
    }
    if (!j.is_object()) {
        if (err) *err = path + ": expected a JSON object";
        return false;
    }
    json_number(j, "chunk_size", c.chunk_size);
    json_number(j, "high_watermark", c.high_watermark);
    json_number(j, "low_watermark", c.low_watermark);
    json_ms(j, "poll_interval_ms", c.poll_interval);
    json_number(j, "flush_threshold", c.flush_threshold);
    json_number(j, "memory_limit", c.memory_limit);
    json_ms(j, "telemetry_interval_ms", c.telemetry_interval);
    json_number(j, "eta_window", c.eta_window);
    json_ms(j, "handshake_timeout_ms", c.handshake_timeout);
    json_number(j, "handshake_retries", c.handshake_retries);
    json_ms(j, "settle_delay_ms", c.settle_delay);
    json_ms(j, "send_retry_delay_ms", c.send_retry_delay);
    json_number(j, "send_retry_limit", c.send_retry_limit);
    if (j.contains("compute_digest") && j["compute_digest"].is_boolean()) c.compute_digest = j["compute_digest"].get<bool>();
    if (j.contains("out_dir") && j["out_dir"].is_string()) c.out_dir = j["out_dir"].get<std::string>();
    if (j.contains("auto_accept") && j["auto_accept"].is_string()) c.auto_accept = j["auto_accept"].get<std::string>();
    return true;
}

bool validate(const Config& c, std::string* err) {
    auto fail = [&](const char* why) { if (err) *err = why; return false; };
    if (c.chunk_size == 0) return fail("chunk_size must be positive");
    if (c.chunk_size > net::kMaxFramePayload) return fail("chunk_size exceeds the largest frame the channel carries");
    if (c.high_watermark == 0) return fail("high_watermark must be positive");
    if (c.low_watermark >= c.high_watermark) return fail("low_watermark must be below high_watermark");
    if (c.poll_interval.count() <= 0) return fail("poll_interval_ms must be positive");
    if (c.flush_threshold == 0) return fail("flush_threshold must be positive");
    if (c.eta_window == 0) return fail("eta_window must be positive");
    if (c.handshake_timeout.count() <= 0) return fail("handshake_timeout_ms must be positive");
    if (c.handshake_retries < 0 || c.send_retry_limit < 0) return fail("retry counts must not be negative");
    if (!c.auto_accept.empty() && c.auto_accept != "motor" && c.auto_accept != "fallback")
        return fail("auto_accept must be empty, 'motor' or 'fallback'");
    return true;
}

} // namespace linkshare
