// Engine tuning and its env/JSON overrides
#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace linkshare {

// Tuning knobs for both engines. Defaults suit a LAN TCP channel.
struct Config {
    std::size_t chunk_size = 256 * 1024;
    std::uint64_t high_watermark = 16ull * 1024 * 1024;
    std::uint64_t low_watermark = 4ull * 1024 * 1024;
    std::chrono::milliseconds poll_interval{5};

    std::uint64_t flush_threshold = 8ull * 1024 * 1024;
    std::uint64_t memory_limit = 1024ull * 1024 * 1024; // largest file accepted without a disk sink

    std::chrono::milliseconds telemetry_interval{300};
    std::size_t eta_window = 5;

    std::chrono::milliseconds handshake_timeout{30000};
    int handshake_retries = 1;
    std::chrono::milliseconds settle_delay{50};
    std::chrono::milliseconds send_retry_delay{5};
    int send_retry_limit = 20;

    bool compute_digest = true;
    std::string out_dir = ".";
    std::string auto_accept; // "", "motor" or "fallback"
};

// Overrides fields from LINKSHARE_* environment variables; bad values are reported and skipped.
void apply_env(Config& c);

// Overrides fields from a JSON object file; unknown keys are ignored.
bool load_config_file(const std::string& path, Config& c, std::string* err = nullptr);

bool validate(const Config& c, std::string* err = nullptr);

} // namespace linkshare
