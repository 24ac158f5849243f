#include "linkshare_log.h"

#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace linkshare {

namespace {

class NullBuffer : public std::streambuf {
protected:
    int overflow(int c) override { return c; }
};

std::ostream& null_stream() {
    static NullBuffer buf;
    static std::ostream out(&buf);
    return out;
}

std::ostream& stamp(std::ostream& os, const char* tag) {
    os << "[" << now_hms() << "] [" << tag << "] ";
    return os;
}

} // namespace

std::string now_hms() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
    return std::string(buf);
}

bool debug_enabled() {
    static const bool enabled = [] {
        const char* v = std::getenv("LINKSHARE_DEBUG");
        return v && *v && std::string(v) != "0";
    }();
    return enabled;
}

std::ostream& log_out(const char* tag) { return stamp(std::cout, tag); }

std::ostream& log_err(const char* tag) { return stamp(std::cerr, tag); }

std::ostream& log_debug(const char* tag) {
    if (!debug_enabled()) return null_stream();
    std::cout << "[DEBUG] ";
    return stamp(std::cout, tag);
}

std::string format_mb(std::uint64_t bytes) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << (bytes / (1024.0 * 1024.0)) << " MB";
    return oss.str();
}

} // namespace linkshare
