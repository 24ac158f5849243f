// Incremental SHA-256 over OpenSSL
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace linkshare {

// Incremental SHA-256 over a file's bytes in stream order.
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void reset();
    void update(const std::uint8_t* data, std::size_t len);
    // Lowercase hex digest; the object must be reset() before reuse.
    std::string final_hex();

private:
    struct State;
    std::unique_ptr<State> state_;
};

std::string sha256_hex(const std::string& data);

} // namespace linkshare
