#include "linkshare_digest.h"

#include <iomanip>
#include <openssl/sha.h>
#include <sstream>

namespace linkshare {

struct Sha256::State {
    SHA256_CTX ctx;
};

Sha256::Sha256() : state_(new State) { reset(); }

Sha256::~Sha256() = default;

void Sha256::reset() { SHA256_Init(&state_->ctx); }

void Sha256::update(const std::uint8_t* data, std::size_t len) {
    if (len) SHA256_Update(&state_->ctx, data, len);
}

std::string Sha256::final_hex() {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256_Final(hash, &state_->ctx);
    std::ostringstream oss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return oss.str();
}

std::string sha256_hex(const std::string& data) {
    Sha256 d;
    d.update(reinterpret_cast<const std::uint8_t*>(data.data()), data.size());
    return d.final_hex();
}

} // namespace linkshare
