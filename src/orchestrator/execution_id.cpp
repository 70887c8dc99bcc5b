/**
 * @file execution_id.cpp
 * @brief SHA-256 via OpenSSL EVP.
 * @author Dimitris Kafetzis
 */

#include "orchestrator/execution_id.hpp"

#include <openssl/evp.h>

#include <array>
#include <chrono>
#include <stdexcept>

namespace sandbox_engine {

std::string sha256_hex(std::string_view data) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (EVP_Digest(data.data(), data.size(), digest.data(), &length, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest(sha256) failed");
    }

    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        out += kHex[digest[i] >> 4];
        out += kHex[digest[i] & 0x0F];
    }
    return out;
}

ExecutionId make_execution_id(Language language, std::string_view code,
                              Timestamp submitted, uint32_t nonce) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        submitted.time_since_epoch()).count();
    auto stamp = std::to_string(ms);

    std::string payload(code);
    payload += stamp;
    if (nonce > 0) payload += "#" + std::to_string(nonce);

    return std::string(to_string(language)) + "_" + stamp + "_" + sha256_hex(payload).substr(0, 8);
}

}  // namespace sandbox_engine
