#pragma once

/// @file room_token.hpp
/// @brief HMAC-SHA256 room access tokens using the OpenSSL EVP API.
///
/// Internal header for LocalRoomProvisioner. A token has the form
/// "<roomId>.<peerId>.<expiresAtUnix>.<hex signature>" where the signature
/// covers everything before the last dot.

#include <array>
#include <cstdint>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <random>
#include <string>
#include <string_view>

namespace lcs::service::detail {

[[nodiscard]] inline std::string toHex(const unsigned char* data, std::size_t length) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(length * 2);
    for (std::size_t i = 0; i < length; ++i) {
        out.push_back(kDigits[data[i] >> 4]);
        out.push_back(kDigits[data[i] & 0x0F]);
    }
    return out;
}

/// Hex-encoded HMAC-SHA256 of @p message, or empty on OpenSSL failure.
[[nodiscard]] inline std::string hmacSha256Hex(std::string_view key, std::string_view message) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digestLength = 0;

    auto* result = HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
                        reinterpret_cast<const unsigned char*>(message.data()), message.size(),
                        digest.data(), &digestLength);
    if (result == nullptr) {
        return {};
    }
    return toHex(digest.data(), digestLength);
}

/// Random bytes from std::random_device, hex encoded.
[[nodiscard]] inline std::string secureRandomHex(std::size_t numBytes) {
    std::random_device rd;
    std::string bytes(numBytes, '\0');
    for (auto& b : bytes) {
        b = static_cast<char>(rd());
    }
    return toHex(reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size());
}

/// Compare two strings in constant time.
[[nodiscard]] inline bool constantTimeEqual(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    volatile uint8_t diff = 0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        diff = diff | static_cast<uint8_t>(a[i] ^ b[i]);
    }
    return diff == 0;
}

[[nodiscard]] inline std::string signRoomToken(std::string_view secret, std::string_view roomId,
                                               uint64_t peerId, int64_t expiresAt) {
    std::string body(roomId);
    body += '.';
    body += std::to_string(peerId);
    body += '.';
    body += std::to_string(expiresAt);

    auto signature = hmacSha256Hex(secret, body);
    if (signature.empty()) {
        return {};
    }
    return body + '.' + signature;
}

} // namespace lcs::service::detail
