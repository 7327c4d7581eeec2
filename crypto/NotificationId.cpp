/**
 * @file NotificationId.cpp
 * @brief Deterministic notification ids derived with OpenSSL SHA-256
 *
 * The digest input is the geofence key, a NUL separator and the transition
 * name. The first four digest bytes are read big-endian and masked to 31 bits
 * so the id is always a non-negative int.
 */

#include "NotificationId.hpp"
#include <openssl/evp.h>
#include <cstdint>
#include <stdexcept>

namespace nearme {

int NotificationId::forTransition(const std::string& geofenceKey, TransitionKind kind) {
    std::string message = geofenceKey;
    message.push_back('\0');
    message += transitionKindToString(kind);

    const std::string digest = sha256(message);

    uint32_t value = 0;
    for (size_t i = 0; i < 4; ++i) {
        value = (value << 8) | static_cast<unsigned char>(digest[i]);
    }
    return static_cast<int>(value & 0x7FFFFFFFu);
}

/**
 * @brief One-shot SHA-256 using the EVP interface
 *
 * @return Raw binary digest (32 bytes)
 * @throws std::runtime_error if OpenSSL reports a failure
 */
std::string NotificationId::sha256(const std::string& message) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;

    if (EVP_Digest(message.data(), message.size(), digest, &length, EVP_sha256(), nullptr) != 1 ||
        length < 4) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    return std::string(reinterpret_cast<char*>(digest), length);
}

} // namespace nearme
