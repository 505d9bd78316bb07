#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <QByteArray>
#include <QString>

#include <array>
#include <sodium.h>

namespace lanlink::crypto {

constexpr size_t kContentHashSize = 16;
// 2^53 - 1, the largest integer a double holds exactly.
constexpr InstanceId kMaxInstanceId = 0x001FFFFFFFFFFFFFULL;

/**
 * Initialize libsodium. Safe to call more than once.
 */
[[nodiscard]] inline Result<void, Error> init() {
    if (sodium_init() < 0) {
        return Result<void, Error>::err(Error{"Failed to initialize libsodium"});
    }
    return Result<void, Error>::ok();
}

/**
 * Draw a random, non-zero instance id for this process.
 */
[[nodiscard]] inline InstanceId random_instance_id() {
    InstanceId id = 0;
    while (id == 0) {
        randombytes_buf(&id, sizeof(id));
        // Keep it within the range every JSON/number parser round-trips exactly.
        id &= kMaxInstanceId;
    }
    return id;
}

/**
 * BLAKE2b digest of UTF-8 text, rendered as lowercase hex.
 * Used only to suppress clipboard echo; not a security boundary.
 */
[[nodiscard]] inline QString content_hash(const QString& text) {
    const QByteArray utf8 = text.toUtf8();
    std::array<unsigned char, kContentHashSize> out{};
    crypto_generichash(out.data(), out.size(),
                       reinterpret_cast<const unsigned char*>(utf8.constData()),
                       static_cast<unsigned long long>(utf8.size()),
                       nullptr, 0);

    std::array<char, kContentHashSize * 2 + 1> hex{};
    sodium_bin2hex(hex.data(), hex.size(), out.data(), out.size());
    return QString::fromLatin1(hex.data());
}

} // namespace lanlink::crypto
