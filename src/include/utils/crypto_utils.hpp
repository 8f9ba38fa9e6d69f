#pragma once
/**
 * @file crypto_utils.hpp
 * @brief Cryptographic utilities for data-integrity checksums.
 *
 * This module provides a centralized interface for the hashing used by the copy
 * engine:
 * - SHA-256 one-shot hashing of a buffer
 * - Incremental SHA-256 over a stream of buffers (`Sha256Stream`)
 * - SHA-1 for version 1.x block maps (`sha1_hex`, `Sha1Stream`)
 * - Lowercase hex encoding and case-insensitive digest comparison
 *
 * SHA-256 and hex encoding come from libsodium, which is initialized automatically
 * via the Lifecycle module. libsodium has no SHA-1, so that digest goes through the
 * OpenSSL EVP interface.
 *
 * - ABI-stable interface (no libsodium or OpenSSL types in the public API)
 * - Thread-safe (libsodium is thread-safe after initialization)
 *
 * @see https://libsodium.gitbook.io/doc/
 */
#include "bmapcopy_utils_export.h"
#include "module_def.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace bmapcopy::crypto
{

// ============================================================================
// Constants
// ============================================================================

/** SHA-256 digest size in bytes. */
static constexpr size_t SHA256_HASH_BYTES = 32;

/** Length of a SHA-256 digest rendered as lowercase hex. */
static constexpr size_t SHA256_HEX_CHARS = SHA256_HASH_BYTES * 2;

/** SHA-1 digest size in bytes. */
static constexpr size_t SHA1_HASH_BYTES = 20;

static constexpr size_t SHA1_HEX_CHARS = SHA1_HASH_BYTES * 2;

using Sha256Digest = std::array<uint8_t, SHA256_HASH_BYTES>;
using Sha1Digest = std::array<uint8_t, SHA1_HASH_BYTES>;

// ============================================================================
// SHA-256 Hashing
// ============================================================================

/**
 * @brief Computes a SHA-256 hash of the input data.
 *
 * @param out Pointer to output buffer (must be at least SHA256_HASH_BYTES).
 * @param data Pointer to input data to hash. May be null only if `len == 0`.
 * @param len Length of input data in bytes.
 * @return True on success, false if libsodium initialization failed or on a null argument.
 */
BMAPCOPY_UTILS_EXPORT bool compute_sha256(uint8_t *out, const void *data, size_t len) noexcept;

/**
 * @brief Computes a SHA-256 hash and returns it as lowercase hex.
 * @return 64 hex characters, or an empty string on failure.
 */
BMAPCOPY_UTILS_EXPORT std::string sha256_hex(const void *data, size_t len);

/**
 * @brief Encodes bytes as lowercase hex using sodium_bin2hex.
 */
BMAPCOPY_UTILS_EXPORT std::string to_hex(const uint8_t *data, size_t len);

/**
 * @brief Compares two hex digests case-insensitively.
 * @return True if both have the same length and the same value.
 */
BMAPCOPY_UTILS_EXPORT bool hex_digest_equals(std::string_view a, std::string_view b) noexcept;

/**
 * @class Sha256Stream
 * @brief Incremental SHA-256 over a sequence of buffers.
 *
 * Wraps `crypto_hash_sha256_state`. Call `update()` any number of times, then
 * `final_hex()` once. `reset()` starts a new digest.
 *
 * @code
 * Sha256Stream h;
 * h.update(chunk1.data(), chunk1.size());
 * h.update(chunk2.data(), chunk2.size());
 * std::string digest = h.final_hex();
 * @endcode
 */
class BMAPCOPY_UTILS_EXPORT Sha256Stream
{
  public:
    /** @throws std::runtime_error if libsodium cannot be initialized. */
    Sha256Stream();
    ~Sha256Stream();

    Sha256Stream(const Sha256Stream &) = delete;
    Sha256Stream &operator=(const Sha256Stream &) = delete;
    Sha256Stream(Sha256Stream &&) noexcept;
    Sha256Stream &operator=(Sha256Stream &&) noexcept;

    void update(const void *data, size_t len);
    /** @brief Finalizes the digest. The stream must be reset before reuse. */
    [[nodiscard]] Sha256Digest final_digest();
    [[nodiscard]] std::string final_hex();
    void reset();

  private:
    struct State;
    std::unique_ptr<State> m_state;
};

// ============================================================================
// SHA-1 Hashing
// ============================================================================

/**
 * @brief Computes a SHA-1 hash and returns it as lowercase hex.
 * @return 40 hex characters, or an empty string on failure.
 */
BMAPCOPY_UTILS_EXPORT std::string sha1_hex(const void *data, size_t len);

/**
 * @class Sha1Stream
 * @brief Incremental SHA-1, same contract as Sha256Stream.
 */
class BMAPCOPY_UTILS_EXPORT Sha1Stream
{
  public:
    /** @throws std::runtime_error if the digest context cannot be created. */
    Sha1Stream();
    ~Sha1Stream();

    Sha1Stream(const Sha1Stream &) = delete;
    Sha1Stream &operator=(const Sha1Stream &) = delete;
    Sha1Stream(Sha1Stream &&) noexcept;
    Sha1Stream &operator=(Sha1Stream &&) noexcept;

    void update(const void *data, size_t len);
    [[nodiscard]] Sha1Digest final_digest();
    [[nodiscard]] std::string final_hex();
    void reset();

  private:
    struct State;
    std::unique_ptr<State> m_state;
};

// ============================================================================
// Lifecycle Integration
// ============================================================================

/**
 * @brief Returns the ModuleDef for crypto utilities lifecycle management.
 * @details The startup function calls sodium_init() once at application startup.
 *
 * @return ModuleDef for the "CryptoUtils" module, depending on the Logger.
 */
BMAPCOPY_UTILS_EXPORT bmapcopy::utils::ModuleDef GetLifecycleModule();

} // namespace bmapcopy::crypto
