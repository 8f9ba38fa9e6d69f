/**
 * @file crypto_utils.cpp
 * @brief Implementation of cryptographic utilities using libsodium and OpenSSL EVP.
 */
#include "utils/crypto_utils.hpp"
#include "bmc_service.hpp" // For Logger (includes bmc_base.hpp)

#include <openssl/evp.h>
#include <sodium.h>
#include <atomic>
#include <chrono>
#include <stdexcept>

namespace bmapcopy::crypto
{

// ============================================================================
// Libsodium Initialization (Internal)
// ============================================================================

namespace
{
/**
 * @brief Tracks libsodium initialization status.
 * @details sodium_init() is idempotent and thread-safe; the flag only spares the call
 *          on the hot path.
 */
std::atomic<bool> g_sodium_initialized{false};

/**
 * @brief Ensures libsodium is initialized, calling sodium_init() if needed.
 * @return True if libsodium is initialized, false on catastrophic failure.
 */
bool ensure_sodium_init() noexcept
{
    if (g_sodium_initialized.load(std::memory_order_acquire))
    {
        return true;
    }

    // 0: first initialization, 1: already initialized, -1: failure
    if (sodium_init() == -1)
    {
        return false;
    }
    g_sodium_initialized.store(true, std::memory_order_release);
    return true;
}

} // anonymous namespace

// ============================================================================
// SHA-256 Hashing Implementation
// ============================================================================

bool compute_sha256(uint8_t *out, const void *data, size_t len) noexcept
{
    if (!ensure_sodium_init())
    {
        return false;
    }
    if (out == nullptr || (data == nullptr && len != 0))
    {
        return false;
    }
    return crypto_hash_sha256(out, static_cast<const unsigned char *>(data), len) == 0;
}

std::string sha256_hex(const void *data, size_t len)
{
    Sha256Digest digest{};
    if (!compute_sha256(digest.data(), data, len))
    {
        return {};
    }
    return to_hex(digest.data(), digest.size());
}

std::string to_hex(const uint8_t *data, size_t len)
{
    if (data == nullptr || len == 0)
    {
        return {};
    }
    // sodium_bin2hex writes a terminating NUL.
    std::string hex(len * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), data, len);
    hex.resize(len * 2);
    return hex;
}

bool hex_digest_equals(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
    {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i)
    {
        auto lower = [](char c) { return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c; };
        if (lower(a[i]) != lower(b[i]))
        {
            return false;
        }
    }
    return true;
}

// ============================================================================
// Sha256Stream
// ============================================================================

struct Sha256Stream::State
{
    crypto_hash_sha256_state ctx{};
    bool finalized = false;
};

Sha256Stream::Sha256Stream() : m_state(std::make_unique<State>())
{
    if (!ensure_sodium_init())
    {
        throw std::runtime_error("Sha256Stream: libsodium initialization failed");
    }
    crypto_hash_sha256_init(&m_state->ctx);
}

Sha256Stream::~Sha256Stream() = default;
Sha256Stream::Sha256Stream(Sha256Stream &&) noexcept = default;
Sha256Stream &Sha256Stream::operator=(Sha256Stream &&) noexcept = default;

void Sha256Stream::update(const void *data, size_t len)
{
    if (m_state->finalized)
    {
        throw std::logic_error("Sha256Stream::update called after finalization");
    }
    if (len == 0)
    {
        return;
    }
    crypto_hash_sha256_update(&m_state->ctx, static_cast<const unsigned char *>(data), len);
}

Sha256Digest Sha256Stream::final_digest()
{
    if (m_state->finalized)
    {
        throw std::logic_error("Sha256Stream already finalized");
    }
    Sha256Digest digest{};
    crypto_hash_sha256_final(&m_state->ctx, digest.data());
    m_state->finalized = true;
    return digest;
}

std::string Sha256Stream::final_hex()
{
    const Sha256Digest digest = final_digest();
    return to_hex(digest.data(), digest.size());
}

void Sha256Stream::reset()
{
    crypto_hash_sha256_init(&m_state->ctx);
    m_state->finalized = false;
}

// ============================================================================
// SHA-1 (OpenSSL EVP)
// ============================================================================

std::string sha1_hex(const void *data, size_t len)
{
    if (data == nullptr && len != 0)
    {
        return {};
    }
    Sha1Digest digest{};
    unsigned int out_len = 0;
    if (EVP_Digest(data, len, digest.data(), &out_len, EVP_sha1(), nullptr) != 1 ||
        out_len != digest.size())
    {
        return {};
    }
    return to_hex(digest.data(), digest.size());
}

struct Sha1Stream::State
{
    EVP_MD_CTX *ctx = nullptr;
    bool finalized = false;

    ~State()
    {
        if (ctx != nullptr)
        {
            EVP_MD_CTX_free(ctx);
        }
    }
};

Sha1Stream::Sha1Stream() : m_state(std::make_unique<State>())
{
    m_state->ctx = EVP_MD_CTX_new();
    if (m_state->ctx == nullptr || EVP_DigestInit_ex(m_state->ctx, EVP_sha1(), nullptr) != 1)
    {
        throw std::runtime_error("Sha1Stream: cannot initialize the SHA-1 context");
    }
}

Sha1Stream::~Sha1Stream() = default;
Sha1Stream::Sha1Stream(Sha1Stream &&) noexcept = default;
Sha1Stream &Sha1Stream::operator=(Sha1Stream &&) noexcept = default;

void Sha1Stream::update(const void *data, size_t len)
{
    if (m_state->finalized)
    {
        throw std::logic_error("Sha1Stream::update called after finalization");
    }
    if (len == 0)
    {
        return;
    }
    if (EVP_DigestUpdate(m_state->ctx, data, len) != 1)
    {
        throw std::runtime_error("Sha1Stream: EVP_DigestUpdate failed");
    }
}

Sha1Digest Sha1Stream::final_digest()
{
    if (m_state->finalized)
    {
        throw std::logic_error("Sha1Stream already finalized");
    }
    Sha1Digest digest{};
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(m_state->ctx, digest.data(), &out_len) != 1 ||
        out_len != digest.size())
    {
        throw std::runtime_error("Sha1Stream: EVP_DigestFinal_ex failed");
    }
    m_state->finalized = true;
    return digest;
}

std::string Sha1Stream::final_hex()
{
    const Sha1Digest digest = final_digest();
    return to_hex(digest.data(), digest.size());
}

void Sha1Stream::reset()
{
    if (EVP_DigestInit_ex(m_state->ctx, EVP_sha1(), nullptr) != 1)
    {
        throw std::runtime_error("Sha1Stream: cannot reset the SHA-1 context");
    }
    m_state->finalized = false;
}

// ============================================================================
// Lifecycle Integration
// ============================================================================

namespace
{
void crypto_startup(const char *arg)
{
    (void)arg;
    LOGGER_DEBUG("[CryptoUtils] Module starting up...");
    if (!ensure_sodium_init())
    {
        LOGGER_ERROR("[CryptoUtils] FATAL: Failed to initialize libsodium!");
        throw std::runtime_error("CryptoUtils: sodium_init() failed");
    }
    LOGGER_INFO("[CryptoUtils] libsodium {} initialized", sodium_version_string());
}

void crypto_shutdown(const char *arg)
{
    (void)arg;
    // libsodium needs no explicit cleanup.
    LOGGER_DEBUG("[CryptoUtils] Module shutdown complete");
}

} // anonymous namespace

bmapcopy::utils::ModuleDef GetLifecycleModule()
{
    bmapcopy::utils::ModuleDef module("CryptoUtils");
    module.add_dependency("bmapcopy::utils::Logger");
    module.set_startup(crypto_startup);
    module.set_shutdown(crypto_shutdown, std::chrono::milliseconds(1000));
    return module;
}

} // namespace bmapcopy::crypto
