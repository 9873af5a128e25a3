#include "core/hasher.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <openssl/evp.h>

#include <format>
#include <memory>

namespace pdpl {

namespace {

/**
 * @brief RAII wrapper for EVP_MD_CTX* (auto-calls EVP_MD_CTX_free on destruction)
 */
struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }
};
using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

struct DigestBuffer {
    unsigned char bytes[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
};

// Digest of the concatenation a + b
DigestBuffer compute_digest(const EVP_MD* md, std::string_view a, std::string_view b) {
    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw Error("EVP_MD_CTX_new failed");
    }

    DigestBuffer out;
    if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), a.data(), a.size()) != 1 ||
        EVP_DigestUpdate(ctx.get(), b.data(), b.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), out.bytes, &out.len) != 1) {
        throw Error("Message digest computation failed");
    }
    return out;
}

constexpr int kUuidVersion = 5;

} // anonymous namespace

DeterministicHasher::DeterministicHasher(std::string salt, std::string_view namespace_uuid)
    : salt_(std::move(salt)) {
    const auto parsed = parse_uuid(namespace_uuid);
    if (!parsed) {
        throw ConfigurationError(std::format("Invalid hashing namespace UUID: '{}'", namespace_uuid));
    }
    namespace_ = *parsed;
}

// ============================================================================
// Salted SHA-256 digest
// ============================================================================

std::optional<std::string> DeterministicHasher::digest(std::string_view value) const {
    const auto trimmed = utils::trim(value);
    if (trimmed.empty()) return std::nullopt;

    const auto md = compute_digest(EVP_sha256(), salt_, trimmed);

    std::string result(kDigestTag);
    result += utils::bytes_to_hex(md.bytes, md.len);
    return result;
}

// ============================================================================
// Name-based UUID (RFC 4122 §4.3, SHA-1)
// ============================================================================

std::optional<std::string> DeterministicHasher::name_uuid(std::string_view value) const {
    const auto trimmed = utils::trim(value);
    if (trimmed.empty()) return std::nullopt;

    const std::string_view ns(reinterpret_cast<const char*>(namespace_.data()), namespace_.size());
    const auto md = compute_digest(EVP_sha1(), ns, trimmed);

    Uuid uuid{};
    for (size_t i = 0; i < uuid.size(); ++i) {
        uuid[i] = md.bytes[i];
    }
    uuid[6] = static_cast<uint8_t>((uuid[6] & 0x0F) | (kUuidVersion << 4));
    uuid[8] = static_cast<uint8_t>((uuid[8] & 0x3F) | 0x80);   // RFC 4122 variant

    std::string result(kUuidTag);
    result += format_uuid(uuid);
    return result;
}

// ============================================================================
// UUID text helpers
// ============================================================================

std::optional<DeterministicHasher::Uuid> DeterministicHasher::parse_uuid(std::string_view text) {
    static constexpr size_t kCanonicalLength = 36;
    if (text.size() != kCanonicalLength) return std::nullopt;

    std::string hex;
    hex.reserve(32);
    for (size_t i = 0; i < text.size(); ++i) {
        const bool dash_position = (i == 8 || i == 13 || i == 18 || i == 23);
        if (dash_position) {
            if (text[i] != '-') return std::nullopt;
            continue;
        }
        hex += text[i];
    }

    const auto bytes = utils::hex_to_bytes(hex);
    if (bytes.size() != 16) return std::nullopt;

    Uuid uuid{};
    for (size_t i = 0; i < uuid.size(); ++i) {
        uuid[i] = bytes[i];
    }
    return uuid;
}

std::string DeterministicHasher::format_uuid(const Uuid& uuid) {
    const std::string hex = utils::bytes_to_hex(uuid.data(), uuid.size());
    return std::format("{}-{}-{}-{}-{}",
        hex.substr(0, 8), hex.substr(8, 4), hex.substr(12, 4),
        hex.substr(16, 4), hex.substr(20, 12));
}

} // namespace pdpl
