#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pdpl {

/**
 * @brief Deterministic, non-reversible pseudonymization
 *
 * Two transforms over the trimmed input:
 * - digest():    "HASH_"  + SHA-256(salt + value) as 64 lowercase hex chars
 * - name_uuid(): "UUID5_" + RFC 4122 version-5 UUID of value in a fixed namespace
 *
 * Blank input yields nullopt, never the hash of an empty string.
 * Immutable after construction, safe to share across threads.
 */
class DeterministicHasher {
public:
    static constexpr std::string_view kDigestTag = "HASH_";
    static constexpr std::string_view kUuidTag = "UUID5_";
    static constexpr std::string_view kDefaultNamespace = "5b2d9f3e-8c1a-4f6e-9d2b-7a4c3e1f0b6d";

    using Uuid = std::array<uint8_t, 16>;

    /**
     * @param salt Application-wide secret prepended to every digest input
     * @param namespace_uuid Canonical UUID text (8-4-4-4-12)
     * @throws ConfigurationError if namespace_uuid is not a valid UUID
     */
    explicit DeterministicHasher(std::string salt,
                                 std::string_view namespace_uuid = kDefaultNamespace);

    [[nodiscard]] std::optional<std::string> digest(std::string_view value) const;

    [[nodiscard]] std::optional<std::string> name_uuid(std::string_view value) const;

    /**
     * @brief Parse canonical UUID text into bytes
     * @return nullopt if text is not 32 hex digits in 8-4-4-4-12 groups
     */
    [[nodiscard]] static std::optional<Uuid> parse_uuid(std::string_view text);

    [[nodiscard]] static std::string format_uuid(const Uuid& uuid);

private:
    std::string salt_;
    Uuid namespace_{};
};

} // namespace pdpl
