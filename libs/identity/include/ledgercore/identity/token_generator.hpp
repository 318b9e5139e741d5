#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace ledgercore {
namespace identity {

constexpr std::size_t kTokenBytes = 16;
constexpr std::size_t kTokenTextSize = 36;  // 8-4-4-4-12

using TokenBytes = std::array<std::uint8_t, kTokenBytes>;

// Opaque, globally unique row identities (RFC 4122 version 4 UUIDs drawn
// from libsodium's CSPRNG). Thread-safe.
class TokenGenerator {
 public:
  TokenGenerator();

  [[nodiscard]] std::string next() const;

  // Formats 16 raw bytes as a canonical lower-case UUID, forcing the version
  // and variant bits.
  [[nodiscard]] static std::string format(TokenBytes bytes);
  [[nodiscard]] static bool is_valid(std::string_view token) noexcept;
};

}  // namespace identity
}  // namespace ledgercore
