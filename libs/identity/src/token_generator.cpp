#include "ledgercore/identity/token_generator.hpp"

#include <sodium.h>

#include <stdexcept>

namespace ledgercore {
namespace identity {

namespace {

class SodiumInitializer {
 public:
  SodiumInitializer() {
    if (sodium_init() < 0) {
      throw std::runtime_error("Failed to initialize libsodium");
    }
  }
};

void ensure_sodium_init() {
  static SodiumInitializer init;
}

constexpr bool is_dash_position(std::size_t pos) noexcept {
  return pos == 8 || pos == 13 || pos == 18 || pos == 23;
}

bool is_lower_hex(char ch) noexcept {
  return (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'f');
}

}  // namespace

TokenGenerator::TokenGenerator() {
  ensure_sodium_init();
}

std::string TokenGenerator::next() const {
  TokenBytes bytes{};
  randombytes_buf(bytes.data(), bytes.size());
  return format(bytes);
}

std::string TokenGenerator::format(TokenBytes bytes) {
  bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0f) | 0x40);  // version 4
  bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3f) | 0x80);  // RFC 4122 variant

  std::array<char, kTokenBytes * 2 + 1> hex{};
  sodium_bin2hex(hex.data(), hex.size(), bytes.data(), bytes.size());

  std::string token;
  token.reserve(kTokenTextSize);
  std::size_t src = 0;
  for (std::size_t pos = 0; pos < kTokenTextSize; ++pos) {
    if (is_dash_position(pos)) {
      token.push_back('-');
    } else {
      token.push_back(hex[src++]);
    }
  }
  return token;
}

bool TokenGenerator::is_valid(std::string_view token) noexcept {
  if (token.size() != kTokenTextSize) {
    return false;
  }
  for (std::size_t pos = 0; pos < token.size(); ++pos) {
    if (is_dash_position(pos)) {
      if (token[pos] != '-') {
        return false;
      }
    } else if (!is_lower_hex(token[pos])) {
      return false;
    }
  }
  const char variant = token[19];
  return token[14] == '4' && (variant == '8' || variant == '9' || variant == 'a' || variant == 'b');
}

}  // namespace identity
}  // namespace ledgercore
