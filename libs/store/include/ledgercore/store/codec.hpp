#pragma once

#include <algorithm>
#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <vector>

#include "ledgercore/store/change_set.hpp"

namespace ledgercore {
namespace store {

namespace detail {

template <typename T>
inline void append_primitive(std::vector<std::byte>& buffer, T value) {
  auto raw = std::bit_cast<std::array<std::byte, sizeof(T)>>(value);
  buffer.insert(buffer.end(), raw.begin(), raw.end());
}

template <typename T>
inline T read_primitive(std::span<const std::byte> data, std::size_t& offset) {
  if (offset + sizeof(T) > data.size()) {
    throw std::runtime_error("change set decode out of bounds");
  }
  std::array<std::byte, sizeof(T)> storage{};
  std::copy_n(data.begin() + static_cast<std::ptrdiff_t>(offset), sizeof(T), storage.begin());
  offset += sizeof(T);
  return std::bit_cast<T>(storage);
}

}  // namespace detail

// Binary form of a ChangeSet as stored in the commit journal:
//   [version:u8] then for each of the eight tables in declaration order
//   [count:u32] { [present:u8] row | key }...
// Strings are [length:u32][bytes], optionals [flag:u8][value], amounts are
// cents as i64, dates i32 days and timestamps i64 seconds since the epoch.
class ChangeSetCodec {
 public:
  static constexpr std::uint8_t kFormatVersion = 1;

  [[nodiscard]] static std::vector<std::byte> encode(const ChangeSet& changes);
  // Throws std::runtime_error on truncated or malformed input.
  [[nodiscard]] static ChangeSet decode(std::span<const std::byte> data);

 private:
  static InvoiceRow decode_invoice(std::span<const std::byte> data, std::size_t& offset);
};

}  // namespace store
}  // namespace ledgercore
