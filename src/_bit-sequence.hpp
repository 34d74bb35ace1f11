#pragma once

#include "_config.hpp"
#include "_errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <compare>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <cassert>
#include <cstdint>

namespace dynhash::detail {

// ------------------------------------------------------------------------------------- BitSequence

/**
 * A window onto a fixed-width string of bits, stored most-significant-bit first.
 *
 * Consuming a bit narrows the window from one end; the bits themselves are never
 * moved, so a consumed sequence is the same storage with a smaller [first, last).
 */
template <std::size_t Bits> class BitSequence {
public:
  static_assert(Bits > 0, "a bit sequence needs at least one bit");
  static_assert(Bits <= 0xffffu, "bit positions are stored in 16 bits");

  static constexpr std::size_t bit_width = Bits;
  static constexpr std::size_t byte_width = (Bits + 7) / 8;
  using storage_type = std::array<uint8_t, byte_width>;

private:
  storage_type bytes_{};
  uint16_t first_{0}; //!< first live bit
  uint16_t last_{0};  //!< one past the last live bit

  constexpr BitSequence(const storage_type& bytes, uint16_t first, uint16_t last)
      : bytes_{bytes}, first_{first}, last_{last} {}

  constexpr bool raw_bit_(std::size_t position) const {
    return (bytes_[position / 8] >> (7 - position % 8)) & 0x01u;
  }

  constexpr void set_raw_bit_(std::size_t position) {
    bytes_[position / 8] |= static_cast<uint8_t>(0x80u >> (position % 8));
  }

public:
  //@{ Construction
  constexpr BitSequence() = default; // empty

  /**
   * The first `Bits` bits of `bytes`, most-significant-bit first
   */
  static constexpr BitSequence from_bytes(std::span<const uint8_t, byte_width> bytes) {
    storage_type storage{};
    for (auto i = 0u; i < byte_width; ++i)
      storage[i] = bytes[i];
    return BitSequence{storage, 0, static_cast<uint16_t>(Bits)};
  }

  /**
   * Parses a string of exactly `Bits` characters, each '0' or '1'
   */
  static BitSequence from_string(std::string_view bits) {
    if (bits.size() != Bits)
      throw std::invalid_argument{
          fmt::format("expected {} bits, got a string of length {}", Bits, bits.size())};
    BitSequence sequence{storage_type{}, 0, static_cast<uint16_t>(Bits)};
    for (auto i = 0u; i < bits.size(); ++i) {
      if (bits[i] == '1')
        sequence.set_raw_bit_(i);
      else if (bits[i] != '0')
        throw std::invalid_argument{fmt::format("invalid bit '{}' at position {}", bits[i], i)};
    }
    return sequence;
  }

  /**
   * The low `Bits` bits of `value`, most-significant first; i.e., 5 => "0101" for Bits=4
   */
  static constexpr BitSequence from_integer(uint64_t value) {
    static_assert(Bits <= 64, "an integer has at most 64 bits");
    BitSequence sequence{storage_type{}, 0, static_cast<uint16_t>(Bits)};
    for (auto i = 0u; i < Bits; ++i) {
      if ((value >> (Bits - 1 - i)) & 0x01u)
        sequence.set_raw_bit_(i);
    }
    return sequence;
  }
  //@}

  //@{ Getters
  constexpr std::size_t size() const { return last_ - first_; }
  constexpr bool empty() const { return first_ == last_; }

  /**
   * @return The bit at `index`, counting from the front of the live window
   */
  constexpr bool bit(std::size_t index) const {
    assert(index < size());
    return raw_bit_(first_ + index);
  }

  std::string to_string() const {
    std::string out;
    out.reserve(size());
    for (auto i = first_; i < last_; ++i)
      out.push_back(raw_bit_(i) ? '1' : '0');
    return out;
  }
  //@}

  //@{ Consumption
  /**
   * Removes one bit from the end selected by `direction`, and returns it
   * @throw sequence_exhausted_error if there are no bits left
   */
  constexpr bool consume(Direction direction) {
    if (empty())
      throw sequence_exhausted_error{"cannot consume a bit from an empty bit sequence"};
    return (direction == Direction::RightToLeft) ? raw_bit_(--last_) : raw_bit_(first_++);
  }

  /**
   * @return {bit, residual} without modifying this sequence
   */
  constexpr std::pair<bool, BitSequence> consumed(Direction direction) const {
    auto residual = *this;
    const bool bit = residual.consume(direction);
    return {bit, residual};
  }
  //@}

  //@{ Comparison
  friend constexpr bool operator==(const BitSequence& lhs, const BitSequence& rhs) {
    if (lhs.size() != rhs.size())
      return false;
    for (auto i = 0u; i < lhs.size(); ++i)
      if (lhs.bit(i) != rhs.bit(i))
        return false;
    return true;
  }

  friend constexpr std::strong_ordering operator<=>(const BitSequence& lhs,
                                                    const BitSequence& rhs) {
    const auto common = std::min(lhs.size(), rhs.size());
    for (auto i = 0u; i < common; ++i) {
      if (lhs.bit(i) != rhs.bit(i))
        return lhs.bit(i) ? std::strong_ordering::greater : std::strong_ordering::less;
    }
    return lhs.size() <=> rhs.size();
  }
  //@}
};

} // namespace dynhash::detail

template <std::size_t Bits> struct fmt::formatter<dynhash::detail::BitSequence<Bits>> {
  constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

  template <typename FormatContext>
  auto format(const dynhash::detail::BitSequence<Bits>& sequence, FormatContext& ctx) const {
    return fmt::format_to(ctx.out(), "{}", sequence.to_string());
  }
};
