#include <catch2/catch.hpp>

#include "dynhash/dynamic-index.hpp"

#include <fmt/format.h>

#include <array>
#include <string>

namespace dynhash::test {

using namespace std::string_literals;

CATCH_TEST_CASE("bit_sequence_from_string", "[bit_sequence_from_string]") {
  using sequence_type = detail::BitSequence<6>;
  const auto bits = sequence_type::from_string("101100");
  CATCH_REQUIRE(bits.size() == 6);
  CATCH_REQUIRE(!bits.empty());
  CATCH_REQUIRE(bits.to_string() == "101100"s);
  CATCH_REQUIRE(bits.bit(0) == true);
  CATCH_REQUIRE(bits.bit(1) == false);
  CATCH_REQUIRE(bits.bit(3) == true);
  CATCH_REQUIRE(bits.bit(5) == false);

  CATCH_REQUIRE_THROWS_AS(sequence_type::from_string("10110"), std::invalid_argument);
  CATCH_REQUIRE_THROWS_AS(sequence_type::from_string("1011000"), std::invalid_argument);
  CATCH_REQUIRE_THROWS_AS(sequence_type::from_string("10x100"), std::invalid_argument);
}

CATCH_TEST_CASE("bit_sequence_from_integer", "[bit_sequence_from_integer]") {
  CATCH_REQUIRE(detail::BitSequence<4>::from_integer(0).to_string() == "0000"s);
  CATCH_REQUIRE(detail::BitSequence<4>::from_integer(3).to_string() == "0011"s);
  CATCH_REQUIRE(detail::BitSequence<4>::from_integer(9).to_string() == "1001"s);
  CATCH_REQUIRE(detail::BitSequence<4>::from_integer(0x1f).to_string() == "1111"s); // high bits dropped
  CATCH_REQUIRE(detail::BitSequence<12>::from_integer(0xa5c).to_string() == "101001011100"s);
}

CATCH_TEST_CASE("bit_sequence_from_bytes", "[bit_sequence_from_bytes]") {
  const std::array<uint8_t, 2> bytes{{0xc3, 0xf0}};
  const auto bits = detail::BitSequence<12>::from_bytes(bytes);
  CATCH_REQUIRE(bits.size() == 12);
  CATCH_REQUIRE(bits.to_string() == "110000111111"s); // trailing 4 bits of 0xf0 are not part of it
}

CATCH_TEST_CASE("bit_sequence_consume", "[bit_sequence_consume]") {
  using sequence_type = detail::BitSequence<4>;

  { // left to right
    auto bits = sequence_type::from_string("1101");
    CATCH_REQUIRE(bits.consume(Direction::LeftToRight) == true);
    CATCH_REQUIRE(bits.to_string() == "101"s);
    CATCH_REQUIRE(bits.consume(Direction::LeftToRight) == true);
    CATCH_REQUIRE(bits.consume(Direction::LeftToRight) == false);
    CATCH_REQUIRE(bits.to_string() == "1"s);
    CATCH_REQUIRE(bits.consume(Direction::LeftToRight) == true);
    CATCH_REQUIRE(bits.empty());
    CATCH_REQUIRE(bits.to_string().empty());
  }

  { // right to left
    auto bits = sequence_type::from_string("1101");
    CATCH_REQUIRE(bits.consume(Direction::RightToLeft) == true);
    CATCH_REQUIRE(bits.to_string() == "110"s);
    CATCH_REQUIRE(bits.consume(Direction::RightToLeft) == false);
    CATCH_REQUIRE(bits.to_string() == "11"s);
  }

  { // mixed
    auto bits = sequence_type::from_string("1000");
    CATCH_REQUIRE(bits.consume(Direction::RightToLeft) == false);
    CATCH_REQUIRE(bits.consume(Direction::LeftToRight) == true);
    CATCH_REQUIRE(bits.to_string() == "00"s);
  }
}

CATCH_TEST_CASE("bit_sequence_consumed", "[bit_sequence_consumed]") {
  const auto bits = detail::BitSequence<5>::from_string("01011");
  const auto [bit, residual] = bits.consumed(Direction::LeftToRight);
  CATCH_REQUIRE(bit == false);
  CATCH_REQUIRE(residual.to_string() == "1011"s);
  CATCH_REQUIRE(bits.to_string() == "01011"s); // unchanged

  const auto [rbit, rresidual] = bits.consumed(Direction::RightToLeft);
  CATCH_REQUIRE(rbit == true);
  CATCH_REQUIRE(rresidual.to_string() == "0101"s);
}

CATCH_TEST_CASE("bit_sequence_exhausted", "[bit_sequence_exhausted]") {
  auto bits = detail::BitSequence<1>::from_string("1");
  CATCH_REQUIRE(bits.consume(Direction::LeftToRight) == true);
  CATCH_REQUIRE(bits.empty());
  CATCH_REQUIRE_THROWS_AS(bits.consume(Direction::LeftToRight), sequence_exhausted_error);
  CATCH_REQUIRE_THROWS_AS(bits.consume(Direction::RightToLeft), sequence_exhausted_error);
  CATCH_REQUIRE_THROWS_AS(bits.consumed(Direction::LeftToRight), std::out_of_range);

  detail::BitSequence<8> empty;
  CATCH_REQUIRE(empty.size() == 0);
  CATCH_REQUIRE_THROWS_AS(empty.consume(Direction::LeftToRight), sequence_exhausted_error);
}

CATCH_TEST_CASE("bit_sequence_compare", "[bit_sequence_compare]") {
  using sequence_type = detail::BitSequence<4>;

  // Equal live bits, different windows onto different storage
  auto a = sequence_type::from_string("0110");
  auto b = sequence_type::from_string("1100");
  a.consume(Direction::LeftToRight);  // "110"
  b.consume(Direction::RightToLeft); // "110"
  CATCH_REQUIRE(a == b);
  CATCH_REQUIRE(!(a != b));
  CATCH_REQUIRE((a <=> b) == std::strong_ordering::equal);

  const auto c = sequence_type::from_string("0111");
  const auto d = sequence_type::from_string("1000");
  CATCH_REQUIRE(c != d);
  CATCH_REQUIRE(c < d);
  CATCH_REQUIRE(d > c);

  // A prefix orders first
  auto e = sequence_type::from_string("1000");
  e.consume(Direction::RightToLeft); // "100"
  CATCH_REQUIRE(e < d);
  CATCH_REQUIRE(e != d);
}

CATCH_TEST_CASE("bit_sequence_format", "[bit_sequence_format]") {
  auto bits = detail::BitSequence<8>::from_integer(0x5a);
  CATCH_REQUIRE(fmt::format("{}", bits) == "01011010"s);
  bits.consume(Direction::LeftToRight);
  CATCH_REQUIRE(fmt::format("<{}>", bits) == "<1011010>"s);
}

} // namespace dynhash::test
