#include <catch2/catch.hpp>

#include "dynhash/dynamic-index.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace dynhash::test {

using namespace std::string_literals;

CATCH_TEST_CASE("sha256_hasher_known_digests", "[sha256_hasher_known_digests]") {
  const auto hasher = sha256_hasher<std::string>{};

  // SHA-256("abc") = ba7816bf ... f20015ad
  const auto abc = hasher("abc"s);
  CATCH_REQUIRE(abc.size() == 256);
  const auto abc_bits = abc.to_string();
  CATCH_REQUIRE(abc_bits.substr(0, 16) == "1011101001111000"s);   // ba78
  CATCH_REQUIRE(abc_bits.substr(240, 16) == "0001010110101101"s); // 15ad

  // SHA-256("") = e3b0c442 ... 7852b855
  const auto empty_bits = hasher(""s).to_string();
  CATCH_REQUIRE(empty_bits.substr(0, 8) == "11100011"s);   // e3
  CATCH_REQUIRE(empty_bits.substr(248, 8) == "01010101"s); // 55
}

CATCH_TEST_CASE("sha256_hasher_key_bytes", "[sha256_hasher_key_bytes]") {
  // Integers hash as their little-endian bytes
  const auto from_integer = sha256_hasher<uint32_t>{}(0x04030201u);
  const auto from_string = sha256_hasher<std::string>{}("\x01\x02\x03\x04"s);
  CATCH_REQUIRE(from_integer == from_string);

  // string and string_view agree
  CATCH_REQUIRE(sha256_hasher<std::string_view>{}("dynamic") ==
                sha256_hasher<std::string>{}("dynamic"s));

  // Same key, same bits; different keys, different bits
  CATCH_REQUIRE(sha256_hasher<int>{}(42) == sha256_hasher<int>{}(42));
  CATCH_REQUIRE(sha256_hasher<int>{}(42) != sha256_hasher<int>{}(43));

  // Width matters: a 16 bit 1 is two bytes, a 64 bit 1 is eight
  CATCH_REQUIRE(sha256_hasher<uint16_t>{}(1) != sha256_hasher<uint64_t>{}(1));
}

CATCH_TEST_CASE("identity_hasher", "[identity_hasher]") {
  const auto hasher = identity_hasher<4>{};
  CATCH_REQUIRE(hasher(0).to_string() == "0000"s);
  CATCH_REQUIRE(hasher(1).to_string() == "0001"s);
  CATCH_REQUIRE(hasher(2u).to_string() == "0010"s);
  CATCH_REQUIRE(hasher(15).to_string() == "1111"s);
  CATCH_REQUIRE(hasher(uint8_t{10}).to_string() == "1010"s);

  CATCH_REQUIRE_THROWS_AS(hasher(16), hash_input_error);
  CATCH_REQUIRE_THROWS_AS(hasher(-1), hash_input_error);

  CATCH_REQUIRE(identity_hasher<64>{}(~uint64_t{0}).size() == 64);
}

} // namespace dynhash::test
