#pragma once

#include "_bit-sequence.hpp"
#include "_errors.hpp"

#include <fmt/format.h>
#include <openssl/evp.h>

#include <array>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>

#include <cstdint>

namespace dynhash {

// ---------------------------------------------------------------------------------------- key_bytes

/**
 * Feeds the byte form of a key to a sink: `sink(const void* data, std::size_t size)`.
 * Specialise for your own key types; throw `hash_input_error` if a key has no byte form.
 */
template <typename Key, typename Enable = void> struct key_bytes;

template <typename Key>
struct key_bytes<Key, std::enable_if_t<std::is_integral<Key>::value &&
                                       !std::is_same<Key, bool>::value>> {
  template <typename Sink> static void feed(const Key& key, Sink&& sink) {
    // Little endian, so the byte form does not depend on the host
    std::array<uint8_t, sizeof(Key)> bytes;
    auto value = static_cast<std::make_unsigned_t<Key>>(key);
    for (auto& byte : bytes) {
      byte = static_cast<uint8_t>(value & 0xffu);
      value = static_cast<std::make_unsigned_t<Key>>(value >> 8);
    }
    sink(bytes.data(), bytes.size());
  }
};

template <> struct key_bytes<std::string_view> {
  template <typename Sink> static void feed(std::string_view key, Sink&& sink) {
    sink(key.data(), key.size());
  }
};

template <> struct key_bytes<std::string> {
  template <typename Sink> static void feed(const std::string& key, Sink&& sink) {
    sink(key.data(), key.size());
  }
};

// ------------------------------------------------------------------------------------ sha256_hasher

/**
 * SHA-256 of the key's byte form (see `key_bytes`), as 256 bits
 */
template <typename Key> struct sha256_hasher {
  static constexpr std::size_t bit_width = 256;
  static constexpr std::size_t digest_size = bit_width / 8;
  using sequence_type = detail::BitSequence<bit_width>;

  sequence_type operator()(const Key& key) const {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> context{EVP_MD_CTX_new(),
                                                                   &EVP_MD_CTX_free};
    if (context == nullptr || EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr) != 1)
      throw hash_input_error{"failed to initialise a SHA-256 digest"};

    key_bytes<Key>::feed(key, [&context](const void* data, std::size_t size) {
      if (EVP_DigestUpdate(context.get(), data, size) != 1)
        throw hash_input_error{fmt::format("failed to digest {} bytes of key", size)};
    });

    std::array<uint8_t, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(context.get(), digest.data(), &length) != 1 || length != digest_size)
      throw hash_input_error{"failed to finalise a SHA-256 digest"};

    return sequence_type::from_bytes(std::span<const uint8_t, digest_size>{digest.data(),
                                                                           digest_size});
  }
};

// ---------------------------------------------------------------------------------- identity_hasher

/**
 * A non-negative integer key rendered as its own `Bits`-bit binary string; 3 => "0011".
 * Deterministic routing for tests and examples.
 */
template <std::size_t Bits> struct identity_hasher {
  static constexpr std::size_t bit_width = Bits;
  using sequence_type = detail::BitSequence<bit_width>;

  template <typename Key> sequence_type operator()(const Key& key) const {
    static_assert(std::is_integral<Key>::value, "identity_hasher needs integer keys");
    if constexpr (std::is_signed<Key>::value) {
      if (key < 0)
        throw hash_input_error{fmt::format("negative key {} has no identity hash", key)};
    }
    const auto value = static_cast<uint64_t>(key);
    if constexpr (Bits < 64) {
      if ((value >> Bits) != 0)
        throw hash_input_error{fmt::format("key {} does not fit in {} bits", value, Bits)};
    }
    return sequence_type::from_integer(value);
  }
};

} // namespace dynhash
