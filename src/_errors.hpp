#pragma once

#include <stdexcept>
#include <string>

namespace dynhash {

// ------------------------------------------------------------------------------------- Exceptions

/**
 * The key could not be turned into a bit sequence: it has no byte form, the
 * digest engine failed, or the hasher produced a sequence of the wrong width.
 */
class hash_input_error : public std::runtime_error {
public:
  explicit hash_input_error(const std::string& what) : std::runtime_error{what} {}
  explicit hash_input_error(const char* what) : std::runtime_error{what} {}
};

/**
 * A bit was consumed from an empty bit sequence
 */
class sequence_exhausted_error : public std::out_of_range {
public:
  explicit sequence_exhausted_error(const std::string& what) : std::out_of_range{what} {}
  explicit sequence_exhausted_error(const char* what) : std::out_of_range{what} {}
};

} // namespace dynhash
