#include <catch2/catch.hpp>

#include "dynhash/dynamic-index.hpp"

#include <functional>
#include <string>
#include <vector>

namespace dynhash::test {

using namespace std::string_literals;

using EntryType = detail::Entry<int, std::string, 8>;
using BucketType = detail::Bucket<EntryType, std::less<int>>;

static EntryType make_entry(int key, std::string value) {
  return EntryType{{key, std::move(value)}, detail::BitSequence<8>::from_integer(key & 0xff)};
}

static std::vector<std::string> values_of(const BucketType& bucket) {
  std::vector<std::string> out;
  for (const auto& entry : bucket)
    out.push_back(entry.value());
  return out;
}

CATCH_TEST_CASE("bucket_insert_ordered", "[bucket_insert_ordered]") {
  BucketType bucket;
  CATCH_REQUIRE(bucket.empty());
  for (auto key : {5, 1, 9, 3, 7})
    bucket.insert(make_entry(key, std::to_string(key)));

  CATCH_REQUIRE(bucket.size() == 5);
  CATCH_REQUIRE(values_of(bucket) == std::vector<std::string>{"1", "3", "5", "7", "9"});

  // Residual bits travel with the entry
  CATCH_REQUIRE(bucket[0].residual.to_string() == "00000001"s);
  CATCH_REQUIRE(bucket[4].residual.to_string() == "00001001"s);
}

CATCH_TEST_CASE("bucket_duplicates", "[bucket_duplicates]") {
  BucketType bucket;
  bucket.insert(make_entry(2, "a"));
  bucket.insert(make_entry(1, "b"));
  bucket.insert(make_entry(2, "c"));
  bucket.insert(make_entry(3, "d"));
  bucket.insert(make_entry(2, "e"));

  // Equal keys are kept in insertion order
  CATCH_REQUIRE(values_of(bucket) == std::vector<std::string>{"b", "a", "c", "e", "d"});
  CATCH_REQUIRE(bucket.count(2) == 3);
  CATCH_REQUIRE(bucket.count(1) == 1);
  CATCH_REQUIRE(bucket.count(4) == 0);

  // First match is the oldest
  CATCH_REQUIRE(bucket.first_match(2) != nullptr);
  CATCH_REQUIRE(bucket.first_match(2)->value() == "a"s);

  auto removed = bucket.remove_first_match(2);
  CATCH_REQUIRE(removed.has_value());
  CATCH_REQUIRE(removed->value() == "a"s);
  CATCH_REQUIRE(bucket.first_match(2)->value() == "c"s);
  CATCH_REQUIRE(bucket.count(2) == 2);
  CATCH_REQUIRE(bucket.contains(2));

  CATCH_REQUIRE(bucket.remove_first_match(2)->value() == "c"s);
  CATCH_REQUIRE(bucket.remove_first_match(2)->value() == "e"s);
  CATCH_REQUIRE(!bucket.contains(2));
  CATCH_REQUIRE(!bucket.remove_first_match(2).has_value());
  CATCH_REQUIRE(values_of(bucket) == std::vector<std::string>{"b", "d"});
}

CATCH_TEST_CASE("bucket_lookup_miss", "[bucket_lookup_miss]") {
  BucketType bucket;
  CATCH_REQUIRE(bucket.first_match(1) == nullptr);
  CATCH_REQUIRE(!bucket.contains(1));
  CATCH_REQUIRE(!bucket.remove_first_match(1).has_value());

  bucket.insert(make_entry(10, "x"));
  CATCH_REQUIRE(bucket.first_match(9) == nullptr);
  CATCH_REQUIRE(bucket.first_match(11) == nullptr);
  CATCH_REQUIRE(bucket.size() == 1);
}

CATCH_TEST_CASE("bucket_is_full", "[bucket_is_full]") {
  BucketType bucket;
  for (auto key = 0; key < 3; ++key)
    bucket.insert(make_entry(key, ""));
  CATCH_REQUIRE(!bucket.is_full(3, 1.0));
  bucket.insert(make_entry(3, ""));
  CATCH_REQUIRE(bucket.is_full(3, 1.0));

  // 8 * 0.8 = 6.4
  BucketType other;
  for (auto key = 0; key < 6; ++key)
    other.insert(make_entry(key, ""));
  CATCH_REQUIRE(!other.is_full(8, 0.8));
  other.insert(make_entry(6, ""));
  CATCH_REQUIRE(other.is_full(8, 0.8));
}

CATCH_TEST_CASE("bucket_split", "[bucket_split]") {
  BucketType bucket;
  for (auto key : {200, 4, 130, 2, 7})
    bucket.insert(make_entry(key, std::to_string(key)));

  // Left to right: 11001000 and 10000010 go right
  auto halves = bucket.split(Direction::LeftToRight);
  CATCH_REQUIRE(bucket.empty());
  CATCH_REQUIRE(values_of(halves[0]) == std::vector<std::string>{"2", "4", "7"});
  CATCH_REQUIRE(values_of(halves[1]) == std::vector<std::string>{"130", "200"});
  CATCH_REQUIRE(halves[0][0].residual.to_string() == "0000010"s);
  CATCH_REQUIRE(halves[1][0].residual.to_string() == "0000010"s);

  // Right to left: 2 and 4 are even
  auto quarters = halves[0].split(Direction::RightToLeft);
  CATCH_REQUIRE(halves[0].empty());
  CATCH_REQUIRE(values_of(quarters[0]) == std::vector<std::string>{"2", "4"});
  CATCH_REQUIRE(values_of(quarters[1]) == std::vector<std::string>{"7"});
  CATCH_REQUIRE(quarters[1][0].residual.to_string() == "000011"s);

  // Nothing left to split on
  BucketType exhausted = std::move(quarters[1]);
  for (auto i = 0; i < 6; ++i) {
    auto parts = exhausted.split(Direction::LeftToRight);
    exhausted = std::move(parts[parts[0].empty() ? 1 : 0]);
  }
  CATCH_REQUIRE(exhausted.size() == 1);
  CATCH_REQUIRE(exhausted[0].residual.empty());
  CATCH_REQUIRE_THROWS_AS(exhausted.split(Direction::LeftToRight), sequence_exhausted_error);
  CATCH_REQUIRE(exhausted.size() == 1);
}

} // namespace dynhash::test
