#include <catch2/catch.hpp>

#include "dynhash/dynamic-index.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <map>
#include <random>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace dynhash::test {

using namespace std::string_literals;

// Index types used in testing need to be declared here to use the "private hack"
using SmallIndex = dynamic_index<uint32_t, int, identity_hasher<4>>;
using ByteIndex = dynamic_index<uint32_t, int, identity_hasher<8>>;
using IntIndex = dynamic_index<int, int>;
using StringIndex = dynamic_index<std::string, std::size_t>;

// Throws from the `countdown`th comparison once armed
struct ThrowingLess {
  static inline int countdown = -1;
  bool operator()(uint32_t lhs, uint32_t rhs) const {
    if (countdown >= 0 && countdown-- == 0)
      throw std::runtime_error{"comparison failed"};
    return lhs < rhs;
  }
};

// Copyable, with a move that may throw, so containers copy it; copies throw once armed
struct FragileValue {
  static inline int countdown = -1;
  int value{0};
  explicit FragileValue(int v) : value{v} {}
  FragileValue(const FragileValue& o) : value{o.value} {
    if (countdown >= 0 && countdown-- == 0)
      throw std::runtime_error{"copy failed"};
  }
  FragileValue(FragileValue&& o) : value{o.value} {}
  FragileValue& operator=(const FragileValue&) = default;
  FragileValue& operator=(FragileValue&&) = default;
};

using OrderedIndex = dynamic_index<uint32_t, int, identity_hasher<4>, ThrowingLess>;
using FragileIndex = dynamic_index<uint32_t, FragileValue, identity_hasher<4>>;

template <typename Index> struct IndexTraits {
  using key_type = typename Index::key_type;
  using value_type = typename Index::value_type;
  using hasher = typename Index::hasher;
  using key_compare = typename Index::key_compare;
  using base_type = detail::base_index<key_type, value_type, hasher, key_compare>;
  using ops_type = detail::NodeOps<key_type, value_type, hasher, key_compare>;
};

namespace private_hack {
  template <typename Tag> struct result {
    using type = typename Tag::type;
    static type ptr;
  };
  template <typename Tag> typename result<Tag>::type result<Tag>::ptr;

  template <typename Tag, typename Tag::type p> struct rob : result<Tag> {
    struct filler {
      filler() { result<Tag>::ptr = p; }
    };
    static filler filler_obj;
  };
  template <typename Tag, typename Tag::type p>
  typename rob<Tag, p>::filler rob<Tag, p>::filler_obj;

  template <typename Index> struct Bf {
    using base_type = typename IndexTraits<Index>::base_type;
    using type = typename IndexTraits<Index>::ops_type::node_const_ptr_type (base_type::*)() const;
  };

  template struct rob<Bf<SmallIndex>, &IndexTraits<SmallIndex>::base_type::get_root_>;
  template struct rob<Bf<ByteIndex>, &IndexTraits<ByteIndex>::base_type::get_root_>;
  template struct rob<Bf<IntIndex>, &IndexTraits<IntIndex>::base_type::get_root_>;
  template struct rob<Bf<StringIndex>, &IndexTraits<StringIndex>::base_type::get_root_>;
  template struct rob<Bf<OrderedIndex>, &IndexTraits<OrderedIndex>::base_type::get_root_>;
  template struct rob<Bf<FragileIndex>, &IndexTraits<FragileIndex>::base_type::get_root_>;

  template <typename Index> auto get_root(const Index& index) {
    using base_type = typename IndexTraits<Index>::base_type;
    const auto& base = *reinterpret_cast<const base_type*>(&index);
    return (base.*result<Bf<Index>>::ptr)();
  }
} // namespace private_hack

/**
 * Walks the whole trie checking:
 *  - node depths, and that no node but the root is collapsible
 *  - each bucket is in key order
 *  - each entry is reachable by its key's hash, and carries exactly the unconsumed bits
 *  - with cascading splits, no bucket is over-full unless it is out of bits
 *  - entry count, and height agree with the index
 */
template <typename Index> void check_index_invariants(const Index& index) {
  using Ops = typename IndexTraits<Index>::ops_type;
  using node_const_ptr_type = typename Ops::node_const_ptr_type;
  using bucket_type = typename Ops::bucket_type;

  const auto& config = index.config();
  const auto hasher = typename Index::hasher{};
  const auto compare = typename Index::key_compare{};
  const node_const_ptr_type root = private_hack::get_root(index);
  CATCH_REQUIRE(root != nullptr);
  CATCH_REQUIRE(root->depth_ == 0);

  std::size_t entry_count = 0;
  std::size_t deepest = 0;
  std::vector<bool> route; // bits taken from the root

  auto check_bucket = [&](const bucket_type& bucket) {
    for (auto i = 1u; i < bucket.size(); ++i)
      CATCH_REQUIRE(!compare(bucket[i].key(), bucket[i - 1].key()));
    for (const auto& entry : bucket) {
      CATCH_REQUIRE(entry.residual.size() == Index::bit_width - route.size());
      auto bits = hasher(entry.key());
      for (const bool bit : route)
        CATCH_REQUIRE(bits.consume(config.direction) == bit);
      CATCH_REQUIRE(bits == entry.residual);
    }
    if (config.split == SplitPolicy::Cascade && !bucket.empty() &&
        !bucket[0].residual.empty()) {
      CATCH_REQUIRE(!bucket.is_full(config.capacity, config.fill_factor));
    }
    entry_count += bucket.size();
  };

  auto check_node = [&](auto&& self, node_const_ptr_type node) -> void {
    CATCH_REQUIRE(node->depth_ == route.size());
    CATCH_REQUIRE((node == root || !Ops::is_collapsible(node)));
    deepest = std::max<std::size_t>(deepest, node->depth_);
    for (const bool bit : {false, true}) {
      route.push_back(bit);
      if (auto child = Ops::child_at(node, bit)) {
        CATCH_REQUIRE(child->depth_ == node->depth_ + 1);
        self(self, child);
      } else {
        const auto* bucket = Ops::bucket_at(node, bit);
        CATCH_REQUIRE(bucket != nullptr);
        check_bucket(*bucket);
      }
      route.pop_back();
    }
  };
  check_node(check_node, root);

  CATCH_REQUIRE(entry_count == index.size());
  CATCH_REQUIRE(deepest + 1 == index.height());
  CATCH_REQUIRE(index.statistics().entries == index.size());
  CATCH_REQUIRE(index.statistics().height == index.height());
}

template <typename Index> std::size_t traversed_count(const Index& index) {
  std::size_t counter = 0;
  index.traverse([&counter](const auto&, const auto&) { ++counter; });
  return counter;
}

template <typename Index>
std::vector<std::pair<typename Index::key_type, typename Index::value_type>>
sorted_contents(const Index& index) {
  std::vector<std::pair<typename Index::key_type, typename Index::value_type>> out;
  index.traverse([&out](const auto& key, const auto& value) { out.emplace_back(key, value); });
  std::sort(begin(out), end(out));
  return out;
}

class TracedValue {
private:
  uint32_t* copies_;
  uint32_t* live_;
  int value_{0};

public:
  TracedValue(uint32_t& copies, uint32_t& live, int value)
      : copies_{&copies}, live_{&live}, value_{value} {
    ++*live_;
  }
  TracedValue(const TracedValue& o) : copies_{o.copies_}, live_{o.live_}, value_{o.value_} {
    ++*copies_;
    ++*live_;
  }
  TracedValue(TracedValue&& o) noexcept : copies_{o.copies_}, live_{o.live_}, value_{o.value_} {
    ++*live_;
  }
  ~TracedValue() { --*live_; }
  TracedValue& operator=(const TracedValue& o) {
    ++*copies_;
    value_ = o.value_;
    return *this;
  }
  TracedValue& operator=(TracedValue&& o) noexcept {
    value_ = o.value_;
    return *this;
  }
  int value() const { return value_; }
};

// ------------------------------------------------------------------------------------------ Tests

CATCH_TEST_CASE("index_empty", "[index_empty]") {
  SmallIndex index{3, 1.0};
  CATCH_REQUIRE(index.empty());
  CATCH_REQUIRE(index.size() == 0);
  CATCH_REQUIRE(index.height() == 1);
  CATCH_REQUIRE(index.begin() == index.end());
  CATCH_REQUIRE(!index.contains(0));
  CATCH_REQUIRE(!index.get(0).has_value());
  CATCH_REQUIRE(index.find(0) == nullptr);
  CATCH_REQUIRE(index.count(0) == 0);
  CATCH_REQUIRE(index.erase(0) == 0);
  CATCH_REQUIRE_THROWS_AS(index.at(0), std::out_of_range);

  const auto stats = index.statistics();
  CATCH_REQUIRE(stats.nodes == 1);
  CATCH_REQUIRE(stats.buckets == 2);
  CATCH_REQUIRE(stats.empty_buckets == 2);
  CATCH_REQUIRE(stats.height == 1);
  check_index_invariants(index);
}

CATCH_TEST_CASE("index_four_bit_scenario", "[index_four_bit_scenario]") {
  // 0000, 0001, 0010, 0011 all start with a 0 bit
  SmallIndex index{3, 1.0, Direction::LeftToRight};
  for (uint32_t key = 0; key < 3; ++key) {
    index.add(key, static_cast<int>(10 * key));
    CATCH_REQUIRE(index.height() == 1);
  }
  CATCH_REQUIRE(index.statistics().largest_bucket == 3);

  index.add(3u, 30); // the 4th entry overflows the left bucket
  CATCH_REQUIRE(index.height() == 2);
  CATCH_REQUIRE(index.size() == 4);
  check_index_invariants(index);

  const auto stats = index.statistics();
  CATCH_REQUIRE(stats.nodes == 2);
  CATCH_REQUIRE(stats.buckets == 3);
  CATCH_REQUIRE(stats.largest_bucket == 4); // all share the second bit too

  CATCH_REQUIRE(sorted_contents(index) ==
                std::vector<std::pair<uint32_t, int>>{{0, 0}, {1, 10}, {2, 20}, {3, 30}});
  for (uint32_t key = 0; key < 4; ++key) {
    CATCH_REQUIRE(index.contains(key));
    CATCH_REQUIRE(index.get(key) == static_cast<int>(10 * key));
  }

  for (uint32_t key = 0; key < 4; ++key) {
    CATCH_REQUIRE(index.erase(key) == 1);
    CATCH_REQUIRE(!index.contains(key));
    check_index_invariants(index);
  }
  CATCH_REQUIRE(index.height() == 1);
  CATCH_REQUIRE(index.begin() == index.end());
  CATCH_REQUIRE(index.statistics().nodes == 1);
}

CATCH_TEST_CASE("index_deferred_split", "[index_deferred_split]") {
  // A bucket left over-full by a split, splits again on the next insert into it
  SmallIndex index{3, 1.0};
  for (uint32_t key : {0u, 1u, 2u, 3u})
    index.add(key, 0);
  CATCH_REQUIRE(index.height() == 2);

  index.add(8u, 0); // 1000: goes right at the root
  CATCH_REQUIRE(index.height() == 2);

  index.add(1u, 1); // 0001 again: lands in the over-full bucket
  CATCH_REQUIRE(index.height() == 3);
  CATCH_REQUIRE(index.count(1u) == 2);
  check_index_invariants(index);
}

CATCH_TEST_CASE("index_cascade_split", "[index_cascade_split]") {
  SmallIndex index{IndexConfig{3, 1.0, Direction::LeftToRight, SplitPolicy::Cascade}};
  for (uint32_t key = 0; key < 4; ++key)
    index.add(key, static_cast<int>(key));

  // 00|00, 00|01, 00|10, 00|11 => splits at depth 0 and 1, then separate at depth 2
  CATCH_REQUIRE(index.height() == 3);
  CATCH_REQUIRE(index.statistics().largest_bucket == 2);
  check_index_invariants(index);

  for (uint32_t key = 0; key < 4; ++key)
    index.erase(key);
  CATCH_REQUIRE(index.height() == 1);
  CATCH_REQUIRE(index.empty());
  check_index_invariants(index);
}

CATCH_TEST_CASE("index_right_to_left", "[index_right_to_left]") {
  // 0000, 0010, 0100, 0110 all end with a 0 bit; the next bit from the right splits them
  SmallIndex index{3, 1.0, Direction::RightToLeft};
  for (uint32_t key : {0u, 2u, 4u, 6u})
    index.add(key, static_cast<int>(key));
  CATCH_REQUIRE(index.height() == 2);
  CATCH_REQUIRE(index.statistics().largest_bucket == 2);
  check_index_invariants(index);

  // With right to left consumption, iteration visits keys by their reversed bits
  std::vector<uint32_t> keys;
  for (const auto& [key, value] : index)
    keys.push_back(key);
  CATCH_REQUIRE(keys == std::vector<uint32_t>{0, 4, 2, 6});
}

CATCH_TEST_CASE("index_traversal_order", "[index_traversal_order]") {
  // Left to right over the identity hash is numeric order
  std::vector<uint32_t> keys(256);
  for (auto i = 0u; i < keys.size(); ++i)
    keys[i] = i;
  std::mt19937 generator{20191028};
  std::shuffle(begin(keys), end(keys), generator);

  ByteIndex index{3, 1.0};
  for (auto key : keys)
    index.add(key, static_cast<int>(key) * 2);
  check_index_invariants(index);

  uint32_t expected = 0;
  for (auto ii = index.cbegin(); ii != index.cend(); ++ii) {
    CATCH_REQUIRE(ii->first == expected);
    CATCH_REQUIRE(ii->second == static_cast<int>(expected) * 2);
    ++expected;
  }
  CATCH_REQUIRE(expected == 256);

  // Post increment
  std::size_t counter = 0;
  for (auto ii = index.begin(); ii != index.end();) {
    CATCH_REQUIRE((*ii++).first == counter);
    ++counter;
  }
  CATCH_REQUIRE(counter == 256);

  // Incrementing past the end has no effect
  auto end = index.end();
  ++end;
  CATCH_REQUIRE(end == index.end());
}

CATCH_TEST_CASE("index_duplicates", "[index_duplicates]") {
  ByteIndex index{4, 0.75};
  for (auto i = 0; i < 5; ++i)
    index.add(7u, i);
  index.add(6u, 60);
  index.add(8u, 80);
  check_index_invariants(index);

  CATCH_REQUIRE(index.size() == 7);
  CATCH_REQUIRE(index.count(7u) == 5);
  CATCH_REQUIRE(index.get(7u) == 0); // the oldest

  CATCH_REQUIRE(index.erase(7u) == 1);
  CATCH_REQUIRE(index.contains(7u));
  CATCH_REQUIRE(index.count(7u) == 4);
  CATCH_REQUIRE(index.get(7u) == 1);

  auto extracted = index.extract(7u);
  CATCH_REQUIRE(extracted.has_value());
  CATCH_REQUIRE(*extracted == std::pair<uint32_t, int>{7u, 1});

  while (index.erase(7u) == 1) {
  }
  CATCH_REQUIRE(!index.contains(7u));
  CATCH_REQUIRE(index.size() == 2);
  CATCH_REQUIRE(index.at(6u) == 60);
  CATCH_REQUIRE(index.at(8u) == 80);
  check_index_invariants(index);
}

CATCH_TEST_CASE("index_collision_overflow", "[index_collision_overflow]") {
  // Every entry has the same hash, so the trie runs out of bits
  SmallIndex index{3, 1.0};
  std::size_t last_height = 1;
  for (auto i = 0; i < 10; ++i) {
    index.add(5u, i);
    CATCH_REQUIRE(index.height() >= last_height);
    CATCH_REQUIRE(index.height() <= last_height + 1); // at most one level per insert
    last_height = index.height();
    check_index_invariants(index);
  }

  CATCH_REQUIRE(index.height() == SmallIndex::bit_width);
  CATCH_REQUIRE(index.count(5u) == 10);
  CATCH_REQUIRE(index.get(5u) == 0);

  const auto stats = index.statistics();
  CATCH_REQUIRE(stats.collision_buckets == 1);
  CATCH_REQUIRE(stats.largest_bucket == 10);

  // Other keys still route normally
  index.add(4u, 40);
  CATCH_REQUIRE(index.get(4u) == 40);
  CATCH_REQUIRE(index.erase(4u) == 1);

  for (auto i = 0; i < 10; ++i) {
    CATCH_REQUIRE(index.get(5u) == i);
    CATCH_REQUIRE(index.erase(5u) == 1);
  }
  CATCH_REQUIRE(index.empty());
  CATCH_REQUIRE(index.height() == 1);
  check_index_invariants(index);
}

CATCH_TEST_CASE("index_collision_overflow_cascade", "[index_collision_overflow_cascade]") {
  SmallIndex index{IndexConfig{3, 1.0, Direction::RightToLeft, SplitPolicy::Cascade}};
  for (auto i = 0; i < 4; ++i)
    index.add(9u, i);
  CATCH_REQUIRE(index.height() == SmallIndex::bit_width); // one insert split all the way down
  CATCH_REQUIRE(index.statistics().collision_buckets == 1);
  check_index_invariants(index);
}

CATCH_TEST_CASE("index_hash_input_error", "[index_hash_input_error]") {
  SmallIndex index{3, 1.0};
  index.add(1u, 1);
  CATCH_REQUIRE_THROWS_AS(index.add(16u, 16), hash_input_error);
  CATCH_REQUIRE_THROWS_AS(index.contains(99u), hash_input_error);
  CATCH_REQUIRE_THROWS_AS(index.erase(16u), hash_input_error);
  CATCH_REQUIRE(index.size() == 1);
  check_index_invariants(index);

  dynamic_index<int, int, identity_hasher<8>> signed_index{3, 1.0};
  CATCH_REQUIRE_THROWS_AS(signed_index.add(-1, 0), hash_input_error);
  CATCH_REQUIRE(signed_index.empty());
}

struct TruncatedHasher {
  static constexpr std::size_t bit_width = 8;
  detail::BitSequence<bit_width> operator()(int key) const {
    auto bits = detail::BitSequence<bit_width>::from_integer(static_cast<uint64_t>(key) & 0xffu);
    bits.consume(Direction::LeftToRight);
    return bits; // 7 bits
  }
};

CATCH_TEST_CASE("index_hash_width_mismatch", "[index_hash_width_mismatch]") {
  dynamic_index<int, int, TruncatedHasher> index;
  CATCH_REQUIRE_THROWS_AS(index.add(1, 1), hash_input_error);
  CATCH_REQUIRE_THROWS_AS(index.get(1), hash_input_error);
  CATCH_REQUIRE(index.empty());
}

CATCH_TEST_CASE("index_random_operations", "[index_random_operations]") {
  for (const auto split : {SplitPolicy::SingleLevel, SplitPolicy::Cascade}) {
    IntIndex index{IndexConfig{4, 0.75, Direction::LeftToRight, split}};
    std::multimap<int, int> model;
    std::mt19937 generator{42};
    std::uniform_int_distribution<int> key_distribution{0, 300};

    // Grow: height never decreases
    std::size_t last_height = index.height();
    for (auto i = 0; i < 2000; ++i) {
      const auto key = key_distribution(generator);
      index.add(key, i);
      model.emplace(key, i);
      CATCH_REQUIRE(index.contains(key));
      CATCH_REQUIRE(index.height() >= last_height);
      last_height = index.height();
    }
    check_index_invariants(index);
    CATCH_REQUIRE(index.size() == model.size());

    // Mixed
    for (auto i = 0; i < 3000; ++i) {
      const auto key = key_distribution(generator);
      if (generator() % 3 == 0) {
        index.add(key, -i);
        model.emplace(key, -i);
      } else {
        const auto expected = model.count(key) > 0 ? std::size_t{1} : std::size_t{0};
        CATCH_REQUIRE(index.erase(key) == expected);
        if (expected == 1)
          model.erase(model.lower_bound(key)); // oldest entry for key
      }
      CATCH_REQUIRE(index.count(key) == model.count(key));
      CATCH_REQUIRE(index.contains(key) == (model.count(key) > 0));
      if (model.count(key) > 0)
        CATCH_REQUIRE(index.get(key) == model.lower_bound(key)->second);
    }
    check_index_invariants(index);
    std::vector<std::pair<int, int>> expected{begin(model), end(model)};
    std::sort(begin(expected), end(expected));
    CATCH_REQUIRE(sorted_contents(index) == expected);

    // Drain, in random order
    std::vector<int> keys;
    for (const auto& [key, value] : model)
      keys.push_back(key);
    std::shuffle(begin(keys), end(keys), generator);
    for (auto key : keys)
      CATCH_REQUIRE(index.erase(key) == 1);
    CATCH_REQUIRE(index.empty());
    CATCH_REQUIRE(index.begin() == index.end());
    CATCH_REQUIRE(index.height() == 1);
    check_index_invariants(index);
  }
}

CATCH_TEST_CASE("index_string_keys", "[index_string_keys]") {
  StringIndex index; // sha256, default configuration
  const std::size_t count = 5000;
  for (auto i = 0u; i < count; ++i)
    index.add(fmt::format("key-{}", i), std::size_t{i});
  CATCH_REQUIRE(index.size() == count);
  CATCH_REQUIRE(index.height() > 1);
  check_index_invariants(index);

  for (auto i = 0u; i < count; ++i) {
    const auto key = fmt::format("key-{}", i);
    CATCH_REQUIRE(index.contains(key));
    CATCH_REQUIRE(*index.find(key) == i);
  }
  CATCH_REQUIRE(!index.contains("key-x"s));

  std::size_t sum = 0;
  index.traverse([&sum](const std::string&, std::size_t value) { sum += value; });
  CATCH_REQUIRE(sum == count * (count - 1) / 2);

  for (auto i = 0u; i < count; i += 2)
    CATCH_REQUIRE(index.erase(fmt::format("key-{}", i)) == 1);
  check_index_invariants(index);
  CATCH_REQUIRE(index.size() == count / 2);

  for (auto i = 1u; i < count; i += 2)
    CATCH_REQUIRE(index.erase(fmt::format("key-{}", i)) == 1);
  CATCH_REQUIRE(index.empty());
  CATCH_REQUIRE(index.height() == 1);
  CATCH_REQUIRE(index.statistics().nodes == 1);
}

CATCH_TEST_CASE("index_string_keys_cascade", "[index_string_keys_cascade]") {
  StringIndex index{IndexConfig{3, 1.0, Direction::LeftToRight, SplitPolicy::Cascade}};
  for (auto i = 0u; i < 2000; ++i) {
    index.add(fmt::format("key-{}", i), std::size_t{i});
    if (i % 250 == 0)
      check_index_invariants(index); // includes the fill threshold of every bucket
  }
  check_index_invariants(index);

  const auto stats = index.statistics();
  CATCH_REQUIRE(stats.collision_buckets == 0);
  CATCH_REQUIRE(stats.largest_bucket <= 3);

  for (auto i = 0u; i < 2000; i += 3)
    CATCH_REQUIRE(index.erase(fmt::format("key-{}", i)) == 1);
  check_index_invariants(index);
  CATCH_REQUIRE(index.statistics().largest_bucket <= 3);
}

CATCH_TEST_CASE("index_throwing_compare", "[index_throwing_compare]") {
  auto threw_once = false;
  for (auto countdown = 0; countdown < 8; ++countdown) {
    OrderedIndex index{3, 1.0};
    for (uint32_t key : {0u, 1u, 2u})
      index.add(key, static_cast<int>(key));

    auto threw = false;
    ThrowingLess::countdown = countdown;
    try {
      index.add(3u, 3); // overflows the bucket holding 0, 1, 2
    } catch (std::runtime_error&) {
      threw = true;
    }
    ThrowingLess::countdown = -1;
    threw_once = threw_once || threw;

    CATCH_REQUIRE(traversed_count(index) == index.size());
    for (uint32_t key : {0u, 1u, 2u})
      CATCH_REQUIRE(index.get(key) == static_cast<int>(key));
    CATCH_REQUIRE(index.contains(3u) == !threw);
    CATCH_REQUIRE(index.size() == (threw ? 3u : 4u));
    check_index_invariants(index);
  }
  CATCH_REQUIRE(threw_once);
}

CATCH_TEST_CASE("index_throwing_split", "[index_throwing_split]") {
  FragileIndex index{3, 1.0};
  for (uint32_t key : {0u, 1u, 2u})
    index.add(key, FragileValue{static_cast<int>(key)});

  // Splitting copies the entries, and the first copy throws
  FragileValue::countdown = 0;
  CATCH_REQUIRE_THROWS_AS(index.add(3u, FragileValue{3}), std::runtime_error);
  FragileValue::countdown = -1;

  CATCH_REQUIRE(traversed_count(index) == index.size());
  for (uint32_t key : {0u, 1u, 2u})
    CATCH_REQUIRE(index.find(key)->value == static_cast<int>(key));
  CATCH_REQUIRE(index.contains(3u) == (index.size() == 4));
  check_index_invariants(index);

  // The next insert into that bucket splits it
  index.add(1u, FragileValue{11});
  CATCH_REQUIRE(index.height() > 1);
  CATCH_REQUIRE(traversed_count(index) == index.size());
  CATCH_REQUIRE(index.find(1u)->value == 1);
  check_index_invariants(index);
}

CATCH_TEST_CASE("index_moves_not_copies", "[index_moves_not_copies]") {
  uint32_t copies = 0;
  uint32_t live = 0;
  {
    dynamic_index<uint32_t, TracedValue, identity_hasher<8>> index{3, 1.0};
    for (uint32_t key = 0; key < 200; ++key)
      index.add(key, TracedValue{copies, live, static_cast<int>(key)});
    CATCH_REQUIRE(index.height() > 3); // plenty of splits
    CATCH_REQUIRE(live == 200);

    for (uint32_t key = 0; key < 200; key += 2) {
      auto item = index.extract(key);
      CATCH_REQUIRE(item.has_value());
      CATCH_REQUIRE(item->second.value() == static_cast<int>(key));
    }
    CATCH_REQUIRE(live == 100);
    CATCH_REQUIRE(index.find(1u)->value() == 1);
  }
  CATCH_REQUIRE(copies == 0);
  CATCH_REQUIRE(live == 0);
}

CATCH_TEST_CASE("index_construct_move_swap_clear", "[index_construct_move_swap_clear]") {
  ByteIndex a{{{1u, 10}, {2u, 20}, {3u, 30}, {1u, 11}}, IndexConfig{3, 1.0}};
  CATCH_REQUIRE(a.size() == 4);
  CATCH_REQUIRE(a.count(1u) == 2);

  const std::vector<std::pair<uint32_t, int>> items{{5u, 50}, {6u, 60}};
  ByteIndex b{std::begin(items), std::end(items)};
  CATCH_REQUIRE(b.size() == 2);
  CATCH_REQUIRE(b.config() == IndexConfig{});

  swap(a, b);
  CATCH_REQUIRE(a.size() == 2);
  CATCH_REQUIRE(b.size() == 4);
  CATCH_REQUIRE(b.config().capacity == 3);
  check_index_invariants(a);
  check_index_invariants(b);

  ByteIndex c{std::move(b)};
  CATCH_REQUIRE(c.size() == 4);
  CATCH_REQUIRE(c.get(2u) == 20);
  check_index_invariants(c);

  // Moved from is empty and usable
  CATCH_REQUIRE(b.empty());
  CATCH_REQUIRE(b.height() == 1);
  CATCH_REQUIRE(b.begin() == b.end());
  CATCH_REQUIRE(b.config() == c.config());
  b.add(9u, 90);
  CATCH_REQUIRE(b.get(9u) == 90);
  check_index_invariants(b);
  static_assert(std::is_nothrow_move_assignable<ByteIndex>::value);

  c.clear();
  CATCH_REQUIRE(c.empty());
  CATCH_REQUIRE(c.height() == 1);
  CATCH_REQUIRE(!c.contains(2u));
  c.add(2u, 22);
  CATCH_REQUIRE(c.get(2u) == 22);
  check_index_invariants(c);
}

CATCH_TEST_CASE("index_observers", "[index_observers]") {
  CATCH_REQUIRE(SmallIndex::hash_function()(5u) == detail::BitSequence<4>::from_string("0101"));
  CATCH_REQUIRE(SmallIndex::key_comp()(1u, 2u));
  CATCH_REQUIRE(!SmallIndex::key_comp()(2u, 2u));
  CATCH_REQUIRE(SmallIndex::bit_width == 4);
}

} // namespace dynhash::test
