#pragma once

#include "_base-index.hpp"
#include "_hashers.hpp"

#include <functional>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <type_traits>

namespace dynhash {

namespace detail {
  template <typename InputIt>
  using RequireInputIterator = std::enable_if_t<std::is_base_of<
      std::input_iterator_tag, typename std::iterator_traits<InputIt>::iterator_category>::value>;
} // namespace detail

// ----------------------------------------------------------------------------------- dynamic_index

/**
 * A multimap kept in a binary trie over the bits of each key's hash.
 *
 * Each node consumes one bit of the hash and routes to one of two branches. A branch
 * is a bucket of at most `capacity * fill_factor` entries (kept in key order), or a
 * child node. A bucket that grows past that splits into a child node; a node whose
 * buckets both empty collapses back into a bucket in its parent. The root never
 * collapses, so a new or drained index has height 1.
 *
 * Keys may repeat: `find`, `get` and `erase` act on the oldest entry for a key.
 * Iteration follows the trie (left before right), and is sorted only within a bucket.
 */
template <typename KeyType,                       // Type of key
          typename ValueType,                     // Type of mapped value
          typename Hash = sha256_hasher<KeyType>, // Key => BitSequence<Hash::bit_width>
          typename Compare = std::less<KeyType>   // Order of keys within a bucket
          >
class dynamic_index {
private:
  using index_type = detail::base_index<KeyType, ValueType, Hash, Compare>;
  index_type index_;

public:
  using key_type = typename index_type::key_type;
  using value_type = typename index_type::value_type;
  using item_type = typename index_type::item_type;
  using size_type = typename index_type::size_type;
  using sequence_type = typename index_type::sequence_type;
  using hasher = typename index_type::hasher;
  using key_compare = typename index_type::key_compare;
  using const_reference = typename index_type::const_reference;
  using iterator = typename index_type::iterator;
  using const_iterator = typename index_type::const_iterator;
  static constexpr std::size_t bit_width = index_type::bit_width;

  //@{ Construction/Destruction
  explicit dynamic_index(const IndexConfig& config = {}) : index_{config} {}
  dynamic_index(std::size_t capacity, double fill_factor,
                Direction direction = Direction::LeftToRight)
      : index_{IndexConfig{capacity, fill_factor, direction}} {}
  dynamic_index(const dynamic_index& other) = delete;
  dynamic_index(dynamic_index&& other) = default; // leaves `other` empty, which allocates
  ~dynamic_index() = default;

  template <typename InputIt, typename = detail::RequireInputIterator<InputIt>>
  dynamic_index(InputIt first, InputIt last, const IndexConfig& config = {}) : index_{config} {
    add(first, last);
  }
  dynamic_index(std::initializer_list<item_type> ilist, const IndexConfig& config = {})
      : index_{config} {
    add(std::begin(ilist), std::end(ilist));
  }
  //@}

  //@{ Assignment
  dynamic_index& operator=(const dynamic_index& other) = delete;
  dynamic_index& operator=(dynamic_index&& other) = default;
  //@}

  //@{ Iterators
  const_iterator begin() const { return index_.begin(); }
  const_iterator cbegin() const { return index_.cbegin(); }

  const_iterator end() const { return index_.end(); }
  const_iterator cend() const { return index_.cend(); }

  /**
   * Calls `f(key, value)` for every entry, in iteration order
   */
  template <typename Function> void traverse(Function&& f) const {
    index_.traverse(std::forward<Function>(f));
  }
  //@}

  //@{ Capacity
  bool empty() const { return index_.empty(); }
  std::size_t size() const { return index_.size(); }
  std::size_t height() const { return index_.height(); }
  //@}

  //@{ Modifiers
  void clear() { index_.clear(); }

  /**
   * Adds (key, value), even if key is already present
   * @throw hash_input_error if key cannot be hashed; the index is unchanged
   */
  template <typename K, typename V> void add(K&& key, V&& value) {
    index_.add(std::forward<K>(key), std::forward<V>(value));
  }
  void add(const item_type& item) { index_.add(item.first, item.second); }
  template <typename InputIt, typename = detail::RequireInputIterator<InputIt>>
  void add(InputIt first, InputIt last) {
    while (first != last) {
      add(*first);
      ++first;
    }
  }

  /**
   * Removes the oldest entry for key, if any
   * @return The number of entries removed: 0 or 1
   */
  size_type erase(const key_type& key) { return index_.erase(key); }
  std::optional<item_type> extract(const key_type& key) { return index_.extract(key); }

  void swap(dynamic_index& other) noexcept { index_.swap(other.index_); }
  //@}

  //@{ Lookup
  const value_type* find(const key_type& key) const { return index_.find(key); }
  std::optional<value_type> get(const key_type& key) const { return index_.get(key); }
  const value_type& at(const key_type& key) const { return index_.at(key); }
  bool contains(const key_type& key) const { return index_.contains(key); }
  size_type count(const key_type& key) const { return index_.count(key); }
  //@}

  //@{ Observers
  const IndexConfig& config() const { return index_.config(); }
  IndexStatistics statistics() const { return index_.statistics(); }
  static hasher hash_function() { return index_type::hash_function(); }
  static key_compare key_comp() { return index_type::key_comp(); }
  //@}

  //@{ Friends
  friend void swap(dynamic_index& lhs, dynamic_index& rhs) noexcept { lhs.swap(rhs); }
  //@}
};

} // namespace dynhash
