#pragma once

#include "_config.hpp"
#include "_errors.hpp"
#include "_node-ops.hpp"
#include "_iterator.hpp"

#include <fmt/format.h>

#include <functional>
#include <optional>
#include <stdexcept>
#include <utility>

namespace dynhash::detail {

// -------------------------------------------------------------------------------------- base_index

template <typename KeyType,   // The type ordered by Compare, and hashed by Hash
          typename ValueType, //
          typename Hash,      // Key => BitSequence<Hash::bit_width>
          typename Compare    // Order of keys within a bucket
          >
class base_index {
private:
  using Ops = detail::NodeOps<KeyType, ValueType, Hash, Compare>;
  using node_type = typename Ops::node_type;
  using node_ptr_type = typename Ops::node_ptr_type;
  using node_const_ptr_type = typename Ops::node_const_ptr_type;
  using node_owner_type = typename Ops::node_owner_type;

public:
  //@{
  using key_type = KeyType;
  using value_type = ValueType;
  using item_type = typename Ops::item_type;
  using size_type = typename Ops::size_type;
  using sequence_type = typename Ops::sequence_type;
  using hasher = Hash;
  using key_compare = Compare;
  using const_reference = const item_type&;
  using const_iterator = detail::Iterator<Ops>;
  using iterator = const_iterator;
  static constexpr std::size_t bit_width = Hash::bit_width;
  //@}

private:
  IndexConfig config_;   //!< Normalized, and fixed at construction
  node_owner_type root_; //!< Root of the tree; never collapses
  std::size_t size_{0};  //!< Number of entries

public:
  //@{ Construction/Destruction
  explicit base_index(const IndexConfig& config = {})
      : config_{normalize(config)}, root_{Ops::make_root()} {}
  base_index(const base_index&) = delete;
  // Allocates: `other` is left empty but usable, with a fresh root of its own
  base_index(base_index&& other) : base_index{other.config_} { swap(other); }
  ~base_index() = default;
  //@}

  //@{ Assignment
  base_index& operator=(const base_index&) = delete;
  base_index& operator=(base_index&& other) noexcept {
    swap(other);
    return *this;
  }
  //@}

  //@{ Iterators
  const_iterator begin() const { return cbegin(); }
  const_iterator cbegin() const {
    return const_iterator{root_.get(), typename const_iterator::MakeBeginTag{}};
  }

  const_iterator end() const { return cend(); }
  const_iterator cend() const {
    return const_iterator{root_.get(), typename const_iterator::MakeEndTag{}};
  }

  template <typename Function> void traverse(Function&& f) const {
    for (const auto& [key, value] : *this)
      std::invoke(f, key, value);
  }
  //@}

  //@{ Capacity
  bool empty() const { return size() == 0; }
  std::size_t size() const { return size_; }
  std::size_t height() const { return Ops::height(root_.get()); }
  //@}

  //@{ Modifiers
  void clear() {
    root_ = Ops::make_root();
    size_ = 0;
  }

  template <typename K, typename V> void add(K&& key, V&& value) {
    auto bits = hash_(key);
    const auto path = Ops::insert(root_.get(), config_, std::move(bits), std::forward<K>(key),
                                  std::forward<V>(value));
    ++size_; // the entry is in, even if splitting its bucket throws
    Ops::overflow(path, config_);
  }

  size_type erase(const key_type& key) { return extract(key).has_value() ? 1 : 0; }

  std::optional<item_type> extract(const key_type& key) {
    auto removed = Ops::erase(root_.get(), config_, hash_(key), key);
    if (removed)
      --size_;
    return removed;
  }

  void swap(base_index& other) noexcept {
    std::swap(config_, other.config_);
    std::swap(root_, other.root_);
    std::swap(size_, other.size_);
  }
  //@}

  //@{ Lookup
  const value_type* find(const key_type& key) const {
    const auto* entry = Ops::find(root_.get(), config_, hash_(key), key);
    return (entry == nullptr) ? nullptr : &entry->value();
  }

  std::optional<value_type> get(const key_type& key) const {
    const auto* value = find(key);
    return (value == nullptr) ? std::optional<value_type>{} : std::optional<value_type>{*value};
  }

  const value_type& at(const key_type& key) const {
    const auto* value = find(key);
    if (value == nullptr)
      throw std::out_of_range{"key not in index"};
    return *value;
  }

  bool contains(const key_type& key) const { return find(key) != nullptr; }

  size_type count(const key_type& key) const {
    return Ops::count(root_.get(), config_, hash_(key), key);
  }
  //@}

  //@{ Observers
  const IndexConfig& config() const { return config_; }
  static hasher hash_function() { return hasher{}; }
  static key_compare key_comp() { return key_compare{}; }
  IndexStatistics statistics() const { return Ops::statistics(root_.get(), config_); }
  //@}

private:
  node_const_ptr_type get_root_() const { return root_.get(); }

  static sequence_type hash_(const key_type& key) {
    sequence_type bits = hasher{}(key);
    if (bits.size() != bit_width)
      throw hash_input_error{
          fmt::format("hash of key has {} bits, expected {}", bits.size(), bit_width)};
    return bits;
  }
};

} // namespace dynhash::detail
