#pragma once

#include "_bit-sequence.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace dynhash::detail {

// ------------------------------------------------------------------------------------------- Entry

template <typename KeyType, typename ValueType, std::size_t Bits> struct Entry {
  using key_type = KeyType;
  using value_type = ValueType;
  using item_type = std::pair<KeyType, ValueType>;
  using sequence_type = BitSequence<Bits>;

  item_type item;         //!< (key, value)
  sequence_type residual; //!< hash bits not consumed on the way to the holding bucket

  constexpr const key_type& key() const { return item.first; }
  constexpr const value_type& value() const { return item.second; }
};

// ------------------------------------------------------------------------------------------ Bucket

/**
 * Key ordered multiset of entries. Entries with equivalent keys are kept in
 * insertion order, so "first match" is the oldest entry for that key.
 */
template <typename EntryType, typename Compare> class Bucket {
public:
  using entry_type = EntryType;
  using key_type = typename EntryType::key_type;
  using size_type = std::size_t;
  using const_iterator = typename std::vector<EntryType>::const_iterator;

private:
  std::vector<EntryType> entries_;

  static bool less_(const EntryType& entry, const key_type& key) {
    return Compare{}(entry.key(), key);
  }
  static bool greater_(const key_type& key, const EntryType& entry) {
    return Compare{}(key, entry.key());
  }

  const_iterator lower_bound_(const key_type& key) const {
    return std::lower_bound(entries_.cbegin(), entries_.cend(), key, less_);
  }

  // Position of the first match, or end()
  const_iterator find_(const key_type& key) const {
    auto position = lower_bound_(key);
    return (position != entries_.cend() && !greater_(key, *position)) ? position
                                                                      : entries_.cend();
  }

public:
  //@{ Capacity
  size_type size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }

  /**
   * @return TRUE if this bucket holds more than `capacity * fill_factor` entries
   */
  bool is_full(std::size_t capacity, double fill_factor) const {
    return static_cast<double>(size()) > static_cast<double>(capacity) * fill_factor;
  }
  //@}

  //@{ Iterators
  const_iterator begin() const { return entries_.cbegin(); }
  const_iterator end() const { return entries_.cend(); }
  const EntryType& operator[](size_type index) const { return entries_[index]; }
  //@}

  //@{ Modifiers
  void insert(EntryType&& entry) {
    auto position = std::upper_bound(entries_.begin(), entries_.end(), entry.key(), greater_);
    entries_.insert(position, std::move(entry));
  }

  std::optional<EntryType> remove_first_match(const key_type& key) {
    auto position = find_(key);
    if (position == entries_.cend())
      return {};
    auto ii = entries_.begin() + (position - entries_.cbegin());
    std::optional<EntryType> removed{std::move(*ii)};
    entries_.erase(ii);
    return removed;
  }

  /**
   * Distributes the entries between two new buckets by the next bit of each residual,
   * which is consumed. Key order carries over, so no keys are compared.
   *
   * Entries are moved if that cannot throw, and copied otherwise. If an exception is
   * thrown, this bucket is unchanged; on success it is left empty.
   */
  std::array<Bucket, 2> split(Direction direction) {
    auto next_bit = [direction](const EntryType& entry) {
      return entry.residual.consumed(direction).first;
    };
    const auto ones = static_cast<size_type>(std::count_if(begin(), end(), next_bit));

    std::array<Bucket, 2> halves;
    halves[0].entries_.reserve(size() - ones);
    halves[1].entries_.reserve(ones);
    for (auto& entry : entries_) {
      auto [bit, residual] = entry.residual.consumed(direction);
      auto& half = halves[bit ? 1 : 0].entries_;
      half.push_back(std::move_if_noexcept(entry));
      half.back().residual = residual;
    }

    entries_.clear();
    return halves;
  }
  //@}

  //@{ Lookup
  const EntryType* first_match(const key_type& key) const {
    auto position = find_(key);
    return (position == entries_.cend()) ? nullptr : &*position;
  }

  bool contains(const key_type& key) const { return find_(key) != entries_.cend(); }

  size_type count(const key_type& key) const {
    auto range = std::equal_range(entries_.cbegin(), entries_.cend(), key, KeyOrder{});
    return static_cast<size_type>(range.second - range.first);
  }
  //@}

private:
  // Heterogeneous comparison for std::equal_range
  struct KeyOrder {
    bool operator()(const EntryType& entry, const key_type& key) const { return less_(entry, key); }
    bool operator()(const key_type& key, const EntryType& entry) const {
      return greater_(key, entry);
    }
  };
};

} // namespace dynhash::detail
