#pragma once

#include "_node-ops.hpp"

#include <array>
#include <iterator>

namespace dynhash::detail {

/**
 * Depth first, left branch before right branch; each bucket in key order.
 * Invalidated by any modification of the index.
 */
template <typename NodeOps> class Iterator {
public:
  using iterator_category = std::forward_iterator_tag;
  using difference_type = std::ptrdiff_t;
  using value_type = typename NodeOps::item_type;
  using reference = const value_type&;
  using pointer = const value_type*;
  using node_type = typename NodeOps::node_type;
  using node_const_ptr_type = const node_type*;
  using bucket_type = typename NodeOps::bucket_type;

private:
  static constexpr uint32_t NotADepth{static_cast<uint32_t>(-1)};
  std::array<node_const_ptr_type, NodeOps::MaxTrieDepth> path_{};
  std::array<uint8_t, NodeOps::MaxTrieDepth> position_{}; // branch (0 or 1) being visited
  uint32_t depth_{NotADepth};
  const bucket_type* bucket_{nullptr};
  std::size_t cursor_{0}; // in bucket_

public:
  struct MakeBeginTag {};
  struct MakeEndTag {};

  Iterator() = default; // end

  Iterator(node_const_ptr_type root, MakeBeginTag) : depth_{0} {
    path_[0] = root;
    position_[0] = 0;
    settle_();
  }

  Iterator(node_const_ptr_type root, MakeEndTag) { path_[0] = root; }

  bool operator==(const Iterator& other) const {
    return (is_end_() && other.is_end_())     // both at `end()`
           || (bucket_ == other.bucket_       // same bucket (so neither at `end()`)
               && cursor_ == other.cursor_); // and same entry
  }

  bool operator!=(const Iterator& other) const { return !(*this == other); }

  Iterator& operator++() {
    increment_();
    return *this;
  }

  Iterator operator++(int) {
    Iterator tmp = *this;
    ++(*this);
    return tmp;
  }

  reference operator*() const { return *operator->(); }

  pointer operator->() const {
    assert(!is_end_());
    assert(cursor_ < bucket_->size());
    return &(*bucket_)[cursor_].item;
  }

private:
  bool is_end_() const { return depth_ == NotADepth; }
  node_const_ptr_type current_() const { return path_[depth_]; }

  void increment_() {
    if (is_end_())
      return; // Attempt to increment beyond the end of the collection
    if (++cursor_ < bucket_->size())
      return;
    if (next_branch_())
      settle_();
  }

  // Moves to the next unvisited branch; FALSE (and at `end()`) if there are none
  bool next_branch_() {
    while (position_[depth_] == 1) {
      if (depth_ == 0) {
        depth_ = NotADepth;
        bucket_ = nullptr;
        cursor_ = 0;
        return false;
      }
      --depth_;
    }
    ++position_[depth_];
    return true;
  }

  // From the current branch, descend to the first entry at or after it
  void settle_() {
    while (!is_end_()) {
      const bool bit = position_[depth_] == 1;
      if (auto* child = NodeOps::child_at(current_(), bit)) {
        assert(depth_ + 1 < path_.size());
        path_[++depth_] = child;
        position_[depth_] = 0;
        continue;
      }
      const auto* bucket = NodeOps::bucket_at(current_(), bit);
      if (!bucket->empty()) {
        bucket_ = bucket;
        cursor_ = 0;
        return;
      }
      next_branch_();
    }
  }
};

} // namespace dynhash::detail
