#pragma once

#include "_bucket.hpp"

#include <array>
#include <memory>
#include <variant>

#include <cstddef>
#include <cstdint>

namespace dynhash {

// ---------------------------------------------------------------------------------- IndexStatistics

struct IndexStatistics {
  std::size_t height{0};            //!< nodes on the longest root-to-bucket path
  std::size_t nodes{0};             //!< internal nodes, root included
  std::size_t buckets{0};           //!< leaf buckets
  std::size_t empty_buckets{0};     //!< buckets without entries
  std::size_t entries{0};           //!< (key, value) pairs
  std::size_t largest_bucket{0};    //!< entries in the fullest bucket
  std::size_t collision_buckets{0}; //!< over-full buckets with no hash bits left to split on
};

} // namespace dynhash

namespace dynhash::detail {

// ------------------------------------------------------------------------------------ Node, Branch

template <typename BucketType> struct Node;

/**
 * A node's slot: a bucket (leaf state) or an owned child node (internal state)
 */
template <typename BucketType>
using Branch = std::variant<BucketType, std::unique_ptr<Node<BucketType>>>;

template <typename BucketType> struct Node {
  using bucket_type = BucketType;
  using branch_type = Branch<BucketType>;

  // @{ members
  uint32_t depth_{0};                   //!< root is 0, and a child is its parent's depth + 1
  std::array<branch_type, 2> branches_; //!< [0] for a 0 bit (left), [1] for a 1 bit (right)
  // @}

  explicit Node(uint32_t depth) : depth_{depth} {}

  branch_type& branch(bool bit) { return branches_[bit ? 1 : 0]; }
  const branch_type& branch(bool bit) const { return branches_[bit ? 1 : 0]; }
};

} // namespace dynhash::detail
