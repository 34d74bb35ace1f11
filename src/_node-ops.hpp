#pragma once

#include "_node-data.hpp"

#include <algorithm>
#include <optional>
#include <utility>
#include <vector>

#include <cassert>

namespace dynhash::detail {

// ----------------------------------------------------------------------------------------- NodeOps

template <typename KeyType,   //
          typename ValueType, //
          typename Hash,      // Provides `bit_width`, and `Hash{}(key)` => BitSequence
          typename Compare>   // Key order within a bucket
struct NodeOps {
  using key_type = KeyType;
  using value_type = ValueType;
  using sequence_type = BitSequence<Hash::bit_width>;
  using entry_type = Entry<KeyType, ValueType, Hash::bit_width>;
  using item_type = typename entry_type::item_type;
  using bucket_type = Bucket<entry_type, Compare>;
  using node_type = Node<bucket_type>;
  using node_ptr_type = node_type*;
  using node_const_ptr_type = const node_type*;
  using node_owner_type = std::unique_ptr<node_type>;
  using size_type = std::size_t;

  // One bit is consumed per node, so no path holds more nodes than the hash has bits
  static constexpr std::size_t MaxTrieDepth{Hash::bit_width};

  static node_owner_type make_root() { return std::make_unique<node_type>(0); }

  //@{ Branch access
  static bucket_type* bucket_at(node_ptr_type node, bool bit) {
    return std::get_if<bucket_type>(&node->branch(bit));
  }
  static const bucket_type* bucket_at(node_const_ptr_type node, bool bit) {
    return std::get_if<bucket_type>(&node->branch(bit));
  }

  static node_ptr_type child_at(node_ptr_type node, bool bit) {
    auto* owner = std::get_if<node_owner_type>(&node->branch(bit));
    return (owner == nullptr) ? nullptr : owner->get();
  }
  static node_const_ptr_type child_at(node_const_ptr_type node, bool bit) {
    const auto* owner = std::get_if<node_owner_type>(&node->branch(bit));
    return (owner == nullptr) ? nullptr : owner->get();
  }

  /**
   * @return TRUE if both of node's branches are empty buckets
   */
  static bool is_collapsible(node_const_ptr_type node) {
    const auto* left = bucket_at(node, false);
    const auto* right = bucket_at(node, true);
    return left != nullptr && right != nullptr && left->empty() && right->empty();
  }
  //@}

  //@{ Path
  struct TreePath {
    std::array<node_ptr_type, MaxTrieDepth> nodes; //!< root first
    std::array<bool, MaxTrieDepth> bits;           //!< the branch taken at each node
    bucket_type* bucket_end = nullptr;             //!< the bucket the path ends in
    sequence_type residual;                        //!< bits left over at `bucket_end`
    uint32_t size = 0;                             //!< number of nodes in path
    void push(node_ptr_type node, bool bit) {
      assert(size < nodes.size());
      nodes[size] = node;
      bits[size] = bit;
      ++size;
    }
  };

  static TreePath make_path(node_ptr_type root, sequence_type bits, Direction direction) {
    TreePath path;
    auto node = root;
    while (true) {
      const bool bit = bits.consume(direction);
      path.push(node, bit);
      if (auto* child = child_at(node, bit)) {
        node = child;
        continue;
      }
      path.bucket_end = bucket_at(node, bit);
      path.residual = bits;
      break;
    }
    assert(path.bucket_end != nullptr);
    return path;
  }

  static const bucket_type* find_bucket(node_const_ptr_type root, sequence_type bits,
                                        Direction direction) {
    auto node = root;
    while (true) {
      const bool bit = bits.consume(direction);
      if (auto* child = child_at(node, bit))
        node = child;
      else
        return bucket_at(node, bit);
    }
  }
  //@}

  //@{ Modifiers
  /**
   * Places (key, value) in the bucket its bits lead to. The bucket may now be full;
   * pass the returned path to `overflow` to split it.
   */
  template <typename K, typename V>
  static TreePath insert(node_ptr_type root, const IndexConfig& config, sequence_type bits,
                         K&& key, V&& value) {
    auto path = make_path(root, std::move(bits), config.direction);
    path.bucket_end->insert(
        entry_type{item_type{std::forward<K>(key), std::forward<V>(value)}, path.residual});
    return path;
  }

  /**
   * Removes the first entry matching `key`, collapsing any subtree left empty
   * @return The removed (key, value), if there was one
   */
  static std::optional<item_type> erase(node_ptr_type root, const IndexConfig& config,
                                        sequence_type bits, const key_type& key) {
    auto path = make_path(root, std::move(bits), config.direction);
    auto removed = path.bucket_end->remove_first_match(key);
    if (!removed)
      return {};
    underflow(path);
    return std::optional<item_type>{std::move(removed->item)};
  }

  /**
   * Replaces the full bucket at the end of `path` (or at `bit` of `node`) with a new child
   * node, moving each entry down by consuming one more of its residual bits. Each split
   * either completes or leaves its bucket as it was. With `SplitPolicy::Cascade`,
   * any child bucket that is still full is split in turn.
   *
   * A bucket whose entries have no residual bits is at the bottom of the trie, and
   * stays a bucket regardless of its size.
   *
   * @return TRUE if the bucket was split
   */
  static bool overflow(const TreePath& path, const IndexConfig& config) {
    if (!path.bucket_end->is_full(config.capacity, config.fill_factor))
      return false;
    const auto level = path.size - 1;
    return overflow(path.nodes[level], path.bits[level], config);
  }

  static bool overflow(node_ptr_type node, bool bit, const IndexConfig& config) {
    if (!split_(node, bit, config))
      return false;
    if (config.split == SplitPolicy::Cascade) {
      std::vector<node_ptr_type> pending{child_at(node, bit)};
      while (!pending.empty()) {
        auto* current = pending.back();
        pending.pop_back();
        for (const bool side : {false, true}) {
          const auto* bucket = bucket_at(current, side);
          if (bucket != nullptr && bucket->is_full(config.capacity, config.fill_factor) &&
              split_(current, side, config)) {
            pending.push_back(child_at(current, side));
          }
        }
      }
    }
    return true;
  }

  /**
   * Walks back up `path` (deepest first), and while a non-root node has two empty
   * buckets, its parent swaps it for a single empty bucket. The root never collapses.
   */
  static void underflow(const TreePath& path) {
    for (auto level = path.size - 1; level > 0; --level) {
      auto* node = path.nodes[level];
      if (!is_collapsible(node))
        break;
      log(LogLevel::Trace, "collapsing empty node at depth {}", node->depth_);
      path.nodes[level - 1]->branch(path.bits[level - 1]) = bucket_type{};
    }
  }
  //@}

  //@{ Lookup
  static const entry_type* find(node_const_ptr_type root, const IndexConfig& config,
                                sequence_type bits, const key_type& key) {
    return find_bucket(root, std::move(bits), config.direction)->first_match(key);
  }

  static size_type count(node_const_ptr_type root, const IndexConfig& config,
                         sequence_type bits, const key_type& key) {
    return find_bucket(root, std::move(bits), config.direction)->count(key);
  }
  //@}

  //@{ Shape
  /**
   * Applies `f(node)` to every node, depth first
   */
  template <typename Function> static void for_each_node(node_const_ptr_type root, Function f) {
    // Children are pushed two at a time, one level deeper than the node popped,
    // so the stack never holds more than one node per level plus one
    std::vector<node_const_ptr_type> stack;
    stack.reserve(MaxTrieDepth + 1);
    stack.push_back(root);
    while (!stack.empty()) {
      auto* node = stack.back();
      stack.pop_back();
      f(node);
      for (const bool bit : {true, false}) { // push right first, so left is visited first
        if (auto* child = child_at(node, bit))
          stack.push_back(child);
      }
    }
  }

  static size_type height(node_const_ptr_type root) {
    uint32_t deepest = 0;
    for_each_node(root, [&deepest](node_const_ptr_type node) {
      deepest = std::max(deepest, node->depth_);
    });
    return static_cast<size_type>(deepest) + 1;
  }

  static IndexStatistics statistics(node_const_ptr_type root, const IndexConfig& config) {
    IndexStatistics stats;
    for_each_node(root, [&](node_const_ptr_type node) {
      stats.height = std::max<std::size_t>(stats.height, node->depth_ + 1);
      ++stats.nodes;
      for (const bool bit : {false, true}) {
        const auto* bucket = bucket_at(node, bit);
        if (bucket == nullptr)
          continue;
        ++stats.buckets;
        stats.entries += bucket->size();
        stats.largest_bucket = std::max(stats.largest_bucket, bucket->size());
        if (bucket->empty())
          ++stats.empty_buckets;
        else if ((*bucket)[0].residual.empty() &&
                 bucket->is_full(config.capacity, config.fill_factor))
          ++stats.collision_buckets;
      }
    });
    return stats;
  }
  //@}

private:
  static bool split_(node_ptr_type node, bool bit, const IndexConfig& config) {
    auto* bucket = bucket_at(node, bit);
    assert(bucket != nullptr);
    assert(!bucket->empty());

    if ((*bucket)[0].residual.empty()) {
      log(LogLevel::Debug, "bucket at depth {} is out of hash bits, keeping all {} entries",
          node->depth_, bucket->size());
      return false;
    }

    // Nothing is committed until the child is complete; `bucket` is intact on a throw
    auto child = std::make_unique<node_type>(node->depth_ + 1);
    auto halves = bucket->split(config.direction);
    *bucket_at(child.get(), false) = std::move(halves[0]);
    *bucket_at(child.get(), true) = std::move(halves[1]);
    const auto* added = child.get();
    node->branch(bit) = std::move(child); // the (now empty) bucket is released here

    log(LogLevel::Trace, "split bucket at depth {} into {} + {} entries", node->depth_,
        bucket_at(added, false)->size(), bucket_at(added, true)->size());
    return true;
  }
};

} // namespace dynhash::detail
