#pragma once

#include "_logging.hpp"

#include <cmath>
#include <cstddef>
#include <string_view>

namespace dynhash {

// ---------------------------------------------------------------------------------------- Direction

/**
 * Which end of a bit sequence is consumed first
 */
enum class Direction : int { LeftToRight = 0, RightToLeft = 1 };

constexpr std::string_view to_string(Direction direction) {
  return (direction == Direction::RightToLeft) ? "right-to-left" : "left-to-right";
}

// -------------------------------------------------------------------------------------- SplitPolicy

/**
 * How far an overflow may grow the tree in one insertion.
 *
 * `SingleLevel` adds exactly one node per overflow; a child bucket left above the
 * threshold by the redistribution splits when the next insertion lands in it.
 * `Cascade` keeps splitting the new child buckets until each one is within the
 * threshold (or has no bits left to split on).
 */
enum class SplitPolicy : int { SingleLevel = 0, Cascade = 1 };

constexpr std::string_view to_string(SplitPolicy policy) {
  return (policy == SplitPolicy::Cascade) ? "cascade" : "single-level";
}

// -------------------------------------------------------------------------------------- IndexConfig

struct IndexConfig {
  static constexpr std::size_t MinCapacity{3};
  static constexpr double MinFillFactor{0.25};

  std::size_t capacity{8};                     //!< raw entries per bucket
  double fill_factor{0.80};                    //!< fraction of capacity before a split
  Direction direction{Direction::LeftToRight}; //!< end of the hash consumed first
  SplitPolicy split{SplitPolicy::SingleLevel}; //!< growth per overflow

  /**
   * @return The number of entries a bucket may hold before it is full
   */
  constexpr double bucket_limit() const { return static_cast<double>(capacity) * fill_factor; }

  constexpr bool operator==(const IndexConfig& other) const = default;
};

/**
 * Clamps `config` into the valid range, logging a warning for every adjustment.
 */
inline IndexConfig normalize(IndexConfig config) {
  if (config.capacity < IndexConfig::MinCapacity) {
    log(LogLevel::Warn, "bucket capacity {} is below the minimum, using {}", config.capacity,
        IndexConfig::MinCapacity);
    config.capacity = IndexConfig::MinCapacity;
  }
  if (std::isnan(config.fill_factor) || config.fill_factor < IndexConfig::MinFillFactor) {
    log(LogLevel::Warn, "fill factor {} is below the minimum, using {}", config.fill_factor,
        IndexConfig::MinFillFactor);
    config.fill_factor = IndexConfig::MinFillFactor;
  }
  if (config.direction != Direction::LeftToRight && config.direction != Direction::RightToLeft) {
    log(LogLevel::Warn, "unknown direction {}, using {}", static_cast<int>(config.direction),
        to_string(Direction::LeftToRight));
    config.direction = Direction::LeftToRight;
  }
  if (config.split != SplitPolicy::SingleLevel && config.split != SplitPolicy::Cascade) {
    log(LogLevel::Warn, "unknown split policy {}, using {}", static_cast<int>(config.split),
        to_string(SplitPolicy::SingleLevel));
    config.split = SplitPolicy::SingleLevel;
  }
  return config;
}

} // namespace dynhash
