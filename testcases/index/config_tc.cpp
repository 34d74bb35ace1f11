#include <catch2/catch.hpp>

#include "dynhash/dynamic-index.hpp"

#include <cmath>
#include <limits>

namespace dynhash::test {

namespace {
  // Silences warnings for the lifetime of a test
  struct QuietLog {
    LogLevel saved{log_level()};
    QuietLog() { set_log_level(LogLevel::Off); }
    ~QuietLog() { set_log_level(saved); }
  };
} // namespace

CATCH_TEST_CASE("config_defaults", "[config_defaults]") {
  const IndexConfig config;
  CATCH_REQUIRE(config.capacity == 8);
  CATCH_REQUIRE(config.fill_factor == Approx(0.80));
  CATCH_REQUIRE(config.direction == Direction::LeftToRight);
  CATCH_REQUIRE(config.split == SplitPolicy::SingleLevel);
  CATCH_REQUIRE(config.bucket_limit() == Approx(6.4));
  CATCH_REQUIRE(normalize(config) == config);
}

CATCH_TEST_CASE("config_normalize", "[config_normalize]") {
  QuietLog quiet;

  const auto clamped = normalize(IndexConfig{1, 0.1, Direction::RightToLeft});
  CATCH_REQUIRE(clamped.capacity == IndexConfig::MinCapacity);
  CATCH_REQUIRE(clamped.fill_factor == Approx(IndexConfig::MinFillFactor));
  CATCH_REQUIRE(clamped.direction == Direction::RightToLeft);

  const auto nan = normalize(IndexConfig{10, std::numeric_limits<double>::quiet_NaN()});
  CATCH_REQUIRE(nan.capacity == 10);
  CATCH_REQUIRE(nan.fill_factor == Approx(IndexConfig::MinFillFactor));

  const auto bad_direction = normalize(IndexConfig{3, 1.0, static_cast<Direction>(7)});
  CATCH_REQUIRE(bad_direction.direction == Direction::LeftToRight);

  const auto bad_split =
      normalize(IndexConfig{3, 1.0, Direction::LeftToRight, static_cast<SplitPolicy>(-2)});
  CATCH_REQUIRE(bad_split.split == SplitPolicy::SingleLevel);

  // In range values are untouched, a fill factor above 1 included
  const auto big = normalize(IndexConfig{100, 2.5, Direction::RightToLeft, SplitPolicy::Cascade});
  CATCH_REQUIRE(big == IndexConfig{100, 2.5, Direction::RightToLeft, SplitPolicy::Cascade});
}

CATCH_TEST_CASE("config_index_is_normalized", "[config_index_is_normalized]") {
  QuietLog quiet;
  dynamic_index<int, int> index{0, 0.0, Direction::RightToLeft};
  CATCH_REQUIRE(index.config().capacity == 3);
  CATCH_REQUIRE(index.config().fill_factor == Approx(0.25));
  CATCH_REQUIRE(index.config().direction == Direction::RightToLeft);
  CATCH_REQUIRE(index.height() == 1);
}

CATCH_TEST_CASE("log_levels", "[log_levels]") {
  QuietLog quiet;
  CATCH_REQUIRE(parse_log_level("trace", LogLevel::Off) == LogLevel::Trace);
  CATCH_REQUIRE(parse_log_level("warn", LogLevel::Off) == LogLevel::Warn);
  CATCH_REQUIRE(parse_log_level("off", LogLevel::Warn) == LogLevel::Off);
  CATCH_REQUIRE(parse_log_level("loud", LogLevel::Info) == LogLevel::Info);
  CATCH_REQUIRE(to_string(LogLevel::Error) == "error");

  set_log_level(LogLevel::Info);
  CATCH_REQUIRE(is_logging(LogLevel::Error));
  CATCH_REQUIRE(is_logging(LogLevel::Info));
  CATCH_REQUIRE(!is_logging(LogLevel::Debug));
  CATCH_REQUIRE(!is_logging(LogLevel::Off));

  set_log_level(LogLevel::Off);
  CATCH_REQUIRE(!is_logging(LogLevel::Error));
}

} // namespace dynhash::test
