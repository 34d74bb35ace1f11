
#include "dynhash/dynamic-index.hpp"

#include <fmt/format.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>

std::chrono::steady_clock::time_point tick() { return std::chrono::steady_clock::now(); }

template <typename T> T tock(std::chrono::steady_clock::time_point reference) {
  return std::chrono::duration_cast<T>(tick() - reference);
}

static void show_help(const char* exec) {
  fmt::print("Usage: {} [capacity [fill-factor [ltr|rtl]]]\n\n"
             "   Inserts the keys 0 1 9 2 8 3 7 4 6 5 with random values, prints lookups,\n"
             "   the height and the traversal, then deletes every key.\n\n"
             "   Defaults: capacity 3, fill-factor 0.8, ltr.\n"
             "   Set DYNHASH_LOG_LEVEL=trace|debug|info|warn|error|off to see splits and merges.\n",
             exec);
}

static dynhash::IndexConfig parse_arguments(int argc, char** argv) {
  dynhash::IndexConfig config;
  config.capacity = 3;
  if (argc > 1)
    config.capacity = std::stoul(argv[1]);
  if (argc > 2)
    config.fill_factor = std::stod(argv[2]);
  if (argc > 3) {
    const std::string_view direction = argv[3];
    if (direction == "ltr")
      config.direction = dynhash::Direction::LeftToRight;
    else if (direction == "rtl")
      config.direction = dynhash::Direction::RightToLeft;
    else
      throw std::invalid_argument(fmt::format("unknown direction '{}'", direction));
  }
  return config;
}

#ifndef BUILD_EXAMPLES
int main(int argc, char** argv) {
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      show_help(argv[0]);
      return EXIT_SUCCESS;
    }
  }

  dynhash::IndexConfig config;
  try {
    config = parse_arguments(argc, argv);
  } catch (std::exception& e) {
    fmt::print(stderr, "Error parsing arguments: {}, pass -h for help\n", e.what());
    return EXIT_FAILURE;
  }

  const int keys[] = {0, 1, 9, 2, 8, 3, 7, 4, 6, 5};
  std::mt19937 generator{std::random_device{}()};
  std::uniform_real_distribution<double> distribution{0.0, 100.0};

  dynhash::dynamic_index<int, double> index{config};
  fmt::print("capacity = {}, fill-factor = {:.2f}, direction = {}\n", index.config().capacity,
             index.config().fill_factor, to_string(index.config().direction));

  const auto reference = tick();
  for (auto key : keys)
    index.add(key, distribution(generator));
  const auto elapsed = tock<std::chrono::microseconds>(reference);

  for (auto key : keys)
    fmt::print("{}\n", index.at(key));
  fmt::print("height = {}\n", index.height());
  index.traverse([](int key, double value) { fmt::print("({} => {})\n", key, value); });
  for (auto key : keys)
    fmt::print("Contains {}: {}\n", key, index.contains(key));

  const auto stats = index.statistics();
  fmt::print("nodes = {}, buckets = {}, largest bucket = {}, inserts took {}us\n", stats.nodes,
             stats.buckets, stats.largest_bucket, elapsed.count());

  for (auto key : keys)
    index.erase(key);

  fmt::print("{:-<80}\n", "");
  index.traverse([](int key, double value) { fmt::print("({} => {})\n", key, value); });
  fmt::print("height = {}\n", index.height());

  return EXIT_SUCCESS;
}
#endif
