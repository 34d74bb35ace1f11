
#include "dynhash/dynamic-index.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <array>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <vector>

using namespace std::string_literals;

using ticktock_type = std::chrono::time_point<std::chrono::steady_clock>;

static ticktock_type tick() { return std::chrono::steady_clock::now(); }
static std::chrono::microseconds tock(const ticktock_type& whence) {
  auto now = std::chrono::steady_clock::now();
  return std::chrono::duration_cast<std::chrono::microseconds>(now - whence);
}

constexpr std::size_t ColumnCount = 4;

struct Data {
  std::string label;
  std::size_t size;
  std::array<std::string, ColumnCount> columns;
  std::array<uint64_t, ColumnCount> insert_times;
  std::array<uint64_t, ColumnCount> iterate_times;
  std::array<uint64_t, ColumnCount> find_times;
  std::array<uint64_t, ColumnCount> delete_times;
  std::size_t volatile_data = 0; // to prevent optimizing away
};

template <typename T> T generate(std::size_t counter) {
  static_assert(std::is_integral<T>::value || std::is_same<T, std::string>::value);
  if constexpr (std::is_integral<T>::value) {
    return static_cast<T>(counter);
  } else {
    return fmt::format("{0}:{1}:{0}:{2}", counter, 10 * counter, 437 * counter * 12345667);
  }
}

template <typename key_type, typename value_type>
std::vector<std::pair<key_type, value_type>> generate_items(std::size_t count) {
  using item_type = typename std::pair<key_type, value_type>;

  std::vector<item_type> items;
  items.reserve(count);
  for (auto i = 0u; i < count; ++i)
    items.push_back({generate<key_type>(i), generate<value_type>(i)});

  return items;
}

template <typename key_type, typename value_type>
Data run_items(std::string label, const std::size_t size, const uint32_t sample_size) {
  using item_type = typename std::pair<key_type, value_type>;
  using vector_type = std::vector<item_type>;
  using unordered_type = std::unordered_multimap<key_type, value_type>;
  using ordered_type = std::multimap<key_type, value_type>;
  using index_type = dynhash::dynamic_index<key_type, value_type>;

  const vector_type items = generate_items<key_type, value_type>(size);

  // 1. unordered_multimap
  // 2. multimap
  // 3. dynamic_index (single level splits)
  // 4. dynamic_index (cascading splits)

  Data data;
  data.label = label;
  data.size = size;
  data.columns = decltype(data.columns){{"unordered-multimap"s, "multimap"s, "dynhash"s,
                                         "dynhash-cascade"s}};

  auto cascade_config = dynhash::IndexConfig{};
  cascade_config.split = dynhash::SplitPolicy::Cascade;

  const auto start = std::begin(items);
  const auto finish = std::end(items);

  auto profile = [sample_size](std::string_view label, auto make_thunk) {
    uint64_t total_us = 0;
    for (auto i = 0u; i < sample_size; ++i) {
      auto thunk = make_thunk(); // setup is not timed
      const auto reference = tick();
      thunk();
      total_us += tock(reference).count();
    }
    const auto average_us = uint64_t(total_us / double(sample_size));
    const auto seconds = average_us / 1000000;
    std::cout << fmt::format("             {:18s} = {}.{:06d}s\n", label, seconds,
                             average_us % 1000000);
    return average_us;
  };

  // Containers filled once, for the read-only operations
  unordered_type unordered{start, finish};
  ordered_type ordered{start, finish};
  index_type index{start, finish};
  index_type cascade_index{start, finish, cascade_config};

  { // Insert
    std::cout << fmt::format("{}({}) -- INSERT\n", label, size);
    data.insert_times[0] = profile(data.columns[0], [&]() {
      return [&]() { unordered_type{}.insert(start, finish); };
    });
    data.insert_times[1] = profile(data.columns[1], [&]() {
      return [&]() { ordered_type{}.insert(start, finish); };
    });
    data.insert_times[2] = profile(data.columns[2], [&]() {
      return [&]() { index_type{}.add(start, finish); };
    });
    data.insert_times[3] = profile(data.columns[3], [&]() {
      return [&]() { index_type{cascade_config}.add(start, finish); };
    });
  }

  { // Iterate
    std::cout << fmt::format("{}({}) -- ITERATE\n", label, size);
    std::size_t counter = 0;
    auto iterate = [&counter](const auto& container) {
      return [&]() {
        for (const auto& item : container)
          counter += item.second;
      };
    };
    data.iterate_times[0] = profile(data.columns[0], [&]() { return iterate(unordered); });
    data.iterate_times[1] = profile(data.columns[1], [&]() { return iterate(ordered); });
    data.iterate_times[2] = profile(data.columns[2], [&]() { return iterate(index); });
    data.iterate_times[3] = profile(data.columns[3], [&]() { return iterate(cascade_index); });
    data.volatile_data += counter;
  }

  { // Find
    std::cout << fmt::format("{}({}) -- FIND\n", label, size);
    std::size_t counter = 0;
    auto find_std = [&](const auto& container) {
      return [&]() {
        for (const auto& item : items)
          counter += container.count(item.first);
      };
    };
    auto find_index = [&](const index_type& container) {
      return [&]() {
        for (const auto& item : items)
          counter += container.contains(item.first);
      };
    };
    data.find_times[0] = profile(data.columns[0], [&]() { return find_std(unordered); });
    data.find_times[1] = profile(data.columns[1], [&]() { return find_std(ordered); });
    data.find_times[2] = profile(data.columns[2], [&]() { return find_index(index); });
    data.find_times[3] = profile(data.columns[3], [&]() { return find_index(cascade_index); });
    data.volatile_data += counter;
  }

  { // Delete, from a freshly filled container each sample
    std::cout << fmt::format("{}({}) -- DELETE\n", label, size);
    data.delete_times[0] = profile(data.columns[0], [&]() {
      return [&, container = unordered_type{start, finish}]() mutable {
        for (const auto& item : items)
          container.erase(item.first);
      };
    });
    data.delete_times[1] = profile(data.columns[1], [&]() {
      return [&, container = ordered_type{start, finish}]() mutable {
        for (const auto& item : items)
          container.erase(item.first);
      };
    });
    data.delete_times[2] = profile(data.columns[2], [&]() {
      return [&, container = index_type{start, finish}]() mutable {
        for (const auto& item : items)
          container.erase(item.first);
      };
    });
    data.delete_times[3] = profile(data.columns[3], [&]() {
      return [&, container = index_type{start, finish, cascade_config}]() mutable {
        for (const auto& item : items)
          container.erase(item.first);
      };
    });
  }

  const auto stats = index.statistics();
  std::cout << fmt::format("             height = {}, nodes = {}, buckets = {}, largest = {}\n",
                           stats.height, stats.nodes, stats.buckets, stats.largest_bucket);
  std::cout << "\n";

  return data;
}

template <typename key_type, typename value_type>
void run_types(std::ostream& os, std::string label, std::size_t size0, std::size_t max_size,
               uint32_t sample_size) {
  // collect all the data
  std::vector<Data> data;
  for (std::size_t size = size0; size <= max_size; size *= 2)
    data.push_back(run_items<key_type, value_type>(label, size, sample_size));

  auto output = [&](std::string op_type, auto fn) {
    os << fmt::format("{}_{}\t{}\n", label, op_type, fmt::join(data[0].columns, "\t"));
    for (const auto& datum : data)
      os << fmt::format("{}\t{}\n", datum.size, fmt::join(fn(datum), "\t"));
    os << "\n";
  };

  output("insert", std::mem_fn(&Data::insert_times));
  output("iterate", std::mem_fn(&Data::iterate_times));
  output("find", std::mem_fn(&Data::find_times));
  output("delete", std::mem_fn(&Data::delete_times));
}

void run_benchmark(std::string filename) {
  const std::size_t min_size = 1000;
  const std::size_t max_size = 256000;
  const uint32_t sample_size = 5;
  std::fstream file(filename, file.out);
  if (!file.is_open()) {
    std::cerr << fmt::format("failed to open file '{}'\n", filename);
    std::exit(1);
  }

  run_types<int, int>(file, "integer", min_size, max_size, sample_size);
  run_types<std::string, int>(file, "string", min_size, max_size, sample_size);

  file.close();
  std::cout << fmt::format("Benchmark results collated in '{}'\n", filename);
}

int main(int argc, char* argv[]) {
  run_benchmark(argc > 1 ? argv[1] : "/tmp/dynhash-benchmark.tsv");
}
