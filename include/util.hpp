#pragma once
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <format>
#include <functional>
#include <iostream>
#include <numeric>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>
#include "config.hpp"

template <class... Args>
void print(FILE *stream, std::format_string<Args...> fmt, Args &&... args) {
  auto buf = std::format(fmt, std::forward<Args>(args)...);
  std::fwrite(buf.data(), 1, buf.size(), stream);
}

template <class... Args>
void print(std::ostream &os, std::format_string<Args...> fmt, Args &&... args) {
  std::ostreambuf_iterator it(os);
  std::format_to(it, fmt, std::forward<Args>(args)...);
}

template <class... Args>
void print(std::format_string<Args...> fmt, Args &&... args) {
  print(std::cout, fmt, std::forward<Args>(args)...);
}

template <class... Args>
void println(FILE *stream, std::format_string<Args...> fmt, Args &&... args) {
  auto buf = std::format(fmt, std::forward<Args>(args)...).append(1, '\n');
  std::fwrite(buf.data(), 1, buf.size(), stream);
}

template <class... Args>
void println(std::ostream &os, std::format_string<Args...> fmt, Args &&... args) {
  std::ostreambuf_iterator it(os);
  std::format_to(it, fmt, std::forward<Args>(args)...);
  *it = '\n';
}

template <class... Args>
void println(std::format_string<Args...> fmt, Args &&... args) {
  println(std::cout, fmt, std::forward<Args>(args)...);
}

template <class Duration, class Fn, class... Args>
auto measure_time(Fn &&fn, Args &&... args) {
  using Ret = std::invoke_result_t<Fn, Args...>;
  auto start = std::chrono::high_resolution_clock::now();
  if constexpr (std::is_void_v<Ret>) {
    std::invoke(std::forward<Fn>(fn), std::forward<Args>(args)...);
    auto end = std::chrono::high_resolution_clock::now();
    return std::chrono::duration_cast<Duration>(end - start);
  } else {
    Ret result = std::invoke(std::forward<Fn>(fn), std::forward<Args>(args)...);
    auto end = std::chrono::high_resolution_clock::now();
    return std::pair<Ret, Duration>(std::move(result), std::chrono::duration_cast<Duration>(end - start));
  }
}

inline std::string now_iso8601() {
  auto now = std::chrono::system_clock::now();
  auto tp = std::chrono::time_point_cast<std::chrono::milliseconds>(now);
  return std::format("{:%Y-%m-%dT%H:%M:%SZ}", tp);
}

inline std::string format_bytes(std::size_t bytes) {
  if (bytes >= MiB) return std::format("{:.1f} MiB", bytes / MiB_d);
  if (bytes >= KiB) return std::format("{:.1f} KiB", bytes / KiB_d);
  return std::format("{} B", bytes);
}

// Sorts samples in place; samples must not be empty.
inline std::size_t percentile(std::vector<std::size_t> &samples, std::size_t per_mille) {
  std::ranges::sort(samples);
  return samples[std::min(samples.size() - 1, samples.size() * per_mille / 1000)];
}
