#pragma once
#include <algorithm>
#include <chrono>
#include <exception>
#include <mutex>
#include <thread>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

// Runs task(i) for every i in [0, count) on a pool of at most `workers`
// threads and returns once all of them finished. Tasks must only write to
// their own slot of any shared result. pacingMs spaces successive task starts
// across the whole pool.
template <typename Task>
void fanOut(size_t count, size_t workers, Task task, unsigned pacingMs = 0)
{
  if (!count) return;
  workers = std::max<size_t>(1, std::min(workers, count));

  std::mutex paceMutex;
  auto lastStart = std::chrono::steady_clock::time_point();
  const auto pace = std::chrono::milliseconds(pacingMs);

  auto runOne = [&](size_t i) {
    if (pacingMs) {
      std::lock_guard<std::mutex> lock(paceMutex);
      auto now = std::chrono::steady_clock::now();
      if (now < lastStart + pace) {
        std::this_thread::sleep_until(lastStart + pace);
        now = std::chrono::steady_clock::now();
      }
      lastStart = now;
    }
    try {
      task(i);
    } catch (const std::exception& e) {
      spdlog::error("worker task {} failed: {}", i, e.what());
    }
  };

  boost::asio::thread_pool pool(workers);
  for (size_t i = 0; i < count; i++) {
    boost::asio::post(pool, [&runOne, i]() { runOne(i); });
  }
  pool.join();
}
