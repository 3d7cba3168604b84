#include "search/parallel_for.hpp"

#include <algorithm>
#include <exception>
#include <thread>
#include <vector>

namespace plotter {

namespace {

struct JoinAll {
  std::vector<std::thread>& threads;
  ~JoinAll() {
    for (auto& th : threads) {
      if (th.joinable()) th.join();
    }
  }
};

} // namespace

void ParallelFor(std::size_t count, std::size_t threads, const std::function<void(std::size_t)>& fn,
                 const std::function<void(std::size_t)>& on_spawn) {
  threads = std::min(threads, count);
  if (threads <= 1) {
    for (std::size_t i = 0; i < count; ++i) fn(i);
    return;
  }

  std::vector<std::exception_ptr> errors(threads);
  std::vector<std::thread> workers;
  workers.reserve(threads);
  {
    JoinAll joiner{workers};
    for (std::size_t t = 0; t < threads; ++t) {
      if (on_spawn) on_spawn(t);
      workers.emplace_back([&, t] {
        try {
          for (std::size_t i = t; i < count; i += threads) fn(i);
        } catch (...) {
          errors[t] = std::current_exception();
        }
      });
    }
  }
  for (const auto& e : errors) {
    if (e) std::rethrow_exception(e);
  }
}

} // namespace plotter
