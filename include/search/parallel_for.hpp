#pragma once
#include <cstddef>
#include <functional>

namespace plotter {

// Runs fn(0) .. fn(count - 1) on up to `threads` std::threads, worker t taking
// indices t, t + threads, ... Runs inline when one thread is enough.
//
// Every started worker is joined before returning, including when creating a
// later worker fails. The first worker exception (in worker order) is
// rethrown after the join; a failed spawn is rethrown as is.
//
// `on_spawn` runs right before each worker is created (tests use it to make
// thread creation fail).
void ParallelFor(std::size_t count, std::size_t threads, const std::function<void(std::size_t)>& fn,
                 const std::function<void(std::size_t)>& on_spawn = {});

} // namespace plotter
