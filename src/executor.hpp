#pragma once

// Parallel loops for batch work: multi-book index builds and
// per-session matching.
//
// Internal header — not installed.

#include <taskflow/taskflow.hpp>

#include <cstddef>
#include <exception>
#include <mutex>

namespace xpoint_cpp::detail {

// Work-stealing executor shared by every parallel loop in the library,
// sized to std::thread::hardware_concurrency(). Created on first use.
inline auto global_executor() -> tf::Executor& {
    static tf::Executor executor;
    return executor;
}

// Call fn(i) for every i in [0, count) and wait for all calls to finish.
// A single item runs on the calling thread. If any call throws, the
// remaining calls still run and the first exception is rethrown here.
template <typename Fn>
void parallel_for(std::size_t count, Fn&& fn) {
    if (count == 0) return;
    if (count == 1) {
        fn(std::size_t{0});
        return;
    }

    auto first_error = std::exception_ptr{};
    auto error_mutex = std::mutex{};

    auto taskflow = tf::Taskflow{};
    taskflow.for_each_index(std::size_t{0}, count, std::size_t{1}, [&](std::size_t i) {
        try {
            fn(i);
        } catch (...) {
            auto lock = std::scoped_lock{error_mutex};
            if (!first_error) first_error = std::current_exception();
        }
    });
    global_executor().run(taskflow).wait();

    if (first_error) std::rethrow_exception(first_error);
}

}  // namespace xpoint_cpp::detail
