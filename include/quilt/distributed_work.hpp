#pragma once

#include <quilt/result.hpp>
#include <algorithm>
#include <exception>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace quilt {

// Worker count for n units: `requested` when positive (capped at n),
// otherwise min(n, max(16, 4 * hardware threads)).
inline size_t effective_workers(size_t requested, size_t n) {
    if (n == 0) return 0;
    if (requested > 0) return std::min(requested, n);
    size_t hw = std::thread::hardware_concurrency();
    size_t cap = std::max<size_t>(16, 4 * hw);
    return std::min(cap, n);
}

// Runs independent work units on a bounded pool of threads. Results come
// back in submission order regardless of completion order, and every
// submitted unit runs to completion before run() returns.
template<typename T>
class DistributedWork {
public:
    using Unit = std::function<Result<T>()>;

    explicit DistributedWork(size_t max_workers = 0)
        : max_workers_(max_workers) {}

    void add(Unit unit) { units_.push_back(std::move(unit)); }
    size_t size() const { return units_.size(); }

    // One outcome per unit, in submission order. Consumes the queued units.
    std::vector<Result<T>> run_all();

    // All values in submission order, or the first failure by submission
    // order once every unit has finished.
    Result<std::vector<T>> run();

private:
    size_t max_workers_;
    std::vector<Unit> units_;

    static Result<T> execute(Unit& unit);
};

template<typename T>
Result<T> DistributedWork<T>::execute(Unit& unit) {
    try {
        return unit();
    } catch (const std::exception& e) {
        return QuiltError{QuiltError::Internal,
            std::string("work unit threw: ") + e.what()};
    }
}

template<typename T>
std::vector<Result<T>> DistributedWork<T>::run_all() {
    std::vector<Unit> units = std::move(units_);
    units_.clear();

    const size_t n = units.size();
    std::vector<std::optional<Result<T>>> slots(n);

    std::mutex queue_mutex;
    size_t next = 0;

    auto worker = [&]() {
        while (true) {
            size_t index;
            {
                std::lock_guard<std::mutex> lock(queue_mutex);
                if (next >= n) return;
                index = next++;
            }
            // Each slot is written by exactly one worker
            slots[index].emplace(execute(units[index]));
        }
    };

    size_t worker_count = effective_workers(max_workers_, n);
    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& thread : workers) {
        if (thread.joinable()) thread.join();
    }

    std::vector<Result<T>> results;
    results.reserve(n);
    for (auto& slot : slots) {
        results.push_back(std::move(*slot));
    }
    return results;
}

template<typename T>
Result<std::vector<T>> DistributedWork<T>::run() {
    auto outcomes = run_all();

    std::vector<T> values;
    values.reserve(outcomes.size());
    for (auto& outcome : outcomes) {
        if (outcome.is_err()) return std::move(outcome).error();
        values.push_back(std::move(outcome).value());
    }
    return Result<std::vector<T>>::ok(std::move(values));
}

} // namespace quilt
