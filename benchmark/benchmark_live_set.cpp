#include <iostream>
#include <iomanip>
#include <thread>
#include <vector>
#include <chrono>
#include <mutex>
#include <unordered_map>
#include <atomic>
#include <random>
#include <algorithm>
#include <cstdint>
#include <string>
#include "liveset/live_set.hpp"

using namespace liveset;

// Registry with explicit deregistration for comparison
template<typename T>
class ManualRegistry {
private:
    std::unordered_map<std::uint64_t, T> items_;
    std::uint64_t next_id_ = 1;
    mutable std::mutex mutex_;

public:
    std::uint64_t add(const T& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::uint64_t id = next_id_++;
        items_.emplace(id, value);
        return id;
    }

    bool remove(std::uint64_t id) {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.erase(id) > 0;
    }

    std::vector<T> snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<T> result;
        result.reserve(items_.size());
        for (const auto& item : items_) {
            result.push_back(item.second);
        }
        return result;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }
};

// Adapters giving both containers the same join/leave/broadcast shape
struct LiveSetUnique {
    std::shared_ptr<LiveSet<int>> set = LiveSet<int>::create();
    using Handle = ItemOwner<int>;

    Handle join(int value) { return set->insert(value); }
    void leave(Handle& handle) { handle.release(); }
    size_t broadcast() const { return set->snapshot().size(); }
    size_t size() const { return set->size(); }
};

struct LiveSetShared {
    std::shared_ptr<LiveSet<int>> set = LiveSet<int>::create();
    using Handle = SharedItemOwner<int>;

    Handle join(int value) {
        Handle handle = set->insert_shared(value);
        Handle extra = handle;  // exercise the reference count on every join
        return handle;
    }
    void leave(Handle& handle) { handle.release(); }
    size_t broadcast() const { return set->snapshot().size(); }
    size_t size() const { return set->size(); }
};

struct Manual {
    ManualRegistry<int> registry;
    using Handle = std::uint64_t;

    Handle join(int value) { return registry.add(value); }
    void leave(Handle& handle) { registry.remove(handle); }
    size_t broadcast() const { return registry.snapshot().size(); }
    size_t size() const { return registry.size(); }
};

template<typename Container>
void benchmark_churn(const std::string& name, int num_threads,
                     int operations_per_thread, int broadcast_percentage) {
    Container container;
    std::atomic<bool> start_flag{false};

    // Pre-generate all random data to avoid RNG during timing
    constexpr int op_pool_size = 100000;
    std::vector<int> pre_generated_ops(op_pool_size);

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> op_dist(0, 99);
    for (int i = 0; i < op_pool_size; ++i) {
        pre_generated_ops[i] = op_dist(gen);
    }

    std::cout << "Benchmarking " << name << " - " << num_threads << " threads, "
              << operations_per_thread << " ops each, " << broadcast_percentage << "% broadcasts\n";

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&, t]() {
            while (!start_flag.load(std::memory_order_acquire)) {
                // Spin wait
            }

            std::vector<typename Container::Handle> handles;
            int op_index = t * 1000;

            for (int i = 0; i < operations_per_thread; ++i) {
                int op = pre_generated_ops[(op_index + i) % op_pool_size];

                if (op < broadcast_percentage) {
                    container.broadcast();
                } else if (handles.empty() || op % 2 == 0) {
                    handles.push_back(container.join(i));
                } else {
                    container.leave(handles.back());
                    handles.pop_back();
                }
            }

            for (auto& handle : handles) {
                container.leave(handle);
            }
        });
    }

    auto start_time = std::chrono::high_resolution_clock::now();
    start_flag.store(true, std::memory_order_release);

    for (auto& thread : threads) {
        thread.join();
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time);

    int total_operations = num_threads * operations_per_thread;
    double throughput = (total_operations * 1000000.0) / std::max<long long>(1, duration.count());

    std::cout << "  Time: " << duration.count() << " us\n";
    std::cout << "  Throughput: " << std::fixed << std::setprecision(0) << throughput << " ops/sec\n";
    std::cout << "  Final size: " << container.size() << "\n\n";
}

void benchmark_join_leave_heavy() {
    std::cout << "=== Join/Leave-Heavy Workload (5% broadcasts) ===\n\n";

    benchmark_churn<LiveSetUnique>("LiveSet unique owners", 8, 20000, 5);
    benchmark_churn<LiveSetShared>("LiveSet shared owners", 8, 20000, 5);
    benchmark_churn<Manual>("Manual registry", 8, 20000, 5);
}

void benchmark_broadcast_heavy() {
    std::cout << "=== Broadcast-Heavy Workload (50% broadcasts) ===\n\n";

    benchmark_churn<LiveSetUnique>("LiveSet unique owners", 8, 5000, 50);
    benchmark_churn<LiveSetShared>("LiveSet shared owners", 8, 5000, 50);
    benchmark_churn<Manual>("Manual registry", 8, 5000, 50);
}

void benchmark_scaling() {
    std::cout << "=== Scaling Benchmark ===\n\n";

    std::vector<int> thread_counts = {1, 2, 4, 8, 16};
    constexpr int ops_per_thread = 10000;

    for (int threads : thread_counts) {
        std::cout << "--- " << threads << " threads ---\n";
        benchmark_churn<LiveSetUnique>("LiveSet unique owners", threads, ops_per_thread, 20);
        benchmark_churn<Manual>("Manual registry", threads, ops_per_thread, 20);
    }
}

int main() {
    std::cout << "LiveSet Performance Benchmark\n";
    std::cout << "=============================\n\n";

    benchmark_scaling();
    benchmark_join_leave_heavy();
    benchmark_broadcast_heavy();

    return 0;
}
