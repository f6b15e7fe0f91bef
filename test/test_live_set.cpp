#include <iostream>
#include <thread>
#include <vector>
#include <atomic>
#include <cassert>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <random>
#include <algorithm>
#include <iterator>
#include <type_traits>
#include "liveset/live_set.hpp"

using namespace liveset;

// Calls back into the set from its destructor
struct DestructionHook {
    std::function<void()> on_destroy;

    explicit DestructionHook(std::function<void()> callback) : on_destroy(std::move(callback)) {}
    DestructionHook(DestructionHook&& other) noexcept : on_destroy(std::move(other.on_destroy)) {
        other.on_destroy = nullptr;
    }
    ~DestructionHook() {
        if (on_destroy) {
            on_destroy();
        }
    }
};

// Aggregate with no constructors of its own
struct Endpoint {
    std::string host;
    int port;
};

static_assert(std::is_default_constructible<LiveSet<int>::ReadGuard::iterator>::value,
              "read guard iterators are forward iterators");

void test_basic_live_set_operations() {
    std::cout << "Testing basic live set operations...\n";

    auto set = LiveSet<int>::create();

    assert(set->empty());
    assert(set->size() == 0);
    assert(set->snapshot().empty());

    std::vector<ItemOwner<int>> owners;
    for (int i = 1; i <= 10; ++i) {
        owners.push_back(set->insert(i));
        assert(set->size() == static_cast<size_t>(i));
    }

    assert(!set->empty());

    // Duplicate values are separate entries
    ItemOwner<int> duplicate = set->insert(5);
    assert(set->size() == 11);
    assert(set->count_if([](int x) { return x == 5; }) == 2);

    for (const auto& owner : owners) {
        assert(set->contains(owner.identity()));
    }
    assert(!set->contains(Identity()));

    std::cout << "Basic live set operations test passed!\n";
}

void test_custom_bucket_count() {
    std::cout << "Testing custom bucket count...\n";

    auto set = LiveSet<std::string>::create(4);
    std::vector<ItemOwner<std::string>> owners;

    for (int i = 0; i < 100; ++i) {
        owners.push_back(set->insert("item-" + std::to_string(i)));
    }
    assert(set->size() == 100);

    owners.erase(owners.begin(), owners.begin() + 50);
    assert(set->size() == 50);

    std::cout << "Custom bucket count test passed!\n";
}

void test_snapshot() {
    std::cout << "Testing snapshot...\n";

    auto set = LiveSet<std::string>::create();
    std::vector<ItemOwner<std::string>> owners;
    std::vector<std::string> words = {"apple", "banana", "cherry", "date"};

    for (const auto& word : words) {
        owners.push_back(set->insert(word));
    }

    auto items = set->snapshot();
    assert(items.size() == words.size());

    std::set<std::string> seen;
    std::set<Identity> ids;
    for (const auto& item : items) {
        seen.insert(item.second);
        ids.insert(item.first);
    }
    assert(seen == std::set<std::string>(words.begin(), words.end()));
    assert(ids.size() == words.size());

    // The snapshot is a copy: releasing afterwards does not touch it
    owners.clear();
    assert(set->empty());
    assert(items.size() == words.size());

    std::cout << "Snapshot test passed!\n";
}

void test_identities() {
    std::cout << "Testing identities...\n";

    auto set = LiveSet<std::unique_ptr<int>>::create();
    ItemOwner<std::unique_ptr<int>> a = set->insert(std::make_unique<int>(1));
    ItemOwner<std::unique_ptr<int>> b = set->insert(std::make_unique<int>(2));

    auto ids = set->identities();
    std::sort(ids.begin(), ids.end());
    std::vector<Identity> expected = {a.identity(), b.identity()};
    std::sort(expected.begin(), expected.end());
    assert(ids == expected);

    b.release();
    ids = set->identities();
    assert(ids.size() == 1);
    assert(ids[0] == a.identity());

    std::cout << "Identities test passed!\n";
}

void test_read_guard() {
    std::cout << "Testing read guard...\n";

    auto set = LiveSet<int>::create();
    ItemOwner<int> i1 = set->insert(1);
    ItemOwner<int> i2 = set->insert(2);
    ItemOwner<int> i3 = set->insert(3);

    {
        auto guard = set->lock();
        assert(guard.size() == 3);

        std::vector<int> items(guard.begin(), guard.end());
        std::sort(items.begin(), items.end());
        assert((items == std::vector<int>{1, 2, 3}));

        std::set<Identity> ids;
        for (auto it = guard.begin(); it != guard.end(); ++it) {
            ids.insert(it.identity());
        }
        assert(ids.size() == 3);
        assert(ids.count(i2.identity()) == 1);
    }

    assert(i2.take() == 2);

    {
        auto guard = set->lock();
        std::vector<int> items;
        for (int value : guard) {
            items.push_back(value);
        }
        std::sort(items.begin(), items.end());
        assert((items == std::vector<int>{1, 3}));
    }

    assert(*i1 == 1);

    i1.release();
    i3.release();
    auto guard = set->lock();
    assert(guard.begin() == guard.end());
    assert(guard.size() == 0);

    std::cout << "Read guard test passed!\n";
}

void test_emplace_aggregate() {
    std::cout << "Testing emplace of aggregates...\n";

    auto set = LiveSet<Endpoint>::create();
    ItemOwner<Endpoint> local = set->emplace("localhost", 8080);
    SharedItemOwner<Endpoint> remote = set->emplace_shared(std::string("example.org"), 443);

    assert(local->host == "localhost");
    assert(local->port == 8080);
    assert(remote->host == "example.org");
    assert(remote->port == 443);
    assert(set->count_if([](const Endpoint& e) { return e.port < 1024; }) == 1);

    std::cout << "Emplace of aggregates test passed!\n";
}

void test_iterator_default_construction() {
    std::cout << "Testing iterator default construction...\n";

    auto set = LiveSet<int>::create();
    ItemOwner<int> a = set->insert(1);
    ItemOwner<int> b = set->insert(2);

    auto guard = set->lock();
    LiveSet<int>::ReadGuard::iterator it;
    it = guard.begin();
    assert(it != guard.end());

    int sum = 0;
    for (; it != guard.end(); ++it) {
        sum += *it;
    }
    assert(sum == 3);
    assert(std::distance(guard.begin(), guard.end()) == 2);

    std::cout << "Iterator default construction test passed!\n";
}

void test_others() {
    std::cout << "Testing others...\n";

    auto set = LiveSet<std::string>::create();
    ItemOwner<std::string> alice = set->insert("alice");
    ItemOwner<std::string> bob = set->insert("bob");
    SharedItemOwner<std::string> carol = set->insert_shared("carol");

    {
        auto guard = set->lock();

        std::set<std::string> not_alice;
        for (const auto& name : guard.others(alice)) {
            not_alice.insert(name);
        }
        assert((not_alice == std::set<std::string>{"bob", "carol"}));

        std::set<std::string> not_carol;
        for (const auto& name : guard.others(carol)) {
            not_carol.insert(name);
        }
        assert((not_carol == std::set<std::string>{"alice", "bob"}));
    }

    // An owner from another set excludes nothing
    auto elsewhere = LiveSet<std::string>::create();
    ItemOwner<std::string> stranger = elsewhere->insert("alice");
    {
        auto guard = set->lock();
        auto range = guard.others(stranger);
        assert(std::distance(range.begin(), range.end()) == 3);
    }

    // Neither does an empty owner
    ItemOwner<std::string> empty;
    {
        auto guard = set->lock();
        auto range = guard.others(empty);
        assert(std::distance(range.begin(), range.end()) == 3);
    }

    std::cout << "Others test passed!\n";
}

void test_for_each() {
    std::cout << "Testing for_each...\n";

    auto set = LiveSet<int>::create();
    std::vector<ItemOwner<int>> owners;
    for (int i = 1; i <= 20; ++i) {
        owners.push_back(set->insert(i));
    }

    int sum = 0;
    std::set<Identity> visited;
    set->for_each([&](Identity id, int value) {
        sum += value;
        assert(visited.insert(id).second);
        // size() and empty() do not lock, so the visitor may call them
        assert(set->size() == 20);
        assert(!set->empty());
    });
    assert(sum == 210);
    assert(visited.size() == 20);

    auto even_count = set->count_if([](int x) { return x % 2 == 0; });
    assert(even_count == 10);

    std::cout << "for_each test passed!\n";
}

void test_idempotent_removal() {
    std::cout << "Testing idempotent removal...\n";

    auto set = LiveSet<int>::create();
    ItemOwner<int> keeper = set->insert(1);
    ItemOwner<int> victim = set->insert(2);
    Identity id = victim.identity();

    // Simulate two releases racing for the same identity
    assert(detail::StoreAccess::remove(*set, id));
    assert(!detail::StoreAccess::remove(*set, id));
    assert(set->size() == 1);
    assert(!set->contains(id));
    assert(set->contains(keeper.identity()));

    // The owner's own release then finds nothing left to remove
    assert(!victim.release());
    assert(set->size() == 1);

    assert(!detail::StoreAccess::remove(*set, Identity(123456)));
    assert(set->size() == 1);

    std::cout << "Idempotent removal test passed!\n";
}

void test_values_destroyed_outside_lock() {
    std::cout << "Testing values destroyed outside the lock...\n";

    auto set = LiveSet<DestructionHook>::create();
    LiveSet<DestructionHook>* raw = set.get();

    ItemOwner<DestructionHook> witness = set->emplace(std::function<void()>());
    Identity witness_id = witness.identity();

    size_t size_seen = 99;
    bool witness_seen = false;
    bool victim_seen = true;
    Identity victim_id;

    ItemOwner<DestructionHook> victim = set->emplace(std::function<void()>([&]() {
        // Would deadlock if the set were still locked
        size_seen = raw->size();
        witness_seen = raw->contains(witness_id);
        victim_seen = raw->contains(victim_id);
    }));
    victim_id = victim.identity();

    victim.release();
    assert(size_seen == 1);
    assert(witness_seen);
    assert(!victim_seen);

    std::cout << "Values destroyed outside the lock test passed!\n";
}

void test_concurrent_inserts() {
    std::cout << "Testing concurrent inserts...\n";

    auto set = LiveSet<int>::create();
    constexpr int num_threads = 8;
    constexpr int inserts_per_thread = 500;

    std::vector<std::vector<ItemOwner<int>>> owners(num_threads);
    std::vector<std::thread> threads;

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < inserts_per_thread; ++i) {
                owners[t].push_back(set->insert(t * inserts_per_thread + i));
                // Inserted entries are visible to the inserting thread immediately
                assert(set->contains(owners[t].back().identity()));
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    assert(set->size() == static_cast<size_t>(num_threads * inserts_per_thread));
    assert(set->identities().size() == set->size());

    owners.clear();
    assert(set->empty());

    std::cout << "Concurrent inserts test passed!\n";
}

void test_iteration_under_churn() {
    std::cout << "Testing iteration under churn...\n";

    auto set = LiveSet<int>::create();
    constexpr int num_writers = 4;
    constexpr int num_readers = 3;
    constexpr int operations_per_writer = 2000;

    // Entries with value -1 are pinned for the whole test
    std::vector<ItemOwner<int>> pinned;
    for (int i = 0; i < 10; ++i) {
        pinned.push_back(set->insert(-1));
    }

    std::atomic<bool> writers_done{false};
    std::atomic<int> iterations{0};
    std::vector<std::thread> threads;

    for (int w = 0; w < num_writers; ++w) {
        threads.emplace_back([&, w]() {
            std::random_device rd;
            std::mt19937 gen(rd());
            std::uniform_int_distribution<> op_dist(0, 99);

            std::vector<ItemOwner<int>> mine;
            for (int i = 0; i < operations_per_writer; ++i) {
                if (mine.empty() || op_dist(gen) < 60) {
                    mine.push_back(set->insert(w));
                } else {
                    size_t index = static_cast<size_t>(op_dist(gen)) % mine.size();
                    Identity id = mine[index].identity();
                    mine.erase(mine.begin() + static_cast<std::ptrdiff_t>(index));
                    // Release happens-before this thread's next read
                    assert(!set->contains(id));
                }
            }
        });
    }

    for (int r = 0; r < num_readers; ++r) {
        threads.emplace_back([&, r]() {
            while (!writers_done.load()) {
                if (r % 2 == 0) {
                    auto items = set->snapshot();
                    std::set<Identity> ids;
                    int pinned_seen = 0;
                    for (const auto& item : items) {
                        assert(ids.insert(item.first).second);
                        assert(item.second >= -1 && item.second < num_writers);
                        if (item.second == -1) {
                            ++pinned_seen;
                        }
                    }
                    assert(pinned_seen == 10);
                } else {
                    std::set<Identity> ids;
                    int pinned_seen = 0;
                    set->for_each([&](Identity id, int value) {
                        assert(ids.insert(id).second);
                        if (value == -1) {
                            ++pinned_seen;
                        }
                    });
                    assert(pinned_seen == 10);
                }
                iterations.fetch_add(1);
            }
        });
    }

    for (int w = 0; w < num_writers; ++w) {
        threads[w].join();
    }
    writers_done.store(true);
    for (size_t i = num_writers; i < threads.size(); ++i) {
        threads[i].join();
    }

    std::cout << "Reader iterations: " << iterations.load() << "\n";
    std::cout << "Final set size: " << set->size() << "\n";

    // Writers dropped all their owners on exit
    assert(set->size() == pinned.size());
    pinned.clear();
    assert(set->empty());

    std::cout << "Iteration under churn test passed!\n";
}

void test_stress_operations() {
    std::cout << "Testing stress operations...\n";

    auto set = LiveSet<int>::create();
    constexpr int num_threads = 6;
    constexpr int operations_per_thread = 1000;

    std::atomic<int> inserts{0};
    std::atomic<int> releases{0};
    std::atomic<int> lookups{0};
    std::vector<std::vector<SharedItemOwner<int>>> kept(num_threads);
    std::vector<std::thread> threads;

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&, t]() {
            std::random_device rd;
            std::mt19937 gen(rd());
            std::uniform_int_distribution<> op_dist(0, 99);

            auto& mine = kept[t];
            for (int i = 0; i < operations_per_thread; ++i) {
                int op = op_dist(gen);

                if (op < 50 || mine.empty()) {  // 50% insert operations
                    mine.push_back(set->insert_shared(i));
                    inserts.fetch_add(1);
                } else if (op < 70) {  // 20% release operations
                    if (mine.back().release()) {
                        releases.fetch_add(1);
                    }
                    mine.pop_back();
                } else {  // 30% lookups
                    assert(set->contains(mine.front().identity()));
                    lookups.fetch_add(1);
                }
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    std::cout << "Inserts: " << inserts.load() << ", releases: " << releases.load()
              << ", lookups: " << lookups.load() << "\n";
    std::cout << "Final set size: " << set->size() << "\n";

    // Verify set integrity
    int expected_size = inserts.load() - releases.load();
    assert(set->size() == static_cast<size_t>(expected_size));

    kept.clear();
    assert(set->empty());

    std::cout << "Stress operations test passed!\n";
}

int main() {
    std::cout << "LiveSet Tests\n";
    std::cout << "=============\n\n";

    test_basic_live_set_operations();
    test_custom_bucket_count();
    test_snapshot();
    test_identities();
    test_read_guard();
    test_emplace_aggregate();
    test_iterator_default_construction();
    test_others();
    test_for_each();
    test_idempotent_removal();
    test_values_destroyed_outside_lock();
    test_concurrent_inserts();
    test_iteration_under_churn();
    test_stress_operations();

    std::cout << "\nAll live set tests passed!\n";
    return 0;
}
