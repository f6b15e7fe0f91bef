#include <iostream>
#include <thread>
#include <vector>
#include <chrono>
#include <atomic>
#include <mutex>
#include <memory>
#include <string>
#include <functional>
#include "liveset/live_set.hpp"

using namespace liveset;

// A subscriber's inbox; the room only ever sees it through the set
class Inbox {
public:
    explicit Inbox(std::string name) : name_(std::move(name)) {}

    const std::string& name() const { return name_; }

    void deliver(const std::string& message) const {
        std::lock_guard<std::mutex> lock(mutex_);
        received_.push_back(message);
    }

    size_t received() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_.size();
    }

private:
    std::string name_;
    mutable std::mutex mutex_;
    mutable std::vector<std::string> received_;
};

void test_basic_membership() {
    std::cout << "=== Basic Membership ===\n";

    auto listeners = LiveSet<std::string>::create();

    std::cout << "Initial state - empty: " << listeners->empty()
              << ", size: " << listeners->size() << "\n";

    ItemOwner<std::string> audio = listeners->insert("audio");
    {
        ItemOwner<std::string> video = listeners->insert("video");
        std::cout << "Inside scope - size: " << listeners->size() << "\n";

        for (const auto& item : listeners->snapshot()) {
            std::cout << "  " << item.first << " -> " << item.second << "\n";
        }
    }
    std::cout << "After scope - size: " << listeners->size() << " (video left)\n";

    std::string taken = audio.take();
    std::cout << "Took '" << taken << "' back, size: " << listeners->size() << "\n\n";
}

void test_shared_subscriptions() {
    std::cout << "=== Shared Subscriptions ===\n";

    auto sessions = LiveSet<std::string>::create();

    SharedItemOwner<std::string> tab1 = sessions->insert_shared("user-17");
    SharedItemOwner<std::string> tab2 = tab1;
    SharedItemOwner<std::string> tab3 = tab1;

    std::cout << "Three tabs share one session, owners: " << tab1.use_count()
              << ", sessions: " << sessions->size() << "\n";

    tab1.release();
    tab2.release();
    std::cout << "Two tabs closed, owners: " << tab3.use_count()
              << ", sessions: " << sessions->size() << "\n";

    tab3.release();
    std::cout << "Last tab closed, sessions: " << sessions->size() << "\n\n";
}

void test_chat_room() {
    std::cout << "=== Chat Room Broadcast ===\n";

    auto room = LiveSet<Inbox>::create();
    constexpr int num_clients = 4;
    constexpr int messages_per_client = 3;

    std::atomic<bool> start_flag{false};
    std::atomic<int> connected{0};
    std::vector<std::thread> clients;

    for (int c = 0; c < num_clients; ++c) {
        clients.emplace_back([&, c]() {
            ItemOwner<Inbox> me = room->emplace("client-" + std::to_string(c));
            connected.fetch_add(1);

            while (!start_flag.load()) {
                std::this_thread::yield();
            }

            for (int m = 0; m < messages_per_client; ++m) {
                std::string message = me->name() + " says " + std::to_string(m);

                // Everyone but the sender
                auto guard = room->lock();
                for (const auto& peer : guard.others(me)) {
                    peer.deliver(message);
                }
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(10 * (c + 1)));
            std::cout << me->name() << " received " << me->received()
                      << " messages and disconnects\n";
            // Leaving scope disconnects the client
        });
    }

    while (connected.load() < num_clients) {
        std::this_thread::yield();
    }
    std::cout << "Connected clients: " << room->size() << "\n";
    start_flag.store(true);

    for (auto& client : clients) {
        client.join();
    }

    std::cout << "Clients after everyone left: " << room->size() << "\n\n";
}

void test_observer_registry() {
    std::cout << "=== Observer Registry ===\n";

    using Callback = std::function<void(int)>;
    auto observers = LiveSet<Callback>::create();

    int total = 0;
    auto first = observers->insert([&total](int event) { total += event; });
    auto second = observers->insert([&total](int event) { total += 10 * event; });

    auto notify = [&observers](int event) {
        for (const auto& item : observers->snapshot()) {
            item.second(event);
        }
    };

    notify(1);
    std::cout << "After first event with two observers, total: " << total << "\n";

    second.release();
    notify(2);
    std::cout << "After second event with one observer, total: " << total << "\n\n";
}

int main() {
    std::cout << "LiveSet Example\n";
    std::cout << "===============\n\n";

    test_basic_membership();
    test_shared_subscriptions();
    test_chat_room();
    test_observer_registry();

    std::cout << "All LiveSet examples completed!\n";
    std::cout << "\nNote: membership in a LiveSet follows the lifetime of the owner\n";
    std::cout << "returned by insert, so participants never need to deregister.\n";

    return 0;
}
