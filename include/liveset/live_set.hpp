#pragma once

#include <atomic>
#include <cstddef>
#include <iterator>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "liveset/identity.hpp"
#include "liveset/item_owner.hpp"

namespace liveset {

/**
 * @brief A thread-safe set whose membership follows the lifetime of owner handles.
 *
 * Values are never removed by value or by explicit call. Inserting returns an
 * owner (ItemOwner, or SharedItemOwner for reference-counted ownership), and
 * the value stays in the set exactly as long as that owner, or any copy of a
 * shared owner, is alive. When the last owner goes away the value is removed
 * and destroyed on the releasing thread.
 *
 * The intended use is tracking ephemeral participants such as subscribers,
 * connected clients or registered observers without requiring them to
 * deregister themselves.
 *
 * @tparam T The type of stored values. Needs neither hashing nor comparison:
 *           entries are keyed by an Identity assigned at insertion.
 *
 * Key Features:
 * - Ownership-driven: membership ends when the last owner is released
 * - Thread-safe: insert, release, and traversal from any thread
 * - Unique and shared owners: move-only or reference-counted handles
 * - Snapshots: point-in-time copies that never block removals
 * - Read guards: in-place traversal under a shared lock
 *
 * Performance Characteristics:
 * - Insert: O(1) average, takes the store lock exclusively
 * - Release: O(1) average, takes the store lock exclusively once per entry
 * - Shared owner copy: O(1), a single atomic increment, no store lock
 * - Size: O(1), lock-free
 * - Snapshot: O(n) under the shared lock
 *
 * Memory Management:
 * - Each value lives in its own heap cell, so references stay valid while the
 *   value is a member
 * - Owners hold the store through std::shared_ptr; the store never refers
 *   back to owners
 * - Values are destroyed outside the store lock
 *
 * Usage Example:
 * @code
 * auto subscribers = liveset::LiveSet<std::string>::create();
 *
 * auto alice = subscribers->insert("alice");
 * auto bob = subscribers->insert_shared("bob");
 * auto bob_again = bob;
 *
 * subscribers->for_each([](liveset::Identity id, const std::string& name) {
 *     std::cout << id << " " << name << std::endl;
 * });
 *
 * alice.release();                 // alice leaves immediately
 * bob.release();                   // bob stays, bob_again still owns him
 * assert(subscribers->size() == 1);
 * @endcode
 *
 * @note Stores must be created with create(): owners keep a shared reference
 *       to their store.
 */
template<typename T>
class LiveSet : public std::enable_shared_from_this<LiveSet<T>> {
private:
    using Entry = detail::Entry<T>;
    using Map = std::unordered_map<Identity, std::unique_ptr<Entry>>;

    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    using value_type = T;
    using owner_type = ItemOwner<T>;
    using shared_owner_type = SharedItemOwner<T>;

    static constexpr size_t INITIAL_BUCKET_COUNT = 64;

    /**
     * @brief Create an empty set with the default bucket count.
     *
     * @return Shared reference to the new set
     * @thread_safety Safe
     */
    static std::shared_ptr<LiveSet> create();

    /**
     * @brief Create an empty set sized for an expected population.
     *
     * @param initial_bucket_count Bucket count hint for the identity table
     * @return Shared reference to the new set
     * @thread_safety Safe
     */
    static std::shared_ptr<LiveSet> create(size_t initial_bucket_count);

    /**
     * @brief Constructor reserved for create().
     */
    LiveSet(PrivateTag, size_t initial_bucket_count);

    /**
     * @brief Destructor.
     *
     * Runs once the last owner and the last outside reference are gone, at
     * which point no entries remain.
     */
    ~LiveSet() = default;

    LiveSet(const LiveSet&) = delete;
    LiveSet& operator=(const LiveSet&) = delete;
    LiveSet(LiveSet&&) = delete;
    LiveSet& operator=(LiveSet&&) = delete;

    /**
     * @brief Insert a value and return its unique owner.
     *
     * @param value The value to copy into the set
     * @return Owner whose lifetime controls the value's membership
     * @complexity O(1) average
     * @thread_safety Safe
     * @exception_safety Strong guarantee - if allocation or T's copy
     *                  constructor throws, the set is unchanged
     */
    ItemOwner<T> insert(const T& value);

    /**
     * @brief Insert a value by moving and return its unique owner.
     *
     * @param value The value to move into the set
     * @return Owner whose lifetime controls the value's membership
     * @complexity O(1) average
     * @thread_safety Safe
     * @exception_safety Strong guarantee
     */
    ItemOwner<T> insert(T&& value);

    /**
     * @brief Construct a value in place and return its unique owner.
     *
     * @tparam Args Types of arguments for T's constructor
     * @param args Arguments to forward to T's constructor, or to brace-initialize
     *             T's members when T is an aggregate
     * @return Owner whose lifetime controls the value's membership
     * @complexity O(1) average
     * @thread_safety Safe
     * @exception_safety Strong guarantee
     */
    template<typename... Args>
    ItemOwner<T> emplace(Args&&... args);

    /**
     * @brief Insert a value and return a reference-counted owner.
     *
     * @param value The value to copy into the set
     * @return Shared owner; the value stays while any copy of it is alive
     * @complexity O(1) average
     * @thread_safety Safe
     * @exception_safety Strong guarantee
     */
    SharedItemOwner<T> insert_shared(const T& value);
    SharedItemOwner<T> insert_shared(T&& value);

    template<typename... Args>
    SharedItemOwner<T> emplace_shared(Args&&... args);

    /**
     * @brief Get the current number of live entries.
     *
     * @return Number of entries at the moment of the call
     * @complexity O(1)
     * @thread_safety Safe
     * @exception_safety No-throw guarantee
     *
     * @note Result may be immediately outdated in concurrent environment.
     */
    size_t size() const noexcept;

    /**
     * @brief Check if the set has no live entries.
     *
     * @note Result may be immediately outdated in concurrent environment.
     */
    bool empty() const noexcept;

    /**
     * @brief Check whether an identity is currently live.
     *
     * @param id Identity to look up
     * @return true if an entry with this identity is a member
     * @complexity O(1) average
     * @thread_safety Safe
     */
    bool contains(Identity id) const;

    /**
     * @brief Copy out every live entry at one point in time.
     *
     * The copy is taken under the shared lock; traversing the result never
     * blocks concurrent inserts or releases. Each identity appears once.
     *
     * @return Vector of (identity, value) pairs in unspecified order
     * @complexity O(n)
     * @thread_safety Safe
     * @exception_safety Strong guarantee
     *
     * @note Requires T to be copy-constructible. For move-only values use
     *       lock() or for_each().
     */
    std::vector<std::pair<Identity, T>> snapshot() const;

    /**
     * @brief Identities of every live entry at one point in time.
     *
     * @return Vector of identities in unspecified order
     * @complexity O(n)
     * @thread_safety Safe
     */
    std::vector<Identity> identities() const;

    class ReadGuard;

    /**
     * @brief Lock the set for in-place iteration.
     *
     * References obtained through the guard stay valid for the guard's
     * lifetime. Inserts and releases on other threads wait until the guard is
     * destroyed, so keep guards short-lived.
     *
     * @return Guard holding the set's shared lock
     * @thread_safety Safe
     *
     * @warning While a thread holds the guard it must not call any other
     *          locking member of the same set: releasing or inserting
     *          deadlocks, and contains(), snapshot(), identities(), count_if(),
     *          for_each() or a second lock() re-acquire the shared lock, which
     *          is undefined behavior. size() and empty() are lock-free and safe.
     */
    ReadGuard lock() const;

    /**
     * @brief Visit every live entry under a scoped read guard.
     *
     * @tparam Func Callable as func(Identity, const T&)
     * @param func Visitor
     * @complexity O(n)
     * @thread_safety Safe
     *
     * @warning The visitor runs under the shared lock. It must not release
     *          owners of this set, insert into it, or call its other locking
     *          members (contains(), snapshot(), identities(), count_if(),
     *          for_each(), lock()). size() and empty() are safe.
     */
    template<typename Func>
    void for_each(Func&& func) const;

    /**
     * @brief Count live values matching a predicate.
     *
     * @tparam Predicate Function object type for testing values
     * @param pred Predicate called as pred(const T&)
     * @return Number of live values for which pred returns true
     * @complexity O(n)
     * @thread_safety Safe
     * @exception_safety Depends on predicate's exception safety
     */
    template<typename Predicate>
    size_t count_if(Predicate pred) const;

    /**
     * @brief RAII read lock over a LiveSet, unlocked when destroyed.
     *
     * Iteration yields references to live values in unspecified order.
     */
    class ReadGuard {
    public:
        /**
         * @brief Forward iterator over the values visible through a guard.
         *
         * Optionally skips one identity, which is how others() excludes the
         * caller's own entry.
         */
        class iterator {
        public:
            using iterator_category = std::forward_iterator_tag;
            using value_type = T;
            using difference_type = std::ptrdiff_t;
            using pointer = const T*;
            using reference = const T&;

            iterator() = default;

            const T& operator*() const { return current_->second->value; }
            const T* operator->() const { return &current_->second->value; }

            /**
             * @brief Identity of the entry the iterator points at.
             */
            Identity identity() const { return current_->first; }

            iterator& operator++();
            iterator operator++(int);

            bool operator==(const iterator& other) const { return current_ == other.current_; }
            bool operator!=(const iterator& other) const { return current_ != other.current_; }

        private:
            friend class ReadGuard;

            iterator(typename Map::const_iterator current, typename Map::const_iterator end, Identity except);

            void skip_excluded();

            typename Map::const_iterator current_{};
            typename Map::const_iterator end_{};
            Identity except_;                   ///< Identity to skip, invalid for none
        };

        /**
         * @brief Iterable range produced by others().
         */
        class Range {
        public:
            iterator begin() const { return first_; }
            iterator end() const { return last_; }

        private:
            friend class ReadGuard;
            Range(iterator first, iterator last) : first_(first), last_(last) {}

            iterator first_;
            iterator last_;
        };

        ReadGuard(ReadGuard&&) noexcept = default;
        ReadGuard& operator=(ReadGuard&&) = delete;
        ReadGuard(const ReadGuard&) = delete;
        ReadGuard& operator=(const ReadGuard&) = delete;

        iterator begin() const;
        iterator end() const;

        /**
         * @brief Number of entries visible through this guard.
         *
         * Exact while the guard is held.
         */
        size_t size() const { return set_->entries_.size(); }

        /**
         * @brief Iterate every value except the one held by the given owner.
         *
         * If the owner is empty or belongs to another set, every value is
         * yielded.
         *
         * @param except Owner whose entry should be skipped
         * @return Range over the remaining values
         */
        Range others(const ItemOwner<T>& except) const;
        Range others(const SharedItemOwner<T>& except) const;

    private:
        friend class LiveSet;

        explicit ReadGuard(std::shared_ptr<const LiveSet> set);

        Range excluding(Identity id) const;

        std::shared_ptr<const LiveSet> set_;        ///< Keeps the set alive while locked
        std::shared_lock<std::shared_mutex> lock_;
    };

private:
    friend struct detail::StoreAccess;

    /**
     * @brief Allocate an entry, assign it an identity and publish it.
     */
    template<typename... Args>
    std::pair<Identity, Entry*> store(Args&&... args);

    /**
     * @brief Remove an entry if present.
     *
     * Only reachable from owners' release paths. The entry is destroyed after
     * the lock is dropped, so value destructors never run under the lock.
     *
     * @return true if the entry was removed, false if it was already absent
     */
    bool remove(Identity id);

    /**
     * @brief Unlink an entry and hand it to the caller, or null if absent.
     */
    std::unique_ptr<Entry> extract(Identity id);

    mutable std::shared_mutex mutex_;   ///< Guards entries_
    Map entries_;                       ///< Live entries keyed by identity
    std::atomic<size_t> size_;          ///< Mirror of entries_.size() for lock-free reads
    IdentityGenerator generator_;       ///< Source of fresh identities
};

template<typename T>
std::shared_ptr<LiveSet<T>> LiveSet<T>::create() {
    return create(INITIAL_BUCKET_COUNT);
}

template<typename T>
std::shared_ptr<LiveSet<T>> LiveSet<T>::create(size_t initial_bucket_count) {
    return std::make_shared<LiveSet>(PrivateTag{}, initial_bucket_count);
}

template<typename T>
LiveSet<T>::LiveSet(PrivateTag, size_t initial_bucket_count)
    : entries_(initial_bucket_count), size_(0) {}

template<typename T>
template<typename... Args>
std::pair<Identity, typename LiveSet<T>::Entry*> LiveSet<T>::store(Args&&... args) {
    // Build the value before locking; T's constructor may be arbitrary user code.
    auto entry = std::make_unique<Entry>(std::in_place, std::forward<Args>(args)...);
    Entry* raw = entry.get();
    Identity id = generator_.next();

    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_.emplace(id, std::move(entry));
    size_.fetch_add(1, std::memory_order_relaxed);
    return {id, raw};
}

template<typename T>
ItemOwner<T> LiveSet<T>::insert(const T& value) {
    return emplace(value);
}

template<typename T>
ItemOwner<T> LiveSet<T>::insert(T&& value) {
    return emplace(std::move(value));
}

template<typename T>
template<typename... Args>
ItemOwner<T> LiveSet<T>::emplace(Args&&... args) {
    auto stored = store(std::forward<Args>(args)...);
    return ItemOwner<T>(this->shared_from_this(), stored.first, stored.second);
}

template<typename T>
SharedItemOwner<T> LiveSet<T>::insert_shared(const T& value) {
    return emplace_shared(value);
}

template<typename T>
SharedItemOwner<T> LiveSet<T>::insert_shared(T&& value) {
    return emplace_shared(std::move(value));
}

template<typename T>
template<typename... Args>
SharedItemOwner<T> LiveSet<T>::emplace_shared(Args&&... args) {
    auto stored = store(std::forward<Args>(args)...);
    return SharedItemOwner<T>(this->shared_from_this(), stored.first, stored.second);
}

template<typename T>
std::unique_ptr<typename LiveSet<T>::Entry> LiveSet<T>::extract(Identity id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return nullptr;
    }

    std::unique_ptr<Entry> entry = std::move(it->second);
    entries_.erase(it);
    size_.fetch_sub(1, std::memory_order_relaxed);
    return entry;
}

template<typename T>
bool LiveSet<T>::remove(Identity id) {
    std::unique_ptr<Entry> doomed = extract(id);
    return doomed != nullptr;
}

template<typename T>
size_t LiveSet<T>::size() const noexcept {
    return size_.load(std::memory_order_relaxed);
}

template<typename T>
bool LiveSet<T>::empty() const noexcept {
    return size() == 0;
}

template<typename T>
bool LiveSet<T>::contains(Identity id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.find(id) != entries_.end();
}

template<typename T>
std::vector<std::pair<Identity, T>> LiveSet<T>::snapshot() const {
    static_assert(std::is_copy_constructible<T>::value,
                  "LiveSet::snapshot() copies values; use lock() or for_each() for move-only types");

    std::vector<std::pair<Identity, T>> result;
    std::shared_lock<std::shared_mutex> lock(mutex_);
    result.reserve(entries_.size());
    for (const auto& item : entries_) {
        result.emplace_back(item.first, item.second->value);
    }
    return result;
}

template<typename T>
std::vector<Identity> LiveSet<T>::identities() const {
    std::vector<Identity> result;
    std::shared_lock<std::shared_mutex> lock(mutex_);
    result.reserve(entries_.size());
    for (const auto& item : entries_) {
        result.push_back(item.first);
    }
    return result;
}

template<typename T>
typename LiveSet<T>::ReadGuard LiveSet<T>::lock() const {
    return ReadGuard(this->shared_from_this());
}

template<typename T>
template<typename Func>
void LiveSet<T>::for_each(Func&& func) const {
    ReadGuard guard = lock();
    for (auto it = guard.begin(); it != guard.end(); ++it) {
        func(it.identity(), *it);
    }
}

template<typename T>
template<typename Predicate>
size_t LiveSet<T>::count_if(Predicate pred) const {
    size_t count = 0;
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& item : entries_) {
        if (pred(item.second->value)) {
            ++count;
        }
    }
    return count;
}

// ReadGuard implementation

template<typename T>
LiveSet<T>::ReadGuard::ReadGuard(std::shared_ptr<const LiveSet> set)
    : set_(std::move(set)), lock_(set_->mutex_) {}

template<typename T>
typename LiveSet<T>::ReadGuard::iterator LiveSet<T>::ReadGuard::begin() const {
    return iterator(set_->entries_.begin(), set_->entries_.end(), Identity());
}

template<typename T>
typename LiveSet<T>::ReadGuard::iterator LiveSet<T>::ReadGuard::end() const {
    return iterator(set_->entries_.end(), set_->entries_.end(), Identity());
}

template<typename T>
typename LiveSet<T>::ReadGuard::Range LiveSet<T>::ReadGuard::excluding(Identity id) const {
    return Range(iterator(set_->entries_.begin(), set_->entries_.end(), id), end());
}

template<typename T>
typename LiveSet<T>::ReadGuard::Range LiveSet<T>::ReadGuard::others(const ItemOwner<T>& except) const {
    return excluding(except.owner_of(*set_) ? except.identity() : Identity());
}

template<typename T>
typename LiveSet<T>::ReadGuard::Range LiveSet<T>::ReadGuard::others(const SharedItemOwner<T>& except) const {
    return excluding(except.owner_of(*set_) ? except.identity() : Identity());
}

// Iterator implementation

template<typename T>
LiveSet<T>::ReadGuard::iterator::iterator(typename Map::const_iterator current,
                                          typename Map::const_iterator end,
                                          Identity except)
    : current_(current), end_(end), except_(except) {
    skip_excluded();
}

template<typename T>
void LiveSet<T>::ReadGuard::iterator::skip_excluded() {
    if (!except_.valid()) {
        return;
    }
    while (current_ != end_ && current_->first == except_) {
        ++current_;
    }
}

template<typename T>
typename LiveSet<T>::ReadGuard::iterator& LiveSet<T>::ReadGuard::iterator::operator++() {
    ++current_;
    skip_excluded();
    return *this;
}

template<typename T>
typename LiveSet<T>::ReadGuard::iterator LiveSet<T>::ReadGuard::iterator::operator++(int) {
    iterator tmp = *this;
    ++(*this);
    return tmp;
}

} // namespace liveset
