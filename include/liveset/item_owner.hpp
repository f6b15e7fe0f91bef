#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include "liveset/identity.hpp"

namespace liveset {

template<typename T> class LiveSet;
template<typename T> class ItemOwner;
template<typename T> class SharedItemOwner;

namespace detail {

/**
 * @brief Storage cell for one inserted value.
 *
 * Entries are heap-allocated by the store and never move, so owners can keep
 * a plain pointer to them and read the value without taking the store lock.
 * The owner count is only meaningful for shared owners; unique owners leave
 * it at 1.
 */
template<typename T>
struct Entry {
    T value;                            ///< The stored value
    std::atomic<size_t> owners;         ///< Outstanding owners of this entry

    template<typename... Args>
    explicit Entry(std::in_place_t, Args&&... args)
        : Entry(std::is_constructible<T, Args&&...>{}, std::forward<Args>(args)...) {}

private:
    template<typename... Args>
    Entry(std::true_type, Args&&... args)
        : value(std::forward<Args>(args)...), owners(1) {}

    // Aggregates built from their members
    template<typename... Args>
    Entry(std::false_type, Args&&... args)
        : value{std::forward<Args>(args)...}, owners(1) {}
};

/**
 * @brief Entry of a non-empty owner, or std::logic_error for an empty one.
 */
template<typename T>
const Entry<T>& checked_entry(const Entry<T>* entry) {
    if (!entry) {
        throw std::logic_error("liveset: value accessed through an empty owner");
    }
    return *entry;
}

/**
 * @brief Gateway to a store's removal path.
 *
 * Removal is not part of LiveSet's public interface: only owners (and tests
 * that need to simulate racing releases) go through here.
 */
struct StoreAccess {
    template<typename T>
    static bool remove(LiveSet<T>& set, Identity id) {
        return set.remove(id);
    }

    template<typename T>
    static std::unique_ptr<Entry<T>> extract(LiveSet<T>& set, Identity id) {
        return set.extract(id);
    }
};

} // namespace detail

/**
 * @brief Unique owner of one entry in a LiveSet.
 *
 * The entry stays in the set for exactly as long as this owner holds it. The
 * owner can be moved (including to another thread) but not copied, and the
 * entry is removed the moment the owner is destroyed, released, or
 * overwritten by assignment.
 *
 * The owner keeps its store alive through a shared reference, so it may
 * safely outlive every other reference to the store.
 *
 * Usage Example:
 * @code
 * auto listeners = liveset::LiveSet<std::string>::create();
 * {
 *     liveset::ItemOwner<std::string> owner = listeners->insert("audio");
 *     assert(listeners->size() == 1);
 *     std::cout << *owner << std::endl;
 * }
 * assert(listeners->empty());  // removed when the owner went out of scope
 * @endcode
 *
 * @tparam T Type of the stored value
 *
 * @note A moved-from or released owner is empty. Accessing the value of an
 *       empty owner throws std::logic_error; check it with operator bool when
 *       in doubt.
 * @note Like std::unique_ptr, move assignment is noexcept: if releasing the
 *       overwritten entry fails (a std::system_error from the store lock, or a
 *       throwing destructor of T), std::terminate is called.
 */
template<typename T>
class ItemOwner {
public:
    using value_type = T;

    /**
     * @brief Construct an empty owner that holds no membership.
     */
    ItemOwner() noexcept = default;

    /**
     * @brief Destructor. Removes the owned entry from its set.
     *
     * @thread_safety Safe - may run on any thread
     */
    ~ItemOwner();

    ItemOwner(const ItemOwner&) = delete;
    ItemOwner& operator=(const ItemOwner&) = delete;

    /**
     * @brief Transfer ownership. The source is left empty.
     */
    ItemOwner(ItemOwner&& other) noexcept;

    /**
     * @brief Transfer ownership, releasing the entry currently held first.
     */
    ItemOwner& operator=(ItemOwner&& other) noexcept;

    /**
     * @brief Access the stored value.
     *
     * @return Reference to the value, valid while this owner holds it
     * @throws std::logic_error if the owner is empty
     * @thread_safety Safe - the value is immutable while it is a member
     */
    const T& get() const { return detail::checked_entry(entry_).value; }
    const T& operator*() const { return get(); }
    const T* operator->() const { return &get(); }

    /**
     * @brief Identity of the owned entry, or the invalid identity if empty.
     */
    Identity identity() const noexcept { return id_; }

    /**
     * @brief Whether this owner still holds membership.
     */
    explicit operator bool() const noexcept { return entry_ != nullptr; }

    /**
     * @brief Whether this owner holds an entry of the given set.
     */
    bool owner_of(const LiveSet<T>& set) const noexcept { return entry_ != nullptr && set_.get() == &set; }

    /**
     * @brief Remove the entry now instead of at destruction.
     *
     * @return true if this call removed the entry, false if the owner was empty
     * @complexity O(1) average
     * @thread_safety Safe
     *
     * @note The owner is empty afterwards; calling again returns false.
     */
    bool release();

    /**
     * @brief Remove the entry and hand the value back to the caller.
     *
     * @return The stored value, moved out of the set
     * @throws std::logic_error if the owner is empty
     * @thread_safety Safe
     * @exception_safety Strong guarantee for the empty-owner case
     */
    T take();

    /**
     * @brief Convert into a shared owner of the same entry.
     *
     * The entry stays a member throughout; it is not removed and reinserted.
     *
     * @return Shared owner holding the entry (empty if this owner was empty)
     */
    SharedItemOwner<T> share() &&;

    void swap(ItemOwner& other) noexcept;

private:
    friend class LiveSet<T>;

    ItemOwner(std::shared_ptr<LiveSet<T>> set, Identity id, detail::Entry<T>* entry) noexcept
        : set_(std::move(set)), id_(id), entry_(entry) {}

    std::shared_ptr<LiveSet<T>> set_;   ///< Back-reference keeping the store alive
    Identity id_;                       ///< Identity of the owned entry
    detail::Entry<T>* entry_ = nullptr; ///< Owned entry, null when empty
};

/**
 * @brief Reference-counted owner of one entry in a LiveSet.
 *
 * Copies of a shared owner all refer to the same entry. The entry stays in
 * the set while at least one copy is alive and is removed when the last one
 * is released, whichever thread that happens on.
 *
 * Copying and releasing touch only the entry's atomic owner count. The
 * store lock is taken once, by the release that brings the count to zero.
 *
 * Usage Example:
 * @code
 * auto peers = liveset::LiveSet<int>::create();
 * liveset::SharedItemOwner<int> first = peers->insert_shared(7);
 * liveset::SharedItemOwner<int> second = first;   // same entry
 *
 * first.release();
 * assert(peers->size() == 1);                     // second still holds it
 * second.release();
 * assert(peers->empty());
 * @endcode
 *
 * @tparam T Type of the stored value
 *
 * @note Assignment is noexcept and releases the overwritten share; a failure
 *       while removing the last share terminates, as with ItemOwner.
 */
template<typename T>
class SharedItemOwner {
public:
    using value_type = T;

    SharedItemOwner() noexcept = default;
    ~SharedItemOwner();

    /**
     * @brief Add another owner of the same entry.
     *
     * @complexity O(1)
     * @thread_safety Safe - concurrent copies and releases of sibling owners are fine
     * @exception_safety No-throw guarantee
     */
    SharedItemOwner(const SharedItemOwner& other) noexcept;
    SharedItemOwner& operator=(const SharedItemOwner& other) noexcept;

    SharedItemOwner(SharedItemOwner&& other) noexcept;
    SharedItemOwner& operator=(SharedItemOwner&& other) noexcept;

    /**
     * @throws std::logic_error if the owner is empty
     */
    const T& get() const { return detail::checked_entry(entry_).value; }
    const T& operator*() const { return get(); }
    const T* operator->() const { return &get(); }

    Identity identity() const noexcept { return id_; }

    explicit operator bool() const noexcept { return entry_ != nullptr; }

    bool owner_of(const LiveSet<T>& set) const noexcept { return entry_ != nullptr && set_.get() == &set; }

    /**
     * @brief Number of live owners of this entry, 0 if empty.
     *
     * @note Result may be immediately outdated in concurrent environment.
     */
    size_t use_count() const noexcept;

    /**
     * @brief Drop this owner's share of the entry.
     *
     * @return true if this was the last owner and the entry was removed
     * @thread_safety Safe
     *
     * @note The owner is empty afterwards.
     */
    bool release();

    void swap(SharedItemOwner& other) noexcept;

private:
    friend class LiveSet<T>;
    friend class ItemOwner<T>;

    SharedItemOwner(std::shared_ptr<LiveSet<T>> set, Identity id, detail::Entry<T>* entry) noexcept
        : set_(std::move(set)), id_(id), entry_(entry) {}

    std::shared_ptr<LiveSet<T>> set_;
    Identity id_;
    detail::Entry<T>* entry_ = nullptr;
};

// ItemOwner implementation

template<typename T>
ItemOwner<T>::~ItemOwner() {
    release();
}

template<typename T>
ItemOwner<T>::ItemOwner(ItemOwner&& other) noexcept
    : set_(std::move(other.set_)), id_(other.id_), entry_(other.entry_) {
    other.id_ = Identity();
    other.entry_ = nullptr;
}

template<typename T>
ItemOwner<T>& ItemOwner<T>::operator=(ItemOwner&& other) noexcept {
    if (this != &other) {
        release();
        set_ = std::move(other.set_);
        id_ = other.id_;
        entry_ = other.entry_;
        other.id_ = Identity();
        other.entry_ = nullptr;
    }
    return *this;
}

template<typename T>
bool ItemOwner<T>::release() {
    if (!entry_) {
        return false;
    }

    // Keep the store alive until removal completes; this may be the last reference.
    std::shared_ptr<LiveSet<T>> set = std::move(set_);
    Identity id = id_;
    id_ = Identity();
    entry_ = nullptr;

    return detail::StoreAccess::remove(*set, id);
}

template<typename T>
T ItemOwner<T>::take() {
    if (!entry_) {
        throw std::logic_error("liveset::ItemOwner::take() called on an empty owner");
    }

    std::shared_ptr<LiveSet<T>> set = std::move(set_);
    Identity id = id_;
    id_ = Identity();
    entry_ = nullptr;

    std::unique_ptr<detail::Entry<T>> entry = detail::StoreAccess::extract(*set, id);
    if (!entry) {
        throw std::logic_error("liveset::ItemOwner::take() found no entry for its identity");
    }
    return std::move(entry->value);
}

template<typename T>
SharedItemOwner<T> ItemOwner<T>::share() && {
    // A unique owner's entry already carries an owner count of 1.
    SharedItemOwner<T> shared(std::move(set_), id_, entry_);
    id_ = Identity();
    entry_ = nullptr;
    return shared;
}

template<typename T>
void ItemOwner<T>::swap(ItemOwner& other) noexcept {
    using std::swap;
    swap(set_, other.set_);
    swap(id_, other.id_);
    swap(entry_, other.entry_);
}

template<typename T>
void swap(ItemOwner<T>& a, ItemOwner<T>& b) noexcept {
    a.swap(b);
}

// SharedItemOwner implementation

template<typename T>
SharedItemOwner<T>::~SharedItemOwner() {
    release();
}

template<typename T>
SharedItemOwner<T>::SharedItemOwner(const SharedItemOwner& other) noexcept
    : set_(other.set_), id_(other.id_), entry_(other.entry_) {
    if (entry_) {
        // The source owner keeps the count above zero for the duration of the copy.
        entry_->owners.fetch_add(1, std::memory_order_relaxed);
    }
}

template<typename T>
SharedItemOwner<T>& SharedItemOwner<T>::operator=(const SharedItemOwner& other) noexcept {
    SharedItemOwner(other).swap(*this);
    return *this;
}

template<typename T>
SharedItemOwner<T>::SharedItemOwner(SharedItemOwner&& other) noexcept
    : set_(std::move(other.set_)), id_(other.id_), entry_(other.entry_) {
    other.id_ = Identity();
    other.entry_ = nullptr;
}

template<typename T>
SharedItemOwner<T>& SharedItemOwner<T>::operator=(SharedItemOwner&& other) noexcept {
    SharedItemOwner(std::move(other)).swap(*this);
    return *this;
}

template<typename T>
size_t SharedItemOwner<T>::use_count() const noexcept {
    return entry_ ? entry_->owners.load(std::memory_order_relaxed) : 0;
}

template<typename T>
bool SharedItemOwner<T>::release() {
    if (!entry_) {
        return false;
    }

    std::shared_ptr<LiveSet<T>> set = std::move(set_);
    detail::Entry<T>* entry = entry_;
    Identity id = id_;
    id_ = Identity();
    entry_ = nullptr;

    // Exactly one release observes the 1 -> 0 transition.
    if (entry->owners.fetch_sub(1, std::memory_order_acq_rel) != 1) {
        return false;
    }
    return detail::StoreAccess::remove(*set, id);
}

template<typename T>
void SharedItemOwner<T>::swap(SharedItemOwner& other) noexcept {
    using std::swap;
    swap(set_, other.set_);
    swap(id_, other.id_);
    swap(entry_, other.entry_);
}

template<typename T>
void swap(SharedItemOwner<T>& a, SharedItemOwner<T>& b) noexcept {
    a.swap(b);
}

} // namespace liveset
