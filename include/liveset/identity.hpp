#pragma once

#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <limits>
#include <ostream>

namespace liveset {

/**
 * @brief Opaque token addressing one entry of a LiveSet.
 *
 * Identities are handed out by an IdentityGenerator at insertion time and are
 * used only to find an entry again when its owners go away. They say nothing
 * about the stored value: two entries holding equal values still have
 * different identities.
 *
 * The default-constructed identity is invalid and is what empty (moved-from
 * or released) owners report.
 *
 * Usage Example:
 * @code
 * auto set = liveset::LiveSet<std::string>::create();
 * auto owner = set->insert("client-1");
 *
 * liveset::Identity id = owner.identity();
 * assert(id.valid());
 * assert(set->contains(id));
 * @endcode
 */
class Identity {
public:
    using value_type = std::uint64_t;

    /**
     * @brief Construct the invalid identity.
     */
    constexpr Identity() noexcept : value_(0) {}

    /**
     * @brief Wrap a raw token.
     * @param value Raw token, 0 means invalid
     */
    constexpr explicit Identity(value_type value) noexcept : value_(value) {}

    /**
     * @brief Raw token value.
     */
    constexpr value_type value() const noexcept { return value_; }

    /**
     * @brief Whether this identity was issued by a generator.
     */
    constexpr bool valid() const noexcept { return value_ != 0; }

    constexpr explicit operator bool() const noexcept { return valid(); }

    friend constexpr bool operator==(Identity a, Identity b) noexcept { return a.value_ == b.value_; }
    friend constexpr bool operator!=(Identity a, Identity b) noexcept { return a.value_ != b.value_; }
    friend constexpr bool operator<(Identity a, Identity b) noexcept { return a.value_ < b.value_; }

    friend std::ostream& operator<<(std::ostream& os, Identity id) {
        return os << '#' << id.value_;
    }

private:
    value_type value_;
};

/**
 * @brief Thread-safe source of fresh identities.
 *
 * A monotonically increasing 64-bit counter. Identities are never reused for
 * the lifetime of the generator, so a stale identity can never address an
 * entry inserted later.
 *
 * @note Running out of the 64-bit space terminates the process. At one
 *       identity per nanosecond that takes several centuries.
 */
class IdentityGenerator {
public:
    IdentityGenerator() : next_(1) {}

    IdentityGenerator(const IdentityGenerator&) = delete;
    IdentityGenerator& operator=(const IdentityGenerator&) = delete;

    /**
     * @brief Issue a fresh identity.
     *
     * @return An identity distinct from every identity issued before
     * @complexity O(1)
     * @thread_safety Safe
     * @exception_safety No-throw guarantee
     */
    Identity next() noexcept;

    /**
     * @brief Number of identities issued so far.
     *
     * @thread_safety Safe, result may be immediately outdated
     */
    Identity::value_type issued() const noexcept;

private:
    std::atomic<Identity::value_type> next_;
};

inline Identity IdentityGenerator::next() noexcept {
    Identity::value_type value = next_.fetch_add(1, std::memory_order_relaxed);
    if (value == std::numeric_limits<Identity::value_type>::max()) {
        std::terminate();
    }
    return Identity(value);
}

inline Identity::value_type IdentityGenerator::issued() const noexcept {
    return next_.load(std::memory_order_relaxed) - 1;
}

} // namespace liveset

namespace std {
    template<>
    struct hash<liveset::Identity> {
        size_t operator()(liveset::Identity id) const noexcept {
            return std::hash<liveset::Identity::value_type>{}(id.value());
        }
    };
}
