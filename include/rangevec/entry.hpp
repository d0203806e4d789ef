#pragma once

/** \file entry.hpp
 *  \brief Half-open index ranges and the ranged entries stored in a RangeIndex.
 */

#include <cstddef>
#include <type_traits>
#include <utility>

namespace rangevec {

/**
 * \brief Half-open range [start, start + size) of container indices.
 *
 * Only start and size are stored; end() is always derived.
 */
struct Range {
    std::size_t start{0};
    std::size_t size{0};

    [[nodiscard]] constexpr auto end() const noexcept -> std::size_t { return start + size; }
    [[nodiscard]] constexpr auto empty() const noexcept -> bool { return size == 0; }

    [[nodiscard]] constexpr auto contains(std::size_t index) const noexcept -> bool {
        return index >= start && index - start < size;
    }

    /** \brief True if the two ranges share at least one index. */
    [[nodiscard]] constexpr auto overlaps(const Range& other) const noexcept -> bool {
        if (empty() || other.empty()) return false;
        return start < other.end() && other.start < end();
    }

    friend constexpr bool operator==(const Range&, const Range&) = default;
};

/**
 * \brief A payload together with the range of indices it occupies.
 *
 * Entries handed out by a RangeIndex are const; the range of a resident entry
 * can only change through remove() followed by insert().
 */
template<typename T>
struct Entry {
    T value;
    std::size_t start{0};
    std::size_t size{0};

    [[nodiscard]] constexpr auto end() const noexcept -> std::size_t { return start + size; }
    [[nodiscard]] constexpr auto range() const noexcept -> Range { return Range{start, size}; }
    [[nodiscard]] constexpr auto contains(std::size_t index) const noexcept -> bool {
        return range().contains(index);
    }

    friend bool operator==(const Entry&, const Entry&) = default;
};

/** \brief Pair a payload with its (start, size) placement. */
template<typename T>
[[nodiscard]] auto make_entry(T value, std::size_t start, std::size_t size) -> Entry<std::decay_t<T>> {
    return Entry<std::decay_t<T>>{std::move(value), start, size};
}

/**
 * \brief Read-only listing element produced by RangeIndex::get_range().
 *
 * value is nullptr for an unoccupied index; such slots always have size 1.
 */
template<typename T>
struct Slot {
    const T* value{nullptr};
    std::size_t start{0};
    std::size_t size{0};

    [[nodiscard]] auto is_gap() const noexcept -> bool { return value == nullptr; }
    [[nodiscard]] auto end() const noexcept -> std::size_t { return start + size; }
};

/**
 * \brief Detects payloads that know their own placement.
 *
 * A type qualifies when `std::declval<const T&>().placement()` yields
 * something convertible to Range.
 */
template<typename T, typename = void>
struct is_self_placed : std::false_type {};

template<typename T>
struct is_self_placed<T, std::void_t<decltype(std::declval<const T&>().placement())>>
    : std::is_convertible<decltype(std::declval<const T&>().placement()), Range> {};

template<typename T>
inline constexpr bool is_self_placed_v = is_self_placed<T>::value;

/** \brief Convert a self-placed payload into an Entry using its own placement. */
template<typename T>
[[nodiscard]] auto make_entry(T value) -> Entry<std::decay_t<T>> {
    static_assert(is_self_placed_v<std::decay_t<T>>, "make_entry(value) requires a placement() member returning Range");
    const Range r = value.placement();
    return Entry<std::decay_t<T>>{std::move(value), r.start, r.size};
}

} // namespace rangevec
