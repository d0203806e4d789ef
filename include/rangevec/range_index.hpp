#pragma once

/** \file range_index.hpp
 *  \brief Fixed-capacity sparse container of non-overlapping ranged entries.
 */

#include <algorithm>
#include <cstddef>
#include <expected>
#include <iterator>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "rangevec/entry.hpp"
#include "rangevec/error.hpp"

namespace rangevec {

/**
 * \brief Reason an insert was rejected.
 *
 * code is one of error_code::invalid_size, error_code::out_of_range or
 * error_code::overlap. conflict holds the resident entry's range for overlap
 * and is empty otherwise.
 */
struct insert_error {
    core::error_code code{core::error_code::internal};
    Range requested{};
    std::optional<Range> conflict{};

    /** \brief One-line human readable description. */
    [[nodiscard]] auto describe() const -> std::string;

    /** \brief Structured error for callers that propagate core::error. */
    [[nodiscard]] auto to_error() const -> core::error;
};

/**
 * \brief Sparse, range-indexed container over the index space [0, max_size).
 *
 * Entries are kept in a vector sorted by start. For any two neighbours A, B
 * the invariant A.end() <= B.start holds, and every entry satisfies
 * size > 0 and end() <= max_size(). A rejected insert leaves the container
 * untouched.
 *
 * Not thread-safe: one mutator at a time, readers only while no mutator runs.
 */
template<typename T>
class RangeIndex {
public:
    using value_type = Entry<T>;
    using size_type = std::size_t;
    using const_iterator = typename std::vector<Entry<T>>::const_iterator;
    using iterator = const_iterator;

    explicit RangeIndex(std::size_t max_size) noexcept : max_size_(max_size) {}

    /**
     * \brief Insert an entry.
     *
     * Checks, in order: size != 0, end() <= max_size(), no intersection with
     * a resident entry. Only the predecessor and successor of the insertion
     * point are inspected for overlap.
     */
    auto insert(Entry<T> entry) -> std::expected<void, insert_error> {
        const Range requested = entry.range();
        if (requested.size == 0) {
            return std::unexpected(insert_error{core::error_code::invalid_size, requested, std::nullopt});
        }
        // start + size may wrap; compare without forming the sum
        if (requested.size > max_size_ || requested.start > max_size_ - requested.size) {
            return std::unexpected(insert_error{core::error_code::out_of_range, requested, std::nullopt});
        }

        auto pos = upper_bound_start(requested.start);
        if (pos != entries_.begin()) {
            const auto& prev = *std::prev(pos);
            if (prev.end() > requested.start) {
                return std::unexpected(insert_error{core::error_code::overlap, requested, prev.range()});
            }
        }
        if (pos != entries_.end() && pos->start < requested.end()) {
            return std::unexpected(insert_error{core::error_code::overlap, requested, pos->range()});
        }

        entries_.insert(pos, std::move(entry));
        return {};
    }

    auto insert(T value, std::size_t start, std::size_t size) -> std::expected<void, insert_error> {
        return insert(Entry<T>{std::move(value), start, size});
    }

    /** \brief Insert a payload that reports its own placement(). */
    template<typename U = T, std::enable_if_t<is_self_placed_v<U>, int> = 0>
    auto insert(T value) -> std::expected<void, insert_error> {
        return insert(make_entry(std::move(value)));
    }

    /**
     * \brief Remove the entry covering index.
     * \return The removed entry, or nullopt if index lies in a gap.
     */
    auto remove(std::size_t index) -> std::optional<Entry<T>> {
        auto it = find_covering(index);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        std::optional<Entry<T>> removed{std::move(*it)};
        entries_.erase(it);
        return removed;
    }

    /**
     * \brief Remove every entry that covers any index in [index, index + length).
     * \return The removed entries in ascending start order.
     */
    auto remove_range(std::size_t index, std::size_t length) -> std::vector<Entry<T>> {
        std::vector<Entry<T>> removed;
        if (length == 0 || index >= max_size_) {
            return removed;
        }
        const std::size_t stop = saturating_end(index, length);

        auto first = find_covering(index);
        if (first == entries_.end()) {
            first = lower_bound_start(index);
        }
        auto last = lower_bound_start(stop);
        if (first >= last) {
            return removed;
        }

        removed.reserve(static_cast<std::size_t>(std::distance(first, last)));
        std::move(first, last, std::back_inserter(removed));
        entries_.erase(first, last);
        return removed;
    }

    /** \brief Drop all entries; max_size() is unchanged. */
    auto clear() noexcept -> void { entries_.clear(); }

    /** \brief Entry whose range covers index, or nullptr. */
    [[nodiscard]] auto get(std::size_t index) const -> const Entry<T>* {
        auto it = find_covering(index);
        return it == entries_.end() ? nullptr : &*it;
    }

    /** \brief Entry that starts exactly at index, or nullptr. */
    [[nodiscard]] auto get_exact(std::size_t index) const -> const Entry<T>* {
        auto it = lower_bound_start(index);
        if (it == entries_.end() || it->start != index) {
            return nullptr;
        }
        return &*it;
    }

    /** \brief Mutable payload of the entry covering index, or nullptr. */
    [[nodiscard]] auto get_mut(std::size_t index) -> T* {
        auto it = find_covering(index);
        return it == entries_.end() ? nullptr : &it->value;
    }

    /** \brief Mutable payload of the entry starting at index, or nullptr. */
    [[nodiscard]] auto get_exact_mut(std::size_t index) -> T* {
        auto it = lower_bound_start(index);
        if (it == entries_.end() || it->start != index) {
            return nullptr;
        }
        return &it->value;
    }

    /**
     * \brief List entries (and optionally gaps) in a window.
     *
     * The walk begins at the start of the entry covering `start` when there
     * is one, otherwise at `start`, and stops before min(start + length,
     * max_size()). Every entry starting inside the walk is listed; with
     * include_empty each unoccupied index becomes a one-index gap slot.
     */
    [[nodiscard]] auto get_range(std::size_t start, std::size_t length, bool include_empty) const
        -> std::vector<Slot<T>> {
        std::vector<Slot<T>> out;
        const std::size_t limit = std::min(saturating_end(start, length), max_size_);

        auto it = find_covering(start);
        std::size_t i = start;
        if (it != entries_.end()) {
            i = it->start;
        } else {
            it = lower_bound_start(start);
        }

        while (i < limit) {
            if (it != entries_.end() && it->start == i) {
                out.push_back(Slot<T>{&it->value, it->start, it->size});
                i = it->end();
                ++it;
                continue;
            }
            const std::size_t next = (it != entries_.end()) ? std::min(it->start, limit) : limit;
            if (include_empty) {
                for (; i < next; ++i) {
                    out.push_back(Slot<T>{nullptr, i, 1});
                }
            }
            i = next;
        }
        return out;
    }

    /** \brief Every entry, plus every gap index when include_empty is set. */
    [[nodiscard]] auto slots(bool include_empty) const -> std::vector<Slot<T>> {
        return get_range(0, max_size_, include_empty);
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return entries_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return entries_.empty(); }
    [[nodiscard]] auto max_size() const noexcept -> std::size_t { return max_size_; }

    [[nodiscard]] auto begin() const noexcept -> const_iterator { return entries_.cbegin(); }
    [[nodiscard]] auto end() const noexcept -> const_iterator { return entries_.cend(); }

    friend auto operator==(const RangeIndex& a, const RangeIndex& b) -> bool {
        return a.max_size_ == b.max_size_ && a.entries_ == b.entries_;
    }

private:
    using mutable_iterator = typename std::vector<Entry<T>>::iterator;

    static constexpr auto saturating_end(std::size_t start, std::size_t length) noexcept -> std::size_t {
        return length > static_cast<std::size_t>(-1) - start ? static_cast<std::size_t>(-1) : start + length;
    }

    // First entry with start > key.
    auto upper_bound_start(std::size_t key) -> mutable_iterator {
        return std::upper_bound(entries_.begin(), entries_.end(), key,
            [](std::size_t k, const Entry<T>& e) { return k < e.start; });
    }

    // First entry with start >= key.
    auto lower_bound_start(std::size_t key) -> mutable_iterator {
        return std::lower_bound(entries_.begin(), entries_.end(), key,
            [](const Entry<T>& e, std::size_t k) { return e.start < k; });
    }

    [[nodiscard]] auto lower_bound_start(std::size_t key) const -> const_iterator {
        return std::lower_bound(entries_.cbegin(), entries_.cend(), key,
            [](const Entry<T>& e, std::size_t k) { return e.start < k; });
    }

    auto find_covering(std::size_t index) -> mutable_iterator {
        auto it = std::as_const(*this).find_covering(index);
        return entries_.begin() + std::distance(entries_.cbegin(), it);
    }

    [[nodiscard]] auto find_covering(std::size_t index) const -> const_iterator {
        if (index >= max_size_) {
            return entries_.cend();
        }
        auto it = std::upper_bound(entries_.cbegin(), entries_.cend(), index,
            [](std::size_t k, const Entry<T>& e) { return k < e.start; });
        if (it == entries_.cbegin()) {
            return entries_.cend();
        }
        --it;
        return it->contains(index) ? it : entries_.cend();
    }

    std::size_t max_size_;
    std::vector<Entry<T>> entries_;
};

} // namespace rangevec
