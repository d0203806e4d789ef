/** \file range_index.cpp
 *  \brief Non-template parts of RangeIndex error reporting.
 */

#include "rangevec/range_index.hpp"

namespace rangevec {

namespace {

auto format_range(const Range& r) -> std::string {
    return "(start=" + std::to_string(r.start) + " size=" + std::to_string(r.size) + ")";
}

} // namespace

auto insert_error::describe() const -> std::string {
    switch (code) {
        case core::error_code::invalid_size:
            return "entry at " + std::to_string(requested.start) + " has zero size";
        case core::error_code::out_of_range:
            return "entry " + format_range(requested) + " exceeds max size";
        case core::error_code::overlap:
            if (conflict) {
                return "entry " + format_range(requested) + " overlaps resident entry " + format_range(*conflict);
            }
            return "entry " + format_range(requested) + " overlaps another entry";
        default:
            break;
    }
    return "entry " + format_range(requested) + " rejected: " + std::string(core::to_string(code));
}

auto insert_error::to_error() const -> core::error {
    return core::error{code, describe(), "range_index.insert"};
}

} // namespace rangevec
