#include "rangevec/error.hpp"

namespace rangevec::core {

auto to_string(error_code ec) -> std::string_view {
  switch (ec) {
    case error_code::ok: return "ok";
    case error_code::io_failed: return "io_failed";
    case error_code::data_integrity: return "data_integrity";
    case error_code::precondition_failed: return "precondition_failed";
    case error_code::overlap: return "overlap";
    case error_code::not_found: return "not_found";
    case error_code::internal: return "internal";
    case error_code::invalid_argument: return "invalid_argument";
    case error_code::out_of_range: return "out_of_range";
    case error_code::invalid_size: return "invalid_size";
  }
  return "internal";
}

} // namespace rangevec::core
