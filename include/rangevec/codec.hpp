#pragma once

/** \file codec.hpp
 *  \brief Text interchange format for RangeIndex and load/save helpers.
 *
 * Format (v1):
 *   header: "rangevec-index v1"\n
 *   line 2: capacity=<u64> entries=<u64>\n
 *   lines:  start=<u64> size=<u64> value=<encoded>\n
 *
 * Values are written through value_codec<T>; encoded values never contain
 * whitespace, so every line splits cleanly into key=value tokens.
 */

#include <charconv>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>

#include "rangevec/error.hpp"
#include "rangevec/range_index.hpp"

namespace rangevec::codec {

inline constexpr std::string_view kFormatHeader = "rangevec-index v1";

struct LoadOptions {
  bool repair{false};   // drop entries that break container invariants instead of failing
  bool verbose{false};  // diagnostics to stderr
};

struct LoadReport {
  std::size_t loaded{0};
  std::size_t dropped{0};
};

/**
 * \brief Payload encoder/decoder used by the text format.
 *
 * Specialize for custom payloads: `static std::string encode(const T&)` and
 * `static std::optional<T> decode(std::string_view)`. The encoded form must
 * not contain whitespace; escape() is available for that.
 */
template<typename T, typename = void>
struct value_codec;

namespace detail {

/** Percent-escape '%', '=', whitespace and control bytes. */
auto escape(std::string_view raw) -> std::string;
auto unescape(std::string_view text) -> std::optional<std::string>;

auto parse_u64(std::string_view s, std::uint64_t& out) -> bool;

struct Header {
  std::uint64_t capacity{0};
  std::uint64_t entries{0};
};

struct RawEntry {
  std::uint64_t start{0};
  std::uint64_t size{0};
  std::string value;  // still encoded
};

auto parse_counts(const std::string& line, std::size_t line_no) -> std::expected<Header, core::error>;
auto parse_entry(const std::string& line, std::size_t line_no) -> std::expected<RawEntry, core::error>;

auto parse_error(std::size_t line_no, const std::string& what) -> core::error;

auto debug_enabled(const LoadOptions& opts) -> bool;
auto trace(const std::string& msg) -> void;

auto write_file_atomic(const std::filesystem::path& p, const std::string& content)
    -> std::expected<void, core::error>;
auto read_file(const std::filesystem::path& p) -> std::expected<std::string, core::error>;

} // namespace detail

template<>
struct value_codec<std::string, void> {
  static auto encode(const std::string& v) -> std::string { return detail::escape(v); }
  static auto decode(std::string_view text) -> std::optional<std::string> { return detail::unescape(text); }
};

template<typename T>
struct value_codec<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>> {
  static auto encode(T v) -> std::string { return std::to_string(v); }
  static auto decode(std::string_view text) -> std::optional<T> {
    T out{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out, 10);
    if (ec != std::errc() || ptr != text.data() + text.size()) return std::nullopt;
    return out;
  }
};

/** \brief Render an index in the v1 text format. */
template<typename T>
auto serialize(const RangeIndex<T>& index) -> std::string {
  std::string out;
  out.reserve(64 + index.size() * 48);
  out.append(kFormatHeader).append("\n");
  out.append("capacity=").append(std::to_string(index.max_size()))
     .append(" entries=").append(std::to_string(index.size()))
     .append("\n");
  for (const auto& e : index) {
    out.append("start=").append(std::to_string(e.start))
       .append(" size=").append(std::to_string(e.size))
       .append(" value=").append(value_codec<T>::encode(e.value))
       .append("\n");
  }
  return out;
}

/**
 * \brief Rebuild an index from the v1 text format.
 *
 * Entry lines may appear in any order. An entry with zero size, beyond the
 * capacity or overlapping an earlier line is a data_integrity error unless
 * opts.repair is set, in which case it is dropped and counted in report.
 */
template<typename T>
auto deserialize(std::string_view text, LoadOptions opts = {}, LoadReport* report = nullptr)
    -> std::expected<RangeIndex<T>, core::error> {
  using core::error; using core::error_code;
  const bool dbg = detail::debug_enabled(opts);

  std::istringstream in{std::string(text)};
  std::string line;
  if (!std::getline(in, line) || line != kFormatHeader) {
    return std::unexpected(error{error_code::data_integrity, "bad index header", "codec.load"});
  }
  if (!std::getline(in, line)) {
    return std::unexpected(detail::parse_error(2, "missing capacity line"));
  }
  auto header = detail::parse_counts(line, 2);
  if (!header) return std::unexpected(header.error());

  RangeIndex<T> index(static_cast<std::size_t>(header->capacity));
  LoadReport local{};
  std::uint64_t seen = 0;
  std::size_t line_no = 2;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty()) continue;
    ++seen;

    auto raw = detail::parse_entry(line, line_no);
    if (!raw) return std::unexpected(raw.error());

    auto value = value_codec<T>::decode(raw->value);
    if (!value) {
      return std::unexpected(detail::parse_error(line_no, "undecodable value"));
    }

    auto ins = index.insert(std::move(*value), static_cast<std::size_t>(raw->start), static_cast<std::size_t>(raw->size));
    if (!ins) {
      if (!opts.repair) {
        return std::unexpected(detail::parse_error(line_no, ins.error().describe()));
      }
      if (dbg) detail::trace("dropped line " + std::to_string(line_no) + ": " + ins.error().describe());
      ++local.dropped;
      continue;
    }
    ++local.loaded;
  }

  if (seen != header->entries) {
    return std::unexpected(error{error_code::data_integrity,
        "entry count mismatch: header says " + std::to_string(header->entries) + ", found " + std::to_string(seen),
        "codec.load"});
  }
  if (dbg) {
    detail::trace("loaded " + std::to_string(local.loaded) + " entries, dropped " + std::to_string(local.dropped));
  }
  if (report) *report = local;
  return index;
}

/** \brief Write an index to path through a temp file and rename. */
template<typename T>
auto save_index(const std::filesystem::path& path, const RangeIndex<T>& index)
    -> std::expected<void, core::error> {
  return detail::write_file_atomic(path, serialize(index));
}

template<typename T>
auto load_index(const std::filesystem::path& path, LoadOptions opts = {}, LoadReport* report = nullptr)
    -> std::expected<RangeIndex<T>, core::error> {
  auto text = detail::read_file(path);
  if (!text) return std::unexpected(text.error());
  return deserialize<T>(*text, opts, report);
}

} // namespace rangevec::codec
