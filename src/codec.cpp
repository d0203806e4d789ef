#include "rangevec/codec.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <system_error>

namespace rangevec::codec::detail {

namespace {

constexpr char kHex[] = "0123456789ABCDEF";

auto needs_escape(unsigned char c) -> bool {
  return c <= 0x20 || c == 0x7F || c == '%' || c == '=';
}

auto hex_value(char c) -> int {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  return -1;
}

} // namespace

auto escape(std::string_view raw) -> std::string {
  std::string out;
  out.reserve(raw.size());
  for (char ch : raw) {
    const auto c = static_cast<unsigned char>(ch);
    if (needs_escape(c)) {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0F]);
    } else {
      out.push_back(ch);
    }
  }
  return out;
}

auto unescape(std::string_view text) -> std::optional<std::string> {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] != '%') { out.push_back(text[i]); continue; }
    if (text.size() - i < 3) return std::nullopt;  // truncated %XY
    const int hi = hex_value(text[i + 1]);
    const int lo = hex_value(text[i + 2]);
    if (hi < 0 || lo < 0) return std::nullopt;
    out.push_back(static_cast<char>((hi << 4) | lo));
    i += 2;
  }
  return out;
}

auto parse_u64(std::string_view s, std::uint64_t& out) -> bool {
  const char* beg = s.data(); const char* end = beg + s.size();
  unsigned long long tmp = 0;
  auto [ptr, ec] = std::from_chars(beg, end, tmp, 10);
  if (ec != std::errc() || ptr != end) return false;
  out = static_cast<std::uint64_t>(tmp);
  return true;
}

auto parse_error(std::size_t line_no, const std::string& what) -> core::error {
  return core::error{core::error_code::data_integrity,
                     std::string("index parse error at line ") + std::to_string(line_no) + ": " + what,
                     "codec.load"};
}

auto parse_counts(const std::string& line, std::size_t line_no) -> std::expected<Header, core::error> {
  Header h{};
  bool have_capacity = false, have_entries = false;
  std::istringstream iss(line);
  std::string kv;
  while (iss >> kv) {
    auto eq = kv.find('='); if (eq == std::string::npos) continue;
    auto k = kv.substr(0, eq);
    auto v = kv.substr(eq + 1);
    if (k == "capacity") {
      if (have_capacity) return std::unexpected(parse_error(line_no, "duplicate capacity="));
      have_capacity = parse_u64(v, h.capacity);
      if (!have_capacity) return std::unexpected(parse_error(line_no, "invalid capacity=\"" + v + "\""));
    } else if (k == "entries") {
      if (have_entries) return std::unexpected(parse_error(line_no, "duplicate entries="));
      have_entries = parse_u64(v, h.entries);
      if (!have_entries) return std::unexpected(parse_error(line_no, "invalid entries=\"" + v + "\""));
    }
  }
  if (!have_capacity || !have_entries) {
    return std::unexpected(parse_error(line_no, "missing required field(s)"));
  }
  return h;
}

auto parse_entry(const std::string& line, std::size_t line_no) -> std::expected<RawEntry, core::error> {
  RawEntry e{};
  bool have_start = false, have_size = false, have_value = false;
  std::istringstream iss(line);
  std::string kv;
  while (iss >> kv) {
    auto eq = kv.find('='); if (eq == std::string::npos) continue;
    auto k = kv.substr(0, eq);
    auto v = kv.substr(eq + 1);
    if (k == "start") {
      if (have_start) return std::unexpected(parse_error(line_no, "duplicate start="));
      have_start = parse_u64(v, e.start);
      if (!have_start) return std::unexpected(parse_error(line_no, "invalid start=\"" + v + "\""));
    } else if (k == "size") {
      if (have_size) return std::unexpected(parse_error(line_no, "duplicate size="));
      have_size = parse_u64(v, e.size);
      if (!have_size) return std::unexpected(parse_error(line_no, "invalid size=\"" + v + "\""));
    } else if (k == "value") {
      if (have_value) return std::unexpected(parse_error(line_no, "duplicate value="));
      e.value = std::move(v); have_value = true;
    }
  }
  if (!have_start || !have_size || !have_value) {
    return std::unexpected(parse_error(line_no, "missing required field(s)"));
  }
  return e;
}

auto debug_enabled(const LoadOptions& opts) -> bool {
  return opts.verbose;
}

auto trace(const std::string& msg) -> void {
  std::cerr << "[rangevec][codec] " << msg << std::endl;
}

auto write_file_atomic(const std::filesystem::path& p, const std::string& content)
    -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  auto tmp = p;
  tmp += ".tmp";

  // Leftover from an interrupted save; absence is fine.
  { std::error_code ec; std::filesystem::remove(tmp, ec); }

  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out.good()) {
      return std::unexpected(error{error_code::io_failed, "index tmp open failed", "codec.save"});
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out.good()) {
      return std::unexpected(error{error_code::io_failed, "index tmp write failed", "codec.save"});
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp, p, ec);
  if (ec) {
    std::error_code rm_ec; std::filesystem::remove(tmp, rm_ec);
    return std::unexpected(error{error_code::io_failed, "index rename failed: " + ec.message(), "codec.save"});
  }
  return {};
}

auto read_file(const std::filesystem::path& p) -> std::expected<std::string, core::error> {
  using core::error; using core::error_code;
  std::error_code ec;
  if (!std::filesystem::exists(p, ec)) {
    return std::unexpected(error{error_code::not_found, "index file not found: " + p.string(), "codec.load"});
  }
  std::ifstream in(p, std::ios::binary);
  if (!in.good()) {
    return std::unexpected(error{error_code::io_failed, "index open failed: " + p.string(), "codec.load"});
  }
  std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    return std::unexpected(error{error_code::io_failed, "index read failed: " + p.string(), "codec.load"});
  }
  return content;
}

} // namespace rangevec::codec::detail
