#include "chunk_iter/element_policy.hpp"
#include <string>
#include <string_view>
#include <system_error>
#include <fast_float/fast_float.h>
#include <simdjson.h>

namespace ci {

static bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

static std::string_view trim(std::string_view s) {
  while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
  while (!s.empty() && is_space(s.back()))  s.remove_suffix(1);
  return s;
}

bool is_blank(std::string_view s) noexcept {
  for (char c : s) if (!is_space(c)) return false;
  return true;
}

std::optional<double> ElementPolicy::parse_number(std::string_view s) const {
  s = trim(s);
  if (s.empty()) return std::nullopt;
  double out;
  auto [ptr, ec] = fast_float::from_chars(s.data(), s.data() + s.size(), out);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return out;
}

std::optional<std::string> ElementPolicy::normalize_json(std::string_view s) const {
  // thread-local parser; parse() copies into its own padded buffer
  thread_local simdjson::dom::parser parser;
  simdjson::dom::element doc;
  if (parser.parse(s.data(), s.size()).get(doc) != simdjson::SUCCESS) return std::nullopt;
  return simdjson::minify(doc);
}

}
