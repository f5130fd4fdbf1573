#pragma once
#include "chunk_iter/source.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace ci {

// Pre-rendered JSON text, written verbatim by ChunkJsonWriter.
struct RawJson {
  std::string text;
};

inline bool operator==(const RawJson& a, const RawJson& b) { return a.text == b.text; }

struct ElementPolicy {
  // Behavior when a line fails to parse:
  // strict -> throw ElementError; skip -> count it and move on
  enum class OnError { Strict, Skip };

  OnError on_error = OnError::Strict;

  // Numeric parse (fast_float in .cpp); surrounding ASCII blanks are ignored.
  std::optional<double> parse_number(std::string_view s) const;

  // Validate one JSON document (simdjson in .cpp) and return it minified.
  std::optional<std::string> normalize_json(std::string_view s) const;
};

bool is_blank(std::string_view s) noexcept;

// A line that could not be turned into an element under OnError::Strict.
class ElementError : public std::runtime_error {
public:
  ElementError(std::uint64_t line, const std::string& what)
    : std::runtime_error(what), line_(line) {}

  // 1-based index among the lines pulled from the inner source.
  std::uint64_t line() const noexcept { return line_; }

private:
  std::uint64_t line_;
};

namespace detail {

template <class Lines>
class LineMapper {
public:
  LineMapper(Lines lines, ElementPolicy policy)
    : lines_(std::move(lines)), policy_(policy) {}

  std::uint64_t rejected() const noexcept { return rejected_; }

protected:
  std::optional<std::string> next_line() {
    while (auto line = ci::pull(lines_)) {
      ++line_no_;
      if (!is_blank(*line)) return line;
    }
    return std::nullopt;
  }

  void reject(std::string_view what, std::string_view line) {
    if (policy_.on_error == ElementPolicy::OnError::Strict) {
      std::string msg(what);
      msg.append(": ");
      msg.append(line.substr(0, 64));
      throw ElementError(line_no_, msg);
    }
    ++rejected_;
  }

  Lines lines_;
  ElementPolicy policy_;
  std::uint64_t line_no_{0};
  std::uint64_t rejected_{0};
};

}

// Lines -> double. Blank lines are skipped.
template <class Lines>
class NumberSource : public detail::LineMapper<Lines> {
public:
  using value_type = double;

  explicit NumberSource(Lines lines, ElementPolicy policy = {})
    : detail::LineMapper<Lines>(std::move(lines), policy) {}

  std::optional<double> next() {
    while (auto line = this->next_line()) {
      if (auto v = this->policy_.parse_number(*line)) return v;
      this->reject("not a number", *line);
    }
    return std::nullopt;
  }
};

// Lines -> minified JSON values (one document per line). Blank lines are skipped.
template <class Lines>
class JsonValueSource : public detail::LineMapper<Lines> {
public:
  using value_type = RawJson;

  explicit JsonValueSource(Lines lines, ElementPolicy policy = {})
    : detail::LineMapper<Lines>(std::move(lines), policy) {}

  std::optional<RawJson> next() {
    while (auto line = this->next_line()) {
      if (auto v = this->policy_.normalize_json(*line)) return RawJson{std::move(*v)};
      this->reject("invalid JSON", *line);
    }
    return std::nullopt;
  }
};

}
