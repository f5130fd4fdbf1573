#pragma once
#include "chunk_iter/element_policy.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>

namespace ci {

void write_json_string(std::ostream& o, std::string_view s);
void write_json_value(std::ostream& o, double v);
void write_json_value(std::ostream& o, std::string_view s);
void write_json_value(std::ostream& o, const RawJson& v);

inline void write_json_value(std::ostream& o, const std::string& s) {
  write_json_value(o, std::string_view(s));
}

template <class I, std::enable_if_t<std::is_integral_v<I> && !std::is_same_v<I, bool>, int> = 0>
void write_json_value(std::ostream& o, I v) { o << +v; }

// Nested chunks render as nested arrays.
template <class T, std::size_t N>
void write_json_value(std::ostream& o, const std::array<T, N>& a) {
  o << '[';
  for (std::size_t i = 0; i < N; ++i) {
    if (i) o << ',';
    write_json_value(o, a[i]);
  }
  o << ']';
}

class ChunkJsonWriter {
public:
  // One chunk as a JSON array on its own line.
  template <class T, std::size_t N>
  static void write(std::ostream& o, const std::array<T, N>& chunk) {
    write_json_value(o, chunk);
    o << '\n';
  }
};

struct RunSummary {
  std::uint64_t chunk_size = 0;
  std::uint64_t chunks = 0;
  std::uint64_t elements = 0;          // delivered inside chunks
  std::uint64_t discarded = 0;         // trailing partial chunk
  std::uint64_t rejected = 0;          // lines skipped by ElementPolicy
  std::uint64_t oversize_dropped = 0;  // lines over the LineSource guard

  std::string filename;
  std::string format;
  std::string error;                   // empty on success
};

class RunSummaryWriter {
public:
  static std::string to_json(const RunSummary& s);
};

// Write `json` to `path`, creating parent directories.
bool write_summary_file(const std::string& path, const std::string& json, std::string* err_out);

}
