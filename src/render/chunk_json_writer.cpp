#include "chunk_iter/chunk_json.hpp"
#include "chunk_iter/path_utils.hpp"
#include <charconv>
#include <cmath> // std::isfinite
#include <cstdio>
#include <fstream>
#include <sstream>
#include <system_error>
#include <simdjson.h>

namespace ci {

namespace {

void write_escaped_ascii(std::ostream& o, char c) {
  switch (c) {
    case '\\': o << "\\\\"; break;
    case '"':  o << "\\\""; break;
    case '\n': o << "\\n";  break;
    case '\r': o << "\\r";  break;
    case '\t': o << "\\t";  break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        char tmp[8];
        std::snprintf(tmp, sizeof(tmp), "\\u%04x", static_cast<unsigned>(c));
        o << tmp;
      } else {
        o << c;
      }
      break;
  }
}

// Length a UTF-8 lead byte announces, 0 for a byte that cannot start a sequence.
std::size_t utf8_seq_len(unsigned char b) {
  if (b < 0x80) return 1;
  if ((b >> 5) == 0x6) return 2;
  if ((b >> 4) == 0xE) return 3;
  if ((b >> 3) == 0x1E) return 4;
  return 0;
}

}

// Invalid UTF-8 bytes are written as U+FFFD so every line stays valid JSON.
void write_json_string(std::ostream& o, std::string_view s) {
  o << '"';
  if (simdjson::validate_utf8(s.data(), s.size())) {
    for (char c : s) write_escaped_ascii(o, c);
  } else {
    std::size_t i = 0;
    while (i < s.size()) {
      const auto b = static_cast<unsigned char>(s[i]);
      if (b < 0x80) { write_escaped_ascii(o, s[i]); ++i; continue; }
      const std::size_t n = utf8_seq_len(b);
      if (n && i + n <= s.size() && simdjson::validate_utf8(s.data() + i, n)) {
        o.write(s.data() + i, static_cast<std::streamsize>(n));
        i += n;
      } else {
        o << "\\ufffd";
        ++i;
      }
    }
  }
  o << '"';
}

void write_json_value(std::ostream& o, double v) {
  if (!std::isfinite(v)) { o << "null"; return; }
  char tmp[32];
  auto [end, ec] = std::to_chars(tmp, tmp + sizeof(tmp), v);
  if (ec != std::errc()) { o << "null"; return; }
  o.write(tmp, end - tmp);
}

void write_json_value(std::ostream& o, std::string_view s) { write_json_string(o, s); }

void write_json_value(std::ostream& o, const RawJson& v) { o << v.text; }

std::string RunSummaryWriter::to_json(const RunSummary& s) {
  std::ostringstream o;
  o << "{";
  o << "\"chunk_size\":" << s.chunk_size << ",";
  o << "\"chunks\":" << s.chunks << ",";
  o << "\"elements\":" << s.elements << ",";
  o << "\"discarded\":" << s.discarded << ",";
  o << "\"rejected\":" << s.rejected << ",";
  o << "\"oversize_dropped\":" << s.oversize_dropped << ",";
  o << "\"filename\":"; write_json_string(o, s.filename); o << ",";
  o << "\"format\":";   write_json_string(o, s.format);   o << ",";
  o << "\"error\":";    write_json_string(o, s.error);
  o << "}";
  return o.str();
}

bool write_summary_file(const std::string& path, const std::string& json, std::string* err_out) {
  if (!ensure_parent_dirs(path)) {
    if (err_out) *err_out = "cannot create parent directories for " + path;
    return false;
  }
  std::ofstream out(path, std::ios::binary);
  if (!out) {
    if (err_out) *err_out = "cannot open " + path;
    return false;
  }
  out.write(json.data(), static_cast<std::streamsize>(json.size()));
  out << '\n';
  if (!out) {
    if (err_out) *err_out = "write failed: " + path;
    return false;
  }
  return true;
}

}
