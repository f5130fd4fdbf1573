#include "chunk_iter/line_source.hpp"
#include <cerrno>
#include <cstdio>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace ci {

struct LineSource::Impl {
  std::string path;
  Config cfg;
  std::FILE* f{nullptr};
  bool owns_file{false};
  bool eof{false};
  int last_errno{0};
  std::uint64_t bytes{0};
  std::uint64_t lines{0};
  std::uint64_t oversize{0};

  std::vector<char> buf;
  std::size_t pos{0}, len{0};
  std::string carry;
  bool skipping_oversize{false}; // if true, drop until next newline

  ~Impl() { if (f && owns_file) std::fclose(f); }

  bool open() {
    if (f) return true;
    if (path == "-") {
      f = stdin;
      owns_file = false;
    } else {
      f = std::fopen(path.c_str(), "rb");
      if (!f) { last_errno = errno; return false; }
      owns_file = true;
    }
    buf.assign(cfg.chunk_bytes ? cfg.chunk_bytes : 1, 0);
    carry.reserve(256);
    return true;
  }

  std::string emit() {
    std::string out(carry);
    carry.clear();
    if (cfg.strip_cr && !out.empty() && out.back() == '\r') out.pop_back();
    ++lines;
    return out;
  }

  std::optional<std::string> next_line() {
    while (true) {
      if (pos == len) {
        if (eof) {
          // last line without a trailing newline
          if (!carry.empty() && !skipping_oversize) return emit();
          carry.clear();
          skipping_oversize = false;
          return std::nullopt;
        }
        pos = 0;
        len = std::fread(buf.data(), 1, buf.size(), f);
        if (len == 0) {
          if (std::ferror(f)) {
            last_errno = errno;
            throw std::system_error(last_errno, std::generic_category(), "read " + path);
          }
          eof = true;
          continue;
        }
        bytes += len;
      }

      std::string_view block(buf.data() + pos, len - pos);
      const std::size_t nl = block.find('\n');
      const bool hit_nl = (nl != std::string_view::npos);
      std::string_view slice = hit_nl ? block.substr(0, nl) : block;
      pos += hit_nl ? nl + 1 : slice.size();

      if (skipping_oversize) {
        if (hit_nl) skipping_oversize = false;
        continue;
      }

      if (carry.size() + slice.size() > cfg.max_record_bytes) {
        if (!hit_nl) skipping_oversize = true;
        if (cfg.drop_oversize) {
          ++oversize;
          carry.clear();
          continue;
        }
        // truncate and emit as best-effort
        carry.append(slice.substr(0, cfg.max_record_bytes - carry.size()));
        return emit();
      }

      carry.append(slice);
      if (hit_nl) return emit();
    }
  }
};

LineSource::LineSource(std::string path)
  : LineSource(std::move(path), Config{}) {}

LineSource::LineSource(std::string path, Config cfg)
  : p_(new Impl{std::move(path), cfg}) {}

// A moved-from source has no Impl: it opens nothing and yields no lines.
LineSource::LineSource(LineSource&& o) noexcept : p_(o.p_) { o.p_ = nullptr; }

LineSource::~LineSource() { delete p_; }

bool LineSource::open() { return p_ && p_->open(); }

std::optional<std::string> LineSource::next() {
  if (!p_) return std::nullopt;
  if (!p_->f && !p_->open())
    throw std::system_error(p_->last_errno, std::generic_category(), "open " + p_->path);
  return p_->next_line();
}

const std::string& LineSource::path() const noexcept {
  static const std::string empty;
  return p_ ? p_->path : empty;
}
int  LineSource::last_error() const noexcept { return p_ ? p_->last_errno : 0; }
std::uint64_t LineSource::bytes_read() const noexcept { return p_ ? p_->bytes : 0; }
std::uint64_t LineSource::lines() const noexcept { return p_ ? p_->lines : 0; }
std::uint64_t LineSource::oversize_dropped() const noexcept { return p_ ? p_->oversize : 0; }

}
