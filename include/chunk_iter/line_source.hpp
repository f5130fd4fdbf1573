#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace ci {

// Buffered pull source of text lines from a file, or stdin for "-".
class LineSource {
public:
  struct Config {
    std::size_t chunk_bytes      = 512 * 1024;      // 512 KiB
    std::size_t max_record_bytes = 8 * 1024 * 1024; // 8 MiB guard per line
    bool        strip_cr         = true;            // trim trailing '\r' (CRLF)
    bool        drop_oversize    = true;            // drop lines exceeding guard
  };

  explicit LineSource(std::string path);      // uses default Config{}
  LineSource(std::string path, Config cfg);   // explicit Config

  LineSource(LineSource&& o) noexcept;
  LineSource(const LineSource&) = delete;
  LineSource& operator=(const LineSource&) = delete;
  LineSource& operator=(LineSource&&) = delete;
  ~LineSource();

  // false on failure; see last_error()
  bool open();

  // Next line without its '\n'. Throws std::system_error on a read error,
  // or if the file was never opened and cannot be.
  std::optional<std::string> next();

  const std::string& path() const noexcept;
  int  last_error() const noexcept;
  std::uint64_t bytes_read() const noexcept;
  std::uint64_t lines() const noexcept;
  std::uint64_t oversize_dropped() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
