#include "chunk_iter/line_source.hpp"
#include "chunk_iter/chunks.hpp"
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

static fs::path write_fixture(const std::string& name, const std::string& body) {
  fs::path p = fs::temp_directory_path() / ("ci_line_source_" + name);
  std::ofstream out(p, std::ios::binary);
  out << body;
  return p;
}

static std::vector<std::string> drain(ci::LineSource& src) {
  std::vector<std::string> out;
  while (auto line = src.next()) out.push_back(*line);
  return out;
}

int main(){
  bool ok = true;

  // CRLF, empty line, last line without newline; tiny buffer forces carries
  {
    const fs::path f = write_fixture("crlf.txt", "alpha\r\nbeta\n\ngamma-delta\r\nlast");
    ci::LineSource::Config cfg;
    cfg.chunk_bytes = 4;
    ci::LineSource src(f.string(), cfg);
    if (!src.open()) { std::cerr << "[ERR] cannot open " << f << "\n"; return 2; }
    auto lines = drain(src);
    const std::vector<std::string> expect{"alpha", "beta", "", "gamma-delta", "last"};
    if (lines != expect) { std::cerr << "[FAIL] crlf lines mismatch, got " << lines.size() << "\n"; ok = false; }
    if (src.lines() != 5) { std::cerr << "[FAIL] lines()=" << src.lines() << "\n"; ok = false; }
    if (src.bytes_read() != fs::file_size(f)) { std::cerr << "[FAIL] bytes_read mismatch\n"; ok = false; }
    if (src.next()) { std::cerr << "[FAIL] next() after end returned a line\n"; ok = false; }
  }

  // keep CR when asked
  {
    const fs::path f = write_fixture("keepcr.txt", "a\r\nb\r\n");
    ci::LineSource::Config cfg;
    cfg.strip_cr = false;
    ci::LineSource src(f.string(), cfg);
    auto lines = drain(src);
    if (lines.size() != 2 || lines[0] != "a\r") { std::cerr << "[FAIL] strip_cr=false\n"; ok = false; }
  }

  // oversize lines: dropped by default, truncated otherwise
  {
    const fs::path f = write_fixture("oversize.txt", "ok\n0123456789abcdef\nfine\n0123456789");
    ci::LineSource::Config cfg;
    cfg.chunk_bytes = 5;
    cfg.max_record_bytes = 8;
    ci::LineSource drop(f.string(), cfg);
    auto lines = drain(drop);
    if (lines != std::vector<std::string>{"ok", "fine"}) { std::cerr << "[FAIL] oversize drop\n"; ok = false; }
    if (drop.oversize_dropped() != 2) { std::cerr << "[FAIL] oversize_dropped()=" << drop.oversize_dropped() << "\n"; ok = false; }

    cfg.drop_oversize = false;
    ci::LineSource trunc(f.string(), cfg);
    lines = drain(trunc);
    const std::vector<std::string> expect{"ok", "01234567", "fine", "01234567"};
    if (lines != expect) { std::cerr << "[FAIL] oversize truncate\n"; ok = false; }
  }

  // chunking lines: 7 lines in pairs -> 3 chunks, one discarded
  {
    const fs::path f = write_fixture("seven.txt", "1\n2\n3\n4\n5\n6\n7\n");
    ci::LineSource src(f.string());
    auto chunks = ci::chunks<2>(std::ref(src));
    std::size_t n = 0;
    std::string joined;
    for (auto& c : chunks) { ++n; joined += c[0] + c[1]; }
    if (n != 3 || joined != "123456") { std::cerr << "[FAIL] line chunks n=" << n << " joined=" << joined << "\n"; ok = false; }
    if (chunks.discarded() != 1 || src.lines() != 7) { std::cerr << "[FAIL] line chunks discarded\n"; ok = false; }
  }

  // missing file: open() reports errno, next() throws
  {
    ci::LineSource src((fs::temp_directory_path() / "ci_line_source_missing.txt").string());
    if (src.open() || src.last_error() == 0) { std::cerr << "[FAIL] missing file opened\n"; ok = false; }
    bool threw = false;
    try { (void)src.next(); } catch (const std::system_error&) { threw = true; }
    if (!threw) { std::cerr << "[FAIL] next() on missing file did not throw\n"; ok = false; }
  }

  // moved-from source: no lines, zero counters, the new owner keeps reading
  {
    const fs::path f = write_fixture("moved.txt", "x\ny\n");
    ci::LineSource a(f.string());
    auto first = a.next();
    ci::LineSource b(std::move(a));
    if (!a.path().empty() || a.open() || a.next() || a.last_error() != 0 ||
        a.bytes_read() != 0 || a.lines() != 0 || a.oversize_dropped() != 0) {
      std::cerr << "[FAIL] moved-from LineSource is not empty\n"; ok = false;
    }
    auto second = b.next();
    if (!first || *first != "x" || !second || *second != "y" || b.lines() != 2 || b.path() != f.string()) {
      std::cerr << "[FAIL] moved-to LineSource lost its position\n"; ok = false;
    }
  }

  if (!ok) return 1;
  std::cout << "[PASS] line_source\n";
  return 0;
}
