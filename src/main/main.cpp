#include "chunk_iter/chunks.hpp"
#include "chunk_iter/chunk_size.hpp"
#include "chunk_iter/chunk_json.hpp"
#include "chunk_iter/element_policy.hpp"
#include "chunk_iter/line_source.hpp"
#include "chunk_iter/path_utils.hpp"

#include <cstdlib>
#include <cstring>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <system_error>

namespace {

struct Cli {
  long long size = 0;
  bool size_set = false;
  std::string format = "auto";        // auto|lines|numbers|json
  std::string on_error = "strict";    // strict|skip
  std::size_t max_record_bytes = 8 * 1024 * 1024;
  bool keep_cr = false;
  std::string summary;                // run summary JSON path
  std::string input = "-";
};

void print_usage(std::ostream& o) {
  o <<
    "Usage: chunk-iter --size=N [--format=auto|lines|numbers|json]\n"
    "                  [--on-error=strict|skip] [--max-record-bytes=N]\n"
    "                  [--keep-cr] [--summary=PATH] [FILE|-]\n"
    "Groups the elements of FILE (default stdin) into chunks of N and prints\n"
    "one JSON array per chunk. A trailing group shorter than N is dropped.\n";
}

// The whole value must be a number: "3abc" is rejected, not read as 3.
long long parse_int(const std::string& v, const char* flag) {
  std::size_t pos = 0;
  long long n = std::stoll(v, &pos);
  if (pos != v.size()) throw std::invalid_argument(std::string(flag) + ": not a number: " + v);
  return n;
}

unsigned long long parse_uint(const std::string& v, const char* flag) {
  std::size_t pos = 0;
  unsigned long long n = std::stoull(v, &pos);
  if (pos != v.size()) throw std::invalid_argument(std::string(flag) + ": not a number: " + v);
  return n;
}

// Throws std::invalid_argument on malformed flags.
Cli parse_cli(int argc, char** argv) {
  Cli c;
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::strlen(pfx)); return true; }
      return false;
    };
    std::string v;
    if (eat("--size=", &v)) { c.size = parse_int(v, "--size"); c.size_set = true; continue; }
    if (eat("--format=", &c.format)) continue;
    if (eat("--on-error=", &c.on_error)) continue;
    if (eat("--max-record-bytes=", &v)) {
      if (!v.empty() && v[0] == '-') throw std::invalid_argument("--max-record-bytes must not be negative");
      c.max_record_bytes = parse_uint(v, "--max-record-bytes");
      continue;
    }
    if (eat("--summary=", &c.summary)) continue;
    if (a == "--keep-cr") { c.keep_cr = true; continue; }
    if (a == "-h" || a == "--help") {
      print_usage(std::cout);
      std::exit(0);
    }
    if (a.size() > 1 && a[0] == '-') throw std::invalid_argument("unknown option " + a);
    c.input = a;
  }
  if (!c.size_set) throw std::invalid_argument("--size=N is required");
  if (c.on_error != "strict" && c.on_error != "skip")
    throw std::invalid_argument("--on-error must be strict or skip");
  return c;
}

struct Progress {
  std::uint64_t chunks = 0;
  std::uint64_t discarded = 0;
  std::uint64_t rejected = 0;
};

template <std::size_t N, class Src>
void emit_chunks(Src& src, Progress& prog) {
  auto chunks = ci::chunks<N>(std::ref(src));
  for (const auto& chunk : chunks) {
    ci::ChunkJsonWriter::write(std::cout, chunk);
    ++prog.chunks;
  }
  prog.discarded = chunks.discarded();
}

template <std::size_t N>
int chunk_one_file(const Cli& cli, ci::ElementFormat fmt) {
  // --- reader
  ci::LineSource::Config rcfg;
  rcfg.max_record_bytes = cli.max_record_bytes;
  rcfg.strip_cr = !cli.keep_cr;
  ci::LineSource lines(cli.input, rcfg);
  if (!lines.open()) {
    std::cerr << "[chunk] cannot open " << cli.input << ": "
              << std::strerror(lines.last_error()) << "\n";
    return 1;
  }

  ci::ElementPolicy policy;
  policy.on_error = (cli.on_error == "skip") ? ci::ElementPolicy::OnError::Skip
                                             : ci::ElementPolicy::OnError::Strict;

  // --- chunk
  Progress prog;
  std::string error;
  int rc = 0;
  try {
    switch (fmt) {
      case ci::ElementFormat::Numbers: {
        ci::NumberSource<std::reference_wrapper<ci::LineSource>> src(std::ref(lines), policy);
        emit_chunks<N>(src, prog);
        prog.rejected = src.rejected();
        break;
      }
      case ci::ElementFormat::Json: {
        ci::JsonValueSource<std::reference_wrapper<ci::LineSource>> src(std::ref(lines), policy);
        emit_chunks<N>(src, prog);
        prog.rejected = src.rejected();
        break;
      }
      default:
        emit_chunks<N>(lines, prog);
        break;
    }
  } catch (const ci::ElementError& e) {
    error = e.what();
    std::cerr << "[chunk] " << cli.input << ":" << e.line() << ": " << e.what() << "\n";
    rc = 3;
  } catch (const std::system_error& e) {
    error = e.what();
    std::cerr << "[chunk] read error: " << e.what() << "\n";
    rc = 3;
  }
  std::cout.flush();

  ci::RunSummary s;
  s.chunk_size = N;
  s.chunks = prog.chunks;
  s.elements = prog.chunks * N;
  s.discarded = prog.discarded;
  s.rejected = prog.rejected;
  s.oversize_dropped = lines.oversize_dropped();
  s.filename = cli.input;
  s.format = ci::format_name(fmt);
  s.error = error;

  if (!cli.summary.empty()) {
    std::string err;
    if (!ci::write_summary_file(cli.summary, ci::RunSummaryWriter::to_json(s), &err)) {
      std::cerr << "[chunk] summary write failed: " << err << "\n";
      if (rc == 0) rc = 1;
    }
  }

  if (rc == 0) {
    std::cerr << "[chunk] ok: " << cli.input
              << " chunks=" << s.chunks
              << " elements=" << s.elements
              << " discarded=" << s.discarded;
    if (s.rejected) std::cerr << " rejected=" << s.rejected;
    if (s.oversize_dropped) std::cerr << " oversize_dropped=" << s.oversize_dropped;
    std::cerr << "\n";
  }
  return rc;
}

}

int main(int argc, char** argv) {
  Cli cli;
  try {
    cli = parse_cli(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "[cli] " << e.what() << "\n";
    print_usage(std::cerr);
    return 2;
  }

  ci::ElementFormat fmt = (cli.format == "auto") ? ci::detect_format(cli.input)
                                                 : ci::parse_format(cli.format);
  if (fmt == ci::ElementFormat::Unknown) {
    std::cerr << "[cli] unknown format: " << cli.format << "\n";
    return 2;
  }

  try {
    return ci::dispatch_chunk_size(ci::kCliChunkSizes, cli.size, [&](auto size) {
      return chunk_one_file<decltype(size)::value>(cli, fmt);
    });
  } catch (const ci::InvalidChunkSize& e) {
    std::cerr << "[cli] " << e.what() << "\n";
    return 2;
  }
}
