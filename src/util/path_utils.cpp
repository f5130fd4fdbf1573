#include "chunk_iter/path_utils.hpp"
#include <string>
#include <system_error>

namespace ci {

bool ensure_parent_dirs(const std::filesystem::path& p) {
  std::error_code ec;
  auto parent = p.parent_path();
  if (parent.empty()) return true;
  if (std::filesystem::exists(parent, ec)) return true;
  return std::filesystem::create_directories(parent, ec) || !ec;
}

ElementFormat detect_format(std::string_view path) {
  if (path == "-") return ElementFormat::Lines;
  auto ext = std::filesystem::path(std::string(path)).extension().string();
  if (ext == ".jsonl" || ext == ".ndjson") return ElementFormat::Json;
  if (ext == ".num" || ext == ".dat") return ElementFormat::Numbers;
  return ElementFormat::Lines;
}

ElementFormat parse_format(std::string_view name) {
  if (name == "lines") return ElementFormat::Lines;
  if (name == "numbers") return ElementFormat::Numbers;
  if (name == "json" || name == "jsonl") return ElementFormat::Json;
  return ElementFormat::Unknown;
}

const char* format_name(ElementFormat f) noexcept {
  switch (f) {
    case ElementFormat::Lines:   return "lines";
    case ElementFormat::Numbers: return "numbers";
    case ElementFormat::Json:    return "json";
    default:                     return "unknown";
  }
}

}
