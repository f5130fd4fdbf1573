#pragma once
#include <filesystem>
#include <string_view>

namespace ci {

enum class ElementFormat { Lines, Numbers, Json, Unknown };

// Create missing parent directories for p.
bool ensure_parent_dirs(const std::filesystem::path& p);

// Guess the element format from the file extension; "-" and unknown
// extensions read plain lines.
ElementFormat detect_format(std::string_view path);

// "lines" | "numbers" | "json" (also "jsonl"); Unknown otherwise.
ElementFormat parse_format(std::string_view name);

const char* format_name(ElementFormat f) noexcept;

}
