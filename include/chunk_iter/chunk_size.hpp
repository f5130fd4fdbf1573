#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace ci {

// Raised where a chunk size arrives at runtime (CLI, config) and is not
// positive or not one of the compiled-in sizes.
class InvalidChunkSize : public std::invalid_argument {
public:
  InvalidChunkSize(long long requested, const std::string& what)
    : std::invalid_argument(what), requested_(requested) {}

  long long requested() const noexcept { return requested_; }

private:
  long long requested_;
};

inline std::size_t validate_chunk_size(long long n) {
  if (n <= 0) throw InvalidChunkSize(n, "chunk size must be positive, got " + std::to_string(n));
  return static_cast<std::size_t>(n);
}

template <std::size_t... Sizes>
struct ChunkSizes {
  static_assert(sizeof...(Sizes) > 0, "need at least one chunk size");
  static_assert(((Sizes >= 1) && ...), "chunk sizes must be positive");
};

// Sizes the chunk-iter binary is compiled for.
inline constexpr ChunkSizes<1, 2, 3, 4, 5, 6, 7, 8, 10, 12, 16, 32, 64> kCliChunkSizes{};

namespace detail {

template <std::size_t... Sizes>
std::string size_list() {
  std::string out;
  ((out += (out.empty() ? "" : ", ") + std::to_string(Sizes)), ...);
  return out;
}

template <class F, std::size_t S, std::size_t... Rest>
auto dispatch_impl(std::size_t n, F& f, std::string (*supported)()) {
  if (n == S) return f(std::integral_constant<std::size_t, S>{});
  if constexpr (sizeof...(Rest) > 0) {
    return dispatch_impl<F, Rest...>(n, f, supported);
  } else {
    throw InvalidChunkSize(static_cast<long long>(n),
                           "unsupported chunk size " + std::to_string(n) +
                           " (supported: " + supported() + ")");
  }
}

}

// Turn a runtime size into a compile-time one:
//   dispatch_chunk_size<2, 4, 8>(n, [&](auto size) { return run<decltype(size)::value>(); });
// f must return the same type for every size.
template <std::size_t... Sizes, class F>
auto dispatch_chunk_size(long long n, F&& f) {
  ChunkSizes<Sizes...> check{};
  (void)check;
  const std::size_t want = validate_chunk_size(n);
  return detail::dispatch_impl<std::remove_reference_t<F>, Sizes...>(want, f, &detail::size_list<Sizes...>);
}

template <std::size_t... Sizes, class F>
auto dispatch_chunk_size(ChunkSizes<Sizes...>, long long n, F&& f) {
  return dispatch_chunk_size<Sizes...>(n, std::forward<F>(f));
}

}
