#pragma once
#include "chunk_iter/source.hpp"

#include <array>
#include <cstddef>
#include <iterator>
#include <new>
#include <optional>
#include <type_traits>
#include <utility>

namespace ci {

template <class ChunksT>
class ChunkIterator;

// Groups a pull source into std::array<T, N> chunks.
//
// Each next() pulls until N elements are buffered and hands them out as one
// array, in source order. If the source runs dry mid-chunk, the buffered
// elements are destroyed, the adapter becomes exhausted for good and no short
// chunk is ever produced. Exceptions thrown by the source propagate unchanged
// after the partial buffer is destroyed.
template <class Source, std::size_t N>
class Chunks {
  static_assert(N >= 1, "chunk size must be at least 1");
  static_assert(is_pull_source_v<Source>, "Chunks needs a source with std::optional<T> next()");

public:
  using source_type  = Source;
  using element_type = source_value_t<Source>;
  using value_type   = std::array<element_type, N>;
  using iterator     = ChunkIterator<Chunks>;

  static constexpr std::size_t chunk_size = N;

  explicit Chunks(Source src) : src_(std::move(src)) {}

  // fill_ is always 0 between calls, so only the source and state move.
  Chunks(Chunks&& o) noexcept(std::is_nothrow_move_constructible_v<Source>)
    : src_(std::move(o.src_)), exhausted_(o.exhausted_), discarded_(o.discarded_) {
    o.exhausted_ = true;
  }

  Chunks(const Chunks&) = delete;
  Chunks& operator=(const Chunks&) = delete;
  Chunks& operator=(Chunks&&) = delete;

  ~Chunks() { clear(); }

  std::optional<value_type> next() {
    if (exhausted_) return std::nullopt;
    try {
      while (fill_ < N) {
        auto v = ci::pull(src_);
        if (!v) {
          discarded_ += fill_;
          clear();
          exhausted_ = true;
          return std::nullopt;
        }
        ::new (static_cast<void*>(slot(fill_))) element_type(std::move(*v));
        ++fill_;
      }
      std::optional<value_type> out(take(std::make_index_sequence<N>{}));
      clear();
      return out;
    } catch (...) {
      clear();
      throw;
    }
  }

  bool exhausted() const noexcept { return exhausted_; }

  // Elements pulled but dropped because the source ended mid-chunk.
  std::size_t discarded() const noexcept { return discarded_; }

  Source& source() noexcept { return src_; }
  const Source& source() const noexcept { return src_; }

  iterator begin() { return iterator(this); }
  iterator end() { return iterator(); }

private:
  element_type* slot(std::size_t i) noexcept {
    return std::launder(reinterpret_cast<element_type*>(storage_ + i * sizeof(element_type)));
  }

  template <std::size_t... I>
  value_type take(std::index_sequence<I...>) {
    return value_type{{std::move(*slot(I))...}};
  }

  void clear() noexcept {
    for (std::size_t i = 0; i < fill_; ++i) slot(i)->~element_type();
    fill_ = 0;
  }

  Source src_;
  alignas(element_type) unsigned char storage_[N * sizeof(element_type)];
  std::size_t fill_{0};
  bool exhausted_{false};
  std::size_t discarded_{0};
};

// Single-pass input iterator over a Chunks adapter; a default constructed
// iterator is the end.
template <class ChunksT>
class ChunkIterator {
public:
  using iterator_category = std::input_iterator_tag;
  using value_type        = typename ChunksT::value_type;
  using difference_type   = std::ptrdiff_t;
  using pointer           = value_type*;
  using reference         = value_type&;

  ChunkIterator() = default;
  explicit ChunkIterator(ChunksT* c) : chunks_(c) { advance(); }

  reference operator*() { return *cur_; }
  pointer operator->() { return &*cur_; }

  ChunkIterator& operator++() { advance(); return *this; }
  ChunkIterator operator++(int) { ChunkIterator tmp(*this); advance(); return tmp; }

  friend bool operator==(const ChunkIterator& a, const ChunkIterator& b) noexcept {
    return a.chunks_ == b.chunks_;
  }
  friend bool operator!=(const ChunkIterator& a, const ChunkIterator& b) noexcept {
    return !(a == b);
  }

private:
  void advance() {
    cur_.reset();
    if (auto c = chunks_->next()) cur_.emplace(std::move(*c));
    else chunks_ = nullptr;
  }

  ChunksT* chunks_{nullptr};
  std::optional<value_type> cur_;
};

// chunks<N>(src): a pull source is moved in (or copied from an lvalue; pass
// std::ref to borrow it). A range is wrapped in a RangeSource that owns an
// rvalue container and borrows an lvalue one.
template <std::size_t N, class Src>
auto chunks(Src&& src) {
  if constexpr (is_pull_source_v<Src>) {
    return Chunks<std::decay_t<Src>, N>(std::forward<Src>(src));
  } else {
    static_assert(is_range_v<Src>, "chunks<N>() needs a pull source or a range");
    return Chunks<RangeSource<Src>, N>(RangeSource<Src>(std::forward<Src>(src)));
  }
}

}
