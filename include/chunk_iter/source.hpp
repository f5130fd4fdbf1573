#pragma once
#include <cstddef>
#include <functional>
#include <iterator>
#include <optional>
#include <type_traits>
#include <utility>

namespace ci {

// A pull source is anything with `std::optional<T> next()`; an empty optional
// means the source is exhausted.

namespace detail {

template <class T> struct optional_value { };
template <class T> struct optional_value<std::optional<T>> { using type = T; };

template <class S, class = void>
struct pull_source_traits { static constexpr bool value = false; };

template <class S>
struct pull_source_traits<S, std::void_t<typename optional_value<
    decltype(std::declval<S&>().next())>::type>> {
  static constexpr bool value = true;
  using value_type = typename optional_value<decltype(std::declval<S&>().next())>::type;
};

// Borrowed pull source.
template <class S>
struct pull_source_traits<std::reference_wrapper<S>, std::void_t<typename optional_value<
    decltype(std::declval<S&>().next())>::type>> {
  static constexpr bool value = true;
  using value_type = typename optional_value<decltype(std::declval<S&>().next())>::type;
};

template <class R, class = void>
struct is_range : std::false_type { };

template <class R>
struct is_range<R, std::void_t<decltype(std::begin(std::declval<R&>())),
                               decltype(std::end(std::declval<R&>()))>> : std::true_type { };

}

template <class S>
inline constexpr bool is_pull_source_v = detail::pull_source_traits<std::decay_t<S>>::value;

template <class S>
using source_value_t = typename detail::pull_source_traits<std::decay_t<S>>::value_type;

template <class R>
inline constexpr bool is_range_v = detail::is_range<std::remove_reference_t<R>>::value;

// Pull once from a source held by value or through std::reference_wrapper.
template <class S>
auto pull(S& src) -> decltype(src.next()) { return src.next(); }

template <class S>
auto pull(std::reference_wrapper<S> src) -> decltype(src.get().next()) { return src.get().next(); }

// Pull source over an iterator range.
// RangeSource<C>  owns the container (moved in), elements are moved out.
// RangeSource<C&> borrows it, elements are copied out; the container must
// outlive the source and must not be touched while the source is in use.
template <class Range>
class RangeSource {
  using stored_t = std::conditional_t<std::is_reference_v<Range>,
                                      std::remove_reference_t<Range>*,
                                      Range>;
  using iter_t = decltype(std::begin(std::declval<std::remove_reference_t<Range>&>()));

public:
  using value_type = typename std::iterator_traits<iter_t>::value_type;

  template <class R = Range, std::enable_if_t<std::is_reference_v<R>, int> = 0>
  explicit RangeSource(std::remove_reference_t<Range>& r)
    : range_(&r), it_(std::begin(r)), end_(std::end(r)) {}

  template <class R = Range, std::enable_if_t<!std::is_reference_v<R>, int> = 0>
  explicit RangeSource(Range&& r)
    : range_(std::move(r)), it_(std::begin(range_)), end_(std::end(range_)) {}

  // Iterators point into range_, so an owning source cannot be relocated
  // without rebinding them.
  RangeSource(RangeSource&& o) noexcept(std::is_nothrow_move_constructible_v<stored_t>)
    : range_(std::move(o.range_)) {
    if constexpr (std::is_reference_v<Range>) {
      it_ = o.it_; end_ = o.end_;
    } else {
      it_ = std::begin(range_); end_ = std::end(range_);
      std::advance(it_, o.consumed_);
      consumed_ = o.consumed_;
      o.it_ = o.end_;
    }
  }

  RangeSource(const RangeSource&) = delete;
  RangeSource& operator=(const RangeSource&) = delete;
  RangeSource& operator=(RangeSource&&) = delete;

  std::optional<value_type> next() {
    if (it_ == end_) return std::nullopt;
    ++consumed_;
    if constexpr (std::is_reference_v<Range>) {
      return std::optional<value_type>(*it_++);
    } else {
      return std::optional<value_type>(std::move(*it_++));
    }
  }

private:
  stored_t range_;
  iter_t it_{};
  iter_t end_{};
  std::size_t consumed_{0};
};

template <class Range>
auto from_range(Range&& r) {
  return RangeSource<Range>(std::forward<Range>(r));
}

// Pull source over a callable returning std::optional<T>.
template <class F>
class FnSource {
public:
  using value_type = typename detail::optional_value<std::invoke_result_t<F&>>::type;

  explicit FnSource(F f) : fn_(std::move(f)) {}

  std::optional<value_type> next() { return fn_(); }

private:
  F fn_;
};

template <class F>
FnSource<std::decay_t<F>> from_fn(F&& f) {
  return FnSource<std::decay_t<F>>(std::forward<F>(f));
}

}
