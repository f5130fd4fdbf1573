#include "chunk_iter/element_policy.hpp"
#include "chunk_iter/chunks.hpp"
#include <array>
#include <iostream>
#include <string>
#include <vector>

namespace {

std::vector<std::string> lines(std::initializer_list<const char*> l) {
  return std::vector<std::string>(l.begin(), l.end());
}

}

int main(){
  bool ok = true;
  ci::ElementPolicy policy;

  // numbers
  if (policy.parse_number(" 42 ") != 42.0) { std::cerr << "[FAIL] parse_number trims blanks\n"; ok = false; }
  if (policy.parse_number("-1.5e3") != -1500.0) { std::cerr << "[FAIL] parse_number exponent\n"; ok = false; }
  if (policy.parse_number("12abc")) { std::cerr << "[FAIL] parse_number accepts trailing junk\n"; ok = false; }
  if (policy.parse_number("")) { std::cerr << "[FAIL] parse_number accepts empty\n"; ok = false; }

  // json
  auto j = policy.normalize_json(R"({ "a" : [1, 2 ,3], "b": "x" })");
  if (!j || *j != R"({"a":[1,2,3],"b":"x"})") { std::cerr << "[FAIL] normalize_json minify\n"; ok = false; }
  if (policy.normalize_json("{\"a\":")) { std::cerr << "[FAIL] normalize_json accepts truncated doc\n"; ok = false; }

  // NumberSource chunked in threes, blank lines skipped
  {
    ci::NumberSource<ci::RangeSource<std::vector<std::string>>> src(
        ci::from_range(lines({"1", "2", "", "3", "4", " 5 ", "6", "7"})));
    auto c = ci::chunks<3>(std::move(src));
    auto a = c.next();
    auto b = c.next();
    if (!a || *a != std::array<double, 3>{1, 2, 3}) { std::cerr << "[FAIL] numbers chunk 1\n"; ok = false; }
    if (!b || *b != std::array<double, 3>{4, 5, 6}) { std::cerr << "[FAIL] numbers chunk 2\n"; ok = false; }
    if (c.next() || c.discarded() != 1) { std::cerr << "[FAIL] numbers remainder\n"; ok = false; }
  }

  // strict: a bad element mid-chunk surfaces as ElementError with its line
  {
    ci::NumberSource<ci::RangeSource<std::vector<std::string>>> src(
        ci::from_range(lines({"1", "2", "3", "4", "oops", "6"})));
    auto c = ci::chunks<3>(std::move(src));
    auto first = c.next();
    bool threw = false;
    try {
      (void)c.next();
    } catch (const ci::ElementError& e) {
      threw = (e.line() == 5);
    }
    if (!first || !threw) { std::cerr << "[FAIL] strict ElementError propagation\n"; ok = false; }
  }

  // skip: bad elements are counted and skipped
  {
    ci::ElementPolicy skip;
    skip.on_error = ci::ElementPolicy::OnError::Skip;
    ci::JsonValueSource<ci::RangeSource<std::vector<std::string>>> src(
        ci::from_range(lines({"{\"k\": 1}", "nope", "[1, 2]", "\"s\"", "null"})), skip);
    auto c = ci::chunks<2>(std::move(src));
    auto a = c.next();
    auto b = c.next();
    if (!a || (*a)[0].text != "{\"k\":1}" || (*a)[1].text != "[1,2]") { std::cerr << "[FAIL] json chunk 1\n"; ok = false; }
    if (!b || (*b)[0].text != "\"s\"" || (*b)[1].text != "null") { std::cerr << "[FAIL] json chunk 2\n"; ok = false; }
    if (c.source().rejected() != 1) { std::cerr << "[FAIL] rejected()=" << c.source().rejected() << "\n"; ok = false; }
  }

  if (!ok) return 1;
  std::cout << "[PASS] element_policy\n";
  return 0;
}
