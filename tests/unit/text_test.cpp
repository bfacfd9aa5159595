#include "internal/util/text.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <limits>
#include <string>

namespace {

using credpool::util::ParseInt;

void TestParseIntAcceptsValuesInRange() {
  assert(ParseInt("1", 1, 25) == int64_t{1});
  assert(ParseInt("25", 1, 25) == int64_t{25});
  assert(ParseInt("0", 0, std::numeric_limits<uint32_t>::max()) == int64_t{0});
  assert(ParseInt("4294967295", 0, std::numeric_limits<uint32_t>::max()) == int64_t{4294967295});
}

void TestParseIntRejectsValuesThatWouldWrap() {
  constexpr int64_t kInt32Max  = std::numeric_limits<int32_t>::max();
  constexpr int64_t kUint32Max = std::numeric_limits<uint32_t>::max();

  assert(!ParseInt("4294967297", 1, kInt32Max));
  assert(!ParseInt("2147483648", 1, kInt32Max));
  assert(!ParseInt("-1", 1, kInt32Max));
  assert(!ParseInt("-1", 0, kUint32Max));
  assert(!ParseInt("4294967296", 0, kUint32Max));
  assert(!ParseInt("99999999999999999999", 0, std::numeric_limits<int64_t>::max()));
}

void TestParseIntRejectsNonNumbers() {
  assert(!ParseInt("", 0, 10));
  assert(!ParseInt("3x", 0, 10));
  assert(!ParseInt(" 3", 0, 10));
  assert(!ParseInt("+3", 0, 10));
  assert(!ParseInt("ten", 0, 10));
}

void TestTrimSplitAndBasename() {
  assert(credpool::util::Trim("  a b \r\n") == "a b");
  assert(credpool::util::Split("a,,b", ',').size() == 3);
  assert(credpool::util::Basename("configs/peer1.conf") == "peer1.conf");
  assert(credpool::util::ToLower("[Interface]") == "[interface]");
}

} // namespace

int main() {
  TestParseIntAcceptsValuesInRange();
  TestParseIntRejectsValuesThatWouldWrap();
  TestParseIntRejectsNonNumbers();
  TestTrimSplitAndBasename();

  std::cout << "credpool_unit_text: pass\n";
  return 0;
}
