/***
 * Name: test_parse_memory
 * Purpose: Repeated identical parses leave no live allocations behind.
 * Theory of Operation: Replaces the global allocation functions in this test
 *   binary with counting versions, warms up the function-local tables with
 *   one parse, then checks the live count is unchanged after more parses.
 */
#include <gtest/gtest.h>
#include <atomic>
#include <cstdlib>
#include <new>
#include <string>
#include "pytd/Printer.h"
#include "pytdc/parse.h"

namespace {
std::atomic<long long> gLiveAllocations{0};
} // namespace

void* operator new(std::size_t size) {
  void* ptr = std::malloc(size == 0 ? 1 : size);
  if (ptr == nullptr) { throw std::bad_alloc(); }
  gLiveAllocations.fetch_add(1, std::memory_order_relaxed);
  return ptr;
}

void operator delete(void* ptr) noexcept {
  if (ptr == nullptr) { return; }
  gLiveAllocations.fetch_sub(1, std::memory_order_relaxed);
  std::free(ptr);
}

void operator delete(void* ptr, std::size_t /*size*/) noexcept { operator delete(ptr); }

namespace {
const char* kSource =
    "from typing import List\n"
    "if sys.version_info >= (3,):\n"
    "  y = ...  # type: int\n"
    "class A(List[int]):\n"
    "  def f(self, y: str = None) -> A: ...\n"
    "  def f(self, y: int) -> int: ...\n"
    "x = ...  # type: NamedTuple(rec, [(a, int)])\n"
    "def g(*args, **kwargs) -> int:\n"
    "  raise ValueError()\n";

bool parseAndPrint(const std::string& source) {
  const auto result = pytdc::ParseString(source);
  if (!result.ok()) { return false; }
  return !pytdc::pytd::Print(result.module()).empty();
}
} // namespace

TEST(ParseMemory, RepeatedParsesDoNotGrow) {
  const std::string source(kSource);
  ASSERT_TRUE(parseAndPrint(source));
  const long long before = gLiveAllocations.load();
  bool ok = true;
  for (int i = 0; i < 3; ++i) { ok = parseAndPrint(source) && ok; }
  const long long after = gLiveAllocations.load();
  EXPECT_TRUE(ok);
  EXPECT_EQ(after, before);
}

TEST(ParseMemory, RepeatedFailuresDoNotGrow) {
  const std::string source("class Foo:\n  def m(): pass\n  an error\n");
  ASSERT_FALSE(parseAndPrint(source));
  const long long before = gLiveAllocations.load();
  for (int i = 0; i < 3; ++i) { (void)parseAndPrint(source); }
  EXPECT_EQ(gLiveAllocations.load(), before);
}
