#include "dgramipc/contract.hpp"

#include <gtest/gtest.h>

namespace dgramipc {

TEST(ContractTest, HoldingConditionIsNoOp) {
  int calls = 0;
  DGRAMIPC_CHECK(++calls == 1, "evaluated once");
  EXPECT_EQ(calls, 1);
}

TEST(ContractDeathTest, BrokenConditionAborts) {
  // Stays active whatever NDEBUG says.
  EXPECT_DEATH(DGRAMIPC_CHECK(1 + 1 == 3, "arithmetic is broken"), "");
}

}  // namespace dgramipc
