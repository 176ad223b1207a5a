#include <gtest/gtest.h>

#include "layers/transport/transaction_counter.h"

using transport::TransactionCounter;

TEST(TransactionCounter, StartsAtZeroAndPostIncrements) {
    TransactionCounter counter;
    EXPECT_EQ(0, counter.next());
    EXPECT_EQ(1, counter.next());
    EXPECT_EQ(2, counter.peek());
}

TEST(TransactionCounter, WrapsAfter65536Ids) {
    TransactionCounter counter;
    for (int i = 0; i < 65536; ++i) {
        ASSERT_EQ(static_cast<std::uint16_t>(i), counter.next());
    }
    EXPECT_EQ(0, counter.next());
    EXPECT_EQ(1, counter.next());
}

TEST(TransactionCounter, WrapsFromMaximum) {
    TransactionCounter counter(0xFFFF);
    EXPECT_EQ(0xFFFF, counter.next());
    EXPECT_EQ(0, counter.next());
}
