// Built with DLIST_CHECK_INVARIANTS so every mutation re-validates the chain.
#include <gtest/gtest.h>
#include "dlist/list.hpp"
#include "test_common.hpp"

#include <optional>
#include <random>

static_assert(dlist::CHECK_INVARIANTS, "list_checked_test needs DLIST_CHECK_INVARIANTS");

TEST(CheckedListTest, MutationsPassValidationSilently) {
    CerrCapture captured;

    dlist::DoublyLinkedList<int> list;
    std::mt19937 rng(7);
    for (int i = 0; i < 2000; ++i) {
        switch (rng() % 5) {
            case 0: list.append_left(i); break;
            case 1: list.append_right(i); break;
            case 2: static_cast<void>(list.pop_left()); break;
            case 3: static_cast<void>(list.pop_right()); break;
            case 4: list.emplace_right(-i); break;
        }
    }
    list.clear();

    EXPECT_TRUE(captured.text().empty()) << captured.text();
    EXPECT_TRUE(list.empty());
}

TEST(CheckedListTest, CollapseAndRefill) {
    dlist::DoublyLinkedList<int> list;
    list.append_right(1);
    EXPECT_EQ(list.pop_right(), 1);
    EXPECT_EQ(list.pop_left(), std::nullopt);
    list.append_left(2);
    list.append_right(3);
    EXPECT_EQ(list.pop_left(), 2);
    EXPECT_EQ(list.pop_right(), 3);
    EXPECT_TRUE(list.empty());
}

TEST(CheckedListDeathTest, CorruptedListAbortsOnNextMutation) {
    dlist::DoublyLinkedList<int> list;
    list.append_right(1);
    list.append_right(2);
    list.append_right(3);
    dlist::DoublyLinkedListTestAccess::length(list) = 7;
    EXPECT_DEATH(list.append_right(4), "chain holds 4 nodes but length is 8");
    dlist::DoublyLinkedListTestAccess::length(list) = 3;
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
