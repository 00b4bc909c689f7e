#include "LabelMap.hpp"
#include "Errors.hpp"
#include <gtest/gtest.h>

TEST(LabelMapTest, KeysFollowFirstOccurrence) {
    LabelMap map = LabelMap::fromLabels({"toaster", "not-toaster", "toaster", "kettle"});

    EXPECT_EQ(map.size(), 3);
    EXPECT_EQ(map.keyOf("toaster"), 0);
    EXPECT_EQ(map.keyOf("not-toaster"), 1);
    EXPECT_EQ(map.keyOf("kettle"), 2);
    EXPECT_EQ(map.valueOf(1), "not-toaster");
}

TEST(LabelMapTest, AddReturnsExistingKey) {
    LabelMap map;
    EXPECT_EQ(map.add("a"), 0);
    EXPECT_EQ(map.add("b"), 1);
    EXPECT_EQ(map.add("a"), 0);
    EXPECT_EQ(map.size(), 2);
}

TEST(LabelMapTest, UnknownLabelThrows) {
    LabelMap map = LabelMap::fromLabels({"toaster"});

    EXPECT_FALSE(map.contains("broccoli"));
    EXPECT_THROW(map.keyOf("broccoli"), UnseenLabelError);
    EXPECT_THROW(map.valueOf(1), std::out_of_range);
    EXPECT_THROW(map.valueOf(-1), std::out_of_range);
}
