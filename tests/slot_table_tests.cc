#include <gtest/gtest.h>

#include <string>

#include "render/slot_table.h"

namespace {

struct TestTag {};
using TestTable = skygrid::render::SlotTable<std::string, TestTag>;
using TestHandle = skygrid::render::ResourceHandle<TestTag>;

TEST(SlotTableTest, DefaultHandleNeverResolves) {
    TestTable table;
    table.insert("first");

    const TestHandle none{};
    EXPECT_FALSE(none.isValid());
    EXPECT_FALSE(table.contains(none));
    EXPECT_EQ(table.get(none), nullptr);
}

TEST(SlotTableTest, InsertedValueResolvesUntilRemoved) {
    TestTable table;
    const TestHandle handle = table.insert("sky");
    ASSERT_TRUE(handle.isValid());
    ASSERT_NE(table.get(handle), nullptr);
    EXPECT_EQ(*table.get(handle), "sky");
    EXPECT_EQ(table.size(), 1u);

    const std::optional<std::string> removed = table.remove(handle);
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(*removed, "sky");
    EXPECT_EQ(table.size(), 0u);
    EXPECT_EQ(table.get(handle), nullptr);
    EXPECT_FALSE(table.remove(handle).has_value());
}

TEST(SlotTableTest, ReusedSlotRejectsStaleHandle) {
    TestTable table;
    const TestHandle first = table.insert("a");
    ASSERT_TRUE(table.remove(first).has_value());

    const TestHandle second = table.insert("b");
    EXPECT_EQ(second.index, first.index);
    EXPECT_NE(second.generation, first.generation);
    EXPECT_FALSE(table.contains(first));
    ASSERT_NE(table.get(second), nullptr);
    EXPECT_EQ(*table.get(second), "b");
}

TEST(SlotTableTest, SlotAtMaxGenerationIsRetired) {
    TestTable table(2u);
    const TestHandle first = table.insert("a");
    ASSERT_TRUE(table.remove(first).has_value());
    const TestHandle second = table.insert("b");
    ASSERT_EQ(second.index, first.index);
    ASSERT_EQ(second.generation, 2u);
    ASSERT_TRUE(table.remove(second).has_value());
    EXPECT_EQ(table.retiredSlotCount(), 1u);

    const TestHandle third = table.insert("c");
    EXPECT_NE(third.index, first.index);
    EXPECT_FALSE(table.contains(first));
    EXPECT_FALSE(table.contains(second));
}

TEST(SlotTableTest, DrainVisitsEveryLiveValue) {
    TestTable table;
    const TestHandle a = table.insert("a");
    table.insert("b");
    table.insert("c");
    ASSERT_TRUE(table.remove(a).has_value());

    std::string visited;
    table.drain([&visited](std::string& value) { visited += value; });
    EXPECT_EQ(visited, "bc");
    EXPECT_EQ(table.size(), 0u);
}

}  // namespace
