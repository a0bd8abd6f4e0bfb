#include <gtest/gtest.h>

#include "sdqc/thread_store.hpp"
#include "test_util.hpp"

using namespace sdqc;
using sdqc::test::make_message;

class ThreadStoreTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        store.add(make_message("r",  "root"));
        store.add(make_message("a",  "reply",        "r"));
        store.add(make_message("b",  "nested reply", "a"));
        store.add(make_message("r2", "other root"));
    }
    ThreadStore store;
};

TEST_F(ThreadStoreTest, ResolvesRootsAndDepth)
{
    const Message& b = *store.find("b");
    EXPECT_EQ(store.root_of(b).id, "r");
    EXPECT_EQ(store.depth_of(b), 2u);
    EXPECT_EQ(store.depth_of(*store.find("r")), 0u);
    EXPECT_EQ(&store.root_of(*store.find("r2")), store.find("r2"));
    EXPECT_TRUE(store.is_root(*store.find("r")));
    EXPECT_FALSE(store.is_root(b));
}

TEST_F(ThreadStoreTest, KeepsInsertionOrder)
{
    std::vector<std::string> ids;
    for (const Message* m : store.messages()) ids.push_back(m->id);
    EXPECT_EQ(ids, (std::vector<std::string>{"r", "a", "b", "r2"}));
}

TEST_F(ThreadStoreTest, RejectsDuplicateIds)
{
    EXPECT_THROW(store.add(make_message("a", "again")), std::runtime_error);
    EXPECT_THROW(store.add(make_message("", "no id")), std::runtime_error);
    EXPECT_EQ(store.size(), 4u);
}

TEST_F(ThreadStoreTest, DanglingParentEndsTheWalk)
{
    const Message& orphan = store.add(make_message("o", "lost", "missing"));
    EXPECT_EQ(store.parent(orphan), nullptr);
    EXPECT_EQ(&store.root_of(orphan), &orphan);
    EXPECT_EQ(store.depth_of(orphan), 0u);
}

TEST(ThreadStore, CycleIsFatal)
{
    ThreadStore s;
    s.add(make_message("x", "x", "y"));
    s.add(make_message("y", "y", "x"));
    EXPECT_THROW(s.root_of(*s.find("x")), std::runtime_error);
    EXPECT_THROW(s.depth_of(*s.find("y")), std::runtime_error);
}

TEST(ThreadStore, SelfParentIsACycle)
{
    ThreadStore s;
    s.add(make_message("x", "x", "x"));
    EXPECT_THROW(s.root_of(*s.find("x")), std::runtime_error);
}
