#include <gtest/gtest.h>

#include "sdqc/features.hpp"
#include "sdqc/training_filter.hpp"
#include "test_util.hpp"

using namespace sdqc;
using sdqc::test::make_message;

namespace {

std::vector<std::string> ids(const std::vector<const Message*>& v)
{
    std::vector<std::string> out;
    for (const Message* m : v) out.push_back(m->id);
    return out;
}

class TrainingFilterTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        all.push_back(&store.add(make_message("R", "Breaking news: X happened")));
        all.push_back(&store.add(make_message("A", "Is that true?",            "R")));
        all.push_back(&store.add(make_message("B", "No it's not true",         "R")));
        all.push_back(&store.add(make_message("C", "lol same",                 "B")));
        all.push_back(&store.add(make_message("D", "BREAKING news: x happened!", "A")));
        all.push_back(&store.add(make_message("S", "short root")));
    }

    ThreadStore                 store;
    JsonFeatureExtractor        extractor;
    std::vector<const Message*> all;
};

} // namespace

TEST_F(TrainingFilterTest, DropsShortAndEchoingReplies)
{
    FilterStats st;
    auto kept = filter_training(all, store, extractor, true, 0.9, &st);
    EXPECT_EQ(ids(kept), (std::vector<std::string>{"R", "A", "B", "S"}));
    EXPECT_EQ(st.too_short, 1u);
    EXPECT_EQ(st.too_similar, 1u);
    EXPECT_EQ(st.kept, 4u);
}

TEST_F(TrainingFilterTest, ShortRepliesSurviveWithoutFilterShort)
{
    auto kept = filter_training(all, store, extractor, false, 0.9);
    EXPECT_EQ(ids(kept), (std::vector<std::string>{"R", "A", "B", "C", "S"}));
}

TEST_F(TrainingFilterTest, IdenticalTextIsFilteredAtThresholdOne)
{
    auto kept = filter_training(all, store, extractor, false, 1.0);
    EXPECT_EQ(ids(kept), (std::vector<std::string>{"R", "A", "B", "C", "S"}));
}

TEST_F(TrainingFilterTest, RootsAreNeverDropped)
{
    /* threshold 0 drops every reply, short roots stay */
    auto kept = filter_training(all, store, extractor, true, 0.0);
    EXPECT_EQ(ids(kept), (std::vector<std::string>{"R", "S"}));
}

TEST_F(TrainingFilterTest, PreservesRelativeOrder)
{
    std::vector<const Message*> reversed(all.rbegin(), all.rend());
    auto kept = filter_training(reversed, store, extractor, true, 0.9);
    EXPECT_EQ(ids(kept), (std::vector<std::string>{"S", "B", "A", "R"}));
}

TEST_F(TrainingFilterTest, UsesParseableTextWhenPresent)
{
    Message m = make_message("P", "something entirely different", "R");
    m.fields["parseable_text"] = "breaking news x happened";
    std::vector<const Message*> in{ &store.add(std::move(m)) };
    EXPECT_TRUE(filter_training(in, store, extractor, false, 0.9).empty());
}

TEST_F(TrainingFilterTest, QuotedRestatementOfRootIsFiltered)
{
    std::vector<const Message*> in{
        &store.add(make_message("Q", "“Breaking news: X happened”…", "R")),
        &store.add(make_message("E", "it’s “true” \U0001F602",       "R")),
    };
    FilterStats st;
    auto kept = filter_training(in, store, extractor, true, 0.9, &st);
    EXPECT_EQ(ids(kept), (std::vector<std::string>{"E"}));
    EXPECT_EQ(st.too_similar, 1u);
    EXPECT_EQ(st.too_short, 0u);
}
