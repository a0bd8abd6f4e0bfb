#include <gtest/gtest.h>

#include "sdqc/ensemble.hpp"

using namespace sdqc;

namespace {
const Stance C = Stance::Comment, D = Stance::Deny, Q = Stance::Query, S = Stance::Support;
}

TEST(Combine, WithoutDenyCommentWins)
{
    auto out = combine(Strategy::WithoutDeny, { C, C }, { "deny", "not_deny" }, { "query", "query" });
    EXPECT_EQ(out, (std::vector<Stance>{ C, C }));
}

TEST(Combine, WithoutDenyQueryOverridesNonComment)
{
    auto out = combine(Strategy::WithoutDeny, { S, D, S }, { "deny", "deny", "not_deny" },
                       { "query", "query", "not_query" });
    EXPECT_EQ(out, (std::vector<Stance>{ Q, Q, S }));
}

TEST(Combine, WithoutDenyIgnoresDenyMember)
{
    auto out = combine(Strategy::WithoutDeny, { S }, { "deny" }, { "not_query" });
    EXPECT_EQ(out, (std::vector<Stance>{ S }));
}

TEST(Combine, WithDenyPriorityIsQueryThenDenyThenBase)
{
    auto out = combine(Strategy::WithDeny, { C, C, C, S },
                       { "deny", "deny", "not_deny", "not_deny" },
                       { "query", "not_query", "not_query", "not_query" });
    EXPECT_EQ(out, (std::vector<Stance>{ Q, D, C, S }));
}

TEST(Combine, LengthMismatchIsFatal)
{
    EXPECT_THROW(combine(Strategy::WithDeny, { C }, {}, { "query" }), std::runtime_error);
}

TEST(SelectStrategy, StrictlyBetterWins)
{
    /* gold deny, only with-deny gets it */
    auto r = select_strategy({ S }, { "deny" }, { "not_query" }, { D });
    EXPECT_EQ(r.chosen, Strategy::WithDeny);
    EXPECT_DOUBLE_EQ(r.acc_with_deny, 1.0);
    EXPECT_DOUBLE_EQ(r.acc_without_deny, 0.0);
    EXPECT_EQ(r.final_labels(), (std::vector<Stance>{ D }));
}

TEST(SelectStrategy, TieKeepsWithoutDeny)
{
    /* both sequences score 1/2 */
    auto r = select_strategy({ C, S }, { "deny", "deny" }, { "not_query", "not_query" }, { D, S });
    EXPECT_DOUBLE_EQ(r.acc_with_deny, r.acc_without_deny);
    EXPECT_EQ(r.chosen, Strategy::WithoutDeny);
    EXPECT_EQ(r.final_labels(), (std::vector<Stance>{ C, S }));
}

TEST(SelectStrategy, IsDeterministic)
{
    std::vector<Stance>      base{ C, S, D, Q, C };
    std::vector<std::string> deny{ "deny", "not_deny", "deny", "not_deny", "not_deny" };
    std::vector<std::string> query{ "not_query", "query", "not_query", "query", "query" };
    std::vector<Stance>      gold{ D, Q, D, Q, C };

    auto a = select_strategy(base, deny, query, gold);
    auto b = select_strategy(base, deny, query, gold);
    EXPECT_EQ(a.chosen, b.chosen);
    EXPECT_EQ(a.final_labels(), b.final_labels());
}
