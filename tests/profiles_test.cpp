#include <gtest/gtest.h>

#include "sdqc/profiles.hpp"

using namespace sdqc;

namespace {

const ChannelSpec& channel(const ClassifierProfile& p, const std::string& name)
{
    for (const auto& c : p.channels)
        if (c.name == name) return c;
    throw std::runtime_error("no channel " + name + " in " + p.name);
}

json minimal_profiles()
{
    json ch = json::array({ { {"name", "q"}, {"keys", "question_mark_count"} } });
    return { {"profiles", {
        {"base",  { {"channels", ch} }},
        {"deny",  { {"target", "deny"},  {"channels", ch} }},
        {"query", { {"target", "query"}, {"channels", ch} }} }} };
}

} // namespace

TEST(Profiles, ShippedConfigMatchesDefaults)
{
    SdqcConfig cfg = load_config(SDQC_DEFAULT_CONFIG);

    EXPECT_FALSE(cfg.run.filter_short);
    EXPECT_DOUBLE_EQ(cfg.run.similarity_threshold, 0.9);
    EXPECT_EQ(cfg.run.fold_count, 3);
    EXPECT_EQ(cfg.run.extractor.task, "A");

    EXPECT_FALSE(cfg.base.target.has_value());
    EXPECT_EQ(cfg.base.channels.size(), 17u);
    EXPECT_EQ(cfg.base.svm.kernel, Kernel::Rbf);
    EXPECT_DOUBLE_EQ(cfg.base.svm.C, 100);
    EXPECT_DOUBLE_EQ(cfg.base.svm.gamma, 0.001);
    EXPECT_FALSE(cfg.base.svm.balanced);
    EXPECT_DOUBLE_EQ(channel(cfg.base, "is_root").weight, 20.0);
    EXPECT_DOUBLE_EQ(channel(cfg.base, "is_news").weight, 5.0);
    EXPECT_EQ(channel(cfg.base, "tweet_text").keys, (std::vector<std::string>{"text_stemmed_stopped"}));
    EXPECT_EQ(channel(cfg.base, "tweet_text").encoding, Encoding::Text);
    EXPECT_TRUE(cfg.base.search.empty());

    EXPECT_TRUE(cfg.deny.target == Stance::Deny);
    EXPECT_EQ(cfg.deny.svm.kernel, Kernel::Linear);
    EXPECT_DOUBLE_EQ(cfg.deny.svm.C, 10);
    EXPECT_TRUE(cfg.deny.svm.balanced);
    EXPECT_DOUBLE_EQ(channel(cfg.deny, "denying_words").weight, 5.0);
    EXPECT_EQ(channel(cfg.deny, "tweet_text").keys, (std::vector<std::string>{"text_minus_root"}));

    EXPECT_TRUE(cfg.query.target == Stance::Query);
    EXPECT_DOUBLE_EQ(cfg.query.svm.C, 1);
    EXPECT_TRUE(cfg.query.svm.balanced);
    EXPECT_EQ(cfg.query.channels.size(), 6u);
    EXPECT_DOUBLE_EQ(channel(cfg.query, "count_question_marks").weight, 5.0);
    EXPECT_EQ(channel(cfg.query, "pos_neg_sentiment").keys,
              (std::vector<std::string>{"positive_words", "negative_words"}));
}

TEST(Profiles, ShippedTuningConfigExpandsItsGrids)
{
    SdqcConfig cfg = load_config(SDQC_TUNING_CONFIG);

    /* same channel tables as the default run, only the grids differ */
    EXPECT_EQ(cfg.base.channels.size(),  17u);
    EXPECT_EQ(cfg.deny.channels.size(),  10u);
    EXPECT_EQ(cfg.query.channels.size(), 6u);
    EXPECT_EQ(cfg.run.fold_count, 3);

    /* 3 C x 2 gamma x 2 kernels x 4 is_news x 4 is_root */
    auto base = cfg.base.search.expand(cfg.base.svm);
    ASSERT_EQ(base.size(), 192u);
    EXPECT_DOUBLE_EQ(base.front().svm.C, 1);
    EXPECT_DOUBLE_EQ(base.front().svm.gamma, 0.001);
    EXPECT_EQ(base.front().svm.kernel, Kernel::Rbf);
    EXPECT_DOUBLE_EQ(base.front().weights.at("is_news"), 1.0);
    EXPECT_DOUBLE_EQ(base.back().svm.C, 100);
    EXPECT_DOUBLE_EQ(base.back().svm.gamma, 0.0001);
    EXPECT_EQ(base.back().svm.kernel, Kernel::Poly);
    EXPECT_DOUBLE_EQ(base.back().weights.at("is_root"), 20.0);

    /* 3 C x 3 count_ellipsis x 3 denying_words, kernel stays linear */
    auto deny = cfg.deny.search.expand(cfg.deny.svm);
    ASSERT_EQ(deny.size(), 27u);
    for (const auto& c : deny) {
        EXPECT_EQ(c.svm.kernel, Kernel::Linear);
        EXPECT_TRUE(c.svm.balanced);
    }

    /* 3 C x 1 count_question_marks x 3 querying_words */
    auto query = cfg.query.search.expand(cfg.query.svm);
    ASSERT_EQ(query.size(), 9u);
    ClassifierProfile tuned = cfg.query;
    tuned.channels = cfg.query.channels_for(query.back());
    EXPECT_DOUBLE_EQ(channel(tuned, "count_question_marks").weight, 5.0);
    EXPECT_DOUBLE_EQ(channel(tuned, "querying_words").weight, 10.0);
    EXPECT_DOUBLE_EQ(query.back().svm.C, 100);
}

TEST(Profiles, MinimalConfigUsesBuiltInDefaults)
{
    SdqcConfig cfg = parse_config(minimal_profiles());
    EXPECT_EQ(cfg.base.channels.front().keys, (std::vector<std::string>{"question_mark_count"}));
    EXPECT_EQ(cfg.base.channels.front().encoding, Encoding::Numeric);
    EXPECT_DOUBLE_EQ(cfg.base.channels.front().weight, 1.0);
    EXPECT_EQ(cfg.run.fold_count, 3);
}

TEST(Profiles, RejectsMalformedConfig)
{
    json j = minimal_profiles();
    j["profiles"]["base"]["channels"][0]["weight"] = -1.0;
    EXPECT_THROW(parse_config(j), std::runtime_error);

    j = minimal_profiles();
    j["profiles"]["deny"]["svm"] = { {"kernel", "sigmoid"} };
    EXPECT_THROW(parse_config(j), std::runtime_error);

    j = minimal_profiles();
    j["profiles"]["query"]["channels"][0]["encoding"] = "ordinal";
    EXPECT_THROW(parse_config(j), std::runtime_error);

    j = minimal_profiles();
    j["profiles"].erase("query");
    EXPECT_THROW(parse_config(j), std::runtime_error);

    j = minimal_profiles();
    j["profiles"]["deny"]["target"] = "support";
    EXPECT_THROW(parse_config(j), std::runtime_error);

    j = minimal_profiles();
    j["profiles"]["base"]["search"] = { {"weights", { {"nope", {1.0}} }} };
    EXPECT_THROW(parse_config(j), std::runtime_error);

    j = minimal_profiles();
    j["run"] = { {"fold_count", 1} };
    EXPECT_THROW(parse_config(j), std::runtime_error);

    j = minimal_profiles();
    j["run"] = { {"similarity_threshold", -0.5} };
    EXPECT_THROW(parse_config(j), std::runtime_error);
}

TEST(Profiles, OverriddenRunSettingsAreValidated)
{
    RunConfig r;
    EXPECT_NO_THROW(validate(r));

    r.similarity_threshold = -0.1;
    EXPECT_THROW(validate(r), std::runtime_error);

    r = RunConfig{};
    r.similarity_threshold = 0.0;     // drops every reply
    EXPECT_NO_THROW(validate(r));
    r.similarity_threshold = 1.5;     // similarity filter off
    EXPECT_NO_THROW(validate(r));

    r = RunConfig{};
    r.fold_count = 0;
    EXPECT_THROW(validate(r), std::runtime_error);

    r = RunConfig{};
    r.threads = -2;
    EXPECT_THROW(validate(r), std::runtime_error);
}

TEST(Profiles, SearchSectionAndWeightOverrides)
{
    json j = minimal_profiles();
    j["profiles"]["base"]["search"] = { {"C", {1, 10}}, {"kernel", {"rbf", "poly"}},
                                        {"weights", { {"q", {0.5, 5.0}} }} };
    SdqcConfig cfg = parse_config(j);
    auto cands = cfg.base.search.expand(cfg.base.svm);
    ASSERT_EQ(cands.size(), 8u);
    EXPECT_EQ(cands.back().svm.kernel, Kernel::Poly);
    EXPECT_DOUBLE_EQ(cfg.base.channels_for(cands.back()).front().weight, 5.0);
    EXPECT_NE(describe(cands.back().svm).find("kernel=poly"), std::string::npos);
}
