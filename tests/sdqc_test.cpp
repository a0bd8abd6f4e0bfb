#include <sstream>

#include <gtest/gtest.h>

#include "sdqc/sdqc.hpp"
#include "sdqc/training_filter.hpp"
#include "test_util.hpp"

using namespace sdqc;
using sdqc::test::full_features;
using sdqc::test::make_message;

/*  R  "Breaking news: X happened"          support (root)
 *  ├─ A "Is that true?"                    query
 *  ├─ B "No it's not true"                 deny
 *  └─ C "lol same"                         comment, too short            */
class SdqcEndToEnd : public ::testing::Test {
protected:
    void SetUp() override
    {
        cfg = load_config(SDQC_DEFAULT_CONFIG);
        cfg.run.filter_short = true;
        cfg.run.threads      = 1;

        R = &store.add(make_message("R", "Breaking news: X happened", "",
            full_features({ {"text_stemmed_stopped", "break news x happen"},
                            {"is_news", true}, {"verified", true}, {"period_count", 0} })));
        A = &store.add(make_message("A", "Is that true?", "R",
            full_features({ {"text_stemmed_stopped", "true"},
                            {"text_minus_root", "is that true"},
                            {"question_mark_count", 1},
                            {"querying_words", {"true"}} })));
        B = &store.add(make_message("B", "No it's not true", "R",
            full_features({ {"text_stemmed_stopped", "true"},
                            {"text_minus_root", "no it not true"},
                            {"denying_words", {"not"}},
                            {"negative_words", {"no"}} })));
        C = &store.add(make_message("C", "lol same", "R",
            full_features({ {"text_stemmed_stopped", "lol same"},
                            {"text_minus_root", "lol same"} })));

        train_ann = { {"R", Stance::Support}, {"A", Stance::Query},
                      {"B", Stance::Deny},    {"C", Stance::Comment} };
    }

    ThreadStore    store;
    SdqcConfig     cfg;
    const Message *R = nullptr, *A = nullptr, *B = nullptr, *C = nullptr;
    Annotations    train_ann;
};

TEST_F(SdqcEndToEnd, RelabelsTrainingSet)
{
    OneVsRest deny  = relabel_one_vs_rest(train_ann, Stance::Deny);
    OneVsRest query = relabel_one_vs_rest(train_ann, Stance::Query);
    EXPECT_EQ(deny.at("A"), "not_deny");
    EXPECT_EQ(deny.at("B"), "deny");
    EXPECT_EQ(query.at("A"), "query");
    EXPECT_EQ(query.at("B"), "not_query");
}

TEST_F(SdqcEndToEnd, FiltersShortCommentReply)
{
    JsonFeatureExtractor ex(cfg.run.extractor);
    auto kept = filter_training({ R, A, B, C }, store, ex, true, cfg.run.similarity_threshold);
    EXPECT_EQ(kept, (std::vector<const Message*>{ R, A, B }));
}

TEST_F(SdqcEndToEnd, ClassifiesQueryAndDeny)
{
    JsonFeatureExtractor ex(cfg.run.extractor);
    auto search = make_grid_search(cfg.run.threads);

    Annotations eval_ann{ {"A", Stance::Query}, {"B", Stance::Deny} };
    std::ostringstream report;
    Annotations out = classify(store, { R, A, B, C }, { A, B }, train_ann, eval_ann,
                               ex, cfg, *search, report);

    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out.at("A"), Stance::Query);
    EXPECT_EQ(out.at("B"), Stance::Deny);

    const std::string text = report.str();
    EXPECT_NE(text.find("Misclassified - query"), std::string::npos);
    EXPECT_NE(text.find("Misclassified - deny"), std::string::npos);
    EXPECT_NE(text.find("Best base_grid score"), std::string::npos);
    EXPECT_NE(text.find("confusion matrix (combined w deny)"), std::string::npos);
}

TEST_F(SdqcEndToEnd, MissingAnnotationIsFatal)
{
    JsonFeatureExtractor ex;
    auto search = make_grid_search(1);
    Annotations partial{ {"A", Stance::Query} };
    std::ostringstream report;
    EXPECT_THROW(classify(store, { R, A, B, C }, { A, B }, train_ann, partial,
                          ex, cfg, *search, report),
                 std::runtime_error);
}

TEST_F(SdqcEndToEnd, MissingFeatureIsFatal)
{
    const Message* bare = &store.add(make_message("D", "where is the source for this", "R"));
    train_ann.emplace("D", Stance::Query);

    JsonFeatureExtractor ex;
    auto search = make_grid_search(1);
    Annotations eval_ann{ {"A", Stance::Query} };
    std::ostringstream report;
    EXPECT_THROW(classify(store, { R, A, B, bare }, { A }, train_ann, eval_ann,
                          ex, cfg, *search, report),
                 MissingFeatureError);
}

TEST_F(SdqcEndToEnd, EverythingFilteredIsFatal)
{
    JsonFeatureExtractor ex;
    auto search = make_grid_search(1);
    Annotations eval_ann{ {"A", Stance::Query} };
    std::ostringstream report;
    EXPECT_THROW(classify(store, { C }, { A }, train_ann, eval_ann, ex, cfg, *search, report),
                 std::runtime_error);
}
