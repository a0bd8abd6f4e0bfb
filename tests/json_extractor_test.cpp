#include <gtest/gtest.h>

#include "sdqc/feature_composer.hpp"
#include "sdqc/features.hpp"
#include "test_util.hpp"

using namespace sdqc;
using sdqc::test::make_message;

class JsonExtractorTest : public ::testing::Test {
protected:
    ThreadStore          store;
    JsonFeatureExtractor extractor;
};

TEST_F(JsonExtractorTest, NormalizeSplitsOnTypographicPunctuation)
{
    const Message& m = store.add(make_message("1", "It’s… “TRUE”!! \U0001F602 Ça va"));
    EXPECT_EQ(extractor.normalize_text(m), "it s true ça va");
}

TEST_F(JsonExtractorTest, NormalizeStripsTagsWhenAsked)
{
    JsonFeatureExtractor strip(ExtractOptions{"A", true, true});
    const Message& m = store.add(make_message("1", "@bbc #breaking news… “confirmed”"));
    EXPECT_EQ(strip.normalize_text(m), "news confirmed");
    EXPECT_EQ(extractor.normalize_text(m), "bbc breaking news confirmed");
}

TEST_F(JsonExtractorTest, DerivedCharCountIsInCodePoints)
{
    const Message& m = store.add(make_message("1", "“é” \U0001F602"));
    FeatureBag bag = extractor.extract(m, store, ExtractOptions{});
    EXPECT_EQ(std::get<double>(bag.at("char_count")), 5.0);
    EXPECT_EQ(std::get<bool>(bag.at("is_root")), true);
}

TEST_F(JsonExtractorTest, NullFeatureIsMissingNotZero)
{
    const Message& m = store.add(make_message("1", "no way", "",
                                              json{ {"denying_words", nullptr}, {"period_count", 2} }));
    FeatureBag bag = extractor.extract(m, store, ExtractOptions{});
    EXPECT_EQ(bag.count("denying_words"), 0u);
    EXPECT_EQ(bag.count("period_count"),  1u);

    FeatureComposer fc(std::vector<ChannelSpec>{ {"denying_words", {"denying_words"}, Encoding::Numeric, 1.0} });
    std::vector<const FeatureBag*> in{ &bag };
    EXPECT_THROW(fc.fit_transform(in), MissingFeatureError);
}

TEST_F(JsonExtractorTest, NullInsideListIsRejected)
{
    EXPECT_THROW(feature_from_json(json::array({"no", nullptr})), std::runtime_error);
    EXPECT_THROW(feature_from_json(json(nullptr)), std::runtime_error);
}
