// test_tier_classifier.cpp - Review brief partition and sampling

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "tierflow/pipeline/tier_classifier.hpp"

using tierflow::Tier;
using tierflow::WorkItem;

namespace
{

WorkItem make_item(const std::string & id, Tier tier)
{
  WorkItem item;
  item.id = id;
  item.file = id + ".py";
  item.tier = tier;
  item.metadata = {{"id", id}};
  return item;
}

}  // namespace

TEST(TierClassifier, EmptyInputGivesZeroBrief)
{
  const auto brief = tierflow::classify({});

  EXPECT_EQ(brief.total_items, 0u);
  EXPECT_EQ(brief.automated_count, 0u);
  EXPECT_EQ(brief.first.count, 0u);
  EXPECT_EQ(brief.second.count, 0u);
  EXPECT_EQ(brief.estimated_tokens, 0u);
  EXPECT_EQ(brief.first.note, "Total 0 items; showing first 0");
}

TEST(TierClassifier, PartitionsEveryItemExactlyOnce)
{
  std::vector<WorkItem> items;
  for (int i = 0; i < 7; ++i) items.push_back(make_item("a" + std::to_string(i), Tier::Automated));
  for (int i = 0; i < 3; ++i) {
    items.push_back(make_item("f" + std::to_string(i), Tier::FirstReasoning));
  }
  for (int i = 0; i < 2; ++i) {
    items.push_back(make_item("s" + std::to_string(i), Tier::SecondReasoning));
  }

  const auto brief = tierflow::classify(items);

  EXPECT_EQ(brief.total_items, 12u);
  EXPECT_EQ(brief.automated_count, 7u);
  EXPECT_EQ(brief.first.count, 3u);
  EXPECT_EQ(brief.second.count, 2u);
  EXPECT_EQ(brief.automated_count + brief.review_items(), brief.total_items);
  EXPECT_EQ(brief.estimated_tokens, 3u * 300u + 2u * 500u);
}

TEST(TierClassifier, SampleIsCappedAndOrdered)
{
  std::vector<WorkItem> items;
  for (int i = 0; i < 1000; ++i) {
    items.push_back(make_item("s" + std::to_string(i), Tier::SecondReasoning));
  }

  const auto brief = tierflow::classify(items);

  EXPECT_EQ(brief.second.count, 1000u);
  ASSERT_EQ(brief.second.sample.size(), 20u);
  EXPECT_EQ(brief.second.sample.front().id, "s0");
  EXPECT_EQ(brief.second.sample.back().id, "s19");
  EXPECT_EQ(brief.second.note, "Total 1000 items; showing first 20");
  EXPECT_EQ(brief.estimated_tokens, 500000u);
}

TEST(TierClassifier, OptionsOverrideCapAndWeights)
{
  std::vector<WorkItem> items;
  for (int i = 0; i < 10; ++i) {
    items.push_back(make_item("f" + std::to_string(i), Tier::FirstReasoning));
  }

  tierflow::ClassifierOptions options;
  options.sample_cap = 3;
  options.first_weight = 10;
  const auto brief = tierflow::classify(items, options);

  EXPECT_EQ(brief.first.sample.size(), 3u);
  EXPECT_EQ(brief.estimated_tokens, 100u);
}

TEST(TierClassifier, BriefJsonLayout)
{
  const auto brief = tierflow::classify(
    {make_item("a", Tier::Automated), make_item("f", Tier::FirstReasoning),
     make_item("s", Tier::SecondReasoning)});
  const auto j = tierflow::to_json(brief);

  EXPECT_EQ(j.at("phase"), "semantic");
  EXPECT_EQ(j.at("total_items_in_project"), 3);
  EXPECT_EQ(j.at("items_requiring_review"), 2);
  EXPECT_EQ(j.at("first_tier").at("count"), 1);
  EXPECT_EQ(j.at("first_tier").at("items").at(0).at("id"), "f");
  EXPECT_EQ(j.at("second_tier").at("note"), "Total 1 items; showing first 1");
  EXPECT_EQ(j.at("summary").at("automated_items"), 1);
  EXPECT_EQ(j.at("summary").at("estimated_tokens"), 800);
  EXPECT_TRUE(j.at("summary").at("recommendation").is_string());
}
