// tierflow/pipeline/tier_classifier.cpp
//
#include "tierflow/pipeline/tier_classifier.hpp"

#include <fmt/core.h>

#include <algorithm>

namespace tierflow
{

namespace
{

void finish_bucket(TierBucket & bucket)
{
  bucket.note = fmt::format("Total {} items; showing first {}", bucket.count, bucket.sample.size());
}

nlohmann::json j_bucket(const TierBucket & bucket)
{
  nlohmann::json items = nlohmann::json::array();
  for (const auto & item : bucket.sample) {
    items.push_back(item.metadata);
  }
  return nlohmann::json{
    {"count", bucket.count},
    {"description", bucket.description},
    {"items", std::move(items)},
    {"note", bucket.note}};
}

}  // namespace

ReviewBrief classify(const std::vector<WorkItem> & items, const ClassifierOptions & options)
{
  ReviewBrief brief;
  brief.total_items = items.size();

  brief.first.tier = Tier::FirstReasoning;
  brief.first.description = "Medium-complexity semantic patterns requiring first-tier reasoning";
  brief.second.tier = Tier::SecondReasoning;
  brief.second.description =
    "High-complexity patterns requiring second-tier reasoning "
    "(reflection, serialization, native extensions)";

  for (const auto & item : items) {
    TierBucket * bucket = nullptr;
    switch (item.tier) {
      case Tier::FirstReasoning:
        bucket = &brief.first;
        break;
      case Tier::SecondReasoning:
        bucket = &brief.second;
        break;
      case Tier::Automated:
        ++brief.automated_count;
        continue;
    }

    ++bucket->count;
    if (bucket->sample.size() < options.sample_cap) {
      bucket->sample.push_back(item);
    }
  }

  finish_bucket(brief.first);
  finish_bucket(brief.second);

  brief.estimated_tokens =
    brief.first.count * options.first_weight + brief.second.count * options.second_weight;
  brief.recommendation =
    "Run the first reasoning tier first for efficient cost, then escalate remaining "
    "second-tier items if first-tier classification is uncertain";
  return brief;
}

nlohmann::json to_json(const ReviewBrief & brief)
{
  return nlohmann::json{
    {"phase", "semantic"},
    {"purpose", "Curated work items requiring reasoning-tier review"},
    {"total_items_in_project", brief.total_items},
    {"items_requiring_review", brief.review_items()},
    {"first_tier", j_bucket(brief.first)},
    {"second_tier", j_bucket(brief.second)},
    {"summary",
     {{"automated_items", brief.automated_count},
      {"review_items", brief.review_items()},
      {"estimated_tokens", brief.estimated_tokens},
      {"recommendation", brief.recommendation}}}};
}

}  // namespace tierflow
