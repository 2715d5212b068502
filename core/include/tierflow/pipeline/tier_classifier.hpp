// tierflow/pipeline/tier_classifier.hpp - Partition work items by tier
//
// Builds the review brief handed to the reasoning tiers: exact counts plus a
// bounded sample per tier, so the volume sent to expensive review is capped
// and truncation is always stated.
//
#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "tierflow/pipeline/work_item.hpp"

namespace tierflow
{

struct ClassifierOptions
{
  size_t sample_cap = 20;

  /// Advisory tokens per item, per reasoning tier.
  uint64_t first_weight = 300;
  uint64_t second_weight = 500;
};

struct TierBucket
{
  Tier tier = Tier::FirstReasoning;
  size_t count = 0;
  std::vector<WorkItem> sample;
  std::string description;

  /// "Total N items; showing first M"
  std::string note;
};

struct ReviewBrief
{
  size_t total_items = 0;
  size_t automated_count = 0;
  TierBucket first;
  TierBucket second;

  /// Planning aid only.
  uint64_t estimated_tokens = 0;
  std::string recommendation;

  [[nodiscard]] size_t review_items() const noexcept { return first.count + second.count; }
};

/**
 * Partition `items` by their tier.
 *
 * Every item lands in exactly one of: automated, first tier, second tier.
 * Samples keep input order and never exceed `options.sample_cap`.
 */
[[nodiscard]] ReviewBrief classify(
  const std::vector<WorkItem> & items, const ClassifierOptions & options = {});

/// semantic-review-brief.json layout
[[nodiscard]] nlohmann::json to_json(const ReviewBrief & brief);

}  // namespace tierflow
