// tierflow/pipeline/work_item.hpp - Detected migration pattern occurrences
//
// Work items are produced by an external generator tool and only read here.
//
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tierflow
{

/// Ordered by reasoning cost: Automated < FirstReasoning < SecondReasoning.
enum class Tier : uint8_t {
  Automated,
  FirstReasoning,
  SecondReasoning,
};

[[nodiscard]] std::string_view to_string(Tier tier) noexcept;

/**
 * Tier labels as they appear in work items. Matching trims whitespace and
 * ignores case. A label that names neither reasoning tier is Automated.
 */
struct TierLabels
{
  std::vector<std::string> automated{"haiku"};
  std::vector<std::string> first{"sonnet"};
  std::vector<std::string> second{"opus"};

  [[nodiscard]] Tier classify(std::string_view label) const;

  /// True only for labels that explicitly name the automated tier.
  [[nodiscard]] bool is_automated_label(std::string_view label) const;
};

struct WorkItem
{
  std::string id;
  std::string file;
  std::string pattern_type;
  std::string tier_label;
  Tier tier = Tier::Automated;

  /// The item exactly as the generator emitted it.
  nlohmann::json metadata = nlohmann::json::object();
};

/**
 * Build a WorkItem from one generator entry.
 *
 * Missing `id`/`file` become "unknown"; non-string scalars are stringified.
 */
[[nodiscard]] WorkItem work_item_from_json(const nlohmann::json & j, const TierLabels & labels);

/// Items of a generator document's `items` array (empty if absent or not an array).
[[nodiscard]] std::vector<WorkItem> work_items_from_document(
  const nlohmann::json & document, const TierLabels & labels);

struct WorkItemLoadResult
{
  std::vector<WorkItem> items;

  /// Whether the file existed.
  bool found = false;

  /// Why the set is empty when the file was missing or unreadable.
  std::optional<std::string> warning;
};

/**
 * Read a work-items document. Never throws: a missing or malformed file
 * yields an empty set with `warning` set.
 */
[[nodiscard]] WorkItemLoadResult load_work_items(
  const std::filesystem::path & path, const TierLabels & labels);

}  // namespace tierflow
