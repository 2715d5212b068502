// tierflow/pipeline/work_item.cpp
//
#include "tierflow/pipeline/work_item.hpp"

#include <algorithm>

#include "tierflow/basic/text.hpp"
#include "tierflow/pipeline/report_io.hpp"

namespace tierflow
{

namespace
{

bool label_in(const std::vector<std::string> & labels, const std::string & normalized)
{
  return std::any_of(labels.begin(), labels.end(), [&](const std::string & l) {
    return normalize_key(l) == normalized;
  });
}

std::string scalar_or(const nlohmann::json & j, const char * key, const char * fallback)
{
  const auto it = j.find(key);
  if (it == j.end() || it->is_null()) return fallback;
  if (it->is_string()) return it->get<std::string>();
  return it->dump();
}

}  // namespace

std::string_view to_string(Tier tier) noexcept
{
  switch (tier) {
    case Tier::Automated:
      return "automated";
    case Tier::FirstReasoning:
      return "first_reasoning";
    case Tier::SecondReasoning:
      return "second_reasoning";
  }
  return "automated";
}

Tier TierLabels::classify(std::string_view label) const
{
  const std::string normalized = normalize_key(label);
  if (label_in(first, normalized)) return Tier::FirstReasoning;
  if (label_in(second, normalized)) return Tier::SecondReasoning;
  return Tier::Automated;
}

bool TierLabels::is_automated_label(std::string_view label) const
{
  return label_in(automated, normalize_key(label));
}

WorkItem work_item_from_json(const nlohmann::json & j, const TierLabels & labels)
{
  WorkItem item;
  if (!j.is_object()) {
    item.id = "unknown";
    item.file = "unknown";
    item.metadata = j;
    return item;
  }

  item.id = scalar_or(j, "id", "unknown");
  item.file = scalar_or(j, "file", "unknown");
  item.pattern_type = scalar_or(j, "type", "");
  item.tier_label = scalar_or(j, "tier", "");
  item.tier = labels.classify(item.tier_label);
  item.metadata = j;
  return item;
}

std::vector<WorkItem> work_items_from_document(
  const nlohmann::json & document, const TierLabels & labels)
{
  std::vector<WorkItem> out;
  if (!document.is_object()) return out;

  const auto it = document.find("items");
  if (it == document.end() || !it->is_array()) return out;

  out.reserve(it->size());
  for (const auto & entry : *it) {
    out.push_back(work_item_from_json(entry, labels));
  }
  return out;
}

WorkItemLoadResult load_work_items(const std::filesystem::path & path, const TierLabels & labels)
{
  WorkItemLoadResult result;

  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    result.warning = "work-items file not found at " + path.string();
    return result;
  }
  result.found = true;

  std::string error;
  const auto document = read_json_file(path, &error);
  if (!document) {
    result.warning = "could not load work items: " + error;
    return result;
  }
  if (!document->is_object()) {
    result.warning = "could not load work items: " + path.string() + " is not a JSON object";
    return result;
  }

  result.items = work_items_from_document(*document, labels);
  return result;
}

}  // namespace tierflow
