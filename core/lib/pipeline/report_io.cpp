// tierflow/pipeline/report_io.cpp
//
#include "tierflow/pipeline/report_io.hpp"

#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace tierflow
{

void write_report(const fs::path & path, const nlohmann::json & document)
{
  if (path.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      throw std::runtime_error(
        "cannot create directory " + path.parent_path().string() + ": " + ec.message());
    }
  }

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    throw std::runtime_error("cannot open " + path.string() + " for writing");
  }
  out << document.dump(2) << '\n';
  if (!out) {
    throw std::runtime_error("failed to write " + path.string());
  }
}

std::optional<nlohmann::json> read_json_file(const fs::path & path, std::string * error)
{
  const auto fail = [&](std::string msg) -> std::optional<nlohmann::json> {
    if (error) *error = std::move(msg);
    return std::nullopt;
  };

  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    return fail(path.string() + " not found");
  }

  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    return fail("cannot open " + path.string());
  }

  nlohmann::json document = nlohmann::json::parse(in, nullptr, /*allow_exceptions*/ false);
  if (document.is_discarded()) {
    return fail(path.string() + " is not valid JSON");
  }
  return document;
}

}  // namespace tierflow
