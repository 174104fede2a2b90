#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <istream>
#include <map>
#include <string>
#include <vector>

namespace clf {

struct CatalogEntry {
  std::string path;               // image file, already prefixed with the images dir
  std::vector<int64_t> labels;    // one index unless multi-label
};

// Image/label lists per split plus the label index built from the whole CSV.
struct DatasetCatalog {
  bool multilabel{false};
  std::vector<std::string> idx_to_label;                  // sorted label names
  std::map<std::string, std::vector<CatalogEntry>> splits;

  int64_t num_classes() const { return static_cast<int64_t>(idx_to_label.size()); }
  const std::vector<CatalogEntry>& split(const std::string& name) const;
  nlohmann::json label_index_json() const;                 // {"0": "label", ...}
};

// Splits a CSV stream into rows of fields. Handles quoted fields with embedded
// commas and doubled quotes; blank lines are skipped.
std::vector<std::vector<std::string>> read_csv(std::istream& in);

// Builds the catalog from the classification CSV (columns dataset, location, path,
// label) and the splits JSON ({split: [[dataset, location], ...]}). Throws
// std::invalid_argument when splits overlap or labels are malformed.
DatasetCatalog load_catalog(const std::string& csv_path, const std::string& splits_json_path,
                            const std::string& images_dir, bool multilabel);

DatasetCatalog build_catalog(std::istream& csv, const nlohmann::json& splits,
                             const std::string& images_dir, bool multilabel);

} // namespace clf
