#include "clf/catalog.hpp"
#include "log.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

using nlohmann::json;

namespace clf {

const std::vector<CatalogEntry>& DatasetCatalog::split(const std::string& name) const {
  auto it = splits.find(name);
  if (it == splits.end()) throw std::invalid_argument("Split not found: " + name);
  return it->second;
}

json DatasetCatalog::label_index_json() const {
  json j = json::object();
  for (size_t i = 0; i < idx_to_label.size(); ++i) j[std::to_string(i)] = idx_to_label[i];
  return j;
}

std::vector<std::vector<std::string>> read_csv(std::istream& in) {
  std::vector<std::vector<std::string>> rows;
  std::vector<std::string> row;
  std::string field;
  bool quoted = false;
  bool any = false;
  char ch;

  auto end_row = [&]() {
    if (any || !field.empty()) {
      row.push_back(field);
      rows.push_back(std::move(row));
    }
    row.clear(); field.clear(); any = false;
  };

  while (in.get(ch)) {
    if (quoted) {
      if (ch == '"') {
        if (in.peek() == '"') { field += '"'; in.get(ch); }
        else quoted = false;
      } else {
        field += ch;
      }
      continue;
    }
    switch (ch) {
      case '"':  quoted = true; any = true; break;
      case ',':  row.push_back(field); field.clear(); any = true; break;
      case '\r': break;
      case '\n': end_row(); break;
      default:   field += ch; any = true; break;
    }
  }
  if (quoted) throw std::invalid_argument("CSV: unterminated quoted field");
  end_row();
  return rows;
}

namespace {

std::string location_key(const std::string& dataset, const std::string& location) {
  return dataset + '\x1f' + location;
}

std::string json_field(const json& v) {
  return v.is_string() ? v.get<std::string>() : v.dump();
}

std::vector<std::string> split_labels(const std::string& s) {
  std::vector<std::string> out;
  std::stringstream ss(s);
  std::string tok;
  while (std::getline(ss, tok, ',')) out.push_back(tok);
  if (!s.empty() && s.back() == ',') out.emplace_back();   // getline drops the trailing empty token
  return out;
}

} // namespace

DatasetCatalog build_catalog(std::istream& csv, const json& splits,
                             const std::string& images_dir, bool multilabel) {
  if (!splits.is_object()) throw std::invalid_argument("splits JSON must be an object");

  // location -> split
  std::unordered_map<std::string, std::string> loc_to_split;
  for (auto& kv : splits.items()) {
    if (!kv.value().is_array()) throw std::invalid_argument("split '" + kv.key() + "' must be a list");
    for (auto& loc : kv.value()) {
      if (!loc.is_array() || loc.size() != 2)
        throw std::invalid_argument("split '" + kv.key() + "' entries must be [dataset, location]");
      auto key = location_key(json_field(loc[0]), json_field(loc[1]));
      auto ins = loc_to_split.emplace(key, kv.key());
      if (!ins.second && ins.first->second != kv.key()) {
        throw std::invalid_argument("location (" + json_field(loc[0]) + ", " + json_field(loc[1]) +
                                    ") appears in both '" + ins.first->second + "' and '" + kv.key() + "'");
      }
    }
  }

  auto rows = read_csv(csv);
  if (rows.empty()) throw std::invalid_argument("classification CSV is empty");

  const auto& header = rows.front();
  auto column = [&](const char* name) {
    auto it = std::find(header.begin(), header.end(), name);
    if (it == header.end()) throw std::invalid_argument(std::string("CSV: missing column '") + name + "'");
    return static_cast<size_t>(it - header.begin());
  };
  const size_t c_dataset = column("dataset"), c_location = column("location");
  const size_t c_path = column("path"), c_label = column("label");
  const size_t width = std::max({c_dataset, c_location, c_path, c_label}) + 1;

  struct Row { std::string split, path; std::vector<std::string> labels; };
  std::vector<Row> kept;
  std::set<std::string> all_labels;

  for (size_t r = 1; r < rows.size(); ++r) {
    const auto& row = rows[r];
    if (row.size() < width) throw std::invalid_argument("CSV: row " + std::to_string(r) + " is short");

    std::vector<std::string> labels;
    if (multilabel) {
      labels = split_labels(row[c_label]);
    } else {
      if (row[c_label].find(',') != std::string::npos)
        throw std::invalid_argument("CSV: row " + std::to_string(r) + " has a label list but multilabel is off");
      labels.push_back(row[c_label]);
    }
    if (labels.empty() || std::any_of(labels.begin(), labels.end(), [](auto& l) { return l.empty(); }))
      throw std::invalid_argument("CSV: row " + std::to_string(r) + " has an empty label");
    all_labels.insert(labels.begin(), labels.end());

    auto it = loc_to_split.find(location_key(row[c_dataset], row[c_location]));
    if (it == loc_to_split.end()) continue;
    kept.push_back({it->second, (std::filesystem::path(images_dir) / row[c_path]).string(), std::move(labels)});
  }

  DatasetCatalog cat;
  cat.multilabel = multilabel;
  cat.idx_to_label.assign(all_labels.begin(), all_labels.end());
  std::unordered_map<std::string, int64_t> label_to_idx;
  for (size_t i = 0; i < cat.idx_to_label.size(); ++i) label_to_idx[cat.idx_to_label[i]] = static_cast<int64_t>(i);

  for (auto& kv : splits.items()) cat.splits[kv.key()];
  for (auto& row : kept) {
    CatalogEntry e;
    e.path = std::move(row.path);
    for (auto& l : row.labels) e.labels.push_back(label_to_idx.at(l));
    cat.splits[row.split].push_back(std::move(e));
  }

  for (auto& kv : cat.splits)
    CLFLOG_I("split %s: %zu images", kv.first.c_str(), kv.second.size());
  return cat;
}

DatasetCatalog load_catalog(const std::string& csv_path, const std::string& splits_json_path,
                            const std::string& images_dir, bool multilabel) {
  std::ifstream splits_in(splits_json_path);
  if (!splits_in) throw std::runtime_error("Cannot open splits JSON: " + splits_json_path);
  json splits = json::parse(splits_in, nullptr, false);
  if (splits.is_discarded()) throw std::invalid_argument("Malformed splits JSON: " + splits_json_path);

  std::ifstream csv(csv_path);
  if (!csv) throw std::runtime_error("Cannot open classification CSV: " + csv_path);
  return build_catalog(csv, splits, images_dir, multilabel);
}

} // namespace clf
