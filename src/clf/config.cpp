#include "clf/config.hpp"
#include "clf/registry.hpp"
#include <fstream>
#include <set>
#include <stdexcept>

using nlohmann::json;

namespace clf {

namespace {

json read_json_file(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw std::runtime_error("Cannot open JSON file: " + path);
  json j = json::parse(in, nullptr, false);
  if (j.is_discarded()) throw std::invalid_argument("Malformed JSON file: " + path);
  return j;
}

template <typename T>
void read_field(const json& j, const char* key, T& out) {
  if (!j.contains(key) || j[key].is_null()) return;
  try {
    out = j[key].get<T>();
  } catch (const json::exception& e) {
    throw std::invalid_argument(std::string("Config field '") + key + "': " + e.what());
  }
}

} // namespace

ExperimentConfig ExperimentConfig::from_json(const json& j) {
  if (!j.is_object()) throw std::invalid_argument("Experiment config must be a JSON object");
  ExperimentConfig c;
  read_field(j, "model_name",                 c.model_name);
  read_field(j, "classification_dataset_csv", c.classification_dataset_csv);
  read_field(j, "splits_json",                c.splits_json);
  read_field(j, "cropped_images_dir",         c.cropped_images_dir);
  read_field(j, "run_root",                   c.run_root);
  read_field(j, "multilabel",                 c.multilabel);
  read_field(j, "pretrained",                 c.pretrained);
  read_field(j, "pretrained_weights",         c.pretrained_weights);
  read_field(j, "finetune",                   c.finetune);
  read_field(j, "epochs",                     c.epochs);
  read_field(j, "batch_size",                 c.batch_size);
  read_field(j, "num_workers",                c.num_workers);
  read_field(j, "top_k",                      c.top_k);
  read_field(j, "image_size",                 c.image_size);
  read_field(j, "device",                     c.device);
  read_field(j, "log_interval",               c.log_interval);
  if (j.contains("seed") && !j["seed"].is_null()) {
    int64_t seed = 0;
    read_field(j, "seed", seed);
    c.seed = seed;
  }
  return c;
}

ExperimentConfig ExperimentConfig::load(const std::string& path) {
  return from_json(read_json_file(path));
}

json ExperimentConfig::to_json() const {
  json j{
    {"model_name", model_name},
    {"classification_dataset_csv", classification_dataset_csv},
    {"splits_json", splits_json},
    {"cropped_images_dir", cropped_images_dir},
    {"run_root", run_root},
    {"multilabel", multilabel},
    {"pretrained", pretrained},
    {"pretrained_weights", pretrained_weights},
    {"finetune", finetune},
    {"epochs", epochs},
    {"batch_size", batch_size},
    {"num_workers", num_workers},
    {"top_k", top_k},
    {"image_size", image_size},
    {"device", device},
    {"log_interval", log_interval},
  };
  j["seed"] = seed ? json(*seed) : json(nullptr);
  return j;
}

void ExperimentConfig::validate() const {
  if (model_name.empty()) throw std::invalid_argument("model_name is empty");
  if (!Registry::get().contains(model_name))
    throw std::invalid_argument("Unknown model: " + model_name);
  if (epochs < 0) throw std::invalid_argument("epochs must be >= 0");
  if (batch_size <= 0) throw std::invalid_argument("batch_size must be > 0");
  if (num_workers < 0) throw std::invalid_argument("num_workers must be >= 0");
  if (image_size < 0) throw std::invalid_argument("image_size must be >= 0");
  if (log_interval <= 0) throw std::invalid_argument("log_interval must be > 0");
  if (top_k.empty()) throw std::invalid_argument("top_k must name at least one k");
  std::set<int64_t> seen;
  for (auto k : top_k) {
    if (k <= 0) throw std::invalid_argument("top_k values must be positive");
    if (!seen.insert(k).second) throw std::invalid_argument("top_k values must be distinct");
  }
  if (!seen.count(1)) throw std::invalid_argument("top_k must include 1 (checkpoints are chosen by top-1)");
  if (pretrained && pretrained_weights.empty())
    throw std::invalid_argument("pretrained requires pretrained_weights");
  if (device != "cuda" && device != "cpu")
    throw std::invalid_argument("device must be 'cuda' or 'cpu': " + device);
}

EngineConfig EngineConfig::load(const std::string& path) {
  auto j = read_json_file(path);
  EngineConfig c;
  read_field(j, "host",     c.host);
  read_field(j, "port",     c.port);
  read_field(j, "run_root", c.run_root);
  if (c.port <= 0 || c.port > 65535) throw std::invalid_argument("port out of range");
  return c;
}

} // namespace clf
