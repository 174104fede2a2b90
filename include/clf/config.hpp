#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace clf {

// Hyperparameters of one run. Fixed once the experiment starts.
struct ExperimentConfig {
  std::string model_name{"cnn_small"};
  std::string classification_dataset_csv;
  std::string splits_json;
  std::string cropped_images_dir;
  std::string run_root{"run"};
  bool    multilabel{false};
  bool    pretrained{false};
  std::string pretrained_weights;
  bool    finetune{false};
  int64_t epochs{0};                  // 0 = evaluation only
  int64_t batch_size{256};
  int64_t num_workers{8};
  std::optional<int64_t> seed;        // drawn at run start when absent
  std::vector<int64_t> top_k{1, 3};
  int64_t image_size{0};              // 0 = model default
  std::string device{"cuda"};         // "cuda"|"cpu"
  int64_t log_interval{50};

  static ExperimentConfig from_json(const nlohmann::json& j);
  static ExperimentConfig load(const std::string& path);
  nlohmann::json to_json() const;

  // Throws std::invalid_argument on the first violated constraint.
  void validate() const;
};

// Settings of the HTTP control surface.
struct EngineConfig {
  std::string host{"0.0.0.0"};
  int port{18080};
  std::string run_root{"run"};

  static EngineConfig load(const std::string& path);
};

} // namespace clf
