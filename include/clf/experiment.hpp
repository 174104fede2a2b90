#pragma once
#include "clf/checkpoint.hpp"
#include "clf/config.hpp"
#include "clf/metrics.hpp"
#include "clf/telemetry.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace clf {

struct RunSummary {
  std::string run_dir;
  int64_t seed{0};
  std::optional<CheckpointRecord> best;
  nlohmann::json hparams;
  nlohmann::json metrics;     // "hparam/train_*", "hparam/val_*" of the best epoch
};

// Owns one training run: seed, run directory, model, optimizer, loss, the epoch loop
// and best-checkpoint selection.
//
// Run directory layout:
//   params.json                resolved config (with the seed actually used)
//   label_index.json           class index -> label name
//   metrics.jsonl              one record per (split/metric, epoch)
//   checkpoint_best_model.pt   best epoch by val top-1 accuracy
//   hparams.json               summary, written only when the run completes
class Experiment {
public:
  explicit Experiment(ExperimentConfig cfg, ITelemetrySink::Ptr sink = nullptr);

  RunSummary run();

  // The configured seed, or a fresh one in [0, 10000).
  static int64_t resolve_seed(const ExperimentConfig& cfg);

  // <root>/<YYYYmmdd_HHMMSS>, suffixed _1, _2 ... when taken.
  static std::string make_run_dir(const std::string& root);

  static torch::Device select_device(const std::string& name);

  // RMSprop learning rate derived from the batch size (and pretrained start).
  static double learning_rate(const ExperimentConfig& cfg);

private:
  ExperimentConfig cfg_;
  ITelemetrySink::Ptr sink_;
};

// Loads a best-model checkpoint and runs one evaluation pass over split.
EpochMetrics evaluate_checkpoint(const ExperimentConfig& cfg, const std::string& checkpoint_path,
                                 const std::string& split);

} // namespace clf
