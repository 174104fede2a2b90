#pragma once
#include "clf/metrics.hpp"
#include "clf/model_base.hpp"
#include <torch/torch.h>
#include <functional>
#include <limits>
#include <optional>
#include <string>

namespace clf {

// What the best-checkpoint file holds besides the model and optimizer state.
struct CheckpointRecord {
  int64_t epoch{-1};
  double val_accuracy{0.0};
};

// Writes {epoch, val_acc, model, optimizer} to path through a temporary file renamed
// over any previous snapshot. Throws std::runtime_error on I/O failure.
void save_checkpoint(const std::string& path, const CheckpointRecord& record,
                     torch::nn::Module& model, torch::optim::Optimizer& optimizer);

// Restores model (and optimizer when given) from a file written by save_checkpoint.
// Tensors are mapped onto device whatever device they were saved from.
CheckpointRecord load_checkpoint(const std::string& path, torch::nn::Module& model, torch::Device device,
                                 torch::optim::Optimizer* optimizer = nullptr);

// Keeps the single best epoch seen so far by top-1 validation accuracy.
class CheckpointSelector {
public:
  using Persist = std::function<void(const CheckpointRecord&)>;

  explicit CheckpointSelector(Persist persist) : persist_(std::move(persist)) {}

  // Replaces the held record and persists it iff val_acc is strictly greater than
  // the best so far. Returns whether it did.
  bool consider(int64_t epoch, double val_acc, const EpochMetrics& train, const EpochMetrics& val);

  double best_score() const { return best_score_; }
  const std::optional<CheckpointRecord>& best() const { return best_; }
  const std::optional<EpochMetrics>& best_train_metrics() const { return best_train_; }
  const std::optional<EpochMetrics>& best_val_metrics() const { return best_val_; }

private:
  Persist persist_;
  double best_score_{-std::numeric_limits<double>::infinity()};
  std::optional<CheckpointRecord> best_;
  std::optional<EpochMetrics> best_train_;
  std::optional<EpochMetrics> best_val_;
};

} // namespace clf
