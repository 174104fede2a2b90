#pragma once
#include "clf/metrics.hpp"
#include "clf/model_base.hpp"
#include "clf/running_statistic.hpp"
#include <torch/torch.h>
#include <functional>
#include <vector>

namespace clf {

enum class Mode { Train, Eval };

const char* mode_name(Mode m);

// (scores, targets) -> scalar mean loss over the batch.
using LossFn = std::function<torch::Tensor(const torch::Tensor&, const torch::Tensor&)>;

// Cross-entropy on class indices, or BCE-with-logits on multi-hot targets.
LossFn make_loss(bool multilabel);

// Runs one pass over a sequence of batches.
//
// Train: gradients enabled, one optimizer step per batch. The model runs its training
// behavior (batch-norm statistics, dropout) unless finetune is set, in which case it
// stays in inference behavior and only parameters that still require grad are updated.
// Eval: gradients disabled, inference behavior, no optimizer.
class EpochRunner {
public:
  EpochRunner(IModel::Ptr model, torch::Device device, std::vector<int64_t> top,
              bool finetune = false, int64_t log_interval = 50);

  // Loader is any range of torch::data::Example<> (a torch data loader, a vector...).
  // loss may be null in Eval mode; Train mode requires both loss and optimizer.
  template <typename Loader>
  EpochMetrics run(Mode mode, Loader& loader, const LossFn* loss,
                   torch::optim::Optimizer* optimizer = nullptr) {
    begin(mode, loss, optimizer);
    torch::AutoGradMode grad(mode == Mode::Train);
    for (auto& batch : loader) step(batch.data, batch.target);
    return finish();
  }

  const std::vector<int64_t>& top() const { return top_; }
  int64_t steps_taken() const { return steps_; }

private:
  void begin(Mode mode, const LossFn* loss, torch::optim::Optimizer* optimizer);
  void step(const torch::Tensor& data, const torch::Tensor& target);
  EpochMetrics finish();

  IModel::Ptr model_;
  torch::Device device_;
  std::vector<int64_t> top_;
  bool finetune_;
  int64_t log_interval_;

  // per-pass state
  Mode mode_{Mode::Eval};
  const LossFn* loss_fn_{nullptr};
  torch::optim::Optimizer* optimizer_{nullptr};
  RunningStatistic loss_;
  std::vector<RunningStatistic> acc_;
  int64_t batches_{0};
  int64_t steps_{0};
};

} // namespace clf
