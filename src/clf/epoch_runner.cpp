#include "clf/epoch_runner.hpp"
#include "clf/topk.hpp"
#include "log.h"
#include <cmath>
#include <stdexcept>

namespace clf {

const char* mode_name(Mode m) {
  return m == Mode::Train ? "train" : "eval";
}

LossFn make_loss(bool multilabel) {
  if (multilabel) {
    return [](const torch::Tensor& scores, const torch::Tensor& targets) {
      return torch::nn::functional::binary_cross_entropy_with_logits(
          scores, targets.to(scores.scalar_type()));
    };
  }
  return [](const torch::Tensor& scores, const torch::Tensor& targets) {
    return torch::nn::functional::cross_entropy(scores, targets);
  };
}

EpochRunner::EpochRunner(IModel::Ptr model, torch::Device device, std::vector<int64_t> top,
                         bool finetune, int64_t log_interval)
    : model_(std::move(model)), device_(device), top_(std::move(top)),
      finetune_(finetune), log_interval_(log_interval) {
  if (!model_) throw std::invalid_argument("EpochRunner: null model");
  if (top_.empty()) throw std::invalid_argument("EpochRunner: empty top-k set");
  if (log_interval_ <= 0) throw std::invalid_argument("EpochRunner: log_interval must be > 0");
}

void EpochRunner::begin(Mode mode, const LossFn* loss, torch::optim::Optimizer* optimizer) {
  if (mode == Mode::Train && (!loss || !optimizer))
    throw std::invalid_argument("EpochRunner: train mode needs a loss function and an optimizer");
  if (mode == Mode::Eval && optimizer)
    throw std::invalid_argument("EpochRunner: eval mode does not take an optimizer");

  mode_ = mode;
  loss_fn_ = loss;
  optimizer_ = optimizer;
  loss_.reset();
  acc_.assign(top_.size(), RunningStatistic{});
  batches_ = 0;
  steps_ = 0;

  // finetuning keeps batch-norm statistics and dropout in inference behavior
  model_->train(mode == Mode::Train && !finetune_);
}

void EpochRunner::step(const torch::Tensor& data, const torch::Tensor& target) {
  const int64_t batch_size = target.size(0);
  if (batch_size == 0) return;

  auto inputs  = data.to(device_, /*non_blocking=*/true);
  auto targets = target.to(device_, /*non_blocking=*/true);
  auto outputs = model_->forward(inputs);

  if (loss_fn_) {
    auto loss = (*loss_fn_)(outputs, targets);
    const double value = loss.item<double>();
    if (!std::isfinite(value))
      throw std::runtime_error("non-finite loss at batch " + std::to_string(batches_));
    loss_.update(value, batch_size);

    if (optimizer_) {
      optimizer_->zero_grad();
      loss.backward();
      optimizer_->step();
      ++steps_;
    }
  }

  auto correct = topk_correct(outputs, targets, top_);
  for (size_t i = 0; i < top_.size(); ++i) {
    acc_[i].update(static_cast<double>(correct[i]) * (100.0 / static_cast<double>(batch_size)), batch_size);
  }
  ++batches_;

  if (batches_ % log_interval_ == 0) {
    if (loss_fn_) {
      CLFLOG_D("[%s] batch %lld loss %.4f (%.4f) acc@%lld %.3f (%.3f)", mode_name(mode_),
               (long long)batches_, loss_.last(), loss_.avg(),
               (long long)top_.front(), acc_.front().last(), acc_.front().avg());
    } else {
      CLFLOG_D("[%s] batch %lld acc@%lld %.3f (%.3f)", mode_name(mode_), (long long)batches_,
               (long long)top_.front(), acc_.front().last(), acc_.front().avg());
    }
  }
}

EpochMetrics EpochRunner::finish() {
  std::optional<double> loss;
  if (loss_fn_) loss = loss_.avg();
  std::vector<std::pair<int64_t, double>> acc;
  acc.reserve(top_.size());
  for (size_t i = 0; i < top_.size(); ++i) acc.emplace_back(top_[i], acc_[i].avg());

  loss_fn_ = nullptr;
  optimizer_ = nullptr;
  return EpochMetrics(loss, std::move(acc));
}

} // namespace clf
