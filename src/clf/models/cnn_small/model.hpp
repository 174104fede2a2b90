#pragma once
#include "clf/model_base.hpp"

namespace clf {
struct CNNSmallImpl : public IModel {
  torch::nn::Sequential features;
  torch::nn::Linear fc{nullptr};
  explicit CNNSmallImpl(int64_t num_classes);
  torch::Tensor forward(torch::Tensor x) override;
  std::vector<torch::Tensor> head_parameters() override;
};
} // namespace clf
