#pragma once
#include "clf/model_base.hpp"

namespace clf {

// Conv -> BatchNorm -> optional SiLU.
struct ConvBNActImpl : torch::nn::Module {
  torch::nn::Conv2d conv{nullptr};
  torch::nn::BatchNorm2d bn{nullptr};
  bool act;
  ConvBNActImpl(int64_t in, int64_t out, int64_t kernel, int64_t stride,
                int64_t groups = 1, bool act = true);
  torch::Tensor forward(torch::Tensor x);
};
TORCH_MODULE(ConvBNAct);

// Inverted residual: 1x1 expand -> depthwise 3x3 -> 1x1 project, skip when shapes match.
struct MBConvBlockImpl : torch::nn::Module {
  ConvBNAct expand_conv{nullptr};
  ConvBNAct depthwise{nullptr};
  ConvBNAct project{nullptr};
  bool residual;
  MBConvBlockImpl(int64_t in, int64_t out, int64_t stride, int64_t expand);
  torch::Tensor forward(torch::Tensor x);
};
TORCH_MODULE(MBConvBlock);

struct MBConvSmallImpl : public IModel {
  torch::nn::Sequential features;
  torch::nn::Dropout dropout{nullptr};
  torch::nn::Linear fc{nullptr};
  explicit MBConvSmallImpl(int64_t num_classes, double dropout_rate = 0.2);
  torch::Tensor forward(torch::Tensor x) override;
  std::vector<torch::Tensor> head_parameters() override;
};

} // namespace clf
