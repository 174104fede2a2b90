#pragma once
#include <torch/torch.h>
#include <memory>
#include <string>
#include <vector>

namespace clf {

class IModel : public torch::nn::Module {
public:
  using Ptr = std::shared_ptr<IModel>;
  virtual ~IModel() = default;
  virtual torch::Tensor forward(torch::Tensor x) = 0;

  // Parameters of the final classifier layer; the only ones updated when fine-tuning.
  virtual std::vector<torch::Tensor> head_parameters() = 0;
};

// Model plus the parameter group the optimizer is allowed to update.
struct ModelHandle {
  IModel::Ptr model;
  std::vector<torch::Tensor> trainable;
};

} // namespace clf
