#include "clf/registry.hpp"
#include "model.hpp"

namespace clf {
CNNSmallImpl::CNNSmallImpl(int64_t num_classes) {
  features = torch::nn::Sequential(
    torch::nn::Conv2d(torch::nn::Conv2dOptions(3,32,3).stride(1).padding(1)),
    torch::nn::ReLU(),
    torch::nn::MaxPool2d(2),
    torch::nn::Conv2d(torch::nn::Conv2dOptions(32,64,3).stride(1).padding(1)),
    torch::nn::ReLU(),
    torch::nn::AdaptiveAvgPool2d(1),
    torch::nn::Flatten()
  );
  fc = torch::nn::Linear(64, num_classes);
  register_module("features", features);
  register_module("fc", fc);
}
torch::Tensor CNNSmallImpl::forward(torch::Tensor x) {
  return fc->forward(features->forward(x));
}
std::vector<torch::Tensor> CNNSmallImpl::head_parameters() {
  return fc->parameters();
}

static IModel::Ptr make_cnn_small(int64_t num_classes) {
  return std::make_shared<CNNSmallImpl>(num_classes);
}
CLF_REGISTER_MODEL(cnn_small, "cnn_small", 64, make_cnn_small);

} // namespace clf
