#include "clf/registry.hpp"
#include "model.hpp"

namespace clf {

ConvBNActImpl::ConvBNActImpl(int64_t in, int64_t out, int64_t kernel, int64_t stride,
                             int64_t groups, bool act)
    : act(act) {
  conv = register_module("conv", torch::nn::Conv2d(
      torch::nn::Conv2dOptions(in,out,kernel).stride(stride).padding(kernel/2).groups(groups).bias(false)));
  bn = register_module("bn", torch::nn::BatchNorm2d(
      torch::nn::BatchNorm2dOptions(out).momentum(0.01).eps(1e-3)));
}

torch::Tensor ConvBNActImpl::forward(torch::Tensor x) {
  x = bn->forward(conv->forward(x));
  return act ? torch::silu(x) : x;
}

MBConvBlockImpl::MBConvBlockImpl(int64_t in, int64_t out, int64_t stride, int64_t expand)
    : residual(stride == 1 && in == out) {
  const int64_t hidden = in * expand;
  if (expand != 1) expand_conv = register_module("expand_conv", ConvBNAct(in, hidden, 1, 1));
  depthwise = register_module("depthwise", ConvBNAct(hidden, hidden, 3, stride, hidden));
  project = register_module("project", ConvBNAct(hidden, out, 1, 1, 1, /*act=*/false));
}

torch::Tensor MBConvBlockImpl::forward(torch::Tensor x) {
  auto y = expand_conv ? expand_conv->forward(x) : x;
  y = project->forward(depthwise->forward(y));
  return residual ? x + y : y;
}

MBConvSmallImpl::MBConvSmallImpl(int64_t num_classes, double dropout_rate) {
  features = torch::nn::Sequential(
    ConvBNAct(3, 16, 3, 2),
    MBConvBlock(16, 16, 1, 1),
    MBConvBlock(16, 24, 2, 4),
    MBConvBlock(24, 24, 1, 4),
    MBConvBlock(24, 40, 2, 4),
    MBConvBlock(40, 40, 1, 4),
    MBConvBlock(40, 80, 2, 4),
    ConvBNAct(80, 320, 1, 1),
    torch::nn::AdaptiveAvgPool2d(1),
    torch::nn::Flatten()
  );
  dropout = torch::nn::Dropout(dropout_rate);
  fc = torch::nn::Linear(320, num_classes);
  register_module("features", features);
  register_module("dropout", dropout);
  register_module("fc", fc);
}

torch::Tensor MBConvSmallImpl::forward(torch::Tensor x) {
  return fc->forward(dropout->forward(features->forward(x)));
}

std::vector<torch::Tensor> MBConvSmallImpl::head_parameters() {
  return fc->parameters();
}

static IModel::Ptr make_mbconv_small(int64_t num_classes) {
  return std::make_shared<MBConvSmallImpl>(num_classes);
}
CLF_REGISTER_MODEL(mbconv_small, "mbconv_small", 128, make_mbconv_small);

} // namespace clf
