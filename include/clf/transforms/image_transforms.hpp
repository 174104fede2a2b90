#pragma once
#include <opencv2/core.hpp>
#include <torch/torch.h>
#include <array>

namespace clf {
namespace transforms {

// ImageNet channel statistics, RGB order.
constexpr std::array<float, 3> kMean{0.485f, 0.456f, 0.406f};
constexpr std::array<float, 3> kStd{0.229f, 0.224f, 0.225f};

// Crop of a random area fraction and aspect ratio, resized to size x size.
// Falls back to a center crop after ten rejected draws.
cv::Mat random_resized_crop(const cv::Mat& img, int size,
                            double scale_min = 0.08, double scale_max = 1.0,
                            double ratio_min = 3.0 / 4.0, double ratio_max = 4.0 / 3.0);

cv::Mat random_horizontal_flip(const cv::Mat& img, double p = 0.5);

// Resizes so the shorter side equals size (bicubic).
cv::Mat resize_shorter(const cv::Mat& img, int size);

cv::Mat center_crop(const cv::Mat& img, int size);

// 8-bit BGR image -> float CHW RGB tensor in [0, 1].
torch::Tensor to_tensor(const cv::Mat& img);

// In-place per-channel (x - mean) / std on a CHW tensor.
torch::Tensor normalize(torch::Tensor chw);

// Full pipeline: randomized for the training split, deterministic otherwise.
class ImageTransform {
public:
  ImageTransform(int64_t size, bool train) : size_(static_cast<int>(size)), train_(train) {}
  torch::Tensor operator()(const cv::Mat& img) const;

  int64_t size() const { return size_; }
  bool train() const { return train_; }

private:
  int size_;
  bool train_;
};

} // namespace transforms
} // namespace clf
