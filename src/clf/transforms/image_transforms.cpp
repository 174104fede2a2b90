#include "clf/transforms/image_transforms.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace clf {
namespace transforms {

namespace {

// Draws from the process-wide torch generator so torch::manual_seed covers augmentation.
double uniform(double lo, double hi) {
  return torch::empty({1}, torch::kFloat64).uniform_(lo, hi).item<double>();
}

int64_t randint(int64_t lo, int64_t hi_exclusive) {
  return torch::randint(lo, hi_exclusive, {1}, torch::kLong).item<int64_t>();
}

void check_image(const cv::Mat& img) {
  if (img.empty()) throw std::invalid_argument("transform: empty image");
  if (img.type() != CV_8UC3) throw std::invalid_argument("transform: expected 8-bit 3-channel image");
}

} // namespace

cv::Mat random_resized_crop(const cv::Mat& img, int size, double scale_min, double scale_max,
                            double ratio_min, double ratio_max) {
  check_image(img);
  const int height = img.rows, width = img.cols;
  const double area = static_cast<double>(height) * width;
  const double log_lo = std::log(ratio_min), log_hi = std::log(ratio_max);

  cv::Rect roi;
  bool found = false;
  for (int attempt = 0; attempt < 10 && !found; ++attempt) {
    const double target_area = area * uniform(scale_min, scale_max);
    const double aspect = std::exp(uniform(log_lo, log_hi));
    const int w = static_cast<int>(std::lround(std::sqrt(target_area * aspect)));
    const int h = static_cast<int>(std::lround(std::sqrt(target_area / aspect)));
    if (w > 0 && h > 0 && w <= width && h <= height) {
      const int y = static_cast<int>(randint(0, height - h + 1));
      const int x = static_cast<int>(randint(0, width - w + 1));
      roi = cv::Rect(x, y, w, h);
      found = true;
    }
  }

  if (!found) {
    const double in_ratio = static_cast<double>(width) / height;
    int w = width, h = height;
    if (in_ratio < ratio_min) {
      h = std::min(height, static_cast<int>(std::lround(w / ratio_min)));
    } else if (in_ratio > ratio_max) {
      w = std::min(width, static_cast<int>(std::lround(h * ratio_max)));
    }
    roi = cv::Rect((width - w) / 2, (height - h) / 2, w, h);
  }

  cv::Mat out;
  cv::resize(img(roi), out, cv::Size(size, size), 0, 0, cv::INTER_LINEAR);
  return out;
}

cv::Mat random_horizontal_flip(const cv::Mat& img, double p) {
  if (uniform(0.0, 1.0) >= p) return img;
  cv::Mat out;
  cv::flip(img, out, 1);
  return out;
}

cv::Mat resize_shorter(const cv::Mat& img, int size) {
  check_image(img);
  const int shorter = std::min(img.rows, img.cols);
  if (shorter == size) return img;
  const double scale = static_cast<double>(size) / shorter;
  const int w = img.cols <= img.rows ? size : static_cast<int>(std::lround(img.cols * scale));
  const int h = img.rows <= img.cols ? size : static_cast<int>(std::lround(img.rows * scale));
  cv::Mat out;
  cv::resize(img, out, cv::Size(w, h), 0, 0, cv::INTER_CUBIC);
  return out;
}

cv::Mat center_crop(const cv::Mat& img, int size) {
  if (img.rows < size || img.cols < size)
    throw std::invalid_argument("center_crop: image smaller than crop size");
  const int y = (img.rows - size) / 2;
  const int x = (img.cols - size) / 2;
  return img(cv::Rect(x, y, size, size)).clone();
}

torch::Tensor to_tensor(const cv::Mat& img) {
  check_image(img);
  cv::Mat rgb, image_float;
  cv::cvtColor(img, rgb, cv::COLOR_BGR2RGB);
  rgb.convertTo(image_float, CV_32F, 1.0 / 255.0);
  auto options = torch::TensorOptions().dtype(torch::kFloat32);
  auto hwc = torch::from_blob(image_float.data, {image_float.rows, image_float.cols, 3}, options).clone();
  return hwc.permute({2, 0, 1}).contiguous();
}

torch::Tensor normalize(torch::Tensor chw) {
  if (chw.dim() != 3 || chw.size(0) != 3) throw std::invalid_argument("normalize: expected [3, H, W]");
  auto mean = torch::tensor({kMean[0], kMean[1], kMean[2]}).view({3, 1, 1});
  auto stdev = torch::tensor({kStd[0], kStd[1], kStd[2]}).view({3, 1, 1});
  return chw.sub_(mean).div_(stdev);
}

torch::Tensor ImageTransform::operator()(const cv::Mat& img) const {
  cv::Mat out;
  if (train_) {
    out = random_horizontal_flip(random_resized_crop(img, size_));
  } else {
    out = center_crop(resize_shorter(img, size_), size_);
  }
  return normalize(to_tensor(out));
}

} // namespace transforms
} // namespace clf
