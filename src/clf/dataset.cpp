#include "clf/dataset.hpp"
#include <opencv2/imgcodecs.hpp>
#include <stdexcept>

namespace clf {

ImageDataset::ImageDataset(std::vector<CatalogEntry> entries, int64_t num_classes, bool multilabel,
                           transforms::ImageTransform transform)
    : entries_(std::move(entries)), num_classes_(num_classes), multilabel_(multilabel),
      transform_(transform) {}

torch::data::Example<> ImageDataset::get(size_t index) {
  const auto& e = entries_.at(index);
  cv::Mat image = cv::imread(e.path, cv::IMREAD_COLOR);
  if (image.empty()) throw std::runtime_error("Failed to decode image: " + e.path);

  auto data = transform_(image);
  torch::Tensor target;
  if (multilabel_) {
    target = torch::zeros({num_classes_}, torch::kFloat32);
    for (auto l : e.labels) target[l] = 1.0f;
  } else {
    target = torch::tensor(e.labels.front(), torch::kLong);
  }
  return {data, target};
}

ImageDataset DatasetFactory::make(const DatasetCatalog& catalog, const std::string& split,
                                  int64_t image_size) {
  return ImageDataset(catalog.split(split), catalog.num_classes(), catalog.multilabel,
                      transforms::ImageTransform(image_size, split == "train"));
}

} // namespace clf
