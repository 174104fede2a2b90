#pragma once
#include "clf/catalog.hpp"
#include "clf/transforms/image_transforms.hpp"
#include <torch/torch.h>
#include <vector>

namespace clf {

// Decodes catalog images on demand and applies the split's transform. Targets are a
// class index, or a multi-hot float vector of num_classes when multi-label.
class ImageDataset : public torch::data::datasets::Dataset<ImageDataset> {
public:
  ImageDataset(std::vector<CatalogEntry> entries, int64_t num_classes, bool multilabel,
               transforms::ImageTransform transform);

  torch::data::Example<> get(size_t index) override;
  torch::optional<size_t> size() const override { return entries_.size(); }

private:
  std::vector<CatalogEntry> entries_;
  int64_t num_classes_;
  bool multilabel_;
  transforms::ImageTransform transform_;
};

struct DatasetFactory {
  // Training split uses the randomized transform, every other split the deterministic one.
  static ImageDataset make(const DatasetCatalog& catalog, const std::string& split, int64_t image_size);
};

} // namespace clf
