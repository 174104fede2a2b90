#include "clf/registry.hpp"
#include "clf/config.hpp"
#include "log.h"
#include <set>
#include <stdexcept>

namespace clf {

const Registry::Entry& Registry::entry(const std::string& name) const {
  auto it = map_.find(name);
  if (it == map_.end()) throw std::invalid_argument("Model not found: " + name);
  return it->second;
}

IModel::Ptr Registry::create(const std::string& name, int64_t num_classes) const {
  if (num_classes <= 0) throw std::invalid_argument("num_classes must be > 0");
  return entry(name).factory(num_classes);
}

int64_t Registry::image_size(const std::string& name) const {
  return entry(name).image_size;
}

std::vector<std::string> Registry::names() const {
  std::vector<std::string> v; v.reserve(map_.size());
  for (auto& kv : map_) v.push_back(kv.first);
  return v;
}

namespace {

struct PretrainedCopy {
  std::set<const void*> head;
  size_t loaded{0};
  size_t skipped{0};

  void tensor(torch::serialize::InputArchive& ar, const std::string& prefix,
              const std::string& name, torch::Tensor& dst, bool is_buffer) {
    if (head.count(dst.unsafeGetTensorImpl())) { ++skipped; return; }
    torch::Tensor src;
    if (!ar.try_read(name, src, is_buffer) || src.sizes() != dst.sizes()) {
      CLFLOG_W("pretrained: no matching tensor for '%s%s'", prefix.c_str(), name.c_str());
      ++skipped;
      return;
    }
    dst.copy_(src);
    ++loaded;
  }

  // Archives written by torch::save nest one sub-archive per child module.
  void module(torch::nn::Module& m, torch::serialize::InputArchive& ar, const std::string& prefix) {
    for (auto& p : m.named_parameters(/*recurse=*/false)) tensor(ar, prefix, p.key(), p.value(), false);
    for (auto& b : m.named_buffers(/*recurse=*/false)) tensor(ar, prefix, b.key(), b.value(), true);
    for (auto& c : m.named_children()) {
      torch::serialize::InputArchive child;
      if (!ar.try_read(c.key(), child)) {
        CLFLOG_W("pretrained: no sub-archive for '%s%s'", prefix.c_str(), c.key().c_str());
        skipped += c.value()->parameters().size() + c.value()->buffers().size();
        continue;
      }
      module(*c.value(), child, prefix + c.key() + ".");
    }
  }
};

// Copies every non-head tensor of the archive whose name and shape match the model.
void load_pretrained(IModel& model, const std::string& path) {
  torch::serialize::InputArchive archive;
  try {
    archive.load_from(path);
  } catch (const c10::Error& e) {
    throw std::runtime_error("Cannot read pretrained weights '" + path + "': " + e.what_without_backtrace());
  }

  PretrainedCopy copy;
  for (auto& p : model.head_parameters()) copy.head.insert(p.unsafeGetTensorImpl());

  torch::NoGradGuard ng;
  copy.module(model, archive, "");
  CLFLOG_I("pretrained weights %s: %zu tensors loaded, %zu kept initialized",
           path.c_str(), copy.loaded, copy.skipped);
}

} // namespace

ModelHandle build_model(const ExperimentConfig& cfg, int64_t num_classes) {
  ModelHandle h;
  h.model = Registry::get().create(cfg.model_name, num_classes);
  if (cfg.pretrained) load_pretrained(*h.model, cfg.pretrained_weights);

  if (cfg.finetune) {
    for (auto& p : h.model->parameters()) p.set_requires_grad(false);
    for (auto& p : h.model->head_parameters()) {
      p.set_requires_grad(true);
      h.trainable.push_back(p);
    }
  } else {
    h.trainable = h.model->parameters();
  }
  return h;
}

} // namespace clf
