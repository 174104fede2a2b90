#pragma once
#include "clf/model_base.hpp"
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace clf {

struct ExperimentConfig;

class Registry {
public:
  using Factory = std::function<IModel::Ptr(int64_t num_classes)>;

  struct Entry {
    Factory factory;
    int64_t image_size{224};
  };

  static Registry& get() { static Registry r; return r; }
  void add(const std::string& name, Factory f, int64_t image_size) {
    map_[name] = Entry{std::move(f), image_size};
  }
  bool contains(const std::string& name) const { return map_.count(name) != 0; }
  IModel::Ptr create(const std::string& name, int64_t num_classes) const;
  int64_t image_size(const std::string& name) const;
  std::vector<std::string> names() const;

private:
  const Entry& entry(const std::string& name) const;
  std::map<std::string, Entry> map_;
};

// Builds the model named by cfg, loads pretrained weights when asked, sizes the head
// to num_classes and freezes everything but the head when cfg.finetune is set.
ModelHandle build_model(const ExperimentConfig& cfg, int64_t num_classes);

#define CLF_REGISTER_MODEL(ID, NAME, IMAGE_SIZE, FACTORY) \
  static bool _clf_reg_##ID = [](){ \
    ::clf::Registry::get().add(NAME, FACTORY, IMAGE_SIZE); \
    return true; \
  }()

} // namespace clf
