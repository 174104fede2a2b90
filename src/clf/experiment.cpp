#include "clf/experiment.hpp"
#include "clf/catalog.hpp"
#include "clf/dataset.hpp"
#include "clf/epoch_runner.hpp"
#include "clf/registry.hpp"
#include "log.h"
#include <torch/torch.h>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>

using nlohmann::json;
namespace fs = std::filesystem;

namespace clf {

namespace {

void write_json(const fs::path& path, const json& j) {
  std::ofstream f(path);
  if (!f) throw std::runtime_error("Cannot open for writing: " + path.string());
  f << j.dump(2) << '\n';
  if (!f) throw std::runtime_error("Cannot write: " + path.string());
}

void require_split(const DatasetCatalog& catalog, const std::string& name) {
  if (catalog.split(name).empty()) throw std::invalid_argument("Split is empty: " + name);
}

json prefix_all_keys(const json& j, const std::string& prefix) {
  json out = json::object();
  for (auto& kv : j.items()) out[prefix + kv.key()] = kv.value();
  return out;
}

int64_t resolve_image_size(const ExperimentConfig& cfg) {
  return cfg.image_size > 0 ? cfg.image_size : Registry::get().image_size(cfg.model_name);
}

std::string format_metrics(const EpochMetrics& m) {
  std::string s;
  char buf[64];
  for (auto& kv : m.items()) {
    snprintf(buf, sizeof(buf), "%s%s=%.4f", s.empty() ? "" : " ", kv.first.c_str(), kv.second);
    s += buf;
  }
  return s;
}

} // namespace

Experiment::Experiment(ExperimentConfig cfg, ITelemetrySink::Ptr sink)
    : cfg_(std::move(cfg)), sink_(std::move(sink)) {}

int64_t Experiment::resolve_seed(const ExperimentConfig& cfg) {
  if (cfg.seed) return *cfg.seed;
  std::random_device rd;
  return static_cast<int64_t>(std::uniform_int_distribution<int>(0, 9999)(rd));
}

std::string Experiment::make_run_dir(const std::string& root) {
  const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm_info{};
  localtime_r(&now, &tm_info);
  char stamp[32];
  std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &tm_info);

  fs::create_directories(root);
  fs::path dir = fs::path(root) / stamp;
  for (int suffix = 1; !fs::create_directory(dir); ++suffix) {
    dir = fs::path(root) / (std::string(stamp) + "_" + std::to_string(suffix));
  }
  return dir.string();
}

torch::Device Experiment::select_device(const std::string& name) {
  if (name == "cuda" && torch::cuda::is_available()) {
    at::globalContext().setBenchmarkCuDNN(true);
    return torch::Device(torch::kCUDA, 0);
  }
  if (name == "cuda") CLFLOG_W("CUDA requested but not available, using CPU");
  return torch::Device(torch::kCPU);
}

double Experiment::learning_rate(const ExperimentConfig& cfg) {
  double lr = 0.016 * static_cast<double>(cfg.batch_size) / 256.0;
  if (cfg.pretrained) lr *= std::pow(0.97, 175.0 / 2.4);   // halfway point of the decay schedule
  return lr;
}

RunSummary Experiment::run() {
  cfg_.validate();

  // --- Init ---
  RunSummary summary;
  summary.seed = resolve_seed(cfg_);
  torch::manual_seed(static_cast<uint64_t>(summary.seed));

  summary.run_dir = make_run_dir(cfg_.run_root);
  const fs::path dir(summary.run_dir);
  json params = cfg_.to_json();
  params["seed"] = summary.seed;
  write_json(dir / "params.json", params);
  CLFLOG_I("run %s (seed %lld)", summary.run_dir.c_str(), (long long)summary.seed);

  auto catalog = load_catalog(cfg_.classification_dataset_csv, cfg_.splits_json,
                              cfg_.cropped_images_dir, cfg_.multilabel);
  if (catalog.num_classes() == 0) throw std::invalid_argument("No labels in classification CSV");
  if (cfg_.epochs > 0) {
    require_split(catalog, "train");
    require_split(catalog, "val");
  }
  write_json(dir / "label_index.json", catalog.label_index_json());

  const auto device = select_device(cfg_.device);
  auto handle = build_model(cfg_, catalog.num_classes());
  handle.model->to(device);
  CLFLOG_I("model %s: %lld classes, %zu trainable tensors, device %s", cfg_.model_name.c_str(),
           (long long)catalog.num_classes(), handle.trainable.size(), device.str().c_str());

  const LossFn criterion = make_loss(cfg_.multilabel);
  torch::optim::RMSprop optimizer(handle.trainable,
      torch::optim::RMSpropOptions(learning_rate(cfg_)).alpha(0.9).momentum(0.9).weight_decay(1e-5));

  // the default sink belongs to this run's directory, an injected one outlives runs
  ITelemetrySink::Ptr run_sink;
  ITelemetrySink* sink = sink_.get();
  if (!sink) {
    run_sink = std::make_unique<JsonlTelemetrySink>((dir / "metrics.jsonl").string(),
                                                    (dir / "hparams.json").string());
    sink = run_sink.get();
  }

  const auto ckpt_path = (dir / "checkpoint_best_model.pt").string();
  CheckpointSelector selector([&](const CheckpointRecord& record) {
    CLFLOG_I("New best model! Saving checkpoint to %s", ckpt_path.c_str());
    save_checkpoint(ckpt_path, record, *handle.model, optimizer);
  });

  EpochRunner runner(handle.model, device, cfg_.top_k, cfg_.finetune, cfg_.log_interval);

  // --- Epochs ---
  if (cfg_.epochs > 0) {
    const int64_t image_size = resolve_image_size(cfg_);
    auto loader_options = torch::data::DataLoaderOptions()
                              .batch_size(static_cast<size_t>(cfg_.batch_size))
                              .workers(static_cast<size_t>(cfg_.num_workers));

    auto train_loader = torch::data::make_data_loader<torch::data::samplers::RandomSampler>(
        DatasetFactory::make(catalog, "train", image_size).map(torch::data::transforms::Stack<>()),
        loader_options);
    auto val_loader = torch::data::make_data_loader<torch::data::samplers::SequentialSampler>(
        DatasetFactory::make(catalog, "val", image_size).map(torch::data::transforms::Stack<>()),
        loader_options);

    for (int64_t epoch = 0; epoch < cfg_.epochs; ++epoch) {
      CLFLOG_I("Epoch: %lld", (long long)epoch);

      auto train_metrics = runner.run(Mode::Train, *train_loader, &criterion, &optimizer);
      CLFLOG_I("- train: %s", format_metrics(train_metrics).c_str());
      log_metrics(*sink, train_metrics, epoch, "train");

      auto val_metrics = runner.run(Mode::Eval, *val_loader, &criterion);
      CLFLOG_I("- val: %s", format_metrics(val_metrics).c_str());
      log_metrics(*sink, val_metrics, epoch, "val");

      selector.consider(epoch, val_metrics.acc_top(1), train_metrics, val_metrics);
    }
  }

  // --- Finalize ---
  summary.best = selector.best();
  summary.hparams = json{
    {"model_name", cfg_.model_name},
    {"multilabel", cfg_.multilabel},
    {"finetune", cfg_.finetune},
    {"batch_size", cfg_.batch_size},
    {"epochs", cfg_.epochs},
  };
  json best = json::object();
  if (selector.best()) {
    best.update(selector.best_val_metrics()->to_json("val_"));
    best.update(selector.best_train_metrics()->to_json("train_"));
    CLFLOG_I("best epoch %lld, val acc_top1 %.4f", (long long)selector.best()->epoch, selector.best_score());
  }
  summary.metrics = prefix_all_keys(best, "hparam/");
  sink->summary(summary.hparams, summary.metrics);
  return summary;
}

EpochMetrics evaluate_checkpoint(const ExperimentConfig& cfg, const std::string& checkpoint_path,
                                 const std::string& split) {
  cfg.validate();
  if (cfg.seed) torch::manual_seed(static_cast<uint64_t>(*cfg.seed));

  auto catalog = load_catalog(cfg.classification_dataset_csv, cfg.splits_json,
                              cfg.cropped_images_dir, cfg.multilabel);
  require_split(catalog, split);

  ExperimentConfig model_cfg = cfg;
  model_cfg.pretrained = false;     // weights come from the checkpoint
  model_cfg.finetune = false;
  const auto device = select_device(cfg.device);
  auto handle = build_model(model_cfg, catalog.num_classes());
  auto record = load_checkpoint(checkpoint_path, *handle.model, device);
  CLFLOG_I("loaded %s (epoch %lld, val_acc %.4f)", checkpoint_path.c_str(),
           (long long)record.epoch, record.val_accuracy);
  handle.model->to(device);

  auto loader = torch::data::make_data_loader<torch::data::samplers::SequentialSampler>(
      DatasetFactory::make(catalog, split, resolve_image_size(cfg)).map(torch::data::transforms::Stack<>()),
      torch::data::DataLoaderOptions()
          .batch_size(static_cast<size_t>(cfg.batch_size))
          .workers(static_cast<size_t>(cfg.num_workers)));

  const LossFn criterion = make_loss(cfg.multilabel);
  EpochRunner runner(handle.model, device, cfg.top_k, false, cfg.log_interval);
  auto metrics = runner.run(Mode::Eval, *loader, &criterion);
  CLFLOG_I("%s: %s", split.c_str(), format_metrics(metrics).c_str());
  return metrics;
}

} // namespace clf
