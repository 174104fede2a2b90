#pragma once
#include "clf/metrics.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <memory>
#include <string>

namespace clf {

class ITelemetrySink {
public:
  using Ptr = std::unique_ptr<ITelemetrySink>;
  virtual ~ITelemetrySink() = default;

  virtual void record(const std::string& name, double value, int64_t epoch) = 0;

  // End-of-run record joining hyperparameters with the best epoch's metrics.
  virtual void summary(const nlohmann::json& hparams, const nlohmann::json& metrics) = 0;
};

// Writes every record as {"name", "value", "epoch"} to a JSON-lines file, and the
// summary as a standalone JSON document.
class JsonlTelemetrySink : public ITelemetrySink {
public:
  JsonlTelemetrySink(const std::string& metrics_path, const std::string& summary_path);

  void record(const std::string& name, double value, int64_t epoch) override;
  void summary(const nlohmann::json& hparams, const nlohmann::json& metrics) override;

private:
  std::ofstream out_;
  std::string metrics_path_;
  std::string summary_path_;
};

// Records "<prefix>/<metric>" for every metric of the epoch.
void log_metrics(ITelemetrySink& sink, const EpochMetrics& metrics, int64_t epoch, const std::string& prefix);

} // namespace clf
