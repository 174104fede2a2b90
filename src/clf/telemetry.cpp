#include "clf/telemetry.hpp"
#include <stdexcept>

using nlohmann::json;

namespace clf {

JsonlTelemetrySink::JsonlTelemetrySink(const std::string& metrics_path, const std::string& summary_path)
    : out_(metrics_path, std::ios::app), metrics_path_(metrics_path), summary_path_(summary_path) {
  if (!out_) throw std::runtime_error("Cannot open metrics stream: " + metrics_path);
}

void JsonlTelemetrySink::record(const std::string& name, double value, int64_t epoch) {
  out_ << json{{"name", name}, {"value", value}, {"epoch", epoch}}.dump() << '\n';
  out_.flush();
  if (!out_) throw std::runtime_error("Cannot write metrics stream: " + metrics_path_);
}

void JsonlTelemetrySink::summary(const json& hparams, const json& metrics) {
  std::ofstream f(summary_path_, std::ios::trunc);
  if (!f) throw std::runtime_error("Cannot open summary: " + summary_path_);
  f << json{{"hparams", hparams}, {"metrics", metrics}}.dump(2) << '\n';
  if (!f) throw std::runtime_error("Cannot write summary: " + summary_path_);
}

void log_metrics(ITelemetrySink& sink, const EpochMetrics& metrics, int64_t epoch, const std::string& prefix) {
  for (auto& kv : metrics.items()) sink.record(prefix + "/" + kv.first, kv.second, epoch);
}

} // namespace clf
