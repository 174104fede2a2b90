#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace clf {

// Finalized metrics of one pass: the mean loss when a loss function was supplied and
// the top-k accuracy (percent) for every configured k, in configuration order.
class EpochMetrics {
public:
  EpochMetrics(std::optional<double> loss, std::vector<std::pair<int64_t, double>> accuracy)
      : loss_(loss), accuracy_(std::move(accuracy)) {}

  const std::optional<double>& loss() const { return loss_; }
  const std::vector<std::pair<int64_t, double>>& accuracy() const { return accuracy_; }

  // Throws std::out_of_range when k was not configured.
  double acc_top(int64_t k) const;

  // "loss" first (when present), then "acc_top{k}" in configuration order.
  std::vector<std::pair<std::string, double>> items() const;

  nlohmann::json to_json(const std::string& prefix = "") const;

  static std::string acc_name(int64_t k) { return "acc_top" + std::to_string(k); }

private:
  std::optional<double> loss_;
  std::vector<std::pair<int64_t, double>> accuracy_;
};

} // namespace clf
