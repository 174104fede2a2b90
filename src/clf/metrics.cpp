#include "clf/metrics.hpp"
#include <stdexcept>

namespace clf {

double EpochMetrics::acc_top(int64_t k) const {
  for (auto& kv : accuracy_)
    if (kv.first == k) return kv.second;
  throw std::out_of_range("metric not configured: " + acc_name(k));
}

std::vector<std::pair<std::string, double>> EpochMetrics::items() const {
  std::vector<std::pair<std::string, double>> v;
  v.reserve(accuracy_.size() + 1);
  if (loss_) v.emplace_back("loss", *loss_);
  for (auto& kv : accuracy_) v.emplace_back(acc_name(kv.first), kv.second);
  return v;
}

nlohmann::json EpochMetrics::to_json(const std::string& prefix) const {
  auto j = nlohmann::json::object();
  for (auto& kv : items()) j[prefix + kv.first] = kv.second;
  return j;
}

} // namespace clf
