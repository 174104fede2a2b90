#include "clf/topk.hpp"
#include <algorithm>
#include <stdexcept>

namespace clf {

std::vector<int64_t> topk_correct(const torch::Tensor& outputs, const torch::Tensor& targets,
                                  const std::vector<int64_t>& top) {
  if (top.empty()) throw std::invalid_argument("topk_correct: empty k set");
  for (auto k : top)
    if (k <= 0) throw std::invalid_argument("topk_correct: k must be positive");
  if (outputs.dim() != 2) throw std::invalid_argument("topk_correct: outputs must be [N, C]");
  const int64_t n = outputs.size(0);
  const int64_t c = outputs.size(1);
  const bool multi_hot = targets.dim() == 2;
  if (multi_hot ? targets.sizes() != outputs.sizes()
                : (targets.dim() != 1 || targets.size(0) != n)) {
    throw std::invalid_argument("topk_correct: targets must be [N] or [N, C]");
  }

  torch::NoGradGuard ng;
  const int64_t k_max = std::min(*std::max_element(top.begin(), top.end()), c);
  std::vector<int64_t> result(top.size(), 0);
  if (n == 0 || c == 0) return result;

  auto scores = outputs.detach().to(torch::kCPU, torch::kFloat64);
  // stable descending sort: equal scores keep ascending class order
  auto order = std::get<1>(torch::sort(scores, /*stable=*/true, /*dim=*/1, /*descending=*/true));
  auto preds = order.narrow(1, 0, k_max);                               // [N, k_max]

  torch::Tensor hits;
  if (multi_hot) {
    auto positives = targets.detach().to(torch::kCPU).gt(0);
    hits = positives.gather(1, preds);
  } else {
    auto t = targets.detach().to(torch::kCPU, torch::kLong);
    if (t.lt(0).any().item<bool>() || t.ge(c).any().item<bool>())
      throw std::invalid_argument("topk_correct: target class index out of range");
    hits = preds.eq(t.view({-1, 1}).expand_as(preds));
  }

  // an example is correct at k once any of its first k predictions hit
  auto correct_at = hits.to(torch::kInt64).cumsum(1).gt(0).sum(0);     // [k_max]
  for (size_t i = 0; i < top.size(); ++i) {
    const int64_t k = std::min(top[i], k_max);
    result[i] = correct_at[k - 1].item<int64_t>();
  }
  return result;
}

} // namespace clf
