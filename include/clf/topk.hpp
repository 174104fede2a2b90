#pragma once
#include <torch/torch.h>
#include <vector>

namespace clf {

// Counts, for every k in top, how many rows of outputs [N, C] rank their true class
// among the k highest scores. targets is either class indices [N] or a multi-hot
// matrix [N, C]; for multi-hot rows any positive class inside the top k counts.
//
// Equal scores are ordered by the lower class index first, so results never depend
// on sort stability.
std::vector<int64_t> topk_correct(const torch::Tensor& outputs, const torch::Tensor& targets,
                                  const std::vector<int64_t>& top);

} // namespace clf
