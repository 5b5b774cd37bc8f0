#include "nn/scoring/transe.h"

#include "nn/scoring/distance.h"

TransEScore::TransEScore(float gamma, bool check_numerics) {
    gamma_ = gamma;
    check_numerics_ = check_numerics;

    SPDLOG_DEBUG("Initialized TransE score function. gamma: {}", gamma_);
}

void TransEScore::check_widths(int64_t head_dim, int64_t rel_dim, int64_t tail_dim) {
    if (head_dim != tail_dim || rel_dim != head_dim) {
        throw TensorSizeMismatchException("TransE expects equal head, relation and tail widths. Got " + std::to_string(head_dim) + ", " +
                                          std::to_string(rel_dim) + " and " + std::to_string(tail_dim));
    }
}

torch::Tensor TransEScore::transform(const torch::Tensor &inputs, const torch::Tensor &relations) { return inputs + relations; }

torch::Tensor TransEScore::inverse_transform(const torch::Tensor &inputs, const torch::Tensor &relations) { return inputs - relations; }

torch::Tensor TransEScore::distance(const torch::Tensor &predicted, const torch::Tensor &reference) {
    // only one side is wider than 1, so the pairwise (batch, n_p, n_r) result flattens to (batch, n)
    return l2_cdist(predicted, reference, check_numerics_).flatten(1, 2);
}

torch::Tensor TransEScore::chunked_distance(const torch::Tensor &predicted, const torch::Tensor &reference) {
    return l2_cdist(predicted, reference, check_numerics_);
}
