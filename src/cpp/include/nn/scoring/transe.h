#ifndef KGSCORE_TRANSE_H
#define KGSCORE_TRANSE_H

#include "nn/scoring/score_function.h"

/**
 * Translational distance score, gamma - ||(head + relation) - tail||.
 * The inverse direction translates the tail backwards, gamma - ||(tail - relation) - head||.
 */
class TransEScore : public ScoreFunction {
   public:
    TransEScore(float gamma, bool check_numerics = false);

    ScoreFunctionType type() override { return ScoreFunctionType::TRANSE; }

    void check_widths(int64_t head_dim, int64_t rel_dim, int64_t tail_dim) override;

    torch::Tensor transform(const torch::Tensor &inputs, const torch::Tensor &relations) override;

    torch::Tensor inverse_transform(const torch::Tensor &inputs, const torch::Tensor &relations) override;

    torch::Tensor distance(const torch::Tensor &predicted, const torch::Tensor &reference) override;

    torch::Tensor chunked_distance(const torch::Tensor &predicted, const torch::Tensor &reference) override;
};

#endif  // KGSCORE_TRANSE_H
