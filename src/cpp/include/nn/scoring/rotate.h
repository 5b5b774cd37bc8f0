#ifndef KGSCORE_ROTATE_H
#define KGSCORE_ROTATE_H

#include "nn/scoring/score_function.h"

/**
 * Complex rotation score. Entity embeddings pack the real and imaginary parts as [re | im] along the last axis,
 * relation embeddings hold one phase per complex component and are half the entity width.
 * A relation value of phase_scale corresponds to a rotation by pi.
 */
class RotatEScore : public ScoreFunction {
   public:
    float phase_scale_;
    double epsilon_;

    RotatEScore(float gamma, float phase_scale, bool check_numerics = false);

    ScoreFunctionType type() override { return ScoreFunctionType::ROTATE; }

    // unit modulus rotation (cos(phase), sin(phase)) for each relation value
    std::tuple<torch::Tensor, torch::Tensor> rotation(const torch::Tensor &relations);

    void check_widths(int64_t head_dim, int64_t rel_dim, int64_t tail_dim) override;

    torch::Tensor transform(const torch::Tensor &inputs, const torch::Tensor &relations) override;

    // rotates by the conjugate, which is the inverse of a unit modulus rotation
    torch::Tensor inverse_transform(const torch::Tensor &inputs, const torch::Tensor &relations) override;

    torch::Tensor distance(const torch::Tensor &predicted, const torch::Tensor &reference) override;

    torch::Tensor chunked_distance(const torch::Tensor &predicted, const torch::Tensor &reference) override;

   private:
    torch::Tensor complex_residual_norm(const torch::Tensor &residual);
};

#endif  // KGSCORE_ROTATE_H
