#ifndef KGSCORE_OTE_H
#define KGSCORE_OTE_H

#include "nn/scoring/score_function.h"

/**
 * Orthogonal transform score. Entity embeddings are split into blocks of num_elem values, each block is multiplied by
 * its own num_elem x num_elem relation matrix, orthogonalized with Gram-Schmidt before use. The score is gamma minus
 * the sum of the per block euclidean norms of the residual against the target entity.
 *
 * With scaling enabled every relation block carries one extra column holding a per row scale, so relation embeddings
 * are (dim / num_elem) * num_elem * (num_elem + 1) wide instead of dim * num_elem.
 */
class OTEScore : public ScoreFunction {
   public:
    int num_elem_;
    ScaleType scale_type_;
    bool use_scale_;

    OTEScore(float gamma, int num_elem, ScaleType scale_type = ScaleType::NONE, bool check_numerics = false);

    ScoreFunctionType type() override { return ScoreFunctionType::OTE; }

    // num_elem, plus the scale column if scaling is enabled
    int64_t block_width() { return num_elem_ + (use_scale_ ? 1 : 0); }

    /**
      Orthonormalizes the rows of each relation block with modified Gram-Schmidt. The scale column is passed through.
      @param blocks Relation blocks (num_blocks, num_elem, block_width)
      @return Blocks of the same shape whose square part has orthonormal rows
    */
    torch::Tensor orthogonalize(const torch::Tensor &blocks);

    // transposes the square part of each block and inverts its scale column
    torch::Tensor reverse_transform(const torch::Tensor &blocks);

    torch::Tensor get_scale(const torch::Tensor &scale);

    torch::Tensor reverse_scale(const torch::Tensor &scale);

    // value of the raw scale column that leaves a block unscaled
    float scale_init();

    torch::Tensor orthogonalize_relations(const torch::Tensor &relations);

    torch::Tensor reverse_relations(const torch::Tensor &relations);

    /**
      Multiplies each num_elem block of the inputs by the matching relation block.
      @param inputs Entity embeddings (..., dim)
      @param relations Orthogonalized relation embeddings (..., dim * block_width), leading dimensions broadcast against the inputs
      @return Transformed embeddings (..., dim)
    */
    torch::Tensor apply_blocks(const torch::Tensor &inputs, const torch::Tensor &relations);

    // sum over blocks of ||block(inputs * relations) - block(reference)||, without the gamma offset
    torch::Tensor residual_norm(const torch::Tensor &inputs, const torch::Tensor &relations, const torch::Tensor &reference);

    void check_widths(int64_t head_dim, int64_t rel_dim, int64_t tail_dim) override;

    torch::Tensor transform(const torch::Tensor &inputs, const torch::Tensor &relations) override;

    torch::Tensor inverse_transform(const torch::Tensor &inputs, const torch::Tensor &relations) override;

    torch::Tensor distance(const torch::Tensor &predicted, const torch::Tensor &reference) override;

    torch::Tensor chunked_distance(const torch::Tensor &predicted, const torch::Tensor &reference) override;

   private:
    torch::Tensor block_norm_sum(const torch::Tensor &residual);

    void check_blocks(const torch::Tensor &blocks);
};

#endif  // KGSCORE_OTE_H
