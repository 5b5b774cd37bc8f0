#ifndef KGSCORE_SHAPES_H
#define KGSCORE_SHAPES_H

#include "common/datatypes.h"

/**
 * Leading dimensions shared by a head, relation and tail triple of embeddings.
 * Inputs are either (batch, width) or (batch, n, width). At most one of the three carries n > 1, the others are
 * broadcast against it.
 */
struct ScoreShape {
    int64_t batch_size;
    int64_t broadcast_size;
    bool has_broadcast_dim;
};

/** Layout of a chunked negative scoring call: every positive in a chunk is scored against the chunk's negatives. */
struct ChunkShape {
    int64_t num_chunks;
    int64_t chunk_size;
    int64_t num_negs;
};

ScoreShape check_score_shapes(const torch::Tensor &head, const torch::Tensor &relations, const torch::Tensor &tail);

ChunkShape check_chunk_shapes(const torch::Tensor &positives, const torch::Tensor &relations, const torch::Tensor &negatives, int64_t chunk_size);

// (batch, width) -> (batch, 1, width), rank 3 inputs are returned as is
torch::Tensor to_broadcast_rank(const torch::Tensor &embeddings);

#endif  // KGSCORE_SHAPES_H
