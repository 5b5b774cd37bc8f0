#include "nn/scoring/shapes.h"

#include "common/util.h"

namespace {
void check_embeddings(const torch::Tensor &embeddings, const std::string &name) {
    assert_defined(embeddings);
    assert_floating(embeddings, name);

    if (embeddings.dim() != 2 && embeddings.dim() != 3) {
        throw TensorSizeMismatchException(name + " embeddings should be 2 or 3 dimensional, got shape " + shape_to_string(embeddings));
    }
}

// matmul and broadcasting arithmetic require a common dtype and device
void check_matching_options(const torch::Tensor &first, const torch::Tensor &second, const torch::Tensor &third) {
    for (const torch::Tensor *embeddings : {&second, &third}) {
        if (embeddings->scalar_type() != first.scalar_type()) {
            throw TensorSizeMismatchException("Embeddings should share a dtype. Got " + std::string(c10::toString(first.scalar_type())) + " and " +
                                              std::string(c10::toString(embeddings->scalar_type())));
        }

        if (embeddings->device() != first.device()) {
            throw TensorSizeMismatchException("Embeddings should be on the same device. Got " + first.device().str() + " and " + embeddings->device().str());
        }
    }
}
}  // namespace

ScoreShape check_score_shapes(const torch::Tensor &head, const torch::Tensor &relations, const torch::Tensor &tail) {
    check_embeddings(head, "Head");
    check_embeddings(relations, "Relation");
    check_embeddings(tail, "Tail");
    check_matching_options(head, relations, tail);

    int64_t batch_size = head.size(0);
    if (relations.size(0) != batch_size || tail.size(0) != batch_size) {
        throw TensorSizeMismatchException("First dimension of head, relation and tail embeddings should match. Got " + shape_to_string(head) + ", " +
                                          shape_to_string(relations) + " and " + shape_to_string(tail));
    }

    ScoreShape shape;
    shape.batch_size = batch_size;
    shape.broadcast_size = 1;
    shape.has_broadcast_dim = false;

    int num_wide = 0;
    for (const torch::Tensor *embeddings : {&head, &relations, &tail}) {
        if (embeddings->dim() != 3) {
            continue;
        }
        shape.has_broadcast_dim = true;

        if (embeddings->size(1) != 1) {
            shape.broadcast_size = embeddings->size(1);
            num_wide++;
        }
    }

    if (num_wide > 1) {
        throw TensorSizeMismatchException("At most one of head, relation and tail embeddings may carry a broadcast dimension. Got " +
                                          shape_to_string(head) + ", " + shape_to_string(relations) + " and " + shape_to_string(tail));
    }

    return shape;
}

ChunkShape check_chunk_shapes(const torch::Tensor &positives, const torch::Tensor &relations, const torch::Tensor &negatives, int64_t chunk_size) {
    assert_defined(positives);
    assert_defined(relations);
    assert_defined(negatives);
    assert_floating(positives, "Positive");
    assert_floating(relations, "Relation");
    assert_floating(negatives, "Negative");
    check_matching_options(positives, relations, negatives);

    if (positives.dim() != 2 || relations.dim() != 2 || negatives.dim() != 2) {
        throw TensorSizeMismatchException("Chunked negative scoring expects 2 dimensional embeddings");
    }

    if (positives.size(0) != relations.size(0)) {
        throw TensorSizeMismatchException("First dimension of positive and relation embeddings should match. Got " + shape_to_string(positives) + " and " +
                                          shape_to_string(relations));
    }

    if (chunk_size <= 0 || positives.size(0) % chunk_size != 0 || positives.size(0) == 0) {
        throw TensorSizeMismatchException("Number of positives " + std::to_string(positives.size(0)) + " is not divisible into chunks of size " +
                                          std::to_string(chunk_size));
    }

    ChunkShape shape;
    shape.chunk_size = chunk_size;
    shape.num_chunks = positives.size(0) / chunk_size;

    if (negatives.size(0) % shape.num_chunks != 0) {
        throw TensorSizeMismatchException("Number of negatives " + std::to_string(negatives.size(0)) + " is not divisible into " +
                                          std::to_string(shape.num_chunks) + " chunks");
    }
    shape.num_negs = negatives.size(0) / shape.num_chunks;

    return shape;
}

torch::Tensor to_broadcast_rank(const torch::Tensor &embeddings) {
    if (embeddings.dim() == 2) {
        return embeddings.unsqueeze(1);
    }
    return embeddings;
}
