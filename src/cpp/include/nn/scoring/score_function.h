#ifndef KGSCORE_SCORE_FUNCTION_H
#define KGSCORE_SCORE_FUNCTION_H

#include "common/datatypes.h"
#include "configuration/config.h"
#include "nn/scoring/shapes.h"

/**
 * Computes plausibility scores for (head, relation, tail) triples from their embeddings. Larger scores are more
 * plausible: every variant returns gamma minus a distance between the relation-transformed source entity and the
 * target entity.
 *
 * Implementations hold only hyperparameters and never modify their inputs, so a single instance may be shared
 * between threads.
 */
class ScoreFunction {
   public:
    float gamma_;
    bool check_numerics_;

    virtual ~ScoreFunction(){};

    /**
      Scores triples in the head to tail direction.
      @param head Head embeddings (batch, dim) or (batch, n, dim)
      @param relations Relation embeddings (batch, rel_dim) or (batch, n, rel_dim)
      @param tail Tail embeddings (batch, dim) or (batch, n, dim)
      @return Scores (batch) if all inputs are 2 dimensional, (batch, n) otherwise
    */
    Scores score(const EntityEmbeddings &head, const RelationEmbeddings &relations, const EntityEmbeddings &tail);

    /**
      Scores triples in the tail to head direction by applying the inverse of the relation to the tail. Used when the
      head side of the triples is corrupted, so the same relation embeddings serve both directions.
    */
    Scores inverse_score(const EntityEmbeddings &head, const RelationEmbeddings &relations, const EntityEmbeddings &tail);

    /**
      Scores every positive of a chunk against all negatives sampled for that chunk.
      @param head Head embeddings. (num_chunks * num_negs, dim) if corrupt_head, else (num_chunks * chunk_size, dim)
      @param relations Relation embeddings of the positives (num_chunks * chunk_size, rel_dim)
      @param tail Tail embeddings. (num_chunks * chunk_size, dim) if corrupt_head, else (num_chunks * num_negs, dim)
      @param chunk_size Number of positives sharing a set of negatives
      @param corrupt_head Whether the head side holds the negatives
      @return Scores (num_chunks, chunk_size, num_negs)
    */
    Scores negative_score(const EntityEmbeddings &head, const RelationEmbeddings &relations, const EntityEmbeddings &tail, int64_t chunk_size,
                          bool corrupt_head);

    virtual ScoreFunctionType type() = 0;

    // throws TensorSizeMismatchException if the embedding widths do not fit the variant
    virtual void check_widths(int64_t head_dim, int64_t rel_dim, int64_t tail_dim) = 0;

    // applies the relation to the inputs, keeping the entity width. Leading dimensions broadcast.
    virtual torch::Tensor transform(const torch::Tensor &inputs, const torch::Tensor &relations) = 0;

    virtual torch::Tensor inverse_transform(const torch::Tensor &inputs, const torch::Tensor &relations) = 0;

    // (batch, n_p, dim) x (batch, n_r, dim) -> (batch, max(n_p, n_r)), at most one of n_p and n_r is larger than 1
    virtual torch::Tensor distance(const torch::Tensor &predicted, const torch::Tensor &reference) = 0;

    // (num_chunks, chunk_size, dim) x (num_chunks, num_negs, dim) -> (num_chunks, chunk_size, num_negs)
    virtual torch::Tensor chunked_distance(const torch::Tensor &predicted, const torch::Tensor &reference) = 0;

   protected:
    Scores finalize_scores(Scores scores, const ScoreShape &shape);
};

shared_ptr<ScoreFunction> getScoreFunction(shared_ptr<ScoreFunctionConfig> config);

#endif  // KGSCORE_SCORE_FUNCTION_H
