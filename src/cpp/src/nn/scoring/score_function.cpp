#include "nn/scoring/score_function.h"

#include "common/util.h"
#include "nn/scoring/ote.h"
#include "nn/scoring/rotate.h"
#include "nn/scoring/transe.h"

Scores ScoreFunction::score(const EntityEmbeddings &head, const RelationEmbeddings &relations, const EntityEmbeddings &tail) {
    ScoreShape shape = check_score_shapes(head, relations, tail);
    check_widths(head.size(-1), relations.size(-1), tail.size(-1));

    torch::Tensor predicted = transform(to_broadcast_rank(head), to_broadcast_rank(relations));
    Scores scores = gamma_ - distance(predicted, to_broadcast_rank(tail));

    return finalize_scores(scores, shape);
}

Scores ScoreFunction::inverse_score(const EntityEmbeddings &head, const RelationEmbeddings &relations, const EntityEmbeddings &tail) {
    ScoreShape shape = check_score_shapes(head, relations, tail);
    check_widths(head.size(-1), relations.size(-1), tail.size(-1));

    torch::Tensor predicted = inverse_transform(to_broadcast_rank(tail), to_broadcast_rank(relations));
    Scores scores = gamma_ - distance(predicted, to_broadcast_rank(head));

    return finalize_scores(scores, shape);
}

Scores ScoreFunction::negative_score(const EntityEmbeddings &head, const RelationEmbeddings &relations, const EntityEmbeddings &tail, int64_t chunk_size,
                                     bool corrupt_head) {
    torch::Tensor predicted;
    torch::Tensor reference;

    if (corrupt_head) {
        ChunkShape shape = check_chunk_shapes(tail, relations, head, chunk_size);
        check_widths(head.size(-1), relations.size(-1), tail.size(-1));

        predicted = inverse_transform(tail.reshape({shape.num_chunks, shape.chunk_size, tail.size(-1)}),
                                      relations.reshape({shape.num_chunks, shape.chunk_size, relations.size(-1)}));
        reference = head.reshape({shape.num_chunks, shape.num_negs, head.size(-1)});
    } else {
        ChunkShape shape = check_chunk_shapes(head, relations, tail, chunk_size);
        check_widths(head.size(-1), relations.size(-1), tail.size(-1));

        predicted = transform(head.reshape({shape.num_chunks, shape.chunk_size, head.size(-1)}),
                              relations.reshape({shape.num_chunks, shape.chunk_size, relations.size(-1)}));
        reference = tail.reshape({shape.num_chunks, shape.num_negs, tail.size(-1)});
    }

    Scores scores = gamma_ - chunked_distance(predicted, reference);

    if (check_numerics_) {
        assert_no_nans(scores);
    }
    return scores;
}

Scores ScoreFunction::finalize_scores(Scores scores, const ScoreShape &shape) {
    if (!shape.has_broadcast_dim) {
        scores = scores.select(1, 0);
    }

    if (check_numerics_) {
        assert_no_nans(scores);
    }
    return scores;
}

shared_ptr<ScoreFunction> getScoreFunction(shared_ptr<ScoreFunctionConfig> config) {
    if (config == nullptr || config->options == nullptr) {
        throw UnexpectedNullPtrException("Score function config and its options must be set");
    }

    shared_ptr<ScoreFunction> score_function;

    if (config->type == ScoreFunctionType::TRANSE) {
        score_function = std::make_shared<TransEScore>(config->options->gamma, config->check_numerics);
    } else if (config->type == ScoreFunctionType::ROTATE) {
        auto options = std::dynamic_pointer_cast<RotatEOptions>(config->options);
        if (options == nullptr) {
            throw UnsupportedConfigurationException("RotatE requires RotatEOptions");
        }
        score_function = std::make_shared<RotatEScore>(options->gamma, options->phase_scale, config->check_numerics);
    } else if (config->type == ScoreFunctionType::OTE) {
        auto options = std::dynamic_pointer_cast<OTEOptions>(config->options);
        if (options == nullptr) {
            throw UnsupportedConfigurationException("OTE requires OTEOptions");
        }
        score_function = std::make_shared<OTEScore>(options->gamma, options->num_elem, options->scale_type, config->check_numerics);
    } else {
        throw UnsupportedConfigurationException("Unsupported score function type");
    }

    return score_function;
}
