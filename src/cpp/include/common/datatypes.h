#ifndef KGSCORE_DATATYPES_H
#define KGSCORE_DATATYPES_H

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "common/exception.h"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wunused-parameter"
#include "torch/torch.h"
#pragma GCC diagnostic pop

using std::map;
using std::shared_ptr;
using std::string;
using std::unique_ptr;

/** Numeric Constants */

// floor applied to squared distances before taking the square root
#define KGSCORE_DISTANCE_CLAMP 1e-30

// added to the squared modulus of complex residuals
#define KGSCORE_ROTATE_EPSILON 1e-12

// floor applied to squared row norms during Gram-Schmidt orthogonalization
#define KGSCORE_ORTH_EPSILON 1e-18

// added to the magnitude of a scale before inverting it
#define KGSCORE_REVERSE_SCALE_EPSILON 1e-9

// most negative pre-sqrt residue tolerated before a numeric warning is logged
#define KGSCORE_NUMERIC_WARN_TOLERANCE -1e-4

/** Typedefs */

/**
 * Entity embeddings gathered for a batch of triples.
 * Shape (batch, dim) or (batch, n, dim) when the entity side carries the broadcast dimension.
 */
typedef torch::Tensor EntityEmbeddings;

/**
 * Relation embeddings gathered for a batch of triples.
 * Shape (batch, rel_dim) or (batch, n, rel_dim). The width of rel_dim depends on the score function.
 */
typedef torch::Tensor RelationEmbeddings;

/** Plausibility scores. Shape (batch), (batch, n) or (num_chunks, chunk_size, num_negs) */
typedef torch::Tensor Scores;

#endif  // KGSCORE_DATATYPES_H
