#ifndef KGSCORE_DISTANCE_H
#define KGSCORE_DISTANCE_H

#include "common/datatypes.h"

/**
 * Batched pairwise euclidean distance between the rows of x (..., n, d) and y (..., m, d), giving (..., n, m).
 * Uses (x - y)^2 = x^2 + y^2 - 2*x*y. The squared distance is clamped to KGSCORE_DISTANCE_CLAMP before the square root.
 * If check_numerics is set, residues below KGSCORE_NUMERIC_WARN_TOLERANCE are reported as a warning before clamping.
 *
 * The expansion is only exact when every product and sum is exactly representable (e.g. small integer valued
 * embeddings). For general float32 inputs identical rows leave a residue around 1e-6, which the square root turns
 * into a distance around 1e-3, so x == y does not guarantee a distance of exactly zero.
 */
torch::Tensor l2_cdist(const torch::Tensor &x, const torch::Tensor &y, bool check_numerics = false);

#endif  // KGSCORE_DISTANCE_H
