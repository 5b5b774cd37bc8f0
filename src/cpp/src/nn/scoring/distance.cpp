#include "nn/scoring/distance.h"

#include "reporting/logger.h"

torch::Tensor l2_cdist(const torch::Tensor &x, const torch::Tensor &y, bool check_numerics) {
    torch::Tensor x2 = x.pow(2).sum(-1).unsqueeze(-1);
    torch::Tensor y2 = y.pow(2).sum(-1).unsqueeze(-2);
    torch::Tensor xy = torch::matmul(x, y.transpose(-1, -2));

    torch::Tensor squared = x2 + y2 - 2 * xy;

    if (check_numerics && squared.numel() > 0) {
        double min_residue = squared.min().item<double>();
        if (min_residue < KGSCORE_NUMERIC_WARN_TOLERANCE) {
            SPDLOG_WARN("Squared distance of {} below tolerance {}, clamping to {}", min_residue, KGSCORE_NUMERIC_WARN_TOLERANCE, KGSCORE_DISTANCE_CLAMP);
        }
    }

    return torch::sqrt(torch::clamp_min(squared, KGSCORE_DISTANCE_CLAMP));
}
