#include "nn/scoring/rotate.h"

RotatEScore::RotatEScore(float gamma, float phase_scale, bool check_numerics) {
    if (!(phase_scale > 0)) {
        throw UnsupportedConfigurationException("RotatE phase scale must be positive, got " + std::to_string(phase_scale));
    }

    gamma_ = gamma;
    phase_scale_ = phase_scale;
    epsilon_ = KGSCORE_ROTATE_EPSILON;
    check_numerics_ = check_numerics;

    SPDLOG_DEBUG("Initialized RotatE score function. gamma: {}, phase scale: {}", gamma_, phase_scale_);
}

std::tuple<torch::Tensor, torch::Tensor> RotatEScore::rotation(const torch::Tensor &relations) {
    torch::Tensor phase = relations / (phase_scale_ / M_PI);
    return std::make_tuple(torch::cos(phase), torch::sin(phase));
}

void RotatEScore::check_widths(int64_t head_dim, int64_t rel_dim, int64_t tail_dim) {
    if (head_dim != tail_dim) {
        throw TensorSizeMismatchException("RotatE expects equal head and tail widths. Got " + std::to_string(head_dim) + " and " + std::to_string(tail_dim));
    }

    if (head_dim == 0 || head_dim % 2 != 0) {
        throw TensorSizeMismatchException("RotatE entity width must be even and non zero, got " + std::to_string(head_dim));
    }

    if (rel_dim * 2 != head_dim) {
        throw TensorSizeMismatchException("RotatE relation width must be half of the entity width. Got " + std::to_string(rel_dim) + " for entity width " +
                                          std::to_string(head_dim));
    }
}

torch::Tensor RotatEScore::transform(const torch::Tensor &inputs, const torch::Tensor &relations) {
    std::vector<torch::Tensor> halves = inputs.chunk(2, -1);
    torch::Tensor real_emb = halves[0];
    torch::Tensor imag_emb = halves[1];

    torch::Tensor real_rel;
    torch::Tensor imag_rel;
    std::tie(real_rel, imag_rel) = rotation(relations);

    torch::Tensor real_out = real_rel * real_emb - imag_rel * imag_emb;
    torch::Tensor imag_out = real_rel * imag_emb + imag_rel * real_emb;

    return torch::cat({real_out, imag_out}, -1);
}

torch::Tensor RotatEScore::inverse_transform(const torch::Tensor &inputs, const torch::Tensor &relations) {
    std::vector<torch::Tensor> halves = inputs.chunk(2, -1);
    torch::Tensor real_emb = halves[0];
    torch::Tensor imag_emb = halves[1];

    torch::Tensor real_rel;
    torch::Tensor imag_rel;
    std::tie(real_rel, imag_rel) = rotation(relations);

    torch::Tensor real_out = real_rel * real_emb + imag_rel * imag_emb;
    torch::Tensor imag_out = real_rel * imag_emb - imag_rel * real_emb;

    return torch::cat({real_out, imag_out}, -1);
}

torch::Tensor RotatEScore::complex_residual_norm(const torch::Tensor &residual) {
    std::vector<torch::Tensor> halves = residual.chunk(2, -1);
    torch::Tensor modulus = torch::sqrt(halves[0].pow(2) + halves[1].pow(2) + epsilon_);
    return modulus.sum(-1);
}

torch::Tensor RotatEScore::distance(const torch::Tensor &predicted, const torch::Tensor &reference) { return complex_residual_norm(predicted - reference); }

torch::Tensor RotatEScore::chunked_distance(const torch::Tensor &predicted, const torch::Tensor &reference) {
    return complex_residual_norm(predicted.unsqueeze(2) - reference.unsqueeze(1));
}
