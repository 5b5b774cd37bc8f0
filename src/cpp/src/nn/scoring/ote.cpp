#include "nn/scoring/ote.h"

#include "common/util.h"

OTEScore::OTEScore(float gamma, int num_elem, ScaleType scale_type, bool check_numerics) {
    if (num_elem < 1) {
        throw UnsupportedConfigurationException("OTE block size must be positive, got " + std::to_string(num_elem));
    }

    switch (scale_type) {
        case ScaleType::NONE:
            use_scale_ = false;
            break;
        case ScaleType::ABS:
        case ScaleType::EXP:
            use_scale_ = true;
            break;
        default:
            throw UnsupportedConfigurationException("Scale type " + std::to_string(static_cast<int>(scale_type)) + " is not supported");
    }

    gamma_ = gamma;
    num_elem_ = num_elem;
    scale_type_ = scale_type;
    check_numerics_ = check_numerics;

    SPDLOG_DEBUG("Initialized OTE score function. gamma: {}, num_elem: {}, scale type: {}", gamma_, num_elem_, static_cast<int>(scale_type_));
}

void OTEScore::check_blocks(const torch::Tensor &blocks) {
    assert_defined(blocks);

    if (blocks.dim() != 3 || blocks.size(1) != num_elem_ || blocks.size(2) != block_width()) {
        throw TensorSizeMismatchException("OTE relation blocks should have shape (num_blocks, " + std::to_string(num_elem_) + ", " +
                                          std::to_string(block_width()) + "), got " + shape_to_string(blocks));
    }
}

torch::Tensor OTEScore::orthogonalize(const torch::Tensor &blocks) {
    check_blocks(blocks);

    std::vector<torch::Tensor> basis;
    basis.reserve(num_elem_);

    torch::Tensor remaining = blocks.narrow(2, 0, num_elem_);
    for (int i = 0; i < num_elem_; i++) {
        torch::Tensor row = remaining.select(1, 0);
        basis.emplace_back(row);

        if (i == num_elem_ - 1) {
            break;
        }

        // remove the component along the newly finalized row from every row not yet processed
        remaining = remaining.narrow(1, 1, num_elem_ - i - 1);
        torch::Tensor row_norm = row.pow(2).sum(-1, true).clamp_min(KGSCORE_ORTH_EPSILON).unsqueeze(1);
        torch::Tensor coefficients = (remaining * row.unsqueeze(1)).sum(-1, true) / row_norm;
        remaining = remaining - coefficients * row.unsqueeze(1);
    }

    torch::Tensor orthogonal = torch::stack(basis, 1);
    orthogonal = orthogonal / orthogonal.norm(2, -1, true).clamp_min(KGSCORE_ORTH_EPSILON);

    if (use_scale_) {
        orthogonal = torch::cat({orthogonal, blocks.narrow(2, num_elem_, 1)}, -1);
    }
    return orthogonal;
}

torch::Tensor OTEScore::get_scale(const torch::Tensor &scale) {
    switch (scale_type_) {
        case ScaleType::ABS:
            return scale.abs();
        case ScaleType::EXP:
            return scale.exp();
        default:
            throw UnsupportedConfigurationException("Scale type " + std::to_string(static_cast<int>(scale_type_)) + " is not supported");
    }
}

torch::Tensor OTEScore::reverse_scale(const torch::Tensor &scale) {
    switch (scale_type_) {
        case ScaleType::ABS:
            return (scale.abs() + KGSCORE_REVERSE_SCALE_EPSILON).reciprocal();
        case ScaleType::EXP:
            return -scale;
        default:
            throw UnsupportedConfigurationException("Scale type " + std::to_string(static_cast<int>(scale_type_)) + " is not supported");
    }
}

float OTEScore::scale_init() {
    switch (scale_type_) {
        case ScaleType::ABS:
            return 1.0;
        case ScaleType::EXP:
            return 0.0;
        default:
            throw UnsupportedConfigurationException("Scale type " + std::to_string(static_cast<int>(scale_type_)) + " is not supported");
    }
}

torch::Tensor OTEScore::reverse_transform(const torch::Tensor &blocks) {
    check_blocks(blocks);

    torch::Tensor transposed = blocks.narrow(2, 0, num_elem_).transpose(1, 2);

    if (use_scale_) {
        return torch::cat({transposed, reverse_scale(blocks.narrow(2, num_elem_, 1))}, -1);
    }
    return transposed.contiguous();
}

torch::Tensor OTEScore::orthogonalize_relations(const torch::Tensor &relations) {
    assert_defined(relations);

    if (relations.dim() == 0 || relations.size(-1) % (num_elem_ * block_width()) != 0) {
        throw TensorSizeMismatchException("OTE relation width should be a multiple of " + std::to_string(num_elem_ * block_width()) + ", got shape " +
                                          shape_to_string(relations));
    }

    // explicit block count, -1 cannot be inferred for an empty batch
    int64_t num_blocks = relations.numel() / (num_elem_ * block_width());
    return orthogonalize(relations.reshape({num_blocks, num_elem_, block_width()})).reshape(relations.sizes());
}

torch::Tensor OTEScore::reverse_relations(const torch::Tensor &relations) {
    assert_defined(relations);

    if (relations.dim() == 0 || relations.size(-1) % (num_elem_ * block_width()) != 0) {
        throw TensorSizeMismatchException("OTE relation width should be a multiple of " + std::to_string(num_elem_ * block_width()) + ", got shape " +
                                          shape_to_string(relations));
    }

    // explicit block count, -1 cannot be inferred for an empty batch
    int64_t num_blocks = relations.numel() / (num_elem_ * block_width());
    return reverse_transform(relations.reshape({num_blocks, num_elem_, block_width()})).reshape(relations.sizes());
}

torch::Tensor OTEScore::apply_blocks(const torch::Tensor &inputs, const torch::Tensor &relations) {
    int64_t num_blocks = inputs.size(-1) / num_elem_;

    std::vector<int64_t> input_sizes = inputs.sizes().vec();
    input_sizes.pop_back();
    input_sizes.insert(input_sizes.end(), {num_blocks, 1, num_elem_});

    std::vector<int64_t> rel_sizes = relations.sizes().vec();
    rel_sizes.pop_back();
    rel_sizes.insert(rel_sizes.end(), {num_blocks, num_elem_, block_width()});

    torch::Tensor rel_blocks = relations.reshape(rel_sizes);
    torch::Tensor matrices = rel_blocks.narrow(-1, 0, num_elem_);

    if (use_scale_) {
        // one scale per row, normalized to unit norm within the block
        torch::Tensor scale = get_scale(rel_blocks.narrow(-1, num_elem_, 1));
        scale = scale / scale.norm(2, -2, true).clamp_min(KGSCORE_ORTH_EPSILON);
        matrices = matrices * scale;
    }

    torch::Tensor outputs = torch::matmul(inputs.reshape(input_sizes), matrices);
    return outputs.squeeze(-2).flatten(-2, -1);
}

torch::Tensor OTEScore::block_norm_sum(const torch::Tensor &residual) {
    std::vector<int64_t> sizes = residual.sizes().vec();
    int64_t dim = sizes.back();
    sizes.back() = dim / num_elem_;
    sizes.push_back(num_elem_);

    return residual.reshape(sizes).norm(2, -1).sum(-1);
}

torch::Tensor OTEScore::residual_norm(const torch::Tensor &inputs, const torch::Tensor &relations, const torch::Tensor &reference) {
    return block_norm_sum(apply_blocks(inputs, relations) - reference);
}

void OTEScore::check_widths(int64_t head_dim, int64_t rel_dim, int64_t tail_dim) {
    if (head_dim != tail_dim) {
        throw TensorSizeMismatchException("OTE expects equal head and tail widths. Got " + std::to_string(head_dim) + " and " + std::to_string(tail_dim));
    }

    if (head_dim == 0 || head_dim % num_elem_ != 0) {
        throw TensorSizeMismatchException("OTE entity width " + std::to_string(head_dim) + " is not divisible into blocks of " + std::to_string(num_elem_));
    }

    if (rel_dim != head_dim * block_width()) {
        throw TensorSizeMismatchException("OTE relation width should be " + std::to_string(head_dim * block_width()) + " for entity width " +
                                          std::to_string(head_dim) + ", got " + std::to_string(rel_dim));
    }
}

torch::Tensor OTEScore::transform(const torch::Tensor &inputs, const torch::Tensor &relations) {
    return apply_blocks(inputs, orthogonalize_relations(relations));
}

torch::Tensor OTEScore::inverse_transform(const torch::Tensor &inputs, const torch::Tensor &relations) {
    return apply_blocks(inputs, reverse_relations(orthogonalize_relations(relations)));
}

torch::Tensor OTEScore::distance(const torch::Tensor &predicted, const torch::Tensor &reference) { return block_norm_sum(predicted - reference); }

torch::Tensor OTEScore::chunked_distance(const torch::Tensor &predicted, const torch::Tensor &reference) {
    return block_norm_sum(predicted.unsqueeze(2) - reference.unsqueeze(1));
}
