#include "common/util.h"

#include <sstream>

bool has_nans(torch::Tensor values) { return torch::isnan(values).any().item<bool>(); }

void assert_no_nans(torch::Tensor values) {
    if (has_nans(values)) {
        throw NANTensorException();
    }
}

void assert_defined(const torch::Tensor &values) {
    if (!values.defined()) {
        throw UndefinedTensorException();
    }
}

void assert_floating(const torch::Tensor &values, const std::string &name) {
    if (!values.is_floating_point()) {
        throw TensorSizeMismatchException(name + " embeddings must have a floating point dtype");
    }
}

std::string shape_to_string(const torch::Tensor &values) {
    std::stringstream ss;
    ss << values.sizes();
    return ss.str();
}
