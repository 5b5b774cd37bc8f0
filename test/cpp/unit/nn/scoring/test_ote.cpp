#include <gtest/gtest.h>
#include <nn/scoring/ote.h>

#include "testing_util.h"

class OTEScoreTest : public ::testing::Test {
   protected:
    void SetUp() override { torch::manual_seed(0); }

    int64_t num_elem_ = 4;
    int64_t dim_ = 8;
    OTEScore score_fn_ = OTEScore(12.0, 4);
    OTEScore abs_score_fn_ = OTEScore(12.0, 4, ScaleType::ABS);
    OTEScore exp_score_fn_ = OTEScore(12.0, 4, ScaleType::EXP);
};

TEST_F(OTEScoreTest, TestOrthogonalizeRows) {
    torch::Tensor blocks = getRandTensor({10, num_elem_, num_elem_});
    torch::Tensor blocks_copy = blocks.clone();

    torch::Tensor orthogonal = score_fn_.orthogonalize(blocks);

    ASSERT_EQ(orthogonal.sizes(), blocks.sizes());
    ASSERT_TRUE(checkRowOrthonormal(orthogonal, num_elem_));
    ASSERT_TRUE(blocks.equal(blocks_copy));

    // the first row keeps its direction
    torch::Tensor first = blocks.select(1, 0);
    ASSERT_TRUE(allClose(orthogonal.select(1, 0), first / first.norm(2, -1, true), 1e-5));

    // the second row is the second input row minus its projection onto the first
    torch::Tensor second = blocks.select(1, 1);
    torch::Tensor projected = second - ((second * first).sum(-1, true) / first.pow(2).sum(-1, true)) * first;
    ASSERT_TRUE(allClose(orthogonal.select(1, 1), projected / projected.norm(2, -1, true), 1e-4));
}

TEST_F(OTEScoreTest, TestOrthogonalizeWithScale) {
    torch::Tensor blocks = getRandTensor({6, num_elem_, num_elem_ + 1});

    torch::Tensor orthogonal = abs_score_fn_.orthogonalize(blocks);

    ASSERT_EQ(orthogonal.sizes(), blocks.sizes());
    ASSERT_TRUE(checkRowOrthonormal(orthogonal, num_elem_));
    ASSERT_TRUE(orthogonal.narrow(2, num_elem_, 1).equal(blocks.narrow(2, num_elem_, 1)));
}

TEST_F(OTEScoreTest, TestOrthogonalizeIdentityAndSingleElement) {
    torch::Tensor identity = getIdentityBlocks(3, num_elem_);
    ASSERT_TRUE(allClose(score_fn_.orthogonalize(identity), identity, 1e-6));

    OTEScore single = OTEScore(12.0, 1);
    torch::Tensor blocks = torch::tensor({{{-3.0}}, {{0.5}}}, torch::kFloat32);
    ASSERT_TRUE(allClose(single.orthogonalize(blocks), torch::tensor({{{-1.0}}, {{1.0}}}, torch::kFloat32), 1e-6));
}

TEST_F(OTEScoreTest, TestOrthogonalizeDegenerateRows) {
    // linearly dependent rows do not produce NaNs
    torch::Tensor row = getRandTensor({1, 1, num_elem_});
    torch::Tensor blocks = row.repeat({1, num_elem_, 1});

    torch::Tensor orthogonal = score_fn_.orthogonalize(blocks);
    ASSERT_FALSE(torch::isnan(orthogonal).any().item<bool>());
    ASSERT_TRUE(allClose(orthogonal.select(1, 0), row.squeeze(1) / row.norm(), 1e-5));
}

TEST_F(OTEScoreTest, TestReverseTransform) {
    torch::Tensor blocks = score_fn_.orthogonalize(getRandTensor({5, num_elem_, num_elem_}));
    torch::Tensor reversed = score_fn_.reverse_transform(blocks);

    ASSERT_TRUE(reversed.equal(blocks.transpose(1, 2)));

    // the transpose of an orthonormal block is its inverse
    torch::Tensor x = getRandTensor({5, dim_});
    torch::Tensor relations = blocks.reshape({-1}).narrow(0, 0, 2 * num_elem_ * num_elem_).reshape({1, -1}).expand({5, -1});
    torch::Tensor roundtrip = score_fn_.apply_blocks(score_fn_.apply_blocks(x, relations), score_fn_.reverse_relations(relations));
    ASSERT_TRUE(allClose(roundtrip, x, 1e-4));
}

TEST_F(OTEScoreTest, TestReverseScale) {
    torch::Tensor blocks = getRandTensor({5, num_elem_, num_elem_ + 1});
    torch::Tensor scale = blocks.narrow(2, num_elem_, 1);

    torch::Tensor abs_reversed = abs_score_fn_.reverse_transform(blocks);
    ASSERT_TRUE(abs_reversed.narrow(2, 0, num_elem_).equal(blocks.narrow(2, 0, num_elem_).transpose(1, 2)));
    ASSERT_TRUE(allClose(abs_reversed.narrow(2, num_elem_, 1), (scale.abs() + KGSCORE_REVERSE_SCALE_EPSILON).reciprocal(), 1e-5));

    torch::Tensor exp_reversed = exp_score_fn_.reverse_transform(blocks);
    ASSERT_TRUE(exp_reversed.narrow(2, num_elem_, 1).equal(-scale));

    ASSERT_TRUE(abs_score_fn_.get_scale(scale).equal(scale.abs()));
    ASSERT_TRUE(exp_score_fn_.get_scale(scale).equal(scale.exp()));
}

TEST_F(OTEScoreTest, TestScaleInit) {
    ASSERT_FLOAT_EQ(abs_score_fn_.scale_init(), 1.0);
    ASSERT_FLOAT_EQ(exp_score_fn_.scale_init(), 0.0);
    ASSERT_THROW(score_fn_.scale_init(), UnsupportedConfigurationException);
    ASSERT_THROW(score_fn_.get_scale(torch::ones({1})), UnsupportedConfigurationException);
    ASSERT_THROW(score_fn_.reverse_scale(torch::ones({1})), UnsupportedConfigurationException);

    // neutral scales weight every row equally
    for (OTEScore *scaled : {&abs_score_fn_, &exp_score_fn_}) {
        torch::Tensor relations = getIdentityBlocks(2, num_elem_, 1, scaled->scale_init()).reshape({1, -1});
        torch::Tensor x = getRandTensor({1, dim_});
        ASSERT_TRUE(allClose(scaled->apply_blocks(x, relations), x / std::sqrt(num_elem_), 1e-5));
    }
}

TEST_F(OTEScoreTest, TestIdentityRelation) {
    torch::Tensor head = getRandTensor({3, dim_});
    torch::Tensor tail = getRandTensor({3, dim_});
    torch::Tensor relations = getIdentityBlocks(3 * 2, num_elem_).reshape({3, -1});

    torch::Tensor expected = 12.0 - (head - tail).reshape({3, 2, num_elem_}).norm(2, -1).sum(-1);
    ASSERT_TRUE(allClose(score_fn_.score(head, relations, tail), expected));
    ASSERT_TRUE(allClose(score_fn_.residual_norm(head, relations, tail), 12.0 - expected));

    expected = 12.0 - (tail - head).reshape({3, 2, num_elem_}).norm(2, -1).sum(-1);
    ASSERT_TRUE(allClose(score_fn_.inverse_score(head, relations, tail), expected));
}

TEST_F(OTEScoreTest, TestForwardAndInverse) {
    torch::Tensor head = getRandTensor({4, dim_});
    torch::Tensor relations = getRandTensor({4, dim_ * num_elem_});

    torch::Tensor tail = score_fn_.apply_blocks(head, score_fn_.orthogonalize_relations(relations));

    ASSERT_TRUE(allClose(score_fn_.score(head, relations, tail), torch::full({4}, 12.0), 1e-3));
    ASSERT_TRUE(allClose(score_fn_.inverse_score(head, relations, tail), torch::full({4}, 12.0), 1e-3));
}

TEST_F(OTEScoreTest, TestDirectionsDiffer) {
    torch::Tensor head = getRandTensor({4, dim_});
    torch::Tensor relations = getRandTensor({4, dim_ * num_elem_});
    torch::Tensor tail = getRandTensor({4, dim_});

    // inverse_score(t, r, h) applies the transpose of the relation to h, score(h, r, t) applies the relation itself
    ASSERT_FALSE(allClose(score_fn_.score(head, relations, tail), score_fn_.inverse_score(tail, relations, head), 1e-3));
    ASSERT_TRUE(allClose(score_fn_.inverse_score(tail, relations, head),
                         12.0 - score_fn_.residual_norm(head, score_fn_.reverse_relations(score_fn_.orthogonalize_relations(relations)), tail)));
}

TEST_F(OTEScoreTest, TestScaledScore) {
    torch::Tensor head = getRandTensor({3, dim_});
    torch::Tensor relations = getRandTensor({3, dim_ * (num_elem_ + 1)});
    torch::Tensor tail = getRandTensor({3, dim_});

    torch::Tensor blocks = exp_score_fn_.orthogonalize_relations(relations).reshape({3, 2, num_elem_, num_elem_ + 1});
    torch::Tensor scale = blocks.narrow(-1, num_elem_, 1).exp();
    scale = scale / scale.norm(2, -2, true);
    torch::Tensor matrices = blocks.narrow(-1, 0, num_elem_) * scale;
    torch::Tensor predicted = torch::matmul(head.reshape({3, 2, 1, num_elem_}), matrices).reshape({3, dim_});

    torch::Tensor expected = 12.0 - (predicted - tail).reshape({3, 2, num_elem_}).norm(2, -1).sum(-1);
    ASSERT_TRUE(allClose(exp_score_fn_.score(head, relations, tail), expected));
}

TEST_F(OTEScoreTest, TestBroadcast) {
    int64_t num_negs = 6;
    torch::Tensor head = getRandTensor({3, dim_});
    torch::Tensor relations = getRandTensor({3, dim_ * (num_elem_ + 1)});
    torch::Tensor tails = getRandTensor({3, num_negs, dim_});

    for (OTEScore *score_fn : {&abs_score_fn_, &exp_score_fn_}) {
        torch::Tensor scores = score_fn->score(head, relations, tails);
        torch::Tensor inverse_scores = score_fn->inverse_score(tails, relations, head);
        ASSERT_EQ(scores.sizes(), torch::IntArrayRef({3, num_negs}));
        ASSERT_EQ(inverse_scores.sizes(), torch::IntArrayRef({3, num_negs}));

        for (int64_t j = 0; j < num_negs; j++) {
            ASSERT_TRUE(allClose(scores.select(1, j), score_fn->score(head, relations, tails.select(1, j))));
            ASSERT_TRUE(allClose(inverse_scores.select(1, j), score_fn->inverse_score(tails.select(1, j), relations, head)));
        }
    }

    // wide relations against a shared head and tail
    torch::Tensor wide_relations = getRandTensor({3, num_negs, dim_ * num_elem_});
    torch::Tensor scores = score_fn_.score(head, wide_relations, head);
    ASSERT_EQ(scores.sizes(), torch::IntArrayRef({3, num_negs}));
    for (int64_t j = 0; j < num_negs; j++) {
        ASSERT_TRUE(allClose(scores.select(1, j), score_fn_.score(head, wide_relations.select(1, j), head)));
    }
}

TEST_F(OTEScoreTest, TestShapeMismatch) {
    torch::Tensor head = getRandTensor({2, dim_});
    torch::Tensor tail = getRandTensor({2, dim_});

    ASSERT_THROW(score_fn_.score(head, getRandTensor({2, 7}), tail), TensorSizeMismatchException);
    ASSERT_THROW(score_fn_.score(head, getRandTensor({2, dim_ * (num_elem_ + 1)}), tail), TensorSizeMismatchException);
    ASSERT_THROW(abs_score_fn_.score(head, getRandTensor({2, dim_ * num_elem_}), tail), TensorSizeMismatchException);
    ASSERT_THROW(score_fn_.score(getRandTensor({2, 6}), getRandTensor({2, 6 * num_elem_}), getRandTensor({2, 6})), TensorSizeMismatchException);
    ASSERT_THROW(score_fn_.orthogonalize(getRandTensor({3, num_elem_, num_elem_ + 1})), TensorSizeMismatchException);
    ASSERT_THROW(score_fn_.orthogonalize_relations(getRandTensor({3, 7})), TensorSizeMismatchException);
    ASSERT_THROW(abs_score_fn_.reverse_transform(getRandTensor({3, num_elem_, num_elem_})), TensorSizeMismatchException);
}

TEST_F(OTEScoreTest, TestUnsupportedConfiguration) {
    ASSERT_THROW(OTEScore(12.0, 2, getScaleType(3)), UnsupportedConfigurationException);
    ASSERT_THROW(OTEScore(12.0, 2, static_cast<ScaleType>(3)), UnsupportedConfigurationException);
    ASSERT_THROW(OTEScore(12.0, 0), UnsupportedConfigurationException);
    ASSERT_NO_THROW(OTEScore(12.0, 2, getScaleType(2)));
}
