#include <gtest/gtest.h>
#include <common/util.h>

TEST(TestUtil, TestNans) {
    torch::Tensor values = torch::tensor({1.0, 2.0, 3.0}, torch::kFloat32);
    ASSERT_FALSE(has_nans(values));
    ASSERT_NO_THROW(assert_no_nans(values));

    values[1] = std::numeric_limits<float>::quiet_NaN();
    ASSERT_TRUE(has_nans(values));
    ASSERT_THROW(assert_no_nans(values), NANTensorException);
}

TEST(TestUtil, TestTensorChecks) {
    torch::Tensor undef_tensor;
    ASSERT_THROW(assert_defined(undef_tensor), UndefinedTensorException);
    ASSERT_NO_THROW(assert_defined(torch::zeros({2})));

    ASSERT_THROW(assert_floating(torch::zeros({2}, torch::kInt64), "Head"), TensorSizeMismatchException);
    ASSERT_NO_THROW(assert_floating(torch::zeros({2}, torch::kFloat64), "Head"));

    ASSERT_EQ(shape_to_string(torch::zeros({2, 3})), "[2, 3]");
}

TEST(TestUtil, TestExceptionHierarchy) {
    ASSERT_THROW(throw TensorSizeMismatchException("bad width"), KGScoreRuntimeException);
    ASSERT_THROW(throw UnsupportedConfigurationException("bad scale"), std::runtime_error);

    try {
        throw TensorSizeMismatchException("bad width");
    } catch (const KGScoreRuntimeException &e) {
        ASSERT_EQ(std::string(e.what()), "Tensor size mismatch. bad width");
    }
}

TEST(TestUtil, TestTimer) {
    Timer timer = Timer();
    timer.start();
    torch::Tensor values = torch::randn({64, 64});
    values = values.matmul(values);
    timer.stop();
    ASSERT_GE(timer.getDuration(false), 0);
}
