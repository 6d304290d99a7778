#include <hpm/math/pow.hpp>

#include "hpm_test_utils.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <cstdint>
#include <limits>

using namespace hpm;

namespace {

    const big_float inf = big_float::infinity();
    const big_float minus_inf = big_float::infinity(true);
    const big_float pz(0.0);
    const big_float nz(-0.0);

    ::testing::AssertionResult is_zero_with_sign(const big_float& v, bool negative)
    {
        if (v.is_zero() && v.signbit() == negative)
            return ::testing::AssertionSuccess();
        return ::testing::AssertionFailure() << v.str() << " is not " << (negative ? "-0" : "+0");
    }

    ::testing::AssertionResult is_inf_with_sign(const big_float& v, bool negative)
    {
        if (v.is_inf() && v.signbit() == negative)
            return ::testing::AssertionSuccess();
        return ::testing::AssertionFailure() << v.str() << " is not " << (negative ? "-inf" : "+inf");
    }

}//! namespace;

TEST(pow_test_suite, classification_order)
{
    EXPECT_EQ(pow_case::zero_exponent, classify_pow(inf, pz));
    EXPECT_EQ(pow_case::zero_exponent, classify_pow(pz, nz));
    EXPECT_EQ(pow_case::unit_base, classify_pow(big_float(1), inf));
    EXPECT_EQ(pow_case::unit_exponent, classify_pow(minus_inf, big_float(1)));
    EXPECT_EQ(pow_case::zero_base, classify_pow(nz, big_float(-3)));
    EXPECT_EQ(pow_case::minus_one_infinite, classify_pow(big_float(-1), minus_inf));
    EXPECT_EQ(pow_case::infinite_exponent, classify_pow(big_float(-2), inf));
    EXPECT_EQ(pow_case::infinite_base, classify_pow(minus_inf, big_float(0.5)));
    EXPECT_EQ(pow_case::undefined, classify_pow(big_float(-2), big_float(0.5)));
    EXPECT_EQ(pow_case::integer_exponent, classify_pow(big_float(-2), big_float(999999)));
    EXPECT_EQ(pow_case::general, classify_pow(big_float(-2), big_float(1000001)));
    EXPECT_EQ(pow_case::general, classify_pow(big_float(2), big_float(0.5)));
}

TEST(pow_test_suite, unit_results)
{
    EXPECT_EQ(1, pow(inf, pz));
    EXPECT_EQ(1, pow(pz, pz));
    EXPECT_EQ(1, pow(big_float(1), inf));
    EXPECT_EQ(1, pow(big_float(1), big_float(-5.5)));
    EXPECT_EQ(1, pow(big_float(-1), inf));
    EXPECT_EQ(1, pow(big_float(-1), minus_inf));
    EXPECT_EQ(-7.25, pow(big_float(-7.25), big_float(1)));
}

TEST(pow_test_suite, zero_base)
{
    EXPECT_TRUE(is_zero_with_sign(pow(pz, big_float(3)), false));
    EXPECT_TRUE(is_zero_with_sign(pow(nz, big_float(3)), true));
    EXPECT_TRUE(is_zero_with_sign(pow(nz, big_float(2)), false));
    EXPECT_TRUE(is_zero_with_sign(pow(nz, big_float(0.5)), false));
    EXPECT_TRUE(is_inf_with_sign(pow(nz, big_float(-3)), true));
    EXPECT_TRUE(is_inf_with_sign(pow(nz, big_float(-2)), false));
    EXPECT_TRUE(is_inf_with_sign(pow(pz, big_float(-2)), false));
    EXPECT_TRUE(is_inf_with_sign(pow(pz, big_float(-1)), false));
    EXPECT_TRUE(is_zero_with_sign(pow(pz, inf), false));
    EXPECT_TRUE(is_inf_with_sign(pow(nz, minus_inf), false));
}

TEST(pow_test_suite, infinite_exponent)
{
    EXPECT_TRUE(is_inf_with_sign(pow(big_float(2), inf), false));
    EXPECT_TRUE(is_inf_with_sign(pow(big_float(-2), inf), false));
    EXPECT_TRUE(is_zero_with_sign(pow(big_float(0.5), inf), false));
    EXPECT_TRUE(is_zero_with_sign(pow(big_float(2), minus_inf), false));
    EXPECT_TRUE(is_inf_with_sign(pow(big_float(-0.5), minus_inf), false));
}

TEST(pow_test_suite, infinite_base)
{
    EXPECT_TRUE(is_inf_with_sign(pow(inf, big_float(2)), false));
    EXPECT_TRUE(is_zero_with_sign(pow(inf, big_float(-1)), false));
    EXPECT_TRUE(is_inf_with_sign(pow(minus_inf, big_float(3)), true));
    EXPECT_TRUE(is_inf_with_sign(pow(minus_inf, big_float(2)), false));
    EXPECT_TRUE(is_zero_with_sign(pow(minus_inf, big_float(-3)), true));
    EXPECT_TRUE(is_zero_with_sign(pow(minus_inf, big_float(-2)), false));
    EXPECT_TRUE(is_inf_with_sign(pow(minus_inf, big_float(0.5)), false));
}

TEST(pow_test_suite, negative_base_with_fractional_exponent_is_undefined)
{
    EXPECT_TRUE(is_inf_with_sign(pow(big_float(-2), big_float(0.5)), false));
    EXPECT_TRUE(is_inf_with_sign(pow(big_float(-8), big_float(-1.0 / 3.0)), false));
}

TEST(pow_test_suite, integer_exponents)
{
    EXPECT_EQ(1024, pow(big_float(2), big_float(10)));
    EXPECT_EQ(-27, pow(big_float(-3), big_float(3)));
    EXPECT_EQ(0.25, pow(big_float(2), big_float(-2)));
    EXPECT_TRUE(relatively_close(pow(big_float(1.5, 200), big_float(77)), mpfloat(pow(mpfloat(1.5), mpfloat(77))), 1e-57));
    EXPECT_TRUE(relatively_close(pow(big_float(0.9, 200), big_float(-1000)), mpfloat(pow(mpfloat(0.9), mpfloat(-1000))), 1e-55));
}

TEST(pow_test_suite, square_and_multiply_keeps_full_precision)
{
    auto x = big_float::from_ratio(10, 3, 256);
    auto expected = mpfloat(pow(mpfloat(mpfloat(10) / 3), mpfloat(150)));
    EXPECT_TRUE(relatively_close(pow_int(x, 150), expected, 1e-74));
    EXPECT_TRUE(relatively_close(pow_int(x, -150), mpfloat(1 / expected), 1e-74));
    EXPECT_TRUE(pow_int(big_float(2, 64), 100).identical(power_of_two(100)));
    EXPECT_EQ(1, pow_int(big_float(5), 0));
    EXPECT_TRUE(is_inf_with_sign(pow_int(nz, -3), true));
}

TEST(pow_test_suite, general_exponents)
{
    EXPECT_TRUE(relatively_close(pow(big_float(2, 200), big_float(0.5, 200)), mpfloat(sqrt(mpfloat(2))), 1e-57));
    EXPECT_TRUE(relatively_close(pow(big_float(10, 200), big_float(-2.25, 200)), mpfloat(pow(mpfloat(10), mpfloat(-2.25))), 1e-57));
    EXPECT_TRUE(relatively_close(pow(big_float(0.001, 200), big_float(3.7, 200)), mpfloat(pow(mpfloat(0.001), mpfloat(3.7))), 1e-55));
}

TEST(pow_test_suite, large_odd_exponent_of_a_negative_base)
{
    auto v = pow(big_float(-2, 64), big_float(1000001, 64));
    EXPECT_TRUE(v.signbit());
    EXPECT_TRUE(relatively_close(v, -power_of_two(1000001), power_of_two(-50)));

    auto even = pow(big_float(-2, 64), big_float(1000002, 64));
    EXPECT_FALSE(even.signbit());
}

TEST(pow_test_suite, exponents_beyond_double_range_saturate)
{
    auto y = ldexp(big_float(3, 64), 2000);
    EXPECT_EQ(pow_case::general, classify_pow(big_float(1.5, 64), y));
    EXPECT_TRUE(is_inf_with_sign(pow(big_float(1.5, 64), y), false));
    EXPECT_TRUE(is_zero_with_sign(pow(big_float(1.5, 64), -y), false));
    EXPECT_TRUE(is_zero_with_sign(pow(big_float(0.5, 64), y), false));
    EXPECT_TRUE(is_inf_with_sign(pow(big_float(-1.5, 64), y), false));
    EXPECT_TRUE(pow(big_float(-1, 64), y).identical(big_float(1, 64)));
}

TEST(pow_test_suite, large_products_get_extra_guard_bits)
{
    //! y log x is about 100, so exp magnifies the error of the product by 2^7.
    auto v = pow(big_float(1.0001, 200), big_float(1000000.5, 200));
    EXPECT_TRUE(relatively_close(v, mpfloat(pow(mpfloat(1.0001), mpfloat(1000000.5))), 1e-56));
}

TEST(pow_test_suite, precision_of_the_result)
{
    EXPECT_EQ(120u, pow(big_float(2, 80), big_float(0.5, 120)).precision());
    EXPECT_EQ(120u, pow(big_float(1, 120), big_float(0.5, 80)).precision());
}

TEST(pow_test_suite, native_arguments)
{
    EXPECT_EQ(8, pow_float64(2.0, 3.0));
    EXPECT_TRUE(is_inf_with_sign(pow_float64(std::numeric_limits<double>::quiet_NaN(), 2.0), false));
    EXPECT_TRUE(is_inf_with_sign(pow_float64(2.0, std::numeric_limits<double>::quiet_NaN()), false));
    EXPECT_EQ(1, pow_float64(std::numeric_limits<double>::infinity(), 0.0));
}
