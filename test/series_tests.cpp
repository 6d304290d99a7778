#include <hpm/math/series.hpp>
#include <hpm/math/kernels.hpp>

#include "hpm_test_utils.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

using namespace hpm;

namespace {

    series_options options_at(unsigned precision)
    {
        series_options options;
        options.tolerance = series_threshold(precision);
        return options;
    }

}//! namespace;

TEST(series_test_suite, geometric_series_converges)
{
    auto options = options_at(60);
    auto r = sum_series(big_float(1, 64), [](std::size_t, const big_float& t) { return ldexp(t, -1); }, options);
    EXPECT_TRUE(r.converged);
    EXPECT_EQ(60u, r.iterations);
    EXPECT_TRUE(relatively_close(r.value, big_float(2), power_of_two(-60)));
}

TEST(series_test_suite, alternating_terms)
{
    auto options = options_at(60);
    options.alternating = true;
    auto r = sum_series(big_float(1, 64), [](std::size_t, const big_float& t) { return ldexp(t, -1); }, options);
    EXPECT_TRUE(r.converged);
    EXPECT_TRUE(relatively_close(r.value, big_float::from_ratio(2, 3, 64), power_of_two(-58)));
}

TEST(series_test_suite, term_cap_reports_no_convergence)
{
    auto options = options_at(64);
    options.max_terms = 20;
    options.name = "harmonic";
    auto r = sum_series(big_float(1, 64), [](std::size_t n, const big_float&) { return big_float::from_ratio(1, n + 1, 64); }, options);
    EXPECT_FALSE(r.converged);
    EXPECT_EQ(20u, r.iterations);
    EXPECT_GT(r.value, 3.5);
}

TEST(series_test_suite, partial_sum_checks_follow_the_interval)
{
    auto options = options_at(60);
    options.test = series_test::partial_sum_delta;
    options.check_interval = 5;
    auto r = sum_series(big_float(1, 64), [](std::size_t, const big_float& t) { return ldexp(t, -1); }, options);
    EXPECT_TRUE(r.converged);
    EXPECT_EQ(0u, r.iterations % 5);
    EXPECT_GE(r.iterations, 60u);
}

TEST(series_test_suite, absolute_tolerance)
{
    auto options = options_at(10);
    options.relative = false;
    auto r = sum_series(big_float(1000, 64), [](std::size_t, const big_float& t) { return ldexp(t, -1); }, options);
    EXPECT_TRUE(r.converged);
    //! 1000 * 2^-n <= 2^-10 first holds at n = 20.
    EXPECT_EQ(20u, r.iterations);
}

TEST(series_test_suite, zero_first_term)
{
    auto r = sum_series(big_float(), [](std::size_t, const big_float& t) { return t; }, options_at(53));
    EXPECT_TRUE(r.converged);
    EXPECT_EQ(0u, r.iterations);
    EXPECT_TRUE(r.value.is_zero());
}

TEST(series_test_suite, exp_kernel)
{
    auto r = exp_series(big_float(0.5, 200), 200);
    EXPECT_TRUE(r.converged);
    EXPECT_TRUE(relatively_close(r.value, mpfloat(exp(mpfloat(0.5))), 1e-58));
}

TEST(series_test_suite, trig_kernels)
{
    auto x = big_float(0.75, 160);
    EXPECT_TRUE(relatively_close(sin_series(x, 160).value, mpfloat(sin(mpfloat(0.75))), 1e-46));
    EXPECT_TRUE(relatively_close(cos_series(x, 160).value, mpfloat(cos(mpfloat(0.75))), 1e-46));
    EXPECT_TRUE(relatively_close(atan_series(x, 160).value, mpfloat(atan(mpfloat(0.75))), 1e-46));
    EXPECT_TRUE(relatively_close(asin_series(big_float(0.375, 160), 160).value, mpfloat(asin(mpfloat(0.375))), 1e-46));
    EXPECT_TRUE(relatively_close(atanh_series(big_float(0.25, 160), 160).value, mpfloat(log(mpfloat(1.25) / mpfloat(0.75)) / 2), 1e-46));
}

TEST(series_test_suite, tangent_numbers)
{
    auto t = tangent_numbers(6);
    ASSERT_EQ(7u, t.size());
    EXPECT_EQ(1, t[1]);
    EXPECT_EQ(2, t[2]);
    EXPECT_EQ(16, t[3]);
    EXPECT_EQ(272, t[4]);
    EXPECT_EQ(7936, t[5]);
    EXPECT_EQ(353792, t[6]);
}

TEST(series_test_suite, tangent_kernel_at_a_quarter_turn)
{
    //! pi/4 is the widest reduced angle, where the terms shrink slowest.
    auto r = tan_series(big_float(0.7853981633974483, 256), 256);
    EXPECT_TRUE(r.converged);
    EXPECT_TRUE(relatively_close(r.value, mpfloat(tan(mpfloat(0.7853981633974483))), 1e-75));
}
