#include <hpm/math/cordic.hpp>
#include <hpm/math/constants.hpp>

#include "hpm_test_utils.hpp"

#include <boost/math/constants/constants.hpp>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

using namespace hpm;

TEST(cordic_test_suite, rotation_runs_precision_plus_two_steps)
{
    auto r = cordic_rotate(big_float(0.5, 128), 128);
    EXPECT_TRUE(r.converged);
    EXPECT_EQ(130u, r.iterations);
    EXPECT_TRUE(relatively_close(r.sine, mpfloat(sin(mpfloat(0.5))), 1e-36));
    EXPECT_TRUE(relatively_close(r.cosine, mpfloat(cos(mpfloat(0.5))), 1e-36));
}

TEST(cordic_test_suite, rotation_over_the_whole_range)
{
    auto halfPi = ldexp(pi(96), -1);
    for (auto theta : { -halfPi, big_float(-1, 96), big_float(0.0, 96), big_float(0.25, 96), halfPi })
    {
        auto r = cordic_rotate(theta, 96);
        EXPECT_TRUE(r.converged) << theta;
        auto norm = r.sine * r.sine + r.cosine * r.cosine;
        EXPECT_TRUE(relatively_close(norm, big_float(1, 96), power_of_two(-88))) << theta;
    }
}

TEST(cordic_test_suite, reduced_functions)
{
    for (auto v : { 0.125, 1.0, 2.5, -3.5, 5.0, 250.0 })
    {
        auto x = big_float(v, 128);
        EXPECT_TRUE(relatively_close(sin_cordic(x), mpfloat(sin(mpfloat(v))), 1e-34)) << v;
        EXPECT_TRUE(relatively_close(cos_cordic(x), mpfloat(cos(mpfloat(v))), 1e-34)) << v;
        EXPECT_TRUE(relatively_close(tan_cordic(x), mpfloat(tan(mpfloat(v))), 1e-33)) << v;
    }
}

TEST(cordic_test_suite, gain_extends_past_the_table)
{
    //! At 1000 bits factors up to 2^-1000 matter, past the 384 entry table.
    auto r = cordic_rotate(big_float(0.75, 1000), 1000);
    EXPECT_TRUE(r.converged);
    auto norm = r.sine * r.sine + r.cosine * r.cosine;
    EXPECT_TRUE(relatively_close(norm, big_float(1, 1000), power_of_two(-990)));
}

TEST(cordic_test_suite, special_arguments)
{
    EXPECT_EQ(1, cos_cordic(big_float(0.0)));
    EXPECT_TRUE(sin_cordic(big_float(-0.0)).signbit());
    EXPECT_TRUE(tan_cordic(big_float::infinity()).is_inf());
}
