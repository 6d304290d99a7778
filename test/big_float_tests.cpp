#include <hpm/numeric/big_float.hpp>

#include "hpm_test_utils.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <limits>
#include <sstream>

using hpm::big_float;

TEST(big_float_test_suite, default_is_positive_zero)
{
    big_float z;
    EXPECT_TRUE(z.is_zero());
    EXPECT_FALSE(z.signbit());
    EXPECT_EQ(big_float::default_precision, z.precision());
}

TEST(big_float_test_suite, double_round_trip_is_exact)
{
    for (auto v : { 0.1, -2.5, 1e300, 3.14159, 5e-324, -1.0 / 3.0 })
    {
        big_float b(v);
        EXPECT_EQ(v, b.to_double());
    }
}

TEST(big_float_test_suite, nan_is_rejected)
{
    EXPECT_THROW(big_float(std::numeric_limits<double>::quiet_NaN()), hpm::nan_error);
}

TEST(big_float_test_suite, zero_precision_is_rejected)
{
    EXPECT_THROW(big_float(1.0, 0), std::invalid_argument);
    EXPECT_THROW(big_float(1).with_precision(0), std::invalid_argument);
}

TEST(big_float_test_suite, rounding_is_half_to_even)
{
    //! At 3 bits 9 lies halfway between 8 and 10, 11 halfway between 10 and 12.
    EXPECT_EQ(8, big_float(9, 3));
    EXPECT_EQ(12, big_float(11, 3));
    EXPECT_EQ(12, big_float(13, 3).with_precision(2));
}

TEST(big_float_test_suite, sticky_bits_break_ties)
{
    auto one = big_float(1, 400);
    auto half_ulp = power_of_two(-53, 400);
    auto tiny = power_of_two(-200, 400);

    EXPECT_EQ(1, (one + half_ulp).with_precision(53));
    EXPECT_EQ(one + power_of_two(-52, 400), (one + half_ulp + tiny).with_precision(53));
}

TEST(big_float_test_suite, far_apart_operands)
{
    auto one = big_float(1, 53);
    auto tiny = power_of_two(-200, 53);
    EXPECT_EQ(1, one + tiny);
    EXPECT_EQ(1, one - tiny);
    EXPECT_LT(big_float::add(one, tiny, 300), big_float::add(one, tiny + tiny, 300));
    EXPECT_EQ(big_float::sub(one, tiny, 300) + tiny, big_float(1, 300));
}

TEST(big_float_test_suite, signed_zero)
{
    big_float nz(-0.0);
    big_float pz(0.0);
    EXPECT_TRUE(nz.signbit());
    EXPECT_EQ(pz, nz);
    EXPECT_FALSE(pz.identical(nz));

    auto cancel = big_float(1) - big_float(1);
    EXPECT_TRUE(cancel.is_zero());
    EXPECT_FALSE(cancel.signbit());
    EXPECT_TRUE((nz + nz).signbit());
    EXPECT_TRUE((big_float(-3) * pz).signbit());
}

TEST(big_float_test_suite, undefined_operations_throw)
{
    auto inf = big_float::infinity();
    big_float zero;
    EXPECT_THROW(inf - inf, hpm::nan_error);
    EXPECT_THROW(zero * inf, hpm::nan_error);
    EXPECT_THROW(zero / zero, hpm::nan_error);
    EXPECT_THROW(inf / inf, hpm::nan_error);
    EXPECT_THROW(hpm::sqrt(big_float(-1)), hpm::nan_error);
}

TEST(big_float_test_suite, division_by_zero_is_signed_infinity)
{
    auto pos = big_float(1) / big_float(0.0);
    auto neg = big_float(-1) / big_float(0.0);
    auto flipped = big_float(1) / big_float(-0.0);
    EXPECT_TRUE(pos.is_inf());
    EXPECT_FALSE(pos.signbit());
    EXPECT_TRUE(neg.is_inf() && neg.signbit());
    EXPECT_TRUE(flipped.is_inf() && flipped.signbit());
    EXPECT_TRUE((big_float(5) / big_float::infinity()).is_zero());
}

TEST(big_float_test_suite, ordering)
{
    auto inf = big_float::infinity();
    EXPECT_LT(-inf, big_float(-1));
    EXPECT_LT(big_float(-1), big_float(-0.0));
    EXPECT_LT(big_float(0.0), big_float(1));
    EXPECT_LT(big_float(1), inf);
    EXPECT_EQ(0, hpm::compare(inf, inf));
    EXPECT_GT(big_float(0.5), 0.25);
    EXPECT_TRUE(2 > big_float(1.5));
}

TEST(big_float_test_suite, precision_of_results)
{
    auto a = big_float(1, 80);
    auto b = big_float(3, 120);
    EXPECT_EQ(120u, (a / b).precision());
    a /= b;
    EXPECT_EQ(80u, a.precision());
    EXPECT_EQ(80u, (a * 2).precision());
    EXPECT_EQ(200u, big_float::mul(a, b, 200).precision());
}

TEST(big_float_test_suite, integer_predicates)
{
    EXPECT_TRUE(big_float(3).is_odd_integer());
    EXPECT_TRUE(big_float(-3).is_odd_integer());
    EXPECT_TRUE(big_float(-7000001).is_odd_integer());
    EXPECT_FALSE(big_float(4).is_odd_integer());
    EXPECT_FALSE(big_float(2.5).is_odd_integer());
    EXPECT_FALSE(big_float(0.0).is_odd_integer());
    EXPECT_TRUE(big_float(6).is_int());
    EXPECT_TRUE(big_float(0.0).is_int());
    EXPECT_FALSE(big_float(0.5).is_int());
    EXPECT_FALSE(big_float::infinity().is_int());
}

TEST(big_float_test_suite, exponent_is_floor_log2)
{
    EXPECT_EQ(0, big_float(1).exponent());
    EXPECT_EQ(-1, big_float(0.75).exponent());
    EXPECT_EQ(10, big_float(1024).exponent());
    EXPECT_EQ(10, big_float(-2047).exponent());
}

TEST(big_float_test_suite, truncation)
{
    EXPECT_EQ(-2, hpm::trunc(big_float(-2.5)));
    EXPECT_EQ(-3, hpm::floor(big_float(-2.5)));
    EXPECT_EQ(2, hpm::floor(big_float(2.5)));
    EXPECT_TRUE(hpm::trunc(big_float(-0.25)).is_zero());
    EXPECT_EQ(-12345, big_float(-12345.75).to_int64());
    EXPECT_EQ(big_float::mantissa_type(big_float::mantissa_type(1) << 100), power_of_two(100).to_integer());
    EXPECT_THROW(big_float::infinity().to_int64(), std::overflow_error);
    EXPECT_THROW(power_of_two(70).to_int64(), std::overflow_error);
}

TEST(big_float_test_suite, ldexp_is_exact)
{
    auto x = big_float(3, 2);
    EXPECT_EQ(12, hpm::ldexp(x, 2));
    EXPECT_EQ(0.375, hpm::ldexp(x, -3));
    EXPECT_TRUE(hpm::ldexp(x, std::int64_t(1) << 40).is_inf());
}

TEST(big_float_test_suite, sqrt)
{
    auto two = big_float(2, 200);
    auto r = hpm::sqrt(two);
    EXPECT_EQ(200u, r.precision());
    EXPECT_TRUE(relatively_close(r * r, two, power_of_two(-198)));
    EXPECT_EQ(12, hpm::sqrt(big_float(144)));
    EXPECT_TRUE(hpm::sqrt(big_float(-0.0)).signbit());
}

TEST(big_float_test_suite, parse_decimal_text)
{
    EXPECT_TRUE(big_float::from_string("0.1", 100).identical(big_float::from_ratio(1, 10, 100)));
    EXPECT_EQ(-1250, big_float::from_string("-1.25e3"));
    EXPECT_EQ(0.015625, big_float::from_string("15.625E-3"));
    auto inf = big_float::from_string("-inf");
    EXPECT_TRUE(inf.is_inf() && inf.signbit());
    EXPECT_THROW(big_float::from_string("abc"), std::invalid_argument);
    EXPECT_THROW(big_float::from_string("1.5e"), std::invalid_argument);
    EXPECT_THROW(big_float::from_ratio(1, 0, 10), std::invalid_argument);
}

TEST(big_float_test_suite, decimal_output)
{
    EXPECT_EQ("1.024e+03", big_float(1024).str());
    EXPECT_EQ("-1.2345e+03", big_float(-1234.5).str(5));
    EXPECT_EQ("5e-01", big_float(0.5).str(3));
    EXPECT_EQ("1e+00", big_float(0.9999999).str(3));
    EXPECT_EQ("0", big_float().str());
    EXPECT_EQ("-inf", big_float::infinity(true).str());

    std::stringstream os;
    os << big_float(0.25);
    EXPECT_EQ("2.5e-01", os.str());
}

TEST(big_float_test_suite, conversion_saturates)
{
    EXPECT_EQ(std::numeric_limits<double>::infinity(), power_of_two(5000).to_double());
    EXPECT_EQ(0.0, power_of_two(-5000).to_double());
}
