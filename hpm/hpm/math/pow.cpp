//
//! Copyright © 2022
//! Brandon Kohn
//
//  Distributed under the Boost Software License, Version 1.0. (See
//  accompanying file LICENSE_1_0.txt or copy at
//  http://www.boost.org/LICENSE_1_0.txt)
//
#include <hpm/math/pow.hpp>
#include <hpm/config.hpp>
#include <hpm/math/exp.hpp>
#include <hpm/math/log.hpp>
#include <hpm/math/precision_policy.hpp>
#include <hpm/logging.hpp>

#include <algorithm>
#include <cmath>

namespace hpm {

    namespace {

        constexpr std::int64_t integer_exponent_limit = 1000000;

        //! Case 4 with its sign and parity rules.
        big_float pow_zero_base(const big_float& x, const big_float& y, unsigned p)
        {
            if (y.is_inf())
                return y.signbit() ? big_float::infinity(false, p) : big_float::zero(false, p);
            bool odd = y.is_odd_integer();
            if (y.signbit())
                return big_float::infinity(odd && x.signbit(), p);
            return big_float::zero(odd && x.signbit(), p);
        }

        big_float square_and_multiply(const big_float& x, std::uint64_t n, unsigned wp)
        {
            big_float result(1, wp);
            auto base = x.with_precision(wp);
            while (n)
            {
                if (n & 1)
                    result *= base;
                n >>= 1;
                if (n)
                    base *= base;
            }
            return result;
        }

    }//! namespace;

    pow_case classify_pow(const big_float& x, const big_float& y)
    {
        if (y.is_zero())
            return pow_case::zero_exponent;
        if (x == 1)
            return pow_case::unit_base;
        if (y == 1)
            return pow_case::unit_exponent;
        if (x.is_zero())
            return pow_case::zero_base;
        if (x == -1 && y.is_inf())
            return pow_case::minus_one_infinite;
        if (y.is_inf())
            return pow_case::infinite_exponent;
        if (x.is_inf())
            return pow_case::infinite_base;
        if (x.signbit() && !y.is_int())
            return pow_case::undefined;
        if (y.is_int() && abs(y) < integer_exponent_limit)
            return pow_case::integer_exponent;
        return pow_case::general;
    }

    big_float pow(const big_float& x, const big_float& y)
    {
        auto p = (std::max)(x.precision(), y.precision());
        auto c = classify_pow(x, y);
        switch (c)
        {
        case pow_case::zero_exponent:
        case pow_case::unit_base:
        case pow_case::minus_one_infinite:
            return big_float(1, p);
        case pow_case::unit_exponent:
            return x.with_precision(p);
        case pow_case::zero_base:
            return pow_zero_base(x, y, p);
        case pow_case::infinite_exponent:
        {
            bool grows = (abs(x) > 1) != y.signbit();
            return grows ? big_float::infinity(false, p) : big_float::zero(false, p);
        }
        case pow_case::infinite_base:
            if (x.signbit())
                return pow_zero_base(big_float::zero(true, p), -y, p);
            return y.signbit() ? big_float::zero(false, p) : big_float::infinity(false, p);
        case pow_case::undefined:
            logger()->debug("pow: negative base {} with non-integral exponent {}", x.str(), y.str());
            return big_float::infinity(false, p);
        case pow_case::integer_exponent:
            return pow_int(x.with_precision(p), y.to_int64());
        case pow_case::general:
        default:
            break;
        }

        //! exp amplifies the rounding error of t = y log|x| by |t|, so t is recomputed with exponent(t) more bits.
        //! Beyond the exp limit t saturates exp directly.
        auto wp = working_precision(p);
        auto ax = abs(x);
        auto t = y.with_precision(wp) * log(ax.with_precision(wp));
        if (abs(t) <= HPM_EXP_LIMIT && t.exponent() > 0)
        {
            wp += static_cast<unsigned>(t.exponent()) + 2;
            t = y.with_precision(wp) * log(ax.with_precision(wp));
        }
        auto v = exp(t);

        //! Only a large integral y reaches here with a negative base.
        if (x.signbit() && y.is_odd_integer())
            v = -v;
        return v.with_precision(p);
    }

    big_float pow_int(const big_float& x, std::int64_t n)
    {
        auto p = x.precision();
        if (n == 0)
            return big_float(1, p);
        if (n == 1)
            return x;
        if (x.is_zero() || x.is_inf())
            return pow(x, big_float(n, 64)).with_precision(p);

        auto magnitude = n < 0 ? static_cast<std::uint64_t>(-(n + 1)) + 1 : static_cast<std::uint64_t>(n);
        unsigned bits = 0;
        for (auto m = magnitude; m; m >>= 1)
            ++bits;
        auto wp = working_precision(p) + bits;
        auto v = square_and_multiply(x, magnitude, wp);
        if (n < 0)
            v = big_float::div(big_float(1, wp), v, wp);
        return v.with_precision(p);
    }

    big_float pow_float64(double x, double y)
    {
        if (std::isnan(x) || std::isnan(y))
            return big_float::infinity(false, big_float::default_precision);
        return pow(big_float(x), big_float(y));
    }

}//! namespace hpm;
