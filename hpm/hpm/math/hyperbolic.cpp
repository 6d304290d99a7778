//
//! Copyright © 2022
//! Brandon Kohn
//
//  Distributed under the Boost Software License, Version 1.0. (See
//  accompanying file LICENSE_1_0.txt or copy at
//  http://www.boost.org/LICENSE_1_0.txt)
//
#include <hpm/math/hyperbolic.hpp>
#include <hpm/math/exp.hpp>
#include <hpm/math/kernels.hpp>
#include <hpm/math/log.hpp>

#include <algorithm>

namespace hpm {

    namespace {
        //! Bits lost to cancellation when combining terms near 1 for a small |x|.
        unsigned cancellation_bits(const big_float& x)
        {
            if (x.is_zero() || x.exponent() >= 0)
                return 0;
            return static_cast<unsigned>((std::min)(-x.exponent(), std::int64_t(1) << 20));
        }
    }//! namespace;

    big_float sinh(const big_float& x)
    {
        if (x.is_zero() || x.is_inf())
            return x;

        auto p = x.precision();
        auto wp = working_precision(p) + cancellation_bits(x);
        auto ex = exp(x.with_precision(wp));
        return ldexp(ex - 1 / ex, -1).with_precision(p);
    }

    big_float cosh(const big_float& x)
    {
        auto p = x.precision();
        if (x.is_zero())
            return big_float(1, p);
        if (x.is_inf())
            return big_float::infinity(false, p);

        auto wp = working_precision(p);
        auto ex = exp(x.with_precision(wp));
        return ldexp(ex + 1 / ex, -1).with_precision(p);
    }

    big_float tanh(const big_float& x)
    {
        auto p = x.precision();
        if (x.is_zero())
            return x;

        //! Past (p + 2) ln(2) / 2 the result rounds to +-1.
        if (x.is_inf() || abs(x) > 0.35 * (p + 4))
            return big_float(x.signbit() ? -1 : 1, p);

        auto wp = working_precision(p) + cancellation_bits(x);
        auto e2x = exp(ldexp(x.with_precision(wp), 1));
        return ((e2x - 1) / (e2x + 1)).with_precision(p);
    }

    big_float asinh(const big_float& x)
    {
        if (x.is_zero() || x.is_inf())
            return x;

        auto p = x.precision();
        auto wp = working_precision(p) + cancellation_bits(x);
        auto t = abs(x).with_precision(wp);
        auto v = log(t + sqrt(t * t + 1));
        if (x.signbit())
            v = -v;
        return v.with_precision(p);
    }

    big_float acosh(const big_float& x)
    {
        auto p = x.precision();
        if (x < 1)
            throw domain_error("acosh: argument " + x.str() + " below 1");
        if (x == 1)
            return big_float::zero(false, p);
        if (x.is_inf())
            return x;

        //! Near 1 the result is about sqrt(2 (x - 1)); carry the bits the logarithm cancels.
        auto wp = working_precision(p) + cancellation_bits(big_float::sub(x, big_float(1, 64), p + 2)) / 2 + 16;
        auto t = x.with_precision(wp);
        return log(t + sqrt((t - 1) * (t + 1))).with_precision(p);
    }

    big_float atanh(const big_float& x)
    {
        auto p = x.precision();
        if (x.is_inf() || abs(x) > 1)
            throw domain_error("atanh: argument " + x.str() + " outside [-1, 1]");
        if (x.is_zero())
            return x;
        if (abs(x) == 1)
            return big_float::infinity(x.signbit(), p);

        auto wp = working_precision(p);
        auto t = x.with_precision(wp);
        if (abs(t) <= 0.5)
            return atanh_series(t, wp).value.with_precision(p);
        return ldexp(log((1 + t) / (1 - t)), -1).with_precision(p);
    }

}//! namespace hpm;
