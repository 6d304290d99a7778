//
//! Copyright © 2022
//! Brandon Kohn
//
//  Distributed under the Boost Software License, Version 1.0. (See
//  accompanying file LICENSE_1_0.txt or copy at
//  http://www.boost.org/LICENSE_1_0.txt)
//
#include <hpm/math/cordic.hpp>
#include <hpm/math/argument_reduction.hpp>
#include <hpm/math/constants.hpp>
#include <hpm/math/precision_policy.hpp>
#include <hpm/logging.hpp>

namespace hpm {

    rotation_result cordic_rotate(const big_float& theta, unsigned precision)
    {
        auto n = static_cast<std::size_t>(precision) + 2;
        auto x = cordic_gain(precision);
        auto y = big_float::zero(false, precision);
        auto z = theta.with_precision(precision);
        for (std::size_t i = 0; i < n; ++i)
        {
            auto shift = -static_cast<std::int64_t>(i);
            auto dx = ldexp(y, shift);
            auto dy = ldexp(x, shift);
            auto a = atan_table_entry(i, precision);
            if (!z.signbit())
            {
                x -= dx;
                y += dy;
                z -= a;
            }
            else
            {
                x += dx;
                y -= dy;
                z += a;
            }
        }

        bool converged = abs(z) <= ldexp(big_float(1, 64), 2 - static_cast<std::int64_t>(precision));
        if (!converged)
            logger()->warn("cordic_rotate: residual angle {} after {} iterations", z.str(6), n);
        return { x, y, converged, n };
    }

    big_float sin_cordic(const big_float& x)
    {
        auto p = x.precision();
        if (x.is_inf())
            return big_float::infinity(false, p);
        if (x.is_zero())
            return x;

        auto wp = working_precision(p);
        auto reduced = reduce_sine(x, reduction_range::half_pi, wp);
        auto v = cordic_rotate(reduced.angle, wp).sine;
        if (reduced.transform.negate)
            v = -v;
        return v.with_precision(p);
    }

    big_float cos_cordic(const big_float& x)
    {
        auto p = x.precision();
        if (x.is_inf())
            return big_float::infinity(false, p);
        if (x.is_zero())
            return big_float(1, p);

        auto wp = working_precision(p);
        auto reduced = reduce_cosine(x, reduction_range::half_pi, wp);
        auto v = cordic_rotate(reduced.angle, wp).cosine;
        if (reduced.transform.negate)
            v = -v;
        return v.with_precision(p);
    }

    big_float tan_cordic(const big_float& x)
    {
        auto p = x.precision();
        if (x.is_inf())
            return big_float::infinity(false, p);
        if (x.is_zero())
            return x;

        auto wp = working_precision(p);
        auto reduced = reduce_tangent(x, wp);
        auto rotation = cordic_rotate(reduced.angle, wp);
        auto v = reduced.transform.reciprocal ? rotation.cosine / rotation.sine : rotation.sine / rotation.cosine;
        if (reduced.transform.negate)
            v = -v;
        return v.with_precision(p);
    }

}//! namespace hpm;
