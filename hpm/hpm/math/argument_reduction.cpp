//
//! Copyright © 2022
//! Brandon Kohn
//
//  Distributed under the Boost Software License, Version 1.0. (See
//  accompanying file LICENSE_1_0.txt or copy at
//  http://www.boost.org/LICENSE_1_0.txt)
//
#include <hpm/math/argument_reduction.hpp>
#include <hpm/math/constants.hpp>

#include <algorithm>
#include <stdexcept>

namespace hpm {

    namespace {

        //! Folds r in [0, 2pi) into [0, pi/2] tracking the sign of sin (odd) or cos (even).
        big_float fold_to_half_pi(const big_float& r, int q, const big_float& piw, bool isSine, bool& negate)
        {
            switch (q)
            {
            case 0:
                return r;
            case 1:
                if (!isSine)
                    negate = !negate;
                return piw - r;
            case 2:
                negate = !negate;
                return r - piw;
            default:
                if (isSine)
                    negate = !negate;
                return 2 * piw - r;
            }
        }

        reduced_angle reduce_sine_or_cosine(const big_float& x, reduction_range range, unsigned precision, bool isSine)
        {
            if (x.is_inf())
                throw std::invalid_argument("argument reduction of an infinite angle");

            auto piw = pi(precision);
            reduced_angle result;
            result.transform.negate = isSine && x.signbit();
            auto r = reduce_two_pi(abs(x), precision);
            result.quadrant = quadrant(r, precision);
            auto a = fold_to_half_pi(r, result.quadrant, piw, isSine, result.transform.negate);
            if (a.signbit())
                a = big_float::zero(false, precision);

            auto halfPi = ldexp(piw, -1);
            if (range == reduction_range::quarter_pi && a >= ldexp(piw, -2))
            {
                a = halfPi - a;
                result.transform.cofunction = true;
            }
            result.angle = a;
            return result;
        }

    }//! namespace;

    big_float reduce_two_pi(const big_float& x, unsigned precision)
    {
        if (x.is_inf())
            throw std::invalid_argument("reduce_two_pi: infinite angle");
        if (x.is_zero())
            return big_float::zero(false, precision);

        auto extra = static_cast<unsigned>((std::max)(std::int64_t(0), x.exponent())) + 8;
        auto pp = (std::max)(precision, x.precision()) + extra;
        auto twoPi = ldexp(pi(pp), 1);
        auto r = abs(x).with_precision(pp);

        while (r >= twoPi)
        {
            auto j = r.exponent() - twoPi.exponent();
            auto m = ldexp(twoPi, j);
            if (m > r)
                m = ldexp(twoPi, --j);
            r -= m;
        }

        if (x.signbit() && !r.is_zero())
            r = twoPi - r;
        return r.with_precision(precision);
    }

    int quadrant(const big_float& r, unsigned precision)
    {
        auto halfPi = ldexp(pi(precision), -1);
        if (r < halfPi)
            return 0;
        if (r < 2 * halfPi)
            return 1;
        if (r < 3 * halfPi)
            return 2;
        return 3;
    }

    reduced_angle reduce_sine(const big_float& x, reduction_range range, unsigned precision)
    {
        return reduce_sine_or_cosine(x, range, precision, true);
    }

    reduced_angle reduce_cosine(const big_float& x, reduction_range range, unsigned precision)
    {
        return reduce_sine_or_cosine(x, range, precision, false);
    }

    reduced_angle reduce_tangent(const big_float& x, unsigned precision)
    {
        if (x.is_inf())
            throw std::invalid_argument("reduce_tangent: infinite angle");

        auto piw = pi(precision);
        reduced_angle result;
        result.transform.negate = x.signbit();
        auto r = reduce_two_pi(abs(x), precision);
        result.quadrant = quadrant(r, precision);
        if (r >= piw)
            r -= piw;
        if (r >= ldexp(piw, -1))
        {
            r = piw - r;
            result.transform.negate = !result.transform.negate;
        }
        if (r.signbit())
            r = big_float::zero(false, precision);
        if (r >= ldexp(piw, -2))
        {
            r = ldexp(piw, -1) - r;
            result.transform.reciprocal = true;
        }
        result.angle = r;
        return result;
    }

}//! namespace hpm;
