//
//! Copyright © 2022
//! Brandon Kohn
//
//  Distributed under the Boost Software License, Version 1.0. (See
//  accompanying file LICENSE_1_0.txt or copy at
//  http://www.boost.org/LICENSE_1_0.txt)
//
#include <hpm/math/trig.hpp>
#include <hpm/math/argument_reduction.hpp>
#include <hpm/math/constants.hpp>
#include <hpm/math/cordic.hpp>
#include <hpm/math/detail/minimax.hpp>
#include <hpm/math/kernels.hpp>
#include <hpm/logging.hpp>

#include <string>

namespace hpm {

    namespace {

        constexpr unsigned cordic_threshold = 1000;
        constexpr unsigned minimax_threshold = 53;

        enum class sine_family
        {
            sine
          , cosine
        };

        //! The special cases shared by every sine and cosine strategy. Returns true when result is final.
        bool trig_special_case(const big_float& x, sine_family f, big_float& result)
        {
            if (x.is_inf())
            {
                logger()->debug("{}: infinite argument, returning the undefined sentinel", f == sine_family::sine ? "sin" : "cos");
                result = big_float::infinity(false, x.precision());
                return true;
            }
            if (x.is_zero())
            {
                result = f == sine_family::sine ? x : big_float(1, x.precision());
                return true;
            }
            return false;
        }

        template <typename SinKernel, typename CosKernel>
        big_float evaluate_quarter(const big_float& x, sine_family f, SinKernel&& sinKernel, CosKernel&& cosKernel)
        {
            big_float result;
            if (trig_special_case(x, f, result))
                return result;

            auto p = x.precision();
            auto wp = working_precision(p);
            auto reduced = f == sine_family::sine ? reduce_sine(x, reduction_range::quarter_pi, wp) : reduce_cosine(x, reduction_range::quarter_pi, wp);
            bool useSine = (f == sine_family::sine) != reduced.transform.cofunction;
            auto v = useSine ? sinKernel(reduced.angle, wp) : cosKernel(reduced.angle, wp);
            if (reduced.transform.negate)
                v = -v;
            return v.with_precision(p);
        }

        big_float sin_kernel(const big_float& a, unsigned wp)
        {
            return sin_series(a, wp).value;
        }

        big_float cos_kernel(const big_float& a, unsigned wp)
        {
            return cos_series(a, wp).value;
        }

        big_float sin_minimax_kernel(const big_float& a, unsigned wp)
        {
            return detail::minimax_sin(a.with_precision(wp));
        }

        big_float cos_minimax_kernel(const big_float& a, unsigned wp)
        {
            return detail::minimax_cos(a.with_precision(wp));
        }

        trig_method select(trig_method method, unsigned p, const char* name)
        {
            if (method != trig_method::automatic)
                return method;
            if (p >= cordic_threshold)
                method = trig_method::cordic;
            else if (p <= minimax_threshold)
                method = trig_method::minimax;
            else
                method = trig_method::taylor;
            if (logger()->should_log(spdlog::level::debug))
            {
                const char* names[] = { "automatic", "taylor", "minimax", "cordic" };
                logger()->debug("{}: {} at {} bits", name, names[static_cast<int>(method)], p);
            }
            return method;
        }

        //! tan of an angle in [0, pi/4] followed by the reducer's transform.
        template <typename Kernel>
        big_float evaluate_tangent(const big_float& x, Kernel&& kernel)
        {
            auto p = x.precision();
            if (x.is_inf())
                return big_float::infinity(false, p);
            if (x.is_zero())
                return x;

            auto wp = working_precision(p);
            auto reduced = reduce_tangent(x, wp);
            auto t = kernel(reduced.angle, wp);
            if (reduced.transform.reciprocal)
                t = big_float::div(big_float(1, wp), t, wp);
            if (reduced.transform.negate)
                t = -t;
            return t.with_precision(p);
        }

    }//! namespace;

    big_float sin_taylor(const big_float& x)
    {
        return evaluate_quarter(x, sine_family::sine, sin_kernel, cos_kernel);
    }

    big_float sin_minimax(const big_float& x)
    {
        return evaluate_quarter(x, sine_family::sine, sin_minimax_kernel, cos_minimax_kernel);
    }

    big_float cos_taylor(const big_float& x)
    {
        return evaluate_quarter(x, sine_family::cosine, sin_kernel, cos_kernel);
    }

    big_float cos_minimax(const big_float& x)
    {
        return evaluate_quarter(x, sine_family::cosine, sin_minimax_kernel, cos_minimax_kernel);
    }

    big_float sin(const big_float& x, trig_method method)
    {
        switch (select(method, x.precision(), "sin"))
        {
        case trig_method::cordic:
            return sin_cordic(x);
        case trig_method::minimax:
            return sin_minimax(x);
        default:
            return sin_taylor(x);
        }
    }

    big_float cos(const big_float& x, trig_method method)
    {
        switch (select(method, x.precision(), "cos"))
        {
        case trig_method::cordic:
            return cos_cordic(x);
        case trig_method::minimax:
            return cos_minimax(x);
        default:
            return cos_taylor(x);
        }
    }

    big_float tan_quotient(const big_float& x)
    {
        return evaluate_tangent(x, [](const big_float& a, unsigned wp)
        {
            return sin_series(a, wp).value / cos_series(a, wp).value;
        });
    }

    big_float tan_continued_fraction(const big_float& x)
    {
        return evaluate_tangent(x, [](const big_float& a, unsigned wp)
        {
            auto a2 = a.with_precision(wp);
            a2 *= a2;
            std::size_t n = wp / 8 + 16;
            auto d = big_float(2 * n + 1, wp);
            for (std::size_t k = n; k-- > 0;)
                d = (2 * k + 1) - a2 / d;
            return a.with_precision(wp) / d;
        });
    }

    big_float tan_taylor(const big_float& x)
    {
        return evaluate_tangent(x, [](const big_float& a, unsigned wp)
        {
            return tan_series(a, wp).value;
        });
    }

    big_float tan(const big_float& x, tan_method method)
    {
        switch (method)
        {
        case tan_method::continued_fraction:
            return tan_continued_fraction(x);
        case tan_method::taylor:
            return tan_taylor(x);
        case tan_method::cordic:
            return tan_cordic(x);
        default:
            return tan_quotient(x);
        }
    }

    big_float atan(const big_float& x)
    {
        auto p = x.precision();
        if (x.is_zero())
            return x;
        if (x.is_inf())
        {
            auto halfPi = ldexp(pi(p), -1);
            return x.signbit() ? -halfPi : halfPi;
        }

        auto wp = working_precision(p) + 8;
        auto t = abs(x).with_precision(wp);
        bool reflect = t > 1;
        if (reflect)
            t = 1 / t;

        //! atan(t) = 2 atan(t / (1 + sqrt(1 + t^2)))
        std::int64_t doublings = 0;
        while (t > 0.25)
        {
            t = t / (1 + sqrt(1 + t * t));
            ++doublings;
        }

        auto v = ldexp(atan_series(t, wp).value, doublings);
        if (reflect)
            v = ldexp(pi(wp), -1) - v;
        if (x.signbit())
            v = -v;
        return v.with_precision(p);
    }

    big_float asin(const big_float& x)
    {
        auto p = x.precision();
        if (x.is_inf() || abs(x) > 1)
            throw domain_error("asin: argument " + x.str() + " outside [-1, 1]");
        if (x.is_zero())
            return x;

        auto wp = working_precision(p) + 8;
        auto halfPi = ldexp(pi(wp), -1);
        auto t = abs(x).with_precision(wp);
        big_float v;
        if (t == 1)
            v = halfPi;
        else if (t <= 0.5)
            v = asin_series(t, wp).value;
        else
        {
            //! asin(t) = pi/2 - 2 asin(sqrt((1 - t)/2))
            v = halfPi - 2 * asin_series(sqrt(ldexp(1 - t, -1)), wp).value;
        }

        if (x.signbit())
            v = -v;
        return v.with_precision(p);
    }

    big_float acos(const big_float& x)
    {
        auto p = x.precision();
        if (x.is_inf() || abs(x) > 1)
            throw domain_error("acos: argument " + x.str() + " outside [-1, 1]");
        if (x == 1)
            return big_float::zero(false, p);
        if (x == -1)
            return pi(p);

        auto wp = working_precision(p) + 8;
        return (ldexp(pi(wp), -1) - asin(x.with_precision(wp))).with_precision(p);
    }

}//! namespace hpm;
