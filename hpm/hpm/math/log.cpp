//
//! Copyright © 2022
//! Brandon Kohn
//
//  Distributed under the Boost Software License, Version 1.0. (See
//  accompanying file LICENSE_1_0.txt or copy at
//  http://www.boost.org/LICENSE_1_0.txt)
//
#include <hpm/math/log.hpp>
#include <hpm/math/constants.hpp>
#include <hpm/math/exp.hpp>
#include <hpm/math/series.hpp>
#include <hpm/logging.hpp>

#include <cmath>
#include <string>

namespace hpm {

    namespace {

        constexpr double native_ln2 = 0.69314718055994530942;
        constexpr double native_sqrt2 = 1.41421356237309504880;

        //! Returns true (with the result stored) when x needs no iteration.
        bool log_special_case(const big_float& x, const char* name, big_float& result)
        {
            if (x.is_zero() || x.signbit())
                throw domain_error(std::string(name) + ": logarithm of a non-positive value " + x.str());
            if (x.is_inf())
            {
                result = x;
                return true;
            }
            if (x == 1)
            {
                result = big_float::zero(false, x.precision());
                return true;
            }
            return false;
        }

        //! Native seed good for any magnitude: log(m) + k ln(2) with m in [1, 2).
        double initial_guess(const big_float& x)
        {
            auto k = x.exponent();
            auto m = ldexp(x, -k).to_double();
            return std::log(m) + static_cast<double>(k) * native_ln2;
        }

        bool close_enough(const big_float& diff, const big_float& y, const big_float& tol, const big_float& rtol)
        {
            return diff <= tol || (!y.is_zero() && diff <= rtol * abs(y));
        }

        //! e^y, failing when the iteration has wandered to an exponential that no longer fits.
        big_float checked_exp(const big_float& y, const char* name, std::size_t iteration)
        {
            auto ey = exp(y);
            if (ey.is_inf() || ey.is_zero())
                throw numerical_error(std::string(name) + ": exponential left the representable range at iteration " + std::to_string(iteration));
            return ey;
        }

        template <typename Step>
        iteration_result refine(const big_float& x, convergence_order order, const char* name, Step&& step)
        {
            auto p = x.precision();
            auto wp = working_precision(p);
            auto xw = x.with_precision(wp);
            auto tol = tolerance(p);
            auto rtol = relative_tolerance(p);
            auto maxIterations = max_iterations(p, order);

            big_float y(initial_guess(x), wp);
            for (std::size_t i = 1; i <= maxIterations; ++i)
            {
                auto next = step(xw, y, i);
                auto diff = abs(next - y);
                y = next;
                if (logger()->should_log(spdlog::level::trace))
                    logger()->trace("{}: iteration {} y={} |dy|={}", name, i, y.str(20), diff.str(6));
                if (close_enough(diff, y, tol, rtol))
                {
                    //! The tolerance tiers stop short of 2^-p at high precision, so keep stepping until the update
                    //! itself is below 2^-p relative.
                    auto fine = series_threshold(p);
                    auto n = i;
                    while (n < maxIterations && !diff.is_zero() && diff > fine * abs(y))
                    {
                        next = step(xw, y, ++n);
                        diff = abs(next - y);
                        y = next;
                    }
                    return { y.with_precision(p), true, n };
                }
            }

            logger()->warn("{}: no convergence after {} iterations at {} bits for x={}", name, maxIterations, p, x.str());
            return { y.with_precision(p), false, maxIterations };
        }

        big_float newton_step(const big_float& x, const big_float& y, std::size_t i)
        {
            auto ey = checked_exp(y, "log_newton", i);
            auto den = x + ey;
            if (den.is_zero())
                throw numerical_error("log_newton: division by zero at iteration " + std::to_string(i));
            return y + 2 * (x - ey) / den;
        }

        big_float halley_step(const big_float& x, const big_float& y, std::size_t i)
        {
            auto ey = checked_exp(y, "log_halley", i);
            auto f = ey - x;
            auto den = ey * (ey + x);
            if (den.is_zero() || den.is_inf())
                throw numerical_error("log_halley: degenerate denominator at iteration " + std::to_string(i));
            return y - 2 * f * ey / den;
        }

    }//! namespace;

    iteration_result log_newton(const big_float& x)
    {
        big_float result;
        if (log_special_case(x, "log_newton", result))
            return { result, true, 0 };
        return refine(x, convergence_order::quadratic, "log_newton", newton_step);
    }

    iteration_result log_halley(const big_float& x)
    {
        big_float result;
        if (log_special_case(x, "log_halley", result))
            return { result, true, 0 };
        return refine(x, convergence_order::cubic, "log_halley", halley_step);
    }

    iteration_result log_taylor(const big_float& x)
    {
        big_float result;
        if (log_special_case(x, "log_taylor", result))
            return { result, true, 0 };

        auto p = x.precision();
        auto k = x.exponent();
        auto m = ldexp(x, -k);

        //! Center m on 1 in [sqrt(1/2), sqrt(2)) so that |u| <= 0.172.
        if (m > native_sqrt2)
        {
            m = ldexp(m, -1);
            ++k;
        }

        auto wp = working_precision(p) + static_cast<unsigned>(std::log2(std::abs(static_cast<double>(k)) + 1.0)) + 1;
        auto mw = m.with_precision(wp);
        auto u = (mw - 1) / (mw + 1);
        auto u2 = u * u;

        series_options options;
        options.tolerance = series_threshold(wp);
        options.test = series_test::partial_sum_delta;
        options.check_interval = 5;
        options.max_terms = max_iterations(p, convergence_order::linear);
        options.name = "log_taylor";
        auto series = sum_series(u, [&u2](std::size_t n, const big_float& t)
        {
            return t * u2 * (2 * n - 1) / (2 * n + 1);
        }, options);

        auto y = 2 * series.value + k * ln2(wp);
        return { y.with_precision(p), series.converged, series.iterations };
    }

    big_float log(const big_float& x, log_method method)
    {
        big_float result;
        if (log_special_case(x, "log", result))
            return result;

        switch (method)
        {
        case log_method::newton:
            return log_newton(x).value;
        case log_method::halley:
            return log_halley(x).value;
        case log_method::taylor:
            return log_taylor(x).value;
        case log_method::automatic:
        default:
            break;
        }

        auto p = x.precision();
        auto k = x.exponent();
        if (k > 1020 || k < -1020)
        {
            auto wp = working_precision(p) + 64;
            auto m = ldexp(x, -k).with_precision(wp);
            logger()->debug("log: splitting binary exponent {} at {} bits", k, p);
            return (log_newton(m).value + k * ln2(wp)).with_precision(p);
        }

        if (x <= 100000)
        {
            logger()->debug("log: newton at {} bits", p);
            return log_newton(x).value;
        }

        logger()->debug("log: halley at {} bits", p);
        return log_halley(x).value;
    }

}//! namespace hpm;
