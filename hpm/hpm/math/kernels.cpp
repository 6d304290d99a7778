//
//! Copyright © 2022
//! Brandon Kohn
//
//  Distributed under the Boost Software License, Version 1.0. (See
//  accompanying file LICENSE_1_0.txt or copy at
//  http://www.boost.org/LICENSE_1_0.txt)
//
#include <hpm/math/kernels.hpp>
#include <hpm/math/series.hpp>

namespace hpm {

    namespace {
        series_options make_options(unsigned precision, const char* name, bool alternating)
        {
            series_options options;
            options.tolerance = series_threshold(precision);
            options.alternating = alternating;
            options.max_terms = max_iterations(precision, convergence_order::linear);
            options.name = name;
            return options;
        }
    }//! namespace;

    iteration_result exp_series(const big_float& x, unsigned precision)
    {
        auto r = x.with_precision(precision);
        return sum_series(big_float(1, precision), [&r](std::size_t n, const big_float& t)
        {
            return t * r / n;
        }, make_options(precision, "exp_series", false));
    }

    iteration_result sin_series(const big_float& x, unsigned precision)
    {
        auto r = x.with_precision(precision);
        auto r2 = r * r;
        return sum_series(r, [&r2](std::size_t n, const big_float& t)
        {
            return t * r2 / ((2 * n) * (2 * n + 1));
        }, make_options(precision, "sin_series", true));
    }

    iteration_result cos_series(const big_float& x, unsigned precision)
    {
        auto r = x.with_precision(precision);
        auto r2 = r * r;
        return sum_series(big_float(1, precision), [&r2](std::size_t n, const big_float& t)
        {
            return t * r2 / ((2 * n - 1) * (2 * n));
        }, make_options(precision, "cos_series", true));
    }

    iteration_result tan_series(const big_float& x, unsigned precision)
    {
        //! Terms shrink by about (2x/pi)^2 <= 1/4, two bits each.
        auto t = tangent_numbers(precision / 2 + 32);
        auto r = x.with_precision(precision);
        auto r2 = r * r;
        auto power = r;
        auto options = make_options(precision, "tan_series", false);
        options.max_terms = t.size() - 2;
        return sum_series(r, [&](std::size_t n, const big_float&)
        {
            //! power = x^(2k - 1) / (2k - 1)! with k = n + 1
            auto k = n + 1;
            power = power * r2 / ((2 * k - 2) * (2 * k - 1));
            return big_float::from_integer(t[k], precision) * power;
        }, options);
    }

    iteration_result atan_series(const big_float& x, unsigned precision)
    {
        auto r = x.with_precision(precision);
        auto r2 = r * r;
        return sum_series(r, [&r2](std::size_t n, const big_float& t)
        {
            return t * r2 * (2 * n - 1) / (2 * n + 1);
        }, make_options(precision, "atan_series", true));
    }

    iteration_result asin_series(const big_float& x, unsigned precision)
    {
        auto r = x.with_precision(precision);
        auto r2 = r * r;
        return sum_series(r, [&r2](std::size_t n, const big_float& t)
        {
            return t * r2 * ((2 * n - 1) * (2 * n - 1)) / ((2 * n) * (2 * n + 1));
        }, make_options(precision, "asin_series", false));
    }

    iteration_result atanh_series(const big_float& x, unsigned precision)
    {
        auto r = x.with_precision(precision);
        auto r2 = r * r;
        return sum_series(r, [&r2](std::size_t n, const big_float& t)
        {
            return t * r2 * (2 * n - 1) / (2 * n + 1);
        }, make_options(precision, "atanh_series", false));
    }

    std::vector<boost::multiprecision::cpp_int> tangent_numbers(std::size_t n)
    {
        std::vector<boost::multiprecision::cpp_int> t(n + 1);
        if (n == 0)
            return t;
        t[1] = 1;
        for (std::size_t k = 2; k <= n; ++k)
            t[k] = (k - 1) * t[k - 1];
        for (std::size_t k = 2; k <= n; ++k)
            for (std::size_t j = k; j <= n; ++j)
                t[j] = (j - k) * t[j - 1] + (j - k + 2) * t[j];
        return t;
    }

}//! namespace hpm;
