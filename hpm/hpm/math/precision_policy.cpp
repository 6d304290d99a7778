//
//! Copyright © 2022
//! Brandon Kohn
//
//  Distributed under the Boost Software License, Version 1.0. (See
//  accompanying file LICENSE_1_0.txt or copy at
//  http://www.boost.org/LICENSE_1_0.txt)
//
#include <hpm/math/precision_policy.hpp>
#include <hpm/config.hpp>

#include <algorithm>
#include <cmath>

namespace hpm {

    namespace {
        inline big_float power_of_two(std::int64_t n)
        {
            return ldexp(big_float(1, 64), n);
        }

        inline std::size_t clamp_iterations(double n, std::size_t lo, std::size_t hi)
        {
            return (std::min)((std::max)(static_cast<std::size_t>(n), lo), hi);
        }
    }//! namespace;

    big_float tolerance(unsigned precision)
    {
        auto p = static_cast<std::int64_t>(precision);
        if (p >= 512)
            return power_of_two(-p / 8);
        if (p >= 256)
            return power_of_two(-p / 3);
        if (p >= 128)
            return power_of_two(-p / 2);
        if (p >= 64)
            return power_of_two(-p + 8);
        return power_of_two(-p + 4);
    }

    big_float relative_tolerance(unsigned precision)
    {
        if (precision >= 128)
            return power_of_two(-static_cast<std::int64_t>(precision) + 12);
        return tolerance(precision);
    }

    std::size_t max_iterations(unsigned precision, convergence_order order)
    {
        auto lg = std::log2(static_cast<double>((std::max)(precision, 1u)));
        switch (order)
        {
        case convergence_order::quadratic:
            return clamp_iterations(3.0 * lg + 20.0, 15, 10000);
        case convergence_order::cubic:
            return clamp_iterations(2.0 * lg + 15.0, 20, 5000);
        case convergence_order::linear:
        default:
            return clamp_iterations(2.0 * precision + 200.0, 50, 10000);
        }
    }

    unsigned working_precision(unsigned precision)
    {
        return precision + HPM_GUARD_BITS;
    }

    big_float series_threshold(unsigned precision)
    {
        return power_of_two(-static_cast<std::int64_t>(precision));
    }

}//! namespace hpm;
