//
//! Copyright © 2022
//! Brandon Kohn
//
//  Distributed under the Boost Software License, Version 1.0. (See
//  accompanying file LICENSE_1_0.txt or copy at
//  http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include <hpm/logging.hpp>
#include <hpm/math/precision_policy.hpp>

#include <cstddef>
#include <utility>

namespace hpm {

    enum class series_test
    {
        term              //! stop when the latest term is small
      , partial_sum_delta //! stop when the sum moved little since the previous check (and the term is small)
    };

    struct series_options
    {
        big_float   tolerance;
        bool        relative = true;    //! tolerance is scaled by |sum|
        bool        alternating = false;//! negate each new term after the recurrence
        series_test test = series_test::term;
        std::size_t check_interval = 1;
        std::size_t max_terms = 10000;
        const char* name = "series";
    };

    namespace detail {
        inline bool below_tolerance(const big_float& v, const big_float& sum, const series_options& options)
        {
            if (v.is_zero())
                return true;
            if (options.relative)
                return abs(v) <= abs(sum) * options.tolerance;
            return abs(v) <= options.tolerance;
        }
    }//! namespace detail;

    //! Sum first + t(1) + t(2) + ... where t(n) = next(n, t(n-1)). The sum carries the precision of first.
    //! Returns the last partial sum and whether the convergence test passed before options.max_terms.
    template <typename NextTerm>
    inline iteration_result sum_series(big_float first, NextTerm&& next, const series_options& options)
    {
        big_float sum = first;
        big_float term = std::move(first);
        big_float lastCheck = sum;
        if (term.is_zero())
            return { sum, true, 0 };

        for (std::size_t n = 1; n <= options.max_terms; ++n)
        {
            term = next(n, term);
            if (options.alternating)
                term = -term;
            sum += term;

            bool smallTerm = detail::below_tolerance(term, sum, options);
            if (options.test == series_test::term)
            {
                if (smallTerm)
                    return { sum, true, n };
            }
            else if (n % options.check_interval == 0)
            {
                if (smallTerm && detail::below_tolerance(sum - lastCheck, sum, options))
                    return { sum, true, n };
                lastCheck = sum;
            }
        }

        logger()->warn("{}: no convergence after {} terms at {} bits", options.name, options.max_terms, sum.precision());
        return { sum, false, options.max_terms };
    }

}//! namespace hpm;
