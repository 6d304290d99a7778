//
//! Copyright © 2022
//! Brandon Kohn
//
//  Distributed under the Boost Software License, Version 1.0. (See
//  accompanying file LICENSE_1_0.txt or copy at
//  http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include <hpm/hpm_export.hpp>
#include <hpm/numeric/big_float.hpp>

#include <cstddef>

namespace hpm {

    enum class convergence_order
    {
        linear
      , quadratic
      , cubic
    };

    //! Outcome of an iterative or series computation.
    struct iteration_result
    {
        big_float   value;
        bool        converged;
        std::size_t iterations;
    };

    //! Absolute convergence tolerance for a bit precision. Coarser than 2^-p at high precision where rounding in the
    //! iteration itself keeps the full precision out of reach.
    HPM_API big_float tolerance(unsigned precision);

    //! Relative tolerance used alongside tolerance(); relaxed to 2^(12-p) from 128 bits up.
    HPM_API big_float relative_tolerance(unsigned precision);

    //! Iteration cap for a method of the given convergence order, clamped to guarantee termination.
    HPM_API std::size_t max_iterations(unsigned precision, convergence_order order);

    //! Precision carried by intermediates: precision plus HPM_GUARD_BITS.
    HPM_API unsigned working_precision(unsigned precision);

    //! Relative term size 2^-p at which a power series is considered summed.
    HPM_API big_float series_threshold(unsigned precision);

}//! namespace hpm;
