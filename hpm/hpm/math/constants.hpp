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

    //! Build the shared constant table now instead of on first use.
    HPM_API void init();

    //! Copies of the shared constants, rounded to precision. Precisions above HPM_CONSTANT_PRECISION are computed on
    //! demand and not cached.
    HPM_API big_float pi(unsigned precision = HPM_CONSTANT_PRECISION);
    HPM_API big_float e(unsigned precision = HPM_CONSTANT_PRECISION);
    HPM_API big_float ln2(unsigned precision = HPM_CONSTANT_PRECISION);

    //! Direct evaluation from the defining series: Machin's formula, sum of 1/n!, and 2*atanh(1/3).
    HPM_API big_float compute_pi(unsigned precision);
    HPM_API big_float compute_e(unsigned precision);
    HPM_API big_float compute_ln2(unsigned precision);

    //! Number of entries in the CORDIC arctangent table.
    HPM_API std::size_t atan_table_size();

    //! arctan(2^-i). Indices past the table use the small angle value 2^-i once it is exact to the precision;
    //! precisions above HPM_CONSTANT_PRECISION are evaluated directly.
    HPM_API big_float atan_table_entry(std::size_t i, unsigned precision);

    //! Product of 1/sqrt(1 + 2^-2i) over every factor that differs from one at the precision, the starting length
    //! of a CORDIC rotation.
    HPM_API big_float cordic_gain(unsigned precision);

}//! namespace hpm;
