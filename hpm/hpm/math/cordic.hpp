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

    struct rotation_result
    {
        big_float   cosine;
        big_float   sine;
        bool        converged;
        std::size_t iterations;
    };

    //! Rotate (K, 0) by theta with precision + 2 pseudo-rotations of angle arctan(2^-i). theta must lie in
    //! [-pi/2, pi/2]. Converged when the residual angle is below 2^(2 - precision).
    HPM_API rotation_result cordic_rotate(const big_float& theta, unsigned precision);

    //! Sine, cosine and tangent through argument reduction and cordic_rotate.
    HPM_API big_float sin_cordic(const big_float& x);
    HPM_API big_float cos_cordic(const big_float& x);
    HPM_API big_float tan_cordic(const big_float& x);

}//! namespace hpm;
