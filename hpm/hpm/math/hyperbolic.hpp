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

namespace hpm {

    HPM_API big_float sinh(const big_float& x);
    HPM_API big_float cosh(const big_float& x);
    HPM_API big_float tanh(const big_float& x);
    HPM_API big_float asinh(const big_float& x);

    //! Throws domain_error for x < 1.
    HPM_API big_float acosh(const big_float& x);

    //! Throws domain_error for |x| > 1; atanh(+-1) = +-inf.
    HPM_API big_float atanh(const big_float& x);

}//! namespace hpm;
