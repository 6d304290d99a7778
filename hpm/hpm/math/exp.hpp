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

    //! e^x at the precision of x. exp(0) is exactly 1; |x| beyond HPM_EXP_LIMIT saturates to +inf or +0.
    HPM_API big_float exp(const big_float& x);

    //! 2^x at the precision of x; exact for integral x.
    HPM_API big_float exp2(const big_float& x);

}//! namespace hpm;
