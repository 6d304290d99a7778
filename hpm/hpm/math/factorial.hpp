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

#include <cstdint>

namespace hpm {

    //! n! exactly. Throws domain_error for negative n.
    HPM_API boost::multiprecision::cpp_int factorial(std::int64_t n);

    //! x! at the precision of x: exact product for integers up to 1000, gamma(x + 1) otherwise.
    //! Negative arguments give the +inf sentinel.
    HPM_API big_float factorial(const big_float& x);

}//! namespace hpm;
