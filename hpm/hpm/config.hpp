//
//! Copyright © 2022
//! Brandon Kohn
//
//  Distributed under the Boost Software License, Version 1.0. (See
//  accompanying file LICENSE_1_0.txt or copy at
//  http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

//! Bit precision used when a value is built from a native type without an explicit precision.
#ifndef HPM_DEFAULT_PRECISION
    #define HPM_DEFAULT_PRECISION 53
#endif

//! Bit precision at which pi, e, ln(2) and the arctangent table are stored.
#ifndef HPM_CONSTANT_PRECISION
    #define HPM_CONSTANT_PRECISION 1024
#endif

//! Extra bits carried by intermediate computations.
#ifndef HPM_GUARD_BITS
    #define HPM_GUARD_BITS 32
#endif

//! |x| above which exp(x) saturates to +inf (or +0 for negative x).
#ifndef HPM_EXP_LIMIT
    #define HPM_EXP_LIMIT 700000
#endif

//! Number of arctan(2^-i) entries in the CORDIC table.
#ifndef HPM_CORDIC_TABLE_SIZE
    #define HPM_CORDIC_TABLE_SIZE 384
#endif
