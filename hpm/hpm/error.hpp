//
//! Copyright © 2022
//! Brandon Kohn
//
//  Distributed under the Boost Software License, Version 1.0. (See
//  accompanying file LICENSE_1_0.txt or copy at
//  http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include <stdexcept>
#include <string>

namespace hpm {

    //! Argument outside the mathematical domain of a function (log of a non-positive value, asin(2), ...).
    class domain_error : public std::domain_error
    {
    public:
        using std::domain_error::domain_error;
    };

    //! An iteration left its valid operating regime (division by zero, an intermediate overflowing to infinity).
    class numerical_error : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    //! Arithmetic with no defined value in the representation: 0*inf, inf-inf, 0/0, inf/inf, sqrt of a negative.
    class nan_error : public std::domain_error
    {
    public:
        using std::domain_error::domain_error;
    };

}//! namespace hpm;
