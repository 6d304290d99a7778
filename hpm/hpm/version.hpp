//!  (C) Copyright Brandon Kohn 2008-2022.
//!  Distributed under the Boost
//!  Software License, Version 1.0. (See accompanying file
//!  LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef HPM_VERSION_HPP
#define HPM_VERSION_HPP
#pragma once

//!  HPM_VERSION % 100 is the patch level
//!  HPM_VERSION / 100 % 1000 is the minor version
//!  HPM_VERSION / 100000 is the major version
#define HPM_VERSION 100100

#endif
