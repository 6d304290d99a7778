//
//! Copyright © 2022
//! Brandon Kohn
//
//  Distributed under the Boost Software License, Version 1.0. (See
//  accompanying file LICENSE_1_0.txt or copy at
//  http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#ifdef HPM_STATIC_LIB
    #define HPM_API 
#else
    #ifdef _WIN32
        #ifdef HPM_EXPORTS_API
            #define HPM_API __declspec(dllexport)
        #else
            #define HPM_API __declspec(dllimport)
        #endif
    #else
        #ifdef HPM_EXPORTS_API
            #define HPM_API __attribute__ ((visibility ("default")))
        #else
            #define HPM_API
        #endif
    #endif
#endif
