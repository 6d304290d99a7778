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

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace hpm {

    //! The library logger ("hpm"). Created on first use with level warn.
    HPM_API std::shared_ptr<spdlog::logger> logger();

    //! Set the library log level from its name: trace, debug, info, warn, err, critical or off.
    //! Throws std::runtime_error for an unknown name.
    HPM_API void set_log_level(const std::string& level);

}//! namespace hpm;
