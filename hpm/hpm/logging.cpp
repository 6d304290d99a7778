//
//! Copyright © 2022
//! Brandon Kohn
//
//  Distributed under the Boost Software License, Version 1.0. (See
//  accompanying file LICENSE_1_0.txt or copy at
//  http://www.boost.org/LICENSE_1_0.txt)
//
#include <hpm/logging.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <map>
#include <stdexcept>

namespace hpm {

    namespace {
        std::shared_ptr<spdlog::logger> make_logger()
        {
            auto log = spdlog::get("hpm");
            if (!log)
            {
                log = spdlog::stdout_color_mt("hpm");
                log->set_pattern("[%H:%M:%S.%f] [%n] [%L] [%t] %v");
                log->set_level(spdlog::level::warn);
            }
            return log;
        }
    }//! namespace;

    std::shared_ptr<spdlog::logger> logger()
    {
        static const std::shared_ptr<spdlog::logger> instance = make_logger();
        return instance;
    }

    void set_log_level(const std::string& level)
    {
        static const std::map<std::string, spdlog::level::level_enum> levels = {
            {"trace", spdlog::level::trace},
            {"debug", spdlog::level::debug},
            {"info", spdlog::level::info},
            {"warn", spdlog::level::warn},
            {"err", spdlog::level::err},
            {"critical", spdlog::level::critical},
            {"off", spdlog::level::off}
        };

        auto it = levels.find(level);
        if (it == levels.end())
            throw std::runtime_error("Invalid log level: " + level);
        logger()->set_level(it->second);
    }

}//! namespace hpm;
