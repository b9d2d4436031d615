// Copyright 2026 Maree Carroll
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#include "logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>  // for stderr_color_sink_mt
#include <spdlog/spdlog.h>                    // for register_logger
#include <memory>                             // for make_shared
#include <mutex>                              // for call_once, once_flag
#include <string>                             // for string

namespace logging {

    namespace {
        std::once_flag loggerOnce;
        std::shared_ptr<spdlog::logger> sharedLogger;
    }  // namespace

    std::shared_ptr<spdlog::logger> initLogger() {
        std::call_once(loggerOnce, []() {
            // stdout carries CLI results, so logs go to stderr
            auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
            sharedLogger = std::make_shared<spdlog::logger>(LOGGER_NAME, sink);
            sharedLogger->set_level(spdlog::level::info);
            spdlog::register_logger(sharedLogger);
        });
        return sharedLogger;
    }

    std::shared_ptr<spdlog::logger> getLogger() {
        return initLogger();
    }

    void setLogLevel(const std::string& level) {
        auto logger = getLogger();
        // from_str maps unknown names to off, so check the round trip
        const auto parsed = spdlog::level::from_str(level);
        if (parsed == spdlog::level::off && level != "off") {
            logger->warn("Unknown log level {}; defaulting to info", level);
            logger->set_level(spdlog::level::info);
            return;
        }
        logger->set_level(parsed);
    }

}  // namespace logging
