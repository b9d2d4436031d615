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
#ifndef DELIVERY_ZONES_LOGGING_HPP_
#define DELIVERY_ZONES_LOGGING_HPP_

#include <spdlog/logger.h>  // for logger
#include <memory>           // for shared_ptr
#include <string>           // for string

namespace logging {

const char LOGGER_NAME[] = "delivery_zones";

// Creates the shared stderr logger once; later calls return the same one
std::shared_ptr<spdlog::logger> initLogger();

// The shared logger, created on first use
std::shared_ptr<spdlog::logger> getLogger();

// Args:
//    level: spdlog level name (trace, debug, info, warn, err, critical, off)
void setLogLevel(const std::string& level);

}  // namespace logging

#endif  // DELIVERY_ZONES_LOGGING_HPP_
