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
#ifndef DELIVERY_ZONES_CONFIG_HPP_
#define DELIVERY_ZONES_CONFIG_HPP_

#include <optional>  // for optional
#include <string>    // for string
#include "geometry.hpp"

using std::string;
using std::optional;

namespace config {

const char ENV_FEED_URL[] = "DELIVERY_ZONES_FEED_URL";
const char ENV_API_KEY[] = "DELIVERY_ZONES_API_KEY";
const char ENV_LOG_LEVEL[] = "DELIVERY_ZONES_LOG_LEVEL";

// input args for main entry point
struct Args {
    optional<string> zonesPath;      // zone records from disk
    optional<string> feedUrl;        // or from the backend
    string apiKey;
    optional<double> lat, lng;       // point to detect
    optional<string> inspectPath;    // boundary text to validate
    optional<geometry::BoundingBox> region;
    optional<string> logLevel;
};

// "minLat,maxLat,minLng,maxLng"; nullopt when malformed
optional<geometry::BoundingBox> parseRegion(const string& text);

// Parses arguments from main entry point
//
// Args:
//    argc: number of arguments given
//    argv: provided arguments
//    out: pointer to the Args structure to set state on
// Returns:
//    false on --help, an unknown flag, or a value that does not parse
bool parseArgs(int argc, char** argv, Args* out);

// Fills options the command line left empty from the environment
void applyEnvironment(Args* args);

// true when args describe either a detection or an inspection run
bool isRunnable(const Args& args);

}  // namespace config

#endif  // DELIVERY_ZONES_CONFIG_HPP_
