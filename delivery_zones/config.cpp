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
#include "config.hpp"
#include <cstdlib>    // for getenv
#include <optional>   // for optional
#include <sstream>    // for istringstream
#include <stdexcept>  // for invalid_argument, out_of_range
#include <string>     // for string, stod
#include <vector>     // for vector

using std::string;
using std::optional;
using std::vector;
using std::istringstream;

using geometry::BoundingBox;

namespace config {

    namespace {
        optional<double> parseDouble(const string& text) {
            try {
                size_t used = 0;
                const double value = std::stod(text, &used);
                if (used != text.size()) return std::nullopt;
                return value;
            } catch (const std::invalid_argument&) {
                return std::nullopt;
            } catch (const std::out_of_range&) {
                return std::nullopt;
            }
        }

        optional<string> fromEnv(const char* name) {
            const char* raw = std::getenv(name);
            if (raw == nullptr || string(raw).empty()) return std::nullopt;
            return string(raw);
        }
    }  // namespace

    optional<BoundingBox> parseRegion(const string& text) {
        vector<double> values;
        istringstream in(text);
        string field;
        while (std::getline(in, field, ',')) {
            const auto value = parseDouble(field);
            if (!value) return std::nullopt;
            values.push_back(*value);
        }
        if (values.size() != 4) return std::nullopt;

        BoundingBox box{values[0], values[1], values[2], values[3]};
        if (box.minLat > box.maxLat || box.minLng > box.maxLng) return std::nullopt;
        return box;
    }

    bool parseArgs(int argc, char** argv, Args* out) {
        for (int i = 1; i < argc; ++i) {
            const string a(argv[i]);
            const bool hasValue = i + 1 < argc;
            if (a == "--help" || a == "-h") {
                return false;
            } else if (a == "--zones" && hasValue) {
                out->zonesPath = argv[++i];
            } else if (a == "--feed-url" && hasValue) {
                out->feedUrl = argv[++i];
            } else if (a == "--api-key" && hasValue) {
                out->apiKey = argv[++i];
            } else if ((a == "--lat" || a == "--lng") && hasValue) {
                const bool isLat = a == "--lat";
                const auto value = parseDouble(argv[++i]);
                if (!value) return false;
                // out of range is a usage error, caught before any zones load
                if (isLat ? !geometry::isValidLatitude(*value) : !geometry::isValidLongitude(*value)) {
                    return false;
                }
                (isLat ? out->lat : out->lng) = *value;
            } else if (a == "--inspect-boundary" && hasValue) {
                out->inspectPath = argv[++i];
            } else if (a == "--region" && hasValue) {
                out->region = parseRegion(argv[++i]);
                if (!out->region) return false;
            } else if (a == "--log-level" && hasValue) {
                out->logLevel = argv[++i];
            } else {
                return false;
            }
        }
        return true;
    }

    void applyEnvironment(Args* args) {
        if (!args->feedUrl) args->feedUrl = fromEnv(ENV_FEED_URL);
        if (args->apiKey.empty()) args->apiKey = fromEnv(ENV_API_KEY).value_or("");
        if (!args->logLevel) args->logLevel = fromEnv(ENV_LOG_LEVEL);
    }

    bool isRunnable(const Args& args) {
        if (args.inspectPath) return true;
        const bool hasSource = args.zonesPath.has_value() || args.feedUrl.has_value();
        return hasSource && args.lat.has_value() && args.lng.has_value();
    }

}  // namespace config
