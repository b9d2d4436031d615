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

// main.cpp

// 1. Project headers
#include "main.h"

// 2. C++ system headers
#include <exception>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <variant>

// 3. Other library headers
#include <nlohmann/json.hpp>

// 4. This project's headers
#include "boundary.hpp"
#include "config.hpp"
#include "detection.hpp"
#include "distance.hpp"
#include "http_client.hpp"
#include "logging.hpp"
#include "zone.hpp"
#include "zone_feed.hpp"
#include "zone_store.hpp"

using std::string;
using std::cout;
using std::cerr;
using std::fixed;
using std::setprecision;
using std::ifstream;
using std::ostringstream;
using std::exception;
using std::runtime_error;

using geometry::Coordinate;

// CLI usage message output as console error message
//
// Args:
//     exe: executable's name
void usage(const char* exe) {
    cerr << "Usage:\n"
    << "  " << exe << " (--zones zones.json | --feed-url URL [--api-key KEY])"
    << " --lat LAT --lng LNG [--log-level LEVEL]\n"
    << "  " << exe << " --inspect-boundary boundary.txt"
    << " [--region minLat,maxLat,minLng,maxLng] [--log-level LEVEL]\n"
    << "Environment: " << config::ENV_FEED_URL << ", " << config::ENV_API_KEY
    << ", " << config::ENV_LOG_LEVEL << "\n";
}

// Validates a boundary file and prints diagnostics
//
// Returns:
//    exit code, EXIT_INVALID_BOUNDARY when the report has violations
int inspectBoundary(const string& path, const config::Args& args) {
    ifstream in(path);
    if (!in) throw runtime_error("Failed to open boundary file: " + path);
    ostringstream text;
    text << in.rdbuf();

    const geometry::Boundary parsed = boundary::parseBoundary(text.str());
    const auto region = args.region ? args.region : boundary::NORTHEAST_INDIA_REGION;
    const boundary::ValidationReport report = boundary::validate(parsed, region);

    cout << "Vertices: " << parsed.points.size()
         << (boundary::isClosed(parsed) ? " (closed)" : " (open)") << "\n";
    for (const auto& v : report.violations) cout << "VIOLATION: " << v << "\n";
    for (const auto& w : report.warnings) {
        cout << "warning: " << w << "\n";
        logging::getLogger()->warn("{}: {}", path, w);
    }

    const auto box = boundary::boundingBox(parsed);
    cout << fixed << setprecision(6)
         << "Bounding box: lat [" << box.minLat << ", " << box.maxLat << "]"
         << " lng [" << box.minLng << ", " << box.maxLng << "]\n"
         << "Centroid: " << geometry::toString(geometry::centroid(parsed)) << "\n"
         << setprecision(2)
         << "Approximate area: " << boundary::approximateAreaKm2(parsed) << " km2\n";

    if (!report.ok()) return EXIT_INVALID_BOUNDARY;
    cout << "boundary_coordinates: "
         << zone::boundaryToJson(boundary::close(*report.boundary)).dump() << "\n";
    return EXIT_OK;
}

void printZone(const zone::DeliveryZone& z) {
    cout << "  zone: " << z.name << " [" << z.id << "] #" << z.zoneNumber << "\n"
         << "  delivery fee: " << z.deliveryFee
         << ", min order: " << z.minOrderAmount
         << ", eta: " << z.estimatedDeliveryTime << "\n";
}

// Loads zones, runs detection for one point, suggests the closest zone on a miss
int detectPoint(const config::Args& args) {
    const Coordinate point(*args.lat, *args.lng);
    zone_store::ZoneStore store;
    if (args.zonesPath) {
        store.refresh(zone_feed::loadZonesFile(*args.zonesPath));
    } else {
        http::CurlHttpClient client;
        zone_feed::syncZones(client, zone_feed::zonesUrl(*args.feedUrl, args.apiKey), store);
    }

    // zone data problems are worth surfacing even when detection succeeds
    boundary::findOverlaps(*store.activeZones());

    const detection::ZoneDetector detector(store);
    const zone::ZoneDetectionResult result = detector.detectZone(point);

    if (const auto* found = std::get_if<zone::Found>(&result)) {
        cout << "Delivery available at " << geometry::toString(point) << "\n";
        printZone(found->zone);
        cout << "  town: " << found->town.name << ", " << found->town.state << "\n";
        return EXIT_OK;
    }

    const auto& notFound = std::get<zone::NotFound>(result);
    cout << notFound.message << "\n";
    const auto closest = detector.findClosestZone(point);
    if (closest) {
        cout << "Closest zone (" << fixed << setprecision(2)
             << distance::distanceKm(point, zone::anchorOf(*closest)) << " km away):\n";
        printZone(*closest);
    }
    return EXIT_OK;
}

// Entry point
int main(int argc, char** argv) {
    config::Args args;
    if (!config::parseArgs(argc, argv, &args)) {
        usage(argv[0]);
        return EXIT_USAGE;
    }
    config::applyEnvironment(&args);
    if (!config::isRunnable(args)) {
        usage(argv[0]);
        return EXIT_USAGE;
    }

    try {
        logging::initLogger();
        if (args.logLevel) logging::setLogLevel(*args.logLevel);

        if (args.inspectPath) return inspectBoundary(*args.inspectPath, args);
        return detectPoint(args);
    } catch (const exception& e) {
        logging::getLogger()->critical("Fatal: {}", e.what());
        return EXIT_FATAL;
    }
}
