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
#include "detection.hpp"
#include <limits>    // for numeric_limits
#include <optional>  // for optional
#include "distance.hpp"
#include "logging.hpp"

using std::optional;

using geometry::Coordinate;
using zone::DeliveryZone;
using zone::Found;
using zone::NotFound;
using zone::ZoneDetectionResult;

namespace detection {

    ZoneDetectionResult ZoneDetector::detectZone(const Coordinate& point) const {
        // hold the snapshot for the whole scan
        const auto zones = store_.activeZones();
        for (const auto& candidate : *zones) {
            if (!zone::contains(candidate, point)) continue;
            return Found{candidate, zone::projectTown(candidate), point};
        }

        logging::getLogger()->info("No delivery zone at {} ({} active zones checked)",
                                   geometry::toString(point), zones->size());
        return NotFound{point, zone::NOT_FOUND_MESSAGE};
    }

    optional<DeliveryZone> ZoneDetector::findClosestZone(const Coordinate& point) const {
        const auto zones = store_.activeZones();
        const DeliveryZone* closest = nullptr;
        double minDistance = std::numeric_limits<double>::infinity();

        for (const auto& candidate : *zones) {
            const double d = distance::distanceKm(point, zone::anchorOf(candidate));
            // strict: the first of equally distant zones stays
            if (d < minDistance) {
                minDistance = d;
                closest = &candidate;
            }
        }

        if (closest == nullptr) return std::nullopt;
        return *closest;
    }

    bool ZoneDetector::isDeliveryAvailable(const Coordinate& point) const {
        return zone::isFound(detectZone(point));
    }

}  // namespace detection
