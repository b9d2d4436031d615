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
#ifndef DELIVERY_ZONES_DETECTION_HPP_
#define DELIVERY_ZONES_DETECTION_HPP_

#include <optional>  // for optional
#include "geometry.hpp"
#include "zone.hpp"
#include "zone_store.hpp"

namespace detection {

// Answers zone questions against whatever snapshot the store holds at the
// time of each call. Never modifies the store; safe to share across threads.
class ZoneDetector {
 public:
    explicit ZoneDetector(const zone_store::ZoneStore& store) : store_(store) {}

    // First active zone, in store order, whose shape holds the point.
    // No match is a NotFound result, not an error.
    zone::ZoneDetectionResult detectZone(const geometry::Coordinate& point) const;

    // Active zone whose centroid (circle: center) is nearest to the point;
    // ties go to the zone earlier in store order
    std::optional<zone::DeliveryZone> findClosestZone(const geometry::Coordinate& point) const;

    bool isDeliveryAvailable(const geometry::Coordinate& point) const;

 private:
    const zone_store::ZoneStore& store_;
};

}  // namespace detection

#endif  // DELIVERY_ZONES_DETECTION_HPP_
