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
#ifndef DELIVERY_ZONES_ZONE_HPP_
#define DELIVERY_ZONES_ZONE_HPP_

#include <nlohmann/json_fwd.hpp>  // for json
#include <optional>               // for optional
#include <stdexcept>              // for runtime_error
#include <string>                 // for string
#include <variant>                // for variant
#include <vector>                 // for vector
#include "geometry.hpp"

using std::string;
using std::vector;
using std::optional;
using json = nlohmann::json;

namespace zone {

// -------------------------------------
// defaults applied when a zone record leaves a field out
// -------------------------------------
const int DEFAULT_DELIVERY_FEE = 25;
const int DEFAULT_MIN_ORDER_AMOUNT = 200;
const char DEFAULT_DELIVERY_TIME[] = "30-45 mins";
const char DEFAULT_STATE[] = "Meghalaya";

const double MIN_CIRCLE_RADIUS_KM = 0.1;   // exclusive
const double MAX_CIRCLE_RADIUS_KM = 50.0;  // inclusive

const char NOT_FOUND_MESSAGE[] =
    "We don't deliver to this area yet, but we're expanding soon!";

class MalformedZoneRecord : public std::runtime_error {
 public:
    explicit MalformedZoneRecord(const string& what) : std::runtime_error(what) {}
};

enum class ZoneType { Polygon, Circle };

struct Circle {
    geometry::Coordinate center;
    double radiusKm{};
};

// delivery zone as held in the zone store
struct DeliveryZone {
    string id;
    string name;
    int zoneNumber{};
    bool active{true};
    ZoneType type{ZoneType::Polygon};
    geometry::Boundary boundary;          // polygon zones
    geometry::BoundingBox bounds;         // of boundary, or of the circle
    optional<Circle> circle;              // circle zones
    int deliveryFee{DEFAULT_DELIVERY_FEE};
    int minOrderAmount{DEFAULT_MIN_ORDER_AMOUNT};
    string estimatedDeliveryTime{DEFAULT_DELIVERY_TIME};
    optional<string> townId;
    optional<string> state;
    optional<string> description;
};

// town view synthesised from a matched zone
struct Town {
    string id;
    string name;
    string state;
    int deliveryFee{};
    int minOrderAmount{};
    string estimatedDeliveryTime;
    bool active{};
};

struct Found {
    DeliveryZone zone;
    Town town;
    geometry::Coordinate point;
};

struct NotFound {
    geometry::Coordinate point;
    string message;
};

using ZoneDetectionResult = std::variant<Found, NotFound>;

inline bool isFound(const ZoneDetectionResult& result) {
    return std::holds_alternative<Found>(result);
}

// Build a polygon zone, computing its bounding box
DeliveryZone makePolygonZone(const string& id, const string& name, int zoneNumber,
                             const geometry::Boundary& boundary, bool active = true);

// Build a circle zone; radius must be in (0.1, 50] km
DeliveryZone makeCircleZone(const string& id, const string& name, int zoneNumber,
                            const geometry::Coordinate& center, double radiusKm,
                            bool active = true);

Town projectTown(const DeliveryZone& zone);

// point inside the zone's shape; ignores the active flag
bool contains(const DeliveryZone& zone, const geometry::Coordinate& point);

// representative point used for nearest-zone ranking
geometry::Coordinate anchorOf(const DeliveryZone& zone);

DeliveryZone zoneFromJson(const json& record);
vector<DeliveryZone> zonesFromJson(const json& records);
json toJson(const DeliveryZone& zone);
json boundaryToJson(const geometry::Boundary& boundary);

}  // namespace zone

#endif  // DELIVERY_ZONES_ZONE_HPP_
