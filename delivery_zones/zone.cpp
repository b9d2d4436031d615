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
#include "zone.hpp"
#include <algorithm>          // for min, max
#include <cmath>              // for cos, fabs
#include <cstddef>            // for size_t
#include <nlohmann/json.hpp>  // for basic_json
#include <optional>           // for optional
#include <sstream>            // for ostringstream
#include <string>             // for string
#include <utility>            // for move
#include <vector>             // for vector
#include "containment.hpp"
#include "distance.hpp"

using std::string;
using std::vector;
using std::optional;
using std::ostringstream;
using std::min;
using std::max;
using std::move;
using json = nlohmann::json;

using geometry::Boundary;
using geometry::BoundingBox;
using geometry::Coordinate;
using geometry::InvalidCoordinate;

namespace zone {

    namespace {
        const double KM_PER_DEGREE = 111.32;

        bool isValidRadius(double radiusKm) {
            return radiusKm > MIN_CIRCLE_RADIUS_KM && radiusKm <= MAX_CIRCLE_RADIUS_KM;
        }

        // id for error messages; records without one are named by position
        string recordLabel(const json& record, size_t index) {
            if (record.is_object() && record.contains("id") && record["id"].is_string()) {
                return "zone '" + record["id"].get<string>() + "'";
            }
            return "zone record #" + std::to_string(index);
        }

        // prefer the override column when the backend sets it
        template <typename T>
        T pick(const json& record, const char* overrideKey, const char* key, const T& fallback) {
            if (record.contains(overrideKey) && !record[overrideKey].is_null()) {
                return record[overrideKey].get<T>();
            }
            if (record.contains(key) && !record[key].is_null()) {
                return record[key].get<T>();
            }
            return fallback;
        }

        optional<string> optionalString(const json& record, const char* key) {
            if (record.contains(key) && record[key].is_string()) return record[key].get<string>();
            return std::nullopt;
        }

        Boundary boundaryFromJson(const json& coords) {
            if (!coords.is_array()) throw MalformedZoneRecord("boundary_coordinates is not an array");
            Boundary boundary;
            for (const auto& p : coords) {
                if (!p.is_object() || !p.contains("lat") || !p.contains("lng") ||
                    !p["lat"].is_number() || !p["lng"].is_number()) {
                    throw MalformedZoneRecord("boundary vertex is not a {lat, lng} object: " + p.dump());
                }
                boundary.points.emplace_back(p["lat"].get<double>(), p["lng"].get<double>());
            }
            return boundary;
        }

        DeliveryZone decode(const json& record) {
            if (!record.is_object()) throw MalformedZoneRecord("record is not an object");
            if (!record.contains("id") || !record["id"].is_string() || record["id"].get<string>().empty())
                throw MalformedZoneRecord("missing id");
            if (!record.contains("name") || !record["name"].is_string())
                throw MalformedZoneRecord("missing name");

            const string id = record["id"].get<string>();
            const string name = record["name"].get<string>();
            const int zoneNumber = record.value("zone_number", 0);
            const bool active = record.value("is_active", true);
            const string type = record.value("zone_type", string("polygon"));

            DeliveryZone zone;
            if (type == "polygon") {
                if (!record.contains("boundary_coordinates"))
                    throw MalformedZoneRecord("polygon zone without boundary_coordinates");
                zone = makePolygonZone(id, name, zoneNumber, boundaryFromJson(record["boundary_coordinates"]), active);
            } else if (type == "circle") {
                for (const char* key : {"center_lat", "center_lng", "radius_km"}) {
                    if (!record.contains(key) || !record[key].is_number())
                        throw MalformedZoneRecord(string("circle zone without ") + key);
                }
                const Coordinate center(record["center_lat"].get<double>(), record["center_lng"].get<double>());
                zone = makeCircleZone(id, name, zoneNumber, center, record["radius_km"].get<double>(), active);
            } else {
                throw MalformedZoneRecord("unknown zone_type '" + type + "'");
            }

            zone.deliveryFee = pick<int>(record, "custom_delivery_fee", "delivery_fee", DEFAULT_DELIVERY_FEE);
            zone.minOrderAmount = pick<int>(record, "custom_min_order", "min_order_amount", DEFAULT_MIN_ORDER_AMOUNT);
            zone.estimatedDeliveryTime = pick<string>(
                record, "custom_delivery_time", "estimated_delivery_time", string(DEFAULT_DELIVERY_TIME));
            zone.townId = optionalString(record, "town_id");
            zone.state = optionalString(record, "state");
            zone.description = optionalString(record, "description");
            return zone;
        }
    }  // namespace

    DeliveryZone makePolygonZone(const string& id, const string& name, int zoneNumber,
                                 const Boundary& boundary, bool active) {
        if (boundary.points.size() < 3) {
            ostringstream oss;
            oss << "polygon boundary needs at least 3 vertices, got " << boundary.points.size();
            throw MalformedZoneRecord(oss.str());
        }
        DeliveryZone zone;
        zone.id = id;
        zone.name = name;
        zone.zoneNumber = zoneNumber;
        zone.active = active;
        zone.type = ZoneType::Polygon;
        zone.boundary = boundary;
        zone.bounds = geometry::boundsOf(boundary);
        return zone;
    }

    DeliveryZone makeCircleZone(const string& id, const string& name, int zoneNumber,
                                const Coordinate& center, double radiusKm, bool active) {
        if (!isValidRadius(radiusKm)) {
            ostringstream oss;
            oss << "circle radius " << radiusKm << " km outside (" << MIN_CIRCLE_RADIUS_KM
                << ", " << MAX_CIRCLE_RADIUS_KM << "]";
            throw MalformedZoneRecord(oss.str());
        }
        DeliveryZone zone;
        zone.id = id;
        zone.name = name;
        zone.zoneNumber = zoneNumber;
        zone.active = active;
        zone.type = ZoneType::Circle;
        zone.circle = Circle{center, radiusKm};

        // loose box: degrees of longitude shrink with latitude
        const double dLat = radiusKm / KM_PER_DEGREE;
        const double cosLat = std::cos(distance::degreesToRadians(center.lat()));
        const double dLng = cosLat > 1e-6 ? radiusKm / (KM_PER_DEGREE * cosLat) : 360.0;
        zone.bounds.minLat = max(geometry::MIN_LAT, center.lat() - dLat);
        zone.bounds.maxLat = min(geometry::MAX_LAT, center.lat() + dLat);
        zone.bounds.minLng = max(geometry::MIN_LNG, center.lng() - dLng);
        zone.bounds.maxLng = min(geometry::MAX_LNG, center.lng() + dLng);
        return zone;
    }

    // Town projection of a zone: identity and commercial terms come from the
    // zone, state from the zone or the default region
    Town projectTown(const DeliveryZone& zone) {
        Town town;
        town.id = zone.id;
        town.name = zone.name;
        town.state = zone.state.value_or(DEFAULT_STATE);
        town.deliveryFee = zone.deliveryFee;
        town.minOrderAmount = zone.minOrderAmount;
        town.estimatedDeliveryTime = zone.estimatedDeliveryTime;
        town.active = zone.active;
        return town;
    }

    bool contains(const DeliveryZone& zone, const Coordinate& point) {
        switch (zone.type) {
            case ZoneType::Polygon:
                return containment::contains(point, zone.boundary, zone.bounds);
            case ZoneType::Circle:
                return zone.circle.has_value() &&
                    distance::distanceKm(point, zone.circle->center) <= zone.circle->radiusKm;
        }
        return false;
    }

    Coordinate anchorOf(const DeliveryZone& zone) {
        if (zone.type == ZoneType::Circle && zone.circle) return zone.circle->center;
        return geometry::centroid(zone.boundary);
    }

    // Decodes one zone record in the backend wire format
    //
    // Args:
    //    record: json object for a single zone
    // Returns:
    //    the decoded zone
    // Throws:
    //    MalformedZoneRecord naming the zone when any field is unusable
    DeliveryZone zoneFromJson(const json& record) {
        try {
            return decode(record);
        } catch (const MalformedZoneRecord& e) {
            throw MalformedZoneRecord(recordLabel(record, 0) + ": " + e.what());
        } catch (const InvalidCoordinate& e) {
            throw MalformedZoneRecord(recordLabel(record, 0) + ": " + e.what());
        } catch (const json::exception& e) {
            throw MalformedZoneRecord(recordLabel(record, 0) + ": " + e.what());
        }
    }

    // Decodes an array of zone records, failing on the first bad one
    vector<DeliveryZone> zonesFromJson(const json& records) {
        if (!records.is_array()) throw MalformedZoneRecord("zone list is not a json array");
        vector<DeliveryZone> zones;
        zones.reserve(records.size());
        for (size_t i = 0; i < records.size(); ++i) {
            const json& record = records[i];
            try {
                zones.push_back(decode(record));
            } catch (const MalformedZoneRecord& e) {
                throw MalformedZoneRecord(recordLabel(record, i) + ": " + e.what());
            } catch (const InvalidCoordinate& e) {
                throw MalformedZoneRecord(recordLabel(record, i) + ": " + e.what());
            } catch (const json::exception& e) {
                throw MalformedZoneRecord(recordLabel(record, i) + ": " + e.what());
            }
        }
        return zones;
    }

    json boundaryToJson(const Boundary& boundary) {
        json coords = json::array();
        for (const auto& p : boundary.points) {
            coords.push_back({{"lat", p.lat()}, {"lng", p.lng()}});
        }
        return coords;
    }

    json toJson(const DeliveryZone& zone) {
        json record = {
            {"id", zone.id},
            {"name", zone.name},
            {"zone_number", zone.zoneNumber},
            {"is_active", zone.active},
            {"delivery_fee", zone.deliveryFee},
            {"min_order_amount", zone.minOrderAmount},
            {"estimated_delivery_time", zone.estimatedDeliveryTime},
        };
        if (zone.type == ZoneType::Circle && zone.circle) {
            record["zone_type"] = "circle";
            record["center_lat"] = zone.circle->center.lat();
            record["center_lng"] = zone.circle->center.lng();
            record["radius_km"] = zone.circle->radiusKm;
        } else {
            record["zone_type"] = "polygon";
            record["boundary_coordinates"] = boundaryToJson(zone.boundary);
        }
        if (zone.townId) record["town_id"] = *zone.townId;
        if (zone.state) record["state"] = *zone.state;
        if (zone.description) record["description"] = *zone.description;
        return record;
    }

}  // namespace zone
