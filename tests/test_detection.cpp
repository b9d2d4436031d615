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
#include <doctest/doctest.h>
#include <string>
#include <variant>
#include "../delivery_zones/boundary.hpp"
#include "../delivery_zones/detection.hpp"
#include "../delivery_zones/zone.hpp"
#include "../delivery_zones/zone_store.hpp"

using std::string;

using geometry::Coordinate;
using geometry::Boundary;

using zone::DeliveryZone;
using zone::Found;
using zone::NotFound;
using zone::ZoneDetectionResult;
using zone::makePolygonZone;
using zone::makeCircleZone;

using zone_store::ZoneStore;
using detection::ZoneDetector;

namespace {
Boundary square(double lat, double lng, double side) {
    return Boundary{ { {lat, lng}, {lat, lng + side}, {lat + side, lng + side}, {lat + side, lng} } };
}

DeliveryZone zoneA() { return makePolygonZone("zone-a", "Zone A", 1, square(25.0, 90.0, 0.1)); }
DeliveryZone zoneB() { return makePolygonZone("zone-b", "Zone B", 2, square(26.0, 91.0, 0.1)); }
}  // namespace

// -----------------------------------------------------------------------------
// Tests for detectZone
// -----------------------------------------------------------------------------

TEST_CASE("detectZone finds the zone holding the point") {
    ZoneStore store({zoneA(), zoneB()});
    ZoneDetector detector(store);

    ZoneDetectionResult result = detector.detectZone(Coordinate(26.05, 91.05));
    REQUIRE(zone::isFound(result));

    const Found& found = std::get<Found>(result);
    CHECK_EQ(found.zone.id, "zone-b");
    CHECK_EQ(found.town.name, "Zone B");
    CHECK_EQ(found.town.deliveryFee, zone::DEFAULT_DELIVERY_FEE);
    CHECK(found.point == Coordinate(26.05, 91.05));
}

TEST_CASE("detectZone returns NotFound with the fixed message") {
    ZoneStore store({zoneA(), zoneB()});
    ZoneDetector detector(store);

    ZoneDetectionResult result = detector.detectZone(Coordinate(25.5, 90.5));
    REQUIRE(std::holds_alternative<NotFound>(result));

    const NotFound& notFound = std::get<NotFound>(result);
    CHECK_EQ(notFound.message, zone::NOT_FOUND_MESSAGE);
    CHECK(notFound.point == Coordinate(25.5, 90.5));
}

TEST_CASE("detectZone on an empty store is NotFound") {
    ZoneStore store;
    ZoneDetector detector(store);
    CHECK_FALSE(zone::isFound(detector.detectZone(Coordinate(25.05, 90.05))));
}

TEST_CASE("detectZone skips inactive zones") {
    DeliveryZone a = zoneA();
    a.active = false;
    ZoneStore store({a});
    ZoneDetector detector(store);
    CHECK_FALSE(zone::isFound(detector.detectZone(Coordinate(25.05, 90.05))));
}

TEST_CASE("detectZone picks the lowest zone number among overlapping zones") {
    DeliveryZone wide = makePolygonZone("wide", "Wide", 5, square(25.0, 90.0, 0.2));
    DeliveryZone narrow = makePolygonZone("narrow", "Narrow", 2, square(25.05, 90.05, 0.05));
    ZoneStore store({wide, narrow});
    ZoneDetector detector(store);

    ZoneDetectionResult result = detector.detectZone(Coordinate(25.07, 90.07));
    REQUIRE(zone::isFound(result));
    CHECK_EQ(std::get<Found>(result).zone.id, "narrow");
}

TEST_CASE("detectZone breaks zone number ties by id") {
    DeliveryZone second = makePolygonZone("m", "M", 1, square(25.0, 90.0, 0.1));
    DeliveryZone first = makePolygonZone("k", "K", 1, square(25.0, 90.0, 0.1));
    ZoneStore store({second, first});
    ZoneDetector detector(store);

    ZoneDetectionResult result = detector.detectZone(Coordinate(25.05, 90.05));
    REQUIRE(zone::isFound(result));
    CHECK_EQ(std::get<Found>(result).zone.id, "k");
}

TEST_CASE("detectZone matches circle zones") {
    ZoneStore store({makeCircleZone("ring", "Ring", 1, Coordinate(25.5, 91.9), 2.0)});
    ZoneDetector detector(store);

    CHECK(detector.isDeliveryAvailable(Coordinate(25.51, 91.9)));
    CHECK_FALSE(detector.isDeliveryAvailable(Coordinate(25.6, 91.9)));
}

TEST_CASE("detectZone sees zones published after construction") {
    ZoneStore store;
    ZoneDetector detector(store);
    CHECK_FALSE(detector.isDeliveryAvailable(Coordinate(25.05, 90.05)));

    store.refresh({zoneA()});
    CHECK(detector.isDeliveryAvailable(Coordinate(25.05, 90.05)));
}

// -----------------------------------------------------------------------------
// Tests for findClosestZone
// -----------------------------------------------------------------------------

TEST_CASE("findClosestZone returns the zone with the nearest centroid") {
    ZoneStore store({zoneA(), zoneB()});
    ZoneDetector detector(store);

    auto nearA = detector.findClosestZone(Coordinate(25.3, 90.3));
    REQUIRE(nearA.has_value());
    CHECK_EQ(nearA->id, "zone-a");

    auto nearB = detector.findClosestZone(Coordinate(25.9, 90.9));
    REQUIRE(nearB.has_value());
    CHECK_EQ(nearB->id, "zone-b");
}

TEST_CASE("findClosestZone is empty without active zones") {
    ZoneStore empty;
    CHECK_FALSE(ZoneDetector(empty).findClosestZone(Coordinate(25.0, 90.0)).has_value());

    DeliveryZone a = zoneA();
    a.active = false;
    ZoneStore inactive({a});
    CHECK_FALSE(ZoneDetector(inactive).findClosestZone(Coordinate(25.0, 90.0)).has_value());
}

TEST_CASE("findClosestZone keeps the earlier zone on a tie") {
    ZoneStore store({
        makeCircleZone("later", "Later", 2, Coordinate(25.5, 91.9), 1.0),
        makeCircleZone("earlier", "Earlier", 1, Coordinate(25.5, 91.9), 3.0),
    });
    ZoneDetector detector(store);

    auto closest = detector.findClosestZone(Coordinate(25.6, 91.9));
    REQUIRE(closest.has_value());
    CHECK_EQ(closest->id, "earlier");
}

TEST_CASE("findClosestZone measures circle zones from the centre") {
    ZoneStore store({
        zoneA(),
        makeCircleZone("ring", "Ring", 2, Coordinate(25.5, 90.5), 1.0),
    });
    ZoneDetector detector(store);

    auto closest = detector.findClosestZone(Coordinate(25.45, 90.45));
    REQUIRE(closest.has_value());
    CHECK_EQ(closest->id, "ring");
}

// -----------------------------------------------------------------------------
// End to end: authored boundary text to detection
// -----------------------------------------------------------------------------

TEST_CASE("a zone authored as KML text detects points inside it") {
    Boundary authored = boundary::parseBoundary(
        "90.0,25.0,0 90.0,25.1,0 90.1,25.1,0 90.1,25.0,0 90.0,25.0,0");
    REQUIRE_EQ(authored.points.size(), 5);
    REQUIRE(boundary::validate(authored, boundary::NORTHEAST_INDIA_REGION).ok());

    DeliveryZone kml = makePolygonZone("kml", "Authored", 1, authored);
    DeliveryZone far = makeCircleZone("far", "Far", 2, Coordinate(27.0, 94.0), 10.0);
    ZoneStore store({kml, far});
    ZoneDetector detector(store);

    ZoneDetectionResult inside = detector.detectZone(Coordinate(25.05, 90.05));
    REQUIRE(zone::isFound(inside));
    CHECK_EQ(std::get<Found>(inside).zone.id, "kml");

    const Coordinate outside(25.5, 90.5);
    CHECK_FALSE(zone::isFound(detector.detectZone(outside)));

    auto closest = detector.findClosestZone(outside);
    REQUIRE(closest.has_value());
    CHECK_EQ(closest->id, "kml");
}

TEST_CASE("a nearer zone beats the KML zone as the closest suggestion") {
    Boundary authored = boundary::parseBoundary(
        "90.0,25.0,0 90.0,25.1,0 90.1,25.1,0 90.1,25.0,0 90.0,25.0,0");
    DeliveryZone kml = makePolygonZone("kml", "Authored", 1, authored);
    // centroid (25.45, 90.45), about 7.5 km from the point; the KML centroid is about 67 km away
    DeliveryZone near = makePolygonZone("near", "Near", 2, square(25.42, 90.42, 0.06));
    ZoneStore store({kml, near});
    ZoneDetector detector(store);

    const Coordinate outside(25.5, 90.5);
    CHECK_FALSE(zone::isFound(detector.detectZone(outside)));

    auto closest = detector.findClosestZone(outside);
    REQUIRE(closest.has_value());
    CHECK_EQ(closest->id, "near");
}
