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
#include <limits>
#include "../delivery_zones/distance.hpp"
#include "../delivery_zones/geometry.hpp"

using geometry::Coordinate;
using geometry::Boundary;

using distance::EARTH_RADIUS_KM;
using distance::degreesToRadians;
using distance::distanceKm;
using distance::distanceToBoundaryKm;

// -----------------------------------------------------------------------------
// Tests for distanceKm
// -----------------------------------------------------------------------------

TEST_CASE("distanceKm is exactly zero for the same point") {
    const Coordinate shillong(25.5788, 91.8933);
    CHECK_EQ(distanceKm(shillong, shillong), 0.0);
    CHECK_EQ(distanceKm(Coordinate(-33.87, 151.21), Coordinate(-33.87, 151.21)), 0.0);
}

TEST_CASE("distanceKm is symmetric") {
    const Coordinate shillong(25.5788, 91.8933);
    const Coordinate guwahati(26.1445, 91.7362);
    CHECK_EQ(distanceKm(shillong, guwahati), distanceKm(guwahati, shillong));
}

TEST_CASE("distanceKm of one degree of latitude") {
    CHECK(distanceKm(Coordinate(0.0, 0.0), Coordinate(1.0, 0.0)) == doctest::Approx(111.19493).epsilon(1e-6));
}

TEST_CASE("distanceKm between antipodes is half the circumference") {
    CHECK(distanceKm(Coordinate(0.0, 0.0), Coordinate(0.0, 180.0)) ==
          doctest::Approx(20015.0868).epsilon(1e-6));
}

TEST_CASE("distanceKm between Shillong and Guwahati") {
    const double d = distanceKm(Coordinate(25.5788, 91.8933), Coordinate(26.1445, 91.7362));
    CHECK(d > 60.0);
    CHECK(d < 70.0);
}

TEST_CASE("degreesToRadians converts half a turn") {
    CHECK(degreesToRadians(180.0) == doctest::Approx(3.14159265358979));
    CHECK_EQ(EARTH_RADIUS_KM, 6371.0);
}

// -----------------------------------------------------------------------------
// Tests for distanceToBoundaryKm
// -----------------------------------------------------------------------------

TEST_CASE("distanceToBoundaryKm measures to the nearest vertex") {
    Boundary boundary{ { {0.0, 0.0}, {0.0, 1.0}, {1.0, 1.0} } };
    CHECK(distanceToBoundaryKm(Coordinate(2.0, 1.0), boundary) ==
          doctest::Approx(distanceKm(Coordinate(2.0, 1.0), Coordinate(1.0, 1.0))));
    CHECK_EQ(distanceToBoundaryKm(Coordinate(0.0, 1.0), boundary), 0.0);
}

TEST_CASE("distanceToBoundaryKm of an empty boundary is infinite") {
    CHECK_EQ(distanceToBoundaryKm(Coordinate(0.0, 0.0), Boundary{}),
             std::numeric_limits<double>::infinity());
}
