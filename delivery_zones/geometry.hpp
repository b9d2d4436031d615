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
#ifndef DELIVERY_ZONES_GEOMETRY_HPP_
#define DELIVERY_ZONES_GEOMETRY_HPP_

#include <stdexcept>  // for invalid_argument
#include <string>     // for string
#include <vector>     // for vector

using std::string;
using std::vector;

namespace geometry {

const double MIN_LAT = -90.0;
const double MAX_LAT = 90.0;
const double MIN_LNG = -180.0;
const double MAX_LNG = 180.0;

// thrown when a latitude/longitude is outside the valid range
class InvalidCoordinate : public std::invalid_argument {
 public:
    explicit InvalidCoordinate(const string& what) : std::invalid_argument(what) {}
};

bool isValidLatitude(double lat);
bool isValidLongitude(double lng);

// Immutable lat/lng in decimal degrees. Always within range.
class Coordinate {
 public:
    // Args:
    //    lat: latitude in degrees, -90..90
    //    lng: longitude in degrees, -180..180
    // Throws:
    //    InvalidCoordinate when either component is out of range or not finite
    Coordinate(double lat, double lng);

    double lat() const { return lat_; }
    double lng() const { return lng_; }

    bool operator==(const Coordinate& other) const {
        return lat_ == other.lat_ && lng_ == other.lng_;
    }
    bool operator!=(const Coordinate& other) const { return !(*this == other); }

 private:
    double lat_;
    double lng_;
};

// true when both components are within eps degrees
bool approxEqual(const Coordinate& a, const Coordinate& b, double eps);

string toString(const Coordinate& c);

// polygon ring, closed or open
struct Boundary {
    vector<Coordinate> points;
};

// axis-aligned bounding box for fast reject
struct BoundingBox {
    double minLat{}, maxLat{}, minLng{}, maxLng{};

    bool contains(const Coordinate& c) const {
        return c.lat() >= minLat && c.lat() <= maxLat &&
            c.lng() >= minLng && c.lng() <= maxLng;
    }
    bool intersects(const BoundingBox& other) const {
        return minLat <= other.maxLat && other.minLat <= maxLat &&
            minLng <= other.maxLng && other.minLng <= maxLng;
    }
};

BoundingBox boundsOf(const Boundary& boundary);

// true when the last vertex repeats the first exactly
bool hasClosingVertex(const Boundary& boundary);

Coordinate centroid(const Boundary& boundary);

}  // namespace geometry

#endif  // DELIVERY_ZONES_GEOMETRY_HPP_
