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
#include "distance.hpp"
#include <algorithm>  // for min
#include <cmath>      // for sin, cos, atan2, sqrt
#include <limits>     // for numeric_limits

using std::sin;
using std::cos;
using std::atan2;
using std::sqrt;
using std::min;

using geometry::Boundary;
using geometry::Coordinate;

namespace distance {

    namespace {
        const double PI = 3.14159265358979323846;
    }  // namespace

    double degreesToRadians(double degrees) {
        return degrees * (PI / 180.0);
    }

    // Great-circle distance using the haversine formula on a sphere
    //
    // Args:
    //    a: first point
    //    b: second point
    // Returns:
    //    distance in kilometres; exactly 0 for identical points
    double distanceKm(const Coordinate& a, const Coordinate& b) {
        if (a == b) return 0.0;

        const double lat1 = degreesToRadians(a.lat());
        const double lat2 = degreesToRadians(b.lat());
        const double dLat = degreesToRadians(b.lat() - a.lat());
        const double dLng = degreesToRadians(b.lng() - a.lng());

        // symmetric in a and b: sin^2 of half differences, product of cosines
        const double sinLat = sin(dLat / 2.0);
        const double sinLng = sin(dLng / 2.0);
        double h = sinLat * sinLat + cos(lat1) * cos(lat2) * sinLng * sinLng;
        h = min(1.0, h);

        const double c = 2.0 * atan2(sqrt(h), sqrt(1.0 - h));
        return EARTH_RADIUS_KM * c;
    }

    // Nearest-vertex distance; edges between vertices are not measured
    double distanceToBoundaryKm(const Coordinate& point, const Boundary& boundary) {
        double best = std::numeric_limits<double>::infinity();
        for (const auto& vertex : boundary.points) {
            best = min(best, distanceKm(point, vertex));
        }
        return best;
    }

}  // namespace distance
