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
#include "geometry.hpp"
#include <algorithm>  // for min, max
#include <cmath>      // for fabs, isfinite
#include <cstddef>    // for size_t
#include <sstream>    // for ostringstream
#include <stdexcept>  // for invalid_argument
#include <string>     // for string

using std::string;
using std::min;
using std::max;
using std::fabs;
using std::isfinite;
using std::ostringstream;
using std::invalid_argument;

namespace geometry {

    bool isValidLatitude(double lat) {
        return isfinite(lat) && lat >= MIN_LAT && lat <= MAX_LAT;
    }

    bool isValidLongitude(double lng) {
        return isfinite(lng) && lng >= MIN_LNG && lng <= MAX_LNG;
    }

    Coordinate::Coordinate(double lat, double lng) : lat_(lat), lng_(lng) {
        if (!isValidLatitude(lat)) {
            ostringstream oss;
            oss << "latitude " << lat << " outside [-90, 90]";
            throw InvalidCoordinate(oss.str());
        }
        if (!isValidLongitude(lng)) {
            ostringstream oss;
            oss << "longitude " << lng << " outside [-180, 180]";
            throw InvalidCoordinate(oss.str());
        }
    }

    bool approxEqual(const Coordinate& a, const Coordinate& b, double eps) {
        return fabs(a.lat() - b.lat()) <= eps && fabs(a.lng() - b.lng()) <= eps;
    }

    string toString(const Coordinate& c) {
        ostringstream oss;
        oss.precision(8);
        oss << "(" << c.lat() << ", " << c.lng() << ")";
        return oss.str();
    }

    // Compute axis-aligned bounding box for a boundary
    //
    // Args:
    //    boundary: vertices to bound, must not be empty
    // Returns:
    //    the box spanning all vertices
    BoundingBox boundsOf(const Boundary& boundary) {
        if (boundary.points.empty()) throw invalid_argument("bounding box of empty boundary");
        BoundingBox box;
        box.minLat = box.maxLat = boundary.points.front().lat();
        box.minLng = box.maxLng = boundary.points.front().lng();
        for (const auto& point : boundary.points) {
            box.minLat = min(box.minLat, point.lat());
            box.maxLat = max(box.maxLat, point.lat());
            box.minLng = min(box.minLng, point.lng());
            box.maxLng = max(box.maxLng, point.lng());
        }
        return box;
    }

    bool hasClosingVertex(const Boundary& boundary) {
        return boundary.points.size() >= 2 && boundary.points.front() == boundary.points.back();
    }

    // Mean of the vertices; an approximation of the true centroid that is good
    // enough for ranking zones by proximity. A closing duplicate of the first
    // vertex is left out so open and closed rings agree.
    Coordinate centroid(const Boundary& boundary) {
        if (boundary.points.empty()) throw invalid_argument("centroid of empty boundary");
        size_t n = boundary.points.size();
        if (n > 1 && hasClosingVertex(boundary)) --n;

        double sumLat = 0.0, sumLng = 0.0;
        for (size_t i = 0; i < n; ++i) {
            sumLat += boundary.points[i].lat();
            sumLng += boundary.points[i].lng();
        }
        return Coordinate(sumLat / static_cast<double>(n), sumLng / static_cast<double>(n));
    }

}  // namespace geometry
