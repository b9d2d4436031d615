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
#include "containment.hpp"
#include <algorithm>  // for min, max
#include <cstddef>    // for size_t

using std::min;
using std::max;

using geometry::Boundary;
using geometry::BoundingBox;
using geometry::Coordinate;

namespace containment {

    namespace {
        // sign of the cross product (b - a) x (c - a) in lng/lat space
        int orientation(const Coordinate& a, const Coordinate& b, const Coordinate& c) {
            const double cross = (b.lng() - a.lng()) * (c.lat() - a.lat()) -
                (b.lat() - a.lat()) * (c.lng() - a.lng());
            if (cross > 0) return 1;
            if (cross < 0) return -1;
            return 0;
        }

        // c is collinear with a-b; is it within the segment's extent?
        bool onSegment(const Coordinate& a, const Coordinate& b, const Coordinate& c) {
            return c.lng() >= min(a.lng(), b.lng()) && c.lng() <= max(a.lng(), b.lng()) &&
                c.lat() >= min(a.lat(), b.lat()) && c.lat() <= max(a.lat(), b.lat());
        }
    }  // namespace

    bool contains(const Coordinate& point, const Boundary& boundary) {
        const auto& points = boundary.points;
        const size_t n = points.size();
        if (n < 3) return false;

        bool inside = false;
        for (size_t i = 0, j = n - 1; i < n; j = i++) {
            // order each edge south to north so the crossing is computed the
            // same way whichever direction the ring winds
            const bool rising = points[j].lat() < points[i].lat();
            const Coordinate& a = rising ? points[j] : points[i];
            const Coordinate& b = rising ? points[i] : points[j];
            // straddle test excludes horizontal edges, so the division is safe
            if ((a.lat() > point.lat()) == (b.lat() > point.lat())) continue;
            const double crossLng = (b.lng() - a.lng()) * (point.lat() - a.lat()) /
                (b.lat() - a.lat()) + a.lng();
            if (point.lng() < crossLng) inside = !inside;
        }
        return inside;
    }

    bool contains(const Coordinate& point, const Boundary& boundary, const BoundingBox& box) {
        // Fast bounding box reject
        if (!box.contains(point)) return false;
        return contains(point, boundary);
    }

    bool segmentsIntersect(const Coordinate& p1, const Coordinate& p2,
                           const Coordinate& q1, const Coordinate& q2) {
        const int o1 = orientation(p1, p2, q1);
        const int o2 = orientation(p1, p2, q2);
        const int o3 = orientation(q1, q2, p1);
        const int o4 = orientation(q1, q2, p2);

        if (o1 != o2 && o3 != o4) return true;

        if (o1 == 0 && onSegment(p1, p2, q1)) return true;
        if (o2 == 0 && onSegment(p1, p2, q2)) return true;
        if (o3 == 0 && onSegment(q1, q2, p1)) return true;
        if (o4 == 0 && onSegment(q1, q2, p2)) return true;
        return false;
    }

    bool segmentsCross(const Coordinate& p1, const Coordinate& p2,
                       const Coordinate& q1, const Coordinate& q2) {
        const int o1 = orientation(p1, p2, q1);
        const int o2 = orientation(p1, p2, q2);
        const int o3 = orientation(q1, q2, p1);
        const int o4 = orientation(q1, q2, p2);
        return o1 * o2 < 0 && o3 * o4 < 0;
    }

}  // namespace containment
