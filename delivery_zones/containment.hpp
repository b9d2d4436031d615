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
#ifndef DELIVERY_ZONES_CONTAINMENT_HPP_
#define DELIVERY_ZONES_CONTAINMENT_HPP_

#include "geometry.hpp"

namespace containment {

// Even-odd ray casting. The ray runs from the point toward increasing
// longitude; an edge counts when its endpoints straddle the point's latitude
// under the half-open rule (a.lat > p.lat) != (b.lat > p.lat) and the
// crossing lies strictly east of the point.
//
// Consequences of that rule:
//   - orientation of the ring does not matter
//   - horizontal and zero-length edges never count, so a closing vertex
//     equal to the first changes nothing and collinear rings contain nothing
//   - a point on a south or west edge is inside, on a north or east edge
//     outside; the answer is always the same for the same input
//   - fewer than 3 vertices never contains
bool contains(const geometry::Coordinate& point, const geometry::Boundary& boundary);

// Same as above with a bounding-box reject first
bool contains(const geometry::Coordinate& point, const geometry::Boundary& boundary,
              const geometry::BoundingBox& box);

// true when segments p1-p2 and q1-q2 intersect, touching included
bool segmentsIntersect(const geometry::Coordinate& p1, const geometry::Coordinate& p2,
                       const geometry::Coordinate& q1, const geometry::Coordinate& q2);

// true only when each segment passes strictly through the other's interior
bool segmentsCross(const geometry::Coordinate& p1, const geometry::Coordinate& p2,
                   const geometry::Coordinate& q1, const geometry::Coordinate& q2);

}  // namespace containment

#endif  // DELIVERY_ZONES_CONTAINMENT_HPP_
