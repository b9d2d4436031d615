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
#ifndef DELIVERY_ZONES_DISTANCE_HPP_
#define DELIVERY_ZONES_DISTANCE_HPP_

#include "geometry.hpp"

namespace distance {

const double EARTH_RADIUS_KM = 6371.0;  // mean radius, spherical model

double degreesToRadians(double degrees);

double distanceKm(const geometry::Coordinate& a, const geometry::Coordinate& b);

double distanceToBoundaryKm(const geometry::Coordinate& point, const geometry::Boundary& boundary);

}  // namespace distance

#endif  // DELIVERY_ZONES_DISTANCE_HPP_
