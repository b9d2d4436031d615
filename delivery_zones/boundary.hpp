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
#ifndef DELIVERY_ZONES_BOUNDARY_HPP_
#define DELIVERY_ZONES_BOUNDARY_HPP_

#include <cstddef>    // for size_t
#include <optional>   // for optional
#include <stdexcept>  // for runtime_error
#include <string>     // for string
#include <utility>    // for pair
#include <vector>     // for vector
#include "geometry.hpp"
#include "zone.hpp"

using std::string;
using std::vector;
using std::optional;

namespace boundary {

const double CLOSED_EPSILON_DEG = 0.0001;
const double KM_PER_DEGREE = 111.32;  // flat scale, no latitude correction
const double MAX_SANE_AREA_KM2 = 100.0;

// Rough box around Northeast India, the default service region
const geometry::BoundingBox NORTHEAST_INDIA_REGION{20.0, 30.0, 85.0, 100.0};

// boundary text could not be turned into coordinates
class MalformedBoundary : public std::runtime_error {
 public:
    MalformedBoundary(const string& what, const string& token, size_t position)
        : std::runtime_error(what), token_(token), position_(position) {}

    // the offending token, empty when the text as a whole was bad
    const string& token() const { return token_; }
    // 1-based index of the token, 0 when not applicable
    size_t position() const { return position_; }

 private:
    string token_;
    size_t position_;
};

struct ValidationReport {
    vector<string> violations;  // any of these makes the boundary unusable
    vector<string> warnings;    // worth a look before publishing
    optional<geometry::Boundary> boundary;  // set only when there are no violations

    bool ok() const { return violations.empty(); }
};

struct ZoneOverlap {
    string firstId;
    string secondId;
};

geometry::Boundary parseBoundary(const string& rawText);
string serializeBoundary(const geometry::Boundary& boundary);

ValidationReport validate(const geometry::Boundary& boundary,
                          const optional<geometry::BoundingBox>& allowedRegion = std::nullopt);

geometry::BoundingBox boundingBox(const geometry::Boundary& boundary);
double approximateAreaKm2(const geometry::Boundary& boundary);

bool isClosed(const geometry::Boundary& boundary);
geometry::Boundary close(const geometry::Boundary& boundary);

// index pair of the first two non-adjacent edges found crossing, if any
optional<std::pair<size_t, size_t>> findSelfIntersection(const geometry::Boundary& boundary);

vector<ZoneOverlap> findOverlaps(const vector<zone::DeliveryZone>& zones);

}  // namespace boundary

#endif  // DELIVERY_ZONES_BOUNDARY_HPP_
