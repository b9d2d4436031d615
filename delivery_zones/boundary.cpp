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
#include "boundary.hpp"
#include <algorithm>  // for min, max, sort
#include <cmath>      // for fabs, cos, hypot
#include <cstddef>    // for size_t
#include <optional>   // for optional
#include <sstream>    // for istringstream, ostringstream
#include <stdexcept>  // for invalid_argument, out_of_range
#include <string>     // for string, stod
#include <utility>    // for pair, make_pair
#include <vector>     // for vector
#include "containment.hpp"
#include "distance.hpp"
#include "logging.hpp"

using std::string;
using std::vector;
using std::optional;
using std::istringstream;
using std::ostringstream;
using std::pair;
using std::make_pair;
using std::fabs;
using std::min;
using std::max;
using std::sort;

using geometry::Boundary;
using geometry::BoundingBox;
using geometry::Coordinate;
using geometry::InvalidCoordinate;
using zone::DeliveryZone;
using zone::ZoneType;

namespace boundary {

    namespace {
        const double ZERO_AREA_KM2 = 1e-9;
        const double ON_EDGE_EPSILON_DEG = 1e-9;

        // Parses a whole-token double; anything left over is an error
        //
        // Args:
        //    field: text of one comma-separated field
        //    out: parsed value set here
        // Returns:
        //    true if the field was a number and nothing else
        bool parseNumber(const string& field, double* out) {
            if (field.empty()) return false;
            try {
                size_t used = 0;
                *out = std::stod(field, &used);
                return used == field.size();
            } catch (const std::invalid_argument&) {
                return false;
            } catch (const std::out_of_range&) {
                return false;
            }
        }

        vector<string> splitFields(const string& token) {
            vector<string> fields;
            string field;
            istringstream in(token);
            while (std::getline(in, field, ',')) fields.push_back(field);
            // "a,b," leaves a dangling empty field that getline drops
            if (!token.empty() && token.back() == ',') fields.push_back("");
            return fields;
        }

        // consecutive repeats collapsed, closing repeat of the first dropped
        vector<Coordinate> distinctRing(const Boundary& boundary) {
            vector<Coordinate> ring;
            for (const auto& point : boundary.points) {
                if (!ring.empty() && ring.back() == point) continue;
                ring.push_back(point);
            }
            if (ring.size() > 1 && ring.front() == ring.back()) ring.pop_back();
            return ring;
        }

        size_t countRepeatedVertices(const Boundary& boundary) {
            size_t repeats = 0;
            const auto& points = boundary.points;
            // the final vertex repeating the first is closure, not a repeat
            for (size_t i = 1; i < points.size(); ++i) {
                if (points[i] == points[i - 1]) ++repeats;
            }
            return repeats;
        }

        // Positions along p1->p2, as fractions of its length, where q1->q2 meets
        // it. A collinear overlap contributes both of its ends.
        void addSplitParameters(const Coordinate& p1, const Coordinate& p2,
                                const Coordinate& q1, const Coordinate& q2, vector<double>* ts) {
            if (!containment::segmentsIntersect(p1, p2, q1, q2)) return;
            const double rx = p2.lng() - p1.lng();
            const double ry = p2.lat() - p1.lat();
            const double sx = q2.lng() - q1.lng();
            const double sy = q2.lat() - q1.lat();
            const double denom = rx * sy - ry * sx;
            if (denom != 0.0) {
                const double t = ((q1.lng() - p1.lng()) * sy - (q1.lat() - p1.lat()) * sx) / denom;
                ts->push_back(min(1.0, max(0.0, t)));
                return;
            }
            const double rr = rx * rx + ry * ry;
            if (rr == 0.0) return;
            for (const Coordinate* q : {&q1, &q2}) {
                const double t = ((q->lng() - p1.lng()) * rx + (q->lat() - p1.lat()) * ry) / rr;
                if (t > 0.0 && t < 1.0) ts->push_back(t);
            }
        }

        // planar distance in degrees from c to segment a-b
        double degreesToSegment(const Coordinate& c, const Coordinate& a, const Coordinate& b) {
            const double dx = b.lng() - a.lng();
            const double dy = b.lat() - a.lat();
            const double len2 = dx * dx + dy * dy;
            double t = 0.0;
            if (len2 > 0.0) {
                t = ((c.lng() - a.lng()) * dx + (c.lat() - a.lat()) * dy) / len2;
                t = min(1.0, max(0.0, t));
            }
            return std::hypot(c.lng() - (a.lng() + t * dx), c.lat() - (a.lat() + t * dy));
        }

        bool strictlyInside(double lat, double lng, const Boundary& boundary) {
            const Coordinate point(lat, lng);
            const auto& points = boundary.points;
            for (size_t k = 0, l = points.size() - 1; k < points.size(); l = k++) {
                if (degreesToSegment(point, points[l], points[k]) < ON_EDGE_EPSILON_DEG) return false;
            }
            return containment::contains(point, boundary);
        }

        // Splits each edge of a where b's edges meet it and asks whether any piece
        // runs through b's interior. Pieces lying along b's border do not count.
        bool edgeEntersInterior(const Boundary& a, const Boundary& b) {
            const auto& pa = a.points;
            const auto& pb = b.points;
            for (size_t i = 0, j = pa.size() - 1; i < pa.size(); j = i++) {
                vector<double> ts = {0.0, 1.0};
                for (size_t k = 0, l = pb.size() - 1; k < pb.size(); l = k++) {
                    addSplitParameters(pa[j], pa[i], pb[l], pb[k], &ts);
                }
                sort(ts.begin(), ts.end());
                for (size_t s = 1; s < ts.size(); ++s) {
                    if (ts[s] - ts[s - 1] < 1e-12) continue;
                    const double mid = (ts[s - 1] + ts[s]) / 2.0;
                    const double lat = pa[j].lat() + mid * (pa[i].lat() - pa[j].lat());
                    const double lng = pa[j].lng() + mid * (pa[i].lng() - pa[j].lng());
                    if (strictlyInside(lat, lng, b)) return true;
                }
            }
            return false;
        }

        // Shared borders are not overlaps: the two areas must share interior
        bool polygonsOverlap(const DeliveryZone& a, const DeliveryZone& b) {
            const auto& pa = a.boundary.points;
            const auto& pb = b.boundary.points;
            for (size_t i = 0, j = pa.size() - 1; i < pa.size(); j = i++) {
                for (size_t k = 0, l = pb.size() - 1; k < pb.size(); l = k++) {
                    if (containment::segmentsCross(pa[j], pa[i], pb[l], pb[k])) return true;
                }
            }
            if (edgeEntersInterior(a.boundary, b.boundary) || edgeEntersInterior(b.boundary, a.boundary)) {
                return true;
            }
            // identical outlines share every edge; fall back to the centroids
            return containment::contains(geometry::centroid(a.boundary), b.boundary) ||
                containment::contains(geometry::centroid(b.boundary), a.boundary);
        }

        // Distance to each edge in a flat projection scaled at the circle's
        // latitude, so a rim crossing a long edge between vertices is caught
        bool circleOverlapsPolygon(const DeliveryZone& circleZone, const DeliveryZone& polygonZone) {
            const auto& circle = *circleZone.circle;
            if (containment::contains(circle.center, polygonZone.boundary)) return true;
            const double lngScale = std::cos(distance::degreesToRadians(circle.center.lat()));
            const auto& points = polygonZone.boundary.points;
            for (size_t k = 0, l = points.size() - 1; k < points.size(); l = k++) {
                const double ax = (points[l].lng() - circle.center.lng()) * lngScale;
                const double bx = (points[k].lng() - circle.center.lng()) * lngScale;
                const double ay = points[l].lat() - circle.center.lat();
                const double by = points[k].lat() - circle.center.lat();
                const double dx = bx - ax;
                const double dy = by - ay;
                const double len2 = dx * dx + dy * dy;
                double t = 0.0;
                if (len2 > 0.0) t = min(1.0, max(0.0, -(ax * dx + ay * dy) / len2));
                const double km = std::hypot(ax + t * dx, ay + t * dy) * KM_PER_DEGREE;
                if (km < circle.radiusKm) return true;
            }
            return false;
        }

        bool zonesOverlap(const DeliveryZone& a, const DeliveryZone& b) {
            if (!a.bounds.intersects(b.bounds)) return false;
            const bool aCircle = a.type == ZoneType::Circle && a.circle;
            const bool bCircle = b.type == ZoneType::Circle && b.circle;
            if (aCircle && bCircle) {
                return distance::distanceKm(a.circle->center, b.circle->center) <
                    a.circle->radiusKm + b.circle->radiusKm;
            }
            if (aCircle) return circleOverlapsPolygon(a, b);
            if (bCircle) return circleOverlapsPolygon(b, a);
            if (a.boundary.points.size() < 3 || b.boundary.points.size() < 3) return false;
            return polygonsOverlap(a, b);
        }
    }  // namespace

    // Parses boundary text exported from a mapping tool
    //
    // Args:
    //    rawText: whitespace separated "lng,lat[,alt]" tokens; altitude ignored
    // Returns:
    //    the boundary in the order given; a closing vertex is kept as is
    // Throws:
    //    MalformedBoundary naming the first token that is not a usable pair
    Boundary parseBoundary(const string& rawText) {
        Boundary boundary;
        istringstream in(rawText);
        string token;
        size_t position = 0;
        while (in >> token) {
            ++position;
            const vector<string> fields = splitFields(token);
            if (fields.size() != 2 && fields.size() != 3) {
                throw MalformedBoundary(
                    "expected lng,lat[,alt] at token " + std::to_string(position) + ": '" + token + "'",
                    token, position);
            }
            double values[3] = {0.0, 0.0, 0.0};
            for (size_t f = 0; f < fields.size(); ++f) {
                if (!parseNumber(fields[f], &values[f])) {
                    throw MalformedBoundary(
                        "non-numeric field '" + fields[f] + "' in token " + std::to_string(position) +
                        ": '" + token + "'",
                        token, position);
                }
            }
            try {
                boundary.points.emplace_back(values[1], values[0]);
            } catch (const InvalidCoordinate& e) {
                throw MalformedBoundary(
                    string(e.what()) + " in token " + std::to_string(position) + ": '" + token + "'",
                    token, position);
            }
        }
        if (boundary.points.empty()) throw MalformedBoundary("boundary text has no coordinates", "", 0);
        return boundary;
    }

    // Writes the boundary back in the authoring format, altitude 0
    string serializeBoundary(const Boundary& boundary) {
        ostringstream out;
        out.precision(12);
        bool first = true;
        for (const auto& point : boundary.points) {
            if (!first) out << ' ';
            out << point.lng() << ',' << point.lat() << ",0";
            first = false;
        }
        return out.str();
    }

    // Checks a boundary before it is published as a zone
    //
    // Coordinate range itself cannot be violated here; Coordinate refuses to
    // exist out of range. Every problem found is reported, not just the first.
    //
    // Args:
    //    boundary: candidate boundary
    //    allowedRegion: if set, every vertex must fall inside it
    // Returns:
    //    report with violations, warnings, and the boundary when usable
    ValidationReport validate(const Boundary& boundary, const optional<BoundingBox>& allowedRegion) {
        ValidationReport report;
        const vector<Coordinate> ring = distinctRing(boundary);

        if (ring.size() < 3) {
            report.violations.push_back(
                "boundary has " + std::to_string(ring.size()) + " distinct vertices, need at least 3");
        }

        if (allowedRegion) {
            // the closing vertex repeats vertex 1; report that location once
            const size_t n = boundary.points.size() - (geometry::hasClosingVertex(boundary) ? 1 : 0);
            for (size_t i = 0; i < n; ++i) {
                const Coordinate& point = boundary.points[i];
                if (allowedRegion->contains(point)) continue;
                report.violations.push_back(
                    "vertex " + std::to_string(i + 1) + " " + geometry::toString(point) +
                    " is outside the allowed region");
            }
        }

        if (ring.size() >= 3) {
            const double area = approximateAreaKm2(boundary);
            if (area < ZERO_AREA_KM2) {
                report.violations.push_back("boundary encloses no area (collinear vertices)");
            } else if (area > MAX_SANE_AREA_KM2) {
                ostringstream oss;
                oss << "boundary area " << area << " km2 is larger than " << MAX_SANE_AREA_KM2 << " km2";
                report.warnings.push_back(oss.str());
            }

            const auto crossing = findSelfIntersection(boundary);
            if (crossing) {
                report.violations.push_back(
                    "edges " + std::to_string(crossing->first + 1) + " and " +
                    std::to_string(crossing->second + 1) + " cross each other");
            }
        }

        if (!isClosed(boundary)) {
            report.warnings.push_back("boundary is not closed; first vertex will be treated as repeated");
        }
        const size_t repeats = countRepeatedVertices(boundary);
        if (repeats > 0) {
            report.warnings.push_back(std::to_string(repeats) + " consecutive duplicate vertices");
        }

        if (report.ok()) report.boundary = boundary;
        return report;
    }

    BoundingBox boundingBox(const Boundary& boundary) {
        return geometry::boundsOf(boundary);
    }

    // Shoelace area in degrees squared scaled by a flat 111.32 km per degree.
    // Ignores the narrowing of longitude degrees toward the poles and earth
    // curvature; fine for sanity checks, not for billing.
    double approximateAreaKm2(const Boundary& boundary) {
        const auto& points = boundary.points;
        const size_t n = points.size();
        if (n < 3) return 0.0;

        double area = 0.0;
        for (size_t i = 0; i < n; ++i) {
            const size_t j = (i + 1) % n;
            area += points[i].lng() * points[j].lat();
            area -= points[j].lng() * points[i].lat();
        }
        return fabs(area) / 2.0 * KM_PER_DEGREE * KM_PER_DEGREE;
    }

    bool isClosed(const Boundary& boundary) {
        if (boundary.points.size() < 2) return false;
        return geometry::approxEqual(boundary.points.front(), boundary.points.back(), CLOSED_EPSILON_DEG);
    }

    Boundary close(const Boundary& boundary) {
        if (boundary.points.empty() || isClosed(boundary)) return boundary;
        Boundary closed = boundary;
        closed.points.push_back(boundary.points.front());
        return closed;
    }

    // Looks for two non-adjacent edges that touch or cross. Works on the ring
    // with repeated vertices removed, so edge numbers count distinct edges.
    optional<pair<size_t, size_t>> findSelfIntersection(const Boundary& boundary) {
        const vector<Coordinate> ring = distinctRing(boundary);
        const size_t m = ring.size();
        if (m < 4) return std::nullopt;

        for (size_t i = 0; i < m; ++i) {
            const Coordinate& a1 = ring[i];
            const Coordinate& a2 = ring[(i + 1) % m];
            for (size_t j = i + 2; j < m; ++j) {
                // first and last edges share vertex 0
                if (i == 0 && j == m - 1) continue;
                const Coordinate& b1 = ring[j];
                const Coordinate& b2 = ring[(j + 1) % m];
                if (containment::segmentsIntersect(a1, a2, b1, b2)) return make_pair(i, j);
            }
        }
        return std::nullopt;
    }

    // Authoring-time check for zones whose areas overlap. Detection resolves
    // overlaps by store order, so these are reported, not rejected.
    vector<ZoneOverlap> findOverlaps(const vector<DeliveryZone>& zones) {
        vector<ZoneOverlap> overlaps;
        auto logger = logging::getLogger();
        for (size_t i = 0; i < zones.size(); ++i) {
            for (size_t j = i + 1; j < zones.size(); ++j) {
                if (!zonesOverlap(zones[i], zones[j])) continue;
                logger->warn("Zones {} and {} overlap; the lower zone number wins detection",
                             zones[i].id, zones[j].id);
                overlaps.push_back(ZoneOverlap{zones[i].id, zones[j].id});
            }
        }
        return overlaps;
    }

}  // namespace boundary
