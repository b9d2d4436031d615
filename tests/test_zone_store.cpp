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
#include <atomic>
#include <string>
#include <thread>
#include <vector>
#include "../delivery_zones/detection.hpp"
#include "../delivery_zones/zone.hpp"
#include "../delivery_zones/zone_store.hpp"

using std::string;
using std::vector;

using geometry::Coordinate;
using geometry::Boundary;

using zone::DeliveryZone;
using zone::makePolygonZone;

using zone_store::ZoneList;
using zone_store::ZoneStore;
using zone_store::NotFoundError;

namespace {
Boundary square(double lat, double lng, double side) {
    return Boundary{ { {lat, lng}, {lat, lng + side}, {lat + side, lng + side}, {lat + side, lng} } };
}

DeliveryZone zoneAt(const string& id, int zoneNumber, double lat, double lng, bool active = true) {
    return makePolygonZone(id, "Zone " + id, zoneNumber, square(lat, lng, 0.1), active);
}

// count zones all named with the same prefix, each covering (25.05, 90.05)
ZoneList generation(const string& prefix, int count) {
    ZoneList zones;
    for (int i = 0; i < count; ++i) {
        zones.push_back(zoneAt(prefix + std::to_string(i), i, 25.0, 90.0));
    }
    return zones;
}
}  // namespace

// -----------------------------------------------------------------------------
// Tests for ZoneStore construction and ordering
// -----------------------------------------------------------------------------

TEST_CASE("ZoneStore starts empty at version 0") {
    ZoneStore store;
    CHECK(store.activeZones()->empty());
    CHECK_EQ(store.version(), 0);
}

TEST_CASE("ZoneStore built from zones starts at version 1") {
    ZoneStore store({zoneAt("a", 1, 25.0, 90.0)});
    CHECK_EQ(store.version(), 1);
    CHECK_EQ(store.activeZones()->size(), 1);
}

TEST_CASE("activeZones orders by zone number then id") {
    ZoneStore store({
        zoneAt("c", 2, 25.0, 90.0),
        zoneAt("b", 1, 25.0, 90.0),
        zoneAt("a", 2, 25.0, 90.0),
    });
    auto active = store.activeZones();

    REQUIRE_EQ(active->size(), 3);
    CHECK_EQ((*active)[0].id, "b");
    CHECK_EQ((*active)[1].id, "a");
    CHECK_EQ((*active)[2].id, "c");
}

TEST_CASE("activeZones leaves out inactive zones") {
    ZoneStore store({zoneAt("on", 1, 25.0, 90.0), zoneAt("off", 2, 25.0, 90.0, false)});
    auto active = store.activeZones();

    REQUIRE_EQ(active->size(), 1);
    CHECK_EQ(active->front().id, "on");
}

// -----------------------------------------------------------------------------
// Tests for zoneById and zonesForTown
// -----------------------------------------------------------------------------

TEST_CASE("zoneById finds inactive zones too") {
    ZoneStore store({zoneAt("on", 1, 25.0, 90.0), zoneAt("off", 2, 25.0, 90.0, false)});
    DeliveryZone z = store.zoneById("off");

    CHECK_EQ(z.name, "Zone off");
    CHECK_FALSE(z.active);
}

TEST_CASE("zoneById throws NotFoundError for an unknown id") {
    ZoneStore store({zoneAt("a", 1, 25.0, 90.0)});
    CHECK_THROWS_AS(store.zoneById("missing"), NotFoundError);

    try {
        store.zoneById("missing");
    } catch (const NotFoundError& e) {
        CHECK_EQ(e.id(), "missing");
    }
}

TEST_CASE("zonesForTown returns active zones of that town") {
    DeliveryZone a = zoneAt("a", 1, 25.0, 90.0);
    a.townId = "shillong";
    DeliveryZone b = zoneAt("b", 2, 25.2, 90.0);
    b.townId = "shillong";
    b.active = false;
    DeliveryZone c = zoneAt("c", 3, 26.1, 91.7);
    c.townId = "guwahati";
    ZoneStore store({a, b, c});

    ZoneList shillong = store.zonesForTown("shillong");
    REQUIRE_EQ(shillong.size(), 1);
    CHECK_EQ(shillong[0].id, "a");
    CHECK(store.zonesForTown("tura").empty());
}

// -----------------------------------------------------------------------------
// Tests for refresh
// -----------------------------------------------------------------------------

TEST_CASE("refresh replaces the zones and bumps the version") {
    ZoneStore store({zoneAt("a", 1, 25.0, 90.0)});
    store.refresh({zoneAt("b", 1, 25.0, 90.0), zoneAt("c", 2, 25.0, 90.0)});

    CHECK_EQ(store.version(), 2);
    CHECK_EQ(store.activeZones()->size(), 2);
    CHECK_THROWS_AS(store.zoneById("a"), NotFoundError);
}

TEST_CASE("refresh accepts an empty or all-inactive list") {
    ZoneStore store({zoneAt("a", 1, 25.0, 90.0)});
    store.refresh({});
    CHECK(store.activeZones()->empty());

    store.refresh({zoneAt("off", 1, 25.0, 90.0, false)});
    CHECK(store.activeZones()->empty());
    CHECK_EQ(store.version(), 3);
}

TEST_CASE("a held snapshot survives a refresh") {
    ZoneStore store(generation("old-", 2));
    auto held = store.snapshot();

    store.refresh(generation("new-", 3));

    CHECK_EQ(held->version, 1);
    CHECK_EQ(held->active->size(), 2);
    CHECK_EQ(held->active->front().id, "old-0");
    CHECK_EQ(store.activeZones()->size(), 3);
}

TEST_CASE("concurrent readers only ever see a whole snapshot") {
    const ZoneList oldZones = generation("old-", 3);
    const ZoneList newZones = generation("new-", 5);
    ZoneStore store(oldZones);
    detection::ZoneDetector detector(store);

    std::atomic<bool> done{false};
    std::atomic<int> torn{0};
    std::atomic<int> misses{0};
    std::atomic<long> reads{0};

    vector<std::thread> readers;
    for (int r = 0; r < 100; ++r) {
        readers.emplace_back([&]() {
            do {
                auto active = store.activeZones();
                const size_t n = active->size();
                const string prefix = n == 3 ? "old-" : "new-";
                bool whole = n == 3 || n == 5;
                for (const auto& z : *active) {
                    whole = whole && z.id.compare(0, prefix.size(), prefix) == 0;
                }
                if (!whole) ++torn;
                if (!detector.isDeliveryAvailable(Coordinate(25.05, 90.05))) ++misses;
                ++reads;
            } while (!done.load());
        });
    }

    for (int i = 0; i < 50; ++i) {
        store.refresh(i % 2 == 0 ? newZones : oldZones);
    }
    done = true;
    for (auto& t : readers) t.join();

    CHECK_EQ(torn.load(), 0);
    CHECK_EQ(misses.load(), 0);
    CHECK(reads.load() >= 100);
    CHECK_EQ(store.version(), 51);
}
