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
#ifndef DELIVERY_ZONES_ZONE_STORE_HPP_
#define DELIVERY_ZONES_ZONE_STORE_HPP_

#include <cstdint>        // for uint64_t
#include <memory>         // for shared_ptr
#include <mutex>          // for mutex
#include <stdexcept>      // for runtime_error
#include <string>         // for string
#include <unordered_map>  // for unordered_map
#include <vector>         // for vector
#include "zone.hpp"

using std::string;
using std::vector;
using std::shared_ptr;

namespace zone_store {

using ZoneList = vector<zone::DeliveryZone>;

// zone id not present in the current snapshot
class NotFoundError : public std::runtime_error {
 public:
    explicit NotFoundError(const string& id)
        : std::runtime_error("zone not found: " + id), id_(id) {}
    const string& id() const { return id_; }

 private:
    string id_;
};

// Immutable point-in-time view of the zones
struct Snapshot {
    uint64_t version{};
    ZoneList zones;                                // every zone, as given
    shared_ptr<const ZoneList> active;             // active only, by (zoneNumber, id)
    std::unordered_map<string, size_t> indexById;  // into zones
};

// Holds the current snapshot. Readers take a reference-counted snapshot and
// never see a half-built one; refresh builds the next snapshot aside and
// swaps it in atomically.
class ZoneStore {
 public:
    ZoneStore();
    explicit ZoneStore(const ZoneList& zones);

    ZoneStore(const ZoneStore&) = delete;
    ZoneStore& operator=(const ZoneStore&) = delete;

    // Active zones ordered by zone number then id
    shared_ptr<const ZoneList> activeZones() const;

    // Replace all zones. Empty or all-inactive lists are fine.
    void refresh(const ZoneList& zones);

    // Any zone in the current snapshot, active or not
    //
    // Throws:
    //    NotFoundError when the id is unknown
    zone::DeliveryZone zoneById(const string& id) const;

    // Active zones belonging to a town, in store order
    ZoneList zonesForTown(const string& townId) const;

    shared_ptr<const Snapshot> snapshot() const;
    uint64_t version() const;

 private:
    shared_ptr<const Snapshot> current_;
    std::mutex refreshMutex_;  // serialises writers only
};

}  // namespace zone_store

#endif  // DELIVERY_ZONES_ZONE_STORE_HPP_
