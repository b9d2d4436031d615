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
#include "zone_store.hpp"
#include <algorithm>  // for sort, copy_if
#include <atomic>     // for atomic_load, atomic_store
#include <iterator>   // for back_inserter
#include <memory>     // for make_shared
#include <mutex>      // for lock_guard
#include <string>     // for string
#include <utility>    // for move
#include <vector>     // for vector
#include "logging.hpp"

using std::string;
using std::vector;
using std::shared_ptr;
using std::make_shared;
using std::move;

using zone::DeliveryZone;

namespace zone_store {

    namespace {
        // Builds a snapshot from scratch; nothing shared with the previous one
        shared_ptr<const Snapshot> buildSnapshot(const ZoneList& zones, uint64_t version) {
            auto snapshot = make_shared<Snapshot>();
            snapshot->version = version;
            snapshot->zones = zones;
            for (size_t i = 0; i < snapshot->zones.size(); ++i) {
                // later duplicates of an id shadow earlier ones
                snapshot->indexById[snapshot->zones[i].id] = i;
            }

            auto active = make_shared<ZoneList>();
            std::copy_if(zones.begin(), zones.end(), std::back_inserter(*active),
                         [](const DeliveryZone& z) { return z.active; });
            std::sort(active->begin(), active->end(),
                      [](const DeliveryZone& a, const DeliveryZone& b) {
                          if (a.zoneNumber != b.zoneNumber) return a.zoneNumber < b.zoneNumber;
                          return a.id < b.id;
                      });
            snapshot->active = move(active);
            return snapshot;
        }
    }  // namespace

    ZoneStore::ZoneStore() : current_(buildSnapshot({}, 0)) {}

    ZoneStore::ZoneStore(const ZoneList& zones) : current_(buildSnapshot(zones, 1)) {}

    shared_ptr<const ZoneList> ZoneStore::activeZones() const {
        return snapshot()->active;
    }

    void ZoneStore::refresh(const ZoneList& zones) {
        std::lock_guard<std::mutex> lock(refreshMutex_);
        const uint64_t next = version() + 1;
        auto fresh = buildSnapshot(zones, next);
        const size_t activeCount = fresh->active->size();
        std::atomic_store(&current_, fresh);
        logging::getLogger()->info("Zone store refreshed: version {} with {} zones ({} active)",
                                   next, zones.size(), activeCount);
    }

    DeliveryZone ZoneStore::zoneById(const string& id) const {
        const auto snap = snapshot();
        const auto it = snap->indexById.find(id);
        if (it == snap->indexById.end()) throw NotFoundError(id);
        return snap->zones[it->second];
    }

    ZoneList ZoneStore::zonesForTown(const string& townId) const {
        const auto active = activeZones();
        ZoneList out;
        for (const auto& z : *active) {
            if (z.townId && *z.townId == townId) out.push_back(z);
        }
        return out;
    }

    shared_ptr<const Snapshot> ZoneStore::snapshot() const {
        return std::atomic_load(&current_);
    }

    uint64_t ZoneStore::version() const {
        return snapshot()->version;
    }

}  // namespace zone_store
