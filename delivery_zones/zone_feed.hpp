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
#ifndef DELIVERY_ZONES_ZONE_FEED_HPP_
#define DELIVERY_ZONES_ZONE_FEED_HPP_

#include <cstddef>    // for size_t
#include <stdexcept>  // for runtime_error
#include <string>     // for string
#include <vector>     // for vector
#include "http_client.hpp"
#include "zone.hpp"
#include "zone_store.hpp"

using std::string;
using std::vector;

namespace zone_feed {

const char ZONES_PATH[] = "/rest/v1/zones";

// zone records could not be fetched or decoded
class FeedError : public std::runtime_error {
 public:
    explicit FeedError(const string& what) : std::runtime_error(what) {}
};

string zonesUrl(const string& baseUrl, const string& apiKey);

vector<zone::DeliveryZone> fetchZones(http::IHttpClient& client, const string& url);

size_t syncZones(http::IHttpClient& client, const string& url, zone_store::ZoneStore& store);

vector<zone::DeliveryZone> loadZonesFile(const string& path);

}  // namespace zone_feed

#endif  // DELIVERY_ZONES_ZONE_FEED_HPP_
