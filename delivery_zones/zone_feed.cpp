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
#include "zone_feed.hpp"
#include <fstream>            // for ifstream
#include <nlohmann/json.hpp>  // for basic_json
#include <sstream>            // for ostringstream
#include <stdexcept>          // for runtime_error
#include <string>             // for string
#include <vector>             // for vector
#include "logging.hpp"

using std::string;
using std::vector;
using std::ifstream;
using std::ostringstream;
using std::runtime_error;
using json = nlohmann::json;

using http::HttpResponse;
using http::IHttpClient;
using zone::DeliveryZone;
using zone::MalformedZoneRecord;

namespace zone_feed {

    namespace {
        // URL without its query string, which carries the api key
        string redact(const string& url) {
            const auto q = url.find('?');
            return q == string::npos ? url : url.substr(0, q) + "?...";
        }

        vector<DeliveryZone> decodeBody(const string& body, const string& source) {
            json records;
            try {
                records = json::parse(body);
            } catch (const json::parse_error& e) {
                throw FeedError("zone feed from " + source + " is not valid JSON: " + e.what());
            }
            try {
                return zone::zonesFromJson(records);
            } catch (const MalformedZoneRecord& e) {
                throw FeedError("zone feed from " + source + " has a bad record: " + e.what());
            }
        }
    }  // namespace

    // Builds the REST url for all zones
    //
    // Args:
    //    baseUrl: project url, e.g. https://xyz.supabase.co
    //    apiKey: anon key passed as a query parameter
    // Returns:
    //    url selecting every zone column
    string zonesUrl(const string& baseUrl, const string& apiKey) {
        string base = baseUrl;
        while (!base.empty() && base.back() == '/') base.pop_back();
        ostringstream url;
        url << base << ZONES_PATH << "?select=*";
        if (!apiKey.empty()) url << "&apikey=" << http::urlEncode(apiKey);
        return url.str();
    }

    // Fetches and decodes every zone record served at url
    //
    // Throws:
    //    FeedError on transport failure, non-2xx status, bad JSON or bad record
    vector<DeliveryZone> fetchZones(IHttpClient& client, const string& url) {
        auto logger = logging::getLogger();
        const string shown = redact(url);

        HttpResponse resp;
        try {
            resp = client.get(url);
        } catch (const runtime_error& e) {
            logger->error("Zone feed request to {} failed: {}", shown, e.what());
            throw FeedError("zone feed request to " + shown + " failed: " + e.what());
        }
        if (resp.status < 200 || resp.status >= 300) {
            logger->error("Zone feed {} answered HTTP {}", shown, resp.status);
            ostringstream oss;
            oss << "HTTP " << resp.status << " from zone feed " << shown;
            throw FeedError(oss.str());
        }

        vector<DeliveryZone> zones = decodeBody(resp.body, shown);
        logger->info("Fetched {} zone records from {}", zones.size(), shown);
        return zones;
    }

    // Fetch then publish. The store is only touched once every record decoded,
    // so a failed sync leaves the previous snapshot serving.
    size_t syncZones(IHttpClient& client, const string& url, zone_store::ZoneStore& store) {
        const vector<DeliveryZone> zones = fetchZones(client, url);
        store.refresh(zones);
        return zones.size();
    }

    vector<DeliveryZone> loadZonesFile(const string& path) {
        ifstream in(path);
        if (!in) throw FeedError("Failed to open zones file: " + path);
        ostringstream body;
        body << in.rdbuf();
        return decodeBody(body.str(), path);
    }

}  // namespace zone_feed
