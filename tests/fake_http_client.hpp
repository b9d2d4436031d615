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
#ifndef DELIVERY_ZONES_TESTS_FAKE_HTTP_CLIENT_HPP_
#define DELIVERY_ZONES_TESTS_FAKE_HTTP_CLIENT_HPP_

#include <string>
#include "../delivery_zones/http_client.hpp"

// Canned response instead of the network; remembers what was asked for
struct FakeHttpClient : http::IHttpClient {
    http::HttpResponse next;
    std::string lastUrl;
    int calls = 0;

    http::HttpResponse get(const std::string& url) override {
        lastUrl = url;
        ++calls;
        return next;
    }
};

#endif  // DELIVERY_ZONES_TESTS_FAKE_HTTP_CLIENT_HPP_
