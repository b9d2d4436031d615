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
#ifndef DELIVERY_ZONES_HTTP_CLIENT_HPP_
#define DELIVERY_ZONES_HTTP_CLIENT_HPP_

#include <cstddef>  // for size_t
#include <cstdint>  // for uint16_t
#include <string>   // for string

using std::string;

namespace http {

const char USER_AGENT[] = "delivery-zones/1.0";
const long TIMEOUT_SECONDS = 20;  // NOLINT(runtime/int): curl takes long

// Simple struct to hold HTTP response data
struct HttpResponse {
    uint16_t status = 0;
    string body;
};

// Interface for HTTP client (allows mocking in tests)
struct IHttpClient {
    virtual ~IHttpClient() = default;
    // Throws std::runtime_error on transport failure; HTTP errors are
    // returned as a status, not thrown
    virtual HttpResponse get(const string& url) = 0;
};

// libcurl implementation. Owns the global curl init for its lifetime, so
// keep one per process.
class CurlHttpClient : public IHttpClient {
 public:
    CurlHttpClient();
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse get(const string& url) override;

 private:
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userData);
};

// Percent-encodes a query parameter value
string urlEncode(const string& value);

}  // namespace http

#endif  // DELIVERY_ZONES_HTTP_CLIENT_HPP_
