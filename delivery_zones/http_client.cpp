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
#include "http_client.hpp"
#include <curl/curl.h>  // for curl_easy_setopt, curl_easy_cleanup
#include <memory>       // for unique_ptr
#include <sstream>      // for ostringstream
#include <stdexcept>    // for runtime_error
#include <string>       // for string
#include <utility>      // for move

using std::string;
using std::runtime_error;
using std::ostringstream;
using std::unique_ptr;

namespace http {

    namespace {
        struct CurlCleanup {
            void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
        };
        using CurlHandle = unique_ptr<CURL, CurlCleanup>;
    }  // namespace

    CurlHttpClient::CurlHttpClient() {
        const CURLcode res = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (res != CURLE_OK) throw runtime_error(string("curl_global_init failed: ") + curl_easy_strerror(res));
    }

    CurlHttpClient::~CurlHttpClient() {
        curl_global_cleanup();
    }

    // Performs an HTTP GET request
    //
    // Args:
    //    url: the URL to send the GET request to
    // Returns:
    //    HttpResponse containing the status code and response body
    HttpResponse CurlHttpClient::get(const string& url) {
        CurlHandle curl(curl_easy_init());
        if (!curl) throw runtime_error("curl_easy_init failed");

        string buffer;
        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, USER_AGENT);
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, TIMEOUT_SECONDS);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &buffer);

        const CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK) {
            ostringstream oss;
            oss << "CURL error: " << curl_easy_strerror(res);
            throw runtime_error(oss.str());
        }

        long code = 0;  // NOLINT(runtime/int)
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);

        HttpResponse resp;
        resp.status = static_cast<uint16_t>(code);
        resp.body = std::move(buffer);
        return resp;
    }

    // Callback function for libcurl to append response data to a string
    size_t CurlHttpClient::writeCallback(void* contents, size_t size, size_t nmemb, void* userData) {
        const size_t total = size * nmemb;
        static_cast<string*>(userData)->append(static_cast<char*>(contents), total);
        return total;
    }

    string urlEncode(const string& value) {
        char* out = curl_easy_escape(nullptr, value.c_str(), static_cast<int>(value.size()));
        if (!out) return value;
        string encoded(out);
        curl_free(out);
        return encoded;
    }

}  // namespace http
