// SPDX-License-Identifier: Apache-2.0
#include "CurlHttpTransport.hpp"

#include <core/Log.hpp>

#include <curl/curl.h>

#include <format>
#include <memory>
#include <mutex>

namespace pushscribe
{

namespace
{

    std::mutex curlGlobalMutex;
    int curlGlobalRefCount = 0;

    auto acquireCurlGlobal() -> bool
    {
        auto lock = std::lock_guard(curlGlobalMutex);
        if (curlGlobalRefCount == 0)
        {
            auto const result = curl_global_init(CURL_GLOBAL_DEFAULT);
            if (result != CURLE_OK)
            {
                log::error("curl_global_init failed: {}", curl_easy_strerror(result));
                return false;
            }
        }
        ++curlGlobalRefCount;
        return true;
    }

    void releaseCurlGlobal()
    {
        auto lock = std::lock_guard(curlGlobalMutex);
        if (curlGlobalRefCount <= 0)
            return;
        if (--curlGlobalRefCount == 0)
            curl_global_cleanup();
    }

    auto writeCallback(char* data, size_t size, size_t count, void* userData) -> size_t
    {
        auto* body = static_cast<std::string*>(userData);
        body->append(data, size * count);
        return size * count;
    }

    // Returning non-zero makes curl abort the transfer with CURLE_ABORTED_BY_CALLBACK
    auto progressCallback(void* userData, curl_off_t, curl_off_t, curl_off_t, curl_off_t) -> int
    {
        auto const* stopToken = static_cast<const std::stop_token*>(userData);
        return stopToken->stop_requested() ? 1 : 0;
    }

    struct CurlDeleter
    {
        void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
    };

    struct SlistDeleter
    {
        void operator()(curl_slist* list) const { curl_slist_free_all(list); }
    };

} // namespace

CurlHttpTransport::CurlHttpTransport(std::chrono::milliseconds connectTimeout):
    _connectTimeout(connectTimeout), _globalAcquired(acquireCurlGlobal())
{
}

CurlHttpTransport::~CurlHttpTransport()
{
    if (_globalAcquired)
        releaseCurlGlobal();
}

auto CurlHttpTransport::post(const HttpRequest& request, std::stop_token stopToken) -> Result<HttpResponse>
{
    if (!_globalAcquired)
        return makeError(ErrorCode::NetworkError, "libcurl is not initialized");
    if (stopToken.stop_requested())
        return makeError(ErrorCode::Cancelled, "Request cancelled");

    auto curl = std::unique_ptr<CURL, CurlDeleter>(curl_easy_init());
    if (!curl)
        return makeError(ErrorCode::NetworkError, "Failed to create curl handle");

    curl_slist* rawHeaders = curl_slist_append(nullptr, "Content-Type: application/json");
    for (auto const& header: request.headers)
        rawHeaders = curl_slist_append(rawHeaders, header.c_str());
    auto headers = std::unique_ptr<curl_slist, SlistDeleter>(rawHeaders);

    auto response = HttpResponse {};

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.data());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &stopToken);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "pushscribe");
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(_connectTimeout.count()));
    if (request.timeout.count() > 0)
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));

    auto const result = curl_easy_perform(curl.get());
    if (result == CURLE_ABORTED_BY_CALLBACK)
        return makeError(ErrorCode::Cancelled, "Request cancelled");
    if (result != CURLE_OK)
        return makeError(ErrorCode::NetworkError, std::format("HTTP request failed: {}", curl_easy_strerror(result)));

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    log::debug("POST {} -> {} ({} bytes)", request.url.substr(0, request.url.find('?')), response.status,
               response.body.size());
    return response;
}

} // namespace pushscribe
