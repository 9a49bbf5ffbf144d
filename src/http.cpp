// http.cpp
// libcurl JSON POST shared by the NER and analysis clients.

#include "ztredact/http.h"

#include "ztredact/errors.h"

#include <memory>

#include <curl/curl.h>

using json = nlohmann::json;

namespace ztredact {

static size_t curl_write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string*)userp)->append((char*)contents, size * nmemb);
    return size * nmemb;
}

static int curl_cancel_cb(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    return static_cast<const CancellationToken*>(clientp)->cancelled() ? 1 : 0;
}

json http_post_json(const std::string &url, const std::string &bearer, const json &payload, long &http_code,
                    int timeout_sec, const CancellationToken *cancel) {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) throw Error("curl init failed");

    std::string response;
    struct curl_slist *raw_headers = nullptr;
    if (!bearer.empty()) {
        std::string auth = "Authorization: Bearer " + bearer;
        raw_headers = curl_slist_append(raw_headers, auth.c_str());
    }
    raw_headers = curl_slist_append(raw_headers, "Content-Type: application/json");
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(raw_headers, &curl_slist_free_all);

    std::string body = payload.dump();

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, (long)timeout_sec);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, curl_write_cb);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);
    if (cancel) {
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, curl_cancel_cb);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, const_cast<CancellationToken*>(cancel));
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    }

    CURLcode res = curl_easy_perform(curl.get());
    http_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);

    if (res == CURLE_ABORTED_BY_CALLBACK) throw PipelineCancelled();
    if (res != CURLE_OK) {
        throw Error(std::string("curl failed: ") + curl_easy_strerror(res));
    }

    try {
        return json::parse(response.empty() ? "{}" : response);
    } catch (const json::parse_error &) {
        // the reply body may echo document text, so it is not included
        throw Error("failed to parse JSON response from " + url + " (HTTP " + std::to_string(http_code) + ")");
    }
}

CurlGlobal::CurlGlobal() { curl_global_init(CURL_GLOBAL_ALL); }
CurlGlobal::~CurlGlobal() { curl_global_cleanup(); }

} // namespace ztredact
