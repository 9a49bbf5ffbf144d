#pragma once

#include "ztredact/cancellation.h"

#include <string>

#include <nlohmann/json.hpp>

namespace ztredact {

// POSTs a JSON body and parses the JSON reply. `bearer` may be empty.
// Throws Error on transport failures and unparseable replies; HTTP status
// codes are reported through http_code and left to the caller. A transfer
// whose token is cancelled is aborted with PipelineCancelled.
nlohmann::json http_post_json(const std::string &url, const std::string &bearer, const nlohmann::json &payload,
                              long &http_code, int timeout_sec, const CancellationToken *cancel = nullptr);

// curl_global_init / curl_global_cleanup for the lifetime of the object.
struct CurlGlobal {
    CurlGlobal();
    ~CurlGlobal();
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

} // namespace ztredact
