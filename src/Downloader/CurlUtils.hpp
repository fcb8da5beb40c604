#ifndef DLMGR_CURL_UTILS_HPP_
#define DLMGR_CURL_UTILS_HPP_

#include <curl/curl.h>

#include <memory>
#include <string>

namespace dlmgr {

// Runs curl_global_init once per process. Throws on failure.
void ensureCurlInitialized();

using CurlEasyHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlMultiHandle = std::unique_ptr<CURLM, decltype(&curl_multi_cleanup)>;
using CurlUrlHandle = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

// True when text parses as a URL with an explicit scheme.
bool isAbsoluteUrl(const std::string& text);

// Normalized path of an absolute URL ("/" when the URL has none). Throws
// std::invalid_argument if text is not an absolute URL.
std::string urlPath(const std::string& text);

// Last non-empty '/'-separated segment of the URL path, or "" if none.
std::string lastPathSegment(const std::string& text);

}  // namespace dlmgr

#endif  // DLMGR_CURL_UTILS_HPP_
