#include "CurlUtils.hpp"

#include <cstdlib>
#include <mutex>
#include <stdexcept>

namespace dlmgr {

namespace {

CurlUrlHandle parseUrl(const std::string& text) {
  ensureCurlInitialized();
  CurlUrlHandle url{curl_url(), &curl_url_cleanup};
  if (!url) {
    throw std::runtime_error("Failed to allocate curl URL handle");
  }
  // Without CURLU_DEFAULT_SCHEME a missing scheme is a parse error.
  if (curl_url_set(url.get(), CURLUPART_URL, text.c_str(), 0) != CURLUE_OK) {
    return CurlUrlHandle{nullptr, &curl_url_cleanup};
  }
  return url;
}

}  // namespace

void ensureCurlInitialized() {
  static std::once_flag flag;
  std::call_once(flag, [] {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw std::runtime_error("Failed to initialize libcurl");
    }
    std::atexit([] { curl_global_cleanup(); });
  });
}

bool isAbsoluteUrl(const std::string& text) {
  return static_cast<bool>(parseUrl(text));
}

std::string urlPath(const std::string& text) {
  CurlUrlHandle url = parseUrl(text);
  if (!url) {
    throw std::invalid_argument("not an absolute URL: " + text);
  }
  char* path = nullptr;
  if (curl_url_get(url.get(), CURLUPART_PATH, &path, 0) != CURLUE_OK ||
      path == nullptr) {
    return "/";
  }
  std::string result(path);
  curl_free(path);
  return result.empty() ? "/" : result;
}

std::string lastPathSegment(const std::string& text) {
  const std::string path = urlPath(text);
  size_t end = path.find_last_not_of('/');
  if (end == std::string::npos) return "";
  size_t start = path.find_last_of('/', end);
  start = (start == std::string::npos) ? 0 : start + 1;
  return path.substr(start, end - start + 1);
}

}  // namespace dlmgr
