#include "Manifest.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

#include "CurlUtils.hpp"

namespace dlmgr {

namespace {

DownloadTask parseEntry(const nlohmann::json& entry, size_t index) {
  const std::string where = "downloads[" + std::to_string(index) + "]";
  if (!entry.is_object()) {
    throw ManifestError(where + " is not an object");
  }

  auto url = entry.find("url");
  if (url == entry.end() || !url->is_string()) {
    throw ManifestError(where + ".url is missing or not a string");
  }
  DownloadTask task;
  task.url = url->get<std::string>();
  if (!isAbsoluteUrl(task.url)) {
    throw ManifestError(where + ".url is not an absolute URL: " + task.url);
  }

  auto fileName = entry.find("file_name");
  if (fileName != entry.end() && !fileName->is_null()) {
    if (!fileName->is_string()) {
      throw ManifestError(where + ".file_name is not a string");
    }
    task.fileName = fileName->get<std::string>();
    if (task.fileName->empty()) {
      throw ManifestError(where + ".file_name is empty");
    }
  }
  return task;
}

}  // namespace

Manifest Manifest::load(const std::filesystem::path& file) {
  std::ifstream ifs(file, std::ios::binary);
  if (!ifs) {
    throw ManifestError("failed to open manifest " + file.string());
  }
  std::ostringstream contents;
  contents << ifs.rdbuf();
  if (ifs.bad()) {
    throw ManifestError("failed to read manifest " + file.string());
  }
  try {
    return parse(contents.str());
  } catch (const ManifestError& e) {
    throw ManifestError(file.string() + ": " + e.what());
  }
}

Manifest Manifest::parse(const std::string& text) {
  auto document = nlohmann::json::parse(text, nullptr, false);
  if (document.is_discarded()) {
    throw ManifestError("manifest is not valid JSON");
  }
  if (!document.is_object()) {
    throw ManifestError("manifest must be a JSON object");
  }
  auto downloads = document.find("downloads");
  if (downloads == document.end() || !downloads->is_array()) {
    throw ManifestError("manifest has no \"downloads\" array");
  }

  Manifest manifest;
  manifest.downloads.reserve(downloads->size());
  for (size_t i = 0; i < downloads->size(); ++i) {
    manifest.downloads.push_back(parseEntry((*downloads)[i], i));
  }
  return manifest;
}

}  // namespace dlmgr
