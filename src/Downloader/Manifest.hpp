#ifndef DLMGR_MANIFEST_HPP_
#define DLMGR_MANIFEST_HPP_

#include <filesystem>
#include <string>
#include <vector>

#include "DownloadTypes.hpp"

namespace dlmgr {

// {"downloads": [{"url": "https://...", "file_name": "optional"}]}
struct Manifest {
  std::vector<DownloadTask> downloads;

  // Throws ManifestError.
  static Manifest load(const std::filesystem::path& file);
  static Manifest parse(const std::string& text);
};

}  // namespace dlmgr

#endif  // DLMGR_MANIFEST_HPP_
