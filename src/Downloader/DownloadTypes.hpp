#ifndef DLMGR_DOWNLOAD_TYPES_HPP_
#define DLMGR_DOWNLOAD_TYPES_HPP_

#include <filesystem>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>

namespace dlmgr {

struct DownloadTask {
  std::string url;
  std::optional<std::string> fileName;  // used verbatim when set
};

enum class DownloadState { Downloading, Completed, Failed, Interrupted };

const char* toString(DownloadState state);
bool isTerminal(DownloadState state);
std::ostream& operator<<(std::ostream& os, DownloadState state);

enum class TransferStatus { Completed, Cancelled };

const char* toString(TransferStatus status);
std::ostream& operator<<(std::ostream& os, TransferStatus status);

// Produced exactly once per worker.
struct WorkerOutcome {
  std::string url;
  std::filesystem::path path;
  std::optional<TransferStatus> status;  // empty on error
  std::string error;

  bool ok() const { return status.has_value(); }
};

class ManifestError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class TransferError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class StateStoreUnavailable : public std::runtime_error {
 public:
  StateStoreUnavailable() : std::runtime_error("state store task died") {}
};

class InvalidStateTransition : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace dlmgr

#endif  // DLMGR_DOWNLOAD_TYPES_HPP_
