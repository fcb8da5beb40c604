#include "DownloadTypes.hpp"

namespace dlmgr {

const char* toString(DownloadState state) {
  switch (state) {
    case DownloadState::Downloading:
      return "Downloading";
    case DownloadState::Completed:
      return "Completed";
    case DownloadState::Failed:
      return "Failed";
    case DownloadState::Interrupted:
      return "Interrupted";
  }
  return "Unknown";
}

bool isTerminal(DownloadState state) {
  return state != DownloadState::Downloading;
}

std::ostream& operator<<(std::ostream& os, DownloadState state) {
  return os << toString(state);
}

const char* toString(TransferStatus status) {
  switch (status) {
    case TransferStatus::Completed:
      return "Completed";
    case TransferStatus::Cancelled:
      return "Cancelled";
  }
  return "Unknown";
}

std::ostream& operator<<(std::ostream& os, TransferStatus status) {
  return os << toString(status);
}

}  // namespace dlmgr
