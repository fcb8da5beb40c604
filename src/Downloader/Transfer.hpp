#ifndef DLMGR_TRANSFER_HPP_
#define DLMGR_TRANSFER_HPP_

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

#include "Cancellation.hpp"
#include "DownloadTypes.hpp"

namespace dlmgr {

struct TransferProgress {
  std::string url;
  std::chrono::steady_clock::duration elapsed;
  uint64_t bytesDownloaded;
};

using ProgressCallback = std::function<void(const TransferProgress&)>;

// Streams one URL into one file.
class Transfer {
 public:
  virtual ~Transfer() = default;

  // Returns Completed when the body has been fully written, whatever the
  // response status, and Cancelled when the token fired first (the file is
  // flushed and closed). Throws TransferError on network, stream or file
  // errors; a partial file is left in place.
  virtual TransferStatus run(const std::string& url,
                             const std::filesystem::path& destination,
                             CancellationToken& token) const = 0;
};

struct TransferOptions {
  std::chrono::milliseconds progressInterval{1000};
  std::string userAgent = "dlmgr/1.0";
  ProgressCallback onProgress;
};

/**
 * @brief libcurl-backed transfer.
 *
 * Each run drives one easy handle through its own multi handle so that body
 * chunks, the progress tick and the cancellation token are waited on together
 * in curl_multi_poll. The token wakes the poll with curl_multi_wakeup.
 * Instances are stateless and shared by every worker.
 */
class CurlTransfer final : public Transfer {
 public:
  explicit CurlTransfer(TransferOptions options = TransferOptions());

  TransferStatus run(const std::string& url,
                     const std::filesystem::path& destination,
                     CancellationToken& token) const override;

 private:
  void reportProgress(const TransferProgress& progress) const;

  TransferOptions options_;
};

}  // namespace dlmgr

#endif  // DLMGR_TRANSFER_HPP_
