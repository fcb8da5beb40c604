#include "Transfer.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <utility>

#include "CurlUtils.hpp"
#include "logger.hpp"

namespace dlmgr {

namespace {

// State shared with the curl callbacks. The file is created (truncated) once
// the final response's headers are in, so a request that never gets a response
// leaves nothing on disk.
struct TransferContext {
  TransferContext(const std::filesystem::path& path, CURL* handle)
      : destination(path), easy(handle) {}

  bool openFile() {
    file.open(destination, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
      writeError = "Cannot create destination file " + destination.string();
      return false;
    }
    fileOpen = true;
    return true;
  }

  // Flushes and closes. Throws TransferError if buffered bytes could not be
  // written.
  void closeFile() {
    if (!fileOpen) return;
    fileOpen = false;
    file.flush();
    const bool flushed = static_cast<bool>(file);
    file.close();
    if (!flushed || file.fail()) {
      throw TransferError("Failed to flush destination file " +
                          destination.string());
    }
  }

  const std::filesystem::path& destination;
  CURL* easy;
  std::ofstream file;
  bool fileOpen = false;
  uint64_t bytesDownloaded = 0;
  std::string writeError;
};

// Headers arrive line by line; the blank line ends one response. Interim
// (1xx) and redirect (3xx) responses are skipped, the body of whatever
// response comes last is what gets saved.
size_t headerLine(char* buffer, size_t size, size_t nitems, void* userdata) {
  auto* ctx = static_cast<TransferContext*>(userdata);
  const size_t total = size * nitems;
  const bool endOfHeaders =
      (total == 2 && buffer[0] == '\r' && buffer[1] == '\n') ||
      (total == 1 && buffer[0] == '\n');
  if (!endOfHeaders || ctx->fileOpen) return total;

  long status = 0;
  curl_easy_getinfo(ctx->easy, CURLINFO_RESPONSE_CODE, &status);
  if ((status >= 100 && status < 200) || (status >= 300 && status < 400)) {
    return total;
  }
  return ctx->openFile() ? total : 0;
}

// 写入回调
size_t writeBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* ctx = static_cast<TransferContext*>(userdata);
  const size_t total = size * nmemb;
  if (!ctx->fileOpen && !ctx->openFile()) {
    return total == 0 ? 1 : 0;  // any mismatch aborts the transfer
  }
  ctx->bytesDownloaded += total;
  ctx->file.write(ptr, static_cast<std::streamsize>(total));
  if (!ctx->file) {
    ctx->writeError =
        "Failed to write destination file " + ctx->destination.string();
    return 0;
  }
  return total;
}

// Removes the easy handle from the multi handle before either is cleaned up.
class MultiAttachment {
 public:
  MultiAttachment(CURLM* multi, CURL* easy) : multi_(multi), easy_(easy) {
    if (curl_multi_add_handle(multi_, easy_) != CURLM_OK) {
      throw TransferError("curl_multi_add_handle failed");
    }
  }
  ~MultiAttachment() { curl_multi_remove_handle(multi_, easy_); }

  MultiAttachment(const MultiAttachment&) = delete;
  MultiAttachment& operator=(const MultiAttachment&) = delete;

 private:
  CURLM* multi_;
  CURL* easy_;
};

class WakerRegistration {
 public:
  WakerRegistration(CancellationToken& token, CURLM* multi) : token_(token) {
    token_.setWaker([multi]() { curl_multi_wakeup(multi); });
  }
  ~WakerRegistration() { token_.clearWaker(); }

  WakerRegistration(const WakerRegistration&) = delete;
  WakerRegistration& operator=(const WakerRegistration&) = delete;

 private:
  CancellationToken& token_;
};

std::string describe(CURLcode code, const char* errbuf) {
  std::string message = std::string("curl error: ") + curl_easy_strerror(code);
  if (errbuf[0] != '\0') {
    message += " (";
    message += errbuf;
    message += ")";
  }
  return message;
}

std::string formatElapsed(std::chrono::steady_clock::duration elapsed) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2)
      << std::chrono::duration<double>(elapsed).count() << "s";
  return oss.str();
}

}  // namespace

CurlTransfer::CurlTransfer(TransferOptions options)
    : options_(std::move(options)) {
  if (options_.progressInterval <= std::chrono::milliseconds::zero()) {
    options_.progressInterval = std::chrono::milliseconds(1000);
  }
}

TransferStatus CurlTransfer::run(const std::string& url,
                                 const std::filesystem::path& destination,
                                 CancellationToken& token) const {
  using Clock = std::chrono::steady_clock;

  ensureCurlInitialized();
  CurlEasyHandle easy{curl_easy_init(), &curl_easy_cleanup};
  if (!easy) {
    throw TransferError("Failed to allocate curl handle");
  }
  CurlMultiHandle multi{curl_multi_init(), &curl_multi_cleanup};
  if (!multi) {
    throw TransferError("Failed to allocate curl multi handle");
  }

  TransferContext ctx(destination, easy.get());
  char errbuf[CURL_ERROR_SIZE] = {0};

  curl_easy_setopt(easy.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(easy.get(), CURLOPT_WRITEFUNCTION, &writeBody);
  curl_easy_setopt(easy.get(), CURLOPT_WRITEDATA, &ctx);
  curl_easy_setopt(easy.get(), CURLOPT_HEADERFUNCTION, &headerLine);
  curl_easy_setopt(easy.get(), CURLOPT_HEADERDATA, &ctx);
  curl_easy_setopt(easy.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(easy.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(easy.get(), CURLOPT_NOPROGRESS, 1L);
  curl_easy_setopt(easy.get(), CURLOPT_ERRORBUFFER, errbuf);
  curl_easy_setopt(easy.get(), CURLOPT_USERAGENT, options_.userAgent.c_str());

  MultiAttachment attachment(multi.get(), easy.get());
  WakerRegistration waker(token, multi.get());

  const auto period = options_.progressInterval;
  const auto start = Clock::now();
  // First report after one full period.
  auto nextTick = start + period;

  while (true) {
    if (token.isTriggered()) {
      // A cancelled download always leaves a fresh (possibly empty) file.
      if (!ctx.fileOpen && !ctx.openFile()) {
        throw TransferError(ctx.writeError);
      }
      ctx.closeFile();
      return TransferStatus::Cancelled;
    }

    int running = 0;
    CURLMcode mc = curl_multi_perform(multi.get(), &running);
    if (mc != CURLM_OK) {
      throw TransferError(std::string("curl_multi_perform: ") +
                          curl_multi_strerror(mc));
    }

    if (running == 0) {
      CURLcode result = CURLE_OK;
      int left = 0;
      while (CURLMsg* msg = curl_multi_info_read(multi.get(), &left)) {
        if (msg->msg == CURLMSG_DONE) result = msg->data.result;
      }
      if (!ctx.writeError.empty()) {
        throw TransferError(ctx.writeError);
      }
      if (result != CURLE_OK) {
        throw TransferError(describe(result, errbuf));
      }
      // Protocols without headers, and empty bodies, never opened the file.
      if (!ctx.fileOpen && !ctx.openFile()) {
        throw TransferError(ctx.writeError);
      }
      ctx.closeFile();

      long status = 0;
      curl_easy_getinfo(easy.get(), CURLINFO_RESPONSE_CODE, &status);
      if (status >= 400) {
        LOG(WARN) << "server returned an error status"
                  << utils::kv("url", url) << utils::kv("status", status)
                  << utils::kv("bytes", ctx.bytesDownloaded);
      }
      return TransferStatus::Completed;
    }

    auto now = Clock::now();
    if (now >= nextTick) {
      reportProgress({url, now - start, ctx.bytesDownloaded});
      nextTick += period;
      if (nextTick <= now) nextTick = now + period;
    }

    const auto wait =
        std::chrono::duration_cast<std::chrono::milliseconds>(nextTick - now);
    const int timeoutMs = static_cast<int>(
        std::clamp<std::chrono::milliseconds::rep>(wait.count(), 0,
                                                   period.count()));
    mc = curl_multi_poll(multi.get(), nullptr, 0, timeoutMs, nullptr);
    if (mc != CURLM_OK) {
      throw TransferError(std::string("curl_multi_poll: ") +
                          curl_multi_strerror(mc));
    }
  }
}

void CurlTransfer::reportProgress(const TransferProgress& progress) const {
  LOG(INFO) << "download progress" << utils::kv("url", progress.url)
            << utils::kv("elapsed", formatElapsed(progress.elapsed))
            << utils::kv("bytes", progress.bytesDownloaded);
  if (options_.onProgress) options_.onProgress(progress);
}

}  // namespace dlmgr
