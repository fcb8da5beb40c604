#include <gflags/gflags.h>

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include <utility>

#include "Downloader/CurlUtils.hpp"
#include "Downloader/Downloader.hpp"
#include "Downloader/InterruptSource.hpp"
#include "Downloader/Manifest.hpp"
#include "Downloader/Transfer.hpp"
#include "utils/logger.hpp"

DEFINE_string(out_dir, "out", "Directory the downloads are written to");
DEFINE_string(d, "", "Shorthand for --out_dir");
DEFINE_int32(max_concurrent_downloads, 0,
             "Maximum number of downloads running at once (0 for unbounded)");
DEFINE_string(log_dir, "", "Also append logs to <log_dir>/dlmgr.log");
DEFINE_string(log_level, "INFO", "Minimum log level: DEBUG, INFO, WARN, ERROR");
DEFINE_int32(max_log_file_mb, 10, "Rotate the log file past this size");
DEFINE_int32(max_log_backups, 3, "Number of rotated log files to keep");
DEFINE_string(user_agent, "dlmgr/1.0", "User-Agent header sent with requests");

namespace {

const char* kUsage = "run <manifest-path> [--out_dir|-d <dir>]";

int runDownloads(const std::string& manifestPath,
                 dlmgr::InterruptSource& interrupts) {
  LOG(DEBUG) << "loading manifest" << dlmgr::utils::kv("manifest", manifestPath);
  dlmgr::Manifest manifest = dlmgr::Manifest::load(manifestPath);

  const std::string requestedDir = FLAGS_d.empty() ? FLAGS_out_dir : FLAGS_d;
  std::error_code ec;
  std::filesystem::create_directories(requestedDir, ec);
  if (ec) {
    LOG(ERROR) << "Failed to create output directory"
               << dlmgr::utils::kv("dir", requestedDir)
               << dlmgr::utils::kv("error", ec.message());
    return 1;
  }
  const std::filesystem::path outDir =
      std::filesystem::canonical(requestedDir);

  dlmgr::ensureCurlInitialized();

  dlmgr::TransferOptions transferOptions;
  transferOptions.userAgent = FLAGS_user_agent;
  auto transfer = std::make_shared<dlmgr::CurlTransfer>(transferOptions);

  dlmgr::DownloaderOptions options;
  options.outDir = outDir;
  options.maxConcurrentDownloads =
      FLAGS_max_concurrent_downloads > 0
          ? static_cast<size_t>(FLAGS_max_concurrent_downloads)
          : 0;

  dlmgr::Downloader downloader(transfer, interrupts, options);
  dlmgr::DownloadReport report = downloader.run(std::move(manifest.downloads));

  for (const auto& url : report.failedUrls) {
    LOG(WARN) << "not downloaded" << dlmgr::utils::kv("url", url);
  }
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  // Before any thread exists, so every thread inherits the blocked SIGINT.
  dlmgr::SignalInterruptSource interrupts;

  gflags::SetUsageMessage(std::string(kUsage));
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  if (argc != 3 || std::string(argv[1]) != "run") {
    std::cerr << "Usage: " << argv[0] << " " << kUsage << std::endl;
    return 1;
  }

  try {
    dlmgr::utils::LogConfig logCfg;
    logCfg.logDir = FLAGS_log_dir;
    logCfg.minLevel = dlmgr::utils::parseLogLevel(FLAGS_log_level);
    logCfg.maxFileSize =
        static_cast<size_t>(FLAGS_max_log_file_mb > 0 ? FLAGS_max_log_file_mb
                                                      : 10) *
        1024 * 1024;
    logCfg.maxBackupFiles =
        static_cast<size_t>(FLAGS_max_log_backups > 0 ? FLAGS_max_log_backups
                                                      : 0);
    dlmgr::utils::Logger::initialize(logCfg);

    return runDownloads(argv[2], interrupts);
  } catch (const std::exception& e) {
    LOG(ERROR) << "Fatal error" << dlmgr::utils::kv("error", e.what());
    return 1;
  }
}
