#include "log.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>
#include <zlib.h>

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/details/os.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {
constexpr const char *kLoggerName = "resetspan";
constexpr std::size_t kMaxLogFileSize = 1024 * 1024 * 5;

std::weak_ptr<spdlog::logger> g_logger;
std::mutex g_logger_mutex;
// Every logger writes through this sink so reconfiguring the outputs also
// affects category loggers created earlier.
std::shared_ptr<spdlog::sinks::dist_sink_mt> g_sink;

void ensure_thread_pool() {
  if (spdlog::thread_pool()) {
    return;
  }
  constexpr std::size_t queue_size = 8192;
  constexpr std::size_t num_threads = 1;
  spdlog::init_thread_pool(queue_size, num_threads);
}

namespace fs = std::filesystem;

/**
 * Path of rotation @p index for @p base: "app.log" -> "app.2.log".
 */
fs::path rotated_path(const std::string &base, std::size_t index) {
  fs::path base_path(base);
  if (index == 0) {
    return base_path;
  }
  fs::path rotated = base_path.parent_path() /
                     (base_path.stem().string() + "." + std::to_string(index) +
                      base_path.extension().string());
  return rotated;
}

/**
 * Shift existing compressed rotations one slot up, dropping the oldest.
 */
void shift_compressed_logs(const std::string &base, std::size_t max_files) {
  if (max_files == 0) {
    return;
  }
  std::error_code ec;
  fs::remove(rotated_path(base, max_files).string() + ".gz", ec);
  for (std::size_t i = max_files; i > 1; --i) {
    fs::path src_gz(rotated_path(base, i - 1).string() + ".gz");
    if (!fs::exists(src_gz, ec)) {
      continue;
    }
    fs::path target_gz(rotated_path(base, i).string() + ".gz");
    fs::remove(target_gz, ec);
    fs::rename(src_gz, target_gz, ec);
  }
}

/**
 * Gzip @p path into "<path>.gz" and remove the original on success.
 *
 * @return `true` if compression succeeded.
 */
bool gzip_file(const std::string &path) {
  auto log = rspan::category_logger("logging");
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    log->warn("Failed to open log file {} for compression", path);
    return false;
  }
  const std::string gz_path = path + ".gz";
  gzFile gz = gzopen(gz_path.c_str(), "wb");
  if (!gz) {
    log->warn("Failed to open compressed log {}", gz_path);
    return false;
  }
  char buffer[16 * 1024];
  while (input) {
    input.read(buffer, sizeof(buffer));
    std::streamsize read = input.gcount();
    if (read <= 0) {
      continue;
    }
    int written = gzwrite(gz, buffer, static_cast<unsigned>(read));
    if (written != read) {
      int err = 0;
      const char *msg = gzerror(gz, &err);
      log->warn("Failed to compress log {}: {}", path, msg ? msg : "unknown");
      gzclose(gz);
      std::error_code ec;
      fs::remove(fs::path(gz_path), ec);
      return false;
    }
  }
  gzclose(gz);
  input.close();
  std::error_code ec;
  fs::remove(fs::path(path), ec);
  if (ec) {
    log->warn("Failed to remove log {} after compression: {}", path,
              ec.message());
  }
  log->debug("Compressed rotated log '{}'", gz_path);
  return true;
}

std::vector<spdlog::sink_ptr> make_sinks(const rspan::LogSettings &settings) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (settings.file.empty()) {
    return sinks;
  }
  if (settings.rotate_files == 0) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        settings.file, true));
    return sinks;
  }
  spdlog::file_event_handlers handlers;
  if (settings.compress_rotations) {
    const std::size_t keep = settings.rotate_files;
    handlers.before_open = [keep](const spdlog::filename_t &filename) {
      const auto base = spdlog::details::os::filename_to_str(filename);
      shift_compressed_logs(base, keep);
      fs::path newest = rotated_path(base, 1);
      std::error_code ec;
      if (fs::exists(newest, ec)) {
        gzip_file(newest.string());
      }
    };
  }
  sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
      settings.file, kMaxLogFileSize, settings.rotate_files, false, handlers));
  return sinks;
}
} // namespace

namespace rspan {

void init_logger(const LogSettings &settings) {
  // Opening a rotating sink may compress old rotations, which logs.
  auto sinks = make_sinks(settings);
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  if (!g_sink) {
    g_sink = std::make_shared<spdlog::sinks::dist_sink_mt>();
  }
  g_sink->set_sinks(std::move(sinks));
  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    ensure_thread_pool();
    logger = std::make_shared<spdlog::async_logger>(
        kLoggerName, g_sink, spdlog::thread_pool(),
        spdlog::async_overflow_policy::block);
    spdlog::set_default_logger(logger);
    g_logger = logger;
  }
  lock.unlock();
  spdlog::set_level(settings.level);
  if (!settings.pattern.empty()) {
    spdlog::set_pattern(settings.pattern);
  }
  logger->debug(
      "Logger initialised (level={}, file='{}', rotate={}, compress={})",
      spdlog::level::to_string_view(settings.level), settings.file,
      settings.rotate_files, settings.compress_rotations ? "true" : "false");
}

void ensure_default_logger() {
  auto logger = spdlog::default_logger();
  auto locked = g_logger.lock();
  if (!logger || !locked || logger.get() != locked.get()) {
    init_logger(LogSettings{});
  }
}

std::shared_ptr<spdlog::logger> category_logger(const std::string &category) {
  const std::string name = std::string(kLoggerName) + "." + category;
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  auto logger = spdlog::get(name);
  if (logger) {
    return logger;
  }
  auto default_logger = g_logger.lock();
  if (!default_logger) {
    lock.unlock();
    init_logger(LogSettings{});
    lock.lock();
    default_logger = g_logger.lock();
  }
  ensure_thread_pool();
  auto new_logger = std::make_shared<spdlog::async_logger>(
      name, g_sink, spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  new_logger->set_level(default_logger ? default_logger->level()
                                       : spdlog::level::info);
  spdlog::register_logger(new_logger);
  return new_logger;
}

void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides) {
  if (overrides.empty()) {
    return;
  }
  for (const auto &[category, level] : overrides) {
    category_logger(category)->set_level(level);
  }
  category_logger("logging")->debug("Applied {} log category override(s)",
                                    overrides.size());
}

spdlog::level::level_enum
level_from_string(const std::string &name,
                  spdlog::level::level_enum fallback) {
  std::string lower = name;
  std::transform(
      lower.begin(), lower.end(), lower.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  auto level = spdlog::level::from_str(lower);
  // from_str maps unknown names to "off"
  if (level == spdlog::level::off && lower != "off") {
    return fallback;
  }
  return level;
}

void shutdown_logger() {
  std::lock_guard<std::mutex> lock(g_logger_mutex);
  g_logger.reset();
  g_sink.reset();
  spdlog::shutdown();
}

} // namespace rspan
