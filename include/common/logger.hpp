#pragma once
#include <string>
#include <memory>
#include <fstream>
#include <mutex>
#include <atomic>
#include <chrono>
#include <queue>
#include <thread>
#include <condition_variable>

enum class LogLevel { DEBUG, INFO, WARNING, ERROR, CRITICAL };

struct LogEntry {
  std::chrono::system_clock::time_point timestamp;
  LogLevel level;
  std::string message;
  std::string file;
  int line;
  std::thread::id thread_id;
};

// Asynchronous file logger. Entries are queued by the caller and written by a
// worker thread. Before Initialize() (and after Shutdown()) all calls are no-ops.
class Logger {
  static std::unique_ptr<Logger> instance_;
  static std::mutex instance_mutex_;
  std::ofstream log_file_;
  std::mutex log_mutex_;
  std::queue<LogEntry> log_queue_;
  std::thread worker_thread_;
  std::condition_variable cv_;
  bool running_ = false;
  std::atomic<bool> echo_stderr_{false};
  LogLevel min_level_ = LogLevel::INFO;
  Logger() = default;
  void WorkerFunction();
  void WriteLogEntry(const LogEntry&);
  static std::string FormatLogEntry(const LogEntry&);
public:
  static void Initialize(const std::string& path, LogLevel min_level = LogLevel::INFO, bool echo_stderr = false);
  static void Shutdown();
  static bool IsEnabled(LogLevel level);
  // file/line default to the caller's location.
  static void Log(LogLevel level, const std::string& message,
                  const std::string& file = __builtin_FILE(), int line = __builtin_LINE());
  static void Debug(const std::string& m, const std::string& f = __builtin_FILE(), int l = __builtin_LINE());
  static void Info(const std::string& m, const std::string& f = __builtin_FILE(), int l = __builtin_LINE());
  static void Warning(const std::string& m, const std::string& f = __builtin_FILE(), int l = __builtin_LINE());
  static void Error(const std::string& m, const std::string& f = __builtin_FILE(), int l = __builtin_LINE());
  static void Critical(const std::string& m, const std::string& f = __builtin_FILE(), int l = __builtin_LINE());
  static const char* LevelToString(LogLevel);
  // Accepts debug|info|warn|warning|error|critical (any case); returns fallback otherwise.
  static LogLevel ParseLevel(const std::string& s, LogLevel fallback = LogLevel::INFO);
  ~Logger();
};
