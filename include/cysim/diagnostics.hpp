#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace cysim {

enum class Severity : int { Critical = 0, Error, Warning, Info };
enum class Category : int { Transport = 0, Simulation, Validation, System };

using Context = std::map<std::string, std::string>;

struct DiagnosticEntry {
  std::uint64_t sequence = 0;
  std::chrono::system_clock::time_point timestamp{};
  Severity severity = Severity::Info;
  Category category = Category::System;
  std::string message;
  Context context;
};

const char* to_string(Severity s);
const char* to_string(Category c);

// "[2026-01-02T03:04:05Z] WARNING [VALIDATION] message | k=v, k=v"
std::string format_entry(const DiagnosticEntry& e);

// Capability handed to anything that wants to emit diagnostics.
// Implementations must accept report() from any thread.
class DiagnosticSink {
public:
  virtual ~DiagnosticSink() = default;
  virtual void report(std::string message, Severity severity, Category category,
                      Context context = {}) = 0;

  void report_validation(std::string message, Context context = {}) {
    report(std::move(message), Severity::Warning, Category::Validation, std::move(context));
  }
  void report_simulation(std::string message, Context context = {},
                         Severity severity = Severity::Warning) {
    report(std::move(message), severity, Category::Simulation, std::move(context));
  }
  void report_system(std::string message, Context context = {},
                     Severity severity = Severity::Error) {
    report(std::move(message), severity, Category::System, std::move(context));
  }
  void report_transport(std::string message, Context context = {},
                        Severity severity = Severity::Error) {
    report(std::move(message), severity, Category::Transport, std::move(context));
  }
};

class NullSink final : public DiagnosticSink {
public:
  void report(std::string, Severity, Category, Context) override {}
};

// Bounded multi-producer queue drained by one background thread.
// Producers never wait on the drain: a full queue drops the new entry.
class DiagnosticLog final : public DiagnosticSink {
public:
  using Drain = std::function<void(const DiagnosticEntry&)>;

  explicit DiagnosticLog(std::size_t capacity = 1024, Drain drain = {},
                         std::size_t history_limit = 4096);
  ~DiagnosticLog() override { stop(); }
  DiagnosticLog(const DiagnosticLog&) = delete;
  DiagnosticLog& operator=(const DiagnosticLog&) = delete;

  void start();
  void stop();   // drains what is queued, then joins
  bool running() const { return running_.load(); }

  void report(std::string message, Severity severity, Category category,
              Context context = {}) override;

  // Blocks the caller until every accepted entry reached the drain.
  // Drains inline when the thread is not running.
  void flush();

  std::vector<DiagnosticEntry> entries() const;
  std::vector<DiagnosticEntry> entries(std::optional<Severity> severity,
                                       std::optional<Category> category) const;
  std::map<Severity, std::size_t> summary() const;
  void clear();

  std::uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }
  std::size_t capacity() const { return capacity_; }

private:
  void thread_main_();
  void deliver_(std::deque<DiagnosticEntry>& batch);

  const std::size_t capacity_;
  const std::size_t history_limit_;
  Drain drain_;

  mutable std::mutex queue_mu_;
  std::condition_variable queue_cv_;
  std::condition_variable idle_cv_;
  std::deque<DiagnosticEntry> pending_;
  std::uint64_t next_seq_ = 1;
  std::uint64_t delivered_seq_ = 0;   // highest sequence handed to the drain

  std::mutex deliver_mu_;             // one deliverer at a time keeps FIFO
  mutable std::mutex history_mu_;
  std::deque<DiagnosticEntry> history_;

  std::thread th_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> dropped_{0};
};

// Drain that prints format_entry() lines to `out`.
DiagnosticLog::Drain console_drain(std::FILE* out = stderr);

} // namespace cysim
