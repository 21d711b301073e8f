#include <cysim/diagnostics.hpp>
#include <ctime>
#include <sstream>

namespace cysim {

const char* to_string(Severity s) {
  switch (s) {
    case Severity::Critical: return "CRITICAL";
    case Severity::Error:    return "ERROR";
    case Severity::Warning:  return "WARNING";
    case Severity::Info:     return "INFO";
  }
  return "UNKNOWN";
}

const char* to_string(Category c) {
  switch (c) {
    case Category::Transport:  return "TRANSPORT";
    case Category::Simulation: return "SIMULATION";
    case Category::Validation: return "VALIDATION";
    case Category::System:     return "SYSTEM";
  }
  return "UNKNOWN";
}

static std::string iso8601_utc_(std::chrono::system_clock::time_point tp) {
  const std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return std::string(buf);
}

std::string format_entry(const DiagnosticEntry& e) {
  std::ostringstream os;
  os << '[' << iso8601_utc_(e.timestamp) << "] "
     << to_string(e.severity) << " [" << to_string(e.category) << "] "
     << e.message;
  if (!e.context.empty()) {
    os << " | ";
    bool first = true;
    for (const auto& [k, v] : e.context) {
      if (!first) os << ", ";
      os << k << '=' << v;
      first = false;
    }
  }
  return os.str();
}

DiagnosticLog::Drain console_drain(std::FILE* out) {
  return [out](const DiagnosticEntry& e) {
    if (!out) return;
    const std::string line = format_entry(e);
    std::fprintf(out, "%s\n", line.c_str());
    std::fflush(out);
  };
}

// ---- DiagnosticLog ----

DiagnosticLog::DiagnosticLog(std::size_t capacity, Drain drain, std::size_t history_limit)
  : capacity_(capacity == 0 ? 1 : capacity),
    history_limit_(history_limit == 0 ? 1 : history_limit),
    drain_(std::move(drain)) {}

void DiagnosticLog::start() {
  if (running_.load()) return;
  running_.store(true);
  th_ = std::thread(&DiagnosticLog::thread_main_, this);
}

void DiagnosticLog::stop() {
  if (running_.load()) {
    {
      std::lock_guard<std::mutex> lk(queue_mu_);
      running_.store(false);
    }
    queue_cv_.notify_all();
    if (th_.joinable()) th_.join();
  }
  flush(); // leftovers, inline
}

void DiagnosticLog::report(std::string message, Severity severity, Category category,
                           Context context) {
  DiagnosticEntry e;
  e.timestamp = std::chrono::system_clock::now();
  e.severity = severity;
  e.category = category;
  e.message = std::move(message);
  e.context = std::move(context);
  {
    std::lock_guard<std::mutex> lk(queue_mu_);
    if (pending_.size() >= capacity_) {
      dropped_.fetch_add(1, std::memory_order_relaxed);
      return;
    }
    e.sequence = next_seq_++;
    pending_.push_back(std::move(e));
  }
  queue_cv_.notify_one();
}

void DiagnosticLog::deliver_(std::deque<DiagnosticEntry>& batch) {
  if (batch.empty()) return;
  const std::uint64_t last = batch.back().sequence;
  for (const auto& e : batch) {
    if (drain_) drain_(e);
  }
  {
    std::lock_guard<std::mutex> lk(history_mu_);
    for (auto& e : batch) history_.push_back(std::move(e));
    while (history_.size() > history_limit_) history_.pop_front();
  }
  batch.clear();
  {
    std::lock_guard<std::mutex> lk(queue_mu_);
    if (last > delivered_seq_) delivered_seq_ = last;
  }
  idle_cv_.notify_all();
}

void DiagnosticLog::thread_main_() {
  std::deque<DiagnosticEntry> batch;
  while (true) {
    {
      std::unique_lock<std::mutex> lk(queue_mu_);
      queue_cv_.wait(lk, [this]{ return !pending_.empty() || !running_.load(); });
      if (pending_.empty() && !running_.load()) return;
    }
    // Swap under the deliver lock so an inline flush() cannot overtake this batch.
    std::lock_guard<std::mutex> dl(deliver_mu_);
    {
      std::lock_guard<std::mutex> lk(queue_mu_);
      batch.swap(pending_);
    }
    deliver_(batch);
  }
}

void DiagnosticLog::flush() {
  if (!running_.load()) {
    std::lock_guard<std::mutex> dl(deliver_mu_);
    std::deque<DiagnosticEntry> batch;
    {
      std::lock_guard<std::mutex> lk(queue_mu_);
      batch.swap(pending_);
    }
    deliver_(batch);
    return;
  }
  std::unique_lock<std::mutex> lk(queue_mu_);
  const std::uint64_t accepted = next_seq_ - 1;
  idle_cv_.wait(lk, [&]{ return delivered_seq_ >= accepted || !running_.load(); });
}

std::vector<DiagnosticEntry> DiagnosticLog::entries() const {
  std::lock_guard<std::mutex> lk(history_mu_);
  return std::vector<DiagnosticEntry>(history_.begin(), history_.end());
}

std::vector<DiagnosticEntry> DiagnosticLog::entries(std::optional<Severity> severity,
                                                    std::optional<Category> category) const {
  std::vector<DiagnosticEntry> out;
  std::lock_guard<std::mutex> lk(history_mu_);
  for (const auto& e : history_) {
    if (severity && e.severity != *severity) continue;
    if (category && e.category != *category) continue;
    out.push_back(e);
  }
  return out;
}

std::map<Severity, std::size_t> DiagnosticLog::summary() const {
  std::map<Severity, std::size_t> out{
    {Severity::Critical, 0}, {Severity::Error, 0}, {Severity::Warning, 0}, {Severity::Info, 0}};
  std::lock_guard<std::mutex> lk(history_mu_);
  for (const auto& e : history_) ++out[e.severity];
  return out;
}

void DiagnosticLog::clear() {
  {
    std::lock_guard<std::mutex> lk(queue_mu_);
    pending_.clear();
    delivered_seq_ = next_seq_ - 1;
  }
  idle_cv_.notify_all();
  std::lock_guard<std::mutex> lk(history_mu_);
  history_.clear();
}

} // namespace cysim
