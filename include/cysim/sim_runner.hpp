#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <thread>
#include <cysim/config.hpp>
#include <cysim/diagnostics.hpp>
#include <cysim/engine.hpp>
#include <cysim/snap.hpp>
#include <cysim/snap_buffer.hpp>

namespace cysim {

// Owns the simulation thread and publishes snapshots.
class SimRunner {
public:
  static constexpr double kTickHz = 4.0;

  explicit SimRunner(RideConfig config = {}, std::shared_ptr<DiagnosticSink> sink = nullptr);
  ~SimRunner() { stop(); }
  SimRunner(const SimRunner&) = delete;
  SimRunner& operator=(const SimRunner&) = delete;

  void start();
  void stop();
  bool running() const { return running_.load(); }

  void request_reset(ResetMode mode);   // applied on the next tick

  SnapshotBuffer& buffer() { return buffer_; }
  const SnapshotBuffer& buffer() const { return buffer_; }
  const RideConfig& config() const { return config_; }

  // Control surface, safe to write from the UI thread
  std::atomic<int>    target_power{200};
  std::atomic<double> grade_percent{0.0};
  std::atomic<int>    randomness{0};
  std::atomic<int>    manual_cadence{-1}; // -1 = auto
  std::atomic<bool>   resting{false};

private:
  void thread_main_();

  RideConfig config_;
  std::shared_ptr<DiagnosticSink> sink_;

  std::thread th_;
  std::atomic<bool> running_{false};
  SnapshotBuffer buffer_;

  std::atomic<bool> pending_reset_{false};
  std::atomic<int>  pending_reset_mode_{0};
};

} // namespace cysim
