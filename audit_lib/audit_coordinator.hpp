#pragma once
#include "audit_errors.hpp"
#include "audit_request.hpp"
#include "speech_backend.hpp"
#include "ui_dispatcher.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

enum class CoordinatorState { Idle, Running };

// Receives run notifications, always through the UiDispatcher.
class AuditListener {
public:
  virtual ~AuditListener() = default;
  virtual void on_run_started() = 0;
  virtual void on_run_finished(const std::optional<SpeakError> &error) = 0;
};

// Runs at most one synthesis at a time. Each accepted submit gets its own
// detached worker thread that sanitizes the text, configures the rate and
// speaks; the caller's thread never blocks on playback.
class AuditCoordinator {
public:
  AuditCoordinator(SpeechBackend &backend, UiDispatcher &dispatcher,
                   AuditListener &listener);

  // Waits for an in-flight run; the backend must outlive it.
  virtual ~AuditCoordinator();

  AuditCoordinator(const AuditCoordinator &) = delete;
  AuditCoordinator &operator=(const AuditCoordinator &) = delete;

  // Throws EmptyInputError, RateOutOfRangeError or BusyError without
  // changing state, and lets std::system_error through if no worker thread
  // could be started. On success the state is Running when this returns.
  void submit(const std::string &raw_text, int rate_wpm);

  CoordinatorState state() const;
  bool is_running() const { return state() == CoordinatorState::Running; }

  // Returns false if a run is still going after timeout.
  bool wait_until_idle(std::chrono::milliseconds timeout);

protected:
  // Starts job on a fresh detached thread.
  virtual void launch(std::function<void()> job);

private:
  void run(const AuditRequest &request);

  SpeechBackend &m_backend;
  UiDispatcher &m_dispatcher;
  AuditListener &m_listener;

  mutable std::mutex m_mutex;
  std::condition_variable m_idle_cond;
  CoordinatorState m_state = CoordinatorState::Idle;
};
