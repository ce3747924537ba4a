#include "audit_coordinator.hpp"
#include "sanitizer.hpp"
#include <cstdio>
#include <system_error>
#include <thread>

AuditCoordinator::AuditCoordinator(SpeechBackend &backend,
                                   UiDispatcher &dispatcher,
                                   AuditListener &listener)
    : m_backend(backend), m_dispatcher(dispatcher), m_listener(listener) {}

AuditCoordinator::~AuditCoordinator() {
  std::unique_lock<std::mutex> lock(m_mutex);
  m_idle_cond.wait(lock, [this] { return m_state == CoordinatorState::Idle; });
}

void AuditCoordinator::submit(const std::string &raw_text, int rate_wpm) {
  std::string text = trim(raw_text);
  if (text.empty()) {
    throw EmptyInputError();
  }
  if (!is_valid_rate(rate_wpm)) {
    throw RateOutOfRangeError(rate_wpm);
  }

  AuditRequest request{std::move(text), rate_wpm};

  // The started notification is posted under the same lock the worker takes
  // to post its finished notification, so the two can never swap places.
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_state != CoordinatorState::Idle) {
    throw BusyError();
  }

  try {
    launch([this, request] { run(request); });
  } catch (const std::system_error &e) {
    fprintf(stderr, "ERROR: Failed to start audit thread: %s\n", e.what());
    throw;
  }
  m_state = CoordinatorState::Running;

  AuditListener &listener = m_listener;
  m_dispatcher.post([&listener] { listener.on_run_started(); });
}

void AuditCoordinator::launch(std::function<void()> job) {
  std::thread(std::move(job)).detach();
}

void AuditCoordinator::run(const AuditRequest &request) {
  std::string clean_text = sanitize(request.raw_text);
  std::optional<SpeakError> error =
      m_backend.speak(clean_text, request.rate_wpm);

  if (error) {
    fprintf(stderr, "ERROR: Audit exception: %s\n", error->what());
  }

  // Nothing may touch *this after the lock is released: the destructor
  // is allowed to proceed from that point.
  std::lock_guard<std::mutex> lock(m_mutex);
  AuditListener &listener = m_listener;
  m_dispatcher.post([&listener, error] { listener.on_run_finished(error); });
  m_state = CoordinatorState::Idle;
  m_idle_cond.notify_all();
}

CoordinatorState AuditCoordinator::state() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_state;
}

bool AuditCoordinator::wait_until_idle(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(m_mutex);
  return m_idle_cond.wait_for(
      lock, timeout, [this] { return m_state == CoordinatorState::Idle; });
}
