#pragma once
#include <stdexcept>
#include <string>

class AuditError : public std::runtime_error {
public:
  explicit AuditError(const std::string &what) : std::runtime_error(what) {}
};

// Backend unreachable or misconfigured at startup. Fatal.
class InitError : public AuditError {
public:
  explicit InitError(const std::string &what) : AuditError(what) {}
};

class EmptyInputError : public AuditError {
public:
  EmptyInputError() : AuditError("Input buffer is empty.") {}
};

class BusyError : public AuditError {
public:
  BusyError() : AuditError("Audit already in progress.") {}
};

class RateOutOfRangeError : public AuditError {
public:
  explicit RateOutOfRangeError(int rate_wpm)
      : AuditError("Playback rate " + std::to_string(rate_wpm) +
                   " WPM is outside the supported range."),
        m_rate_wpm(rate_wpm) {}

  int rate_wpm() const { return m_rate_wpm; }

private:
  int m_rate_wpm;
};

// Backend failure during a run. Reported, never thrown past the coordinator.
class SpeakError : public AuditError {
public:
  explicit SpeakError(const std::string &what) : AuditError(what) {}
};
