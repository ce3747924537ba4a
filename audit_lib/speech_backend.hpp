#pragma once
#include "audit_errors.hpp"
#include <optional>
#include <string>

// Seam between the audit coordinator and whatever turns text into sound.
// Implementations are driven from one background run at a time.
class SpeechBackend {
public:
  virtual ~SpeechBackend() = default;

  virtual void set_rate(int rate_wpm) = 0;

  // Applies the rate, then plays text and blocks until playback is done.
  // Any failure raised by set_rate() or play() is captured here and handed
  // back as a SpeakError.
  std::optional<SpeakError> speak(const std::string &text, int rate_wpm);

protected:
  virtual void play(const std::string &text) = 0;
};
