#include "speech_backend.hpp"
#include <exception>

std::optional<SpeakError> SpeechBackend::speak(const std::string &text,
                                               int rate_wpm) {
  try {
    set_rate(rate_wpm);
    play(text);
  } catch (const std::exception &e) {
    return SpeakError(e.what());
  }
  return std::nullopt;
}
