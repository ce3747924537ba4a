#pragma once
#include "speech_backend.hpp"
#include <string>

struct EngineConfig {
  std::string model_path;
  std::string config_path;
  std::string espeak_data_path;
  int sample_rate = 22050;

  // Paths baked in at build time (TTS_MODEL_DIR, TTS_VOICE, TTS_ESPEAK_DIR).
  static EngineConfig defaults();
};

// espeak-ng speaks at this rate when Piper runs with a length scale of 1.0.
constexpr int kNominalRateWpm = 175;

float length_scale_for_rate(int rate_wpm);

class TTSEngine : public SpeechBackend {
public:
  explicit TTSEngine(const EngineConfig &config = EngineConfig::defaults());
  ~TTSEngine() override;

  TTSEngine(const TTSEngine &) = delete;
  TTSEngine &operator=(const TTSEngine &) = delete;

  bool is_initialized() const;
  const std::string &init_error() const;

  void set_rate(int rate_wpm) override;
  int rate() const;

  // Linear gain in [0, 1]; 1.0 is unity.
  void set_volume(float volume);
  float volume() const;

  // Synthesizes text and blocks until the device has played all of it.
  // Throws std::runtime_error on synthesis or playback failure.
  void play(const std::string &text) override;

private:
  struct Impl;
  Impl *impl;
};
