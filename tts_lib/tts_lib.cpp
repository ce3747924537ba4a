#include "tts_lib.hpp"
#include "sdl_player.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <piper.h>
#include <stdexcept>
#include <vector>

#ifndef TTS_MODEL_DIR
#define TTS_MODEL_DIR "models"
#endif
#ifndef TTS_VOICE
#define TTS_VOICE "en_US-hfc_male-medium"
#endif
#ifndef TTS_ESPEAK_DIR
#define TTS_ESPEAK_DIR "/usr/share/espeak-ng-data"
#endif

EngineConfig EngineConfig::defaults() {
  EngineConfig config;
  config.model_path = TTS_MODEL_DIR "/" TTS_VOICE ".onnx";
  config.config_path = TTS_MODEL_DIR "/" TTS_VOICE ".onnx.json";
  config.espeak_data_path = TTS_ESPEAK_DIR;
  return config;
}

float length_scale_for_rate(int rate_wpm) {
  if (rate_wpm <= 0) {
    return 1.0f;
  }
  return static_cast<float>(kNominalRateWpm) / static_cast<float>(rate_wpm);
}

struct TTSEngine::Impl {
  piper_synthesizer *synth = nullptr;
  bool initialized = false;
  std::string error;
  int rate_wpm = kNominalRateWpm;
  float volume = 1.0f;
  sdl_player player;
  ~Impl() {
    if (synth) {
      piper_free(synth);
    }
  }
};

TTSEngine::TTSEngine(const EngineConfig &config) : impl(new Impl()) {
  if (!impl->player.init(config.sample_rate)) {
    impl->error = "Failed to initialize SDL player";
    fprintf(stderr, "ERROR: %s\n", impl->error.c_str());
    return;
  }

  // piper_create does not say which file it could not load
  for (const std::string *path : {&config.model_path, &config.config_path}) {
    std::ifstream file(*path);
    if (!file) {
      impl->error = "Voice file not found: " + *path;
      fprintf(stderr, "ERROR: %s\n", impl->error.c_str());
      return;
    }
  }

  impl->synth = piper_create(config.model_path.c_str(),
                             config.config_path.c_str(),
                             config.espeak_data_path.c_str());

  if (!impl->synth) {
    impl->error = "Failed to create piper synthesizer from " + config.model_path;
    fprintf(stderr, "ERROR: %s\n", impl->error.c_str());
    return;
  }

  impl->initialized = true;
}

TTSEngine::~TTSEngine() { delete impl; }

bool TTSEngine::is_initialized() const { return impl && impl->initialized; }

const std::string &TTSEngine::init_error() const { return impl->error; }

void TTSEngine::set_rate(int rate_wpm) { impl->rate_wpm = rate_wpm; }

int TTSEngine::rate() const { return impl->rate_wpm; }

void TTSEngine::set_volume(float volume) {
  impl->volume = std::min(1.0f, std::max(0.0f, volume));
}

float TTSEngine::volume() const { return impl->volume; }

void TTSEngine::play(const std::string &text) {
  if (!impl || !impl->synth) {
    throw std::runtime_error("TTS not initialized");
  }

  if (text.empty()) {
    fprintf(stderr, "WARNING: Nothing to speak\n");
    return;
  }

  piper_synthesize_options opts = piper_default_synthesize_options(impl->synth);
  opts.length_scale = length_scale_for_rate(impl->rate_wpm);

  if (piper_synthesize_start(impl->synth, text.c_str(), &opts) != PIPER_OK) {
    throw std::runtime_error("Piper failed to start synthesis");
  }

  std::vector<float> all_samples;
  piper_audio_chunk chunk;

  int rc;
  while ((rc = piper_synthesize_next(impl->synth, &chunk)) != PIPER_DONE) {
    if (rc != PIPER_OK) {
      throw std::runtime_error("Piper synthesis failed (code " +
                               std::to_string(rc) + ")");
    }
    all_samples.insert(all_samples.end(), chunk.samples,
                       chunk.samples + chunk.num_samples);
  }

  if (all_samples.empty()) {
    fprintf(stderr, "WARNING: No audio generated\n");
    return;
  }

  float max_val = 0.0f;
  for (float s : all_samples) {
    max_val = std::max(max_val, std::abs(s));
  }

  // Peak-normalize with headroom, then apply the requested gain.
  if (max_val > 0.0f) {
    float scale = 0.95f / max_val * impl->volume;
    for (float &s : all_samples) {
      s *= scale;
    }
  }

  if (!impl->player.play(all_samples)) {
    throw std::runtime_error("Audio device is not available");
  }

  if (!impl->player.wait_to_finish()) {
    throw std::runtime_error("Audio device stopped during playback");
  }
}
