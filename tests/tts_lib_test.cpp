#include <catch2/catch.hpp>

#include "audit_request.hpp"
#include "engine_manager.hpp"
#include "tts_lib.hpp"
#include <SDL.h>
#include <cstdlib>
#include <optional>
#include <string>

TEST_CASE("rate maps onto piper length scale", "[tts]") {
  REQUIRE(length_scale_for_rate(kNominalRateWpm) == Approx(1.0f));
  REQUIRE(length_scale_for_rate(350) == Approx(0.5f));
  REQUIRE(length_scale_for_rate(kDefaultRateWpm) == Approx(0.875f));

  // Faster speech means shorter phonemes
  REQUIRE(length_scale_for_rate(kMaxRateWpm) <
          length_scale_for_rate(kMinRateWpm));
}

TEST_CASE("non-positive rate falls back to nominal speed", "[tts]") {
  REQUIRE(length_scale_for_rate(0) == Approx(1.0f));
  REQUIRE(length_scale_for_rate(-5) == Approx(1.0f));
}

TEST_CASE("default engine config points at one voice", "[tts]") {
  EngineConfig config = EngineConfig::defaults();
  REQUIRE(config.sample_rate == 22050);
  REQUIRE(config.config_path == config.model_path + ".json");
  REQUIRE_FALSE(config.espeak_data_path.empty());
}

namespace {

EngineConfig missing_voice() {
  EngineConfig config;
  config.model_path = "/nonexistent/voice.onnx";
  config.config_path = "/nonexistent/voice.onnx.json";
  config.espeak_data_path = "/nonexistent/espeak-ng-data";
  return config;
}

struct DummyAudio {
  DummyAudio() {
    setenv("SDL_AUDIODRIVER", "dummy", 1);
    if (SDL_Init(SDL_INIT_AUDIO) < 0)
      FAIL("SDL_Init failed: " << SDL_GetError());
  }
  ~DummyAudio() { SDL_Quit(); }
};

}

TEST_CASE("engine without an audio device reports why", "[tts]") {
  TTSEngine engine(missing_voice());
  REQUIRE_FALSE(engine.is_initialized());
  REQUIRE_FALSE(engine.init_error().empty());
}

TEST_CASE("engine without a voice names the missing file", "[tts]") {
  DummyAudio audio;
  TTSEngine engine(missing_voice());
  REQUIRE_FALSE(engine.is_initialized());
  REQUIRE(engine.init_error().find("/nonexistent/voice.onnx") !=
          std::string::npos);
}

TEST_CASE("speaking on a dead engine yields a SpeakError", "[tts]") {
  TTSEngine engine(missing_voice());

  std::optional<SpeakError> error;
  REQUIRE_NOTHROW(error = engine.speak("x", 250));
  REQUIRE(error);
  REQUIRE(std::string(error->what()) == "TTS not initialized");

  // The rate is applied before playback is attempted
  REQUIRE(engine.rate() == 250);
}

TEST_CASE("volume starts at unity and stays within gain bounds", "[tts]") {
  TTSEngine engine(missing_voice());
  REQUIRE(engine.volume() == 1.0f);

  engine.set_volume(0.5f);
  REQUIRE(engine.volume() == Approx(0.5f));

  engine.set_volume(3.0f);
  REQUIRE(engine.volume() == 1.0f);

  engine.set_volume(-1.0f);
  REQUIRE(engine.volume() == 0.0f);
}

TEST_CASE("engine manager refuses to start without a voice", "[tts]") {
  setenv("SDL_AUDIODRIVER", "dummy", 1);
  REQUIRE_THROWS_AS(EngineManager(missing_voice()), InitError);
}
