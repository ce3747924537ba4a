#include "../include/sdl_player.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstring>

namespace {
// How often a waiting caller re-checks that the device is still alive.
constexpr std::chrono::milliseconds kDevicePollInterval{100};
}

sdl_player::sdl_player() {
  // Constructor is empty, initialization happens in init()
}

sdl_player::~sdl_player() {
  if (m_dev_id != 0) {
    if (is_playing())
      wait_to_finish();

    SDL_PauseAudioDevice(m_dev_id, 1);
    SDL_CloseAudioDevice(m_dev_id);
  }
}

bool sdl_player::init(int sample_rate) {
  SDL_AudioSpec wanted_spec, have_spec;
  SDL_zero(wanted_spec);

  wanted_spec.freq = sample_rate;
  wanted_spec.format = AUDIO_F32LSB; // 32-bit float, little-endian
  wanted_spec.channels = 1;          // Mono
  wanted_spec.samples = 2048;
  wanted_spec.callback = audio_callback_c;
  wanted_spec.userdata = this;

  m_dev_id =
      SDL_OpenAudioDevice(nullptr, SDL_FALSE, &wanted_spec, &have_spec, 0);
  if (m_dev_id == 0) {
    fprintf(stderr, "%s: Failed to open audio device: %s\n", __func__,
            SDL_GetError());
    return false;
  }

  // Start the audio callback. It will play silence until we give it data.
  SDL_PauseAudioDevice(m_dev_id, 0);

  return true;
}

bool sdl_player::play(const std::vector<float> &audio_data) {
  if (m_dev_id == 0) {
    return false;
  }
  if (audio_data.empty()) {
    return true;
  }

  std::lock_guard<std::mutex> lock(m_mutex);

  if (!m_is_playing) {
    m_buffer = audio_data;
    m_buffer_pos = 0;
  } else {
    m_buffer.insert(m_buffer.end(), audio_data.begin(), audio_data.end());
  }

  m_is_playing = true;
  return true;
}

bool sdl_player::is_playing() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_is_playing;
}

bool sdl_player::wait_to_finish() {
  std::unique_lock<std::mutex> lock(m_mutex);
  while (m_is_playing) {
    if (m_cond.wait_for(lock, kDevicePollInterval,
                        [this] { return !m_is_playing; })) {
      break;
    }
    // A device that was unplugged or lost stops calling us back.
    if (SDL_GetAudioDeviceStatus(m_dev_id) != SDL_AUDIO_PLAYING) {
      fprintf(stderr, "%s: Audio device stopped: %s\n", __func__,
              SDL_GetError());
      m_buffer.clear();
      m_buffer_pos = 0;
      m_is_playing = false;
      return false;
    }
  }
  return true;
}

// The static C-style callback that SDL understands
void sdl_player::audio_callback_c(void *userdata, Uint8 *stream, int len) {
  // Forward the call to the actual C++ member function
  static_cast<sdl_player *>(userdata)->audio_callback(stream, len);
}

// The member function that does the real work
void sdl_player::audio_callback(Uint8 *stream, int len) {
  std::unique_lock<std::mutex> lock(m_mutex);

  size_t bytes_to_copy = 0;

  if (m_buffer_pos < m_buffer.size()) {
    size_t bytes_remaining = (m_buffer.size() - m_buffer_pos) * sizeof(float);
    bytes_to_copy = std::min((size_t)len, bytes_remaining);

    memcpy(stream, (Uint8 *)m_buffer.data() + (m_buffer_pos * sizeof(float)),
           bytes_to_copy);
    m_buffer_pos += bytes_to_copy / sizeof(float);
  }

  // Done: release the buffer and wake the waiting thread
  if (m_buffer_pos >= m_buffer.size()) {
    m_buffer.clear();
    m_buffer_pos = 0;

    if (m_is_playing) {
      m_is_playing = false;
      lock.unlock();       // Unlock before notifying to avoid contention
      m_cond.notify_one();
    }
  }

  // Fill any remaining part of the SDL stream with silence
  if (bytes_to_copy < (size_t)len) {
    SDL_memset(stream + bytes_to_copy, 0, len - bytes_to_copy);
  }
}
