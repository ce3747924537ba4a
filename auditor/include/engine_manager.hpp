#pragma once

#include "audit_errors.hpp"
#include "tts_lib.hpp"
#include <SDL.h>
#include <cstdio>
#include <string>

// Owns SDL and the one speech engine for the lifetime of the process.
// Construction either yields a ready engine at unity gain or throws InitError.
class EngineManager {
public:
    explicit EngineManager(const EngineConfig &config = EngineConfig::defaults())
        : m_tts(config) {
        if (!m_tts.is_initialized()) {
            throw InitError(m_tts.init_error());
        }

        m_tts.set_volume(1.0f);

        printf("Speech engine ready.\n");
    }

    TTSEngine& get_tts() { return m_tts; }

private:
    class SDLInitializer {
    public:
        // Audio for the player, events for the interface loop
        SDLInitializer() {
            if (SDL_Init(SDL_INIT_AUDIO | SDL_INIT_EVENTS) < 0) {
                throw InitError("SDL_Init failed: " + std::string(SDL_GetError()));
            }
        }
        ~SDLInitializer() {
            SDL_Quit();
        }
    };

    // sdl must come up before the engine opens its device;
    // destructors are called in the reverse order
    SDLInitializer m_sdl_initializer;

    TTSEngine m_tts;
};
