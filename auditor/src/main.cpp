#include "audit_console.hpp"
#include "audit_coordinator.hpp"
#include "engine_manager.hpp"
#include "sdl_dispatcher.hpp"
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

// Upper bound on how long a task can sit queued without a wake-up event.
constexpr int kIdlePassMs = 250;

// Blocking stdin reads happen here; every line is handed to the
// interface loop. The thread is left behind at exit.
void start_stdin_reader(std::shared_ptr<SdlDispatcher> dispatcher,
                        AuditConsole &console) {
  std::thread([dispatcher, &console] {
    std::string line;
    while (std::getline(std::cin, line)) {
      dispatcher->post([&console, line] { console.handle_line(line); });
    }
    dispatcher->post([&console] { console.request_quit(); });
  }).detach();
}

}

int main() {
  std::unique_ptr<EngineManager> manager;
  try {
    manager = std::make_unique<EngineManager>();
  } catch (const InitError &e) {
    // No point showing an interface that cannot speak
    fprintf(stderr, "Kernel Error: TTS Engine failed: %s\n", e.what());
    return EXIT_FAILURE;
  }

  std::shared_ptr<SdlDispatcher> dispatcher;
  try {
    dispatcher = std::make_shared<SdlDispatcher>();
  } catch (const std::runtime_error &e) {
    fprintf(stderr, "ERROR: %s\n", e.what());
    return EXIT_FAILURE;
  }

  AuditConsole console(std::cout, std::cerr);
  AuditCoordinator coordinator(manager->get_tts(), *dispatcher, console);
  console.attach(coordinator);

  console.print_banner();
  start_stdin_reader(dispatcher, console);

  while (!console.quit_requested()) {
    SDL_Event ev;
    if (!SDL_WaitEventTimeout(&ev, kIdlePassMs)) {
      dispatcher->run_pending();
      continue;
    }
    if (ev.type == SDL_QUIT) {
      break;
    }
    dispatcher->dispatch(ev);
  }

  // A run cannot be interrupted; leave it behind rather than wait on it.
  if (coordinator.is_running()) {
    printf("Closing with an audit in progress.\n");
    fflush(stdout);
    std::quick_exit(EXIT_SUCCESS);
  }

  return EXIT_SUCCESS;
}
