/**
 * @file main.cpp
 * @brief ClipSync daemon entry point
 *
 * Usage: clipsyncd [config.json]
 */

#include <clipsync/clipsync.h>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

namespace {

volatile std::sig_atomic_t g_stop = 0;

void handle_signal(int) { g_stop = 1; }

} // namespace

int main(int argc, char *argv[]) {
  if (argc > 2) {
    std::cerr << "Usage: " << argv[0] << " [config.json]" << std::endl;
    return 2;
  }

  clipsync::ConfigManager config_manager;
  auto loaded = config_manager.init(argc == 2 ? argv[1] : "");
  if (loaded.is_error()) {
    std::cerr << "clipsyncd: " << loaded.error().to_string() << std::endl;
    return 1;
  }

  clipsync::ClipSync app;
  auto initialized = app.init(config_manager.get());
  if (initialized.is_error()) {
    std::cerr << "clipsyncd: " << initialized.error().to_string() << std::endl;
    return 1;
  }

  app.on_device_discovered([](const clipsync::DeviceInfo &device) {
    CLIPSYNC_LOG_INFO("clipsyncd", "Syncing with " + device.name);
  });

  std::signal(SIGINT, handle_signal);
  std::signal(SIGTERM, handle_signal);

  auto started = app.start();
  if (started.is_error()) {
    std::cerr << "clipsyncd: " << started.error().to_string() << std::endl;
    return 1;
  }

  CLIPSYNC_LOG_INFO("clipsyncd",
                    std::string("ClipSync ") + clipsync::VERSION_STRING +
                        " running as " + app.get_local_device().name);

  while (!g_stop) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  app.stop();
  return 0;
}
