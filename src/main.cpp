#include <asio.hpp>
#include <cpptrace/cpptrace.hpp>

#include <csignal>
#include <filesystem>
#include <memory>

#include "SyncCLI.hpp"
#include "command_line_parser.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "sync_coordinator.hpp"

namespace {

// Blocks until SIGINT or SIGTERM.
void wait_for_signal(Logger& logger) {
  asio::io_context io;
  asio::signal_set signals(io, SIGINT, SIGTERM);
  signals.async_wait([&logger](const std::error_code& ec, int signal_number){
    if(!ec) logger.info("Signal {} received, shutting down", signal_number);
  });
  io.run();
}

} // namespace

int main(int argc, char** argv){
  try {
    auto settings = std::make_shared<SettingsManager>();
    const auto config_root = std::filesystem::current_path() / ".config";
    settings->set_settings_path(config_root / "settings.json");
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "clipsync");
    std::string error;
    if(!parser.parse(argc, argv, *settings, error)) {
      print_err(nullptr, "{}", error);
      parser.usage();
      return 1;
    }
    if(settings->help_requested()) {
      parser.usage();
      return 0;
    }

    LogOptions log_options;
    log_options.verbose = settings->get<bool>("verbose");
    log_options.file = SettingsManager::trim_copy(settings->get<std::string>("log_file"));
    init(log_options);

    if(settings->save_requested()) {
      if(!settings->save()) {
        log_error(nullptr, "Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    auto options = load_sync_options(*settings);
    auto logger = std::make_shared<Logger>(options.identity.name);
    logger->debug("Verbose logging enabled");

    auto coordinator = std::make_shared<SyncCoordinator>(options, logger);
    auto clipboard = std::make_shared<ConsoleClipboard>();
    coordinator->set_image_store(std::make_shared<DirectoryImageStore>(config_root / "images"));
    coordinator->attach_monitor(clipboard, settings->get<bool>("apply_remote"));

    coordinator->start();

    if(settings->get<bool>("interactive")) {
      SyncCLI cli(coordinator, settings, clipboard);
      cli.run();
    } else {
      logger->print("Syncing as {} over {}; press Ctrl+C to stop",
                    options.identity.id(), transport_kind_name(options.transport));
      wait_for_signal(*logger);
    }

    coordinator->stop();
    return 0;
  } catch(std::exception& e) {
    init(false);
    Logger logger("clipsync-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
