#include <cpptrace/cpptrace.hpp>

#include <cstring>
#include <filesystem>
#include <unistd.h>

#include "command_line_parser.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "snap_engine.hpp"

std::string get_host_display_name() {
  char hostname[256];
  if(gethostname(hostname, sizeof(hostname)) != 0) {
    std::strcpy(hostname, "snapsend-device");
  }
  hostname[sizeof(hostname) - 1] = '\0';
  return hostname;
}

int main(int argc, char** argv){
  try {
    SnapEngine::Options options;
    options.workspace_root = std::filesystem::current_path();
    options.start_cli_thread = true;
    options.handle_signals = true;
    options.display_name = get_host_display_name();

    SnapEngine engine(nullptr, options);
    auto settings = engine.settings();
    settings->set_settings_path(options.workspace_root / ".config" / "settings.json");
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "snapsend");
    std::string error;
    if(!parser.parse(argc, argv, *settings, error)) {
      init(false);
      print_err(nullptr, "{}", error);
      parser.usage();
      return 2;
    }
    if(settings->help_requested()) {
      parser.usage();
      return 0;
    }

    auto logger = engine.logger();
    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    engine.start();
    logger->print("snapsend {} mode as '{}' ({}), type 'help' for commands",
                  SnapEngine::to_string(engine.mode()), engine.display_name(), engine.stable_id());
    engine.run();
    engine.stop();

    return 0;
  } catch(std::exception& e) {
    init(false);
    Logger logger("snapsend-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
