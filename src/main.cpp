#include <cpptrace/cpptrace.hpp>
#include <chrono>
#include <filesystem>
#include <memory>

#include "command_line_parser.hpp"
#include "log.hpp"
#include "peer_manager.hpp"
#include "recorder.hpp"
#include "settings_manager.hpp"
#include "sync_engine.hpp"

int main(int argc, char** argv){
  try {
    SettingsManager settings;
    settings.set_settings_path(std::filesystem::current_path() / ".config" / "settings.json");
    settings.load();

    CommandLineParser parser((argc > 0 && argv && argv[0])
                               ? std::filesystem::path(argv[0]).filename().string()
                               : "pairsync");
    std::string error;
    if(!parser.parse(argc, argv, settings, error)) {
      print_err(nullptr, "{}", error);
      parser.usage();
      return 1;
    }
    if(settings.help_requested()) {
      parser.usage();
      return 0;
    }
    if(!settings.validate(error)) {
      print_err(nullptr, "{}", error);
      parser.usage();
      return 1;
    }

    init(settings.get<bool>("verbose"));
    auto logger = std::make_shared<Logger>("pairsync");
    for(const auto& key : settings.keys()) {
      logger->debug("{} = {}", key, settings.value_as_string(key));
    }

    if(settings.save_requested()) {
      if(!settings.save()) {
        logger->error("Unable to persist settings to {}", settings.settings_path().string());
      }
    }

    Recorder recorder(settings.get<std::string>("record_file"),
                      settings.get<std::string>("share_dir"),
                      std::make_shared<Logger>("recorder"));

    PeerManager::Options peer_options;
    peer_options.peer_host = settings.get<std::string>("peer_ip");
    peer_options.port = static_cast<uint16_t>(settings.get<int>("port"));
    peer_options.listen_ip = settings.get<std::string>("listen_ip");
    peer_options.accept_timeout = std::chrono::milliseconds(settings.get<int>("accept_timeout_ms"));
    peer_options.retry_delay = std::chrono::milliseconds(settings.get<int>("retry_delay_ms"));
    PeerManager peers(peer_options, std::make_shared<Logger>("peer"));
    peers.start();

    SyncEngine::Options engine_options;
    engine_options.receive_buffer_size = static_cast<std::size_t>(settings.get<int>("receive_buffer_size"));
    engine_options.round_interval = std::chrono::milliseconds(settings.get<int>("round_interval_ms"));
    SyncEngine engine(peers, recorder, engine_options, std::make_shared<Logger>("sync"));
    engine.run();

    return 0;
  } catch(std::exception& e) {
    init(false);
    Logger logger("pairsync");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
