#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#ifdef _WIN32
#include <fcntl.h>
#include <io.h>
#endif

#include "automation_protocol.pb.h"
#include "blueprint/blueprint_registry.hpp"
#include "command_outbox.hpp"
#include "config.hpp"
#include "engine/automation_engine.hpp"
#include "handlers.hpp"
#include "transport/framed_stdio.hpp"

static void set_binary_mode_stdio() {
#ifdef _WIN32
  _setmode(_fileno(stdin), _O_BINARY);
  _setmode(_fileno(stdout), _O_BINARY);
#endif
}

static void log_err(const std::string &msg) {
  std::cerr << "butler-automation: " << msg << "\n";
}

static void print_usage() {
  log_err("Usage: butler-automation --config <path/to/config.yaml>");
}

int main(int argc, char **argv) {
  GOOGLE_PROTOBUF_VERIFY_VERSION;

  std::optional<std::string> config_path;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else {
      log_err("WARNING: ignoring unknown argument '" + arg + "'");
    }
  }

  if (!config_path) {
    log_err("FATAL: --config argument is required");
    print_usage();
    return 1;
  }

  auto outbox = std::make_shared<handlers::CommandOutbox>();
  auto_blueprint::BlueprintRegistry blueprints;
  std::unique_ptr<auto_engine::AutomationEngine> engine;

  try {
    log_err("loading configuration from: " + *config_path);
    const auto config = butler_automation::load_config(*config_path);

    engine = std::make_unique<auto_engine::AutomationEngine>(
        config.engine, handlers::make_outbox_capabilities(outbox));
    engine->set_sun_events(
        butler_automation::sun_events_for(config, auto_core::Clock::now()));

    for (auto &automation :
         butler_automation::build_automations(config, blueprints)) {
      engine->register_automation(std::move(automation));
    }
    log_err("registered " + std::to_string(engine->list_automations().size()) +
            " automations, " + std::to_string(blueprints.list().size()) +
            " blueprints");
  } catch (const std::exception &e) {
    log_err("FATAL: Failed to load configuration: " + std::string(e.what()));
    return 1;
  }

  set_binary_mode_stdio();
  log_err("starting (transport=stdio+uint32_le)");
  engine->start();

  handlers::Runtime runtime{*engine, blueprints, outbox};
  std::string frame;
  std::string io_err;

  while (true) {
    const auto result = transport::read_frame(std::cin, frame, io_err);
    if (result == transport::ReadResult::Eof) {
      log_err("EOF on stdin; exiting cleanly");
      engine->stop();
      return 0;
    }
    if (result == transport::ReadResult::Error) {
      log_err("read_frame error: " + io_err);
      engine->stop();
      return 2;
    }

    butler::automation::v1::Request req;
    if (!req.ParseFromString(frame)) {
      log_err("failed to parse Request protobuf");
      engine->stop();
      return 3;
    }

    butler::automation::v1::Response resp;
    handlers::dispatch(runtime, req, resp);

    std::string resp_bytes;
    if (!resp.SerializeToString(&resp_bytes)) {
      log_err("failed to serialize Response protobuf");
      engine->stop();
      return 4;
    }

    if (!transport::write_frame(std::cout, resp_bytes, io_err)) {
      log_err("write_frame error: " + io_err);
      engine->stop();
      return 5;
    }
  }
}
