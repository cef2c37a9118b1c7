#include <cstdlib>
#include <iostream>
#include <filesystem>

#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <runbox/config.h>
#include <runbox/execution.h>
#include <runbox/logger.h>
#include <runbox/paths.h>
#include "server.h"

namespace {

Config ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "runbox-server");
  parser.add_argument("-c", "--config")
    .required().default_value(std::string("/etc/runbox.conf"))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-p", "--port")
    .scan<'d', int>()
    .help("Port to listen on");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  Config conf;
  fs::path config_file = parser.get<std::string>("--config");
  if (!LoadConfig(config_file, conf)) {
    spdlog::error("Failed to parse configuration file {}", std::string(config_file));
    exit(1);
  }
  if (auto val = parser.present<int>("--port")) {
    conf.port = val.value();
  }
  if (!ValidateConfig(conf)) exit(1);
  return conf;
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  InitLogger();
  const Config conf = ParseArgs(argc, argv);
  if (!RuntimeAvailable(conf.sandbox)) {
    spdlog::warn("Container runtime {} is not responding; runs will fail until it is", conf.sandbox.runtime);
  }
  spdlog::info("Sandbox image {} inner timeout {}s outer timeout {}s workspaces in {}",
               conf.sandbox.image, conf.sandbox.inner_timeout, conf.sandbox.outer_timeout,
               kWorkspaceRoot.c_str());
  return ServeForever(conf) ? 0 : 1;
}
