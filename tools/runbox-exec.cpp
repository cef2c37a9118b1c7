// Run one source file through the sandbox and print the result as the HTTP service would

#include <fstream>
#include <iostream>
#include <sstream>

#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <runbox/config.h>
#include <runbox/execution.h>
#include <runbox/logger.h>
#include <runbox/report.h>

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  InitLogger();
  int verbosity = 0;
  argparse::ArgumentParser parser("runbox-exec");
  parser.add_argument("source")
    .help("Source file to run; - for stdin");
  parser.add_argument("-c", "--config")
    .help("Path of configuration file (defaults are used if omitted)");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    return 1;
  }
  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }

  Config conf;
  if (auto path = parser.present("--config")) {
    if (!LoadConfig(*path, conf)) {
      spdlog::error("Failed to parse configuration file {}", *path);
      return 1;
    }
  }
  if (!ValidateConfig(conf)) return 1;

  std::string source_path = parser.get<std::string>("source");
  std::stringstream buf;
  if (source_path == "-") {
    buf << std::cin.rdbuf();
  } else {
    std::ifstream fin(source_path, std::ios::binary);
    if (!fin) {
      spdlog::error("Cannot open {}", source_path);
      return 1;
    }
    buf << fin.rdbuf();
  }

  std::string source = buf.str();
  if (std::string err = CheckSource(source, conf.max_source_chars); !err.empty()) {
    std::cout << nlohmann::json({{"error", err}}).dump(2) << std::endl;
    return 1;
  }
  ExecutionResult res = Execute(source, conf.sandbox);
  std::cout << ResultToJson(res, conf.sandbox).dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
            << std::endl;
  return ResultHttpStatus(res) == 200 ? 0 : 2;
}
