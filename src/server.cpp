#include "server.h"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <runbox/execution.h>
#include <runbox/report.h>

namespace {

std::pair<int, nlohmann::json> BadRequest(std::string msg) {
  spdlog::info("Rejected request: {}", msg);
  return {400, {{"error", std::move(msg)}}};
}

} // namespace

std::pair<int, nlohmann::json> HandleRunRequest(const std::string& body, const Config& conf) {
  using nlohmann::json;
  json data = json::parse(body, nullptr, false);
  if (data.is_discarded()) return BadRequest("Invalid JSON body.");
  if (!data.is_object()) data = json::object();

  std::string code;
  if (auto it = data.find("code"); it != data.end()) {
    if (!it->is_string()) return BadRequest("Field 'code' must be a string.");
    code = it->get<std::string>();
  }
  if (std::string err = CheckSource(code, conf.max_source_chars); !err.empty()) {
    return BadRequest(std::move(err));
  }

  ExecutionResult res = Execute(code, conf.sandbox);
  return {ResultHttpStatus(res), ResultToJson(res, conf.sandbox)};
}

bool ServeForever(const Config& conf) {
  httplib::Server svr;
  svr.Post("/run", [&conf](const httplib::Request& req, httplib::Response& res) {
    auto [status, body] = HandleRunRequest(req.body, conf);
    res.status = status;
    // truncation may split a UTF-8 sequence
    res.set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                    "application/json");
  });
  svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
    spdlog::debug("{} {} {} -> {}", req.remote_addr, req.method, req.path, res.status);
  });
  spdlog::info("Listening on {}:{}", conf.host, conf.port);
  if (!svr.listen(conf.host.c_str(), conf.port)) {
    spdlog::error("Failed to listen on {}:{}", conf.host, conf.port);
    return false;
  }
  return true;
}
