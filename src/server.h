#ifndef SERVER_H_
#define SERVER_H_

#include <string>
#include <utility>

#include <nlohmann/json.hpp>
#include <runbox/config.h>

// POST /run; returns (HTTP status, response body)
std::pair<int, nlohmann::json> HandleRunRequest(const std::string& body, const Config&);

// Blocks until the server stops; false if it cannot listen.
// Each request is served by its own worker of the HTTP thread pool.
bool ServeForever(const Config&);

#endif  // SERVER_H_
