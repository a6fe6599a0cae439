#pragma once
#include "Errors.hpp"
#include "JsonCodec.hpp"
#include "ServiceFacade.hpp"
#include <atomic>
#include <cstdint>
#include <json/json.h>
#include <string>

namespace CropAdvisor {

struct RouterResponse {
    int status{200};
    Json::Value payload;  // {"status": ..., "body": ...} or {"status": ..., "error": ...}
};

int statusFor(ErrorKind kind);

// JSON-lines boundary used by the proxy: one {"op", "body"} request per line,
// one response object per line.
class RequestRouter {
public:
    explicit RequestRouter(ServiceFacade& facade) : facade(facade) {}

    RouterResponse route(const std::string& op, const Json::Value& body);
    // Parses one request line; the payload echoes the request "id" when present.
    RouterResponse handle(const std::string& line);
    std::string handleLine(const std::string& line) { return writeLine(handle(line).payload); }

    std::uint32_t predictionsServed() const { return served.load(); }
    std::uint32_t requestErrors() const { return failed.load(); }

private:
    Json::Value dispatch(const std::string& op, const Json::Value& body, int& status);
    RouterResponse failure(int status, const std::string& type, const std::string& message,
                           const std::string& field = std::string());

    ServiceFacade& facade;
    std::atomic<std::uint32_t> served{0};
    std::atomic<std::uint32_t> failed{0};
};

}  // namespace CropAdvisor
