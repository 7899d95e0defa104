#pragma once
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

// Error object returned by the node ({"error":{"code":..,"message":..}}).
class RpcError : public std::runtime_error {
public:
  RpcError(int code, const std::string& message)
    : std::runtime_error("rpc error " + std::to_string(code) + ": " + message), code_(code) {}
  int code() const { return code_; }
private:
  int code_;
};

namespace JsonRpcUtil {
  std::string BuildRequest(const std::string& method, const nlohmann::json& params, int id = 1);
  // Returns the "result" member; throws RpcError on an error object and
  // std::runtime_error on malformed bodies.
  nlohmann::json ExtractResult(const std::string& json_body);
}
