#include "utils/json_rpc.hpp"

using json = nlohmann::json;

namespace JsonRpcUtil {
  std::string BuildRequest(const std::string& method, const json& params, int id) {
    json req = { {"jsonrpc", "2.0"}, {"method", method}, {"params", params}, {"id", id} };
    return req.dump();
  }

  json ExtractResult(const std::string& body) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) throw std::runtime_error("malformed JSON-RPC response");
    if (j.contains("error") && !j["error"].is_null()) {
      const auto& err = j["error"];
      int code = err.value("code", 0);
      std::string msg = err.contains("message") && err["message"].is_string() ? err["message"].get<std::string>() : err.dump();
      throw RpcError(code, msg);
    }
    if (!j.contains("result")) throw std::runtime_error("missing result");
    return j["result"];
  }
}
