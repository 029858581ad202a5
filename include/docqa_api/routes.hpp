#pragma once
#include <memory>
#include <nlohmann/json.hpp>

#include "server.hpp"

// Forward declarations
namespace docqa_core {
class QueryPipeline;
class IndexService;
struct QueryOptions;
struct QueryResult;
struct IndexManifest;
struct RebuildResult;
}  // namespace docqa_core

namespace docqa_api {

class Routes {
 public:
  Routes(std::shared_ptr<docqa_core::QueryPipeline> query_pipeline,
         std::shared_ptr<docqa_core::IndexService> index_service);
  ~Routes() = default;

  // Disable copy constructor and assignment
  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  // Register all routes with the server
  void register_routes(Server &server);

  // Route handlers, callable without a running server
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_query(const crow::request &req);
  crow::response handle_rebuild(const crow::request &req);
  crow::response handle_index_info(const crow::request &req);

  static nlohmann::json query_result_to_json(const docqa_core::QueryResult &result);
  static nlohmann::json manifest_to_json(const docqa_core::IndexManifest &manifest);
  static nlohmann::json rebuild_result_to_json(const docqa_core::RebuildResult &result);

 private:
  std::shared_ptr<docqa_core::QueryPipeline> query_pipeline_;
  std::shared_ptr<docqa_core::IndexService> index_service_;

  // Helper methods
  nlohmann::json parse_json_body(const std::string &body);
  docqa_core::QueryOptions extract_query_options(const nlohmann::json &body);
  nlohmann::json create_success_response(const std::string &message,
                                         const nlohmann::json &data = nlohmann::json{});
  nlohmann::json create_error_response(const std::string &error);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
};

}  // namespace docqa_api
