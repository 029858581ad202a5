#include "docqa_api/routes.hpp"

#include <ctime>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

#include "docqa_core/services/index_service.hpp"
#include "docqa_core/services/query_pipeline.hpp"

namespace docqa_api {

namespace {

// Client errors in the request body
class BadRequest : public std::exception {
 public:
  explicit BadRequest(const std::string &message) : message_(message) {}
  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

std::string format_time(const std::chrono::system_clock::time_point &tp) {
  std::time_t time = std::chrono::system_clock::to_time_t(tp);
  std::tm tm_utc{};
  gmtime_r(&time, &tm_utc);
  std::ostringstream ss;
  ss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%SZ");
  return ss.str();
}

}  // namespace

Routes::Routes(std::shared_ptr<docqa_core::QueryPipeline> query_pipeline,
               std::shared_ptr<docqa_core::IndexService> index_service)
    : query_pipeline_(query_pipeline), index_service_(index_service) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  // Health check endpoint
  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  // Question answering endpoint
  CROW_ROUTE(app, "/query").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_query(req);
  });

  // Index build trigger
  CROW_ROUTE(app, "/rebuild").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_rebuild(req);
  });

  // Manifest of the served index
  CROW_ROUTE(app, "/index")
  ([this](const crow::request &req) { return handle_index_info(req); });

  std::cout << "All routes registered successfully" << std::endl;
}

crow::response Routes::handle_health_check(const crow::request &req) {
  nlohmann::json response = create_success_response("DocQA API is running");
  response["version"] = "0.1.0";
  response["status"] = "healthy";
  response["index_loaded"] = index_service_->info().has_value();
  return create_json_response(response);
}

crow::response Routes::handle_query(const crow::request &req) {
  try {
    nlohmann::json body = parse_json_body(req.body);
    std::string question = body.value("question", "");
    if (question.empty()) {
      throw BadRequest("question is required");
    }
    docqa_core::QueryOptions options = extract_query_options(body);

    std::cout << "Query: " << question << " (top_k " << options.top_k << ", threshold "
              << options.similarity_threshold << ")" << std::endl;
    docqa_core::QueryResult result = query_pipeline_->query(question, options);
    return create_json_response(query_result_to_json(result));
  } catch (const BadRequest &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const nlohmann::json::exception &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const std::invalid_argument &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_query: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_rebuild(const crow::request &req) {
  try {
    std::string corpus_path;
    if (!req.body.empty()) {
      corpus_path = parse_json_body(req.body).value("corpus_path", "");
    }

    docqa_core::RebuildResult result = corpus_path.empty()
                                           ? index_service_->rebuild()
                                           : index_service_->rebuild(corpus_path);
    if (result.already_running) {
      return create_json_response(create_error_response(result.error_message), 409);
    }
    if (!result.success) {
      std::cerr << "Rebuild failed: " << result.error_message << std::endl;
      return create_json_response(rebuild_result_to_json(result), 500);
    }
    return create_json_response(rebuild_result_to_json(result));
  } catch (const nlohmann::json::exception &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_rebuild: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_index_info(const crow::request &req) {
  std::optional<docqa_core::IndexManifest> manifest = index_service_->info();
  if (!manifest) {
    return create_json_response(create_error_response("No index loaded"), 404);
  }
  return create_json_response(manifest_to_json(*manifest));
}

nlohmann::json Routes::query_result_to_json(const docqa_core::QueryResult &result) {
  nlohmann::json response;
  response["outcome"] = docqa_core::to_string(result.outcome());
  response["answer"] = result.answer;
  response["refused"] = result.refused;
  response["reason"] = docqa_core::to_string(result.reason);
  response["sources"] = result.sources;

  nlohmann::json retrieved = nlohmann::json::array();
  for (const auto &item : result.retrieved) {
    nlohmann::json chunk_json;
    chunk_json["chunk_id"] = item.chunk.id;
    chunk_json["source_path"] = item.chunk.source_path;
    chunk_json["section_heading"] = item.chunk.section_heading;
    chunk_json["start_offset"] = item.chunk.start_offset;
    chunk_json["end_offset"] = item.chunk.end_offset;
    chunk_json["score"] = item.score;
    chunk_json["text"] = item.chunk.text;
    retrieved.push_back(chunk_json);
  }
  response["retrieved"] = retrieved;
  response["context"] = result.context;
  if (!result.error.empty()) {
    response["error"] = result.error;
  }
  return response;
}

nlohmann::json Routes::manifest_to_json(const docqa_core::IndexManifest &manifest) {
  nlohmann::json response;
  response["generation"] = manifest.generation;
  response["embedding_model"] = manifest.embedding_model;
  response["dimension"] = manifest.dimension;
  response["chunk_count"] = manifest.chunk_count;
  response["corpus_fingerprint"] = manifest.corpus_fingerprint;
  response["built_at"] = format_time(manifest.built_at);
  nlohmann::json documents = nlohmann::json::array();
  for (const auto &document : manifest.documents) {
    documents.push_back({{"source_path", document.source_path},
                         {"content_hash", document.content_hash},
                         {"chunk_count", document.chunk_count}});
  }
  response["documents"] = documents;
  return response;
}

nlohmann::json Routes::rebuild_result_to_json(const docqa_core::RebuildResult &result) {
  nlohmann::json response;
  response["success"] = result.success;
  if (!result.success) {
    response["error"] = result.error_message;
    return response;
  }
  response["generation"] = result.generation;
  response["documents"] = result.document_count;
  response["skipped_documents"] = result.skipped_documents;
  response["chunks"] = result.chunk_count;
  response["dropped_chunks"] = result.dropped_chunks;
  return response;
}

docqa_core::QueryOptions Routes::extract_query_options(const nlohmann::json &body) {
  docqa_core::QueryOptions options = query_pipeline_->defaults();
  if (body.contains("top_k")) {
    options.top_k = body.at("top_k").get<int>();
  }
  if (body.contains("threshold")) {
    options.similarity_threshold = body.at("threshold").get<float>();
    if (options.similarity_threshold < -1.0f || options.similarity_threshold > 1.0f) {
      throw BadRequest("threshold must be within [-1, 1]");
    }
  }
  if (body.contains("context_budget")) {
    int budget = body.at("context_budget").get<int>();
    if (budget <= 0) {
      throw BadRequest("context_budget must be greater than 0");
    }
    options.context_budget_chars = static_cast<size_t>(budget);
  }
  return options;
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

nlohmann::json Routes::create_success_response(const std::string &message,
                                               const nlohmann::json &data) {
  nlohmann::json response;
  response["success"] = true;
  response["message"] = message;
  if (!data.is_null()) {
    response["data"] = data;
  }
  return response;
}

nlohmann::json Routes::create_error_response(const std::string &error) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error;
  return response;
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  return nlohmann::json::parse(body);
}

}  // namespace docqa_api
