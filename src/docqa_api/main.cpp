#include <atomic>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>

#include "docqa_api/config.hpp"
#include "docqa_api/routes.hpp"
#include "docqa_api/server.hpp"
#include "docqa_core/index/index_registry.hpp"
#include "docqa_core/llm/ollama_client.hpp"
#include "docqa_core/services/index_service.hpp"
#include "docqa_core/services/query_pipeline.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

// The signal handler function
void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();  // Wake up the main thread
}

int main(int argc, char* argv[]) {
  try {
    const char* config_env = std::getenv("DOCQA_CONFIG");
    std::string config_path = argc > 1 ? argv[1] : (config_env ? config_env : "docqarc.json");
    Config config = Config::from_file(config_path);

    std::cout << "Starting DocQA API Server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Corpus Directory: " << config.corpus_dir << std::endl;
    std::cout << "Index Directory: " << config.index_dir << std::endl;
    std::cout << "Ollama URL: " << config.ollama_url << std::endl;
    std::cout << "Embedding Model: " << config.embedding_model << std::endl;
    std::cout << "Generation Model: " << config.generation_model << std::endl;
    std::cout << "Similarity Threshold: " << config.similarity_threshold << std::endl;

    // --- 1. INITIALIZE CORE COMPONENTS ---
    if (!docqa_core::configure_ollama(config.ollama_settings())) {
      std::cerr << "Warning: Ollama is not reachable at " << config.ollama_url
                << "; queries will be refused until it is." << std::endl;
    }
    auto embedder = std::make_shared<docqa_core::OllamaEmbeddingGateway>(
        config.embedding_model, config.query_prefix, config.passage_prefix);
    auto generator = std::make_shared<docqa_core::OllamaGenerationGateway>(
        config.generation_model, config.generation_max_tokens, config.generation_seed);

    auto registry = std::make_shared<docqa_core::IndexRegistry>();
    auto index_service =
        std::make_shared<docqa_core::IndexService>(*registry, *embedder, config.index_options());
    auto query_pipeline = std::make_shared<docqa_core::QueryPipeline>(
        *registry, *embedder, *generator, docqa_core::RefusalPolicy(config.refusal_options()),
        config.query_defaults());

    if (!index_service->load_existing() && config.build_on_startup) {
      std::cout << "Building initial index from " << config.corpus_dir << "..." << std::endl;
      docqa_core::RebuildResult result = index_service->rebuild();
      if (!result.success) {
        std::cerr << "Warning: Initial build failed: " << result.error_message << std::endl;
      }
    }

    docqa_api::Server server(config.api_base_url, static_cast<unsigned>(config.server_threads));
    docqa_api::Routes routes(query_pipeline, index_service);
    routes.register_routes(server);

    // --- 2. START SERVING ---
    std::cout << "Disabling Crow's internal signal handling..." << std::endl;
    server.get_app().signal_clear();

    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    // --- 3. WAIT FOR SHUTDOWN SIGNAL ---
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    // --- 4. GRACEFUL SHUTDOWN SEQUENCE ---
    std::cout << "[1/1] Stopping API server; in-flight queries finish on their snapshot..."
              << std::endl;
    server.stop();

    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
