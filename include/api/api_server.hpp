#pragma once
#include <crow.h>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace engine {

class ApiServer {
public:
  using Handler = std::function<crow::response(const crow::request&)>;

  ApiServer(const std::string& ip, int port, const std::string& run_root);
  void init();
  void start();
  void stop();

private:
  void registerRoutes();
  void addRoute(const std::string& path, crow::HTTPMethod method, Handler h);

  // --- route handlers ---
  crow::response health(const crow::request&);
  crow::response listModels(const crow::request&);
  crow::response train(const crow::request&);

private:
  crow::SimpleApp app_;
  std::string ip_;
  int port_;
  std::string run_root_;
  std::mutex run_mu_;    // one experiment at a time: they share the global torch RNG
};

} // namespace engine
