#include "api/api_server.hpp"
#include "api/handler/handler_base.hpp"
#include "clf/experiment.hpp"
#include "clf/registry.hpp"
#include "log.h"
#include <nlohmann/json.hpp>

using nlohmann::json;

namespace engine {

ApiServer::ApiServer(const std::string& ip, int port, const std::string& run_root)
    : ip_(ip), port_(port), run_root_(run_root) {}

void ApiServer::init() {
  registerRoutes();
  CLFLOG_I("Crow API initialized at %s:%d", ip_.c_str(), port_);
}

void ApiServer::start() {
  app_.signal_clear();
  app_.bindaddr(ip_).port(port_).multithreaded().run();
}

void ApiServer::stop() { app_.stop(); }

void ApiServer::addRoute(const std::string& path, crow::HTTPMethod method, Handler h) {
  app_.route_dynamic(path).methods(method)([h](const crow::request& req){ return h(req); });
  CLFLOG_I("Route: [%s] %s", crow::method_name(method).c_str(), path.c_str());
}

void ApiServer::registerRoutes() {
  addRoute("/health", crow::HTTPMethod::Get, [this](auto& r){ return health(r); });
  addRoute("/models", crow::HTTPMethod::Get, [this](auto& r){ return listModels(r); });
  addRoute("/train", crow::HTTPMethod::Post, [this](auto& r){ return train(r); });
}

crow::response ApiServer::health(const crow::request&) {
  return handler::jsonResp(handler::StatusCode::_200, {{"status","ok"},{"service","clf-engine"}});
}

crow::response ApiServer::listModels(const crow::request&) {
  json models = json::array();
  for (auto& name : clf::Registry::get().names())
    models.push_back({{"name", name}, {"image_size", clf::Registry::get().image_size(name)}});
  return handler::jsonResp(handler::StatusCode::_200, {{"models", models}});
}

crow::response ApiServer::train(const crow::request& req) {
  json body = json::parse(req.body, nullptr, false);
  if (body.is_discarded()) return handler::msg(handler::StatusCode::_400, "invalid json");

  std::unique_lock<std::mutex> lock(run_mu_, std::try_to_lock);
  if (!lock.owns_lock()) return handler::msg(handler::StatusCode::_409, "a run is already in progress");

  try {
    if (!body.contains("run_root")) body["run_root"] = run_root_;
    auto cfg = clf::ExperimentConfig::from_json(body);
    auto summary = clf::Experiment(cfg).run();

    json best = nullptr;
    if (summary.best) best = {{"epoch", summary.best->epoch}, {"val_acc", summary.best->val_accuracy}};
    return handler::jsonResp(handler::StatusCode::_200, {
      {"status", "ok"},
      {"run_dir", summary.run_dir},
      {"seed", summary.seed},
      {"best", best},
      {"hparams", summary.hparams},
      {"metrics", summary.metrics}
    });
  } catch (const std::exception& e) {
    CLFLOG_E("train request failed: %s", e.what());
    return handler::error(e);
  }
}

} // namespace engine
