#include "engine/engine.hpp"
#include "api/api_server.hpp"
#include "log.h"
#include <csignal>
#include <atomic>
#include <filesystem>
#include <thread>
#include <chrono>

static std::atomic<bool> g_exit{false};
static void onSignal(int s){ CLFLOG_W("signal %d", s); g_exit=true; }

namespace engine {

std::unique_ptr<Engine> Engine::create(){ return std::make_unique<Engine>(); }
Engine::~Engine() = default;

EngineState Engine::loadConfig(const std::string& path) {
  if (!std::filesystem::exists(path)) {
    CLFLOG_W("engine config %s not found, using defaults (%s:%d)", path.c_str(), cfg_.host.c_str(), cfg_.port);
    return EngineState::Success;
  }
  try {
    cfg_ = clf::EngineConfig::load(path);
  } catch (const std::exception& e) {
    CLFLOG_E("engine config %s: %s", path.c_str(), e.what());
    return EngineState::ConfigError;
  }
  return EngineState::Success;
}

EngineState Engine::init() {
  try {
    api_ = std::make_unique<ApiServer>(cfg_.host, cfg_.port, cfg_.run_root);
    api_->init();
  } catch (const std::exception& e) {
    CLFLOG_E("engine init: %s", e.what());
    return EngineState::InitError;
  }
  return EngineState::Success;
}

EngineState Engine::run() const {
  if (!api_) return EngineState::RunError;
  std::signal(SIGINT, onSignal);
  std::signal(SIGTERM, onSignal);
  std::thread t([this](){ api_->start(); });

  while(!g_exit) std::this_thread::sleep_for(std::chrono::milliseconds(200));

  api_->stop();
  if (t.joinable()) t.join();
  return EngineState::Success;
}

EngineState Engine::release() {
  api_.reset();
  return EngineState::Success;
}

} // namespace engine
