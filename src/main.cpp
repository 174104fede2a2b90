#include "engine/engine.hpp"
#include "clf/experiment.hpp"
#include "clf/registry.hpp"
#include "log.h"
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>

static int usage(const char* prog) {
  CLFLOG_E("usage: %s train <config.json>\n"
           "       %s eval <config.json> <checkpoint> [split]\n"
           "       %s models\n"
           "       %s serve [engine-config.json]", prog, prog, prog, prog);
  return 64;
}

static int trainCli(const std::string& cfg_path) {
  try {
    auto cfg = clf::ExperimentConfig::load(cfg_path);
    auto summary = clf::Experiment(cfg).run();
    CLFLOG_I("training finished: %s", summary.run_dir.c_str());
  } catch (const std::exception& e) {
    CLFLOG_E("training failed: %s", e.what());
    return 1;
  }
  return 0;
}

static int evalCli(const std::string& cfg_path, const std::string& ckpt, const std::string& split) {
  try {
    auto cfg = clf::ExperimentConfig::load(cfg_path);
    auto metrics = clf::evaluate_checkpoint(cfg, ckpt, split);
    printf("%s\n", metrics.to_json().dump(2).c_str());
  } catch (const std::exception& e) {
    CLFLOG_E("evaluation failed: %s", e.what());
    return 1;
  }
  return 0;
}

int main(int argc, char** argv) {
#ifdef _DEBUG
  start_log_thread();
  atexit(stop_log_thread);
#endif

  if (argc < 2) return usage(argv[0]);
  const std::string cmd = argv[1];

  if (cmd == "train") {
    if (argc != 3) return usage(argv[0]);
    return trainCli(argv[2]);
  }
  if (cmd == "eval") {
    if (argc != 4 && argc != 5) return usage(argv[0]);
    return evalCli(argv[2], argv[3], argc == 5 ? argv[4] : "test");
  }
  if (cmd == "models") {
    for (auto& name : clf::Registry::get().names())
      printf("%s (%lld px)\n", name.c_str(), (long long)clf::Registry::get().image_size(name));
    return 0;
  }
  if (cmd == "serve") {
    auto eng = engine::Engine::create();
    if (eng->loadConfig(argc > 2 ? argv[2] : "./config/engine-config.json") != engine::EngineState::Success) return 2;
    if (eng->init() != engine::EngineState::Success) return 3;
    auto ret = eng->run();
    eng->release();
    return ret == engine::EngineState::Success ? 0 : 4;
  }
  return usage(argv[0]);
}
