#pragma once

#include "clf/catalog.hpp"
#include "clf/checkpoint.hpp"
#include "clf/config.hpp"
#include "clf/dataset.hpp"
#include "clf/epoch_runner.hpp"
#include "clf/experiment.hpp"
#include "clf/metrics.hpp"
#include "clf/model_base.hpp"
#include "clf/registry.hpp"
#include "clf/running_statistic.hpp"
#include "clf/telemetry.hpp"
#include "clf/topk.hpp"
#include "clf/transforms/image_transforms.hpp"

#include <torch/torch.h>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <random>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

extern int testsPassed;
extern int testsFailed;

#define CHECK(cond, msg) do { \
  if (!(cond)) { \
    std::cerr << "FAIL: " << msg << " (" << __FILE__ << ":" << __LINE__ << ")" << std::endl; \
    testsFailed++; \
  } else { \
    testsPassed++; \
  } \
} while(0)

#define CHECK_NEAR(a, b, tol, msg) CHECK(std::fabs((a) - (b)) < (tol), msg)

#define CHECK_THROWS(expr, msg) do { \
  bool threw = false; \
  try { expr; } catch (...) { threw = true; } \
  CHECK(threw, msg); \
} while(0)

#define CHECK_THROWS_AS(expr, type, msg) do { \
  bool threw = false; \
  try { expr; } catch (const type&) { threw = true; } catch (...) {} \
  CHECK(threw, msg); \
} while(0)

// Scratch directory removed on scope exit.
struct TempDir {
  std::filesystem::path path;
  explicit TempDir(const std::string& tag) {
    std::random_device rd;
    path = std::filesystem::temp_directory_path() /
           ("clf_" + tag + "_" + std::to_string(rd()));
    std::filesystem::create_directories(path);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  std::string str(const std::string& rel = "") const { return (path / rel).string(); }
};

// Returns its input as the class scores, so tests control outputs exactly.
struct IdentityModel : public clf::IModel {
  torch::Tensor bias;
  IdentityModel() { bias = register_parameter("bias", torch::zeros({1})); }
  torch::Tensor forward(torch::Tensor x) override { return x + bias; }
  std::vector<torch::Tensor> head_parameters() override { return {bias}; }
};
