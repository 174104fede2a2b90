#include "test_helpers.hpp"

namespace {

// Records the model/autograd configuration seen by every forward call.
struct ProbeModel : public clf::IModel {
  torch::nn::Linear body{nullptr};
  torch::nn::Linear fc{nullptr};
  std::vector<bool> training_seen;
  std::vector<bool> grad_seen;

  ProbeModel() {
    body = register_module("body", torch::nn::Linear(4, 8));
    fc = register_module("fc", torch::nn::Linear(8, 3));
  }
  torch::Tensor forward(torch::Tensor x) override {
    training_seen.push_back(is_training());
    grad_seen.push_back(torch::GradMode::is_enabled());
    return fc->forward(torch::relu(body->forward(x)));
  }
  std::vector<torch::Tensor> head_parameters() override { return fc->parameters(); }
};

struct CountingSGD : public torch::optim::SGD {
  int steps = 0;
  CountingSGD(std::vector<torch::Tensor> params, double lr)
      : torch::optim::SGD(std::move(params), torch::optim::SGDOptions(lr)) {}
  torch::Tensor step(LossClosure closure = nullptr) override {
    ++steps;
    return torch::optim::SGD::step(closure);
  }
};

std::vector<torch::data::Example<>> makeBatches(const std::vector<int64_t>& sizes) {
  std::vector<torch::data::Example<>> batches;
  for (auto n : sizes) batches.push_back({torch::randn({n, 4}), torch::randint(0, 3, {n}, torch::kLong)});
  return batches;
}

bool allEqual(const std::vector<bool>& v, bool value) {
  for (bool b : v) if (b != value) return false;
  return !v.empty();
}

} // namespace

//===================================================================================================================//

static void testTrainStepsOncePerBatch() {
  std::cout << "--- testTrainStepsOncePerBatch ---" << std::endl;

  torch::manual_seed(1);
  auto model = std::make_shared<ProbeModel>();
  CountingSGD opt(model->parameters(), 0.01);
  auto loss = clf::make_loss(false);
  auto batches = makeBatches({4, 4, 2});

  clf::EpochRunner runner(model, torch::kCPU, {1, 2});
  auto m = runner.run(clf::Mode::Train, batches, &loss, &opt);

  CHECK(opt.steps == 3, "one optimizer step per batch");
  CHECK(runner.steps_taken() == 3, "runner counts the same steps");
  CHECK(allEqual(model->training_seen, true), "train mode uses training behavior");
  CHECK(allEqual(model->grad_seen, true), "train mode tracks gradients");
  CHECK(m.loss().has_value(), "loss reported");

  auto items = m.items();
  CHECK(items.size() == 3, "loss + two accuracies");
  CHECK(items[0].first == "loss", "loss first");
  CHECK(items[1].first == "acc_top1", "acc_top1 second");
  CHECK(items[2].first == "acc_top2", "acc_top2 third");
  CHECK(m.acc_top(2) >= m.acc_top(1), "top-2 accuracy >= top-1");
}

//===================================================================================================================//

static void testEvalNeverSteps() {
  std::cout << "--- testEvalNeverSteps ---" << std::endl;

  torch::manual_seed(2);
  auto model = std::make_shared<ProbeModel>();
  auto before = model->fc->weight.clone();
  auto loss = clf::make_loss(false);
  auto batches = makeBatches({5, 5});

  clf::EpochRunner runner(model, torch::kCPU, {1});
  auto m = runner.run(clf::Mode::Eval, batches, &loss);

  CHECK(runner.steps_taken() == 0, "eval takes no optimizer step");
  CHECK(allEqual(model->training_seen, false), "eval uses inference behavior");
  CHECK(allEqual(model->grad_seen, false), "eval disables gradients");
  CHECK(torch::equal(before, model->fc->weight), "parameters untouched");
  CHECK(m.loss().has_value(), "loss measured in eval when supplied");
}

//===================================================================================================================//

static void testEvalWithoutLoss() {
  std::cout << "--- testEvalWithoutLoss ---" << std::endl;

  auto model = std::make_shared<ProbeModel>();
  auto batches = makeBatches({3});
  clf::EpochRunner runner(model, torch::kCPU, {1, 3});
  auto m = runner.run(clf::Mode::Eval, batches, nullptr);

  CHECK(!m.loss().has_value(), "no loss entry without a loss function");
  CHECK(m.items().size() == 2, "only accuracies");
  CHECK_NEAR(m.acc_top(3), 100.0, 1e-9, "top-3 of 3 classes is always right");
}

//===================================================================================================================//

static void testModeArgumentChecks() {
  std::cout << "--- testModeArgumentChecks ---" << std::endl;

  auto model = std::make_shared<ProbeModel>();
  CountingSGD opt(model->parameters(), 0.01);
  auto loss = clf::make_loss(false);
  auto batches = makeBatches({2});
  clf::EpochRunner runner(model, torch::kCPU, {1});

  CHECK_THROWS_AS(runner.run(clf::Mode::Train, batches, &loss, nullptr), std::invalid_argument,
                  "train without optimizer throws");
  CHECK_THROWS_AS(runner.run(clf::Mode::Train, batches, nullptr, &opt), std::invalid_argument,
                  "train without loss throws");
  CHECK_THROWS_AS(runner.run(clf::Mode::Eval, batches, &loss, &opt), std::invalid_argument,
                  "eval with optimizer throws");
  CHECK(opt.steps == 0, "rejected runs take no step");
  CHECK_THROWS_AS((void)clf::EpochRunner(model, torch::kCPU, {}), std::invalid_argument, "empty k set throws");
}

//===================================================================================================================//

static void testWeightedAggregation() {
  std::cout << "--- testWeightedAggregation ---" << std::endl;

  auto model = std::make_shared<IdentityModel>();
  std::vector<torch::data::Example<>> batches;
  batches.push_back({torch::tensor({{0.1f, 0.9f}, {0.8f, 0.2f}}), torch::tensor({1, 0}, torch::kLong)});
  batches.push_back({torch::tensor({{0.9f, 0.1f}}), torch::tensor({1}, torch::kLong)});

  auto loss = clf::make_loss(false);
  clf::EpochRunner runner(model, torch::kCPU, {1, 2});
  auto m = runner.run(clf::Mode::Eval, batches, &loss);

  CHECK_NEAR(m.acc_top(1), 200.0 / 3.0, 1e-9, "top-1 weighted by batch size");
  CHECK_NEAR(m.acc_top(2), 100.0, 1e-9, "top-2 all correct");

  const double l1 = torch::nn::functional::cross_entropy(batches[0].data, batches[0].target).item<double>();
  const double l2 = torch::nn::functional::cross_entropy(batches[1].data, batches[1].target).item<double>();
  CHECK_NEAR(*m.loss(), (2.0 * l1 + 1.0 * l2) / 3.0, 1e-6, "loss weighted by batch size");
}

//===================================================================================================================//

static void testNonFiniteLossAborts() {
  std::cout << "--- testNonFiniteLossAborts ---" << std::endl;

  auto model = std::make_shared<IdentityModel>();
  CountingSGD opt(model->parameters(), 0.01);
  std::vector<torch::data::Example<>> batches;
  batches.push_back({torch::tensor({{std::nanf(""), 0.5f}}), torch::tensor({0}, torch::kLong)});
  batches.push_back({torch::tensor({{0.1f, 0.5f}}), torch::tensor({0}, torch::kLong)});

  auto loss = clf::make_loss(false);
  clf::EpochRunner runner(model, torch::kCPU, {1});
  CHECK_THROWS_AS(runner.run(clf::Mode::Train, batches, &loss, &opt), std::runtime_error,
                  "NaN loss aborts the pass");
  CHECK(opt.steps == 0, "no step taken on the NaN batch");
}

//===================================================================================================================//

static void testFinetuneKeepsInferenceBehavior() {
  std::cout << "--- testFinetuneKeepsInferenceBehavior ---" << std::endl;

  torch::manual_seed(4);
  clf::ExperimentConfig cfg;
  cfg.model_name = "cnn_small";
  cfg.finetune = true;
  auto handle = clf::build_model(cfg, 3);

  CHECK(handle.trainable.size() == handle.model->head_parameters().size(), "only head parameters are trainable");
  size_t frozen = 0;
  for (auto& p : handle.model->parameters()) if (!p.requires_grad()) ++frozen;
  CHECK(frozen == handle.model->parameters().size() - handle.trainable.size(), "everything else frozen");

  std::vector<torch::Tensor> before;
  for (auto& p : handle.model->parameters()) before.push_back(p.detach().clone());

  CountingSGD opt(handle.trainable, 0.1);
  auto loss = clf::make_loss(false);
  std::vector<torch::data::Example<>> batches;
  batches.push_back({torch::randn({4, 3, 8, 8}), torch::tensor({0, 1, 2, 0}, torch::kLong)});

  clf::EpochRunner runner(handle.model, torch::kCPU, {1}, /*finetune=*/true);
  runner.run(clf::Mode::Train, batches, &loss, &opt);

  CHECK(!handle.model->is_training(), "finetune train pass keeps the model in inference behavior");
  CHECK(opt.steps == 1, "one step");

  auto params = handle.model->parameters();
  std::set<const void*> head;
  for (auto& p : handle.model->head_parameters()) head.insert(p.unsafeGetTensorImpl());
  bool head_changed = false, body_unchanged = true;
  for (size_t i = 0; i < params.size(); ++i) {
    const bool same = torch::equal(before[i], params[i].detach());
    if (head.count(params[i].unsafeGetTensorImpl())) head_changed = head_changed || !same;
    else body_unchanged = body_unchanged && same;
  }
  CHECK(head_changed, "head updated");
  CHECK(body_unchanged, "frozen parameters untouched");
}

//===================================================================================================================//

static void testMultilabelLoss() {
  std::cout << "--- testMultilabelLoss ---" << std::endl;

  auto loss = clf::make_loss(true);
  auto scores = torch::tensor({{2.0f, -2.0f}});
  auto targets = torch::tensor({{1.0f, 0.0f}});
  auto expected = torch::nn::functional::binary_cross_entropy_with_logits(scores, targets);
  CHECK_NEAR(loss(scores, targets).item<double>(), expected.item<double>(), 1e-7, "multilabel uses BCE with logits");
}

//===================================================================================================================//

void runEpochRunnerTests() {
  testTrainStepsOncePerBatch();
  testEvalNeverSteps();
  testEvalWithoutLoss();
  testModeArgumentChecks();
  testWeightedAggregation();
  testNonFiniteLossAborts();
  testFinetuneKeepsInferenceBehavior();
  testMultilabelLoss();
}
