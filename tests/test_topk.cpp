#include "test_helpers.hpp"

//===================================================================================================================//

static void testTwoExamplesTop1() {
  std::cout << "--- testTwoExamplesTop1 ---" << std::endl;

  auto outputs = torch::tensor({{0.1f, 0.9f}, {0.8f, 0.2f}});
  auto targets = torch::tensor({1, 0}, torch::kLong);
  auto correct = clf::topk_correct(outputs, targets, {1});

  CHECK(correct.size() == 1, "one count per k");
  CHECK(correct[0] == 2, "both rows correct at top-1");
  CHECK_NEAR(correct[0] * 100.0 / 2, 100.0, 1e-12, "accuracy 100%");
}

//===================================================================================================================//

static void testMonotoneInK() {
  std::cout << "--- testMonotoneInK ---" << std::endl;

  torch::manual_seed(3);
  auto outputs = torch::randn({64, 10});
  auto targets = torch::randint(0, 10, {64}, torch::kLong);
  auto correct = clf::topk_correct(outputs, targets, {1, 2, 3, 5, 10});

  for (size_t i = 1; i < correct.size(); ++i)
    CHECK(correct[i] >= correct[i - 1], "count non-decreasing in k");
  CHECK(correct.back() == 64, "k = C counts every row");
}

//===================================================================================================================//

static void testArgmaxTargetsAllCorrect() {
  std::cout << "--- testArgmaxTargetsAllCorrect ---" << std::endl;

  torch::manual_seed(5);
  auto outputs = torch::rand({17, 6});
  auto targets = outputs.argmax(1);
  auto correct = clf::topk_correct(outputs, targets, {1, 3});

  CHECK(correct[0] == 17, "top-1 = N when the true class scores highest");
  CHECK(correct[1] == 17, "top-3 = N as well");
}

//===================================================================================================================//

static void testTiesPreferLowerClassIndex() {
  std::cout << "--- testTiesPreferLowerClassIndex ---" << std::endl;

  auto outputs = torch::tensor({{0.5f, 0.5f, 0.1f}, {0.5f, 0.5f, 0.1f}});
  auto targets = torch::tensor({0, 1}, torch::kLong);
  auto correct = clf::topk_correct(outputs, targets, {1, 2});

  CHECK(correct[0] == 1, "tie at top-1 goes to class 0");
  CHECK(correct[1] == 2, "both tied classes inside top-2");
}

//===================================================================================================================//

static void testKLargerThanClassCount() {
  std::cout << "--- testKLargerThanClassCount ---" << std::endl;

  auto outputs = torch::tensor({{0.1f, 0.9f}, {0.8f, 0.2f}, {0.3f, 0.7f}});
  auto targets = torch::tensor({0, 1, 0}, torch::kLong);
  auto correct = clf::topk_correct(outputs, targets, {1, 5});

  CHECK(correct[0] == 0, "no row correct at top-1");
  CHECK(correct[1] == 3, "k beyond C counts every row");
}

//===================================================================================================================//

static void testMultiHotTargets() {
  std::cout << "--- testMultiHotTargets ---" << std::endl;

  auto outputs = torch::tensor({{0.9f, 0.5f, 0.1f}, {0.9f, 0.5f, 0.1f}, {0.9f, 0.5f, 0.1f}});
  auto targets = torch::tensor({{1.f, 0.f, 1.f}, {0.f, 1.f, 0.f}, {0.f, 0.f, 1.f}});
  auto correct = clf::topk_correct(outputs, targets, {1, 2, 3});

  CHECK(correct[0] == 1, "only the first row has class 0 among its labels");
  CHECK(correct[1] == 2, "second row hits at rank 2");
  CHECK(correct[2] == 3, "third row hits at rank 3");
}

//===================================================================================================================//

static void testGradientTrackedInputs() {
  std::cout << "--- testGradientTrackedInputs ---" << std::endl;

  auto outputs = torch::tensor({{0.2f, 0.8f}}).requires_grad_(true);
  auto targets = torch::tensor({1}, torch::kLong);
  auto correct = clf::topk_correct(outputs * 2, targets, {1});

  CHECK(correct[0] == 1, "works on tensors attached to the autograd graph");
  CHECK(!outputs.grad().defined(), "no gradient produced");
}

//===================================================================================================================//

static void testInvalidInputs() {
  std::cout << "--- testInvalidInputs ---" << std::endl;

  auto outputs = torch::rand({4, 3});
  CHECK_THROWS_AS(clf::topk_correct(outputs, torch::zeros({3}, torch::kLong), {1}),
                  std::invalid_argument, "target count mismatch throws");
  CHECK_THROWS_AS(clf::topk_correct(outputs.view({12}), torch::zeros({12}, torch::kLong), {1}),
                  std::invalid_argument, "1-D outputs throw");
  CHECK_THROWS_AS(clf::topk_correct(outputs, torch::full({4}, 3, torch::kLong), {1}),
                  std::invalid_argument, "out of range class throws");
  CHECK_THROWS_AS(clf::topk_correct(outputs, torch::zeros({4}, torch::kLong), {}),
                  std::invalid_argument, "empty k set throws");
  CHECK_THROWS_AS(clf::topk_correct(outputs, torch::zeros({4}, torch::kLong), {0}),
                  std::invalid_argument, "k = 0 throws");
}

//===================================================================================================================//

void runTopKTests() {
  testTwoExamplesTop1();
  testMonotoneInK();
  testArgmaxTargetsAllCorrect();
  testTiesPreferLowerClassIndex();
  testKLargerThanClassCount();
  testMultiHotTargets();
  testGradientTrackedInputs();
  testInvalidInputs();
}
