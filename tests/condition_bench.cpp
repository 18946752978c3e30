#include "stepflow/condition/condition_evaluator.hpp"
#include "stepflow/plan/plan.hpp"

#include <benchmark/benchmark.h>

#include <format>

using namespace stepflow;

namespace {

[[nodiscard]] auto make_results(int n) -> StepResults {
  StepResults results;
  for (int i = 0; i < n; ++i) {
    results.set(StepId{std::format("step_{}", i)},
                {{"score", i}, {"status", "ok"}, {"items", {1, 2, 3}}});
  }
  return results;
}

// Linear chain s0 <- s1 <- ... <- s(n-1).
[[nodiscard]] auto make_chain(int n) -> Plan {
  std::vector<Step> steps;
  steps.reserve(n);
  for (int i = 0; i < n; ++i) {
    std::vector<StepId> deps;
    if (i > 0) {
      deps.emplace_back(std::format("s{}", i - 1));
    }
    Step step;
    step.step_id = StepId{std::format("s{}", i)};
    step.action = ActionKind::LlmCall;
    step.depends_on = std::move(deps);
    steps.push_back(std::move(step));
  }
  return Plan{PlanId("bench"), 1, std::move(steps)};
}

}  // namespace

static void BM_ConditionSimpleComparison(benchmark::State& state) {
  auto results = make_results(1);

  for (auto _ : state) {
    auto r = ConditionEvaluator::evaluate("result.score > 0", results);
    benchmark::DoNotOptimize(r);
  }
}

static void BM_ConditionCompound(benchmark::State& state) {
  auto results = make_results(1);

  for (auto _ : state) {
    auto r = ConditionEvaluator::evaluate(
        "result.score >= 0 and result.status == \"ok\" and len(result.items) > 2 "
        "or not (result.missing is_not_null)",
        results);
    benchmark::DoNotOptimize(r);
  }
}

static void BM_ConditionSourceLookup(benchmark::State& state) {
  const int num_results = state.range(0);
  auto results = make_results(num_results);
  auto source = StepId{std::format("step_{}", num_results / 2)};

  for (auto _ : state) {
    auto r = ConditionEvaluator::evaluate("result.items contains 2", results, source);
    benchmark::DoNotOptimize(r);
  }

  state.SetItemsProcessed(state.iterations());
}

static void BM_PlanValidate(benchmark::State& state) {
  auto plan = make_chain(state.range(0));

  for (auto _ : state) {
    benchmark::DoNotOptimize(plan.validate());
  }
}

static void BM_PlanDrainNextStep(benchmark::State& state) {
  const int num_steps = state.range(0);

  for (auto _ : state) {
    state.PauseTiming();
    auto plan = make_chain(num_steps);
    state.ResumeTiming();
    while (auto* step = plan.get_next_step()) {
      step->status = StepStatus::Completed;
    }
  }

  state.SetItemsProcessed(num_steps * state.iterations());
}

BENCHMARK(BM_ConditionSimpleComparison);
BENCHMARK(BM_ConditionCompound);
BENCHMARK(BM_ConditionSourceLookup)->Arg(10)->Arg(100)->Arg(1000);
BENCHMARK(BM_PlanValidate)->Arg(10)->Arg(100)->Arg(1000);
BENCHMARK(BM_PlanDrainNextStep)->Arg(10)->Arg(100)->Arg(1000);
