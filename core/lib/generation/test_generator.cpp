// nstg/generation/test_generator.cpp - Test cases from negative space gaps
//
#include "nstg/generation/test_generator.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <utility>

#include "nstg/types/type_utils.hpp"

namespace nstg
{

const char * to_string(ExpectedBehavior behavior) noexcept
{
  switch (behavior) {
    case ExpectedBehavior::ShouldReturn:
      return "should-return";
    case ExpectedBehavior::ShouldThrow:
      return "should-throw";
    case ExpectedBehavior::ShouldSatisfy:
      return "should-satisfy";
  }
  return "should-satisfy";
}

const char * to_string(TestSource source) noexcept
{
  switch (source) {
    case TestSource::Boundary:
      return "boundary";
    case TestSource::Solver:
      return "solver";
  }
  return "boundary";
}

std::optional<TestOrdering> parse_test_ordering(std::string_view text)
{
  if (text == "priority") return TestOrdering::Priority;
  if (text == "boundary-first") return TestOrdering::BoundaryFirst;
  if (text == "error-first") return TestOrdering::ErrorFirst;
  return std::nullopt;
}

namespace
{

constexpr std::size_t k_max_display_length = 20;
constexpr std::size_t k_truncated_length = 17;

bool contains_ci(const std::string & text, std::string_view needle)
{
  auto it = std::search(
    text.begin(), text.end(), needle.begin(), needle.end(), [](char a, char b) {
      return std::tolower(static_cast<unsigned char>(a)) ==
             std::tolower(static_cast<unsigned char>(b));
    });
  return it != text.end();
}

bool is_boundary_reason(const std::string & reason) { return contains_ci(reason, "boundary"); }

/// NaN, +/-Infinity, -0 and null
bool is_special_argument(const Value & v)
{
  if (v.is_null()) return true;
  if (!v.is_number()) return false;
  return v.is_nan() || !v.is_finite() || v.is_negative_zero();
}

/// First `n` code points of a UTF-8 string
std::string utf8_prefix(const std::string & text, std::size_t n)
{
  std::size_t count = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    const auto byte = static_cast<unsigned char>(text[i]);
    if ((byte & 0xC0) != 0x80) {
      if (count == n) return text.substr(0, i);
      ++count;
    }
  }
  return text;
}

std::string format_argument(const Value & v)
{
  if (v.is_string() && v.string_length() > k_max_display_length) {
    return fmt::format("\"{}...\"", utf8_prefix(v.as_string(), k_truncated_length));
  }
  return v.to_display_string();
}

}  // namespace

// ============================================================================
// Generation
// ============================================================================

TestGenerator::TestGenerator(FunctionSignature signature) : signature_(std::move(signature)) {}

std::vector<TestCase> TestGenerator::generate_tests(
  const std::vector<NegativeSpaceRegion> & gaps, const TestGenerationOptions & options)
{
  std::vector<const NegativeSpaceRegion *> selected;
  for (const auto & gap : gaps) {
    if (gap.priority >= options.priority_threshold) selected.push_back(&gap);
  }
  std::stable_sort(selected.begin(), selected.end(), [](const auto * a, const auto * b) {
    return a->priority > b->priority;
  });

  std::vector<TestCase> tests;
  for (const auto * gap : selected) {
    if (tests.size() >= options.max_tests) break;

    GapTestOptions gap_options;
    gap_options.max_tests = std::min(options.max_tests - tests.size(), options.max_inputs_per_region);
    gap_options.exploration_depth = options.exploration_depth;
    gap_options.include_special_values = options.include_special_values;
    gap_options.include_explanations = options.include_explanations;

    auto gap_tests = generate_tests_for_gap(*gap, gap_options);
    std::move(gap_tests.begin(), gap_tests.end(), std::back_inserter(tests));
  }
  return tests;
}

std::vector<TestCase> TestGenerator::generate_tests_for_gap(
  const NegativeSpaceRegion & gap, const GapTestOptions & options)
{
  BoundaryWalkOptions walk;
  walk.max_inputs = options.max_tests;
  walk.depth = options.exploration_depth;
  walk.include_special_values = options.include_special_values;
  for (const auto & param : signature_.parameters) {
    walk.parameter_names.push_back(param.name);
  }

  BoundaryWalkResult walked = walker_.walk_boundary(gap, walk);

  std::vector<TestCase> tests;
  tests.reserve(walked.test_inputs.size());
  for (std::size_t i = 0; i < walked.test_inputs.size(); ++i) {
    std::optional<std::string> explanation;
    if (options.include_explanations && i < walked.explanations.size()) {
      explanation = walked.explanations[i];
    }
    tests.push_back(make_test_case(
      gap, std::move(walked.test_inputs[i].args), TestSource::Boundary, std::move(explanation)));
  }
  return tests;
}

std::vector<TestCase> TestGenerator::tests_from_solver_values(
  const NegativeSpaceRegion & gap, const std::vector<Value> & values, std::size_t position,
  const std::string & constraint_text)
{
  std::vector<Value> base;
  if (gap.region.is_compound()) {
    for (const auto & component : gap.region.components) {
      auto canonical = BoundaryWalker::canonical_values(component, false);
      base.push_back(canonical.empty() ? Value::make_null() : canonical.front());
    }
  }
  if (base.size() <= position) base.resize(position + 1);

  std::vector<TestCase> tests;
  for (const auto & v : values) {
    std::vector<Value> args = base;
    args[position] = v;

    std::string explanation =
      constraint_text.empty()
        ? fmt::format("solver value {}", v.to_display_string())
        : fmt::format("solver value {} satisfies {}", v.to_display_string(), constraint_text);

    TestCase test = make_test_case(gap, std::move(args), TestSource::Solver, std::move(explanation));
    test.metadata.boundary_point = false;
    tests.push_back(std::move(test));
  }
  return tests;
}

TestCase TestGenerator::make_test_case(
  const NegativeSpaceRegion & gap, std::vector<Value> args, TestSource source,
  std::optional<std::string> explanation)
{
  TestCase test;
  test.id = fmt::format("test-{}", ++test_counter_);
  test.expected_behavior = determine_expected_behavior(gap, args);
  test.description = describe(gap, args, test.expected_behavior, explanation);
  test.function_name = signature_.name;
  test.inputs = std::move(args);
  test.expected_value = expected_value_for(test.expected_behavior, gap);
  test.priority = gap.priority;
  test.source = source;
  test.region = TestCaseRegion{gap.id(), type_to_string(gap.region.type), gap.reason};
  test.metadata.generated = std::chrono::system_clock::now();
  test.metadata.explanation = std::move(explanation);
  return test;
}

ExpectedBehavior TestGenerator::determine_expected_behavior(
  const NegativeSpaceRegion & gap, const std::vector<Value> & args)
{
  const bool has_special = std::any_of(args.begin(), args.end(), is_special_argument);
  if (has_special && contains_ci(gap.reason, "special")) return ExpectedBehavior::ShouldThrow;
  if (is_boundary_reason(gap.reason)) return ExpectedBehavior::ShouldReturn;
  return ExpectedBehavior::ShouldSatisfy;
}

Value TestGenerator::expected_value_for(
  ExpectedBehavior behavior, const NegativeSpaceRegion & gap) const
{
  switch (behavior) {
    case ExpectedBehavior::ShouldThrow:
      return Value::make_object(
        {{"type", Value::make_string("error")},
         {"message", Value::make_string("Expected error")}});
    case ExpectedBehavior::ShouldSatisfy:
      return Value::make_object(
        {{"type", Value::make_string("predicate")},
         {"description",
          Value::make_string(
            fmt::format("Value should be valid for {}", type_to_string(gap.region.type)))}});
    case ExpectedBehavior::ShouldReturn:
      break;
  }
  return Value::make_object(
    {{"type", Value::make_string("returns")},
     {"returnType", Value::make_string(type_to_string(signature_.return_type))}});
}

std::string TestGenerator::describe(
  const NegativeSpaceRegion & gap, const std::vector<Value> & args, ExpectedBehavior behavior,
  const std::optional<std::string> & explanation) const
{
  std::string arg_text;
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (i > 0) arg_text += ", ";
    arg_text += format_argument(args[i]);
  }

  std::string description = fmt::format("should handle {}({})", signature_.name, arg_text);
  if (behavior == ExpectedBehavior::ShouldThrow) description += " (expect error)";
  if (!gap.reason.empty()) description += fmt::format(" - {}", gap.reason);
  if (explanation) description += fmt::format(" [{}]", *explanation);
  return description;
}

// ============================================================================
// Statistics / Ordering
// ============================================================================

TestGenerationStats TestGenerator::calculate_stats(const std::vector<TestCase> & tests)
{
  TestGenerationStats stats;
  stats.total_tests = tests.size();

  double total_priority = 0.0;
  for (const auto & test : tests) {
    if (test.priority >= 0.8) {
      ++stats.high_priority;
    } else if (test.priority >= 0.5) {
      ++stats.medium_priority;
    } else {
      ++stats.low_priority;
    }

    ++stats.tests_by_region[test.region.id];

    switch (test.expected_behavior) {
      case ExpectedBehavior::ShouldReturn:
        ++stats.should_return;
        break;
      case ExpectedBehavior::ShouldThrow:
        ++stats.should_throw;
        break;
      case ExpectedBehavior::ShouldSatisfy:
        ++stats.should_satisfy;
        break;
    }

    total_priority += test.priority;
  }

  if (!tests.empty()) stats.average_priority = total_priority / static_cast<double>(tests.size());
  return stats;
}

std::vector<TestCase> TestGenerator::prioritize_tests(
  std::vector<TestCase> tests, TestOrdering ordering)
{
  const auto by_priority = [](const TestCase & a, const TestCase & b) {
    return a.priority > b.priority;
  };

  switch (ordering) {
    case TestOrdering::Priority:
      std::stable_sort(tests.begin(), tests.end(), by_priority);
      break;
    case TestOrdering::BoundaryFirst:
      std::stable_sort(tests.begin(), tests.end(), [&](const TestCase & a, const TestCase & b) {
        const bool ab = is_boundary_reason(a.region.reason);
        const bool bb = is_boundary_reason(b.region.reason);
        if (ab != bb) return ab;
        return by_priority(a, b);
      });
      break;
    case TestOrdering::ErrorFirst:
      std::stable_sort(tests.begin(), tests.end(), [&](const TestCase & a, const TestCase & b) {
        const bool ae = a.expected_behavior == ExpectedBehavior::ShouldThrow;
        const bool be = b.expected_behavior == ExpectedBehavior::ShouldThrow;
        if (ae != be) return ae;
        return by_priority(a, b);
      });
      break;
  }
  return tests;
}

}  // namespace nstg
