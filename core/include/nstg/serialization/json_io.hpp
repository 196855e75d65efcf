// nstg/serialization/json_io.hpp - JSON input/output
//
// Input: function signatures and observed executions produced by external
// front ends. Output: generated test cases for external renderers.
//
// Numbers that JSON cannot carry are wrapped: {"$number": "NaN"},
// {"$number": "Infinity"}, {"$number": "-Infinity"}, {"$number": "-0"}.
//
#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "nstg/coverage/coverage_tracker.hpp"
#include "nstg/driver/analyzer.hpp"
#include "nstg/generation/test_generator.hpp"
#include "nstg/types/type_node.hpp"
#include "nstg/types/value.hpp"

namespace nstg
{

/**
 * Thrown by the *_from_json functions on malformed input.
 * The load/parse entry points convert it into a failed result.
 */
class JsonFormatError : public std::runtime_error
{
public:
  explicit JsonFormatError(const std::string & what) : std::runtime_error(what) {}
};

// ============================================================================
// Load Results
// ============================================================================

struct SignatureLoadResult
{
  FunctionSignature signature;
  bool success = false;
  std::string error;

  static SignatureLoadResult ok(FunctionSignature sig)
  {
    SignatureLoadResult r;
    r.signature = std::move(sig);
    r.success = true;
    return r;
  }

  static SignatureLoadResult fail(std::string msg)
  {
    SignatureLoadResult r;
    r.error = std::move(msg);
    return r;
  }
};

struct ExecutionsLoadResult
{
  std::vector<CoverageTracker::Observed> executions;
  bool success = false;
  std::string error;

  static ExecutionsLoadResult ok(std::vector<CoverageTracker::Observed> observed)
  {
    ExecutionsLoadResult r;
    r.executions = std::move(observed);
    r.success = true;
    return r;
  }

  static ExecutionsLoadResult fail(std::string msg)
  {
    ExecutionsLoadResult r;
    r.error = std::move(msg);
    return r;
  }
};

// ============================================================================
// Values / Types
// ============================================================================

[[nodiscard]] nlohmann::json to_json(const Value & value);
[[nodiscard]] Value value_from_json(const nlohmann::json & j);

[[nodiscard]] nlohmann::json to_json(const TypeConstraint & constraint);
[[nodiscard]] TypeConstraint constraint_from_json(const nlohmann::json & j);

/// A plain string ("number") is accepted as a primitive type
[[nodiscard]] nlohmann::json to_json(const TypeNode & type);
[[nodiscard]] TypeNode type_from_json(const nlohmann::json & j);

[[nodiscard]] nlohmann::json to_json(const FunctionSignature & signature);
[[nodiscard]] FunctionSignature signature_from_json(const nlohmann::json & j);

// ============================================================================
// Documents
// ============================================================================

[[nodiscard]] SignatureLoadResult parse_signature(const std::string & text);
[[nodiscard]] SignatureLoadResult load_signature(const std::filesystem::path & path);

/// `[{"args": [...], "output": ..., "threw": "message" | true, "durationMs": 1.5}]`
[[nodiscard]] ExecutionsLoadResult parse_executions(const std::string & text);
[[nodiscard]] ExecutionsLoadResult load_executions(const std::filesystem::path & path);

// ============================================================================
// Output
// ============================================================================

[[nodiscard]] nlohmann::json to_json(const TestCase & test);
[[nodiscard]] nlohmann::json to_json(const std::vector<TestCase> & tests);
[[nodiscard]] nlohmann::json to_json(const TestGenerationStats & stats);
[[nodiscard]] nlohmann::json to_json(const NegativeSpaceRegion & gap);

/// Summary report: coverage, gap statistics, test statistics and test cases
[[nodiscard]] nlohmann::json to_json(const AnalysisResult & result);

}  // namespace nstg
