// bsl_gradual/driver/type_json.hpp - JSON export of types and check results
//
// Export shape of a TypeResolution:
//
//   {"certainty": {"kind": "Inferred", "confidence": 0.8},
//    "result": {"kind": "Union", "members": [
//      {"type": {"kind": "Primitive", "name": "Строка"}, "weight": 0.5}, ...]},
//    "source": "Inferred", "display": "Строка | Число", "notes": [...]}
//
#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "bsl_gradual/basic/diagnostic.hpp"
#include "bsl_gradual/sema/type_checker.hpp"
#include "bsl_gradual/sema/type_context.hpp"
#include "bsl_gradual/types/type_resolution.hpp"

namespace bsl_gradual
{

// ============================================================================
// Export
// ============================================================================

[[nodiscard]] nlohmann::json to_json(const Certainty & certainty);
[[nodiscard]] nlohmann::json to_json(const ConcreteType & type);
[[nodiscard]] nlohmann::json to_json(const ResolutionResult & result);
[[nodiscard]] nlohmann::json to_json(const TypeResolution & type);
[[nodiscard]] nlohmann::json to_json(const FunctionSignature & signature);
[[nodiscard]] nlohmann::json to_json(const VariableTypes & variables);
[[nodiscard]] nlohmann::json to_json(const TypeContext & context);
[[nodiscard]] nlohmann::json to_json(const Diagnostic & diagnostic);
[[nodiscard]] nlohmann::json to_json(const DiagnosticBag & diagnostics);

/// {"context": ..., "diagnostics": [...], "statistics": {...}}
[[nodiscard]] nlohmann::json to_json(const CheckResult & result);

// ============================================================================
// Signature Import
// ============================================================================

struct SignatureLoadResult
{
  std::map<std::string, FunctionSignature> signatures;

  bool success = false;
  std::string error;

  static SignatureLoadResult ok(std::map<std::string, FunctionSignature> sigs)
  {
    SignatureLoadResult r;
    r.signatures = std::move(sigs);
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

/**
 * Read signatures of functions declared in other modules.
 *
 * Accepts either the "functions" object of an exported context or a bare
 * object of the same shape:
 *
 *   {"ПолучитьЦену": {"params": [{"name": "Товар"}, {"name": "Дата", "type": "Дата"}],
 *                     "optional_count": 1, "return_type": "Число", "exported": true}}
 *
 * Types are given by name; names outside the standard table become platform
 * types. An exported TypeResolution object is also accepted when it names a
 * standard type, any other object becomes Unknown.
 */
[[nodiscard]] SignatureLoadResult signatures_from_json(const nlohmann::json & json);

[[nodiscard]] SignatureLoadResult load_signatures_file(const std::filesystem::path & path);

}  // namespace bsl_gradual
