// bsl_gradual/types/type_resolution.hpp - Gradual type model
//
// A TypeResolution pairs what is known about a value's type (the result)
// with how sure we are about it (the certainty). All types here are plain
// values: copying is cheap enough, nothing is shared mutably, and every
// analysis builds new values instead of editing existing ones.
//
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace bsl_gradual
{

struct TypeResolution;
struct ResolutionResult;

// ============================================================================
// Enumerations
// ============================================================================

enum class PrimitiveType : uint8_t {
  String,
  Number,
  Boolean,
  Date,
};

enum class SpecialType : uint8_t {
  Undefined,
  Null,
  Type,
};

enum class MetadataKind : uint8_t {
  Catalog,
  Document,
  Register,
  Report,
  DataProcessor,
  Enum,
  ChartOfAccounts,
  ChartOfCharacteristicTypes,
};

/// Alternate "view" of a configuration type (manager, object, reference, ...).
enum class FacetKind : uint8_t {
  Manager,
  Object,
  Reference,
  Metadata,
  Constructor,
  Collection,
  Singleton,
};

enum class ExecutionContext : uint8_t {
  Server,
  Client,
  ThickClient,
  WebClient,
  MobileClient,
  ExternalConnection,
};

enum class ResolutionSource : uint8_t {
  Static,
  Inferred,
  Annotated,
  Runtime,
  Predicted,
};

/// Display names used in messages: Строка, Число, Булево, Дата.
[[nodiscard]] std::string_view to_string(PrimitiveType t) noexcept;
/// Неопределено, Null, Тип
[[nodiscard]] std::string_view to_string(SpecialType t) noexcept;
[[nodiscard]] std::string_view to_string(MetadataKind k) noexcept;
[[nodiscard]] std::string_view to_string(FacetKind k) noexcept;
[[nodiscard]] std::string_view to_string(ExecutionContext c) noexcept;
[[nodiscard]] std::string_view to_string(ResolutionSource s) noexcept;

// ============================================================================
// Certainty
// ============================================================================

/**
 * How confident the checker is in a resolution.
 *
 * Known means fully determined; Inferred carries a confidence in [0, 1]
 * (clamped on construction); Unknown means consumers must treat the result
 * as dynamic whatever it literally holds.
 */
class Certainty
{
public:
  enum class Kind : uint8_t { Known, Inferred, Unknown };

  [[nodiscard]] static Certainty known() noexcept { return Certainty(Kind::Known, 1.0); }
  [[nodiscard]] static Certainty inferred(double confidence) noexcept;
  [[nodiscard]] static Certainty unknown() noexcept { return Certainty(Kind::Unknown, 0.0); }

  [[nodiscard]] Kind kind() const noexcept { return kind_; }
  [[nodiscard]] bool is_known() const noexcept { return kind_ == Kind::Known; }
  [[nodiscard]] bool is_inferred() const noexcept { return kind_ == Kind::Inferred; }
  [[nodiscard]] bool is_unknown() const noexcept { return kind_ == Kind::Unknown; }

  /// Confidence of an Inferred certainty (1 for Known, 0 for Unknown).
  [[nodiscard]] double value() const noexcept { return confidence_; }

  friend bool operator==(const Certainty & a, const Certainty & b) noexcept
  {
    return a.kind_ == b.kind_ && (a.kind_ != Kind::Inferred || a.confidence_ == b.confidence_);
  }
  friend bool operator!=(const Certainty & a, const Certainty & b) noexcept { return !(a == b); }

private:
  Certainty(Kind k, double c) noexcept : kind_(k), confidence_(c) {}

  Kind kind_;
  double confidence_;
};

// ============================================================================
// Concrete Types
// ============================================================================

struct Parameter
{
  std::string name;
  std::optional<std::string> type_name;
  bool optional = false;
  bool by_value = false;
};

struct Method
{
  std::string name;
  std::vector<Parameter> parameters;
  std::optional<std::string> return_type;
  bool is_function = false;
};

struct Property
{
  std::string name;
  std::string type_name;
  bool readonly = false;
};

/// Attribute of a configuration object; the type may be composite
/// ("СправочникСсылка.Контрагенты,Строка(10)").
struct Attribute
{
  std::string name;
  std::string type_name;
  bool is_composite = false;
  std::vector<std::string> types;
};

struct TabularSection
{
  std::string name;
  std::optional<std::string> synonym;
  std::vector<Attribute> attributes;
};

/// Built-in platform type (Массив, Структура, ...).
struct PlatformType
{
  std::string name;
  std::vector<Method> methods;
  std::vector<Property> properties;
};

/// Object described by the application configuration (catalog, document, ...).
struct ConfigurationType
{
  MetadataKind kind = MetadataKind::Catalog;
  std::string name;
  std::vector<Attribute> attributes;
  std::vector<TabularSection> tabular_sections;
};

struct GlobalFunctionParameter
{
  std::string name;
  std::shared_ptr<const TypeResolution> type;
  bool is_optional = false;
  std::optional<std::string> default_value;
  std::optional<std::string> description;
};

/// Global context function (Сообщить, СтрДлина, ...).
struct GlobalFunction
{
  std::string name;
  std::string english_name;
  std::vector<GlobalFunctionParameter> parameters;
  std::shared_ptr<const TypeResolution> return_type;
  bool pure = false;
  bool polymorphic = false;
  std::vector<ExecutionContext> context_required;
};

/// Closed set of concrete types; equality is structural.
using ConcreteType =
  std::variant<PlatformType, ConfigurationType, PrimitiveType, SpecialType, GlobalFunction>;

bool operator==(const Parameter & a, const Parameter & b);
bool operator==(const Method & a, const Method & b);
bool operator==(const Property & a, const Property & b);
bool operator==(const Attribute & a, const Attribute & b);
bool operator==(const TabularSection & a, const TabularSection & b);
bool operator==(const PlatformType & a, const PlatformType & b);
bool operator==(const ConfigurationType & a, const ConfigurationType & b);
bool operator==(const GlobalFunctionParameter & a, const GlobalFunctionParameter & b);
bool operator==(const GlobalFunction & a, const GlobalFunction & b);

inline bool operator!=(const PlatformType & a, const PlatformType & b) { return !(a == b); }
inline bool operator!=(const ConfigurationType & a, const ConfigurationType & b)
{
  return !(a == b);
}
inline bool operator!=(const GlobalFunction & a, const GlobalFunction & b) { return !(a == b); }

/// Name used in messages and JSON ("Строка", "Массив", "Справочник.Товары").
[[nodiscard]] std::string type_name(const ConcreteType & type);

// ============================================================================
// Resolution Results
// ============================================================================

/// One member of a union with its probability weight.
struct WeightedType
{
  ConcreteType type;
  double weight = 0.0;
};

inline bool operator==(const WeightedType & a, const WeightedType & b)
{
  return a.type == b.type && a.weight == b.weight;
}

struct UnionType
{
  std::vector<WeightedType> members;
};

inline bool operator==(const UnionType & a, const UnionType & b) { return a.members == b.members; }

struct DynamicType
{
};

inline bool operator==(const DynamicType &, const DynamicType &) { return true; }

/// Type that depends on a runtime condition.
struct ConditionalType
{
  std::string condition;
  std::shared_ptr<const ResolutionResult> then_type;
  std::shared_ptr<const ResolutionResult> else_type;
};

struct TypeEffect
{
  enum class Kind : uint8_t {
    MayBeNull,
    RequiresTransaction,
    RequiresLock,
    RequiresContext,
    ModifiedByExtension,
  };

  Kind kind = Kind::MayBeNull;
  std::string detail;                        // lock name or extension name
  std::optional<ExecutionContext> context;  // for RequiresContext
};

inline bool operator==(const TypeEffect & a, const TypeEffect & b)
{
  return a.kind == b.kind && a.detail == b.detail && a.context == b.context;
}

/// Type together with its execution context and side effects.
struct ContextualType
{
  std::shared_ptr<const ResolutionResult> base_type;
  std::vector<TypeEffect> effects;
  ExecutionContext context = ExecutionContext::Server;
};

bool operator==(const ConditionalType & a, const ConditionalType & b);
bool operator==(const ContextualType & a, const ContextualType & b);

/**
 * What a resolution says about the type.
 */
struct ResolutionResult
{
  using Storage = std::variant<ConcreteType, UnionType, ConditionalType, ContextualType, DynamicType>;

  Storage value;

  ResolutionResult() : value(DynamicType{}) {}
  ResolutionResult(ConcreteType c) : value(std::move(c)) {}  // NOLINT(google-explicit-constructor)
  ResolutionResult(UnionType u) : value(std::move(u)) {}     // NOLINT(google-explicit-constructor)
  ResolutionResult(ConditionalType c) : value(std::move(c)) {}  // NOLINT(google-explicit-constructor)
  ResolutionResult(ContextualType c) : value(std::move(c)) {}   // NOLINT(google-explicit-constructor)
  ResolutionResult(DynamicType d) : value(d) {}                 // NOLINT(google-explicit-constructor)

  [[nodiscard]] const ConcreteType * concrete() const noexcept
  {
    return std::get_if<ConcreteType>(&value);
  }
  [[nodiscard]] const UnionType * as_union() const noexcept { return std::get_if<UnionType>(&value); }
  [[nodiscard]] bool is_dynamic() const noexcept
  {
    return std::holds_alternative<DynamicType>(value);
  }
};

inline bool operator==(const ResolutionResult & a, const ResolutionResult & b)
{
  return a.value == b.value;
}
inline bool operator!=(const ResolutionResult & a, const ResolutionResult & b) { return !(a == b); }

// ============================================================================
// TypeResolution
// ============================================================================

struct ResolutionMetadata
{
  std::optional<std::string> file;
  std::optional<uint32_t> line;
  std::optional<uint32_t> column;
  std::vector<std::string> notes;
};

bool operator==(const ResolutionMetadata & a, const ResolutionMetadata & b);

/**
 * Atomic unit of type information.
 */
struct TypeResolution
{
  Certainty certainty = Certainty::unknown();
  ResolutionResult result;
  ResolutionSource source = ResolutionSource::Static;
  ResolutionMetadata metadata;
  std::optional<FacetKind> active_facet;
  std::vector<FacetKind> available_facets;

  /// {Known, Concrete(type), Static}
  [[nodiscard]] static TypeResolution known(ConcreteType type);
  /// {Unknown, Dynamic, Static}
  [[nodiscard]] static TypeResolution unknown();
  /// {Inferred(confidence), result, Inferred}
  [[nodiscard]] static TypeResolution inferred(double confidence, ResolutionResult result);

  /// Fully determined (Known certainty).
  [[nodiscard]] bool is_resolved() const noexcept { return certainty.is_known(); }
  [[nodiscard]] bool is_dynamic() const noexcept
  {
    return certainty.is_unknown() || result.is_dynamic();
  }

  /// Concrete type when the result is a single concrete type.
  [[nodiscard]] const ConcreteType * concrete() const noexcept { return result.concrete(); }
  [[nodiscard]] const std::vector<WeightedType> * union_members() const noexcept;

  /// Name of a concrete platform/configuration/primitive/function type.
  [[nodiscard]] std::optional<std::string> get_name() const;

  /// Copy with one more diagnostic note attached.
  [[nodiscard]] TypeResolution with_note(std::string note) const;
};

bool operator==(const TypeResolution & a, const TypeResolution & b);
inline bool operator!=(const TypeResolution & a, const TypeResolution & b) { return !(a == b); }

/// Human-readable description: "Строка", "Строка | Число", "Произвольный".
[[nodiscard]] std::string display_name(const TypeResolution & type);

}  // namespace bsl_gradual
