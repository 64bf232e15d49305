// bsl_gradual/types/type_resolution.cpp - Gradual type model implementation
#include "bsl_gradual/types/type_resolution.hpp"

#include <algorithm>


namespace bsl_gradual
{

namespace
{

template <typename T>
bool same_pointee(const std::shared_ptr<const T> & a, const std::shared_ptr<const T> & b)
{
  if (a == b) return true;
  if (!a || !b) return false;
  return *a == *b;
}

template <class... Ts>
struct Overloaded : Ts...
{
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace

// ============================================================================
// Names
// ============================================================================

std::string_view to_string(PrimitiveType t) noexcept
{
  switch (t) {
    case PrimitiveType::String:
      return "Строка";
    case PrimitiveType::Number:
      return "Число";
    case PrimitiveType::Boolean:
      return "Булево";
    case PrimitiveType::Date:
      return "Дата";
  }
  return "";
}

std::string_view to_string(SpecialType t) noexcept
{
  switch (t) {
    case SpecialType::Undefined:
      return "Неопределено";
    case SpecialType::Null:
      return "Null";
    case SpecialType::Type:
      return "Тип";
  }
  return "";
}

std::string_view to_string(MetadataKind k) noexcept
{
  switch (k) {
    case MetadataKind::Catalog:
      return "Справочник";
    case MetadataKind::Document:
      return "Документ";
    case MetadataKind::Register:
      return "Регистр";
    case MetadataKind::Report:
      return "Отчет";
    case MetadataKind::DataProcessor:
      return "Обработка";
    case MetadataKind::Enum:
      return "Перечисление";
    case MetadataKind::ChartOfAccounts:
      return "ПланСчетов";
    case MetadataKind::ChartOfCharacteristicTypes:
      return "ПланВидовХарактеристик";
  }
  return "";
}

std::string_view to_string(FacetKind k) noexcept
{
  switch (k) {
    case FacetKind::Manager:
      return "Manager";
    case FacetKind::Object:
      return "Object";
    case FacetKind::Reference:
      return "Reference";
    case FacetKind::Metadata:
      return "Metadata";
    case FacetKind::Constructor:
      return "Constructor";
    case FacetKind::Collection:
      return "Collection";
    case FacetKind::Singleton:
      return "Singleton";
  }
  return "";
}

std::string_view to_string(ExecutionContext c) noexcept
{
  switch (c) {
    case ExecutionContext::Server:
      return "Server";
    case ExecutionContext::Client:
      return "Client";
    case ExecutionContext::ThickClient:
      return "ThickClient";
    case ExecutionContext::WebClient:
      return "WebClient";
    case ExecutionContext::MobileClient:
      return "MobileClient";
    case ExecutionContext::ExternalConnection:
      return "ExternalConnection";
  }
  return "";
}

std::string_view to_string(ResolutionSource s) noexcept
{
  switch (s) {
    case ResolutionSource::Static:
      return "Static";
    case ResolutionSource::Inferred:
      return "Inferred";
    case ResolutionSource::Annotated:
      return "Annotated";
    case ResolutionSource::Runtime:
      return "Runtime";
    case ResolutionSource::Predicted:
      return "Predicted";
  }
  return "";
}

// ============================================================================
// Certainty
// ============================================================================

Certainty Certainty::inferred(double confidence) noexcept
{
  return Certainty(Kind::Inferred, std::clamp(confidence, 0.0, 1.0));
}

// ============================================================================
// Structural equality
// ============================================================================

bool operator==(const Parameter & a, const Parameter & b)
{
  return a.name == b.name && a.type_name == b.type_name && a.optional == b.optional &&
         a.by_value == b.by_value;
}

bool operator==(const Method & a, const Method & b)
{
  return a.name == b.name && a.parameters == b.parameters && a.return_type == b.return_type &&
         a.is_function == b.is_function;
}

bool operator==(const Property & a, const Property & b)
{
  return a.name == b.name && a.type_name == b.type_name && a.readonly == b.readonly;
}

bool operator==(const Attribute & a, const Attribute & b)
{
  return a.name == b.name && a.type_name == b.type_name && a.is_composite == b.is_composite &&
         a.types == b.types;
}

bool operator==(const TabularSection & a, const TabularSection & b)
{
  return a.name == b.name && a.synonym == b.synonym && a.attributes == b.attributes;
}

bool operator==(const PlatformType & a, const PlatformType & b)
{
  return a.name == b.name && a.methods == b.methods && a.properties == b.properties;
}

bool operator==(const ConfigurationType & a, const ConfigurationType & b)
{
  return a.kind == b.kind && a.name == b.name && a.attributes == b.attributes &&
         a.tabular_sections == b.tabular_sections;
}

bool operator==(const GlobalFunctionParameter & a, const GlobalFunctionParameter & b)
{
  return a.name == b.name && same_pointee(a.type, b.type) && a.is_optional == b.is_optional &&
         a.default_value == b.default_value && a.description == b.description;
}

bool operator==(const GlobalFunction & a, const GlobalFunction & b)
{
  return a.name == b.name && a.english_name == b.english_name && a.parameters == b.parameters &&
         same_pointee(a.return_type, b.return_type) && a.pure == b.pure &&
         a.polymorphic == b.polymorphic && a.context_required == b.context_required;
}

bool operator==(const ConditionalType & a, const ConditionalType & b)
{
  return a.condition == b.condition && same_pointee(a.then_type, b.then_type) &&
         same_pointee(a.else_type, b.else_type);
}

bool operator==(const ContextualType & a, const ContextualType & b)
{
  return same_pointee(a.base_type, b.base_type) && a.effects == b.effects &&
         a.context == b.context;
}

bool operator==(const ResolutionMetadata & a, const ResolutionMetadata & b)
{
  return a.file == b.file && a.line == b.line && a.column == b.column && a.notes == b.notes;
}

bool operator==(const TypeResolution & a, const TypeResolution & b)
{
  return a.certainty == b.certainty && a.result == b.result && a.source == b.source &&
         a.metadata == b.metadata && a.active_facet == b.active_facet &&
         a.available_facets == b.available_facets;
}

// ============================================================================
// TypeResolution
// ============================================================================

TypeResolution TypeResolution::known(ConcreteType type)
{
  TypeResolution r;
  r.certainty = Certainty::known();
  r.result = ResolutionResult(std::move(type));
  r.source = ResolutionSource::Static;
  return r;
}

TypeResolution TypeResolution::unknown() { return TypeResolution{}; }

TypeResolution TypeResolution::inferred(double confidence, ResolutionResult result)
{
  TypeResolution r;
  r.certainty = Certainty::inferred(confidence);
  r.result = std::move(result);
  r.source = ResolutionSource::Inferred;
  return r;
}

const std::vector<WeightedType> * TypeResolution::union_members() const noexcept
{
  const UnionType * u = result.as_union();
  return u != nullptr ? &u->members : nullptr;
}

std::optional<std::string> TypeResolution::get_name() const
{
  const ConcreteType * c = concrete();
  if (c == nullptr || std::holds_alternative<SpecialType>(*c)) {
    return std::nullopt;
  }
  return type_name(*c);
}

TypeResolution TypeResolution::with_note(std::string note) const
{
  TypeResolution copy = *this;
  copy.metadata.notes.push_back(std::move(note));
  return copy;
}

std::string type_name(const ConcreteType & type)
{
  return std::visit(
    Overloaded{
      [](const PlatformType & p) { return p.name; },
      [](const ConfigurationType & c) { return std::string(to_string(c.kind)) + "." + c.name; },
      [](PrimitiveType p) { return std::string(to_string(p)); },
      [](SpecialType s) { return std::string(to_string(s)); },
      [](const GlobalFunction & f) { return f.name; },
    },
    type);
}

std::string display_name(const TypeResolution & type)
{
  if (type.certainty.is_unknown()) {
    return "Произвольный";
  }
  return std::visit(
    Overloaded{
      [](const ConcreteType & c) { return type_name(c); },
      [](const UnionType & u) {
        std::string out;
        for (const auto & m : u.members) {
          if (!out.empty()) out += " | ";
          out += type_name(m.type);
        }
        return out.empty() ? std::string("Произвольный") : out;
      },
      [](const ConditionalType & c) { return "Условный(" + c.condition + ")"; },
      [](const ContextualType & c) {
        return c.base_type ? display_name(TypeResolution::inferred(1.0, *c.base_type))
                           : std::string("Произвольный");
      },
      [](const DynamicType &) { return std::string("Произвольный"); },
    },
    type.result.value);
}

}  // namespace bsl_gradual
