// bsl_gradual/driver/type_json.cpp - JSON export of types and check results
//
#include "bsl_gradual/driver/type_json.hpp"

#include <fstream>

#include "bsl_gradual/types/standard_types.hpp"

namespace bsl_gradual
{

using nlohmann::json;

namespace
{

std::string certainty_kind_name(Certainty::Kind kind)
{
  switch (kind) {
    case Certainty::Kind::Known:
      return "Known";
    case Certainty::Kind::Inferred:
      return "Inferred";
    case Certainty::Kind::Unknown:
      return "Unknown";
  }
  return "Unknown";
}

json j_parameter(const Parameter & p)
{
  json j{{"name", p.name}, {"optional", p.optional}, {"by_value", p.by_value}};
  if (p.type_name) j["type"] = *p.type_name;
  return j;
}

json j_method(const Method & m)
{
  json params = json::array();
  for (const auto & p : m.parameters) params.push_back(j_parameter(p));
  json j{{"name", m.name}, {"parameters", params}, {"is_function", m.is_function}};
  if (m.return_type) j["return_type"] = *m.return_type;
  return j;
}

json j_attribute(const Attribute & a)
{
  return json{
    {"name", a.name}, {"type", a.type_name}, {"is_composite", a.is_composite}, {"types", a.types}};
}

json j_effect(const TypeEffect & effect)
{
  static constexpr const char * k_names[] = {
    "MayBeNull", "RequiresTransaction", "RequiresLock", "RequiresContext", "ModifiedByExtension"};
  json j{{"kind", k_names[static_cast<size_t>(effect.kind)]}};
  if (!effect.detail.empty()) j["detail"] = effect.detail;
  if (effect.context) j["context"] = std::string(to_string(*effect.context));
  return j;
}

json j_optional_result(const std::shared_ptr<const ResolutionResult> & result)
{
  return result ? to_json(*result) : json(nullptr);
}

json j_scope(const Scope & scope) { return to_string(scope); }

/// Type named in a signature file: a name, or an exported TypeResolution.
TypeResolution type_from_signature_field(const json & j)
{
  if (j.is_string()) {
    const auto name = j.get<std::string>();
    if (auto type = type_from_name(name)) return *type;
    return platform_type(name);
  }
  if (j.is_object() && j.contains("display")) {
    if (auto type = type_from_name(j.at("display").get<std::string>())) return *type;
  }
  return TypeResolution::unknown();
}

}  // namespace

// ============================================================================
// Export
// ============================================================================

json to_json(const Certainty & certainty)
{
  json j{{"kind", certainty_kind_name(certainty.kind())}};
  if (certainty.is_inferred()) j["confidence"] = certainty.value();
  return j;
}

json to_json(const ConcreteType & type)
{
  if (const auto * prim = std::get_if<PrimitiveType>(&type)) {
    return json{{"kind", "Primitive"}, {"name", std::string(to_string(*prim))}};
  }
  if (const auto * special = std::get_if<SpecialType>(&type)) {
    return json{{"kind", "Special"}, {"name", std::string(to_string(*special))}};
  }
  if (const auto * platform = std::get_if<PlatformType>(&type)) {
    json methods = json::array();
    for (const auto & m : platform->methods) methods.push_back(j_method(m));
    json properties = json::array();
    for (const auto & p : platform->properties) {
      properties.push_back(json{{"name", p.name}, {"type", p.type_name}, {"readonly", p.readonly}});
    }
    return json{
      {"kind", "Platform"}, {"name", platform->name}, {"methods", methods},
      {"properties", properties}};
  }
  if (const auto * config = std::get_if<ConfigurationType>(&type)) {
    json attributes = json::array();
    for (const auto & a : config->attributes) attributes.push_back(j_attribute(a));
    json sections = json::array();
    for (const auto & ts : config->tabular_sections) {
      json attrs = json::array();
      for (const auto & a : ts.attributes) attrs.push_back(j_attribute(a));
      json section{{"name", ts.name}, {"attributes", attrs}};
      if (ts.synonym) section["synonym"] = *ts.synonym;
      sections.push_back(std::move(section));
    }
    return json{
      {"kind", "Configuration"},
      {"metadata_kind", std::string(to_string(config->kind))},
      {"name", config->name},
      {"attributes", attributes},
      {"tabular_sections", sections}};
  }

  const auto & fn = std::get<GlobalFunction>(type);
  json params = json::array();
  for (const auto & p : fn.parameters) {
    json param{{"name", p.name}, {"optional", p.is_optional}};
    param["type"] = p.type ? to_json(*p.type) : json(nullptr);
    if (p.default_value) param["default"] = *p.default_value;
    if (p.description) param["description"] = *p.description;
    params.push_back(std::move(param));
  }
  json contexts = json::array();
  for (auto c : fn.context_required) contexts.push_back(std::string(to_string(c)));
  return json{
    {"kind", "GlobalFunction"},
    {"name", fn.name},
    {"english_name", fn.english_name},
    {"parameters", params},
    {"return_type", fn.return_type ? to_json(*fn.return_type) : json(nullptr)},
    {"pure", fn.pure},
    {"polymorphic", fn.polymorphic},
    {"context_required", contexts}};
}

json to_json(const ResolutionResult & result)
{
  if (const auto * concrete = result.concrete()) {
    return json{{"kind", "Concrete"}, {"type", to_json(*concrete)}};
  }
  if (const auto * u = result.as_union()) {
    json members = json::array();
    for (const auto & m : u->members) {
      members.push_back(json{{"type", to_json(m.type)}, {"weight", m.weight}});
    }
    return json{{"kind", "Union"}, {"members", members}};
  }
  if (const auto * cond = std::get_if<ConditionalType>(&result.value)) {
    return json{
      {"kind", "Conditional"},
      {"condition", cond->condition},
      {"then", j_optional_result(cond->then_type)},
      {"else", j_optional_result(cond->else_type)}};
  }
  if (const auto * ctx = std::get_if<ContextualType>(&result.value)) {
    json effects = json::array();
    for (const auto & e : ctx->effects) effects.push_back(j_effect(e));
    return json{
      {"kind", "Contextual"},
      {"base", j_optional_result(ctx->base_type)},
      {"effects", effects},
      {"context", std::string(to_string(ctx->context))}};
  }
  return json{{"kind", "Dynamic"}};
}

json to_json(const TypeResolution & type)
{
  json j{
    {"certainty", to_json(type.certainty)},
    {"result", to_json(type.result)},
    {"source", std::string(to_string(type.source))},
    {"display", display_name(type)}};

  const auto & meta = type.metadata;
  if (!meta.notes.empty()) j["notes"] = meta.notes;
  if (meta.file) j["file"] = *meta.file;
  if (meta.line) j["line"] = *meta.line;
  if (meta.column) j["column"] = *meta.column;
  if (type.active_facet) j["active_facet"] = std::string(to_string(*type.active_facet));
  if (!type.available_facets.empty()) {
    json facets = json::array();
    for (auto f : type.available_facets) facets.push_back(std::string(to_string(f)));
    j["available_facets"] = facets;
  }
  return j;
}

json to_json(const FunctionSignature & signature)
{
  json params = json::array();
  for (const auto & [name, type] : signature.params) {
    params.push_back(json{{"name", name}, {"type", to_json(type)}});
  }
  return json{
    {"params", params},
    {"return_type", to_json(signature.return_type)},
    {"exported", signature.exported},
    {"optional_count", signature.optional_count}};
}

json to_json(const VariableTypes & variables)
{
  json j = json::object();
  for (const auto & [name, type] : variables) j[name] = to_json(type);
  return j;
}

json to_json(const TypeContext & context)
{
  json functions = json::object();
  for (const auto & [name, sig] : context.functions) functions[name] = to_json(sig);

  json locals = json::object();
  for (const auto & [name, vars] : context.function_variables) locals[name] = to_json(vars);

  return json{
    {"variables", to_json(context.variables)},
    {"functions", functions},
    {"function_variables", locals},
    {"scope", j_scope(context.current_scope)}};
}

json to_json(const Diagnostic & diagnostic)
{
  json j{
    {"severity", std::string(to_string(diagnostic.severity))},
    {"code", diagnostic.code},
    {"message", diagnostic.message},
    {"file", diagnostic.file},
    {"line", diagnostic.line()},
    {"column", diagnostic.column()}};
  if (diagnostic.help_message) j["help"] = *diagnostic.help_message;
  return j;
}

json to_json(const DiagnosticBag & diagnostics)
{
  json list = json::array();
  for (const auto & d : diagnostics) list.push_back(to_json(d));
  return list;
}

json to_json(const CheckResult & result)
{
  const auto & s = result.stats;
  return json{
    {"context", to_json(result.context)},
    {"diagnostics", to_json(result.diagnostics)},
    {"statistics",
     {{"functions_analyzed", s.functions_analyzed},
      {"flow_states", s.flow_states},
      {"merge_points", s.merge_points},
      {"dependency_nodes", s.dependency_nodes},
      {"dependency_edges", s.dependency_edges}}}};
}

// ============================================================================
// Signature Import
// ============================================================================

SignatureLoadResult signatures_from_json(const json & j)
{
  const json * functions = &j;
  if (j.is_object() && j.contains("functions")) functions = &j.at("functions");
  if (!functions->is_object()) {
    return SignatureLoadResult::fail("signatures must be a JSON object keyed by function name");
  }

  std::map<std::string, FunctionSignature> out;
  try {
    for (const auto & [name, entry] : functions->items()) {
      if (!entry.is_object()) {
        return SignatureLoadResult::fail("signature of '" + name + "' must be an object");
      }
      FunctionSignature sig;
      if (entry.contains("params")) {
        for (const auto & p : entry.at("params")) {
          const TypeResolution type =
            p.contains("type") ? type_from_signature_field(p.at("type")) : TypeResolution::unknown();
          sig.params.emplace_back(p.at("name").get<std::string>(), type);
        }
      }
      if (entry.contains("return_type")) {
        sig.return_type = type_from_signature_field(entry.at("return_type"));
      }
      sig.exported = entry.value("exported", true);
      sig.optional_count = entry.value("optional_count", size_t{0});
      if (sig.optional_count > sig.params.size()) {
        return SignatureLoadResult::fail(
          "signature of '" + name + "' declares more optional parameters than parameters");
      }
      out.emplace(name, std::move(sig));
    }
  } catch (const json::exception & e) {
    return SignatureLoadResult::fail(std::string("invalid signature file: ") + e.what());
  }
  return SignatureLoadResult::ok(std::move(out));
}

SignatureLoadResult load_signatures_file(const std::filesystem::path & path)
{
  std::ifstream in(path);
  if (!in) {
    return SignatureLoadResult::fail("cannot open " + path.string());
  }
  try {
    return signatures_from_json(json::parse(in));
  } catch (const json::parse_error & e) {
    return SignatureLoadResult::fail(std::string("failed to parse JSON: ") + e.what());
  }
}

}  // namespace bsl_gradual
