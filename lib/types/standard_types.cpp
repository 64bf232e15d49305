// bsl_gradual/types/standard_types.cpp
#include "bsl_gradual/types/standard_types.hpp"

#include <array>
#include <string>
#include <utility>

namespace bsl_gradual
{

namespace
{

struct NameEntry
{
  std::string_view russian;
  std::string_view english;
};

constexpr std::array<std::pair<NameEntry, PrimitiveType>, 4> k_primitive_names = {{
  {{"Строка", "String"}, PrimitiveType::String},
  {{"Число", "Number"}, PrimitiveType::Number},
  {{"Булево", "Boolean"}, PrimitiveType::Boolean},
  {{"Дата", "Date"}, PrimitiveType::Date},
}};

constexpr std::array<NameEntry, 4> k_platform_names = {{
  {k_array_type, "Array"},
  {k_map_type, "Map"},
  {k_structure_type, "Structure"},
  {k_value_table_type, "ValueTable"},
}};

bool is_platform_named(const TypeResolution & t, std::string_view russian, std::string_view english)
{
  const ConcreteType * c = t.concrete();
  if (c == nullptr) return false;
  const auto * p = std::get_if<PlatformType>(c);
  return p != nullptr && (p->name == russian || p->name == english);
}

bool is_special(const TypeResolution & t, SpecialType spec)
{
  const ConcreteType * c = t.concrete();
  if (c == nullptr) return false;
  const auto * s = std::get_if<SpecialType>(c);
  return s != nullptr && *s == spec;
}

}  // namespace

TypeResolution primitive_type(PrimitiveType prim) { return TypeResolution::known(prim); }

TypeResolution special_type(SpecialType spec) { return TypeResolution::known(spec); }

TypeResolution platform_type(std::string_view name)
{
  return TypeResolution::known(PlatformType{std::string(name), {}, {}});
}

std::optional<TypeResolution> type_from_name(std::string_view name)
{
  for (const auto & [names, prim] : k_primitive_names) {
    if (name == names.russian || name == names.english) {
      return primitive_type(prim);
    }
  }
  for (const auto & names : k_platform_names) {
    if (name == names.russian || name == names.english) {
      return platform_type(names.russian);
    }
  }
  return std::nullopt;
}

bool is_primitive(const ConcreteType & t, PrimitiveType prim)
{
  const auto * p = std::get_if<PrimitiveType>(&t);
  return p != nullptr && *p == prim;
}

bool is_primitive(const TypeResolution & t, PrimitiveType prim)
{
  const ConcreteType * c = t.concrete();
  return c != nullptr && is_primitive(*c, prim);
}

bool is_number(const TypeResolution & t) { return is_primitive(t, PrimitiveType::Number); }
bool is_string(const TypeResolution & t) { return is_primitive(t, PrimitiveType::String); }
bool is_boolean(const TypeResolution & t) { return is_primitive(t, PrimitiveType::Boolean); }
bool is_date(const TypeResolution & t) { return is_primitive(t, PrimitiveType::Date); }
bool is_undefined(const TypeResolution & t) { return is_special(t, SpecialType::Undefined); }
bool is_null(const TypeResolution & t) { return is_special(t, SpecialType::Null); }

bool is_array(const TypeResolution & t) { return is_platform_named(t, k_array_type, "Array"); }

bool is_structure(const TypeResolution & t)
{
  return is_platform_named(t, k_structure_type, "Structure");
}

bool is_map(const TypeResolution & t) { return is_platform_named(t, k_map_type, "Map"); }

}  // namespace bsl_gradual
