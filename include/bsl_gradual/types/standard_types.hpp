// bsl_gradual/types/standard_types.hpp - Constructors and predicates for built-in types
#pragma once

#include <optional>
#include <string_view>

#include "bsl_gradual/types/type_resolution.hpp"

namespace bsl_gradual
{

// ============================================================================
// Constructors (all Known / Static)
// ============================================================================

[[nodiscard]] TypeResolution primitive_type(PrimitiveType prim);
[[nodiscard]] TypeResolution special_type(SpecialType spec);
[[nodiscard]] TypeResolution platform_type(std::string_view name);

[[nodiscard]] inline TypeResolution string_type() { return primitive_type(PrimitiveType::String); }
[[nodiscard]] inline TypeResolution number_type() { return primitive_type(PrimitiveType::Number); }
[[nodiscard]] inline TypeResolution boolean_type() { return primitive_type(PrimitiveType::Boolean); }
[[nodiscard]] inline TypeResolution date_type() { return primitive_type(PrimitiveType::Date); }

/// Canonical names of the collection types.
inline constexpr std::string_view k_array_type = "Массив";
inline constexpr std::string_view k_structure_type = "Структура";
inline constexpr std::string_view k_map_type = "Соответствие";
inline constexpr std::string_view k_value_table_type = "ТаблицаЗначений";

/**
 * Resolve a type name written in source (Тип("Строка"), Новый Массив) in
 * either Russian or English spelling. Primitives map to primitive types,
 * the collection types to platform types under their Russian name.
 * Returns std::nullopt for names that are not in the table.
 */
[[nodiscard]] std::optional<TypeResolution> type_from_name(std::string_view name);

// ============================================================================
// Predicates (look at the result only, not at certainty)
// ============================================================================

[[nodiscard]] bool is_primitive(const TypeResolution & t, PrimitiveType prim);
[[nodiscard]] bool is_number(const TypeResolution & t);
[[nodiscard]] bool is_string(const TypeResolution & t);
[[nodiscard]] bool is_boolean(const TypeResolution & t);
[[nodiscard]] bool is_date(const TypeResolution & t);
[[nodiscard]] bool is_undefined(const TypeResolution & t);
[[nodiscard]] bool is_null(const TypeResolution & t);
[[nodiscard]] bool is_array(const TypeResolution & t);
[[nodiscard]] bool is_structure(const TypeResolution & t);
[[nodiscard]] bool is_map(const TypeResolution & t);

/// Same tests on a bare concrete type (used for union members).
[[nodiscard]] bool is_primitive(const ConcreteType & t, PrimitiveType prim);

}  // namespace bsl_gradual
