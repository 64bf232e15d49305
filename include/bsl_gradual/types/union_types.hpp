// bsl_gradual/types/union_types.hpp - Construction and algebra of union types
//
// A union is a weighted list of concrete types. After normalization every
// concrete type appears once, weights sum to 1 and are sorted descending.
// Simplification bounds the size of a union so that deep branching cannot
// blow it up.
//
#pragma once

#include <cstddef>
#include <functional>
#include <vector>

#include "bsl_gradual/types/type_resolution.hpp"

namespace bsl_gradual
{

/**
 * Tunables of union simplification.
 */
struct UnionLimits
{
  /// Unions keep at most this many members (highest weight first).
  size_t max_members = 5;
  /// Members lighter than this are dropped before renormalizing.
  double min_weight = 0.05;
  /// Confidence reported for a multi-member union never exceeds this.
  double confidence_cap = 0.9;
};

class UnionTypeManager
{
public:
  UnionTypeManager() = default;
  explicit UnionTypeManager(UnionLimits limits) : limits_(limits) {}

  [[nodiscard]] const UnionLimits & limits() const noexcept { return limits_; }

  /**
   * Combine resolutions into one.
   *
   * - no input: the "never" resolution (Unknown, Dynamic)
   * - one input: returned unchanged
   * - otherwise every input gets weight 1/N (members of a nested union keep
   *   their share scaled by 1/N), the certainties are averaged with Known = 1
   *   and Unknown = 0, and the member list is normalized and simplified. One
   *   surviving member gives an Inferred concrete type, several give an
   *   Inferred union with capped confidence.
   */
  [[nodiscard]] TypeResolution create_union(const std::vector<TypeResolution> & types) const;

  /// create_union over Known resolutions of the given types.
  [[nodiscard]] TypeResolution from_concrete_types(const std::vector<ConcreteType> & types) const;

  /// Add one more alternative to a union (or to a plain type).
  [[nodiscard]] TypeResolution add_type_to_union(
    const TypeResolution & union_type, const TypeResolution & new_type) const;

  /// Merge equal members (summing weights), then sort by weight descending.
  [[nodiscard]] static std::vector<WeightedType> normalize_union(std::vector<WeightedType> types);

  /// Pairwise intersection; the weight of a common member is the product.
  [[nodiscard]] static std::vector<WeightedType> intersect_unions(
    const std::vector<WeightedType> & lhs, const std::vector<WeightedType> & rhs);

  /// Concatenate both unions with halved weights, then normalize.
  [[nodiscard]] static std::vector<WeightedType> merge_unions(
    const std::vector<WeightedType> & lhs, const std::vector<WeightedType> & rhs);

  [[nodiscard]] static std::vector<WeightedType> filter_union(
    const std::vector<WeightedType> & members,
    const std::function<bool(const ConcreteType &)> & predicate);

  [[nodiscard]] static bool contains_type(
    const std::vector<WeightedType> & members, const ConcreteType & type);

  /// Weight of `type` in the union, 0 when absent.
  [[nodiscard]] static double get_type_weight(
    const std::vector<WeightedType> & members, const ConcreteType & type);

  /// First member (members are kept sorted), nullptr for an empty union.
  [[nodiscard]] static const ConcreteType * get_most_likely_type(
    const std::vector<WeightedType> & members);

  [[nodiscard]] static std::vector<ConcreteType> get_all_types(
    const std::vector<WeightedType> & members);

  /// True if a concrete `type` equals some member. Non-concrete types are
  /// always considered compatible.
  [[nodiscard]] static bool is_compatible_with_union(
    const TypeResolution & type, const std::vector<WeightedType> & members);

  /// Resolution returned for an empty union.
  [[nodiscard]] static TypeResolution never_type();

private:
  [[nodiscard]] std::vector<WeightedType> simplify_union(std::vector<WeightedType> types) const;

  UnionLimits limits_;
};

}  // namespace bsl_gradual
