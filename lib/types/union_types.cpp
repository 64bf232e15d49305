// bsl_gradual/types/union_types.cpp - Union type algebra
#include "bsl_gradual/types/union_types.hpp"

#include <algorithm>
#include <iterator>
#include <numeric>
#include <string>
#include <utility>

#include "bsl_gradual/types/standard_types.hpp"

namespace bsl_gradual
{

namespace
{

double total_weight(const std::vector<WeightedType> & types)
{
  return std::accumulate(
    types.begin(), types.end(), 0.0,
    [](double acc, const WeightedType & wt) { return acc + wt.weight; });
}

bool all_of_primitive(const std::vector<WeightedType> & types, PrimitiveType prim)
{
  return std::all_of(types.begin(), types.end(), [prim](const WeightedType & wt) {
    return is_primitive(wt.type, prim);
  });
}

void renormalize(std::vector<WeightedType> & types)
{
  const double total = total_weight(types);
  if (total > 0.0) {
    for (auto & wt : types) {
      wt.weight /= total;
    }
  }
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

TypeResolution UnionTypeManager::never_type()
{
  TypeResolution r = TypeResolution::unknown();
  r.source = ResolutionSource::Inferred;
  r.metadata.notes.emplace_back("Never type (empty union)");
  return r;
}

TypeResolution UnionTypeManager::create_union(const std::vector<TypeResolution> & types) const
{
  if (types.empty()) {
    return never_type();
  }
  if (types.size() == 1) {
    return types.front();
  }

  const auto n = static_cast<double>(types.size());
  std::vector<WeightedType> members;
  double confidence_sum = 0.0;

  for (const auto & t : types) {
    if (const ConcreteType * c = t.concrete()) {
      members.push_back(WeightedType{*c, 1.0 / n});
    } else if (const auto * nested = t.union_members()) {
      for (const auto & wt : *nested) {
        members.push_back(WeightedType{wt.type, wt.weight / n});
      }
    }
    // Dynamic, conditional and contextual results add no members; they only
    // dilute the weights and the confidence.
    confidence_sum += t.certainty.value();
  }

  const double confidence = confidence_sum / n;
  std::vector<WeightedType> simplified = simplify_union(normalize_union(std::move(members)));

  if (simplified.empty()) {
    return never_type();
  }

  if (simplified.size() == 1) {
    TypeResolution r = TypeResolution::inferred(confidence, std::move(simplified.front().type));
    r.metadata.notes.emplace_back("Union type simplified to concrete");
    return r;
  }

  const size_t count = simplified.size();
  TypeResolution r = TypeResolution::inferred(
    std::min(confidence, limits_.confidence_cap), UnionType{std::move(simplified)});
  r.metadata.notes.push_back("Union of " + std::to_string(count) + " types");
  return r;
}

TypeResolution UnionTypeManager::from_concrete_types(const std::vector<ConcreteType> & types) const
{
  std::vector<TypeResolution> resolutions;
  resolutions.reserve(types.size());
  for (const auto & t : types) {
    resolutions.push_back(TypeResolution::known(t));
  }
  return create_union(resolutions);
}

TypeResolution UnionTypeManager::add_type_to_union(
  const TypeResolution & union_type, const TypeResolution & new_type) const
{
  const auto * members = union_type.union_members();
  if (members == nullptr) {
    return create_union({union_type, new_type});
  }

  // Existing members re-enter with their weight as confidence.
  std::vector<TypeResolution> all;
  all.reserve(members->size() + 1);
  for (const auto & wt : *members) {
    all.push_back(TypeResolution::inferred(wt.weight, wt.type));
  }
  all.push_back(new_type);
  return create_union(all);
}

// ============================================================================
// Normalization and simplification
// ============================================================================

std::vector<WeightedType> UnionTypeManager::normalize_union(std::vector<WeightedType> types)
{
  std::vector<WeightedType> result;
  result.reserve(types.size());

  for (auto & wt : types) {
    auto existing = std::find_if(result.begin(), result.end(), [&](const WeightedType & r) {
      return r.type == wt.type;
    });
    if (existing != result.end()) {
      existing->weight += wt.weight;
    } else {
      result.push_back(std::move(wt));
    }
  }

  std::stable_sort(result.begin(), result.end(), [](const WeightedType & a, const WeightedType & b) {
    return a.weight > b.weight;
  });
  return result;
}

std::vector<WeightedType> UnionTypeManager::simplify_union(std::vector<WeightedType> types) const
{
  if (types.empty()) {
    return types;
  }

  if (all_of_primitive(types, PrimitiveType::Number)) {
    return {WeightedType{PrimitiveType::Number, total_weight(types)}};
  }
  if (all_of_primitive(types, PrimitiveType::String)) {
    return {WeightedType{PrimitiveType::String, total_weight(types)}};
  }

  const double floor = limits_.min_weight;
  types.erase(
    std::remove_if(
      types.begin(), types.end(), [floor](const WeightedType & wt) { return wt.weight < floor; }),
    types.end());
  renormalize(types);

  if (types.size() > limits_.max_members) {
    types.resize(limits_.max_members);
    renormalize(types);
  }
  return types;
}

// ============================================================================
// Set operations and queries
// ============================================================================

std::vector<WeightedType> UnionTypeManager::intersect_unions(
  const std::vector<WeightedType> & lhs, const std::vector<WeightedType> & rhs)
{
  std::vector<WeightedType> result;
  for (const auto & a : lhs) {
    for (const auto & b : rhs) {
      if (a.type == b.type) {
        result.push_back(WeightedType{a.type, a.weight * b.weight});
      }
    }
  }
  return normalize_union(std::move(result));
}

std::vector<WeightedType> UnionTypeManager::merge_unions(
  const std::vector<WeightedType> & lhs, const std::vector<WeightedType> & rhs)
{
  std::vector<WeightedType> all = lhs;
  all.insert(all.end(), rhs.begin(), rhs.end());
  for (auto & wt : all) {
    wt.weight *= 0.5;
  }
  return normalize_union(std::move(all));
}

std::vector<WeightedType> UnionTypeManager::filter_union(
  const std::vector<WeightedType> & members,
  const std::function<bool(const ConcreteType &)> & predicate)
{
  std::vector<WeightedType> kept;
  std::copy_if(
    members.begin(), members.end(), std::back_inserter(kept),
    [&](const WeightedType & wt) { return predicate(wt.type); });
  return normalize_union(std::move(kept));
}

bool UnionTypeManager::contains_type(
  const std::vector<WeightedType> & members, const ConcreteType & type)
{
  return std::any_of(
    members.begin(), members.end(), [&](const WeightedType & wt) { return wt.type == type; });
}

double UnionTypeManager::get_type_weight(
  const std::vector<WeightedType> & members, const ConcreteType & type)
{
  auto it = std::find_if(
    members.begin(), members.end(), [&](const WeightedType & wt) { return wt.type == type; });
  return it != members.end() ? it->weight : 0.0;
}

const ConcreteType * UnionTypeManager::get_most_likely_type(
  const std::vector<WeightedType> & members)
{
  return members.empty() ? nullptr : &members.front().type;
}

std::vector<ConcreteType> UnionTypeManager::get_all_types(const std::vector<WeightedType> & members)
{
  std::vector<ConcreteType> out;
  out.reserve(members.size());
  for (const auto & wt : members) {
    out.push_back(wt.type);
  }
  return out;
}

bool UnionTypeManager::is_compatible_with_union(
  const TypeResolution & type, const std::vector<WeightedType> & members)
{
  const ConcreteType * c = type.concrete();
  if (c == nullptr) {
    return true;
  }
  return contains_type(members, *c);
}

}  // namespace bsl_gradual
