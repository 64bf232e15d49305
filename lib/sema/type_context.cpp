// bsl_gradual/sema/type_context.cpp
#include "bsl_gradual/sema/type_context.hpp"

namespace bsl_gradual
{

bool operator==(const FunctionSignature & a, const FunctionSignature & b)
{
  return a.params == b.params && a.return_type == b.return_type && a.exported == b.exported &&
         a.optional_count == b.optional_count;
}

void TypeContext::push_scope(Scope scope)
{
  scope_stack.push_back(std::move(current_scope));
  current_scope = std::move(scope);
}

void TypeContext::pop_scope()
{
  if (scope_stack.empty()) return;
  current_scope = std::move(scope_stack.back());
  scope_stack.pop_back();
}

const TypeResolution * TypeContext::lookup_variable(std::string_view name) const
{
  auto it = variables.find(std::string(name));
  return it != variables.end() ? &it->second : nullptr;
}

const FunctionSignature * TypeContext::lookup_function(std::string_view name) const
{
  auto it = functions.find(std::string(name));
  return it != functions.end() ? &it->second : nullptr;
}

}  // namespace bsl_gradual
