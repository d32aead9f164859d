#pragma once

#include <conduit/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: dispatch function.
// Dispatch workflow: Loupe view of one registered selector.
namespace conduit::schema {

template <uint16_t Version>
struct dispatch_function;

template <>
struct dispatch_function<1> final {
  uint16_t version{1};
  std::string facet;
  std::string signature;
  selector_t selector{};
  bool self_only{};
};

using dispatch_function_t = dispatch_function<1>;

}  // namespace conduit::schema
