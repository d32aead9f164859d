#include <conduit/dispatch/dispatch_table.hpp>

#include <conduit/blake3/hash.hpp>
#include <conduit/common/critical.hpp>
#include <conduit/common/result.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace conduit::dispatch {

void dispatch_table::add(std::string facet,
                         std::string signature,
                         const visibility_t visibility,
                         facet_handler_t handler) {
  if (sealed_) {
    conduit::common::critical("dispatch table is sealed; cannot add " +
                              signature);
  }
  if (!handler) {
    conduit::common::critical("dispatch handler missing for " + signature);
  }
  auto selector = conduit::blake3::selector(signature);
  if (entries_.contains(selector)) {
    spdlog::error("Selector {} for '{}' already registered by '{}'",
                  conduit::schema::to_hex(conduit::schema::bytes_view_t{
                      selector.data(), selector.size()}),
                  signature, entries_.at(selector).function.signature);
    conduit::common::critical("duplicate dispatch selector");
  }

  auto function = conduit::schema::dispatch_function_t{};
  function.facet = std::move(facet);
  function.signature = std::move(signature);
  function.selector = selector;
  function.self_only = visibility == visibility_t::self_only;
  spdlog::debug("Registered {}::{}", function.facet, function.signature);
  entries_.emplace(selector, entry{.function = std::move(function),
                                   .visibility = visibility,
                                   .handler = std::move(handler)});
}

void dispatch_table::seal() {
  sealed_ = true;
  spdlog::info("Dispatch table sealed with {} function(s)", entries_.size());
}

bool dispatch_table::sealed() const {
  return sealed_;
}

const dispatch_table::entry* dispatch_table::find(
    const conduit::schema::selector_t& selector) const {
  auto it = entries_.find(selector);
  if (it == std::end(entries_)) {
    return nullptr;
  }
  return &it->second;
}

std::vector<conduit::schema::dispatch_function_t> dispatch_table::functions()
    const {
  auto out = std::vector<conduit::schema::dispatch_function_t>{};
  out.reserve(entries_.size());
  for (const auto& [selector, value] : entries_) {
    out.push_back(value.function);
  }
  return out;
}

conduit::schema::transaction_result_t dispatch_table::dispatch(
    facet_context& context,
    const conduit::schema::bytes_view_t& call_data) const {
  auto selector = conduit::schema::selector_t{};
  if (call_data.size() < selector.size()) {
    return conduit::common::make_error(
        conduit::schema::transaction_error_code::malformed_payload,
        "call data shorter than a selector");
  }
  std::copy_n(std::begin(call_data), selector.size(), std::begin(selector));

  const auto* target = find(selector);
  if (target == nullptr) {
    return conduit::common::make_error(
        conduit::schema::transaction_error_code::unknown_selector,
        "no function registered for selector " +
            conduit::schema::to_hex(conduit::schema::bytes_view_t{
                selector.data(), selector.size()}));
  }
  if (target->visibility == visibility_t::self_only &&
      context.caller != context.self) {
    return conduit::common::make_error(
        conduit::schema::transaction_error_code::unauthorized,
        target->function.signature + " is callable only by the unit");
  }
  return target->handler(context, call_data.subspan(selector.size()));
}

}  // namespace conduit::dispatch
