#pragma once

#include <vestry/schema/primitives.hpp>
#include <functional>

namespace vestry::execution {

/// Current logical time in seconds. Read once per operation.
using time_source_t = std::function<vestry::schema::timestamp_seconds_t()>;

/// Returns true when `caller` may invoke administrator operations.
using authorizer_t =
    std::function<bool(const vestry::schema::account_id_t& caller)>;

/// Token movement performed outside the escrow.
///
/// `pull` moves `amount` from `from` into the escrow and fails on insufficient
/// balance or allowance. `push` moves `amount` out of the escrow to `to` and
/// fails on insufficient escrow balance. Both return false on failure without
/// having moved anything.
struct funds_adapter_t final {
  std::function<bool(const vestry::schema::account_id_t& from,
                     const vestry::schema::amount_t& amount)>
      pull;
  std::function<bool(const vestry::schema::account_id_t& to,
                     const vestry::schema::amount_t& amount)>
      push;
};

}  // namespace vestry::execution
