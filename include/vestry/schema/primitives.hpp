#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace vestry::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using account_id_t = hash32_t;
// Checked: underflow and overflow throw instead of wrapping.
using amount_t = boost::multiprecision::checked_uint256_t;
using timestamp_seconds_t = uint64_t;
using duration_seconds_t = uint64_t;

hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(const std::string_view& bytes);
std::optional<hash32_t> try_make_hash32(const std::string_view& bytes);
hash32_t make_zero_hash();

/// The zero account is never a valid recipient or safe address.
bool is_zero_account(const account_id_t& account);

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const account_id_t& account);
std::optional<bytes_t> try_from_hex(const std::string_view hex);

/// Parse a decimal amount; std::nullopt on empty, signed or non-digit input.
std::optional<amount_t> try_make_amount(const std::string_view decimal);

}  // namespace vestry::schema
