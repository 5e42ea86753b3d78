#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

#include <boost/multiprecision/cpp_int.hpp>

namespace tally::protocol {

using amount = boost::multiprecision::uint128_t;

constexpr std::size_t amount_length = 16;

using amount_bytes = std::array< std::byte, amount_length >;

/*
 * Clamps at the largest representable amount instead of wrapping.
 */
amount saturating_add( const amount& lhs, const amount& rhs ) noexcept;

/*
 * Clamps at zero instead of wrapping.
 */
amount saturating_sub( const amount& lhs, const amount& rhs ) noexcept;

// Little-endian, always amount_length bytes.
amount_bytes to_bytes( const amount& value ) noexcept;
amount from_bytes( std::span< const std::byte > bytes );

} // namespace tally::protocol
