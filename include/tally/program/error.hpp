#pragma once

#include <expected>
#include <system_error>

namespace tally::program {

enum class program_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  invalid_instruction,
  invalid_argument,
  malformed_output
};

const std::error_category& program_category() noexcept;

std::error_code make_error_code( program_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace tally::program

template<>
struct std::is_error_code_enum< tally::program::program_errc >: public std::true_type
{};
