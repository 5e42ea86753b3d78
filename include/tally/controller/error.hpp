#pragma once

#include <expected>
#include <system_error>

namespace tally::controller {

enum class controller_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  bad_file_descriptor,
  truncated_input
};

const std::error_category& controller_category() noexcept;

std::error_code make_error_code( controller_errc e );

template< typename T >
using result = std::expected< T, std::error_code >;

} // namespace tally::controller

template<>
struct std::is_error_code_enum< tally::controller::controller_errc >: public std::true_type
{};
