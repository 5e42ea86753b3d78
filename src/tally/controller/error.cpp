#include <tally/controller/error.hpp>

#include <string>
#include <utility>

namespace tally::controller {

struct _controller_category final: std::error_category
{
  const char* name() const noexcept final;
  std::string message( int condition ) const noexcept final;
};

const char* _controller_category::name() const noexcept
{
  return "controller";
}

std::string _controller_category::message( int condition ) const noexcept
{
  using namespace std::string_literals;
  switch( static_cast< controller_errc >( condition ) )
  {
    case controller_errc::ok:
      return "ok"s;
    case controller_errc::bad_file_descriptor:
      return "bad file descriptor"s;
    case controller_errc::truncated_input:
      return "truncated input"s;
  }
  std::unreachable();
}

const std::error_category& controller_category() noexcept
{
  static _controller_category category;
  return category;
}

std::error_code make_error_code( controller_errc e )
{
  return std::error_code( static_cast< int >( e ), controller_category() );
}

} // namespace tally::controller
