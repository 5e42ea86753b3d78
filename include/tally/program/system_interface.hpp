#pragma once

#include <tally/program/error.hpp>
#include <tally/protocol/account.hpp>

#include <span>
#include <string>
#include <system_error>

namespace tally::program {

enum class file_descriptor : int // NOLINT(performance-enum-size)
{
  stdin,
  stdout
};

struct system_interface
{
  system_interface()                          = default;
  system_interface( const system_interface& ) = delete;
  system_interface( system_interface&& )      = delete;
  virtual ~system_interface()                 = default;

  system_interface& operator=( const system_interface& ) = delete;
  system_interface& operator=( system_interface&& )      = delete;

  virtual std::span< const std::string > arguments() = 0;

  // Reads fill the whole buffer or fail without consuming input.
  virtual std::error_code write( file_descriptor fd, std::span< const std::byte > buffer ) = 0;
  virtual std::error_code read( file_descriptor fd, std::span< std::byte > buffer )        = 0;

  // Authenticated by the host before the program runs.
  virtual const protocol::account& get_caller() = 0;
};

} // namespace tally::program
