#pragma once

#include <tally/controller/error.hpp>
#include <tally/program/system_interface.hpp>
#include <tally/protocol/program.hpp>

#include <cstddef>
#include <span>
#include <string>

namespace tally::controller {

/*
 * Host side of a single program call. Owns the output frame, borrows the
 * input for the duration of the call.
 */
class execution_context final: public program::system_interface
{
public:
  execution_context()                           = delete;
  execution_context( const execution_context& ) = delete;
  execution_context( execution_context&& )      = delete;
  execution_context( const protocol::account& caller, const protocol::program_input& input );

  ~execution_context() final = default;

  execution_context& operator=( const execution_context& ) = delete;
  execution_context& operator=( execution_context&& )      = delete;

  std::span< const std::string > arguments() final;

  std::error_code write( program::file_descriptor fd, std::span< const std::byte > buffer ) final;
  std::error_code read( program::file_descriptor fd, std::span< std::byte > buffer ) final;

  const protocol::account& get_caller() final;

  std::size_t remaining_input() const noexcept;

  protocol::program_output& output() noexcept;

private:
  const protocol::account& _caller;
  const protocol::program_input& _input;
  std::size_t _input_offset = 0;
  protocol::program_output _output;
};

} // namespace tally::controller
