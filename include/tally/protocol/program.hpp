#pragma once

#include <string>
#include <vector>

#include <tally/protocol/event.hpp>

namespace tally::protocol {

struct program_input
{
  std::vector< std::string > arguments;
  std::vector< std::byte > stdin;
};

struct program_output
{
  std::vector< std::byte > stdout;
  std::vector< event > events;
};

} // namespace tally::protocol
