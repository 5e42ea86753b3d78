#pragma once

#include <string_view>

#include <quill/LogMacros.h>

#include <tally/log/formatter.hpp>
#include <tally/log/frontend.hpp>

namespace tally::log {

void initialize() noexcept;
logger* instance() noexcept;

// Accepts quill level names such as "debug" or "warning".
void set_level( std::string_view level );

} // namespace tally::log
