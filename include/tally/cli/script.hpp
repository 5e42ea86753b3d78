#pragma once

#include <cstddef>
#include <istream>
#include <ostream>
#include <string>

#include <tally/cli/address_book.hpp>
#include <tally/controller/controller.hpp>
#include <tally/protocol/event.hpp>

namespace tally::cli {

std::string describe( const protocol::event& ev, const address_book& accounts );

/*
 * Runs every `<caller> <instruction> [args...]` line of script through the
 * controller and reports each result and its events to out. Text after '#'
 * is ignored. Calls the token rejects are reported and counted; malformed
 * lines throw std::runtime_error.
 *
 * Returns the number of rejected calls.
 */
std::size_t run_script( controller::controller& controller,
                        const address_book& accounts,
                        std::istream& script,
                        std::ostream& out );

} // namespace tally::cli
