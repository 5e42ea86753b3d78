#pragma once

#include <string_view>

#include <yaml-cpp/yaml.h>

#include <tally/cli/address_book.hpp>
#include <tally/controller/controller.hpp>
#include <tally/protocol/amount.hpp>

namespace tally::cli {

// Decimal digits only, at most 2^128 - 1.
protocol::amount parse_amount( std::string_view text );

/*
 * Reads the accounts: alias map into accounts, then builds the genesis from
 * the token: section. Keys other than token.creator fall back to
 * controller::default_genesis. Throws std::runtime_error on invalid values.
 */
controller::genesis_data load_genesis( const YAML::Node& config, address_book& accounts );

} // namespace tally::cli
