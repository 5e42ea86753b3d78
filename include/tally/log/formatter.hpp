#pragma once

#include <span>

#include <quill/BinaryDataDeferredFormatCodec.h>
#include <quill/DeferredFormatCodec.h>

#include <tally/encode.hpp>
#include <tally/protocol/account.hpp>
#include <tally/protocol/amount.hpp>

namespace tally::log {

struct hex_tag
{};

using hex = quill::BinaryData< hex_tag >;

} // namespace tally::log

template<>
struct fmtquill::formatter< tally::log::hex >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const tally::log::hex& bin_data, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(),
                                "{}",
                                tally::encode::to_hex( std::span( bin_data.data(), bin_data.size() ) ) );
  }
};

template<>
struct quill::Codec< tally::log::hex >: quill::BinaryDataDeferredFormatCodec< tally::log::hex >
{};

template<>
struct fmtquill::formatter< tally::protocol::account >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const tally::protocol::account& account, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(), "{}", tally::protocol::to_hex( account ) );
  }
};

template<>
struct quill::Codec< tally::protocol::account >: quill::DeferredFormatCodec< tally::protocol::account >
{};

template<>
struct fmtquill::formatter< tally::protocol::amount >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const tally::protocol::amount& value, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(), "{}", value.str() );
  }
};

template<>
struct quill::Codec< tally::protocol::amount >: quill::DeferredFormatCodec< tally::protocol::amount >
{};
