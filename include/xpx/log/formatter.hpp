#pragma once

#include <span>

#include <quill/BinaryDataDeferredFormatCodec.h>

#include <xpx/encode.hpp>

namespace xpx::log {

struct hex_tag
{};

using hex = quill::BinaryData< hex_tag >;

struct base32_tag
{};

using base32 = quill::BinaryData< base32_tag >;

} // namespace xpx::log

template<>
struct fmtquill::formatter< xpx::log::hex >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const xpx::log::hex& bin_data, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(), "{}", xpx::encode::to_hex( std::span( bin_data.data(), bin_data.size() ) ) );
  }
};

template<>
struct quill::Codec< xpx::log::hex >: quill::BinaryDataDeferredFormatCodec< xpx::log::hex >
{};

template<>
struct fmtquill::formatter< xpx::log::base32 >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const xpx::log::base32& bin_data, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(),
                                "{}",
                                xpx::encode::to_base32( std::span( bin_data.data(), bin_data.size() ) ) );
  }
};

template<>
struct quill::Codec< xpx::log::base32 >: quill::BinaryDataDeferredFormatCodec< xpx::log::base32 >
{};
