#pragma once

#include <quill/LogMacros.h>

#include <xpx/log/formatter.hpp>
#include <xpx/log/frontend.hpp>

namespace xpx::log {

void initialize() noexcept;
logger* instance() noexcept;

} // namespace xpx::log
