#pragma once

#include <xpx/encode/base32.hpp>
#include <xpx/encode/error.hpp>
#include <xpx/encode/hex.hpp>
