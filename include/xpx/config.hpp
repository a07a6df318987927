#pragma once

#include <xpx/config/config.hpp>
#include <xpx/config/error.hpp>
