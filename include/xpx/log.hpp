#pragma once

#include <xpx/log/log.hpp>
