#pragma once

#include <xpx/memory/memory.hpp>
