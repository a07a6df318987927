#pragma once

#include <xpx/crypto/checksum.hpp>
#include <xpx/crypto/hash.hpp>
