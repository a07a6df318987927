#pragma once

#include <xpx/protocol/account.hpp>
#include <xpx/protocol/address.hpp>
#include <xpx/protocol/alias.hpp>
#include <xpx/protocol/error.hpp>
#include <xpx/protocol/identifier.hpp>
#include <xpx/protocol/mosaic_id.hpp>
#include <xpx/protocol/namespace_id.hpp>
#include <xpx/protocol/namespace_info.hpp>
#include <xpx/protocol/namespace_path.hpp>
#include <xpx/protocol/network_type.hpp>
