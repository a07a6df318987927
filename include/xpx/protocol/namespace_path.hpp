#pragma once

#include <string_view>
#include <vector>

#include <xpx/protocol/error.hpp>
#include <xpx/protocol/namespace_id.hpp>

namespace xpx::protocol {

constexpr std::size_t max_namespace_depth = 3;
constexpr char namespace_separator        = '.';

// Root first, leaf last
using namespace_path = std::vector< namespace_id >;

/**
 * Checks a single namespace segment against the network name grammar,
 * ^[a-z0-9][a-z0-9_-]*$
 */
bool is_valid_namespace_name( std::string_view name ) noexcept;

/**
 * Derives the identifier of the segment `name` beneath `parent`.
 *
 * The identifier is the first eight bytes, little endian, of
 * SHA3-256( LE64( parent ) || name ) with the namespace bit forced on.
 * Root segments use the empty namespace id as their parent.
 */
namespace_id derive_namespace_id( std::string_view name, const namespace_id& parent = root_namespace_parent );

/**
 * Derives the identifiers for every level of a dotted name such as
 * "root", "root.child" or "root.child.grandchild".
 */
result< namespace_path > derive_namespace_path( std::string_view name );

result< namespace_id > namespace_id_from_name( std::string_view name );

} // namespace xpx::protocol
