#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <xpx/protocol/account.hpp>
#include <xpx/protocol/alias.hpp>
#include <xpx/protocol/error.hpp>
#include <xpx/protocol/namespace_id.hpp>
#include <xpx/protocol/namespace_path.hpp>

namespace xpx::protocol {

enum class namespace_type : std::uint8_t
{
  root = 0,
  sub  = 1
};

struct namespace_name
{
  namespace_id id;
  std::string name;
  std::optional< namespace_id > parent;
};

struct namespace_info
{
  namespace_id id;
  bool active         = false;
  namespace_type type = namespace_type::root;
  std::uint32_t depth = 0;
  namespace_path levels;
  namespace_alias alias;
  std::optional< public_account > owner;
  std::uint64_t start_height = 0;
  std::uint64_t end_height   = 0;

  std::optional< namespace_id > parent_id() const;
};

/**
 * An ordered list of namespace ids that converts to and from the canonical
 * hex text of each id.
 */
class namespace_ids
{
public:
  namespace_ids() = default;
  explicit namespace_ids( std::vector< namespace_id > ids ) noexcept;

  static result< namespace_ids > from_strings( std::span< const std::string > strings );

  std::vector< std::string > to_strings() const;

  const std::vector< namespace_id >& ids() const noexcept;
  bool empty() const noexcept;
  std::size_t size() const noexcept;

private:
  std::vector< namespace_id > _ids;
};

} // namespace xpx::protocol
