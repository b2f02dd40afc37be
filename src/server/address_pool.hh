#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <vector>

/* administratively scoped multicast groups (239.0.0.0/8) handed out to live calls */
class MulticastAddressPool
{
  static constexpr uint32_t PREFIX = 239u << 24;
  static constexpr uint32_t HOST_SPACE = 1u << 24;

  uint32_t next_ { 1 };
  std::vector<uint32_t> free_list_ {};
  std::set<uint32_t> in_use_ {};

  static std::string dotted_quad( const uint32_t address );

public:
  std::string allocate();

  /* only addresses handed out by this pool are accepted back */
  void release( const std::string& address );

  size_t in_use() const { return in_use_.size(); }
  bool is_in_use( const std::string& address ) const;
};
