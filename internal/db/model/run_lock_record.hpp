#pragma once

#include <cstdint>
#include <string>

namespace flowstead::db::model {

struct RunLockRecord {
  std::string workflow_id;
  std::string run_id;
  std::string holder_id;
  uint64_t    lease_expiry_ms = 0;
  uint64_t    ttl_ms          = 0;
};

} // namespace flowstead::db::model
