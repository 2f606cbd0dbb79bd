#pragma once

#include <google/protobuf/struct.pb.h>

#include <optional>
#include <string>

#include "offline/v1/types.pb.h"

namespace offline::sync {

struct RemoteOutcome {
  bool success  = false;
  bool conflict = false;

  // the remote's current version of the entity, on conflict
  std::optional<google::protobuf::Value> remote_data;

  std::string error;
};

/*
  Remote side of the sync. Implementations must tolerate seeing the same
  operation more than once and must bound every call; a throw is treated
  like any other failed attempt.
*/
class RemoteSync {
 public:
  virtual ~RemoteSync() = default;

  virtual RemoteOutcome Attempt(const offline::v1::Operation& op) = 0;

  virtual bool IsOnline() = 0;
};

} // namespace offline::sync
