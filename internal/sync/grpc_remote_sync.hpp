#pragma once

#if OFFLINE_SYNC_WITH_GRPC

#include <grpcpp/channel.h>

#include <chrono>
#include <memory>
#include <string>

#include "internal/sync/remote_sync.hpp"
#include "offline/v1/sync_service.grpc.pb.h"

namespace offline::sync {

/*
  RemoteSync over the SyncService.Attempt unary RPC.

  Transport failures and deadline expiry come back as unsuccessful
  outcomes carrying the gRPC status message.
*/
class GrpcRemoteSync final : public RemoteSync {
 public:
  GrpcRemoteSync(std::shared_ptr<grpc::Channel> channel, std::chrono::milliseconds timeout);

  static std::shared_ptr<GrpcRemoteSync> Connect(const std::string& endpoint, std::chrono::milliseconds timeout);

  RemoteOutcome Attempt(const offline::v1::Operation& op) override;

  bool IsOnline() override;

 private:
  std::shared_ptr<grpc::Channel>                    channel_;
  std::unique_ptr<offline::v1::SyncService::Stub>   stub_;
  std::chrono::milliseconds                         timeout_;
};

} // namespace offline::sync

#endif
