#include "grpc_remote_sync.hpp"

#if OFFLINE_SYNC_WITH_GRPC

#include <grpcpp/client_context.h>
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include "internal/observability/logging.hpp"

namespace offline::sync {

using offline::observability::StringField;

GrpcRemoteSync::GrpcRemoteSync(std::shared_ptr<grpc::Channel> channel, std::chrono::milliseconds timeout)
    : channel_(std::move(channel)), stub_(offline::v1::SyncService::NewStub(channel_)), timeout_(timeout) {
}

std::shared_ptr<GrpcRemoteSync> GrpcRemoteSync::Connect(const std::string& endpoint, std::chrono::milliseconds timeout) {
  auto channel = grpc::CreateChannel(endpoint, grpc::InsecureChannelCredentials());
  OFFLINE_LOG_INFO("Remote sync channel created", {StringField("endpoint", endpoint)});
  return std::make_shared<GrpcRemoteSync>(std::move(channel), timeout);
}

RemoteOutcome GrpcRemoteSync::Attempt(const offline::v1::Operation& op) {
  offline::v1::AttemptRequest  request;
  offline::v1::AttemptResponse response;
  *request.mutable_operation() = op;

  grpc::ClientContext ctx;
  ctx.set_deadline(std::chrono::system_clock::now() + timeout_);

  RemoteOutcome outcome;
  const auto    status = stub_->Attempt(&ctx, request, &response);
  if (!status.ok()) {
    outcome.error = "Attempt failed: " + status.error_message();
    return outcome;
  }

  outcome.success  = response.success();
  outcome.conflict = response.conflict();
  outcome.error    = response.error();
  if (response.has_remote_data()) {
    outcome.remote_data = response.remote_data();
  }
  return outcome;
}

bool GrpcRemoteSync::IsOnline() {
  const auto state = channel_->GetState(true);
  return state == GRPC_CHANNEL_READY || state == GRPC_CHANNEL_IDLE || state == GRPC_CHANNEL_CONNECTING;
}

} // namespace offline::sync

#endif
