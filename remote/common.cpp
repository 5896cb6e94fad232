#include "remote/common.hpp"

namespace remote {

const char* const kAuthorizationKey = "authorization";

std::string BearerValue(const std::string& token) { return "Bearer " + token; }

void SetupContext(grpc::ClientContext* context, const std::string& token,
                  std::chrono::seconds timeout) {
  context->AddMetadata(kAuthorizationKey, BearerValue(token));
  if (timeout.count() > 0) {
    context->set_deadline(std::chrono::system_clock::now() + timeout);
  }
}

bool IsAuthorized(
    const std::multimap<grpc::string_ref, grpc::string_ref>& metadata,
    const std::string& token) {
  auto it = metadata.find(kAuthorizationKey);
  if (it == metadata.end()) return false;
  return std::string(it->second.data(), it->second.length()) ==
         BearerValue(token);
}

}  // namespace remote
