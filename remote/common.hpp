#ifndef REMOTE_COMMON_HPP
#define REMOTE_COMMON_HPP
#include <chrono>
#include <map>
#include <string>

#include "grpc++/client_context.h"
#include "grpc++/support/string_ref.h"

namespace remote {

// Metadata key that carries the bearer token.
extern const char* const kAuthorizationKey;

// Returns the metadata value expected for the given token.
std::string BearerValue(const std::string& token);

// Attaches the token to the call and, if timeout is not zero, sets its
// deadline.
void SetupContext(grpc::ClientContext* context, const std::string& token,
                  std::chrono::seconds timeout = std::chrono::seconds(0));

// Returns true if the metadata holds exactly the expected bearer token.
bool IsAuthorized(
    const std::multimap<grpc::string_ref, grpc::string_ref>& metadata,
    const std::string& token);

}  // namespace remote

#endif
