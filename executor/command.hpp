#ifndef EXECUTOR_COMMAND_HPP
#define EXECUTOR_COMMAND_HPP
#include <stdexcept>
#include <string>

#include "nlohmann/json.hpp"
#include "proto/command.pb.h"

namespace executor {

// A command lacks a required parameter, or has one of the wrong type.
class missing_parameter : public std::runtime_error {
 public:
  explicit missing_parameter(const std::string& name)
      : std::runtime_error("missing parameter '" + name + "'") {}
};

// Returns the action named by verb, accepting both the current and the
// legacy names. Unknown verbs map to UNKNOWN_ACTION.
proto::Action ParseAction(const std::string& verb);

// Name of the action in error messages, e.g. "Pip install".
std::string ActionLabel(proto::Action action);

// Builds the typed command for action from the fields of document. Throws
// missing_parameter if a required field is absent and std::invalid_argument
// if an optional one has the wrong type.
proto::Command DecodeCommand(const std::string& id, proto::Action action,
                             const nlohmann::json& document);

// Serializes a result to the JSON document stored in the result collection.
std::string EncodeResult(const proto::Result& result);

}  // namespace executor

#endif
