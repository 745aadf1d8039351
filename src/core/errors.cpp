#include "flakeid/core/result.h"

namespace flakeid::core {

const char* error_message(const CreateError error) {
  switch (error) {
    case CreateError::kStartTimeInFuture:
      return "start time is ahead of the current time";
    case CreateError::kMachineIdUnavailable:
      return "machine ID provider failed";
    case CreateError::kServiceIdUnavailable:
      return "service ID provider failed";
    case CreateError::kMachineIdRejected:
      return "machine ID rejected by validator";
    case CreateError::kServiceIdRejected:
      return "service ID rejected by validator";
    case CreateError::kMachineIdOutOfRange:
      return "machine ID does not fit in 5 bits";
    case CreateError::kServiceIdOutOfRange:
      return "service ID does not fit in 5 bits";
  }
  return "unknown create error";
}

const char* error_message(const IssueError error) {
  switch (error) {
    case IssueError::kOverTimeLimit:
      return "over the time limit";
  }
  return "unknown issue error";
}

const char* error_message(const ParseError error) {
  switch (error) {
    case ParseError::kInvalidFormat:
      return "invalid identifier format";
    case ParseError::kOutOfRange:
      return "identifier does not fit in 64 bits";
  }
  return "unknown parse error";
}

}  // namespace flakeid::core
