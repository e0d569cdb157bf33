// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/errors.hpp"

namespace cartograph {
namespace discovery {

std::string ToString(DiscoveryError error) {
  switch (error) {
  case DiscoveryError::Unreachable:
    return "unreachable";
  case DiscoveryError::AuthenticationFailed:
    return "authentication failed";
  case DiscoveryError::PlatformDetectionExhausted:
    return "platform detection exhausted";
  case DiscoveryError::ParseLowConfidence:
    return "parse low confidence";
  case DiscoveryError::OperationTimeout:
    return "operation timeout";
  case DiscoveryError::Cancelled:
    return "cancelled";
  case DiscoveryError::UnexpectedFailure:
    return "unexpected failure";
  }
  return "unknown";
}

}  // namespace discovery
}  // namespace cartograph
