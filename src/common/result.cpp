#include "linkwatch/common/result.hpp"

namespace linkwatch::common {

std::string_view error_kind_name(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "none";
  case ErrorKind::ProbeTimeout:
    return "probe_timeout";
  case ErrorKind::ProbeUnavailable:
    return "probe_unavailable";
  case ErrorKind::TransportFailure:
    return "transport_failure";
  case ErrorKind::ConfigurationError:
    return "configuration_error";
  case ErrorKind::IoError:
    return "io_error";
  case ErrorKind::Internal:
    return "internal";
  }
  return "internal";
}

} // namespace linkwatch::common
