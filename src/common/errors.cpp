#include "common/errors.hpp"

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InvalidAddress: return "InvalidAddress";
    case ErrorKind::SigningFailed: return "SigningFailed";
    case ErrorKind::InvalidSignature: return "InvalidSignature";
    case ErrorKind::TransportFailure: return "TransportFailure";
  }
  return "Unknown";
}
