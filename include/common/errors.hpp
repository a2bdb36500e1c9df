#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

// Stage at which a wallet operation failed.
enum class ErrorKind {
  InvalidAddress,    // owner address is not a 20-byte hex value
  SigningFailed,     // the owner could not produce a signature
  InvalidSignature,  // signer output is not r(32) || s(32) || v(1)
  TransportFailure,  // network, HTTP or JSON-RPC level failure
};

const char* ErrorKindName(ErrorKind kind);

class WalletError : public std::runtime_error {
public:
  WalletError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}
  ErrorKind Kind() const { return kind_; }
private:
  ErrorKind kind_;
};

// Always ErrorKind::TransportFailure. status is 0 when no HTTP response was
// received; rpc_code is set only when the server returned a JSON-RPC error.
class TransportError : public WalletError {
public:
  TransportError(const std::string& message,
                 long status = 0,
                 std::optional<long long> rpc_code = std::nullopt,
                 std::string details = std::string())
    : WalletError(ErrorKind::TransportFailure, message),
      status_(status), rpc_code_(rpc_code), details_(std::move(details)) {}
  long Status() const { return status_; }
  const std::optional<long long>& RpcCode() const { return rpc_code_; }
  const std::string& Details() const { return details_; }
private:
  long status_;
  std::optional<long long> rpc_code_;
  std::string details_;
};
