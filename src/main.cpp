#include "common/config_manager.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "constants/circle.hpp"
#include "net/http_client.hpp"
#include "transport/http_modular_transport.hpp"
#include "wallet/local_account.hpp"
#include "wallet/local_smart_account_delegate.hpp"
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

static void PrintUsage(const char* argv0) {
  std::cerr << "usage:\n"
            << "  " << argv0 << " owner\n"
            << "  " << argv0 << " address [--name <name>]\n"
            << "  " << argv0 << " sign <0x-hash> [--user-op-gas]\n"
            << "configuration is read from .env (or the environment):\n"
            << "  OWNER_PRIVATE_KEY, CLIENT_KEY, CLIENT_URL, SMART_ACCOUNT_VERSION,\n"
            << "  HTTP_TIMEOUT_MS, HTTP_VERIFY_TLS, HTTP2, LOG_FILE, LOG_LEVEL\n";
}

static int RunAddress(const LocalSmartAccountDelegate& delegate, const std::vector<std::string>& args) {
  std::optional<std::string> name;
  for (size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--name" && i + 1 < args.size()) name = args[++i];
    else { std::cerr << "unexpected argument: " << args[i] << std::endl; return 2; }
  }
  const std::string client_key = ConfigManager::GetOrThrow("CLIENT_KEY");
  const std::string url = ConfigManager::GetOr("CLIENT_URL", CircleConstants::BASE_URL);
  const int timeout_ms = ConfigManager::GetIntOr("HTTP_TIMEOUT_MS", 10000);
  const std::string sca_core = CircleConstants::ResolveScaCore(
    ConfigManager::GetOr("SMART_ACCOUNT_VERSION", CircleConstants::SMART_ACCOUNT_VERSION_V1));

  HttpClientTuning tuning;
  tuning.verify_tls = ConfigManager::GetBoolOr("HTTP_VERIFY_TLS", true);
  tuning.enable_http2 = ConfigManager::GetBoolOr("HTTP2", true);
  std::unique_ptr<HttpClient> http(CreateCurlHttpClientTuned(tuning));
  auto transport = HttpModularTransport::WithClientKey(*http, client_key, url, timeout_ms);
  Logger::Info("RPC endpoint: " + url);
  ModularWallet wallet = delegate.GetModularWalletAddress(transport, sca_core, name);
  std::cout << nlohmann::json(wallet).dump(2) << std::endl;
  return 0;
}

static int RunSign(const LocalSmartAccountDelegate& delegate, const std::vector<std::string>& args) {
  std::optional<std::string> hash;
  bool has_user_op_gas = false;
  for (const auto& a : args) {
    if (a == "--user-op-gas") has_user_op_gas = true;
    else if (!hash) hash = a;
    else { std::cerr << "unexpected argument: " << a << std::endl; return 2; }
  }
  if (!hash) { std::cerr << "sign: missing hash" << std::endl; return 2; }
  std::cout << delegate.SignAndWrap(*hash, has_user_op_gas) << std::endl;
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 2) { PrintUsage(argv[0]); return 2; }
  const std::string command = argv[1];
  const std::vector<std::string> args(argv + 2, argv + argc);

  ConfigManager::Initialize(".env");
  Logger::Initialize(ConfigManager::GetOr("LOG_FILE", "modular_wallet.log"),
                     Logger::ParseLevel(ConfigManager::GetOr("LOG_LEVEL", "info")));
  int rc = 1;
  try {
    auto owner = std::make_shared<LocalAccount>(ConfigManager::GetOrThrow("OWNER_PRIVATE_KEY"));
    LocalSmartAccountDelegate delegate(owner);
    if (command == "owner") {
      std::cout << owner->Address() << std::endl;
      rc = 0;
    } else if (command == "address") {
      rc = RunAddress(delegate, args);
    } else if (command == "sign") {
      rc = RunSign(delegate, args);
    } else {
      PrintUsage(argv[0]);
      rc = 2;
    }
  } catch (const TransportError& e) {
    std::cerr << ErrorKindName(e.Kind()) << ": " << e.what();
    if (e.Status()) std::cerr << " (status " << e.Status() << ")";
    if (!e.Details().empty()) std::cerr << ": " << e.Details();
    std::cerr << std::endl;
    Logger::Error(std::string(ErrorKindName(e.Kind())) + ": " + e.what());
  } catch (const WalletError& e) {
    std::cerr << ErrorKindName(e.Kind()) << ": " << e.what() << std::endl;
    Logger::Error(std::string(ErrorKindName(e.Kind())) + ": " + e.what());
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << std::endl;
    Logger::Error(e.what());
  }
  Logger::Shutdown();
  return rc;
}
