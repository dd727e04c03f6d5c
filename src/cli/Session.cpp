#include "cli/Session.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <string>
#include <utility>
#include <vector>

namespace dnsc::cli {

namespace {

enum MenuItem : std::size_t {
  kSelectProvider = 0,
  kCustomDns,
  kAutomaticDns,
  kShowCurrentDns,
  kExit,
};

const std::vector<std::string>& menuItems() {
  static const std::vector<std::string> vItems{
      "Select DNS Provider", "Custom DNS", "Automatic DNS (Router)", "Show Current DNS", "Exit",
  };
  return vItems;
}

}  // namespace

Session::Session(const core::ProviderCatalog& pcCatalog, std::string sConnection,
                 nm::NetworkManager& nmManager, IPrompt& ipPrompt, std::ostream& osOut,
                 std::ostream& osErr, int iExitCode)
    : _pcCatalog(pcCatalog),
      _sConnection(std::move(sConnection)),
      _nmManager(nmManager),
      _ipPrompt(ipPrompt),
      _osOut(osOut),
      _osErr(osErr),
      _iExitCode(iExitCode) {}

Session::~Session() = default;

int Session::run() {
  auto spLog = common::Logger::get();

  while (true) {
    try {
      if (runOnce() == common::MenuAction::Exit) {
        break;
      }
    } catch (const common::InputError& ex) {
      if (ex._bEndOfInput) {
        spLog->info("Input closed, leaving menu");
        _osOut << "\n";
        break;
      }
      _osErr << "Error: " << ex.what() << std::endl;
    } catch (const std::exception& ex) {
      _osErr << "Error: " << ex.what() << std::endl;
    }
    _osOut << "\n";
  }

  _osOut << "Goodbye!" << std::endl;
  return _iExitCode;
}

common::MenuAction Session::runOnce() {
  _osOut << "========================================\n"
         << "           DNS Changer Tool\n"
         << "========================================\n"
         << "Current Connection: " << _sConnection << "\n\n";

  const std::size_t nChoice = _ipPrompt.select("Choose an option", menuItems(), 0);
  switch (nChoice) {
    case kSelectProvider:
      selectProvider();
      break;
    case kCustomDns:
      setCustomDns();
      break;
    case kAutomaticDns:
      setAutomaticDns();
      break;
    case kShowCurrentDns:
      showCurrentDns();
      break;
    case kExit:
      return common::MenuAction::Exit;
    default:
      break;
  }
  return common::MenuAction::Continue;
}

void Session::selectProvider() {
  const std::size_t nIndex = _ipPrompt.select("Select DNS Provider", _pcCatalog.labels(), 0);
  const auto& dp = _pcCatalog.at(nIndex);

  _nmManager.applyDns(_sConnection, dp.sPrimaryDns, dp.sSecondaryDns);
  _osOut << "✅ DNS set to " << dp.sName << " (" << dp.sPrimaryDns << ", " << dp.sSecondaryDns
         << ")\n";
}

void Session::setCustomDns() {
  const std::string sPrimary = _ipPrompt.input("Enter primary DNS");
  const std::string sSecondary = _ipPrompt.input("Enter secondary DNS");

  _nmManager.applyDns(_sConnection, sPrimary, sSecondary);
  _osOut << "✅ DNS set to custom: " << sPrimary << ", " << sSecondary << "\n";
}

void Session::setAutomaticDns() {
  _nmManager.setAutomaticDns(_sConnection);
  _osOut << "✅ Switched to automatic DNS (Router)\n";
}

void Session::showCurrentDns() {
  for (const auto& sLine : _nmManager.showDnsSettings(_sConnection)) {
    _osOut << sLine << "\n";
  }

  _osOut << "\nSystem DNS configuration:" << std::endl;
  _nmManager.printResolverStatus();
}

}  // namespace dnsc::cli
