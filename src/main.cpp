#include <cstdlib>
#include <iostream>
#include <string>

#include "cli/Session.hpp"
#include "cli/StreamPrompt.hpp"
#include "common/Config.hpp"
#include "common/Logger.hpp"
#include "core/ProviderCatalog.hpp"
#include "exec/ProcessRunner.hpp"
#include "nm/NetworkManager.hpp"

#include <spdlog/fmt/ranges.h>

int main() {
  try {
    // ── Step 1: Load and validate configuration ──────────────────────────
    auto cfgApp = dnsc::common::Config::load();

    dnsc::common::Logger::init(cfgApp.sLogLevel);
    auto spLog = dnsc::common::Logger::get();
    spLog->info("Configuration loaded (nmcli={}, elevate='{}')", cfgApp.sNmcliBin,
                fmt::join(cfgApp.vElevateCmd, " "));

    // ── Step 2: External tool access ─────────────────────────────────────
    dnsc::exec::ProcessRunner prRunner;
    dnsc::nm::NetworkManager nmManager(prRunner, cfgApp);

    // ── Step 3: Provider catalog ─────────────────────────────────────────
    auto pcCatalog = cfgApp.oProvidersFile
                         ? dnsc::core::ProviderCatalog::fromFile(*cfgApp.oProvidersFile)
                         : dnsc::core::ProviderCatalog::builtin();

    // ── Step 4: Discover the connection to manage ────────────────────────
    const std::string sConnection = nmManager.findActiveConnection();

    // ── Step 5: Interactive menu ─────────────────────────────────────────
    dnsc::cli::StreamPrompt spPrompt(std::cin, std::cout);
    dnsc::cli::Session ssSession(pcCatalog, sConnection, nmManager, spPrompt, std::cout,
                                 std::cerr, cfgApp.iExitCode);
    return ssSession.run();
  } catch (const std::exception& ex) {
    std::cerr << "[fatal] startup failed: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}
