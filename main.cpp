// Config
#include "config/Config.hpp"
#include "config/ConfigRegistry.hpp"

// Upload
#include "cli/Invocation.hpp"
#include "cli/Signals.hpp"
#include "upload/Orchestrator.hpp"
#include "remote/flickr/Client.hpp"

// Misc
#include "log/Registry.hpp"
#include "util/errors.hpp"

// Libraries
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace lb;
using namespace lb::config;
using namespace lb::cli;
using namespace lb::upload;

namespace {

constexpr int EXIT_ABORTED = 1;
constexpr int EXIT_USAGE = 2;
constexpr int EXIT_AUTH = 3;
std::string promptForVerifier(const std::string& authorizeUrl) {
    std::cout << "Open the following URL in your browser to authorize lightbox:\n\n  " << authorizeUrl
              << "\n\nEnter the verification code: " << std::flush;
    std::string code;
    std::getline(std::cin, code);
    return code;
}

}

int main(const int argc, char** argv) {
    Invocation inv;
    try {
        inv = parseInvocation(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const ConfigurationError& e) {
        std::cerr << "lightbox: " << e.what() << "\n\n" << usage();
        return EXIT_USAGE;
    }

    if (inv.help) {
        std::cout << usage();
        return EXIT_SUCCESS;
    }

    try {
        ConfigRegistry::init(inv.configPath ? loadConfig(*inv.configPath) : loadDefaultConfig());
        const auto& cfg = ConfigRegistry::get();
        log::Registry::init(cfg.logging, inv.verbose);
        log::Registry::lightbox()->debug("[lightbox] Effective configuration:\n{}", cfg.dump());

        const auto flag = installInterruptHandlers();

        auto client = std::make_shared<remote::flickr::Client>(cfg.flickr, promptForVerifier);
        Orchestrator orchestrator(client, buildRunOptions(inv, cfg), flag);

        log::Registry::lightbox()->info("[lightbox] Uploading {} to set \"{}\"", inv.directory.string(),
                                        orchestrator.collectionTitle());

        const auto result = orchestrator.run();
        return result.exitCode();
    } catch (const ConfigurationError& e) {
        if (log::Registry::isInitialized()) log::Registry::lightbox()->error("[lightbox] {}", e.what());
        else std::cerr << "lightbox: " << e.what() << '\n';
        return EXIT_USAGE;
    } catch (const AuthError& e) {
        log::Registry::lightbox()->critical("[lightbox] Authentication failed: {}", e.what());
        return EXIT_AUTH;
    } catch (const std::exception& e) {
        if (log::Registry::isInitialized()) log::Registry::lightbox()->critical("[lightbox] Fatal error: {}", e.what());
        else std::cerr << "lightbox: " << e.what() << '\n';
        return EXIT_ABORTED;
    }
}
