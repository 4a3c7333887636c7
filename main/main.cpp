#include "cli/commands.hpp"
#include "cli/Router.hpp"
#include "log/Registry.hpp"

#include <cstdlib>
#include <iostream>

int main(int argc, char** argv) {
    try {
        const auto call = hs::cli::parseArgs(hs::cli::normalizeArgs(argc, argv));

        hs::cli::Router router;
        hs::cli::registerCommands(router);

        return router.execute(call);
    } catch (const std::exception& e) {
        if (hs::log::Registry::isInitialized()) hs::log::Registry::harborsync()->error("[-] {}", e.what());
        else std::cerr << "harborsync: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
