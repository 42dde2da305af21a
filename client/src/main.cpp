#include <cstdlib>
#include <exception>
#include <iostream>

#include "copypasta/client/app.hpp"
#include "copypasta/client/config.hpp"
#include "copypasta/client/logger.hpp"
#include "copypasta/version.hpp"

int main(int argc, char *argv[])
{
    using copypasta::client::ClientApp;
    using copypasta::client::Logger;

    std::ios::sync_with_stdio(false);

    try
    {
        auto config = copypasta::client::parse_arguments(argc, argv);
        if (config.show_help)
        {
            std::cout << "Copypasta " << copypasta::version() << "\n"
                      << copypasta::client::usage();
            return EXIT_SUCCESS;
        }
        if (config.show_version)
        {
            std::cout << "copypasta " << copypasta::version() << std::endl;
            return EXIT_SUCCESS;
        }

        Logger logger(config.log_path, config.verbose);
        logger.log("info", "copypasta ", copypasta::version(), " starting");
        ClientApp app(std::move(config), std::move(logger));
        return app.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        std::cerr << copypasta::client::usage();
        return EXIT_FAILURE;
    }
}
