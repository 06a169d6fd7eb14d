#include "app.hpp"
#include "configuration.hpp"

#include <csignal>

auto main(int argc, char* argv[]) -> int
{
    auto const cfg = load_configuration(argc, argv);

    // a child closing its stdin is reported as a write error instead
    std::signal(SIGPIPE, SIG_IGN);

    auto app = App{cfg};
    return app.startup();
}
