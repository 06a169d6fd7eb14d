#include "configuration.hpp"

#include "config.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string_view>
#include <unistd.h>

[[noreturn]] static void usage(void)
{
    std::cerr <<
    "procrun " PROCRUN_VERSION "\n"
    "usage: procrun\n"
    "         [-r]\n"
    "         [-c charset]\n"
    "         [-s]\n"
    "         [-i]\n"
    "         [-C directory]\n"
    "         [-e NAME=VALUE]...\n"
    "         [-E]\n"
    "         [-A program]...\n"
    "         [-L script.lua]\n"
    "         [-h]\n"
    "         [program [arguments...]]\n"
    "\n"
    "  PROCRUN_ALLOW    colon separated programs added to -A\n";
    exit(EXIT_FAILURE);
}

static void split_allow_list(std::vector<std::string>& allowed, std::string_view list)
{
    while (not list.empty())
    {
        auto const colon = list.find(':');
        auto const entry = list.substr(0, colon);
        if (not entry.empty())
        {
            allowed.emplace_back(entry);
        }
        if (colon == list.npos)
        {
            break;
        }
        list.remove_prefix(colon + 1);
    }
}

configuration load_configuration(int argc, char** argv)
{
    configuration cfg {};

    cfg.encoding = procshell::Encoding::Text;

    if (auto const allow = getenv("PROCRUN_ALLOW"))
    {
        split_allow_list(cfg.allowed, allow);
    }

    bool show_usage = false;

    // + stops at the first positional argument so child flags pass through
    char const* const flags = "+:A:c:C:e:EhiL:rs";
    int opt;
    while ((opt = getopt(argc, argv, flags)) != -1) {
        switch (opt) {
        default: abort();
        case '?': std::cerr << "Unknown flag: " << char(optopt) << std::endl; usage();
        case ':': std::cerr << "Missing flag argument: " << char(optopt) << std::endl; usage();
        case 'h': usage();
        case 'A': cfg.allowed.emplace_back(optarg); break;
        case 'C': cfg.cwd                   = optarg; break;
        case 'e':
            if (nullptr == strchr(optarg, '=') || '=' == optarg[0]) {
                std::cerr << "Environment variable should be NAME=VALUE (-e).\n";
                show_usage = true;
            }
            cfg.environment.emplace_back(optarg);
            break;
        case 'c': cfg.charset               = optarg; break;
        case 'E': cfg.clear_environment     = true; break;
        case 'i': cfg.interactive           = true; break;
        case 'L': cfg.lua_filename          = optarg; break;
        case 'r': cfg.encoding              = procshell::Encoding::Raw; break;
        case 's': cfg.sidecar               = true; break;
        }
    }

    argv += optind;
    argc -= optind;

    cfg.command.assign(argv, argv + argc);

    if (nullptr == cfg.lua_filename && cfg.command.empty()) {
        std::cerr << "Program required (or use -L for a script).\n";
        show_usage = true;
    }

    if (nullptr != cfg.lua_filename && cfg.interactive) {
        std::cerr << "Interactive mode runs a program, not a script (-i with -L).\n";
        show_usage = true;
    }

    if (show_usage) {
        usage();
    }

    return cfg;
}
