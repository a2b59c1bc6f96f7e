#include "daehwa_console.h"

#include <iostream>
#include <cstring>

static void printUsage() {
    std::cout << "DaehwaConsole - Interactive player for .dhb bots\n"
              << "Usage: DaehwaConsole <bot.dhb> [options]\n"
              << "\n"
              << "Options:\n"
              << "  --state <dir>    Persist conversation state in <dir>\n"
              << "  --config <file>  Engine configuration (JSON)\n"
              << "  --locale <xx>    Locale sent with every message\n"
              << "  --traces         Print trace activities\n"
              << "  --version        Show version\n"
              << "  -h, --help       Show this help\n";
}

int main(int argc, char* argv[]) {
    // --version / --help 처리
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--version") == 0) {
            std::cout << "DaehwaConsole 0.1.0" << std::endl;
            return 0;
        }
        if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            printUsage();
            return 0;
        }
    }

    if (argc < 2) {
        std::cerr << "Usage: DaehwaConsole <bot.dhb> [options]\n"
                  << "Try 'DaehwaConsole --help' for more information.\n";
        return 1;
    }

    Daehwa::Console console;

    for (int i = 2; i < argc; ++i) {
        if (std::strcmp(argv[i], "--state") == 0 && i + 1 < argc) {
            console.setStateDirectory(argv[++i]);
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            if (!console.loadConfig(argv[++i])) return 1;
        } else if (std::strcmp(argv[i], "--locale") == 0 && i + 1 < argc) {
            console.setLocale(argv[++i]);
        } else if (std::strcmp(argv[i], "--traces") == 0) {
            console.setShowTraces(true);
        } else {
            std::cerr << "Unknown option: " << argv[i] << std::endl;
            return 1;
        }
    }

    if (!console.loadBot(argv[1])) {
        return 1;
    }

    console.run();
    return 0;
}
