#include "daehwa_compiler.h"
#include <iostream>
#include <string>
#include <cstring>

static const char* VERSION = "0.1.0";

static void printUsage() {
    std::cout << "Daehwa Compiler v" << VERSION << "\n"
              << "Usage: DaehwaCompiler <bot.json> [-o output.dhb]\n"
              << "\n"
              << "Options:\n"
              << "  -o <path>    Output file path (default: bot.dhb)\n"
              << "  --check      Validate only, do not write output\n"
              << "  -h, --help   Show this help message\n"
              << "  --version    Show version number\n";
}

int main(int argc, char* argv[]) {
    // help/version 플래그 체크 (위치 무관)
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            printUsage();
            return 0;
        }
        if (std::strcmp(argv[i], "--version") == 0) {
            std::cout << "DaehwaCompiler " << VERSION << std::endl;
            return 0;
        }
    }

    if (argc < 2) {
        printUsage();
        return 1;
    }

    std::string inputPath = argv[1];
    std::string outputPath = "bot.dhb";
    bool checkOnly = false;

    // 옵션 파싱
    for (int i = 2; i < argc; ++i) {
        if (std::strcmp(argv[i], "-o") == 0 && i + 1 < argc) {
            outputPath = argv[++i];
        } else if (std::strcmp(argv[i], "--check") == 0) {
            checkOnly = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << std::endl;
            return 1;
        }
    }

    Daehwa::Compiler compiler;

    bool parsed = compiler.parse(inputPath);

    // 경고 출력
    for (const auto& warn : compiler.getWarnings()) {
        std::cerr << "warning: " << warn << std::endl;
    }

    if (!parsed) {
        const auto& errors = compiler.getErrors();
        for (const auto& err : errors) {
            std::cerr << "error: " << err << std::endl;
        }
        std::cerr << "\n" << errors.size() << " error(s). Compilation aborted." << std::endl;
        return 1;
    }

    if (checkOnly) {
        std::cout << inputPath << ": OK (" << compiler.getBot().dialogs.size() << " dialogs)" << std::endl;
        return 0;
    }

    if (!compiler.compile(outputPath)) {
        const auto& errors = compiler.getErrors();
        for (const auto& err : errors) {
            std::cerr << "error: " << err << std::endl;
        }
        std::cerr << "\n" << errors.size() << " error(s). Compilation failed." << std::endl;
        return 1;
    }

    return 0;
}
