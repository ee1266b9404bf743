//Author copyright Marcin Matysek (Rewertyn)

#include <exception>
#include <iostream>
#include <string>

#include "Sources/app_runner.h"
#include "Sources/cli/arg_parser.h"
#include "Sources/config/run_config.h"
#include "Sources/utils/logging.h"

int main(int argc, char** argv) {
    using namespace sudoku_rounds;

    const ParseArgsResult parsed = parse_args(argc, argv);
    if (!parsed.ok) {
        std::cerr << parsed.error << "\n";
        std::cerr << "Run with --help for the list of options.\n";
        return 1;
    }

    const RunConfig& cfg = parsed.cfg;
    if (cfg.show_help) {
        std::cout << usage_text();
        return 0;
    }
    if (cfg.show_version) {
        std::cout << kVersionText << "\n";
        return 0;
    }
    if (cfg.action == RunAction::None) {
        std::cerr << "Please select --generate or --solve.\n";
        std::cerr << usage_text();
        return 1;
    }

    try {
        run_sudoku_rounds(cfg, std::cin, std::cout);
        return 0;
    } catch (const std::exception& ex) {
        log_error("main", std::string("fatal: ") + ex.what());
        std::cerr << "Error: " << ex.what() << "\n";
        return 2;
    }
}
