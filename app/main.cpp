#include <iostream>
#include <string>

#include <cli/cli_common.hpp>

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [options]\n";
    std::cerr << "\n";
    std::cerr << "Simulates a rear-suspension linkage through its shock stroke.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  validate <bike.json>                   Check points and bodies\n";
    std::cerr << "  solve <bike.json> -o <result.json>     Sweep the shock, write travel and leverage\n";
    std::cerr << "  batch <bikes.json> -o <results.json>   Solve several bikes in parallel\n";
    std::cerr << "\n";
    std::cerr << "Run '" << program_name << " <command>' without arguments for command options.\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  REARLINK_LOG_LEVEL - Set log level (trace, debug, info, warn, error, off)\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];

    if (command == "validate") {
        return rearlink::cli::command_validate(argc, argv);
    } else if (command == "solve") {
        return rearlink::cli::command_solve(argc, argv);
    } else if (command == "batch") {
        return rearlink::cli::command_batch(argc, argv);
    } else if (command == "--help" || command == "-h" || command == "help") {
        print_usage(argv[0]);
        return 0;
    }

    std::cerr << "Unknown command: " << command << "\n\n";
    print_usage(argv[0]);
    return 1;
}
