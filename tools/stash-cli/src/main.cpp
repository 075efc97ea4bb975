#include "commands.hpp"
#include <iostream>
#include <stdexcept>
#include <string>

using namespace stash::cli;

namespace {

void print_version() {
    std::cout << "Stash CLI v0.1.0\n";
}

bool parse_int(const char* text, int& out) {
    try {
        size_t consumed = 0;
        std::string str(text);
        out = std::stoi(str, &consumed);
        return consumed == str.size();
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        cmd_help();
        return static_cast<int>(Result::InvalidArgs);
    }

    std::string command = argv[1];

    if (command == "--version" || command == "-v") {
        print_version();
        return 0;
    }

    if (command == "help" || command == "--help" || command == "-h") {
        cmd_help();
        return 0;
    }

    if (command == "show" || command == "reorganize") {
        if (argc < 3) {
            std::cerr << "Error: 'stash " << command << "' requires a settings file\n";
            std::cerr << "Usage: stash " << command << " <settings.json>\n";
            return static_cast<int>(Result::InvalidArgs);
        }
        return command == "show" ? static_cast<int>(cmd_show(argv[2]))
                                 : static_cast<int>(cmd_reorganize(argv[2]));
    }

    if (command == "find") {
        int width = 0;
        int height = 0;
        if (argc < 5 || !parse_int(argv[3], width) || !parse_int(argv[4], height)) {
            std::cerr << "Usage: stash find <settings.json> <width> <height>\n";
            return static_cast<int>(Result::InvalidArgs);
        }
        return static_cast<int>(cmd_find(argv[2], width, height));
    }

    std::cerr << "Unknown command: " << command << "\n";
    std::cerr << "Run 'stash help' for usage information.\n";
    return static_cast<int>(Result::InvalidArgs);
}
