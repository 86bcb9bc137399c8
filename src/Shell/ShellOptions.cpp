#include "ShellOptions.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace turtlescript {

namespace {

bool parsePositive(const std::string& text, long& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    long v = std::strtol(text.c_str(), &end, 10);
    if (*end != '\0' || v <= 0) return false;
    out = v;
    return true;
}

bool parseSize(const std::string& text, int& width, int& height) {
    auto x = text.find_first_of("xX");
    if (x == std::string::npos) return false;
    long w = 0, h = 0;
    if (!parsePositive(text.substr(0, x), w) || !parsePositive(text.substr(x + 1), h)) return false;
    if (w > 16384 || h > 16384) return false;
    width = static_cast<int>(w);
    height = static_cast<int>(h);
    return true;
}

} // namespace

std::optional<std::string> parseShellOptions(int argc, char* argv[], ShellOptions& out, bool gui) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto needValue = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) return std::nullopt;
            return std::string(argv[++i]);
        };

        if (arg == "-h" || arg == "--help") {
            out.showHelp = true;
        } else if (arg == "--trace") {
            out.trace = true;
        } else if (arg == "--dump" && !gui) {
            out.dump = true;
        } else if (arg == "--output" && !gui) {
            auto v = needValue();
            if (!v) return std::string("--output requires a file name");
            out.outputPath = *v;
        } else if (arg == "--size") {
            auto v = needValue();
            if (!v || !parseSize(*v, out.width, out.height)) {
                return std::string("--size expects WIDTHxHEIGHT, e.g. 800x600");
            }
        } else if (arg == "--max-depth") {
            auto v = needValue();
            long depth = 0;
            if (!v || !parsePositive(*v, depth) || static_cast<size_t>(depth) > MAX_CALL_DEPTH) {
                return "--max-depth expects a number from 1 to " + std::to_string(MAX_CALL_DEPTH);
            }
            out.maxDepth = static_cast<size_t>(depth);
        } else if (!arg.empty() && arg[0] == '-') {
            return "Unknown option '" + arg + "'";
        } else if (out.scriptPath.empty()) {
            out.scriptPath = arg;
        } else {
            return "Unexpected argument '" + arg + "'";
        }
    }
    return std::nullopt;
}

void printUsage(std::ostream& out, const char* program, bool gui) {
    out << "TurtleScript " << (gui ? "(SDL3 window)" : "interpreter") << "\n";
    out << "Usage: " << program << " [options] [script]\n";
    out << "\n";
    out << "Without a script, an interactive prompt is started.\n";
    out << "\n";
    out << "Options:\n";
    out << "  -h, --help        Show this help\n";
    out << "  --trace           Print every executed statement to stderr\n";
    if (!gui) {
        out << "  --dump            Print every drawing call to stdout\n";
        out << "  --output FILE     Render into a PPM image written to FILE\n";
    }
    out << "  --size WxH        Canvas size (default 800x600)\n";
    out << "  --max-depth N     Recursion limit for user functions (1 to 1000, default 1000)\n";
    out << "\n";
    out << "Examples:\n";
    out << "  " << program << " square.turtle\n";
    if (!gui) {
        out << "  " << program << " --output spiral.ppm spiral.turtle\n";
        out << "  echo 'forward(100)' | " << program << " --dump\n";
    }
}

bool readSourceFile(const std::string& path, std::string& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open file '" << path << "'" << std::endl;
        return false;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    out = buffer.str();
    return true;
}

} // namespace turtlescript
