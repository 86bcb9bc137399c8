// Command-line options shared by the console and SDL front ends.
#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>

namespace turtlescript {

// Deeper user recursion would exhaust the native stack before the interpreter could report it.
constexpr size_t MAX_CALL_DEPTH = 1000;

struct ShellOptions {
    std::string scriptPath;   // empty: interactive
    bool showHelp{false};
    bool trace{false};
    bool dump{false};         // echo surface calls (console only)
    std::string outputPath;   // PPM file to write after the run (console only)
    int width{800};
    int height{600};
    size_t maxDepth{MAX_CALL_DEPTH};
};

// Parses argv into `out`. Returns an error message for bad arguments.
std::optional<std::string> parseShellOptions(int argc, char* argv[], ShellOptions& out, bool gui);

void printUsage(std::ostream& out, const char* program, bool gui);

// Whole file into `out`; false (with a message on stderr) when unreadable.
bool readSourceFile(const std::string& path, std::string& out);

} // namespace turtlescript
