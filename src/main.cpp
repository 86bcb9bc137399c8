#include <atomic>
#include <csignal>
#include <iostream>
#include <string>
#include <unistd.h> // for isatty

#include "Graphics/RasterSurface.hpp"
#include "Graphics/RecordingSurface.hpp"
#include "Session/Session.hpp"
#include "Shell/Repl.hpp"
#include "Shell/ShellOptions.hpp"

using namespace turtlescript;

namespace {

// Published before SIGINT is routed here and never cleared while it is. Only
// lock-free atomics are touched from the handler.
std::atomic<Session*> activeSession{nullptr};
static_assert(std::atomic<Session*>::is_always_lock_free, "SIGINT handler needs a lock-free pointer");
static_assert(std::atomic<bool>::is_always_lock_free, "SIGINT handler needs a lock-free stop flag");

void handleInterrupt(int) {
    if (Session* session = activeSession.load(std::memory_order_relaxed)) session->stop();
}

int runScript(Session& session, const std::string& path) {
    std::string source;
    if (!readSourceFile(path, source)) return 1;

    RunResult result = session.evalStatement(source);
    if (!result.ok()) {
        std::cerr << "Error: " << formatError(*result.error) << std::endl;
        return 1;
    }
    return 0;
}

int runRepl(Session& session) {
    bool interactive = isatty(STDIN_FILENO);
    Repl repl(session, std::cout, std::cerr);
    if (interactive) repl.printBanner();

    std::string line;
    while (true) {
        if (interactive) std::cout << repl.prompt() << std::flush;
        if (!std::getline(std::cin, line)) {
            if (interactive) std::cout << "\nGoodbye!" << std::endl;
            break;
        }
        if (!repl.feedLine(line)) break;
    }
    // Piped input: report failure like a script would
    return (!interactive && repl.getErrorCount() > 0) ? 1 : 0;
}

} // namespace

int main(int argc, char* argv[]) {
    ShellOptions options;
    if (auto error = parseShellOptions(argc, argv, options, false)) {
        std::cerr << "Error: " << *error << std::endl;
        printUsage(std::cerr, argv[0], false);
        return 2;
    }
    if (options.showHelp) {
        printUsage(std::cout, argv[0], false);
        return 0;
    }
    if (options.dump && !options.outputPath.empty()) {
        std::cerr << "Error: --dump and --output cannot be combined" << std::endl;
        return 2;
    }

    RasterSurface raster(options.width, options.height);
    RecordingSurface recorder;
    if (options.dump) {
        recorder.setListener([](const DrawCall& call) {
            std::cout << formatDrawCall(call) << std::endl;
        });
    }
    DrawingSurface& surface = options.dump ? static_cast<DrawingSurface&>(recorder)
                                           : static_cast<DrawingSurface&>(raster);

    SessionOptions sessionOptions;
    sessionOptions.maxCallDepth = options.maxDepth;
    Session session(surface, sessionOptions);
    session.setTrace(options.trace);

    activeSession.store(&session, std::memory_order_relaxed);
    std::signal(SIGINT, handleInterrupt);

    int status = options.scriptPath.empty() ? runRepl(session) : runScript(session, options.scriptPath);

    // Restored before the session goes out of scope.
    std::signal(SIGINT, SIG_DFL);

    if (!options.outputPath.empty()) {
        if (!raster.savePPM(options.outputPath)) {
            std::cerr << "Error: Cannot write image '" << options.outputPath << "'" << std::endl;
            return 1;
        }
        std::cerr << "[Shell] Wrote " << raster.getWidth() << "x" << raster.getHeight()
                  << " image to " << options.outputPath << std::endl;
    }
    return status;
}
