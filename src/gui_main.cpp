#include <SDL3/SDL.h>
#include <iostream>
#include <string>
#include <poll.h>
#include <unistd.h>

#include "Graphics/RasterSurface.hpp"
#include "Session/Session.hpp"
#include "Shell/Repl.hpp"
#include "Shell/ShellOptions.hpp"

using namespace turtlescript;

// SDL3 window showing the canvas; statements are typed on stdin.
class TurtleShell {
private:
    SDL_Window* window = nullptr;
    SDL_Renderer* renderer = nullptr;
    SDL_Texture* canvasTexture = nullptr;

    RasterSurface surface;
    Session session;
    Repl repl;

    bool running = true;
    bool stdinOpen = true;
    bool canvasDirty = true;
    std::string stdinBuffer;
    uint64_t lastPump = 0;

    static constexpr uint64_t FRAME_MS = 16;

public:
    TurtleShell(const ShellOptions& options)
        : surface(options.width, options.height),
          session(surface, makeSessionOptions(options)),
          repl(session, std::cout, std::cerr) {
        session.setTrace(options.trace);
        surface.setPresentCallback([this](const RasterSurface&) { canvasDirty = true; });
        // Long-running programs keep the window alive and can be stopped.
        session.setCancelCheck([this]() { return !pumpWhileRunning(); });
    }

    ~TurtleShell() {
        cleanup();
    }

    TurtleShell(const TurtleShell&) = delete;
    TurtleShell& operator=(const TurtleShell&) = delete;

    bool initialize() {
        if (!SDL_Init(SDL_INIT_VIDEO)) {
            std::cerr << "SDL initialization failed: " << SDL_GetError() << std::endl;
            return false;
        }

        window = SDL_CreateWindow("TurtleScript", surface.getWidth(), surface.getHeight(), SDL_WINDOW_RESIZABLE);
        if (!window) {
            std::cerr << "Window creation failed: " << SDL_GetError() << std::endl;
            return false;
        }

        renderer = SDL_CreateRenderer(window, nullptr);
        if (!renderer) {
            std::cerr << "Renderer creation failed: " << SDL_GetError() << std::endl;
            return false;
        }

        // RasterSurface stores bytes in R, G, B, A order
        canvasTexture = SDL_CreateTexture(renderer, SDL_PIXELFORMAT_RGBA32, SDL_TEXTUREACCESS_STREAMING,
                                          surface.getWidth(), surface.getHeight());
        if (!canvasTexture) {
            std::cerr << "Canvas texture creation failed: " << SDL_GetError() << std::endl;
            return false;
        }
        return true;
    }

    bool runScript(const std::string& path) {
        std::string source;
        if (!readSourceFile(path, source)) return false;

        std::cout << "Executing script: " << path << std::endl;
        RunResult result = session.evalStatement(source);
        if (!result.ok()) {
            std::cerr << "Error: " << formatError(*result.error) << std::endl;
            return false;
        }
        return true;
    }

    void run() {
        repl.printBanner();
        showPrompt();

        while (running) {
            SDL_Event event;
            while (SDL_PollEvent(&event)) {
                handleEvent(event);
            }

            pollStdin();
            render();

            SDL_Delay(FRAME_MS); // ~60 FPS
        }
    }

private:
    static SessionOptions makeSessionOptions(const ShellOptions& options) {
        SessionOptions sessionOptions;
        sessionOptions.maxCallDepth = options.maxDepth;
        return sessionOptions;
    }

    void cleanup() {
        if (canvasTexture) {
            SDL_DestroyTexture(canvasTexture);
            canvasTexture = nullptr;
        }
        if (renderer) {
            SDL_DestroyRenderer(renderer);
            renderer = nullptr;
        }
        if (window) {
            SDL_DestroyWindow(window);
            window = nullptr;
        }
        SDL_Quit();
    }

    void showPrompt() {
        if (stdinOpen) std::cout << repl.prompt() << std::flush;
    }

    void handleEvent(const SDL_Event& event) {
        switch (event.type) {
        case SDL_EVENT_QUIT:
            running = false;
            session.stop();
            break;

        case SDL_EVENT_KEY_DOWN:
            if (event.key.key == SDLK_ESCAPE) {
                session.stop();
            }
            break;

        case SDL_EVENT_WINDOW_RESIZED:
            canvasDirty = true;
            break;
        }
    }

    // Called between statements of a running program. Returns false to cancel.
    bool pumpWhileRunning() {
        uint64_t now = SDL_GetTicks();
        if (now - lastPump < FRAME_MS) return running;
        lastPump = now;

        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            handleEvent(event);
        }
        canvasDirty = true;
        render();
        return running && !session.stopRequested();
    }

    // Non-blocking read of whole lines from stdin.
    void pollStdin() {
        if (!stdinOpen) return;

        struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
        while (running && poll(&pfd, 1, 0) > 0 && (pfd.revents & (POLLIN | POLLHUP))) {
            char chunk[512];
            ssize_t n = read(STDIN_FILENO, chunk, sizeof(chunk));
            if (n <= 0) {
                stdinOpen = false;
                std::cout << std::endl;
                return;
            }
            stdinBuffer.append(chunk, static_cast<size_t>(n));

            size_t newline;
            while ((newline = stdinBuffer.find('\n')) != std::string::npos) {
                std::string line = stdinBuffer.substr(0, newline);
                stdinBuffer.erase(0, newline + 1);
                if (!repl.feedLine(line)) {
                    running = false;
                    return;
                }
                showPrompt();
            }
        }
    }

    void render() {
        if (canvasDirty) {
            SDL_UpdateTexture(canvasTexture, nullptr, surface.pixels().data(), surface.getWidth() * 4);
            canvasDirty = false;
        }

        SDL_SetRenderDrawColor(renderer, 0, 0, 0, 255);
        SDL_RenderClear(renderer);
        SDL_RenderTexture(renderer, canvasTexture, nullptr, nullptr);
        SDL_RenderPresent(renderer);
    }
};

int main(int argc, char* argv[]) {
    ShellOptions options;
    if (auto error = parseShellOptions(argc, argv, options, true)) {
        std::cerr << "Error: " << *error << std::endl;
        printUsage(std::cerr, argv[0], true);
        return 2;
    }
    if (options.showHelp) {
        printUsage(std::cout, argv[0], true);
        return 0;
    }

    TurtleShell shell(options);

    if (!shell.initialize()) {
        std::cerr << "Failed to initialize TurtleScript window" << std::endl;
        return 1;
    }

    if (!options.scriptPath.empty()) {
        shell.runScript(options.scriptPath);
    }

    shell.run();

    return 0;
}
