#include "sdl.hpp"

#include <cstdint>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

#include "gen_config.hpp"
#include "level_gen.hpp"
#include "render.hpp"
#include "version.hpp"

static std::optional<uint32_t> parseSeedArg(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--seed" && i + 1 < argc) {
            uint32_t v = 0;
            if (parseUnsigned32(argv[i + 1], v)) return v;
            return std::nullopt;
        }
    }
    return std::nullopt;
}

static bool hasFlag(int argc, char** argv, const char* flag) {
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == flag) return true;
    }
    return false;
}

static std::optional<std::string> parseStringArg(int argc, char** argv, const char* opt) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == opt && i + 1 < argc) {
            return std::string(argv[i + 1]);
        }
    }
    return std::nullopt;
}

static void printUsage(const char* exe) {
    std::cout
        << DELVEGEN_APPNAME << " " << DELVEGEN_VERSION << "\n"
        << "Usage: " << (exe ? exe : "delvegen_view") << " [options]\n\n"
        << "Options:\n"
        << "  --seed <n>           First seed to show\n"
        << "  --config <path>      Generator settings INI to load\n"
        << "\n"
        << "Keys: R / Space = next seed, Backspace = previous seed, Esc = quit\n"
        << "\n"
        << "  --version, -v        Print version and exit\n"
        << "  --help, -h           Show this help and exit\n";
}

static std::string windowTitle(const GeneratorConfig& cfg, bool ok, const GenerationReport& rep) {
    std::ostringstream ss;
    ss << DELVEGEN_APPNAME << "  seed " << cfg.seed;
    if (ok) {
        ss << "  attempts " << rep.attempts << "  corridors " << rep.corridorsCarved
           << "  clipped " << rep.corridorsClipped;
    } else {
        ss << "  FAILED: " << generationFailureName(rep.failure);
    }
    return ss.str();
}

int main(int argc, char** argv) {
    if (hasFlag(argc, argv, "--help") || hasFlag(argc, argv, "-h")) {
        printUsage(argc > 0 ? argv[0] : "delvegen_view");
        return 0;
    }
    if (hasFlag(argc, argv, "--version") || hasFlag(argc, argv, "-v")) {
        std::cout << DELVEGEN_APPNAME << " " << DELVEGEN_VERSION << "\n";
        return 0;
    }

    GeneratorConfig cfg;
    if (const std::optional<std::string> configArg = parseStringArg(argc, argv, "--config")) {
        std::string warns;
        if (!loadGeneratorConfig(*configArg, cfg, &warns)) {
            std::cerr << "Failed to load config: " << *configArg << "\n";
            return 2;
        }
        if (!warns.empty()) std::cerr << warns;
    }
    if (const std::optional<uint32_t> seedArg = parseSeedArg(argc, argv)) {
        cfg.seed = *seedArg;
    }

    std::string err;
    if (!validateConfig(cfg, &err)) {
        std::cerr << "Invalid config: " << err << "\n";
        return 2;
    }

    SDL_SetMainReady();
    if (SDL_Init(SDL_INIT_VIDEO) != 0) {
        std::cerr << "SDL_Init failed: " << SDL_GetError() << "\n";
        return 1;
    }

    int rc = 0;
    {
        LevelRenderer view(1280, 720, true);
        if (!view.init()) {
            rc = 1;
        } else {
            Level level;
            GenerationReport rep;
            bool ok = generateLevel(cfg, level, &rep);
            if (!ok) std::cerr << "seed " << cfg.seed << ": " << rep.error << "\n";
            view.setTitle(windowTitle(cfg, ok, rep));

            bool running = true;
            while (running) {
                SDL_Event ev;
                bool regenerate = false;
                while (SDL_PollEvent(&ev)) {
                    if (ev.type == SDL_QUIT) running = false;
                    if (ev.type != SDL_KEYDOWN) continue;
                    switch (ev.key.keysym.sym) {
                        case SDLK_ESCAPE:
                            running = false;
                            break;
                        case SDLK_r:
                        case SDLK_SPACE:
                            ++cfg.seed;
                            regenerate = true;
                            break;
                        case SDLK_BACKSPACE:
                            --cfg.seed;
                            regenerate = true;
                            break;
                        default:
                            break;
                    }
                }

                if (regenerate) {
                    Level next;
                    ok = generateLevel(cfg, next, &rep);
                    if (ok) {
                        level = std::move(next);
                    } else {
                        std::cerr << "seed " << cfg.seed << ": " << rep.error << "\n";
                    }
                    view.setTitle(windowTitle(cfg, ok, rep));
                }

                view.render(level);
                SDL_Delay(16);
            }
        }
    }

    SDL_Quit();
    return rc;
}
