#include "gen_config.hpp"
#include "level.hpp"
#include "level_gen.hpp"
#include "version.hpp"

#include <cstdint>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace {

static void printUsage(const char* argv0) {
    std::cout
        << "Usage:\n"
        << "  " << argv0 << " [options]\n\n"
        << "Options:\n"
        << "  --config <path>               Generator settings INI to load.\n"
        << "  --seed <n>                    Override the seed (decimal or 0x hex).\n"
        << "  --width <n>                   Override the region width.\n"
        << "  --height <n>                  Override the region height.\n"
        << "  --ratio <f>                   Override the target floor ratio (0..1].\n"
        << "  --out <path>                  Write the map as text instead of printing it.\n"
        << "  --json-report <path>          Write a JSON summary report.\n"
        << "  --write-default-config <path> Write a commented default settings file and exit.\n"
        << "  --quiet                       Do not print the map.\n"
        << "  --verbose                     Print the cause of every failed attempt.\n"
        << "  --version                     Print version.\n"
        << "  --help                        Show this help.\n";
}

static bool argValue(int& i, int argc, char** argv, std::string& out) {
    if (i + 1 >= argc) return false;
    out = argv[++i];
    return true;
}

static bool parsePositiveInt(const std::string& s, int& out) {
    uint32_t v = 0;
    if (!parseUnsigned32(s, v) || v == 0 || v > 100000u) return false;
    out = static_cast<int>(v);
    return true;
}

static bool parseRatio(const std::string& s, float& out) {
    std::istringstream ss(s);
    float v = 0.0f;
    if (!(ss >> v) || !ss.eof()) return false;
    out = v;
    return true;
}

static std::string jsonEscape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (unsigned char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    static const char* hex = "0123456789abcdef";
                    out += "\\u00";
                    out += hex[(c >> 4) & 0xF];
                    out += hex[c & 0xF];
                } else {
                    out.push_back(static_cast<char>(c));
                }
                break;
        }
    }
    return out;
}

static bool writeJsonReport(const std::string& path,
                            const GeneratorConfig& cfg,
                            const GenerationReport& rep,
                            const Level* level,
                            std::string* err) {
    std::ofstream f(path);
    if (!f) {
        if (err) *err = "Failed to open JSON report for writing: " + path;
        return false;
    }

    f << "{\n";
    f << "  \"version\": \"" << jsonEscape(DELVEGEN_VERSION) << "\",\n";
    f << "  \"seed\": " << cfg.seed << ",\n";
    f << "  \"region\": { \"width\": " << cfg.regionWidth << ", \"height\": " << cfg.regionHeight << " },\n";
    f << "  \"target_floor_ratio\": " << cfg.targetFloorRatio << ",\n";
    f << "  \"corridor_policy\": \"" << corridorPolicyName(cfg.corridorPolicy) << "\",\n";
    f << "  \"connector\": \"" << connectorStyleName(cfg.connector) << "\",\n";
    f << "  \"success\": " << (level ? "true" : "false") << ",\n";
    f << "  \"failure\": \"" << generationFailureName(rep.failure) << "\",\n";
    f << "  \"error\": \"" << jsonEscape(rep.error) << "\",\n";
    f << "  \"attempts\": " << rep.attempts << ",\n";
    f << "  \"placement_attempts\": " << rep.placementAttempts << ",\n";
    f << "  \"placement_failures\": " << rep.placementFailures << ",\n";
    f << "  \"corridors_carved\": " << rep.corridorsCarved << ",\n";
    f << "  \"corridors_clipped\": " << rep.corridorsClipped << ",\n";
    f << "  \"corridor_reroutes\": " << rep.corridorReroutes << ",\n";

    if (level) {
        f << "  \"achieved_floor_ratio\": " << level->info().achievedFloorRatio << ",\n";
        f << "  \"content_hash\": \"0x" << std::hex << level->contentHash() << std::dec << "\",\n";
        f << "  \"rooms\": [\n";
        const auto& rooms = level->rooms();
        for (size_t i = 0; i < rooms.size(); ++i) {
            const Room& r = rooms[i];
            f << "    { \"id\": " << r.id << ", \"x\": " << r.rect.x << ", \"y\": " << r.rect.y
              << ", \"w\": " << r.rect.w << ", \"h\": " << r.rect.h << " }";
            f << (i + 1 < rooms.size() ? ",\n" : "\n");
        }
        f << "  ],\n";
    }

    f << "  \"failed_attempts\": [\n";
    for (size_t i = 0; i < rep.failedAttempts.size(); ++i) {
        const AttemptRecord& a = rep.failedAttempts[i];
        f << "    { \"attempt\": " << a.attempt
          << ", \"stage\": \"" << genStateName(a.state) << "\""
          << ", \"failure\": \"" << generationFailureName(a.failure) << "\""
          << ", \"detail\": \"" << jsonEscape(a.detail) << "\" }";
        f << (i + 1 < rep.failedAttempts.size() ? ",\n" : "\n");
    }
    f << "  ]\n";
    f << "}\n";

    if (!f) {
        if (err) *err = "Failed while writing JSON report: " + path;
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    std::string configPath;
    std::string outPath;
    std::string jsonReport;
    std::string defaultConfigPath;
    bool quiet = false;
    bool verbose = false;

    bool haveSeed = false, haveWidth = false, haveHeight = false, haveRatio = false;
    uint32_t seed = 0;
    int width = 0;
    int height = 0;
    float ratio = 0.0f;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        std::string v;

        if (a == "--help" || a == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (a == "--version" || a == "-v") {
            std::cout << DELVEGEN_APPNAME << " " << DELVEGEN_VERSION << "\n";
            return 0;
        } else if (a == "--config") {
            if (!argValue(i, argc, argv, configPath)) { std::cerr << "Missing value for --config\n"; return 2; }
        } else if (a == "--out") {
            if (!argValue(i, argc, argv, outPath)) { std::cerr << "Missing value for --out\n"; return 2; }
        } else if (a == "--json-report") {
            if (!argValue(i, argc, argv, jsonReport)) { std::cerr << "Missing value for --json-report\n"; return 2; }
        } else if (a == "--write-default-config") {
            if (!argValue(i, argc, argv, defaultConfigPath)) { std::cerr << "Missing value for --write-default-config\n"; return 2; }
        } else if (a == "--seed") {
            if (!argValue(i, argc, argv, v) || !parseUnsigned32(v, seed)) { std::cerr << "Invalid --seed\n"; return 2; }
            haveSeed = true;
        } else if (a == "--width") {
            if (!argValue(i, argc, argv, v) || !parsePositiveInt(v, width)) { std::cerr << "Invalid --width\n"; return 2; }
            haveWidth = true;
        } else if (a == "--height") {
            if (!argValue(i, argc, argv, v) || !parsePositiveInt(v, height)) { std::cerr << "Invalid --height\n"; return 2; }
            haveHeight = true;
        } else if (a == "--ratio") {
            if (!argValue(i, argc, argv, v) || !parseRatio(v, ratio)) { std::cerr << "Invalid --ratio\n"; return 2; }
            haveRatio = true;
        } else if (a == "--quiet") {
            quiet = true;
        } else if (a == "--verbose") {
            verbose = true;
        } else {
            std::cerr << "Unknown argument: " << a << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    if (!defaultConfigPath.empty()) {
        if (!writeDefaultGeneratorConfig(defaultConfigPath)) {
            std::cerr << "Failed to write default config: " << defaultConfigPath << "\n";
            return 1;
        }
        std::cout << "Wrote default config: " << defaultConfigPath << "\n";
        return 0;
    }

    GeneratorConfig cfg;
    if (!configPath.empty()) {
        std::string warns;
        if (!loadGeneratorConfig(configPath, cfg, &warns)) {
            std::cerr << "Failed to load config: " << configPath << "\n";
            return 2;
        }
        if (!warns.empty()) std::cerr << warns;
    }
    if (haveSeed) cfg.seed = seed;
    if (haveWidth) cfg.regionWidth = width;
    if (haveHeight) cfg.regionHeight = height;
    if (haveRatio) cfg.targetFloorRatio = ratio;

    Level level;
    GenerationReport rep;
    const bool ok = generateLevel(cfg, level, &rep);

    if (verbose) {
        for (const AttemptRecord& a : rep.failedAttempts) {
            std::cerr << "attempt " << a.attempt << " failed in " << genStateName(a.state)
                      << ": " << generationFailureName(a.failure) << ": " << a.detail << "\n";
        }
    }

    if (!jsonReport.empty()) {
        std::string jerr;
        if (!writeJsonReport(jsonReport, cfg, rep, ok ? &level : nullptr, &jerr)) {
            std::cerr << jerr << "\n";
        }
    }

    if (!ok) {
        std::cerr << "Generation FAILED: " << generationFailureName(rep.failure) << ": " << rep.error << "\n";
        return (rep.failure == GenerationFailure::InvalidConfig) ? 2 : 1;
    }

    if (!outPath.empty()) {
        std::ofstream f(outPath);
        if (!f || !(f << level.toText())) {
            std::cerr << "Failed to write map: " << outPath << "\n";
            return 1;
        }
    } else if (!quiet) {
        std::cout << level.toText();
    }

    std::cout << "Level OK: seed=" << cfg.seed
              << " size=" << level.width() << "x" << level.height()
              << " rooms=" << level.rooms().size()
              << " corridors=" << rep.corridorsCarved
              << " clipped=" << rep.corridorsClipped
              << " floor=" << level.info().achievedFloorRatio
              << " attempt=" << level.info().attempt
              << "\n";
    return 0;
}
