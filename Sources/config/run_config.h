//Author copyright Marcin Matysek (Rewertyn)
#pragma once

#include <array>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include "../core/difficulty.h"
#include "../utils/logging.h"

namespace sudoku_rounds {

enum class Symmetry : uint8_t {
    None = 0,
    Rotate90,
    Rotate180,
    Mirror,
    Flip,
    Random
};

enum class PrintStyle : uint8_t {
    OneLine = 0,
    Compact,
    Readable,
    Csv
};

enum class RunAction : uint8_t {
    None = 0,
    Generate,
    Solve
};

// Difficulty filter for --generate; Unknown means any.
struct RunConfig {
    RunAction action = RunAction::None;

    uint64_t generate_count = 1;
    Difficulty difficulty = Difficulty::Unknown;
    Symmetry symmetry = Symmetry::None;
    PrintStyle print_style = PrintStyle::Readable;

    bool print_puzzle = false;
    bool print_solution = false;
    bool print_history = false;
    bool print_instructions = false;
    bool print_stats = false;
    bool print_propagator_stats = false;
    bool count_solutions = false;
    bool timer = false;
    bool log_history = false;

    bool has_seed = false;
    uint64_t seed = 0;

    std::string log_file;
    LogLevel log_level = LogLevel::Info;

    bool show_help = false;
    bool show_version = false;
};

struct RunResult {
    uint64_t puzzles_done = 0;
    uint64_t attempts = 0;
    uint64_t invalid_puzzles = 0;
    uint64_t unsolvable_puzzles = 0;
    double elapsed_s = 0.0;
};

inline std::string normalize_token(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (const unsigned char ch : in) {
        if (std::isalnum(ch) != 0) {
            out.push_back(static_cast<char>(std::tolower(ch)));
        }
    }
    return out;
}

inline const char* symmetry_name(Symmetry s) {
    switch (s) {
        case Symmetry::None: return "none";
        case Symmetry::Rotate90: return "rotate90";
        case Symmetry::Rotate180: return "rotate180";
        case Symmetry::Mirror: return "mirror";
        case Symmetry::Flip: return "flip";
        case Symmetry::Random: return "random";
    }
    return "none";
}

inline bool parse_symmetry(std::string_view raw, Symmetry& out) {
    const std::string key = normalize_token(raw);
    static const std::array<std::pair<std::string_view, Symmetry>, 6> map = {{
        {"none", Symmetry::None},
        {"rotate90", Symmetry::Rotate90},
        {"rotate180", Symmetry::Rotate180},
        {"mirror", Symmetry::Mirror},
        {"flip", Symmetry::Flip},
        {"random", Symmetry::Random},
    }};
    for (const auto& [name, value] : map) {
        if (key == name) {
            out = value;
            return true;
        }
    }
    return false;
}

inline bool parse_difficulty(std::string_view raw, Difficulty& out) {
    const std::string key = normalize_token(raw);
    if (key == "any" || key == "all" || key == "unknown") { out = Difficulty::Unknown; return true; }
    if (key == "simple") { out = Difficulty::Simple; return true; }
    if (key == "easy") { out = Difficulty::Easy; return true; }
    if (key == "medium" || key == "intermediate") { out = Difficulty::Medium; return true; }
    if (key == "expert") { out = Difficulty::Expert; return true; }
    return false;
}

inline const char* print_style_name(PrintStyle ps) {
    switch (ps) {
        case PrintStyle::OneLine: return "one-line";
        case PrintStyle::Compact: return "compact";
        case PrintStyle::Readable: return "readable";
        case PrintStyle::Csv: return "csv";
    }
    return "readable";
}

inline bool parse_log_level(std::string_view raw, LogLevel& out) {
    const std::string key = normalize_token(raw);
    if (key == "debug") { out = LogLevel::Debug; return true; }
    if (key == "info") { out = LogLevel::Info; return true; }
    if (key == "warn" || key == "warning") { out = LogLevel::Warn; return true; }
    if (key == "error") { out = LogLevel::Error; return true; }
    return false;
}

inline LogLevel log_level_from_env(LogLevel fallback) {
    const char* raw = std::getenv("SUDOKU_ROUNDS_LOG_LEVEL");
    if (raw == nullptr || *raw == '\0') {
        return fallback;
    }
    LogLevel level = fallback;
    return parse_log_level(raw, level) ? level : fallback;
}

inline std::string explain_run_config_text(const RunConfig& cfg) {
    std::ostringstream out;
    out << "action=" << (cfg.action == RunAction::Generate ? "generate" : cfg.action == RunAction::Solve ? "solve" : "none");
    out << " count=" << cfg.generate_count;
    out << " difficulty=" << difficulty_name(cfg.difficulty);
    out << " symmetry=" << symmetry_name(cfg.symmetry);
    out << " style=" << print_style_name(cfg.print_style);
    if (cfg.has_seed) {
        out << " seed=" << cfg.seed;
    }
    return out.str();
}

} // namespace sudoku_rounds
