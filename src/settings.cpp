#include "settings.hpp"

#include "grid.hpp"

#include <chrono>
#include <fstream>
#include <iostream>


const char* Settings::to_string(Difficulty difficulty) {
    switch (difficulty) {
        case Difficulty::Easy:   return "easy";
        case Difficulty::Medium: return "medium";
        case Difficulty::Hard:   return "hard";
        case Difficulty::Custom: return "custom";
    }
    return "medium";
}

Difficulty Settings::difficulty_from_string(const std::string& name) {
    if (name == "easy" || name == "Easy") return Difficulty::Easy;
    if (name == "medium" || name == "Medium") return Difficulty::Medium;
    if (name == "hard" || name == "Hard") return Difficulty::Hard;
    if (name == "custom" || name == "Custom") return Difficulty::Custom;
    throw ConfigError("Unknown difficulty: " + name);
}

const char* Settings::to_string(SolvedPolicy policy) {
    return policy == SolvedPolicy::Revert ? "revert" : "sticky";
}

SolvedPolicy Settings::policy_from_string(const std::string& name) {
    if (name == "sticky") return SolvedPolicy::Sticky;
    if (name == "revert") return SolvedPolicy::Revert;
    throw ConfigError("Unknown solved policy: " + name);
}

void to_json(nlohmann::json& j, const PuzzleConfig& config) {
    j = nlohmann::json{
        { "difficulty", Settings::to_string(config.difficulty) },
        { "piece_count", config.piece_count },
        { "shuffle", config.shuffled },
    };
}

void from_json(const nlohmann::json& j, PuzzleConfig& config) {
    config.difficulty = Settings::difficulty_from_string(j.value("difficulty", "medium"));
    config.piece_count = j.value("piece_count", Grid::piece_count_for(config));
    config.shuffled = j.value("shuffle", true);
}

void to_json(nlohmann::json& j, const Settings& settings) {
    to_json(j, settings.config);
    j["seed"] = settings.seed;
    j["canvas"] = { { "width", settings.canvas.width }, { "height", settings.canvas.height } };
    j["sound"] = settings.sound;
    j["solved_policy"] = Settings::to_string(settings.solved_policy);
    j["session_key"] = settings.session_key;
}

void from_json(const nlohmann::json& j, Settings& settings) {
    from_json(j, settings.config);
    settings.seed = j.value("seed", uint64_t{ 0 });

    if (j.contains("canvas")) {
        const auto& canvas = j.at("canvas");
        settings.canvas = cv::Size(canvas.value("width", 0), canvas.value("height", 0));
    }

    settings.sound = j.value("sound", true);
    settings.solved_policy = Settings::policy_from_string(j.value("solved_policy", "sticky"));
    settings.session_key = j.value("session_key", "default");
}

Settings Settings::load(const std::string& path) {
    Settings settings;

    std::ifstream f(path);
    if (!f) {
        return settings;
    }

    try {
        nlohmann::json j;
        f >> j;
        settings = j.get<Settings>();
    }
    catch (const nlohmann::json::exception& e) {
        throw ConfigError("Malformed settings file " + path + ": " + e.what());
    }

    settings.validate();
    return settings;
}

void Settings::save(const std::string& path) const {
    std::ofstream f(path, std::ios::trunc);
    if (!f) {
        std::cerr << "Failed to write settings file: " << path << std::endl;
        return;
    }

    f << nlohmann::json(*this).dump(4) << '\n';
}

void Settings::validate(const PuzzleConfig& config) {
    int count = Grid::piece_count_for(config);
    if (count < MIN_PIECE_COUNT || count > MAX_PIECE_COUNT) {
        throw ConfigError("Piece count must be between " + std::to_string(MIN_PIECE_COUNT) + " and " + std::to_string(MAX_PIECE_COUNT));
    }
}

void Settings::validate() const {
    validate(config);

    if (canvas.width < 0 || canvas.height < 0 || (canvas.width == 0) != (canvas.height == 0)) {
        throw ConfigError("Canvas size must be positive, or 0x0 to fit the image");
    }
}

uint64_t Settings::resolve_seed() const {
    if (seed != 0) {
        return seed;
    }
    return static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count());
}
