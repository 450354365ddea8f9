#pragma once

#include "main.hpp"

#include <string>
#include <cstdint>

#include <nlohmann/json.hpp>
#include <opencv2/opencv.hpp>


struct Settings {
    PuzzleConfig config;
    uint64_t seed = 0;                  // 0: derive from the clock
    cv::Size canvas{ 0, 0 };            // 0x0: derive from the image
    bool sound = true;
    SolvedPolicy solved_policy = SolvedPolicy::Sticky;
    std::string session_key = "default";

    // Missing file yields defaults; malformed content throws ConfigError
    static Settings load(const std::string& path);
    void save(const std::string& path) const;

    static void validate(const PuzzleConfig& config);
    void validate() const;

    uint64_t resolve_seed() const;

    static const char* to_string(Difficulty difficulty);
    static Difficulty difficulty_from_string(const std::string& name);
    static const char* to_string(SolvedPolicy policy);
    static SolvedPolicy policy_from_string(const std::string& name);
};

void to_json(nlohmann::json& j, const PuzzleConfig& config);
void from_json(const nlohmann::json& j, PuzzleConfig& config);

void to_json(nlohmann::json& j, const Settings& settings);
void from_json(const nlohmann::json& j, Settings& settings);
