#pragma once

#include "main.hpp"

#include <string>

#include <nlohmann/json.hpp>

class PuzzleSession;


class Exporter {
public:
    // One PNG per piece plus manifest.json; returns the manifest
    static nlohmann::json write(const std::string& dir, const PuzzleSession& session);

    static std::string file_name(const Piece& piece);
    static std::string data_url(const Piece& piece);
};
