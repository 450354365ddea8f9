#include "export.hpp"

#include "session.hpp"
#include "extractor.hpp"

#include <fstream>
#include <filesystem>


std::string Exporter::file_name(const Piece& piece) {
    return piece.id + ".png";
}

std::string Exporter::data_url(const Piece& piece) {
    return Extractor::data_url(piece.png);
}

nlohmann::json Exporter::write(const std::string& dir, const PuzzleSession& session) {
    std::filesystem::path root(dir);
    std::error_code ec;
    std::filesystem::create_directories(root, ec);
    if (ec) {
        throw std::runtime_error("Cannot create export directory " + dir + ": " + ec.message());
    }

    nlohmann::json manifest = session.snapshot();
    auto& entries = manifest["pieces"];

    for (size_t i = 0; i < session.pieces().size(); ++i) {
        const Piece& piece = session.pieces()[i];
        std::filesystem::path file = root / file_name(piece);

        std::ofstream f(file, std::ios::binary | std::ios::trunc);
        if (!f.write(reinterpret_cast<const char*>(piece.png.data()), static_cast<std::streamsize>(piece.png.size()))) {
            throw std::runtime_error("Failed to write " + file.string());
        }
        entries[i]["file"] = file_name(piece);
    }

    std::ofstream out(root / "manifest.json", std::ios::trunc);
    if (!(out << manifest.dump(2) << '\n')) {
        throw std::runtime_error("Failed to write manifest in " + dir);
    }
    return manifest;
}
