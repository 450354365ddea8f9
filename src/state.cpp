#include "state.hpp"

#include "main.hpp"
#include "session.hpp"

#include <cctype>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <filesystem>

#include <zlib.h>
#include <nlohmann/json.hpp>


std::vector<uint8_t> State::compress(const std::vector<uint8_t>& raw) {
    uLongf packed_size = compressBound(static_cast<uLong>(raw.size()));
    std::vector<uint8_t> packed(sizeof(uint32_t) + packed_size);

    // Raw size prefix so the reader can size its buffer in one go
    uint32_t n = static_cast<uint32_t>(raw.size());
    std::memcpy(packed.data(), &n, sizeof(n));

    int z_result = ::compress(packed.data() + sizeof(n), &packed_size, raw.data(), static_cast<uLong>(raw.size()));
    if (z_result != Z_OK) {
        throw std::runtime_error("zlib compress failed with code " + std::to_string(z_result));
    }

    packed.resize(sizeof(n) + packed_size);
    return packed;
}

std::vector<uint8_t> State::decompress(const std::vector<uint8_t>& packed) {
    uint32_t n = 0;
    if (packed.size() < sizeof(n)) {
        throw std::runtime_error("Saved progress is truncated");
    }
    std::memcpy(&n, packed.data(), sizeof(n));

    std::vector<uint8_t> raw(n);
    uLongf raw_size = n;
    int z_result = uncompress(raw.data(), &raw_size, packed.data() + sizeof(n), static_cast<uLong>(packed.size() - sizeof(n)));
    if (z_result != Z_OK || raw_size != n) {
        throw std::runtime_error("Saved progress is corrupt (zlib code " + std::to_string(z_result) + ")");
    }
    return raw;
}

FileSessionStore::FileSessionStore(std::string dir) : dir(std::move(dir)) {
}

std::string FileSessionStore::path_for(const std::string& key) const {
    std::string name;
    for (char ch : key) {
        name.push_back(std::isalnum(static_cast<unsigned char>(ch)) || ch == '-' ? ch : '_');
    }
    return (std::filesystem::path(dir) / (name + ".sav")).string();
}

void FileSessionStore::save(const std::string& key, const std::vector<uint8_t>& blob) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error("Cannot create session directory " + dir + ": " + ec.message());
    }

    std::vector<uint8_t> packed = State::compress(blob);
    std::ofstream f(path_for(key), std::ios::binary | std::ios::trunc);
    if (!f.write(reinterpret_cast<const char*>(packed.data()), static_cast<std::streamsize>(packed.size()))) {
        throw std::runtime_error("Failed to write session file: " + path_for(key));
    }
}

std::optional<std::vector<uint8_t>> FileSessionStore::load(const std::string& key) {
    std::ifstream f(path_for(key), std::ios::binary);
    if (!f) {
        return std::nullopt;
    }

    std::vector<uint8_t> packed((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return State::decompress(packed);
}

std::optional<std::vector<uint8_t>> MemorySessionStore::load(const std::string& key) {
    auto it = blobs.find(key);
    if (it == blobs.end()) {
        return std::nullopt;
    }
    return it->second;
}

void State::save_progress(SessionStore& store, const std::string& key, const PuzzleSession& session) {
    std::string text = session.snapshot().dump();
    store.save(key, std::vector<uint8_t>(text.begin(), text.end()));
}

std::optional<nlohmann::json> State::load_progress(SessionStore& store, const std::string& key) {
    auto blob = store.load(key);
    if (!blob) {
        return std::nullopt;
    }

    try {
        return nlohmann::json::parse(blob->begin(), blob->end());
    }
    catch (const nlohmann::json::parse_error& e) {
        std::cerr << "Discarding unreadable progress for " << key << ": " << e.what() << std::endl;
        return std::nullopt;
    }
}
