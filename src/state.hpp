#pragma once

#include <map>
#include <string>
#include <vector>
#include <cstdint>
#include <optional>

#include <nlohmann/json.hpp>

class PuzzleSession;


class SessionStore {
public:
    virtual ~SessionStore() = default;
    virtual void save(const std::string& key, const std::vector<uint8_t>& blob) = 0;
    virtual std::optional<std::vector<uint8_t>> load(const std::string& key) = 0;
};

// One zlib-compressed file per key under a directory
class FileSessionStore : public SessionStore {
public:
    explicit FileSessionStore(std::string dir);

    void save(const std::string& key, const std::vector<uint8_t>& blob) override;
    std::optional<std::vector<uint8_t>> load(const std::string& key) override;

    std::string path_for(const std::string& key) const;

private:
    std::string dir;
};

class MemorySessionStore : public SessionStore {
public:
    void save(const std::string& key, const std::vector<uint8_t>& blob) override { blobs[key] = blob; }
    std::optional<std::vector<uint8_t>> load(const std::string& key) override;

private:
    std::map<std::string, std::vector<uint8_t>> blobs;
};

class State {
public:
    static void save_progress(SessionStore& store, const std::string& key, const PuzzleSession& session);
    static std::optional<nlohmann::json> load_progress(SessionStore& store, const std::string& key);

    static std::vector<uint8_t> compress(const std::vector<uint8_t>& raw);
    static std::vector<uint8_t> decompress(const std::vector<uint8_t>& packed);
};
