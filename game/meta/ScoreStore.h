// Checksummed, lightly obfuscated file holding the best score across runs.
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Game {

struct ScoreRecord {
    int version{1};
    int highScore{0};
};

class ScoreStore {
public:
    explicit ScoreStore(std::string path);

    // nullopt when the file is missing, truncated, tampered with or unparsable.
    std::optional<ScoreRecord> load() const;
    bool save(const ScoreRecord& record) const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::vector<uint8_t> serialize(const ScoreRecord& record) const;
    std::optional<ScoreRecord> deserialize(const std::vector<uint8_t>& bytes) const;
    void scramble(std::vector<uint8_t>& buffer) const;
    uint32_t crc32(const std::vector<uint8_t>& data) const;
};

}  // namespace Game
