#include "ScoreStore.h"

#include <array>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

#include <nlohmann/json.hpp>

#include "../../engine/core/Logger.h"

namespace Game {

namespace {
constexpr uint32_t kMagic = 0x42454154;  // 'BEAT'
constexpr std::size_t kHeaderSize = 12;
// Keeps the score from being edited by hand; not meant as protection.
constexpr std::array<uint64_t, 2> kKeySeed = {0x6265617473757276ULL, 0x69766f725f686921ULL};

uint32_t readU32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

void writeU32(uint8_t* p, uint32_t v) {
    p[0] = static_cast<uint8_t>((v >> 24) & 0xFF);
    p[1] = static_cast<uint8_t>((v >> 16) & 0xFF);
    p[2] = static_cast<uint8_t>((v >> 8) & 0xFF);
    p[3] = static_cast<uint8_t>(v & 0xFF);
}
}  // namespace

ScoreStore::ScoreStore(std::string path) : path_(std::move(path)) {}

std::optional<ScoreRecord> ScoreStore::load() const {
    std::ifstream f(path_, std::ios::binary);
    if (!f) return std::nullopt;
    std::vector<uint8_t> fileBuf((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (fileBuf.size() < kHeaderSize) {
        Engine::logWarn("High score file truncated: " + path_);
        return std::nullopt;
    }
    if (readU32(fileBuf.data()) != kMagic) {
        Engine::logWarn("High score file has a bad header: " + path_);
        return std::nullopt;
    }
    const uint32_t payloadSize = readU32(fileBuf.data() + 4);
    const uint32_t storedCrc = readU32(fileBuf.data() + 8);
    if (fileBuf.size() != payloadSize + kHeaderSize) {
        Engine::logWarn("High score file size mismatch: " + path_);
        return std::nullopt;
    }
    std::vector<uint8_t> payload(fileBuf.begin() + static_cast<std::ptrdiff_t>(kHeaderSize), fileBuf.end());
    scramble(payload);
    if (crc32(payload) != storedCrc) {
        Engine::logWarn("High score file checksum mismatch: " + path_);
        return std::nullopt;
    }
    return deserialize(payload);
}

bool ScoreStore::save(const ScoreRecord& record) const {
    std::vector<uint8_t> payload = serialize(record);
    const uint32_t c = crc32(payload);
    scramble(payload);
    std::vector<uint8_t> fileBuf(kHeaderSize + payload.size());
    writeU32(fileBuf.data(), kMagic);
    writeU32(fileBuf.data() + 4, static_cast<uint32_t>(payload.size()));
    writeU32(fileBuf.data() + 8, c);
    std::memcpy(fileBuf.data() + kHeaderSize, payload.data(), payload.size());

    const auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            Engine::logWarn("Could not create " + parent.string() + ": " + ec.message());
            return false;
        }
    }
    std::ofstream f(path_, std::ios::binary | std::ios::trunc);
    if (!f) return false;
    f.write(reinterpret_cast<const char*>(fileBuf.data()), static_cast<std::streamsize>(fileBuf.size()));
    return f.good();
}

std::vector<uint8_t> ScoreStore::serialize(const ScoreRecord& record) const {
    nlohmann::json j;
    j["version"] = record.version;
    j["high_score"] = record.highScore;
    auto str = j.dump();
    return std::vector<uint8_t>(str.begin(), str.end());
}

std::optional<ScoreRecord> ScoreStore::deserialize(const std::vector<uint8_t>& bytes) const {
    try {
        auto j = nlohmann::json::parse(std::string(bytes.begin(), bytes.end()));
        ScoreRecord record;
        record.version = j.value("version", 1);
        record.highScore = j.value("high_score", 0);
        if (record.highScore < 0) record.highScore = 0;
        return record;
    } catch (const nlohmann::json::exception& e) {
        Engine::logWarn(std::string("High score payload unreadable: ") + e.what());
        return std::nullopt;
    }
}

void ScoreStore::scramble(std::vector<uint8_t>& buffer) const {
    // xoroshiro-style keystream; applying it twice restores the input.
    uint64_t s0 = kKeySeed[0];
    uint64_t s1 = kKeySeed[1];
    for (auto& byte : buffer) {
        uint64_t x = s0 + s1;
        s1 ^= s0;
        s0 = ((s0 << 55) | (s0 >> (64 - 55))) ^ s1 ^ (s1 << 14);
        s1 = (s1 << 36) | (s1 >> (64 - 36));
        byte ^= static_cast<uint8_t>(x & 0xFF);
    }
}

uint32_t ScoreStore::crc32(const std::vector<uint8_t>& data) const {
    uint32_t crc = 0xFFFFFFFFu;
    for (uint8_t b : data) {
        crc ^= b;
        for (int i = 0; i < 8; ++i) {
            uint32_t mask = -(crc & 1u);
            crc = (crc >> 1) ^ (0xEDB88320u & mask);
        }
    }
    return ~crc;
}

}  // namespace Game
