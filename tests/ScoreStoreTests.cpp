// High score persistence: round trip and rejection of damaged files.
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <vector>

#include "../game/meta/ScoreStore.h"

namespace fs = std::filesystem;

int main() {
    const fs::path dir = fs::temp_directory_path() / "beat_survivor_score_tests";
    fs::remove_all(dir);
    const std::string path = (dir / "nested" / "score.dat").string();

    Game::ScoreStore store(path);
    assert(!store.load().has_value());

    Game::ScoreRecord record;
    record.highScore = 1234;
    assert(store.save(record));
    auto loaded = store.load();
    assert(loaded.has_value());
    assert(loaded->highScore == 1234 && loaded->version == 1);

    // The payload is not stored as plain text.
    std::vector<char> bytes;
    {
        std::ifstream in(path, std::ios::binary);
        bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
    const std::string raw(bytes.begin(), bytes.end());
    assert(raw.find("high_score") == std::string::npos);

    // Flip one payload byte: checksum mismatch.
    {
        std::vector<char> tampered = bytes;
        tampered[tampered.size() - 1] ^= 0x5A;
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(tampered.data(), static_cast<std::streamsize>(tampered.size()));
    }
    assert(!store.load().has_value());

    // Truncated header.
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(bytes.data(), 6);
    }
    assert(!store.load().has_value());

    record.highScore = 7;
    assert(store.save(record));
    assert(store.load()->highScore == 7);

    fs::remove_all(dir);
    return 0;
}
