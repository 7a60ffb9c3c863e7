#include "ScoreHistory.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "../../engine/core/Logger.h"

namespace Rampart {

namespace {
constexpr int kHistoryVersion = 1;
}  // namespace

std::int64_t bestScore(const std::vector<ScoreEntry>& entries) {
    std::int64_t best = 0;
    for (const auto& e : entries) best = std::max(best, e.score);
    return best;
}

bool InMemoryScoreHistory::record(const ScoreEntry& entry) {
    entries_.push_back(entry);
    return true;
}

JsonFileScoreHistory::JsonFileScoreHistory(std::string path) : path_(std::move(path)) {}

std::vector<ScoreEntry> JsonFileScoreHistory::load() {
    std::vector<ScoreEntry> out;
    std::ifstream f(path_);
    if (!f) return out;
    try {
        auto j = nlohmann::json::parse(f);
        if (!j.contains("scores") || !j["scores"].is_array()) return out;
        for (const auto& s : j["scores"]) {
            if (!s.is_object()) continue;
            ScoreEntry e{};
            e.score = s.value("score", static_cast<std::int64_t>(0));
            e.wave = s.value("wave", 0);
            e.won = s.value("won", false);
            e.seconds = s.value("seconds", 0.0);
            out.push_back(e);
        }
    } catch (const nlohmann::json::exception& ex) {
        Engine::logWarn(std::string("Score history unreadable (") + path_ + "): " + ex.what());
        out.clear();
    }
    return out;
}

bool JsonFileScoreHistory::record(const ScoreEntry& entry) {
    std::vector<ScoreEntry> entries = load();
    entries.push_back(entry);
    return save(entries);
}

bool JsonFileScoreHistory::save(const std::vector<ScoreEntry>& entries) const {
    nlohmann::json j;
    j["version"] = kHistoryVersion;
    nlohmann::json scores = nlohmann::json::array();
    for (const auto& e : entries) {
        nlohmann::json s;
        s["score"] = e.score;
        s["wave"] = e.wave;
        s["won"] = e.won;
        s["seconds"] = e.seconds;
        scores.push_back(s);
    }
    j["scores"] = scores;

    const std::filesystem::path parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            Engine::logError("Cannot create score history directory " + parent.string() + ": " + ec.message());
            return false;
        }
    }
    std::ofstream f(path_, std::ios::trunc);
    if (!f) {
        Engine::logError("Cannot write score history: " + path_);
        return false;
    }
    f << j.dump(2);
    return f.good();
}

}  // namespace Rampart
