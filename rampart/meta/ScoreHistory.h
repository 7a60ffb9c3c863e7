// Persisted results of finished sessions behind a narrow load/record interface.
#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace Rampart {

struct ScoreEntry {
    std::int64_t score{0};
    int wave{0};
    bool won{false};
    double seconds{0.0};
};

class ScoreHistory {
public:
    virtual ~ScoreHistory() = default;

    // Entries in the order they were recorded. Empty when nothing is stored.
    virtual std::vector<ScoreEntry> load() = 0;
    // Returns false when the entry could not be stored.
    virtual bool record(const ScoreEntry& entry) = 0;
};

// Highest score, or 0 for an empty history.
std::int64_t bestScore(const std::vector<ScoreEntry>& entries);

class InMemoryScoreHistory final : public ScoreHistory {
public:
    std::vector<ScoreEntry> load() override { return entries_; }
    bool record(const ScoreEntry& entry) override;

private:
    std::vector<ScoreEntry> entries_;
};

// JSON document {"version":1,"scores":[{score,wave,won,seconds},...]}.
class JsonFileScoreHistory final : public ScoreHistory {
public:
    explicit JsonFileScoreHistory(std::string path);

    std::vector<ScoreEntry> load() override;
    bool record(const ScoreEntry& entry) override;

    const std::string& path() const { return path_; }

private:
    bool save(const std::vector<ScoreEntry>& entries) const;

    std::string path_;
};

}  // namespace Rampart
