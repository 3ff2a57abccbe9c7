#pragma once

#include <optional>
#include <string>

#include "persistence/IBestScoreStore.hpp"

namespace game2048::persistence {

/// Keeps the best score in a one-line text file: "BEST;<value>".
/// Writes go to "<path>.tmp" first and are renamed over the record.
class FileBestScoreStore final : public IBestScoreStore {
public:
    explicit FileBestScoreStore(std::string path);

    core::Score loadBest() override;
    bool saveBest(core::Score value) override;

private:
    std::string path_;
};

/// Format a record line (without trailing '\n').
std::string formatBestRecord(core::Score value);

/// Parse a record line. Returns std::nullopt if malformed.
std::optional<core::Score> parseBestRecord(const std::string& line);

} // namespace game2048::persistence
