#include "persistence/FileBestScoreStore.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>
#include <utility>

namespace game2048::persistence {

namespace {
    constexpr const char* kRecordTag = "BEST";

    bool isDigits(const std::string& s) {
        if (s.empty()) return false;
        for (char c : s) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        }
        return true;
    }
}

std::string formatBestRecord(core::Score value)
{
    std::ostringstream os;
    os << kRecordTag << ';' << value;
    return os.str();
}

std::optional<core::Score> parseBestRecord(const std::string& line)
{
    std::istringstream is(line);
    std::string tag, valueStr;
    if (!std::getline(is, tag, ';')) return std::nullopt;
    if (tag != kRecordTag) return std::nullopt;
    std::getline(is, valueStr);

    // tolerate a trailing '\r' from files edited on Windows
    if (!valueStr.empty() && valueStr.back() == '\r') {
        valueStr.pop_back();
    }
    if (!isDigits(valueStr) || valueStr.size() > 19) {
        return std::nullopt;
    }
    return static_cast<core::Score>(std::stoull(valueStr));
}

FileBestScoreStore::FileBestScoreStore(std::string path)
    : path_{std::move(path)}
{
}

core::Score FileBestScoreStore::loadBest()
{
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return 0;
    }

    std::ifstream in(path_);
    if (!in) {
        std::cerr << "[store] cannot open " << path_ << " for reading\n";
        return 0;
    }

    std::string line;
    if (!std::getline(in, line)) {
        std::cerr << "[store] " << path_ << " is empty\n";
        return 0;
    }

    const auto value = parseBestRecord(line);
    if (!value) {
        std::cerr << "[store] ignoring malformed record in " << path_ << '\n';
        return 0;
    }
    return *value;
}

bool FileBestScoreStore::saveBest(core::Score value)
{
    const std::string tmpPath = path_ + ".tmp";

    {
        std::ofstream out(tmpPath, std::ios::trunc);
        if (!out) {
            std::cerr << "[store] cannot open " << tmpPath << " for writing\n";
            return false;
        }
        out << formatBestRecord(value) << '\n';
        out.flush();
        if (!out) {
            std::cerr << "[store] write to " << tmpPath << " failed\n";
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmpPath, path_, ec);
    if (ec) {
        std::cerr << "[store] cannot replace " << path_ << ": " << ec.message() << '\n';
        std::filesystem::remove(tmpPath, ec);
        return false;
    }
    return true;
}

} // namespace game2048::persistence
