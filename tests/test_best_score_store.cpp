// tests/test_best_score_store.cpp

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <string>

#include "persistence/FileBestScoreStore.hpp"

using namespace game2048::persistence;
namespace fs = std::filesystem;

namespace {

// Fresh path under the temp directory, removed again on scope exit.
class TempPath {
public:
    explicit TempPath(const std::string& name)
        : path_{(fs::temp_directory_path() / ("game2048_" + name)).string()}
    {
        cleanup();
    }
    ~TempPath() { cleanup(); }

    const std::string& str() const { return path_; }

private:
    std::string path_;

    void cleanup() {
        std::error_code ec;
        fs::remove(path_, ec);
        fs::remove(path_ + ".tmp", ec);
    }
};

void writeFile(const std::string& path, const std::string& contents)
{
    std::ofstream out(path, std::ios::trunc);
    out << contents;
}

} // namespace

TEST_CASE("BestScore record: format and parse", "[persistence]")
{
    CHECK(formatBestRecord(0) == "BEST;0");
    CHECK(formatBestRecord(20480) == "BEST;20480");

    const auto parsed = parseBestRecord("BEST;20480");
    REQUIRE(parsed.has_value());
    CHECK(*parsed == 20480);

    const auto withCr = parseBestRecord("BEST;77\r");
    REQUIRE(withCr.has_value());
    CHECK(*withCr == 77);
}

TEST_CASE("BestScore record: malformed lines are rejected", "[persistence]")
{
    CHECK_FALSE(parseBestRecord("").has_value());
    CHECK_FALSE(parseBestRecord("BEST").has_value());
    CHECK_FALSE(parseBestRecord("BEST;").has_value());
    CHECK_FALSE(parseBestRecord("SCORE;10").has_value());
    CHECK_FALSE(parseBestRecord("BEST;-5").has_value());
    CHECK_FALSE(parseBestRecord("BEST;12abc").has_value());
    CHECK_FALSE(parseBestRecord("BEST;99999999999999999999999").has_value());
}

TEST_CASE("FileBestScoreStore: missing file reads as zero", "[persistence]")
{
    TempPath path{"missing.dat"};
    FileBestScoreStore store{path.str()};

    CHECK(store.loadBest() == 0);
    CHECK_FALSE(fs::exists(path.str()));
}

TEST_CASE("FileBestScoreStore: corrupt file reads as zero", "[persistence]")
{
    TempPath path{"corrupt.dat"};
    FileBestScoreStore store{path.str()};

    SECTION("garbage") {
        writeFile(path.str(), "not a score\n");
        CHECK(store.loadBest() == 0);
    }

    SECTION("empty") {
        writeFile(path.str(), "");
        CHECK(store.loadBest() == 0);
    }

    // The next save replaces the bad record
    REQUIRE(store.saveBest(64));
    CHECK(store.loadBest() == 64);
}

TEST_CASE("FileBestScoreStore: save then load", "[persistence]")
{
    TempPath path{"roundtrip.dat"};

    {
        FileBestScoreStore writer{path.str()};
        REQUIRE(writer.saveBest(3932));
        REQUIRE(writer.saveBest(4100));
    }

    // A new instance sees the last value written
    FileBestScoreStore reader{path.str()};
    CHECK(reader.loadBest() == 4100);
    CHECK_FALSE(fs::exists(path.str() + ".tmp"));

    std::ifstream in(path.str());
    std::string line;
    REQUIRE(std::getline(in, line));
    CHECK(line == "BEST;4100");
}

TEST_CASE("FileBestScoreStore: unwritable location reports failure", "[persistence]")
{
    const auto dir = fs::temp_directory_path() / "game2048_no_such_dir";
    std::error_code ec;
    fs::remove_all(dir, ec);

    FileBestScoreStore store{(dir / "best_score.dat").string()};
    CHECK_FALSE(store.saveBest(10));
    CHECK(store.loadBest() == 0);
}
