#include "persistence/snapshot_file.hpp"
#include "persistence/crc32.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace sdb::persistence {

// ── Fixture ──────────────────────────────────────────────────────────────────

class SnapshotFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("sdb_snapshot_test_" + std::string(info->name()));
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
        snap_path_ = test_dir_ / "default" / SnapshotFile::kFilename;
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    std::vector<uint8_t> read_bytes() const {
        std::ifstream ifs(snap_path_, std::ios::binary);
        return {std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
    }

    void write_bytes(const std::vector<uint8_t>& bytes) const {
        std::ofstream ofs(snap_path_, std::ios::binary | std::ios::trunc);
        ofs.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
    }

    static Snapshot sample() {
        Snapshot s;
        s.schemas["User"]  = "name:string age:int";
        s.schemas["Empty"] = "";
        s.records["User"]["Alice"] = R"({"age":30,"name":"Alice"})";
        s.records["User"]["Bob"]   = R"({"age":25,"name":"Bob"})";
        s.records["Empty"];
        return s;
    }

    SnapshotFile file_;
    std::filesystem::path test_dir_;
    std::filesystem::path snap_path_;
};

// ── Save / Load basics ──────────────────────────────────────────────────────

TEST_F(SnapshotFileTest, LoadMissingFileYieldsEmptySnapshot) {
    Snapshot loaded;
    loaded.schemas["stale"] = "x";
    auto ec = file_.load(snap_path_, loaded);
    ASSERT_FALSE(ec) << ec.message();
    EXPECT_TRUE(loaded.empty());
}

TEST_F(SnapshotFileTest, SaveAndLoadEmpty) {
    auto ec = file_.save(snap_path_, Snapshot{});
    ASSERT_FALSE(ec) << ec.message();
    EXPECT_TRUE(std::filesystem::exists(snap_path_));

    Snapshot loaded;
    ec = file_.load(snap_path_, loaded);
    ASSERT_FALSE(ec) << ec.message();
    EXPECT_EQ(loaded, Snapshot{});
}

TEST_F(SnapshotFileTest, SaveCreatesDatabaseDirectory) {
    ASSERT_FALSE(std::filesystem::exists(snap_path_.parent_path()));
    ASSERT_FALSE(file_.save(snap_path_, sample()));
    EXPECT_TRUE(std::filesystem::is_directory(snap_path_.parent_path()));
}

TEST_F(SnapshotFileTest, RoundTripPreservesSchemasAndRecords) {
    const auto original = sample();
    ASSERT_FALSE(file_.save(snap_path_, original));

    Snapshot loaded;
    auto ec = file_.load(snap_path_, loaded);
    ASSERT_FALSE(ec) << ec.message();
    EXPECT_EQ(loaded, original);
    EXPECT_TRUE(loaded.records.at("Empty").empty());
}

TEST_F(SnapshotFileTest, RoundTripKeepsSnapshotShapeExactly) {
    Snapshot s;
    s.records["Orphan"];                   // empty record map, no definition
    s.schemas["User"] = "name:string";     // definition, no record map
    ASSERT_FALSE(file_.save(snap_path_, s));

    Snapshot loaded;
    auto ec = file_.load(snap_path_, loaded);
    ASSERT_FALSE(ec) << ec.message();
    EXPECT_EQ(loaded, s);
    EXPECT_TRUE(loaded.records.contains("Orphan"));
    EXPECT_FALSE(loaded.records.contains("User"));
}

TEST_F(SnapshotFileTest, RecordsNamedLikeSchemasDoNotCollide) {
    Snapshot s;
    s.schemas["User"] = "name:string";
    s.records["User"]["User"] = R"({"name":"User"})";
    ASSERT_FALSE(file_.save(snap_path_, s));

    Snapshot loaded;
    ASSERT_FALSE(file_.load(snap_path_, loaded));
    EXPECT_EQ(loaded, s);
}

TEST_F(SnapshotFileTest, SaveOverwritesPreviousSnapshot) {
    ASSERT_FALSE(file_.save(snap_path_, sample()));

    Snapshot smaller;
    smaller.schemas["Only"] = "a:int";
    smaller.records["Only"]["1"] = R"({"a":1})";
    ASSERT_FALSE(file_.save(snap_path_, smaller));

    Snapshot loaded;
    ASSERT_FALSE(file_.load(snap_path_, loaded));
    EXPECT_EQ(loaded, smaller);
    EXPECT_FALSE(std::filesystem::exists(snap_path_.string() + ".tmp"));
}

TEST_F(SnapshotFileTest, OutputIsDeterministic) {
    ASSERT_FALSE(file_.save(snap_path_, sample()));
    auto first = read_bytes();
    ASSERT_FALSE(file_.save(snap_path_, sample()));
    EXPECT_EQ(read_bytes(), first);
}

TEST_F(SnapshotFileTest, HeaderLayout) {
    ASSERT_FALSE(file_.save(snap_path_, Snapshot{}));
    auto bytes = read_bytes();
    ASSERT_EQ(bytes.size(), kSnapshotHeaderSize + 4);  // empty payload
    EXPECT_EQ(std::string(bytes.begin(), bytes.begin() + 4), "SDBS");
    EXPECT_EQ(bytes[4], kSnapshotVersion);
    EXPECT_EQ(bytes[5], 0);

    const uint32_t stored = static_cast<uint32_t>(bytes[10]) |
                            (static_cast<uint32_t>(bytes[11]) << 8) |
                            (static_cast<uint32_t>(bytes[12]) << 16) |
                            (static_cast<uint32_t>(bytes[13]) << 24);
    EXPECT_EQ(stored, crc32(bytes.data(), kSnapshotHeaderSize));
}

// ── Corruption ───────────────────────────────────────────────────────────────

TEST_F(SnapshotFileTest, FlippedPayloadByteFailsChecksum) {
    ASSERT_FALSE(file_.save(snap_path_, sample()));
    auto bytes = read_bytes();
    bytes[kSnapshotHeaderSize + 3] ^= 0xFF;
    write_bytes(bytes);

    Snapshot loaded;
    EXPECT_EQ(file_.load(snap_path_, loaded), std::make_error_code(std::errc::invalid_argument));
}

TEST_F(SnapshotFileTest, BadMagicIsRejected) {
    ASSERT_FALSE(file_.save(snap_path_, sample()));
    auto bytes = read_bytes();
    bytes[0] = 'X';
    write_bytes(bytes);

    Snapshot loaded;
    EXPECT_TRUE(file_.load(snap_path_, loaded));
}

TEST_F(SnapshotFileTest, TruncatedFileIsRejected) {
    ASSERT_FALSE(file_.save(snap_path_, sample()));
    auto bytes = read_bytes();
    bytes.resize(bytes.size() - 5);
    write_bytes(bytes);

    Snapshot loaded;
    EXPECT_TRUE(file_.load(snap_path_, loaded));
}

TEST_F(SnapshotFileTest, TinyFileIsRejected) {
    std::filesystem::create_directories(snap_path_.parent_path());
    write_bytes({'S', 'D'});

    Snapshot loaded;
    EXPECT_TRUE(file_.load(snap_path_, loaded));
}

TEST_F(SnapshotFileTest, SaveIntoUnwritableLocationFails) {
    // A regular file where the database directory should be.
    std::ofstream(test_dir_ / "blocker") << "x";
    auto ec = file_.save(test_dir_ / "blocker" / SnapshotFile::kFilename, sample());
    EXPECT_TRUE(ec);
}

// ── CRC32 ────────────────────────────────────────────────────────────────────

TEST(Crc32, KnownVector) {
    const std::string input = "123456789";
    EXPECT_EQ(crc32(reinterpret_cast<const uint8_t*>(input.data()), input.size()),
              0xCBF43926u);
}

} // namespace sdb::persistence
