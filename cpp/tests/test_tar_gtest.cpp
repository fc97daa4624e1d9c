// ==============================================================================
// test_tar_gtest.cpp - Тесты индексатора TAR и Android Backup (GoogleTest)
// ==============================================================================

#include "evidex/archive.hpp"
#include "evidex/errors.hpp"
#include "evidex/tar.hpp"

#include "test_fixtures.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace evidex::io::test {

class TarTest : public evidex::test::TempDirTest {
protected:
    const char* prefix() const override { return "evidex_tar_test_"; }

    static evidex::test::TarBuilder sample() {
        evidex::test::TarBuilder tar;
        tar.add_directory("DCIM")
            .add("DCIM/IMG_0001.jpg", std::string(3000, 'J'))
            .add("./Documents/invoice.pdf", "%PDF-1.4")
            .add("sms/mmssms.db", "SQLite format 3");
        return tar;
    }
};

// ==============================================================================
// TST-TAR-001: индексация plain TAR
// ==============================================================================

TEST_F(TarTest, Index_PlainTar) {
    // Arrange
    std::filesystem::path archive = test_dir_ / "dump.tar";
    sample().write(archive);
    TarIndexer tar(archive);
    std::vector<std::size_t> totals;

    // Act
    IndexResult result = tar.index([&](std::size_t, std::size_t total, const std::string&) {
        totals.push_back(total);
    });

    // Assert
    EXPECT_EQ(result.total_entries, 4u);
    EXPECT_EQ(result.directories_skipped, 1u);
    EXPECT_EQ(result.errors, 0u);
    ASSERT_EQ(result.descriptors.size(), 3u);
    EXPECT_EQ(result.descriptors[0].path, "DCIM/IMG_0001.jpg");
    EXPECT_EQ(result.descriptors[0].size, 3000u);
    EXPECT_EQ(result.descriptors[0].modified, "2023-05-17 12:30:00");
    EXPECT_EQ(result.descriptors[1].path, "Documents/invoice.pdf");
    EXPECT_EQ(result.descriptors[1].category, taxonomy::Category::Document);
    EXPECT_EQ(result.descriptors[2].category, taxonomy::Category::Messages);

    // Размер потока неизвестен заранее
    EXPECT_EQ(totals, (std::vector<std::size_t>{0, 0, 0}));
}

TEST_F(TarTest, Index_PlainTar_SkipsDataBySeek) {
    std::filesystem::path archive = test_dir_ / "big.tar";
    evidex::test::TarBuilder()
        .add("a.mp4", std::string(2 * 1024 * 1024, 'A'))
        .add("b.mp4", std::string(2 * 1024 * 1024, 'B'))
        .write(archive);
    TarIndexer tar(archive);

    IndexResult result = tar.index(nullptr);

    EXPECT_EQ(result.descriptors.size(), 2u);
    // Заголовки и блок чтения вокруг них, данные пропущены
    EXPECT_LT(tar.bytes_read(), 128u * 1024);
}

TEST_F(TarTest, Index_Gzip) {
    std::filesystem::path archive = test_dir_ / "dump.tar.gz";
    sample().write_gz(archive);
    TarIndexer tar(archive);

    IndexResult result = tar.index(nullptr);

    EXPECT_EQ(result.descriptors.size(), 3u);
    EXPECT_EQ(result.errors, 0u);
}

TEST_F(TarTest, Index_CorruptHeader_DamagedRegionCountedOnce) {
    // Arrange: повредить контрольную сумму второго заголовка; его блок
    // данных тоже не заголовок, но это та же повреждённая область
    std::string bytes = evidex::test::TarBuilder().add("a.txt", "a").add("b.txt", "b").bytes();
    bytes[1024 + 148] = '9';
    auto path = write_file("broken.tar", bytes);
    TarIndexer tar(path);

    // Act
    IndexResult result = tar.index(nullptr);

    // Assert
    EXPECT_EQ(result.descriptors.size(), 1u);
    EXPECT_EQ(result.errors, 1u);
}

TEST_F(TarTest, Index_LegacyDirectoryWithTrailingSlash) {
    // Arrange: старый TAR без типа '5', каталог узнаётся по '/'
    std::filesystem::path archive = test_dir_ / "legacy.tar";
    evidex::test::TarBuilder()
        .add("legacy/", "", '0')
        .add("legacy/notes.txt", "n")
        .write(archive);
    TarIndexer tar(archive);

    // Act
    IndexResult result = tar.index(nullptr);

    // Assert
    EXPECT_EQ(result.total_entries, 2u);
    EXPECT_EQ(result.directories_skipped, 1u);
    ASSERT_EQ(result.descriptors.size(), 1u);
    EXPECT_EQ(result.descriptors[0].path, "legacy/notes.txt");
}

TEST_F(TarTest, Index_NotATar_ThrowsUnsupportedFormat) {
    auto path = write_file("fake.tar", std::string(2048, 'x'));
    TarIndexer tar(path);

    try {
        tar.index(nullptr);
        FAIL() << "expected UnsupportedFormat";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnsupportedFormat);
    }
}

TEST_F(TarTest, GnuLongName) {
    std::string long_path = std::string(120, 'd') + "/photo.jpg";
    std::filesystem::path archive = test_dir_ / "long.tar";
    evidex::test::TarBuilder()
        .add("././@LongLink", long_path + '\0', 'L')
        .add("truncated", "JPEG")
        .write(archive);
    TarIndexer tar(archive);

    IndexResult result = tar.index(nullptr);

    ASSERT_EQ(result.descriptors.size(), 1u);
    EXPECT_EQ(result.descriptors[0].path, long_path);
    EXPECT_EQ(result.descriptors[0].name, "photo.jpg");
}

TEST_F(TarTest, PaxPathOverridesHeader) {
    std::string record = "path=Pictures/holiday.jpg\n";
    // "<len> <key>=<value>\n", длина включает собственные цифры
    std::string pax = std::to_string(record.size() + 3) + " " + record;
    std::filesystem::path archive = test_dir_ / "pax.tar";
    evidex::test::TarBuilder().add("PaxHeader/x", pax, 'x').add("x", "JPEG").write(archive);
    TarIndexer tar(archive);

    IndexResult result = tar.index(nullptr);

    ASSERT_EQ(result.descriptors.size(), 1u);
    EXPECT_EQ(result.descriptors[0].path, "Pictures/holiday.jpg");
    EXPECT_EQ(result.descriptors[0].category, taxonomy::Category::Image);
}

// ==============================================================================
// TST-TAR-002: чтение и распаковка
// ==============================================================================

TEST_F(TarTest, StreamEntry_FromGzip) {
    std::filesystem::path archive = test_dir_ / "dump.tgz";
    sample().write_gz(archive);
    TarIndexer tar(archive);

    std::string content;
    tar.stream_entry("Documents/invoice.pdf",
                     [&](const char* data, std::size_t size) { content.append(data, size); });

    EXPECT_EQ(content, "%PDF-1.4");
}

TEST_F(TarTest, StreamEntry_Missing_IsNotFound) {
    std::filesystem::path archive = test_dir_ / "dump.tar";
    sample().write(archive);
    TarIndexer tar(archive);

    try {
        tar.stream_entry("nope.txt", [](const char*, std::size_t) {});
        FAIL() << "expected NotFound";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NotFound);
    }
}

TEST_F(TarTest, ExtractAll_WithFilter) {
    std::filesystem::path archive = test_dir_ / "dump.tar";
    sample().write(archive);
    TarIndexer tar(archive);
    std::filesystem::path out = test_dir_ / "out";

    ExtractResult result = tar.extract_all(
        out, [](const std::string& p) { return p.rfind("DCIM/", 0) == 0 || p.rfind("sms/", 0) == 0; },
        nullptr);

    EXPECT_EQ(result.total, 2u);
    EXPECT_EQ(result.extracted, 2u);
    EXPECT_EQ(result.filtered_out, 1u);
    EXPECT_EQ(result.errors, 0u);
    EXPECT_EQ(std::filesystem::file_size(out / "DCIM" / "IMG_0001.jpg"), 3000u);
    EXPECT_FALSE(std::filesystem::exists(out / "Documents"));
}

// ==============================================================================
// TST-TAR-003: Android Backup
// ==============================================================================

TEST_F(TarTest, AndroidBackup_Compressed) {
    // Arrange
    std::string payload = evidex::test::deflate_bytes(sample().bytes(), 15);
    auto path = write_file("device.ab", "ANDROID BACKUP\n5\n1\nnone\n" + payload);
    AndroidBackupIndexer ab(path);

    // Act
    IndexResult result = ab.index(nullptr);

    // Assert
    EXPECT_EQ(ab.header().version, 5);
    EXPECT_TRUE(ab.header().compressed);
    EXPECT_EQ(result.descriptors.size(), 3u);
}

TEST_F(TarTest, AndroidBackup_Encrypted_IsUnsupported) {
    auto path = write_file("secret.ab", "ANDROID BACKUP\n5\n1\nAES-256\n0123456789");
    AndroidBackupIndexer ab(path);

    try {
        ab.index(nullptr);
        FAIL() << "expected UnsupportedFormat";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnsupportedFormat);
    }
}

TEST_F(TarTest, OpenArchive_AndroidBackupBySignature) {
    std::string payload = sample().bytes();
    auto path = write_file("backup_noext", "ANDROID BACKUP\n4\n0\nnone\n" + payload);

    auto indexer = open_archive(path);

    ASSERT_NE(indexer, nullptr);
    EXPECT_EQ(indexer->format(), ContainerFormat::AndroidBackup);
    EXPECT_EQ(indexer->index(nullptr).descriptors.size(), 3u);
}

}  // namespace evidex::io::test
