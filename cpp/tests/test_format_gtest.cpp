// ==============================================================================
// test_format_gtest.cpp - Тесты определения формата контейнера (GoogleTest)
// ==============================================================================

#include "evidex/archive.hpp"
#include "evidex/errors.hpp"
#include "evidex/format.hpp"

#include "test_fixtures.hpp"

#include <gtest/gtest.h>
#include <string>

namespace evidex::io::test {

class FormatTest : public evidex::test::TempDirTest {
protected:
    const char* prefix() const override { return "evidex_format_test_"; }
};

// ==============================================================================
// TST-FMT-001: по расширению
// ==============================================================================

TEST_F(FormatTest, Extension_Ufdr) {
    evidex::test::ZipBuilder().add("files/a.jpg", "x").write(test_dir_ / "phone.ufdr");
    EXPECT_EQ(detect_format(test_dir_ / "phone.ufdr"), ContainerFormat::CellebriteUfdr);
}

TEST_F(FormatTest, Extension_RawImageAndMfdb) {
    write_file("disk.dd", std::string(1024, '\0'));
    write_file("case.mfdb", "AXIOM");

    EXPECT_EQ(detect_format(test_dir_ / "disk.dd"), ContainerFormat::RawImage);
    EXPECT_EQ(detect_format(test_dir_ / "case.mfdb"), ContainerFormat::AxiomMfdb);
    EXPECT_FALSE(is_indexable(ContainerFormat::RawImage));
    EXPECT_FALSE(is_indexable(ContainerFormat::AxiomMfdb));
}

TEST_F(FormatTest, Extension_TarGz) {
    evidex::test::TarBuilder().add("a.txt", "hello").write_gz(test_dir_ / "backup.tar.gz");
    EXPECT_EQ(detect_format(test_dir_ / "backup.tar.gz"), ContainerFormat::TarArchive);
}

// ==============================================================================
// TST-FMT-002: уточнение ZIP по листингу
// ==============================================================================

TEST_F(FormatTest, Zip_WithReportXml_IsCellebrite) {
    evidex::test::ZipBuilder()
        .add("Report/Extraction_Report.xml", "<report/>")
        .add("files/Image/a.jpg", "jpg")
        .write(test_dir_ / "export.zip");

    EXPECT_EQ(detect_format(test_dir_ / "export.zip"), ContainerFormat::CellebriteZip);
}

TEST_F(FormatTest, Zip_WithManifest_IsGeneric) {
    evidex::test::ZipBuilder()
        .add("manifest.json", "{}")
        .add("data/a.db", "db")
        .write(test_dir_ / "export.zip");

    EXPECT_EQ(detect_format(test_dir_ / "export.zip"), ContainerFormat::GenericZip);
}

TEST_F(FormatTest, Zip_Plain_IsZipArchive) {
    evidex::test::ZipBuilder().add("notes.txt", "n").write(test_dir_ / "plain.zip");
    EXPECT_EQ(detect_format(test_dir_ / "plain.zip"), ContainerFormat::ZipArchive);
}

TEST_F(FormatTest, Zip_CorruptDirectory_FallsBackToZipArchive) {
    write_file("broken.zip", "PK\x03\x04 this is not really a zip");
    EXPECT_EQ(detect_format(test_dir_ / "broken.zip"), ContainerFormat::ZipArchive);
}

TEST(FormatListingTest, ClassifyListing_CaseInsensitive) {
    EXPECT_EQ(classify_zip_listing({"UFED_REPORT.XML"}), ContainerFormat::CellebriteZip);
    EXPECT_EQ(classify_zip_listing({"Metadata.JSON"}), ContainerFormat::GenericZip);
    EXPECT_EQ(classify_zip_listing({}), ContainerFormat::ZipArchive);
}

// ==============================================================================
// TST-FMT-003: по сигнатуре без расширения
// ==============================================================================

TEST_F(FormatTest, Signature_ZipWithoutExtension) {
    evidex::test::ZipBuilder().add("manifest.json", "{}").write(test_dir_ / "extraction");
    EXPECT_EQ(detect_format(test_dir_ / "extraction"), ContainerFormat::GenericZip);
}

TEST_F(FormatTest, Signature_TarWithoutExtension) {
    evidex::test::TarBuilder().add("a.txt", "hello").write(test_dir_ / "dump");
    EXPECT_EQ(detect_format(test_dir_ / "dump"), ContainerFormat::TarArchive);
}

TEST_F(FormatTest, Signature_AndroidBackup) {
    write_file("device_backup", "ANDROID BACKUP\n5\n1\nnone\n");
    EXPECT_EQ(detect_format(test_dir_ / "device_backup"), ContainerFormat::AndroidBackup);
}

// ==============================================================================
// TST-FMT-004: неизвестные и отсутствующие файлы
// ==============================================================================

TEST_F(FormatTest, Unknown_NeverThrows) {
    write_file("notes.docx.bak", "plain text");

    EXPECT_EQ(detect_format(test_dir_ / "notes.docx.bak"), ContainerFormat::Unknown);
    EXPECT_EQ(detect_format(test_dir_ / "missing.zip"), ContainerFormat::Unknown);
    EXPECT_EQ(detect_format(test_dir_), ContainerFormat::Unknown);
}

TEST_F(FormatTest, OpenArchive_UnsupportedFormatThrows) {
    write_file("disk.img", std::string(512, '\0'));

    try {
        open_archive(test_dir_ / "disk.img");
        FAIL() << "expected UnsupportedFormat";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnsupportedFormat);
        EXPECT_NE(std::string(e.what()).find("raw_image"), std::string::npos);
    }
}

TEST(FormatNameTest, Names_RoundTrip) {
    for (ContainerFormat f : {ContainerFormat::CellebriteZip, ContainerFormat::TarArchive,
                              ContainerFormat::AndroidBackup, ContainerFormat::Unknown}) {
        EXPECT_EQ(format_from_string(format_to_string(f)), f);
    }
    EXPECT_STREQ(display_name(ContainerFormat::CellebriteUfdr), "Cellebrite UFDR");
    EXPECT_FALSE(format_from_string("rar").has_value());
}

// ==============================================================================
// TST-FMT-005: безопасные пути распаковки
// ==============================================================================

TEST(SafePathTest, RejectsTraversalAndAbsolute) {
    EXPECT_TRUE(is_safe_entry_path("DCIM/Camera/a.jpg"));
    EXPECT_TRUE(is_safe_entry_path("a..b/c"));
    EXPECT_FALSE(is_safe_entry_path("../etc/passwd"));
    EXPECT_FALSE(is_safe_entry_path("a/../../b"));
    EXPECT_FALSE(is_safe_entry_path("/etc/passwd"));
    EXPECT_FALSE(is_safe_entry_path("C:\\Windows\\x"));
    EXPECT_FALSE(is_safe_entry_path(""));
}

TEST(SafePathTest, SafeJoin_ThrowsCorruptEntry) {
    try {
        safe_join("/tmp/out", "../escape.txt");
        FAIL() << "expected CorruptEntry";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CorruptEntry);
    }
}

}  // namespace evidex::io::test
