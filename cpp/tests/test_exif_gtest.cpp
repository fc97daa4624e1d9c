// ==============================================================================
// test_exif_gtest.cpp - Тесты разбора EXIF (GoogleTest)
// ==============================================================================

#include "evidex/exif.hpp"

#include "test_fixtures.hpp"

#include <gtest/gtest.h>
#include <string>

namespace evidex::io::test {

using evidex::test::ExifBuilder;

class ExifTest : public evidex::test::TempDirTest {
protected:
    const char* prefix() const override { return "evidex_exif_test_"; }

    static ExifMetadata parse(const std::string& bytes) {
        return parse_exif(reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size());
    }

    /// Canon, съёмка 2021-07-04, 55°45'N 37°36'3.6"W, 156.5 м
    static ExifBuilder camera_sample(bool big_endian) {
        ExifBuilder exif(big_endian);
        exif.ascii(ExifBuilder::Ifd0, 0x010F, "Canon")
            .ascii(ExifBuilder::Ifd0, 0x0110, "Canon EOS 80D ")
            .ascii(ExifBuilder::Ifd0, 0x0132, "2022:01:01 00:00:00")
            .ascii(ExifBuilder::ExifIfd, 0x9003, "2021:07:04 15:20:11")
            .ascii(ExifBuilder::GpsIfd, 1, "N")
            .rationals(ExifBuilder::GpsIfd, 2, {{55, 1}, {45, 1}, {0, 1}})
            .ascii(ExifBuilder::GpsIfd, 3, "W")
            .rationals(ExifBuilder::GpsIfd, 4, {{37, 1}, {36, 1}, {36, 10}})
            .byte(ExifBuilder::GpsIfd, 5, 0)
            .rationals(ExifBuilder::GpsIfd, 6, {{1565, 10}});
        return exif;
    }
};

// ==============================================================================
// TST-EXIF-001: JPEG и TIFF
// ==============================================================================

TEST_F(ExifTest, Jpeg_LittleEndian_CameraDateAndGps) {
    // Arrange
    std::string jpeg = camera_sample(false).jpeg();

    // Act
    ExifMetadata meta = parse(jpeg);

    // Assert: DateTimeOriginal важнее DateTime, хвостовые пробелы убраны
    EXPECT_EQ(meta.camera_make.value_or(""), "Canon");
    EXPECT_EQ(meta.camera_model.value_or(""), "Canon EOS 80D");
    EXPECT_EQ(meta.date_taken.value_or(""), "2021-07-04 15:20:11");
    ASSERT_TRUE(meta.gps_latitude.has_value());
    ASSERT_TRUE(meta.gps_longitude.has_value());
    ASSERT_TRUE(meta.gps_altitude.has_value());
    EXPECT_NEAR(*meta.gps_latitude, 55.75, 1e-9);
    EXPECT_NEAR(*meta.gps_longitude, -37.601, 1e-9);
    EXPECT_NEAR(*meta.gps_altitude, 156.5, 1e-9);
}

TEST_F(ExifTest, Tiff_BigEndian_SameValues) {
    ExifMetadata meta = parse(camera_sample(true).tiff());

    EXPECT_EQ(meta.camera_make.value_or(""), "Canon");
    EXPECT_EQ(meta.date_taken.value_or(""), "2021-07-04 15:20:11");
    ASSERT_TRUE(meta.gps_longitude.has_value());
    EXPECT_NEAR(*meta.gps_longitude, -37.601, 1e-9);
}

TEST_F(ExifTest, DateTimeFallbackAndBelowSeaLevel) {
    // Arrange: нет Exif IFD, высота ниже уровня моря
    std::string jpeg = ExifBuilder(true)
                           .ascii(ExifBuilder::Ifd0, 0x0132, "2020:01:02 03:04:05")
                           .byte(ExifBuilder::GpsIfd, 5, 1)
                           .rationals(ExifBuilder::GpsIfd, 6, {{28, 1}})
                           .jpeg();

    // Act
    ExifMetadata meta = parse(jpeg);

    // Assert
    EXPECT_EQ(meta.date_taken.value_or(""), "2020-01-02 03:04:05");
    ASSERT_TRUE(meta.gps_altitude.has_value());
    EXPECT_DOUBLE_EQ(*meta.gps_altitude, -28.0);
    EXPECT_FALSE(meta.gps_latitude.has_value());
    EXPECT_FALSE(meta.camera_make.has_value());
}

TEST_F(ExifTest, ZeroDateAndCoordinateWithoutRef_Ignored) {
    std::string tiff = ExifBuilder()
                           .ascii(ExifBuilder::Ifd0, 0x0132, "0000:00:00 00:00:00")
                           .rationals(ExifBuilder::GpsIfd, 2, {{10, 1}, {0, 1}, {0, 1}})
                           .tiff();

    ExifMetadata meta = parse(tiff);

    EXPECT_TRUE(meta.empty());
}

// ==============================================================================
// TST-EXIF-002: отсутствующие и повреждённые метаданные
// ==============================================================================

TEST_F(ExifTest, JpegWithoutExif_IsEmpty) {
    std::string jpeg("\xFF\xD8", 2);
    jpeg += std::string("\xFF\xE0\x00\x04\x00\x00", 6);
    jpeg += std::string("\xFF\xDA\x00\x02", 4);

    EXPECT_TRUE(parse(jpeg).empty());
}

TEST_F(ExifTest, Truncated_NeverReadsPastBuffer) {
    std::string jpeg = camera_sample(false).jpeg();

    // Каждый префикс разбирается без выхода за границы
    for (std::size_t n = 0; n < jpeg.size(); n += 7) {
        EXPECT_NO_THROW(parse(jpeg.substr(0, n)));
    }
    // Обрезаны последние данные GPS (высота и конец долготы): эти поля
    // пропадают, камера и широта остаются
    ExifMetadata partial = parse(jpeg.substr(0, jpeg.size() - 80));
    EXPECT_EQ(partial.camera_make.value_or(""), "Canon");
    EXPECT_TRUE(partial.gps_latitude.has_value());
    EXPECT_FALSE(partial.gps_longitude.has_value());
    EXPECT_FALSE(partial.gps_altitude.has_value());
}

TEST_F(ExifTest, NotAnImage_IsEmpty) {
    EXPECT_TRUE(parse("%PDF-1.4 not an image").empty());
    EXPECT_TRUE(parse_exif(nullptr, 0).empty());
}

// ==============================================================================
// TST-EXIF-003: чтение из файла
// ==============================================================================

TEST_F(ExifTest, ReadExif_FromFile) {
    auto path = write_file("DCIM/IMG_0001.jpg", camera_sample(false).jpeg());

    ExifMetadata meta = read_exif(path);

    EXPECT_EQ(meta.camera_model.value_or(""), "Canon EOS 80D");
    EXPECT_TRUE(meta.gps_latitude.has_value());
}

TEST_F(ExifTest, ReadExif_MissingFile_IsEmpty) {
    EXPECT_TRUE(read_exif(test_dir_ / "missing.jpg").empty());
}

}  // namespace evidex::io::test
