// ==============================================================================
// evidex/exif.hpp - Метаданные EXIF изображений
// ==============================================================================
//
// Назначение:
// - Поиск блока EXIF: сегмент APP1 "Exif\0\0" в JPEG или TIFF целиком
// - Разбор IFD0 / Exif IFD / GPS IFD (порядок байт II и MM)
// - Дата съёмки, производитель и модель камеры, координаты
//
// Повреждённые или отсутствующие метаданные дают пустой результат: EXIF
// дополняет запись о файле и не должен срывать её приём.
//
// ==============================================================================

#ifndef EVIDEX_EXIF_HPP
#define EVIDEX_EXIF_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace evidex::io {

struct ExifMetadata {
    std::optional<std::string> date_taken;  // "YYYY-MM-DD HH:MM:SS", время камеры
    std::optional<std::string> camera_make;
    std::optional<std::string> camera_model;
    std::optional<double> gps_latitude;     // градусы, юг < 0
    std::optional<double> gps_longitude;    // градусы, запад < 0
    std::optional<double> gps_altitude;     // метры, ниже уровня моря < 0

    bool empty() const {
        return !date_taken && !camera_make && !camera_model && !gps_latitude && !gps_longitude &&
               !gps_altitude;
    }
};

/// Разобрать JPEG или TIFF в памяти
ExifMetadata parse_exif(const unsigned char* data, std::size_t size);

/// Прочитать начало файла и разобрать EXIF; пустой результат, если файл
/// не читается
ExifMetadata read_exif(const std::filesystem::path& path);

}  // namespace evidex::io

#endif  // EVIDEX_EXIF_HPP
