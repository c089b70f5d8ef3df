#include "metasplice/exif_tag_names.h"

#include "metasplice/exif_tiff_decode.h"

namespace metasplice {
namespace {

    struct TagNameEntry final {
        uint16_t tag     = 0;
        const char* name = nullptr;
    };

    // Sorted by tag.
    static constexpr TagNameEntry kTiffIfdTags[] = {
        { 0x00FE, "NewSubfileType" },
        { 0x0100, "ImageWidth" },
        { 0x0101, "ImageLength" },
        { 0x0102, "BitsPerSample" },
        { 0x0103, "Compression" },
        { 0x0106, "PhotometricInterpretation" },
        { 0x010D, "DocumentName" },
        { 0x010E, "ImageDescription" },
        { 0x010F, "Make" },
        { 0x0110, "Model" },
        { 0x0111, "StripOffsets" },
        { 0x0112, "Orientation" },
        { 0x0115, "SamplesPerPixel" },
        { 0x0116, "RowsPerStrip" },
        { 0x0117, "StripByteCounts" },
        { 0x011A, "XResolution" },
        { 0x011B, "YResolution" },
        { 0x011C, "PlanarConfiguration" },
        { 0x0128, "ResolutionUnit" },
        { 0x0131, "Software" },
        { 0x0132, "DateTime" },
        { 0x013B, "Artist" },
        { 0x013C, "HostComputer" },
        { 0x0201, "JPEGInterchangeFormat" },
        { 0x0202, "JPEGInterchangeFormatLength" },
        { 0x0213, "YCbCrPositioning" },
        { 0x8298, "Copyright" },
        { 0x8769, "ExifIFDPointer" },
        { 0x8825, "GPSInfoIFDPointer" },
        { 0x9C9B, "XPTitle" },
        { 0x9C9C, "XPComment" },
        { 0x9C9D, "XPAuthor" },
        { 0x9C9E, "XPKeywords" },
        { 0x9C9F, "XPSubject" },
    };

    static constexpr TagNameEntry kExifIfdTags[] = {
        { 0x829A, "ExposureTime" },
        { 0x829D, "FNumber" },
        { 0x8822, "ExposureProgram" },
        { 0x8827, "ISOSpeedRatings" },
        { 0x9000, "ExifVersion" },
        { 0x9003, "DateTimeOriginal" },
        { 0x9004, "DateTimeDigitized" },
        { 0x9010, "OffsetTime" },
        { 0x9011, "OffsetTimeOriginal" },
        { 0x9012, "OffsetTimeDigitized" },
        { 0x9201, "ShutterSpeedValue" },
        { 0x9202, "ApertureValue" },
        { 0x9204, "ExposureBiasValue" },
        { 0x9207, "MeteringMode" },
        { 0x9209, "Flash" },
        { 0x920A, "FocalLength" },
        { 0x927C, "MakerNote" },
        { 0x9286, "UserComment" },
        { 0x9290, "SubSecTime" },
        { 0x9291, "SubSecTimeOriginal" },
        { 0x9292, "SubSecTimeDigitized" },
        { 0xA000, "FlashpixVersion" },
        { 0xA001, "ColorSpace" },
        { 0xA002, "PixelXDimension" },
        { 0xA003, "PixelYDimension" },
        { 0xA005, "InteroperabilityIFDPointer" },
        { 0xA402, "ExposureMode" },
        { 0xA403, "WhiteBalance" },
        { 0xA405, "FocalLengthIn35mmFilm" },
        { 0xA406, "SceneCaptureType" },
        { 0xA420, "ImageUniqueID" },
        { 0xA430, "CameraOwnerName" },
        { 0xA431, "BodySerialNumber" },
        { 0xA433, "LensMake" },
        { 0xA434, "LensModel" },
        { 0xA435, "LensSerialNumber" },
    };

    static constexpr TagNameEntry kGpsIfdTags[] = {
        { 0x0000, "GPSVersionID" },
        { 0x0001, "GPSLatitudeRef" },
        { 0x0002, "GPSLatitude" },
        { 0x0003, "GPSLongitudeRef" },
        { 0x0004, "GPSLongitude" },
        { 0x0005, "GPSAltitudeRef" },
        { 0x0006, "GPSAltitude" },
        { 0x0007, "GPSTimeStamp" },
        { 0x0008, "GPSSatellites" },
        { 0x0009, "GPSStatus" },
        { 0x000A, "GPSMeasureMode" },
        { 0x0012, "GPSMapDatum" },
        { 0x001B, "GPSProcessingMethod" },
        { 0x001D, "GPSDateStamp" },
    };

    static constexpr TagNameEntry kInteropIfdTags[] = {
        { 0x0001, "InteroperabilityIndex" },
        { 0x0002, "InteroperabilityVersion" },
    };

    template <size_t N>
    static std::string_view find_tag_name(const TagNameEntry (&entries)[N],
                                          uint16_t tag) noexcept
    {
        size_t lo = 0;
        size_t hi = N;
        while (lo < hi) {
            const size_t mid = lo + (hi - lo) / 2;
            if (entries[mid].tag < tag) {
                lo = mid + 1;
            } else {
                hi = mid;
            }
        }
        if (lo < N && entries[lo].tag == tag && entries[lo].name) {
            return entries[lo].name;
        }
        return {};
    }

}  // namespace

std::string_view
exif_tag_name(IfdKind kind, uint16_t tag) noexcept
{
    switch (kind) {
    case IfdKind::Ifd0:
    case IfdKind::Ifd1: return find_tag_name(kTiffIfdTags, tag);
    case IfdKind::Exif: return find_tag_name(kExifIfdTags, tag);
    case IfdKind::Gps: return find_tag_name(kGpsIfdTags, tag);
    case IfdKind::Interop: return find_tag_name(kInteropIfdTags, tag);
    }
    return {};
}

}  // namespace metasplice
