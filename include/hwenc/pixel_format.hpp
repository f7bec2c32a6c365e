#pragma once

#include "error_util.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace HWENC {

/// Packed pixel formats accepted from the capture layer
enum class source_format {
    BGRX,
    BGRA,
    RGBX,
    RGBA,
    XRGB,
    ARGB,
    r210,
};

/// Input buffer formats understood by the hardware encoder
enum class buffer_format {
    argb,   ///< 8 bit packed, B G R A in memory
    abgr,   ///< 8 bit packed, R G B A in memory
    argb10, ///< 10 bit packed, 2:10:10:10
    iyuv,   ///< planar 4:2:0, Y then U then V
    yuv444, ///< planar 4:4:4, Y then U then V
};

inline std::string to_string(source_format format) {
    switch (format) {
    case source_format::BGRX:
        return "BGRX";
    case source_format::BGRA:
        return "BGRA";
    case source_format::RGBX:
        return "RGBX";
    case source_format::RGBA:
        return "RGBA";
    case source_format::XRGB:
        return "XRGB";
    case source_format::ARGB:
        return "ARGB";
    case source_format::r210:
        return "r210";
    }
    return "unknown";
}

inline std::string to_string(buffer_format format) {
    switch (format) {
    case buffer_format::argb:
        return "ARGB";
    case buffer_format::abgr:
        return "ABGR";
    case buffer_format::argb10:
        return "ARGB10";
    case buffer_format::iyuv:
        return "IYUV";
    case buffer_format::yuv444:
        return "YUV444";
    }
    return "unknown";
}

/**
 * @brief Parses a capture pixel format name.
 *
 * @throws invalid_configuration for anything outside the supported packed formats (e.g. "RGB565").
 */
inline source_format parse_source_format(const std::string& name) {
    for (auto format : {source_format::BGRX, source_format::BGRA, source_format::RGBX, source_format::RGBA,
                        source_format::XRGB, source_format::ARGB, source_format::r210}) {
        if (to_string(format) == name) {
            return format;
        }
    }
    throw invalid_configuration{"unsupported source pixel format '" + name + "'"};
}

inline bool is_30bit(source_format format) {
    return format == source_format::r210;
}

/// Byte position of each 8 bit channel within one 32 bit source pixel
struct rgb_offsets {
    uint8_t r;
    uint8_t g;
    uint8_t b;
};

inline rgb_offsets channel_offsets(source_format format) {
    switch (format) {
    case source_format::BGRX:
    case source_format::BGRA:
        return {2, 1, 0};
    case source_format::RGBX:
    case source_format::RGBA:
        return {0, 1, 2};
    case source_format::XRGB:
    case source_format::ARGB:
        return {1, 2, 3};
    case source_format::r210:
        break;
    }
    throw invalid_configuration{"no 8 bit channel layout for " + to_string(format)};
}

/**
 * @brief The hardware format that accepts @p format without conversion, if any.
 */
inline std::optional<buffer_format> native_buffer_format(source_format format) {
    switch (format) {
    case source_format::BGRX:
    case source_format::BGRA:
        return buffer_format::argb;
    case source_format::RGBX:
    case source_format::RGBA:
        return buffer_format::abgr;
    case source_format::r210:
        return buffer_format::argb10;
    case source_format::XRGB:
    case source_format::ARGB:
        break;
    }
    return std::nullopt;
}

/// Source imported as-is
struct packed_rgb {
    source_format source;
    buffer_format format;
};

/// Converted to planar 4:2:0
struct planar_420 { };

/// Converted to planar 4:4:4
struct planar_444 { };

/// 30 bit source imported as-is
struct packed_10bit { };

/// The layout of the encoder's input buffer, matched exhaustively wherever it matters
using buffer_layout = std::variant<packed_rgb, planar_420, planar_444, packed_10bit>;

template<class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

inline buffer_format hardware_format(const buffer_layout& layout) {
    return std::visit(overloaded{[](const packed_rgb& p) {
                                     return p.format;
                                 },
                                 [](const planar_420&) {
                                     return buffer_format::iyuv;
                                 },
                                 [](const planar_444&) {
                                     return buffer_format::yuv444;
                                 },
                                 [](const packed_10bit&) {
                                     return buffer_format::argb10;
                                 }},
                      layout);
}

/// Name of the output colorspace, as reported in frame metadata
inline std::string layout_name(const buffer_layout& layout) {
    return std::visit(overloaded{[](const packed_rgb& p) {
                                     return to_string(p.source);
                                 },
                                 [](const planar_420&) {
                                     return std::string{"YUV420P"};
                                 },
                                 [](const planar_444&) {
                                     return std::string{"YUV444P"};
                                 },
                                 [](const packed_10bit&) {
                                     return std::string{"r210"};
                                 }},
                      layout);
}

/// True when the layout needs the conversion kernel between upload and encode
inline bool needs_conversion(const buffer_layout& layout) {
    return std::holds_alternative<planar_420>(layout) || std::holds_alternative<planar_444>(layout);
}

inline bool is_subsampled(const buffer_layout& layout) {
    return std::holds_alternative<planar_420>(layout);
}

} // namespace HWENC
