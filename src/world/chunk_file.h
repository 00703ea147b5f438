#pragma once

#include <bit>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <type_traits>
#include <utility>
#include <vector>

#include "core/grid3.h"

// World ChunkFile subsystem
// Responsible for: the on-disk chunk layout (header, type tags, little-endian cell codec).
// Should NOT do: own chunk memory, decide when chunks are saved, or classify blocks.
namespace delve::world {

inline constexpr char kChunkMagic[4] = {'C', 'H', 'N', 'K'};
inline constexpr std::size_t kChunkHeaderBytes = 4u + (3u * 4u) + 1u;
inline constexpr const char* kChunkFileExtension = ".chnk";

template <typename T>
struct CellTraits;

template <>
struct CellTraits<std::int8_t> {
    static constexpr char kTypeTag = 'b';
};

template <>
struct CellTraits<std::int16_t> {
    static constexpr char kTypeTag = 'h';
};

template <>
struct CellTraits<std::int32_t> {
    static constexpr char kTypeTag = 'i';
};

template <>
struct CellTraits<std::int64_t> {
    static constexpr char kTypeTag = 'l';
};

template <>
struct CellTraits<float> {
    static constexpr char kTypeTag = 'f';
};

template <>
struct CellTraits<double> {
    static constexpr char kTypeTag = 'd';
};

struct ChunkFileHeader {
    core::Cell3i size{};
    char typeTag = 'i';
};

// Byte width of one cell for a type tag, 0 when the tag is unknown.
std::size_t cellByteWidth(char typeTag);

std::filesystem::path chunkFileName(const core::Cell3i& chunkKey);

void appendChunkHeader(std::vector<std::uint8_t>& out, const ChunkFileHeader& header);
bool parseChunkHeader(const std::vector<std::uint8_t>& bytes, ChunkFileHeader& outHeader);
bool readFileBytes(const std::filesystem::path& path, std::vector<std::uint8_t>& outBytes);

namespace detail {

template <std::size_t Width>
using UnsignedOfWidth = std::conditional_t<Width == 1, std::uint8_t,
    std::conditional_t<Width == 2, std::uint16_t,
    std::conditional_t<Width == 4, std::uint32_t, std::uint64_t>>>;

template <typename Raw>
void appendLe(std::vector<std::uint8_t>& out, Raw raw) {
    for (std::size_t i = 0; i < sizeof(Raw); ++i) {
        out.push_back(static_cast<std::uint8_t>((raw >> (8u * i)) & 0xFFu));
    }
}

template <typename Raw>
Raw readLe(const std::uint8_t* bytes) {
    Raw raw = 0;
    for (std::size_t i = 0; i < sizeof(Raw); ++i) {
        raw = static_cast<Raw>(raw | (static_cast<Raw>(bytes[i]) << (8u * i)));
    }
    return raw;
}

template <typename Native>
Native readNativeLe(const std::uint8_t* bytes) {
    using Raw = UnsignedOfWidth<sizeof(Native)>;
    return std::bit_cast<Native>(readLe<Raw>(bytes));
}

} // namespace detail

template <typename T>
void appendCellLe(std::vector<std::uint8_t>& out, T value) {
    using Raw = detail::UnsignedOfWidth<sizeof(T)>;
    detail::appendLe(out, std::bit_cast<Raw>(value));
}

namespace detail {

// Converts `source` to T when it is representable, rounding float targets.
template <typename T, typename Source>
bool convertCell(Source source, T& out) {
    if constexpr (std::is_integral_v<T> && std::is_integral_v<Source>) {
        if (!std::in_range<T>(source)) {
            return false;
        }
    } else if constexpr (std::is_integral_v<T>) {
        // -min is a power of two, so it is exact in Source.
        constexpr Source lower = static_cast<Source>(std::numeric_limits<T>::min());
        if (!std::isfinite(source) || source < lower || source >= -lower) {
            return false;
        }
    } else if constexpr (std::is_floating_point_v<Source> && sizeof(Source) > sizeof(T)) {
        if (std::isfinite(source) &&
            (source < std::numeric_limits<T>::lowest() || source > std::numeric_limits<T>::max())) {
            return false;
        }
    }
    out = static_cast<T>(source);
    return true;
}

} // namespace detail

// Decodes one cell written with `typeTag` into T.
// Returns false when the value does not fit T.
// The tag must be known (cellByteWidth(typeTag) != 0) and `bytes` must hold that many bytes.
template <typename T>
bool readCellLe(const std::uint8_t* bytes, char typeTag, T& out) {
    switch (typeTag) {
    case 'b': return detail::convertCell(detail::readNativeLe<std::int8_t>(bytes), out);
    case 'h': return detail::convertCell(detail::readNativeLe<std::int16_t>(bytes), out);
    case 'i': return detail::convertCell(detail::readNativeLe<std::int32_t>(bytes), out);
    case 'l': return detail::convertCell(detail::readNativeLe<std::int64_t>(bytes), out);
    case 'f': return detail::convertCell(detail::readNativeLe<float>(bytes), out);
    case 'd': return detail::convertCell(detail::readNativeLe<double>(bytes), out);
    default: return false;
    }
}

// True when the raw on-disk cell is the absent sentinel (-1), independent of T.
// Same tag precondition as readCellLe.
inline bool isSentinelCell(const std::uint8_t* bytes, char typeTag) {
    switch (typeTag) {
    case 'b': return detail::readNativeLe<std::int8_t>(bytes) == -1;
    case 'h': return detail::readNativeLe<std::int16_t>(bytes) == -1;
    case 'i': return detail::readNativeLe<std::int32_t>(bytes) == -1;
    case 'l': return detail::readNativeLe<std::int64_t>(bytes) == -1;
    case 'f': return detail::readNativeLe<float>(bytes) == -1.0f;
    case 'd': return detail::readNativeLe<double>(bytes) == -1.0;
    default: return false;
    }
}

} // namespace delve::world
