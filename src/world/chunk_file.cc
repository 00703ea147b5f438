#include "world/chunk_file.h"

#include <cstring>
#include <fstream>
#include <string>

namespace delve::world {

std::size_t cellByteWidth(char typeTag) {
    switch (typeTag) {
    case 'b':
        return 1u;
    case 'h':
        return 2u;
    case 'i':
    case 'f':
        return 4u;
    case 'l':
    case 'd':
        return 8u;
    default:
        return 0u;
    }
}

std::filesystem::path chunkFileName(const core::Cell3i& chunkKey) {
    return std::filesystem::path{
        std::to_string(chunkKey.x) + "_" + std::to_string(chunkKey.y) + "_" + std::to_string(chunkKey.z) +
        kChunkFileExtension};
}

void appendChunkHeader(std::vector<std::uint8_t>& out, const ChunkFileHeader& header) {
    out.insert(out.end(), std::begin(kChunkMagic), std::end(kChunkMagic));
    detail::appendLe(out, static_cast<std::uint32_t>(header.size.x));
    detail::appendLe(out, static_cast<std::uint32_t>(header.size.y));
    detail::appendLe(out, static_cast<std::uint32_t>(header.size.z));
    out.push_back(static_cast<std::uint8_t>(header.typeTag));
}

bool parseChunkHeader(const std::vector<std::uint8_t>& bytes, ChunkFileHeader& outHeader) {
    if (bytes.size() < kChunkHeaderBytes) {
        return false;
    }
    if (std::memcmp(bytes.data(), kChunkMagic, sizeof(kChunkMagic)) != 0) {
        return false;
    }

    outHeader.size.x = static_cast<std::int32_t>(detail::readLe<std::uint32_t>(bytes.data() + 4u));
    outHeader.size.y = static_cast<std::int32_t>(detail::readLe<std::uint32_t>(bytes.data() + 8u));
    outHeader.size.z = static_cast<std::int32_t>(detail::readLe<std::uint32_t>(bytes.data() + 12u));
    outHeader.typeTag = static_cast<char>(bytes[16u]);
    return true;
}

bool readFileBytes(const std::filesystem::path& path, std::vector<std::uint8_t>& outBytes) {
    outBytes.clear();

    std::ifstream stream(path, std::ios::binary | std::ios::ate);
    if (!stream) {
        return false;
    }

    const std::streamsize fileSize = stream.tellg();
    if (fileSize < 0) {
        return false;
    }
    stream.seekg(0, std::ios::beg);

    outBytes.resize(static_cast<std::size_t>(fileSize));
    if (fileSize > 0 && !stream.read(reinterpret_cast<char*>(outBytes.data()), fileSize)) {
        outBytes.clear();
        return false;
    }
    return true;
}

} // namespace delve::world
