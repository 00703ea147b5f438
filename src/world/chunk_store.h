#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <system_error>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "core/grid3.h"
#include "core/log.h"
#include "world/chunk_file.h"

// World ChunkStore subsystem
// Responsible for: sparse cell storage partitioned into lazily created dense chunks, with per-chunk persistence.
// Should NOT do: classify blocks, plan paths, or decide which chunks to keep resident.
namespace delve::world {

enum class PersistStatus : std::uint8_t {
    Ok = 0,
    FileMissing = 1,
    HeaderMismatch = 2,
    ReadFailed = 3,
    WriteFailed = 4
};

inline constexpr const char* persistStatusName(PersistStatus status) {
    switch (status) {
    case PersistStatus::Ok: return "ok";
    case PersistStatus::FileMissing: return "file-missing";
    case PersistStatus::HeaderMismatch: return "header-mismatch";
    case PersistStatus::ReadFailed: return "read-failed";
    case PersistStatus::WriteFailed: return "write-failed";
    }
    return "unknown";
}

struct ChunkStoreConfig {
    core::Cell3i chunkSize{16, 256, 16};
    std::filesystem::path chunkDirectory{"chunks"};
};

template <typename T>
struct CellEntry {
    core::Cell3i cell{};
    T value{};
};

// Observed block values keyed by world cell.
//
// Reads are not side-effect free: get() on a cell whose chunk has never been
// touched allocates an all-absent chunk for it. load() of a file whose header
// does not match this store's chunk size is a logged no-op rather than an error.
template <typename T>
class ChunkStore {
    static_assert(std::is_arithmetic_v<T> && std::is_signed_v<T>, "cell values must be signed so -1 can mark absent cells");

public:
    using Value = T;
    static constexpr char kTypeTag = CellTraits<T>::kTypeTag;

    class CellCursor;

    explicit ChunkStore(ChunkStoreConfig config = {});
    ChunkStore(const ChunkStore&) = delete;
    ChunkStore& operator=(const ChunkStore&) = delete;

    // Legitimate values are non-negative; -1 is reserved for absent cells on disk.
    static bool isStorableValue(T value);

    const core::Cell3i& chunkSize() const;
    const std::filesystem::path& chunkDirectory() const;
    core::Cell3i chunkKeyFor(const core::Cell3i& cell) const;
    core::Cell3i localOffsetFor(const core::Cell3i& cell) const;

    std::optional<T> get(const core::Cell3i& cell);
    bool set(const core::Cell3i& cell, std::optional<T> value);

    // 1-based ordinal view over present cells in cursor order.
    std::optional<CellEntry<T>> getByIndex(std::size_t index) const;
    bool setByIndex(std::size_t index, std::optional<core::Cell3i> target);

    std::size_t size() const;
    std::size_t chunkCount() const;
    bool hasChunk(const core::Cell3i& chunkKey) const;
    // Keys of every allocated chunk, in creation order.
    std::vector<core::Cell3i> chunkKeys() const;

    CellCursor cursor() const;
    template <typename Fn>
    void forEach(Fn&& fn) const;

    std::filesystem::path chunkPath(const core::Cell3i& cell) const;
    PersistStatus save(const core::Cell3i& cell);
    PersistStatus load(const core::Cell3i& cell);

private:
    struct Chunk {
        Chunk(const core::Cell3i& keyIn, std::size_t cellCount) : key(keyIn), cells(cellCount) {}

        core::Cell3i key{};
        std::vector<std::optional<T>> cells;
        std::size_t presentCount = 0;
        mutable std::shared_mutex mutex;
    };

    std::size_t cellsPerChunk() const;
    std::size_t linearIndex(const core::Cell3i& local) const;
    core::Cell3i cellFromLinear(const core::Cell3i& chunkKey, std::size_t linear) const;
    Chunk& ensureChunk(const core::Cell3i& chunkKey);
    const Chunk* chunkAtSlot(std::size_t slot) const;

    ChunkStoreConfig m_config;
    mutable std::shared_mutex m_chunksMutex;
    std::vector<std::unique_ptr<Chunk>> m_chunks;
    std::unordered_map<core::Cell3i, std::size_t, core::Cell3iHash> m_slotByKey;
};

// Walks present cells chunk by chunk (creation order), x outer, y middle, z inner.
// Must not be advanced while another thread creates chunks in the same store.
template <typename T>
class ChunkStore<T>::CellCursor {
public:
    explicit CellCursor(const ChunkStore<T>& store) : m_store(&store) {}

    std::optional<CellEntry<T>> next();
    void restart();

private:
    const ChunkStore<T>* m_store = nullptr;
    std::size_t m_slot = 0;
    std::size_t m_linear = 0;
};

template <typename T>
ChunkStore<T>::ChunkStore(ChunkStoreConfig config) : m_config(std::move(config)) {
    core::Cell3i& size = m_config.chunkSize;
    if (size.x <= 0 || size.y <= 0 || size.z <= 0) {
        DELVE_LOGE("store") << "invalid chunk size " << size << ", clamping components to 1";
        size.x = size.x > 0 ? size.x : 1;
        size.y = size.y > 0 ? size.y : 1;
        size.z = size.z > 0 ? size.z : 1;
    }
}

template <typename T>
bool ChunkStore<T>::isStorableValue(T value) {
    if constexpr (std::is_floating_point_v<T>) {
        return std::isfinite(value) && value >= static_cast<T>(0);
    } else {
        return value >= static_cast<T>(0);
    }
}

template <typename T>
const core::Cell3i& ChunkStore<T>::chunkSize() const {
    return m_config.chunkSize;
}

template <typename T>
const std::filesystem::path& ChunkStore<T>::chunkDirectory() const {
    return m_config.chunkDirectory;
}

template <typename T>
core::Cell3i ChunkStore<T>::chunkKeyFor(const core::Cell3i& cell) const {
    const core::Cell3i& size = m_config.chunkSize;
    return core::Cell3i{
        core::floorDiv(cell.x, size.x),
        core::floorDiv(cell.y, size.y),
        core::floorDiv(cell.z, size.z)};
}

template <typename T>
core::Cell3i ChunkStore<T>::localOffsetFor(const core::Cell3i& cell) const {
    const core::Cell3i& size = m_config.chunkSize;
    return core::Cell3i{
        core::floorMod(cell.x, size.x),
        core::floorMod(cell.y, size.y),
        core::floorMod(cell.z, size.z)};
}

template <typename T>
std::size_t ChunkStore<T>::cellsPerChunk() const {
    const core::Cell3i& size = m_config.chunkSize;
    return static_cast<std::size_t>(size.x) * static_cast<std::size_t>(size.y) * static_cast<std::size_t>(size.z);
}

template <typename T>
std::size_t ChunkStore<T>::linearIndex(const core::Cell3i& local) const {
    const core::Cell3i& size = m_config.chunkSize;
    return (static_cast<std::size_t>(local.x) * static_cast<std::size_t>(size.y) + static_cast<std::size_t>(local.y)) *
               static_cast<std::size_t>(size.z) +
           static_cast<std::size_t>(local.z);
}

template <typename T>
core::Cell3i ChunkStore<T>::cellFromLinear(const core::Cell3i& chunkKey, std::size_t linear) const {
    const core::Cell3i& size = m_config.chunkSize;
    const std::size_t sizeY = static_cast<std::size_t>(size.y);
    const std::size_t sizeZ = static_cast<std::size_t>(size.z);
    const auto localZ = static_cast<std::int32_t>(linear % sizeZ);
    const auto localY = static_cast<std::int32_t>((linear / sizeZ) % sizeY);
    const auto localX = static_cast<std::int32_t>(linear / (sizeZ * sizeY));
    return core::Cell3i{
        chunkKey.x * size.x + localX,
        chunkKey.y * size.y + localY,
        chunkKey.z * size.z + localZ};
}

template <typename T>
typename ChunkStore<T>::Chunk& ChunkStore<T>::ensureChunk(const core::Cell3i& chunkKey) {
    {
        std::shared_lock<std::shared_mutex> lock(m_chunksMutex);
        const auto it = m_slotByKey.find(chunkKey);
        if (it != m_slotByKey.end()) {
            return *m_chunks[it->second];
        }
    }

    std::unique_lock<std::shared_mutex> lock(m_chunksMutex);
    const auto [it, inserted] = m_slotByKey.try_emplace(chunkKey, m_chunks.size());
    if (inserted) {
        m_chunks.push_back(std::make_unique<Chunk>(chunkKey, cellsPerChunk()));
        DELVE_LOGT("store") << "allocated chunk " << chunkKey << " (slot " << it->second << ")";
    }
    return *m_chunks[it->second];
}

template <typename T>
const typename ChunkStore<T>::Chunk* ChunkStore<T>::chunkAtSlot(std::size_t slot) const {
    std::shared_lock<std::shared_mutex> lock(m_chunksMutex);
    if (slot >= m_chunks.size()) {
        return nullptr;
    }
    return m_chunks[slot].get();
}

template <typename T>
std::optional<T> ChunkStore<T>::get(const core::Cell3i& cell) {
    const Chunk& chunk = ensureChunk(chunkKeyFor(cell));
    std::shared_lock<std::shared_mutex> lock(chunk.mutex);
    return chunk.cells[linearIndex(localOffsetFor(cell))];
}

template <typename T>
bool ChunkStore<T>::set(const core::Cell3i& cell, std::optional<T> value) {
    if (value.has_value() && !isStorableValue(*value)) {
        DELVE_LOGW("store") << "rejected value " << +*value << " at " << cell << ": negative values are reserved";
        return false;
    }

    Chunk& chunk = ensureChunk(chunkKeyFor(cell));
    std::unique_lock<std::shared_mutex> lock(chunk.mutex);
    std::optional<T>& slot = chunk.cells[linearIndex(localOffsetFor(cell))];
    if (slot.has_value() && !value.has_value()) {
        --chunk.presentCount;
    } else if (!slot.has_value() && value.has_value()) {
        ++chunk.presentCount;
    }
    slot = value;
    return true;
}

template <typename T>
std::optional<CellEntry<T>> ChunkStore<T>::getByIndex(std::size_t index) const {
    if (index == 0) {
        return std::nullopt;
    }

    std::size_t remaining = index;
    for (std::size_t slot = 0;; ++slot) {
        const Chunk* chunk = chunkAtSlot(slot);
        if (chunk == nullptr) {
            return std::nullopt;
        }

        std::shared_lock<std::shared_mutex> lock(chunk->mutex);
        if (remaining > chunk->presentCount) {
            remaining -= chunk->presentCount;
            continue;
        }
        for (std::size_t linear = 0; linear < chunk->cells.size(); ++linear) {
            if (!chunk->cells[linear].has_value()) {
                continue;
            }
            if (--remaining == 0) {
                return CellEntry<T>{cellFromLinear(chunk->key, linear), *chunk->cells[linear]};
            }
        }
        return std::nullopt;
    }
}

template <typename T>
bool ChunkStore<T>::setByIndex(std::size_t index, std::optional<core::Cell3i> target) {
    const std::optional<CellEntry<T>> entry = getByIndex(index);
    if (!entry.has_value()) {
        return false;
    }

    set(entry->cell, std::nullopt);
    if (target.has_value()) {
        set(*target, entry->value);
    }
    return true;
}

template <typename T>
std::size_t ChunkStore<T>::size() const {
    std::shared_lock<std::shared_mutex> lock(m_chunksMutex);
    std::size_t total = 0;
    for (const std::unique_ptr<Chunk>& chunk : m_chunks) {
        std::shared_lock<std::shared_mutex> chunkLock(chunk->mutex);
        total += chunk->presentCount;
    }
    return total;
}

template <typename T>
std::size_t ChunkStore<T>::chunkCount() const {
    std::shared_lock<std::shared_mutex> lock(m_chunksMutex);
    return m_chunks.size();
}

template <typename T>
bool ChunkStore<T>::hasChunk(const core::Cell3i& chunkKey) const {
    std::shared_lock<std::shared_mutex> lock(m_chunksMutex);
    return m_slotByKey.find(chunkKey) != m_slotByKey.end();
}

template <typename T>
std::vector<core::Cell3i> ChunkStore<T>::chunkKeys() const {
    std::shared_lock<std::shared_mutex> lock(m_chunksMutex);
    std::vector<core::Cell3i> keys;
    keys.reserve(m_chunks.size());
    for (const std::unique_ptr<Chunk>& chunk : m_chunks) {
        keys.push_back(chunk->key);
    }
    return keys;
}

template <typename T>
typename ChunkStore<T>::CellCursor ChunkStore<T>::cursor() const {
    return CellCursor(*this);
}

template <typename T>
template <typename Fn>
void ChunkStore<T>::forEach(Fn&& fn) const {
    CellCursor walker = cursor();
    while (const std::optional<CellEntry<T>> entry = walker.next()) {
        fn(entry->cell, entry->value);
    }
}

template <typename T>
std::optional<CellEntry<T>> ChunkStore<T>::CellCursor::next() {
    for (;;) {
        const Chunk* chunk = m_store->chunkAtSlot(m_slot);
        if (chunk == nullptr) {
            return std::nullopt;
        }

        std::shared_lock<std::shared_mutex> lock(chunk->mutex);
        if (chunk->presentCount > 0) {
            while (m_linear < chunk->cells.size()) {
                const std::size_t linear = m_linear++;
                if (chunk->cells[linear].has_value()) {
                    return CellEntry<T>{m_store->cellFromLinear(chunk->key, linear), *chunk->cells[linear]};
                }
            }
        }
        ++m_slot;
        m_linear = 0;
    }
}

template <typename T>
void ChunkStore<T>::CellCursor::restart() {
    m_slot = 0;
    m_linear = 0;
}

template <typename T>
std::filesystem::path ChunkStore<T>::chunkPath(const core::Cell3i& cell) const {
    return m_config.chunkDirectory / chunkFileName(chunkKeyFor(cell));
}

template <typename T>
PersistStatus ChunkStore<T>::save(const core::Cell3i& cell) {
    const core::Cell3i chunkKey = chunkKeyFor(cell);
    const std::filesystem::path path = m_config.chunkDirectory / chunkFileName(chunkKey);
    Chunk& chunk = ensureChunk(chunkKey);

    std::error_code dirError;
    std::filesystem::create_directories(m_config.chunkDirectory, dirError);
    if (dirError) {
        DELVE_LOGE("store") << "cannot create chunk directory '" << m_config.chunkDirectory.string()
                            << "': " << dirError.message();
        return PersistStatus::WriteFailed;
    }

    std::vector<std::uint8_t> bytes;
    bytes.reserve(kChunkHeaderBytes + cellsPerChunk() * sizeof(T));
    appendChunkHeader(bytes, ChunkFileHeader{m_config.chunkSize, kTypeTag});

    std::unique_lock<std::shared_mutex> lock(chunk.mutex);
    for (const std::optional<T>& value : chunk.cells) {
        appendCellLe(bytes, value.has_value() ? *value : static_cast<T>(-1));
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        DELVE_LOGE("store") << "cannot open '" << path.string() << "' for writing";
        return PersistStatus::WriteFailed;
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out.good()) {
        DELVE_LOGE("store") << "write failed for '" << path.string() << "'";
        return PersistStatus::WriteFailed;
    }

    DELVE_LOGD("store") << "saved chunk " << chunkKey << " to '" << path.string() << "' ("
                        << chunk.presentCount << " present cells)";
    return PersistStatus::Ok;
}

template <typename T>
PersistStatus ChunkStore<T>::load(const core::Cell3i& cell) {
    const core::Cell3i chunkKey = chunkKeyFor(cell);
    const std::filesystem::path path = m_config.chunkDirectory / chunkFileName(chunkKey);
    Chunk& chunk = ensureChunk(chunkKey);

    std::error_code existsError;
    if (!std::filesystem::exists(path, existsError)) {
        DELVE_LOGD("store") << "no saved chunk " << chunkKey << " at '" << path.string() << "'";
        return PersistStatus::FileMissing;
    }

    std::vector<std::uint8_t> bytes;
    if (!readFileBytes(path, bytes)) {
        DELVE_LOGE("store") << "cannot read '" << path.string() << "'";
        return PersistStatus::ReadFailed;
    }
    if (bytes.size() < kChunkHeaderBytes) {
        DELVE_LOGE("store") << "truncated chunk header in '" << path.string() << "' (" << bytes.size() << " bytes)";
        return PersistStatus::ReadFailed;
    }

    ChunkFileHeader header{};
    if (!parseChunkHeader(bytes, header)) {
        DELVE_LOGW("store") << "ignoring '" << path.string() << "': bad magic";
        return PersistStatus::HeaderMismatch;
    }
    if (header.size != m_config.chunkSize) {
        DELVE_LOGW("store") << "ignoring '" << path.string() << "': chunk size " << header.size
                            << " does not match store chunk size " << m_config.chunkSize;
        return PersistStatus::HeaderMismatch;
    }

    const std::size_t width = cellByteWidth(header.typeTag);
    if (width == 0) {
        DELVE_LOGE("store") << "unknown cell type tag '" << header.typeTag << "' in '" << path.string() << "'";
        return PersistStatus::ReadFailed;
    }
    const std::size_t cellCount = cellsPerChunk();
    if (bytes.size() < kChunkHeaderBytes + cellCount * width) {
        DELVE_LOGE("store") << "truncated chunk body in '" << path.string() << "': expected "
                            << (kChunkHeaderBytes + cellCount * width) << " bytes, got " << bytes.size();
        return PersistStatus::ReadFailed;
    }

    std::vector<std::optional<T>> staged(cellCount);
    std::size_t presentCount = 0;
    std::size_t discardedCount = 0;
    const std::uint8_t* cursor = bytes.data() + kChunkHeaderBytes;
    for (std::size_t linear = 0; linear < cellCount; ++linear, cursor += width) {
        if (isSentinelCell(cursor, header.typeTag)) {
            continue;
        }
        T value{};
        if (!readCellLe<T>(cursor, header.typeTag, value) || !isStorableValue(value)) {
            ++discardedCount;
            continue;
        }
        staged[linear] = value;
        ++presentCount;
    }
    if (discardedCount > 0) {
        DELVE_LOGW("store") << "discarded " << discardedCount << " out-of-domain cells from '" << path.string() << "'";
    }

    std::unique_lock<std::shared_mutex> lock(chunk.mutex);
    chunk.cells = std::move(staged);
    chunk.presentCount = presentCount;
    DELVE_LOGD("store") << "loaded chunk " << chunkKey << " from '" << path.string() << "' (" << presentCount
                        << " present cells, tag '" << header.typeTag << "')";
    return PersistStatus::Ok;
}

} // namespace delve::world
