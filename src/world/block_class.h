#pragma once

#include <algorithm>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <vector>

#include "core/grid3.h"
#include "world/chunk_store.h"

// World BlockClass subsystem
// Responsible for: mapping stored block values to the coarse classes navigation cares about.
// Should NOT do: own the block taxonomy, store cells, or compute costs.
namespace delve::world {

using BlockId = std::int32_t;
using BlockStore = ChunkStore<BlockId>;

enum class BlockClass : std::uint8_t {
    Unknown = 0,
    Air = 1,
    // Impassable floor (bedrock); never entered or cleared.
    Floor = 2,
    Solid = 3
};

inline constexpr const char* blockClassName(BlockClass blockClass) {
    switch (blockClass) {
    case BlockClass::Unknown: return "unknown";
    case BlockClass::Air: return "air";
    case BlockClass::Floor: return "floor";
    case BlockClass::Solid: return "solid";
    }
    return "unknown";
}

// What navigation sees of the world. Implementations may allocate storage on reads.
class WorldView {
public:
    virtual ~WorldView() = default;

    virtual BlockClass blockAt(const core::Cell3i& cell) const = 0;
    // Records that the agent cleared or entered `cell`.
    virtual void markCleared(const core::Cell3i& cell) = 0;
};

// Classification by explicit id lists; anything observed but unlisted is solid.
template <typename T>
class BlockTable {
public:
    BlockTable(std::initializer_list<T> airIds, std::initializer_list<T> floorIds)
        : m_airIds(airIds), m_floorIds(floorIds) {}

    BlockClass classify(const std::optional<T>& value) const {
        if (!value.has_value()) {
            return BlockClass::Unknown;
        }
        if (std::find(m_airIds.begin(), m_airIds.end(), *value) != m_airIds.end()) {
            return BlockClass::Air;
        }
        if (std::find(m_floorIds.begin(), m_floorIds.end(), *value) != m_floorIds.end()) {
            return BlockClass::Floor;
        }
        return BlockClass::Solid;
    }

    T airId() const {
        return m_airIds.empty() ? T{} : m_airIds.front();
    }

private:
    std::vector<T> m_airIds;
    std::vector<T> m_floorIds;
};

template <typename T>
class StoreWorldView final : public WorldView {
public:
    StoreWorldView(ChunkStore<T>& store, const BlockTable<T>& table) : m_store(store), m_table(table) {}

    BlockClass blockAt(const core::Cell3i& cell) const override {
        return m_table.classify(m_store.get(cell));
    }

    void markCleared(const core::Cell3i& cell) override {
        m_store.set(cell, m_table.airId());
    }

private:
    ChunkStore<T>& m_store;
    const BlockTable<T>& m_table;
};

} // namespace delve::world
