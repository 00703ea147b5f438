#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "core/grid3.h"
#include "nav/pathfinder.h"
#include "world/block_class.h"
#include "world/chunk_store.h"

// App Survey subsystem
// Responsible for: wiring store, planner and follower into one mining survey run.
// Should NOT do: implement search, persistence formats, or agent hardware.
namespace delve::app {

inline constexpr world::BlockId kAirBlock = 0;
inline constexpr world::BlockId kStoneBlock = 1;
inline constexpr world::BlockId kBedrockBlock = 7;
inline constexpr world::BlockId kOreBlock = 14;

struct SurveyConfig {
    world::ChunkStoreConfig store{};
    core::Cell3i home{0, 6, 0};
    core::Dir6 homeFacing = core::Dir6::NegZ;
    // Half extent of the seeded region in x and z.
    std::int32_t seedRadius = 12;
    std::int32_t seedTopY = 12;
    std::uint64_t seed = 0x5eedu;
    nav::PathfinderConfig pathfinder{};
};

// Environment overrides: DELVE_CHUNK_DIR.
SurveyConfig surveyConfigFromEnvironment();

class SurveyApp {
public:
    explicit SurveyApp(SurveyConfig config = {});

    bool init();
    void run();
    bool shutdown();

    [[nodiscard]] std::size_t minedCount() const { return m_minedCount; }
    [[nodiscard]] std::size_t oreRemaining() const;

private:
    std::vector<core::Cell3i> regionChunkKeys() const;
    std::size_t loadRegion();
    void seedRegion();
    std::vector<core::Cell3i> collectOreTargets() const;

    SurveyConfig m_config;
    std::unique_ptr<world::BlockStore> m_store;
    world::BlockTable<world::BlockId> m_table;
    std::unique_ptr<world::StoreWorldView<world::BlockId>> m_world;
    std::size_t m_minedCount = 0;
};

} // namespace delve::app
