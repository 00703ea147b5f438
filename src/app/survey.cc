#include "app/survey.h"

#include <chrono>
#include <cstdlib>
#include <future>
#include <optional>
#include <string>
#include <utility>

#include "core/log.h"
#include "core/rng.h"
#include "nav/orientation.h"
#include "nav/path_follower.h"
#include "nav/plan_worker.h"
#include "nav/tour.h"

namespace delve::app {

namespace {

constexpr const char* kChunkDirEnvVar = "DELVE_CHUNK_DIR";

// Moves a virtual agent through the block store, digging whatever is not bedrock.
class StoreActuator final : public nav::Actuator {
public:
    StoreActuator(world::BlockStore& store, const core::Cell3i& position, core::Dir6 facing)
        : m_store(store), m_position(position), m_facing(facing) {}

    bool attemptMove(core::Dir6 direction) override {
        if (!core::isVertical(direction) && direction != m_facing) {
            return false;
        }
        const core::Cell3i target = core::neighborCell(m_position, direction);
        const std::optional<world::BlockId> block = m_store.get(target);
        if (block.has_value() && *block != kAirBlock) {
            return false;
        }
        m_position = target;
        return true;
    }

    bool clearObstruction(core::Dir6 direction) override {
        const core::Cell3i target = core::neighborCell(m_position, direction);
        const std::optional<world::BlockId> block = m_store.get(target);
        if (!block.has_value() || *block == kAirBlock || *block == kBedrockBlock) {
            return false;
        }
        if (*block == kOreBlock) {
            ++m_oreCollected;
        }
        return m_store.set(target, kAirBlock);
    }

    bool turn(nav::RelativeSide side) override {
        switch (side) {
        case nav::RelativeSide::Left:
            m_facing = nav::turnLeft(m_facing);
            return true;
        case nav::RelativeSide::Right:
            m_facing = nav::turnRight(m_facing);
            return true;
        case nav::RelativeSide::Back:
            m_facing = nav::turnRight(nav::turnRight(m_facing));
            return true;
        default:
            return false;
        }
    }

    core::Cell3i currentPosition() const override { return m_position; }
    core::Dir6 currentFacing() const override { return m_facing; }

    std::size_t oreCollected() const { return m_oreCollected; }

private:
    world::BlockStore& m_store;
    core::Cell3i m_position{};
    core::Dir6 m_facing = core::Dir6::NegZ;
    std::size_t m_oreCollected = 0;
};

} // namespace

SurveyConfig surveyConfigFromEnvironment() {
    SurveyConfig config{};
    config.pathfinder.maxExpansions = 200000;
    if (const char* chunkDir = std::getenv(kChunkDirEnvVar); chunkDir != nullptr && chunkDir[0] != '\0') {
        config.store.chunkDirectory = chunkDir;
    }
    return config;
}

SurveyApp::SurveyApp(SurveyConfig config)
    : m_config(std::move(config)), m_table({kAirBlock}, {kBedrockBlock}) {}

bool SurveyApp::init() {
    DELVE_LOGI("app") << "init begin, chunk directory '" << m_config.store.chunkDirectory.string() << "'";
    m_store = std::make_unique<world::BlockStore>(m_config.store);
    m_world = std::make_unique<world::StoreWorldView<world::BlockId>>(*m_store, m_table);

    const std::size_t loaded = loadRegion();
    if (loaded == 0) {
        seedRegion();
    }
    if (m_world->blockAt(m_config.home) != world::BlockClass::Air) {
        DELVE_LOGE("app") << "home cell " << m_config.home << " is not air";
        return false;
    }
    DELVE_LOGI("app") << "init done: " << m_store->size() << " known cells in " << m_store->chunkCount()
                      << " chunks";
    return true;
}

void SurveyApp::run() {
    const std::vector<core::Cell3i> targets = collectOreTargets();
    if (targets.empty()) {
        DELVE_LOGI("app") << "no ore to survey";
        return;
    }

    StoreActuator actuator(*m_store, m_config.home, m_config.homeFacing);
    // Each plan is awaited before the agent moves, so the world is never written while a job runs.
    nav::PlanWorker planner(*m_world, m_config.pathfinder);
    const nav::Tour tour = planner.submitTour(targets, m_config.home, std::nullopt, nav::heuristicManhattan).get();
    DELVE_LOGI("app") << "tour over " << tour.nodes.size() << " stops, estimated cost " << tour.totalCost;

    std::vector<core::Cell3i> stops(tour.nodes.begin() + 1, tour.nodes.end());
    stops.push_back(m_config.home);

    using Clock = std::chrono::steady_clock;
    const auto runStart = Clock::now();
    std::size_t legsFailed = 0;
    for (const core::Cell3i& stop : stops) {
        nav::PathRequest request{};
        request.start = actuator.currentPosition();
        request.startFacing = actuator.currentFacing();
        request.goal = stop;

        const nav::PathResult path = planner.submitPath(request).get();
        if (!path.ok()) {
            DELVE_LOGW("app") << "skipping stop " << stop << ": " << nav::navStatusName(path.status);
            ++legsFailed;
            continue;
        }

        const nav::FollowResult followed = nav::followPath(path.path, actuator, *m_world);
        if (followed.status != nav::NavStatus::Ok) {
            DELVE_LOGW("app") << "leg to " << stop << " stopped after " << followed.stepsTaken
                              << " steps: " << nav::navStatusName(followed.status);
            ++legsFailed;
            continue;
        }
    }

    m_minedCount = actuator.oreCollected();
    const auto runMs = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - runStart).count();
    DELVE_LOGI("app") << "survey finished in " << runMs << " ms: mined=" << m_minedCount
                      << ", failedLegs=" << legsFailed << ", position=" << actuator.currentPosition();
}

bool SurveyApp::shutdown() {
    if (!m_store) {
        return true;
    }

    bool ok = true;
    std::size_t saved = 0;
    const core::Cell3i& size = m_store->chunkSize();
    for (const core::Cell3i& key : m_store->chunkKeys()) {
        const core::Cell3i anchor{key.x * size.x, key.y * size.y, key.z * size.z};
        const world::PersistStatus status = m_store->save(anchor);
        if (status != world::PersistStatus::Ok) {
            DELVE_LOGE("app") << "failed to save chunk " << key << ": " << world::persistStatusName(status);
            ok = false;
            continue;
        }
        ++saved;
    }
    DELVE_LOGI("app") << "saved " << saved << " chunks to '" << m_store->chunkDirectory().string() << "'";

    m_world.reset();
    m_store.reset();
    return ok;
}

std::vector<core::Cell3i> SurveyApp::regionChunkKeys() const {
    const core::Cell3i& size = m_config.store.chunkSize;
    const std::int32_t radius = m_config.seedRadius;
    std::vector<core::Cell3i> keys;
    for (std::int32_t kx = core::floorDiv(-radius, size.x); kx <= core::floorDiv(radius, size.x); ++kx) {
        for (std::int32_t ky = 0; ky <= core::floorDiv(m_config.seedTopY, size.y); ++ky) {
            for (std::int32_t kz = core::floorDiv(-radius, size.z); kz <= core::floorDiv(radius, size.z); ++kz) {
                keys.push_back(core::Cell3i{kx, ky, kz});
            }
        }
    }
    return keys;
}

std::size_t SurveyApp::loadRegion() {
    const core::Cell3i& size = m_config.store.chunkSize;
    std::size_t loaded = 0;
    for (const core::Cell3i& key : regionChunkKeys()) {
        const core::Cell3i anchor{key.x * size.x, key.y * size.y, key.z * size.z};
        const world::PersistStatus status = m_store->load(anchor);
        if (status == world::PersistStatus::Ok) {
            ++loaded;
        } else if (status != world::PersistStatus::FileMissing) {
            DELVE_LOGW("app") << "chunk " << key << " not loaded: " << world::persistStatusName(status);
        }
    }
    if (loaded > 0) {
        DELVE_LOGI("app") << "loaded " << loaded << " saved chunks";
    }
    return loaded;
}

void SurveyApp::seedRegion() {
    core::Pcg32 rng(m_config.seed);
    const std::int32_t radius = m_config.seedRadius;
    std::size_t oreCount = 0;
    for (std::int32_t x = -radius; x <= radius; ++x) {
        for (std::int32_t y = 1; y <= m_config.seedTopY; ++y) {
            for (std::int32_t z = -radius; z <= radius; ++z) {
                const core::Cell3i cell{x, y, z};
                world::BlockId block = kStoneBlock;
                if (y == 1) {
                    block = kBedrockBlock;
                } else if (y == m_config.home.y && (z == m_config.home.z || x == m_config.home.x)) {
                    block = kAirBlock;
                } else if (y > 2 && rng.chance(1u, 90u)) {
                    block = kOreBlock;
                    ++oreCount;
                }
                if (!m_store->set(cell, block)) {
                    DELVE_LOGW("app") << "seeding rejected cell " << cell;
                }
            }
        }
    }
    DELVE_LOGI("app") << "seeded region radius " << radius << " with " << oreCount << " ore cells";
}

std::size_t SurveyApp::oreRemaining() const {
    return m_store ? collectOreTargets().size() : 0u;
}

std::vector<core::Cell3i> SurveyApp::collectOreTargets() const {
    std::vector<core::Cell3i> targets;
    m_store->forEach([&targets](const core::Cell3i& cell, world::BlockId block) {
        if (block == kOreBlock) {
            targets.push_back(cell);
        }
    });
    return targets;
}

} // namespace delve::app
