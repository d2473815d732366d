#pragma once

#include <cstdint>
#include <limits>

#include "life.hpp"

// ---- Controls ---- //
enum Control : uint8_t {
    CONTROL_PAUSE          = 0,
    CONTROL_SPEED_DECREASE = 1,
    CONTROL_SPEED_INCREASE = 2,
    CONTROL_REPLAY         = 3
};

constexpr uint32_t INITIAL_RENDER_EVERY = 5;
constexpr uint32_t PAUSED_RENDER_EVERY  = std::numeric_limits<uint32_t>::max();

// ---- Universe ---- //
// A Life plus the frame cadence that drives it. One step is taken every
// renderEvery ticks.
class Universe {
private:
    Life current;
    Pattern seedPattern;
    uint32_t every{INITIAL_RENDER_EVERY};
    uint32_t count{1};

public:
    explicit Universe(const Life& life, uint32_t renderEvery = INITIAL_RENDER_EVERY);

    // One frame. Returns true when the life was stepped.
    bool tick();

    void apply(Control control);
    void replay();

    const Life& life() const noexcept { return current; }
    const Pattern& seed() const noexcept { return seedPattern; }
    uint32_t renderEvery() const noexcept { return every; }
    bool paused() const noexcept { return every == PAUSED_RENDER_EVERY; }
};
