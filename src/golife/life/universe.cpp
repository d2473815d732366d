#include "universe.hpp"
#include <stdexcept>

Universe::Universe(const Life& life, uint32_t renderEvery)
    : current(life),
      seedPattern(life.snapshot()),
      every(renderEvery)
{
    if (every == 0)
        throw std::invalid_argument("renderEvery must be positive");
}

bool Universe::tick()
{
    bool stepped = false;
    if (count % every == 0) {
        current.step();
        stepped = true;
    }
    if (count == every)
        count = 0;
    count++;
    return stepped;
}

void Universe::apply(Control control)
{
    switch (control)
    {
    case CONTROL_SPEED_INCREASE:
        if (every > 1)
            every--;
        break;
    case CONTROL_SPEED_DECREASE:
        if (every < PAUSED_RENDER_EVERY)
            every++;
        break;
    case CONTROL_PAUSE:
        every = paused() ? INITIAL_RENDER_EVERY : PAUSED_RENDER_EVERY;
        break;
    case CONTROL_REPLAY:
        replay();
        break;
    default:
        throw std::invalid_argument("Unknown control");
    }
}

void Universe::replay()
{
    current.restore(seedPattern);
}
