#pragma once

namespace tradebots {
namespace engine {

enum class BotState {
    NONE,                   // never started
    STARTING,
    RUNNING,
    STOPPED,
    STOPLOSS_TRIGGERED,
    INSUFFICIENT_FUNDS,
    INVALID_DECISION,
    ERRORED
};

enum class BotEvent {
    STARTED,                // reference value captured
    STOP_REQUESTED,
    STOPLOSS_BREACHED,
    FUNDS_REJECTED,
    DECISION_REJECTED,
    FAULT
};

struct BotTransitionResult {
    BotState state = BotState::NONE;
    bool changed = false;
    bool terminal = false;
};

// Terminal states absorb every event, so a stopped bot can never run again.
class BotLifecycle {
public:
    static BotTransitionResult transition(BotState current, BotEvent event);

    static bool isTerminal(BotState state);
    static bool isActive(BotState state) {
        return state == BotState::STARTING || state == BotState::RUNNING;
    }
};

const char* toString(BotState state);
const char* toString(BotEvent event);

} // namespace engine
} // namespace tradebots
