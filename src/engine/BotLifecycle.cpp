#include "engine/BotLifecycle.h"

namespace tradebots {
namespace engine {

bool BotLifecycle::isTerminal(BotState state) {
    switch (state) {
        case BotState::STOPPED:
        case BotState::STOPLOSS_TRIGGERED:
        case BotState::INSUFFICIENT_FUNDS:
        case BotState::INVALID_DECISION:
        case BotState::ERRORED:
            return true;
        default:
            return false;
    }
}

BotTransitionResult BotLifecycle::transition(BotState current, BotEvent event) {
    BotTransitionResult result;
    result.state = current;

    if (isTerminal(current)) {
        result.terminal = true;
        return result;
    }

    BotState next = current;
    switch (event) {
        case BotEvent::STARTED:
            if (current == BotState::STARTING) {
                next = BotState::RUNNING;
            }
            break;
        case BotEvent::STOP_REQUESTED:
            if (current != BotState::NONE) {
                next = BotState::STOPPED;
            }
            break;
        case BotEvent::STOPLOSS_BREACHED:
            if (current == BotState::RUNNING) {
                next = BotState::STOPLOSS_TRIGGERED;
            }
            break;
        case BotEvent::FUNDS_REJECTED:
            if (current == BotState::RUNNING) {
                next = BotState::INSUFFICIENT_FUNDS;
            }
            break;
        case BotEvent::DECISION_REJECTED:
            if (current == BotState::RUNNING) {
                next = BotState::INVALID_DECISION;
            }
            break;
        case BotEvent::FAULT:
            if (current != BotState::NONE) {
                next = BotState::ERRORED;
            }
            break;
    }

    result.state = next;
    result.changed = next != current;
    result.terminal = isTerminal(next);
    return result;
}

const char* toString(BotState state) {
    switch (state) {
        case BotState::NONE: return "NotRunning";
        case BotState::STARTING: return "Starting";
        case BotState::RUNNING: return "Running";
        case BotState::STOPPED: return "Stopped";
        case BotState::STOPLOSS_TRIGGERED: return "StoplossTriggered";
        case BotState::INSUFFICIENT_FUNDS: return "InsufficientFunds";
        case BotState::INVALID_DECISION: return "InvalidDecision";
        case BotState::ERRORED: return "Errored";
    }
    return "Unknown";
}

const char* toString(BotEvent event) {
    switch (event) {
        case BotEvent::STARTED: return "started";
        case BotEvent::STOP_REQUESTED: return "stop_requested";
        case BotEvent::STOPLOSS_BREACHED: return "stoploss_breached";
        case BotEvent::FUNDS_REJECTED: return "funds_rejected";
        case BotEvent::DECISION_REJECTED: return "decision_rejected";
        case BotEvent::FAULT: return "fault";
    }
    return "unknown";
}

} // namespace engine
} // namespace tradebots
