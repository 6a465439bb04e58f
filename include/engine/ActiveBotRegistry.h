#pragma once

#include "common/Types.h"
#include "engine/BotLifecycle.h"
#include "engine/CancellationToken.h"
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace tradebots {
namespace engine {

struct BotStatus {
    BotState state = BotState::NONE;
    std::string strategy_id;
    std::string strategy_name;
    uint64_t cycle_count = 0;
    std::optional<TradingPair> pair;
    double stoploss = 0.0;
    double initial_value_usd = 0.0;
    std::string reason;             // why the bot ended, empty while running
    // Set once a stop is requested. The state stays Running until the task
    // has left its current cycle, so a trade it was committing is counted.
    bool stop_requested = false;

    bool running() const { return BotLifecycle::isActive(state); }
};

struct StopResult {
    bool was_running = false;
    BotStatus status;
};

// Runtime record of one bot instance plus the task that drives it.
class BotHandle {
public:
    BotHandle(UserId user,
              std::string strategy_id,
              std::string strategy_name,
              TradingPair pair,
              double stoploss);
    ~BotHandle();

    BotHandle(const BotHandle&) = delete;
    BotHandle& operator=(const BotHandle&) = delete;

    BotTransitionResult apply(BotEvent event, const std::string& reason = std::string());

    // Cooperative stop. A bot still Starting is stopped at once; a Running
    // bot keeps its state until the task calls acknowledgeStop(). Returns
    // true only for the call that initiated the stop.
    bool requestStop(const std::string& reason);
    void acknowledgeStop();

    BotState state() const;
    BotStatus status() const;
    bool active() const { return BotLifecycle::isActive(state()); }

    const UserId& user() const { return user_; }
    void setInitialValue(double value_usd);
    void setCycleCount(uint64_t count) { cycle_count_.store(count); }

    CancellationToken& token() { return token_; }

    // Moves Starting -> Running and spawns the task in one step, so join()
    // never misses a task that is about to be attached.
    BotTransitionResult launch(std::function<void()> task);
    // Waits for the task to exit; safe to call more than once
    void join();

private:
    BotTransitionResult applyLocked(BotEvent event, const std::string& reason);

    const UserId user_;
    const std::string strategy_id_;
    const std::string strategy_name_;
    const TradingPair pair_;
    const double stoploss_;

    mutable std::mutex mutex_;
    BotState state_;
    double initial_value_usd_;
    std::string reason_;
    bool stop_requested_;
    std::string stop_reason_;
    std::atomic<uint64_t> cycle_count_;

    CancellationToken token_;

    std::mutex thread_mutex_;
    std::thread thread_;
};

// At most one active bot per user. The last handle for a user is kept after
// it ends so status() can report the terminal state.
class ActiveBotRegistry {
public:
    // Per-user gate. tryStart takes it, so anything that checks isActive()
    // and then mutates the account while holding it cannot interleave with
    // a start for the same user. Lock order: gate, then registry, then account.
    std::unique_lock<std::mutex> lockUser(const UserId& user);

    // Atomic check-and-insert. Fails while the user's current bot is active.
    // On success a finished predecessor is handed back through `replaced`
    // so the caller can join it outside the registry lock.
    bool tryStart(const UserId& user,
                  std::shared_ptr<BotHandle> handle,
                  std::shared_ptr<BotHandle>* replaced = nullptr);

    // Cooperative stop. The handle is returned for joining.
    StopResult stop(const UserId& user, std::shared_ptr<BotHandle>* handle = nullptr);

    // Forced termination for unrecoverable errors
    bool abort(const UserId& user, const std::string& reason);

    BotStatus status(const UserId& user) const;
    bool isActive(const UserId& user) const;

    std::shared_ptr<BotHandle> find(const UserId& user) const;
    std::vector<std::shared_ptr<BotHandle>> handles() const;
    std::vector<UserId> activeUsers() const;

private:
    std::map<UserId, std::shared_ptr<BotHandle>> bots_;
    mutable std::mutex mutex_;

    std::map<UserId, std::unique_ptr<std::mutex>> gates_;
    std::mutex gates_mutex_;
};

} // namespace engine
} // namespace tradebots
