#include "engine/ActiveBotRegistry.h"
#include "common/Logger.h"

namespace tradebots {
namespace engine {

// ===== BotHandle =====

BotHandle::BotHandle(UserId user,
                     std::string strategy_id,
                     std::string strategy_name,
                     TradingPair pair,
                     double stoploss)
    : user_(std::move(user))
    , strategy_id_(std::move(strategy_id))
    , strategy_name_(std::move(strategy_name))
    , pair_(std::move(pair))
    , stoploss_(stoploss)
    , state_(BotState::STARTING)
    , initial_value_usd_(0.0)
    , stop_requested_(false)
    , cycle_count_(0)
{}

BotHandle::~BotHandle() {
    token_.requestAbort();
    std::lock_guard<std::mutex> lock(thread_mutex_);
    if (!thread_.joinable()) {
        return;
    }
    if (thread_.get_id() == std::this_thread::get_id()) {
        thread_.detach();
    } else {
        thread_.join();
    }
}

BotTransitionResult BotHandle::apply(BotEvent event, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    return applyLocked(event, reason);
}

BotTransitionResult BotHandle::applyLocked(BotEvent event, const std::string& reason) {
    const BotState previous = state_;
    BotTransitionResult result = BotLifecycle::transition(state_, event);
    if (result.changed) {
        state_ = result.state;
        if (result.terminal && reason_.empty()) {
            reason_ = reason.empty() ? toString(event) : reason;
        }
        LOG_INFO("[{}] bot {} -> {} ({})", user_, toString(previous), toString(state_), toString(event));
    }
    return result;
}

bool BotHandle::requestStop(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == BotState::STARTING) {
            stop_requested_ = true;
            return applyLocked(BotEvent::STOP_REQUESTED, reason).changed;
        }
        if (state_ != BotState::RUNNING || stop_requested_) {
            return false;
        }
        stop_requested_ = true;
        stop_reason_ = reason;
    }
    LOG_INFO("[{}] stop requested: {}", user_, reason);
    token_.requestStop();
    return true;
}

void BotHandle::acknowledgeStop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == BotState::RUNNING) {
        applyLocked(BotEvent::STOP_REQUESTED, stop_reason_.empty() ? "stopped" : stop_reason_);
    }
}

BotState BotHandle::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

BotStatus BotHandle::status() const {
    BotStatus out;
    out.strategy_id = strategy_id_;
    out.strategy_name = strategy_name_;
    out.pair = pair_;
    out.stoploss = stoploss_;
    out.cycle_count = cycle_count_.load();

    std::lock_guard<std::mutex> lock(mutex_);
    out.state = state_;
    out.initial_value_usd = initial_value_usd_;
    out.reason = reason_;
    out.stop_requested = stop_requested_;
    return out;
}

void BotHandle::setInitialValue(double value_usd) {
    std::lock_guard<std::mutex> lock(mutex_);
    initial_value_usd_ = value_usd;
}

BotTransitionResult BotHandle::launch(std::function<void()> task) {
    std::lock_guard<std::mutex> lock(thread_mutex_);
    BotTransitionResult result = apply(BotEvent::STARTED);
    if (result.changed) {
        thread_ = std::thread(std::move(task));
    }
    return result;
}

void BotHandle::join() {
    std::lock_guard<std::mutex> lock(thread_mutex_);
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

// ===== ActiveBotRegistry =====

std::unique_lock<std::mutex> ActiveBotRegistry::lockUser(const UserId& user) {
    std::mutex* gate = nullptr;
    {
        std::lock_guard<std::mutex> lock(gates_mutex_);
        auto& slot = gates_[user];
        if (!slot) {
            slot = std::make_unique<std::mutex>();
        }
        gate = slot.get();
    }
    return std::unique_lock<std::mutex>(*gate);
}

bool ActiveBotRegistry::tryStart(const UserId& user,
                                 std::shared_ptr<BotHandle> handle,
                                 std::shared_ptr<BotHandle>* replaced) {
    auto gate = lockUser(user);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = bots_.find(user);
    if (it != bots_.end()) {
        if (it->second->active()) {
            return false;
        }
        if (replaced) {
            *replaced = it->second;
        }
        it->second = std::move(handle);
        return true;
    }
    bots_.emplace(user, std::move(handle));
    return true;
}

StopResult ActiveBotRegistry::stop(const UserId& user, std::shared_ptr<BotHandle>* handle) {
    StopResult result;
    std::shared_ptr<BotHandle> bot = find(user);
    if (!bot) {
        return result;
    }

    result.was_running = bot->requestStop("stopped by user");
    result.status = bot->status();
    if (handle) {
        *handle = bot;
    }
    return result;
}

bool ActiveBotRegistry::abort(const UserId& user, const std::string& reason) {
    std::shared_ptr<BotHandle> bot = find(user);
    if (!bot) {
        return false;
    }
    BotTransitionResult transition = bot->apply(BotEvent::FAULT, reason);
    if (transition.changed) {
        LOG_ERROR("[{}] bot aborted: {}", user, reason);
        bot->token().requestAbort();
    }
    return transition.changed;
}

BotStatus ActiveBotRegistry::status(const UserId& user) const {
    std::shared_ptr<BotHandle> bot = find(user);
    if (!bot) {
        return BotStatus();
    }
    return bot->status();
}

bool ActiveBotRegistry::isActive(const UserId& user) const {
    std::shared_ptr<BotHandle> bot = find(user);
    return bot && bot->active();
}

std::shared_ptr<BotHandle> ActiveBotRegistry::find(const UserId& user) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = bots_.find(user);
    if (it == bots_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<std::shared_ptr<BotHandle>> ActiveBotRegistry::handles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<BotHandle>> out;
    out.reserve(bots_.size());
    for (const auto& [user, bot] : bots_) {
        out.push_back(bot);
    }
    return out;
}

std::vector<UserId> ActiveBotRegistry::activeUsers() const {
    std::vector<UserId> out;
    for (const auto& bot : handles()) {
        if (bot->active()) {
            out.push_back(bot->user());
        }
    }
    return out;
}

} // namespace engine
} // namespace tradebots
