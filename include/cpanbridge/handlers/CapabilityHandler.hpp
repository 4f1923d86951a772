#pragma once

#include "cpanbridge/Types.hpp"
#include "cpanbridge/core/HandlePool.hpp"
#include "cpanbridge/core/Value.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cpanbridge::handlers {

// Per-request view of the daemon state a handler may touch.
class HandlerContext {
public:
    HandlerContext(HandlePool& pool, std::string owner)
        : pool_(pool), owner_(std::move(owner)) {}

    [[nodiscard]] HandlePool& pool() noexcept { return pool_; }
    [[nodiscard]] const std::string& owner() const noexcept { return owner_; }

    // Looks up |id| as |kind|. The handle and its parent count as used only
    // once the call succeeds; see touch_acquired().
    HandlePtr acquire(const std::string& id, HandleKind kind);

    std::string create(HandleKind kind, std::unique_ptr<NativeState> state, std::string parent = {});

    // Called by the dispatcher after a successful invoke().
    void touch_acquired();

private:
    HandlePool& pool_;
    std::string owner_;
    std::vector<HandlePtr> acquired_;
    std::vector<std::string> parents_;
};

class CapabilityHandler {
public:
    virtual ~CapabilityHandler() = default;

    [[nodiscard]] virtual std::string_view module() const noexcept = 0;
    [[nodiscard]] virtual std::vector<std::string> functions() const = 0;

    // Runs |function|. Failures are reported by throwing BridgeError; any other
    // exception is treated as an execution failure by the dispatcher.
    virtual Value invoke(const std::string& function, const Value& params, HandlerContext& context) = 0;
};

using CapabilityHandlerPtr = std::shared_ptr<CapabilityHandler>;

}  // namespace cpanbridge::handlers
