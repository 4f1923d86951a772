#include "cpanbridge/handlers/CapabilityHandler.hpp"

namespace cpanbridge::handlers {

HandlePtr HandlerContext::acquire(const std::string& id, HandleKind kind) {
    auto handle = pool_.require(id, kind);
    acquired_.push_back(handle);
    if (!handle->parent().empty()) {
        parents_.push_back(handle->parent());
    }
    return handle;
}

std::string HandlerContext::create(HandleKind kind, std::unique_ptr<NativeState> state, std::string parent) {
    if (!parent.empty()) {
        parents_.push_back(parent);
    }
    return pool_.create(kind, std::move(state), owner_, std::move(parent));
}

void HandlerContext::touch_acquired() {
    for (const auto& handle : acquired_) {
        handle->touch();
    }
    // Parents removed during the call are simply skipped.
    for (const auto& parent : parents_) {
        pool_.touch(parent);
    }
    acquired_.clear();
    parents_.clear();
}

}  // namespace cpanbridge::handlers
