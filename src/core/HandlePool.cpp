#include "cpanbridge/core/HandlePool.hpp"

#include "cpanbridge/daemon/StructuredLogger.hpp"

#include <algorithm>
#include <utility>

namespace cpanbridge {

namespace {

std::chrono::milliseconds elapsed_ms(Handle::Clock::time_point since, Handle::Clock::time_point now) {
    if (since >= now) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(now - since);
}

}  // namespace

Handle::Handle(std::string id,
               HandleKind kind,
               std::unique_ptr<NativeState> state,
               std::string owner,
               std::string parent)
    : id_(std::move(id)),
      kind_(kind),
      state_(std::move(state)),
      owner_(std::move(owner)),
      parent_(std::move(parent)),
      created_at_(Clock::now()),
      last_used_ticks_(created_at_.time_since_epoch().count()) {}

Handle::Clock::time_point Handle::last_used_at() const noexcept {
    return Clock::time_point(Clock::duration(last_used_ticks_.load(std::memory_order_acquire)));
}

std::uint64_t Handle::use_count() const noexcept {
    return use_count_.load(std::memory_order_relaxed);
}

void Handle::touch() noexcept {
    last_used_ticks_.store(Clock::now().time_since_epoch().count(), std::memory_order_release);
    use_count_.fetch_add(1, std::memory_order_relaxed);
}

HandlePool::HandlePool(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {}

HandlePool::~HandlePool() {
    clear();
}

std::string HandlePool::create(HandleKind kind,
                               std::unique_ptr<NativeState> state,
                               std::string owner,
                               std::string parent) {
    if (!state) {
        throw BridgeError(ErrorKind::Internal, "Refusing to pool an empty native state");
    }

    std::string id;
    {
        std::scoped_lock lock(mutex_);
        if (handles_.size() >= capacity_) {
            throw BridgeError(ErrorKind::Resource,
                              "Handle pool exhausted (" + std::to_string(capacity_) + " handles in use)");
        }
        id = std::string(handle_kind_prefix(kind)) + "_" + std::to_string(++next_sequence_);
        handles_.emplace(id, std::make_shared<Handle>(id, kind, std::move(state), std::move(owner), std::move(parent)));
    }

    daemon::log_event(daemon::StructuredLogger::Level::Debug,
                      "pool.handle.created",
                      {{"id", id}, {"kind", std::string(handle_kind_to_string(kind))}});
    return id;
}

HandlePtr HandlePool::get(const std::string& id) const {
    std::scoped_lock lock(mutex_);
    const auto it = handles_.find(id);
    return it == handles_.end() ? nullptr : it->second;
}

HandlePtr HandlePool::require(const std::string& id, HandleKind kind) const {
    auto handle = get(id);
    if (!handle) {
        throw_handle_not_found(id);
    }
    if (handle->kind() != kind) {
        throw BridgeError(ErrorKind::Handle,
                          "Handle " + id + " has wrong kind: expected " + std::string(handle_kind_to_string(kind)) +
                              ", found " + std::string(handle_kind_to_string(handle->kind())));
    }
    return handle;
}

bool HandlePool::touch(const std::string& id) {
    auto handle = get(id);
    if (!handle) {
        return false;
    }
    handle->touch();
    return true;
}

std::vector<HandlePtr> HandlePool::detach_locked(const std::string& id) {
    std::vector<HandlePtr> detached;
    const auto it = handles_.find(id);
    if (it == handles_.end()) {
        return detached;
    }
    detached.push_back(it->second);
    handles_.erase(it);

    // Breadth-first over the parent links; the pool is small enough for a scan per level.
    for (std::size_t index = 0; index < detached.size(); ++index) {
        const auto parent_id = detached[index]->id();
        for (auto child = handles_.begin(); child != handles_.end();) {
            if (child->second->parent() == parent_id) {
                detached.push_back(child->second);
                child = handles_.erase(child);
            } else {
                ++child;
            }
        }
    }
    return detached;
}

bool HandlePool::remove(const std::string& id) {
    std::vector<HandlePtr> detached;
    {
        std::scoped_lock lock(mutex_);
        detached = detach_locked(id);
    }
    if (detached.empty()) {
        return false;
    }
    log_removed(detached);
    return true;
}

void HandlePool::log_removed(const std::vector<HandlePtr>& detached) {
    for (const auto& handle : detached) {
        daemon::log_event(daemon::StructuredLogger::Level::Debug,
                          "pool.handle.removed",
                          {{"id", handle->id()}, {"kind", std::string(handle_kind_to_string(handle->kind()))}});
    }
}

std::size_t HandlePool::remove_children(const std::string& parent) {
    std::size_t removed = 0;
    for (const auto& child : children_of(parent)) {
        if (remove(child->id())) {
            ++removed;
        }
    }
    return removed;
}

std::vector<HandlePtr> HandlePool::remove_if_idle(const std::string& id, std::chrono::milliseconds threshold) {
    std::vector<HandlePtr> detached;
    {
        std::scoped_lock lock(mutex_);
        const auto it = handles_.find(id);
        if (it == handles_.end()) {
            return detached;
        }
        const auto idle = elapsed_ms(it->second->last_used_at(), Handle::Clock::now());
        if (idle <= threshold) {
            return detached;
        }
        detached = detach_locked(id);
    }
    log_removed(detached);
    return detached;
}

std::vector<HandlePtr> HandlePool::by_kind(HandleKind kind) const {
    std::vector<HandlePtr> matches;
    std::scoped_lock lock(mutex_);
    for (const auto& [id, handle] : handles_) {
        if (handle->kind() == kind) {
            matches.push_back(handle);
        }
    }
    return matches;
}

std::vector<HandlePtr> HandlePool::children_of(const std::string& parent) const {
    std::vector<HandlePtr> matches;
    std::scoped_lock lock(mutex_);
    for (const auto& [id, handle] : handles_) {
        if (handle->parent() == parent) {
            matches.push_back(handle);
        }
    }
    return matches;
}

PoolStats HandlePool::stats() const {
    PoolStats stats;
    std::scoped_lock lock(mutex_);
    stats.total = handles_.size();
    stats.ids.reserve(handles_.size());
    for (const auto& [id, handle] : handles_) {
        ++stats.per_kind[std::string(handle_kind_to_string(handle->kind()))];
        stats.ids.push_back(id);
    }
    std::sort(stats.ids.begin(), stats.ids.end());
    return stats;
}

std::vector<HandleInfo> HandlePool::snapshot() const {
    std::vector<HandleInfo> entries;
    const auto now = Handle::Clock::now();
    std::scoped_lock lock(mutex_);
    entries.reserve(handles_.size());
    for (const auto& [id, handle] : handles_) {
        HandleInfo info;
        info.id = id;
        info.kind = handle->kind();
        info.owner = handle->owner();
        info.parent = handle->parent();
        info.age = elapsed_ms(handle->created_at(), now);
        info.idle = elapsed_ms(handle->last_used_at(), now);
        info.use_count = handle->use_count();
        entries.push_back(std::move(info));
    }
    std::sort(entries.begin(), entries.end(), [](const HandleInfo& lhs, const HandleInfo& rhs) {
        return lhs.id < rhs.id;
    });
    return entries;
}

std::size_t HandlePool::size() const {
    std::scoped_lock lock(mutex_);
    return handles_.size();
}

void HandlePool::clear() {
    std::unordered_map<std::string, HandlePtr> drained;
    {
        std::scoped_lock lock(mutex_);
        drained.swap(handles_);
    }
    // Release dependents before the handles they hang off.
    for (auto it = drained.begin(); it != drained.end();) {
        if (!it->second->parent().empty()) {
            it = drained.erase(it);
        } else {
            ++it;
        }
    }
    drained.clear();
}

}  // namespace cpanbridge
