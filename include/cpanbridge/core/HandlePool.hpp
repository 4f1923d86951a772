#pragma once

#include "cpanbridge/Types.hpp"
#include "cpanbridge/core/BridgeError.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace cpanbridge {

// Per-capability native resource owned by a handle. Destruction releases it.
class NativeState {
public:
    virtual ~NativeState() = default;
};

class Handle {
public:
    using Clock = std::chrono::steady_clock;

    Handle(std::string id,
           HandleKind kind,
           std::unique_ptr<NativeState> state,
           std::string owner,
           std::string parent);

    Handle(const Handle&) = delete;
    Handle& operator=(const Handle&) = delete;

    [[nodiscard]] const std::string& id() const noexcept { return id_; }
    [[nodiscard]] HandleKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& owner() const noexcept { return owner_; }
    [[nodiscard]] const std::string& parent() const noexcept { return parent_; }
    [[nodiscard]] Clock::time_point created_at() const noexcept { return created_at_; }
    [[nodiscard]] Clock::time_point last_used_at() const noexcept;
    [[nodiscard]] std::uint64_t use_count() const noexcept;

    void touch() noexcept;

    // Serializes operations on the underlying native resource.
    std::mutex& mutex() noexcept { return mutex_; }

    NativeState& state() noexcept { return *state_; }

    template <typename T>
    T& state_as() {
        auto* typed = dynamic_cast<T*>(state_.get());
        if (!typed) {
            throw BridgeError(ErrorKind::Internal, "Handle " + id_ + " carries unexpected native state");
        }
        return *typed;
    }

private:
    std::string id_;
    HandleKind kind_;
    std::unique_ptr<NativeState> state_;
    std::string owner_;
    std::string parent_;
    Clock::time_point created_at_;
    std::atomic<Clock::rep> last_used_ticks_;
    std::atomic<std::uint64_t> use_count_{0};
    std::mutex mutex_;
};

using HandlePtr = std::shared_ptr<Handle>;

struct HandleInfo {
    std::string id;
    HandleKind kind{HandleKind::DatabaseConnection};
    std::string owner;
    std::string parent;
    std::chrono::milliseconds age{0};
    std::chrono::milliseconds idle{0};
    std::uint64_t use_count{0};
};

struct PoolStats {
    std::size_t total{0};
    std::map<std::string, std::size_t> per_kind;
    std::vector<std::string> ids;
};

class HandlePool {
public:
    static constexpr std::size_t kDefaultCapacity = 10'000;

    explicit HandlePool(std::size_t capacity = kDefaultCapacity);
    ~HandlePool();

    HandlePool(const HandlePool&) = delete;
    HandlePool& operator=(const HandlePool&) = delete;

    // Registers |state| under a fresh id. Throws BridgeError(Resource) at capacity.
    std::string create(HandleKind kind,
                       std::unique_ptr<NativeState> state,
                       std::string owner = {},
                       std::string parent = {});

    // Lookup without touching; nullptr when absent.
    HandlePtr get(const std::string& id) const;

    // Lookup that throws BridgeError(Handle) when absent or of another kind.
    HandlePtr require(const std::string& id, HandleKind kind) const;

    bool touch(const std::string& id);

    // Removes the handle and every handle parented (transitively) to it.
    // Native state is released once in-flight users drop their references.
    bool remove(const std::string& id);
    std::size_t remove_children(const std::string& parent);

    // Removes |id| only if it is still idle for longer than |threshold|.
    // Returns every detached handle, |id| first and cascaded children after it.
    std::vector<HandlePtr> remove_if_idle(const std::string& id, std::chrono::milliseconds threshold);

    std::vector<HandlePtr> by_kind(HandleKind kind) const;
    std::vector<HandlePtr> children_of(const std::string& parent) const;

    PoolStats stats() const;
    std::vector<HandleInfo> snapshot() const;
    std::size_t size() const;
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

    void clear();

private:
    std::vector<HandlePtr> detach_locked(const std::string& id);
    static void log_removed(const std::vector<HandlePtr>& detached);

    std::size_t capacity_;
    std::uint64_t next_sequence_{0};
    std::unordered_map<std::string, HandlePtr> handles_;
    mutable std::mutex mutex_;
};

}  // namespace cpanbridge
