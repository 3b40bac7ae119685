#pragma once

#include "core/Errors.hpp"
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace mcpd {

using json = nlohmann::json;

/**
 * @brief Where a registry entry came from
 */
enum class EntryOrigin {
    Builtin,
    Dynamic
};

/**
 * @brief What register_entry does when the name is already taken
 */
enum class RegisterMode {
    Reject,   ///< fail with DuplicateName
    Replace   ///< swap the whole entry, keeping its list position
};

inline const char* to_string(EntryOrigin origin) {
    return origin == EntryOrigin::Builtin ? "builtin" : "dynamic";
}

/**
 * @brief One named entry of a Registry
 */
template <typename Handler>
struct RegistryEntry {
    std::string name;
    json definition;          // protocol-facing schema blob
    Handler handler;
    int priority = 0;
    EntryOrigin origin = EntryOrigin::Dynamic;
};

/**
 * @brief Name-keyed store shared by concurrent readers and writers
 *
 * Used identically for tools, resources and prompts. Entries are immutable
 * once inserted: a replacement installs a new entry object, so readers
 * holding a copy never observe a half-written one. list() returns a
 * snapshot ordered by descending priority, then insertion order.
 *
 * Locking: get/list take the shared lock, register/unregister the exclusive
 * lock. No handler code and no listener runs while a lock is held.
 */
template <typename Handler>
class Registry {
public:
    using Entry = RegistryEntry<Handler>;

    /**
     * @brief Checks the required shape of an entry before insertion
     *
     * Throws std::invalid_argument with a description on failure.
     */
    using Validator = std::function<void(const Entry&)>;

    /**
     * @brief Called after every successful register/unregister
     * @param kind The registry kind ("tools", "resources", ...)
     */
    using ChangeListener = std::function<void(const std::string& kind)>;

    /**
     * @param kind Registry kind, used in messages and change events
     * @param domain_code JSON-RPC domain error code for this registry
     * @param validator Optional definition validator
     */
    Registry(std::string kind, int domain_code, Validator validator = nullptr)
        : kind_(std::move(kind)), domain_code_(domain_code), validator_(std::move(validator)) {
    }

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    /**
     * @brief Insert an entry
     * @throws RegistryError Disabled, InvalidDefinition or DuplicateName
     */
    void register_entry(Entry entry, RegisterMode mode = RegisterMode::Reject) {
        if (!is_enabled()) {
            throw RegistryError(RegistryErrorReason::Disabled, domain_code_,
                                "Feature '" + kind_ + "' is disabled");
        }
        validate(entry);

        const std::string name = entry.name;
        auto stored = std::make_shared<const Entry>(std::move(entry));
        ChangeListener listener;
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            auto it = entries_.find(name);
            if (it != entries_.end()) {
                if (mode == RegisterMode::Reject) {
                    throw RegistryError(RegistryErrorReason::DuplicateName, domain_code_,
                                        "Duplicate " + kind_ + " name: " + name);
                }
                it->second.entry = std::move(stored);
            } else {
                entries_.emplace(name, Slot{std::move(stored), next_sequence_++});
            }
            listener = listener_;
        }

        spdlog::info("Registered {} entry: {}", kind_, name);
        notify(listener);
    }

    /**
     * @brief Remove an entry and return it
     * @throws RegistryError NotFound
     */
    Entry unregister(const std::string& name) {
        std::shared_ptr<const Entry> removed;
        ChangeListener listener;
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            auto it = entries_.find(name);
            if (it == entries_.end()) {
                throw not_found(name);
            }
            removed = std::move(it->second.entry);
            entries_.erase(it);
            listener = listener_;
        }

        spdlog::info("Unregistered {} entry: {}", kind_, name);
        notify(listener);
        return *removed;
    }

    /**
     * @brief Look up an entry; works while the registry is disabled
     * @throws RegistryError NotFound
     */
    Entry get(const std::string& name) const {
        auto entry = find(name);
        if (!entry) {
            throw not_found(name);
        }
        return *entry;
    }

    std::optional<Entry> find(const std::string& name) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(name);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        return *it->second.entry;
    }

    /**
     * @brief Fetch an entry for invocation
     *
     * Unlike get(), fails with Disabled when the feature gate is off.
     */
    Entry checkout(const std::string& name) const {
        if (!is_enabled()) {
            throw RegistryError(RegistryErrorReason::Disabled, domain_code_,
                                "Feature '" + kind_ + "' is disabled");
        }
        return get(name);
    }

    /**
     * @brief Consistent snapshot of every entry in list order
     */
    std::vector<Entry> list() const {
        std::vector<std::pair<std::shared_ptr<const Entry>, std::uint64_t>> snapshot;
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            snapshot.reserve(entries_.size());
            for (const auto& [name, slot] : entries_) {
                snapshot.emplace_back(slot.entry, slot.sequence);
            }
        }

        std::sort(snapshot.begin(), snapshot.end(), [](const auto& a, const auto& b) {
            if (a.first->priority != b.first->priority) {
                return a.first->priority > b.first->priority;
            }
            return a.second < b.second;
        });

        std::vector<Entry> result;
        result.reserve(snapshot.size());
        for (const auto& item : snapshot) {
            result.push_back(*item.first);
        }
        return result;
    }

    size_t size() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return entries_.size();
    }

    bool contains(const std::string& name) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return entries_.count(name) > 0;
    }

    bool is_enabled() const { return enabled_.load(std::memory_order_acquire); }

    void set_enabled(bool enabled) {
        enabled_.store(enabled, std::memory_order_release);
        spdlog::info("Feature '{}' {}", kind_, enabled ? "enabled" : "disabled");
    }

    void set_change_listener(ChangeListener listener) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        listener_ = std::move(listener);
    }

    const std::string& kind() const { return kind_; }
    int domain_code() const { return domain_code_; }

private:
    struct Slot {
        std::shared_ptr<const Entry> entry;
        std::uint64_t sequence;
    };

    void validate(const Entry& entry) const {
        if (entry.name.empty()) {
            throw RegistryError(RegistryErrorReason::InvalidDefinition, domain_code_,
                                kind_ + " name cannot be empty");
        }
        if (!entry.handler) {
            throw RegistryError(RegistryErrorReason::InvalidDefinition, domain_code_,
                                kind_ + " '" + entry.name + "' has no handler");
        }
        if (!validator_) {
            return;
        }
        try {
            validator_(entry);
        } catch (const std::invalid_argument& e) {
            throw RegistryError(RegistryErrorReason::InvalidDefinition, domain_code_,
                                "Invalid " + kind_ + " definition '" + entry.name + "': " + e.what());
        } catch (const nlohmann::json::exception& e) {
            throw RegistryError(RegistryErrorReason::InvalidDefinition, domain_code_,
                                "Invalid " + kind_ + " definition '" + entry.name + "': " + e.what());
        }
    }

    RegistryError not_found(const std::string& name) const {
        return RegistryError(RegistryErrorReason::NotFound, domain_code_,
                             "Unknown " + kind_ + ": " + name);
    }

    void notify(const ChangeListener& listener) const {
        if (!listener) {
            return;
        }
        try {
            listener(kind_);
        } catch (const std::exception& e) {
            spdlog::warn("List-changed notification for '{}' failed: {}", kind_, e.what());
        }
    }

    std::string kind_;
    int domain_code_;
    Validator validator_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Slot> entries_;
    std::uint64_t next_sequence_ = 0;
    ChangeListener listener_;
    std::atomic<bool> enabled_{true};
};

} // namespace mcpd
