#pragma once
#include "id_generator.hpp"
#include <any>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/logger.h>

namespace wsrpc {

enum class OperationKind {
    Promise,
    Data
};

const char* to_string(OperationKind kind) noexcept;

/// Snapshot of a tracked operation, as handed to event hooks and get().
struct PendingOperation {
    std::string id;
    OperationKind kind{OperationKind::Data};
    std::chrono::steady_clock::time_point created_at;
    /// 0 means the operation never expires on its own.
    std::chrono::milliseconds timeout{0};
    std::any data;
};

struct AddOptions {
    /// Falls back to Options::default_timeout. 0 disables expiry.
    std::optional<std::chrono::milliseconds> timeout;
    std::optional<std::string> custom_id;
};

struct PendingOperationEvents {
    std::function<void(const PendingOperation&)> on_timeout;
    std::function<void(const PendingOperation&, const nlohmann::json& result)> on_resolve;
    std::function<void(const PendingOperation&, std::exception_ptr reason)> on_reject;
    std::function<void(const PendingOperation&)> on_cleanup;
};

struct PendingOperationStats {
    std::size_t total = 0;
    std::map<std::string, std::size_t> by_kind;
    /// Operations expiring within the next minute.
    std::size_t expiring_soon = 0;
    std::optional<std::chrono::steady_clock::time_point> oldest;
    double average_age_ms = 0.0;
};

/// Registry of in-flight operations keyed by string id. Each operation with a
/// non-zero timeout owns a steady_timer on the supplied io_context; expiry
/// rejects it with TimeoutError. An optional periodic sweep calls
/// cleanup_expired() as a safety net.
///
/// Not thread-safe: use from the thread running the io_context.
class PendingOperations {
public:
    struct Options {
        std::chrono::milliseconds default_timeout{30000};
        std::chrono::milliseconds cleanup_interval{10000};
        bool enable_auto_cleanup = true;
        IdGenerator generate_id = generate_uuid;
    };

    PendingOperations(boost::asio::io_context& io,
                      Options opts,
                      PendingOperationEvents events = {},
                      std::shared_ptr<spdlog::logger> logger = nullptr);
    virtual ~PendingOperations();

    PendingOperations(const PendingOperations&) = delete;
    PendingOperations& operator=(const PendingOperations&) = delete;

    /// Complete an operation. Returns false if `id` is unknown.
    bool resolve(const std::string& id, nlohmann::json result = nullptr);

    /// Fail an operation. Returns false if `id` is unknown.
    bool reject(const std::string& id, std::exception_ptr reason);
    bool reject(const std::string& id, const std::string& reason);

    /// Drop an operation without settling it. Fires on_cleanup.
    bool remove(const std::string& id);

    [[nodiscard]] std::optional<PendingOperation> get(const std::string& id) const;
    [[nodiscard]] bool has(const std::string& id) const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::vector<std::string> ids() const;
    [[nodiscard]] std::vector<std::string> ids_by_kind(OperationKind kind) const;

    /// Reject every outstanding operation with `reason`. Returns the count.
    std::size_t clear(const std::string& reason = "All operations cleared");

    /// Time out every operation whose deadline has passed. Returns the count.
    std::size_t cleanup_expired();

    [[nodiscard]] PendingOperationStats stats() const;

    void start_auto_cleanup();
    void stop_auto_cleanup();
    [[nodiscard]] bool auto_cleanup_running() const noexcept { return auto_cleanup_running_; }

    /// Stop the sweep and reject everything with `reason`. Safe to call twice.
    void destroy(const std::string& reason = "PendingOperations destroyed");

    [[nodiscard]] const Options& options() const noexcept { return opts_; }

    /// Replace the hooks that are set in `events`; unset hooks are kept.
    void set_event_handlers(PendingOperationEvents events);

protected:
    struct Entry {
        PendingOperation op;
        uint64_t seq = 0;
        std::unique_ptr<boost::asio::steady_timer> timer;
        std::optional<std::promise<nlohmann::json>> promise;
    };

    /// Register a new entry. Throws DuplicateIdError if the id is taken.
    const std::string& insert(OperationKind kind, std::any data, const AddOptions& opts,
                              std::optional<std::promise<nlohmann::json>> promise);

    std::shared_ptr<spdlog::logger> logger_;

private:
    void arm_timer(Entry& entry);
    void on_timer(const std::string& id, uint64_t seq);
    void handle_timeout(const std::string& id);
    std::optional<Entry> take(const std::string& id);
    void schedule_cleanup();

    boost::asio::io_context& io_;
    Options opts_;
    PendingOperationEvents events_;
    std::unordered_map<std::string, Entry> operations_;
    uint64_t next_seq_{1};
    boost::asio::steady_timer cleanup_timer_;
    bool auto_cleanup_running_{false};
    std::shared_ptr<int> alive_;
};

/// Operations settled through a std::future (caller side of an RPC).
class PromiseOperations : public PendingOperations {
public:
    using PendingOperations::PendingOperations;

    struct Added {
        std::string id;
        std::future<nlohmann::json> future;
    };

    [[nodiscard]] Added add(std::any data = {}, const AddOptions& opts = {});
};

/// Operations that only carry a payload (request tracking, stored context).
class DataOperations : public PendingOperations {
public:
    using PendingOperations::PendingOperations;

    std::string add(std::any data, const AddOptions& opts = {});
};

} // namespace wsrpc
