#include "wsrpc/pending_operations.hpp"
#include "wsrpc/error.hpp"
#include "wsrpc/log.hpp"
#include <stdexcept>

namespace wsrpc {

const char* to_string(OperationKind kind) noexcept {
    switch (kind) {
        case OperationKind::Promise: return "promise";
        case OperationKind::Data:    return "data";
    }
    return "unknown";
}

PendingOperations::PendingOperations(boost::asio::io_context& io,
                                     Options opts,
                                     PendingOperationEvents events,
                                     std::shared_ptr<spdlog::logger> logger)
    : logger_(log::or_default(std::move(logger), "PendingOperations"))
    , io_(io)
    , opts_(std::move(opts))
    , events_(std::move(events))
    , cleanup_timer_(io)
    , alive_(std::make_shared<int>(0)) {
    if (opts_.default_timeout.count() <= 0) {
        throw std::invalid_argument("default_timeout must be greater than zero");
    }
    if (opts_.enable_auto_cleanup && opts_.cleanup_interval.count() <= 0) {
        throw std::invalid_argument("cleanup_interval must be greater than zero");
    }
    if (!opts_.generate_id) {
        opts_.generate_id = generate_uuid;
    }
    if (opts_.enable_auto_cleanup) {
        start_auto_cleanup();
    }
}

PendingOperations::~PendingOperations() {
    destroy();
    alive_.reset();
}

const std::string& PendingOperations::insert(OperationKind kind, std::any data,
                                             const AddOptions& opts,
                                             std::optional<std::promise<nlohmann::json>> promise) {
    std::string id = opts.custom_id ? *opts.custom_id : opts_.generate_id();
    if (operations_.count(id) > 0) {
        throw DuplicateIdError("Operation with ID '" + id + "' already exists");
    }
    auto timeout = opts.timeout.value_or(opts_.default_timeout);
    if (timeout.count() < 0) {
        throw std::invalid_argument("timeout must not be negative");
    }

    Entry entry;
    entry.op.id = id;
    entry.op.kind = kind;
    entry.op.created_at = std::chrono::steady_clock::now();
    entry.op.timeout = timeout;
    entry.op.data = std::move(data);
    entry.seq = next_seq_++;
    entry.promise = std::move(promise);

    auto [it, inserted] = operations_.emplace(id, std::move(entry));
    (void)inserted;
    arm_timer(it->second);

    logger_->debug("Added {} operation {} (timeout {}ms)", to_string(kind), it->first,
                   timeout.count());
    return it->first;
}

void PendingOperations::arm_timer(Entry& entry) {
    if (entry.op.timeout.count() == 0) return;

    entry.timer = std::make_unique<boost::asio::steady_timer>(io_);
    entry.timer->expires_after(entry.op.timeout);
    std::weak_ptr<int> alive = alive_;
    entry.timer->async_wait([this, alive, id = entry.op.id, seq = entry.seq](
                                const boost::system::error_code& ec) {
        if (ec || alive.expired()) return;
        on_timer(id, seq);
    });
}

void PendingOperations::on_timer(const std::string& id, uint64_t seq) {
    auto it = operations_.find(id);
    // The id may have been settled and reused since the timer was armed.
    if (it == operations_.end() || it->second.seq != seq) return;
    handle_timeout(id);
}

void PendingOperations::handle_timeout(const std::string& id) {
    auto it = operations_.find(id);
    if (it == operations_.end()) return;

    PendingOperation snapshot = it->second.op;
    logger_->warn("Operation {} timed out after {}ms", id, snapshot.timeout.count());
    if (events_.on_timeout) {
        events_.on_timeout(snapshot);
    }
    reject(id, std::make_exception_ptr(TimeoutError(
        "Operation timed out after " + std::to_string(snapshot.timeout.count()) + "ms")));
}

std::optional<PendingOperations::Entry> PendingOperations::take(const std::string& id) {
    auto it = operations_.find(id);
    if (it == operations_.end()) return std::nullopt;

    Entry entry = std::move(it->second);
    operations_.erase(it);
    if (entry.timer) {
        entry.timer->cancel();
        entry.timer.reset();
    }
    return entry;
}

bool PendingOperations::resolve(const std::string& id, nlohmann::json result) {
    auto entry = take(id);
    if (!entry) return false;

    if (entry->promise) {
        entry->promise->set_value(result);
    }
    logger_->debug("Resolved operation {}", id);
    if (events_.on_resolve) {
        events_.on_resolve(entry->op, result);
    }
    return true;
}

bool PendingOperations::reject(const std::string& id, std::exception_ptr reason) {
    auto entry = take(id);
    if (!entry) return false;

    if (!reason) {
        reason = std::make_exception_ptr(Error("Operation rejected"));
    }
    if (entry->promise) {
        entry->promise->set_exception(reason);
    }
    logger_->debug("Rejected operation {}", id);
    if (events_.on_reject) {
        events_.on_reject(entry->op, reason);
    }
    return true;
}

bool PendingOperations::reject(const std::string& id, const std::string& reason) {
    return reject(id, std::make_exception_ptr(Error(reason)));
}

bool PendingOperations::remove(const std::string& id) {
    auto entry = take(id);
    if (!entry) return false;

    logger_->debug("Removed operation {}", id);
    if (events_.on_cleanup) {
        events_.on_cleanup(entry->op);
    }
    return true;
}

std::optional<PendingOperation> PendingOperations::get(const std::string& id) const {
    auto it = operations_.find(id);
    if (it == operations_.end()) return std::nullopt;
    return it->second.op;
}

bool PendingOperations::has(const std::string& id) const {
    return operations_.count(id) > 0;
}

std::size_t PendingOperations::size() const {
    return operations_.size();
}

std::vector<std::string> PendingOperations::ids() const {
    std::vector<std::string> out;
    out.reserve(operations_.size());
    for (const auto& [id, entry] : operations_) {
        out.push_back(id);
    }
    return out;
}

std::vector<std::string> PendingOperations::ids_by_kind(OperationKind kind) const {
    std::vector<std::string> out;
    for (const auto& [id, entry] : operations_) {
        if (entry.op.kind == kind) out.push_back(id);
    }
    return out;
}

std::size_t PendingOperations::clear(const std::string& reason) {
    auto keys = ids();
    for (const auto& id : keys) {
        reject(id, reason);
    }
    return keys.size();
}

std::size_t PendingOperations::cleanup_expired() {
    auto now = std::chrono::steady_clock::now();
    std::vector<std::string> expired;

    for (const auto& [id, entry] : operations_) {
        if (entry.op.timeout.count() > 0 && entry.op.created_at + entry.op.timeout <= now) {
            expired.push_back(id);
        }
    }
    for (const auto& id : expired) {
        handle_timeout(id);
    }
    if (!expired.empty()) {
        logger_->info("Cleaned up {} expired operation(s)", expired.size());
    }
    return expired.size();
}

PendingOperationStats PendingOperations::stats() const {
    using namespace std::chrono;
    auto now = steady_clock::now();
    PendingOperationStats s;
    s.total = operations_.size();

    double total_age_ms = 0.0;
    for (const auto& [id, entry] : operations_) {
        const auto& op = entry.op;
        s.by_kind[to_string(op.kind)]++;
        total_age_ms += duration<double, std::milli>(now - op.created_at).count();

        if (!s.oldest || op.created_at < *s.oldest) {
            s.oldest = op.created_at;
        }
        if (op.timeout.count() > 0) {
            auto time_to_expiry = (op.created_at + op.timeout) - now;
            if (time_to_expiry > steady_clock::duration::zero() &&
                time_to_expiry <= minutes(1)) {
                s.expiring_soon++;
            }
        }
    }
    if (s.total > 0) {
        s.average_age_ms = total_age_ms / static_cast<double>(s.total);
    }
    return s;
}

void PendingOperations::start_auto_cleanup() {
    if (auto_cleanup_running_) return;
    auto_cleanup_running_ = true;
    schedule_cleanup();
}

void PendingOperations::schedule_cleanup() {
    cleanup_timer_.expires_after(opts_.cleanup_interval);
    std::weak_ptr<int> alive = alive_;
    cleanup_timer_.async_wait([this, alive](const boost::system::error_code& ec) {
        if (ec || alive.expired() || !auto_cleanup_running_) return;
        cleanup_expired();
        schedule_cleanup();
    });
}

void PendingOperations::stop_auto_cleanup() {
    if (!auto_cleanup_running_) return;
    auto_cleanup_running_ = false;
    cleanup_timer_.cancel();
}

void PendingOperations::destroy(const std::string& reason) {
    stop_auto_cleanup();
    clear(reason);
}

void PendingOperations::set_event_handlers(PendingOperationEvents events) {
    if (events.on_timeout) events_.on_timeout = std::move(events.on_timeout);
    if (events.on_resolve) events_.on_resolve = std::move(events.on_resolve);
    if (events.on_reject)  events_.on_reject  = std::move(events.on_reject);
    if (events.on_cleanup) events_.on_cleanup = std::move(events.on_cleanup);
}

// ---------- PromiseOperations ----------

PromiseOperations::Added PromiseOperations::add(std::any data, const AddOptions& opts) {
    std::promise<nlohmann::json> promise;
    auto future = promise.get_future();
    const std::string& id = insert(OperationKind::Promise, std::move(data), opts,
                                   std::move(promise));
    return Added{id, std::move(future)};
}

// ---------- DataOperations ----------

std::string DataOperations::add(std::any data, const AddOptions& opts) {
    return insert(OperationKind::Data, std::move(data), opts, std::nullopt);
}

} // namespace wsrpc
