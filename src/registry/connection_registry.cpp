#include "mcpmux/registry/connection_registry.hpp"
#include "mcpmux/log/logger.hpp"

#include <asio/post.hpp>
#include <asio/use_future.hpp>

#include <algorithm>
#include <format>
#include <iterator>
#include <system_error>
#include <thread>
#include <utility>

namespace mcpmux {

namespace {

void clear_capabilities(ServerConfig& config) {
    config.tools.reset();
    config.resources.reset();
    config.prompts.reset();
}

void touch(ServerConfig& config) {
    config.updated_at = ServerConfig::Clock::now();
}

void close_quietly(const std::string& id, const std::shared_ptr<IChannel>& channel) {
    if (!channel) {
        return;
    }
    try {
        channel->close();
    } catch (const std::exception& e) {
        MCPMUX_LOG_WARN(std::format("[{}] Teardown error: {}", id, e.what()));
    }
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Record / StartAttempt
// ─────────────────────────────────────────────────────────────────────────────

ConnectionRegistry::Record::Record(asio::thread_pool& pool, std::uint64_t seq)
    : strand(asio::make_strand(pool))
    , sequence(seq)
{}

void ConnectionRegistry::Record::publish() {
    auto next = std::make_shared<const ServerConfig>(config);
    std::shared_ptr<ProtocolClient> client;
    if (config.status == ServerStatus::Active && connection) {
        client = connection->client;
    }

    std::lock_guard lock(published_mutex);
    snapshot = std::move(next);
    live_client = std::move(client);
}

std::shared_ptr<IChannel> ConnectionRegistry::StartAttempt::cancel() {
    std::lock_guard lock(mutex);
    cancelled = true;
    if (channel) {
        channel->cancel();
    }
    return channel;
}

// Posts `fn` to the record's strand and blocks until it has run
template <typename Fn>
auto ConnectionRegistry::run_on_strand(const RecordPtr& record, Fn&& fn) {
    return asio::post(record->strand, asio::use_future(std::forward<Fn>(fn))).get();
}

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

ConnectionRegistry::ConnectionRegistry(HubConfig config,
                                       HostProfile host,
                                       std::shared_ptr<ITransportAdapter> adapter)
    : config_(std::move(config))
    , host_(std::move(host))
    , adapter_(std::move(adapter))
    , pool_(std::max<std::size_t>(config_.worker_threads, 1))
{}

ConnectionRegistry::~ConnectionRegistry() {
    std::vector<std::pair<std::string, RecordPtr>> records;
    {
        std::lock_guard lock(records_mutex_);
        for (const auto& [id, record] : records_) {
            records.emplace_back(id, record);
        }
    }

    for (const auto& [id, record] : records) {
        std::shared_ptr<IChannel> teardown;
        auto stopped = run_on_strand(record, [this, record = record, &teardown] {
            return stop_on_strand(record, teardown);
        });
        if (!stopped) {
            MCPMUX_LOG_WARN(std::format("Shutdown: {}", stopped.error().describe()));
        }
        close_quietly(id, teardown);
    }

    // Pending attempts were cancelled above and unwind promptly
    join_workers(false);

    // Runs the completions the last workers posted; those may hand off more teardowns
    pool_.join();
    join_workers(false);
}

// ─────────────────────────────────────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────────────────────────────────────

ConnectionRegistry::RecordPtr ConnectionRegistry::find(const std::string& id) const {
    std::lock_guard lock(records_mutex_);
    const auto it = records_.find(id);
    return it == records_.end() ? nullptr : it->second;
}

// Must be called with records_mutex_ held
std::string ConnectionRegistry::unique_id(const std::string& requested) const {
    if (!requested.empty() && records_.count(requested) == 0) {
        return requested;
    }
    const std::string base = requested.empty() ? std::string("server") : requested;
    for (std::uint64_t n = records_.size() + 1;; ++n) {
        auto candidate = std::format("{}-{}", base, n);
        if (records_.count(candidate) == 0) {
            return candidate;
        }
    }
}

void ConnectionRegistry::spawn_worker(std::function<void()> body) {
    join_workers(true);

    auto finished = std::make_shared<std::atomic<bool>>(false);
    std::thread thread([body = std::move(body), finished] {
        body();
        finished->store(true);
    });

    std::lock_guard lock(workers_mutex_);
    workers_.push_back(Worker{std::move(thread), std::move(finished)});
}

void ConnectionRegistry::join_workers(bool finished_only) {
    std::vector<Worker> joinable;
    {
        std::lock_guard lock(workers_mutex_);
        const auto first_done = std::partition(workers_.begin(), workers_.end(), [&](const Worker& worker) {
            return finished_only && !worker.finished->load();
        });
        joinable.assign(std::make_move_iterator(first_done), std::make_move_iterator(workers_.end()));
        workers_.erase(first_done, workers_.end());
    }
    for (auto& worker : joinable) {
        worker.thread.join();
    }
}

void ConnectionRegistry::close_later(const std::string& id, std::shared_ptr<IChannel> channel) {
    try {
        spawn_worker([id, channel] { close_quietly(id, channel); });
    } catch (const std::system_error& e) {
        MCPMUX_LOG_WARN(std::format("[{}] No worker for teardown ({}), closing inline", id, e.what()));
        close_quietly(id, channel);
    }
}

void ConnectionRegistry::resolve_waiters(const RecordPtr& record, const Result<StartResult>& outcome) {
    for (auto& waiter : record->waiters) {
        waiter.set_value(outcome);
    }
    record->waiters.clear();
}

// ─────────────────────────────────────────────────────────────────────────────
// Add / Query
// ─────────────────────────────────────────────────────────────────────────────

ServerConfig ConnectionRegistry::add(ServerConfig config) {
    const auto now = ServerConfig::Clock::now();
    config.status = ServerStatus::Inactive;
    clear_capabilities(config);
    config.server_info.reset();
    config.last_error.reset();
    config.resolved_command.clear();
    config.restart_required = false;
    config.created_at = now;
    config.updated_at = now;

    RecordPtr record;
    {
        std::lock_guard lock(records_mutex_);
        const auto requested = config.id;
        config.id = unique_id(requested);
        if (config.id != requested && !requested.empty()) {
            MCPMUX_LOG_WARN(std::format("Server id '{}' already in use, stored as '{}'", requested, config.id));
        }
        record = std::make_shared<Record>(pool_, next_sequence_++);
        record->config = config;
        record->publish();
        records_.emplace(config.id, record);
    }

    MCPMUX_LOG_INFO(std::format("[{}] Added {} server '{}'",
                                config.id, to_string(config.transport), config.display_name()));
    return config;
}

Result<ServerConfig> ConnectionRegistry::get(const std::string& id) const {
    const auto record = find(id);
    if (!record) {
        return tl::unexpected(Error::not_found(id));
    }
    std::lock_guard lock(record->published_mutex);
    return *record->snapshot;
}

std::vector<ServerConfig> ConnectionRegistry::list() const {
    std::vector<RecordPtr> records;
    {
        std::lock_guard lock(records_mutex_);
        records.reserve(records_.size());
        for (const auto& [id, record] : records_) {
            records.push_back(record);
        }
    }
    std::sort(records.begin(), records.end(),
              [](const RecordPtr& a, const RecordPtr& b) { return a->sequence < b->sequence; });

    std::vector<ServerConfig> out;
    out.reserve(records.size());
    for (const auto& record : records) {
        std::lock_guard lock(record->published_mutex);
        out.push_back(*record->snapshot);
    }
    return out;
}

Result<std::shared_ptr<ProtocolClient>> ConnectionRegistry::client_for(const std::string& id) const {
    const auto record = find(id);
    if (!record) {
        return tl::unexpected(Error::not_found(id));
    }
    std::lock_guard lock(record->published_mutex);
    if (!record->live_client) {
        return tl::unexpected(Error::not_connected(id));
    }
    return record->live_client;
}

// ─────────────────────────────────────────────────────────────────────────────
// Start
// ─────────────────────────────────────────────────────────────────────────────

Result<StartResult> ConnectionRegistry::start(const std::string& id) {
    const auto record = find(id);
    if (!record) {
        return tl::unexpected(Error::not_found(id));
    }
    auto outcome = run_on_strand(record, [this, record] { return begin_start(record); });
    return outcome.get();
}

std::future<Result<StartResult>> ConnectionRegistry::begin_start(const RecordPtr& record) {
    std::promise<Result<StartResult>> promise;
    auto future = promise.get_future();
    auto& config = record->config;

    if (record->deleted) {
        promise.set_value(Result<StartResult>(tl::unexpected(Error::not_found(config.id))));
        return future;
    }

    switch (config.status) {
        case ServerStatus::Active:
            // Idempotent: no new discovery
            promise.set_value(Result<StartResult>(StartResult::from_config(config)));
            return future;
        case ServerStatus::Starting:
            record->waiters.push_back(std::move(promise));
            return future;
        case ServerStatus::Stopping:
            // Not observable from another strand job; stop completes in one job
            promise.set_value(Result<StartResult>(tl::unexpected(Error::precondition_failed(
                std::format("Server '{}' is stopping", config.id)))));
            return future;
        case ServerStatus::Inactive:
        case ServerStatus::Error:
            break;
    }

    auto launched = launch_attempt(record);
    if (!launched) {
        promise.set_value(Result<StartResult>(tl::unexpected(launched.error())));
        return future;
    }
    record->waiters.push_back(std::move(promise));
    return future;
}

Result<void> ConnectionRegistry::launch_attempt(const RecordPtr& record) {
    auto& config = record->config;
    auto attempt = std::make_shared<StartAttempt>();

    record->pending = attempt;
    config.status = ServerStatus::Starting;
    config.last_error.reset();
    config.restart_required = false;
    clear_capabilities(config);
    touch(config);
    record->publish();

    MCPMUX_LOG_INFO(std::format("[{}] Starting", config.id));

    try {
        spawn_worker([this, record, attempt, config] { run_start_attempt(record, attempt, config); });
    } catch (const std::system_error& e) {
        Error error = Error::connection_fault(std::string("Failed to start worker thread: ") + e.what());
        record->pending.reset();
        config.status = ServerStatus::Error;
        config.last_error = error;
        touch(config);
        record->publish();
        MCPMUX_LOG_ERROR(std::format("[{}] {}", config.id, error.describe()));
        return tl::unexpected(std::move(error));
    }
    return {};
}

void ConnectionRegistry::run_start_attempt(RecordPtr record,
                                           std::shared_ptr<StartAttempt> attempt,
                                           ServerConfig config) {
    Result<Established> outcome = [&]() -> Result<Established> {
        try {
            return establish(config, *attempt);
        } catch (const std::exception& e) {
            return tl::unexpected(Error::connection_fault(std::string("Start failed: ") + e.what()));
        }
    }();

    asio::post(record->strand,
               [this, record, attempt, outcome = std::move(outcome)]() mutable {
                   finish_start(record, attempt, std::move(outcome));
               });
}

Result<ConnectionRegistry::Established> ConnectionRegistry::establish(const ServerConfig& config,
                                                                      StartAttempt& attempt) {
    auto opened = adapter_->open(config, host_);
    if (!opened) {
        return tl::unexpected(opened.error());
    }

    {
        std::lock_guard lock(attempt.mutex);
        if (attempt.cancelled) {
            opened->channel->close();
            return tl::unexpected(Error::cancelled(std::format("Start of '{}' was cancelled", config.id)));
        }
        attempt.channel = opened->channel;
    }

    auto client = std::make_shared<ProtocolClient>(opened->channel, config.id, config_.client_info);
    auto capabilities = client->handshake(config_.handshake_timeout);
    if (!capabilities) {
        close_quietly(config.id, opened->channel);
        return tl::unexpected(capabilities.error());
    }

    return Established{std::move(*opened), std::move(client), std::move(*capabilities)};
}

void ConnectionRegistry::finish_start(const RecordPtr& record,
                                      const std::shared_ptr<StartAttempt>& attempt,
                                      Result<Established> outcome) {
    if (record->pending != attempt) {
        // Superseded by a stop; that stop already settled the status
        if (outcome) {
            close_later(record->config.id, outcome->opened.channel);
        }
        return;
    }
    record->pending.reset();

    auto& config = record->config;
    touch(config);

    if (!outcome) {
        if (attempt->channel) {
            close_later(config.id, attempt->channel);
        }
        config.status = ServerStatus::Error;
        config.last_error = outcome.error();
        clear_capabilities(config);
        record->connection.reset();
        record->publish();

        MCPMUX_LOG_ERROR(std::format("[{}] Start failed: {}", config.id, outcome.error().describe()));
        resolve_waiters(record, tl::unexpected(outcome.error()));
        return;
    }

    auto& established = *outcome;
    config.status = ServerStatus::Active;
    config.last_error.reset();
    config.tools = std::move(established.capabilities.tools);
    config.resources = std::move(established.capabilities.resources);
    config.prompts = std::move(established.capabilities.prompts);
    config.server_info = std::move(established.capabilities.server_info);
    config.resolved_command = established.opened.resolved_command;
    record->connection = std::make_shared<Connection>(
        Connection{established.opened.channel, established.client});
    record->publish();

    MCPMUX_LOG_INFO(std::format("[{}] Active ({} tools, {} resources, {} prompts)",
                                config.id, config.tools->size(), config.resources->size(),
                                config.prompts->size()));
    resolve_waiters(record, StartResult::from_config(config));
}

// ─────────────────────────────────────────────────────────────────────────────
// Stop
// ─────────────────────────────────────────────────────────────────────────────

Result<StopResult> ConnectionRegistry::stop(const std::string& id) {
    const auto record = find(id);
    if (!record) {
        return tl::unexpected(Error::not_found(id));
    }

    std::shared_ptr<IChannel> teardown;
    auto stopped = run_on_strand(record, [this, record, &teardown] { return stop_on_strand(record, teardown); });

    // SIGTERM, grace period and reaping block this caller, never a pool thread
    close_quietly(id, teardown);
    return stopped;
}

Result<StopResult> ConnectionRegistry::stop_on_strand(const RecordPtr& record,
                                                      std::shared_ptr<IChannel>& teardown) {
    auto& config = record->config;
    if (record->deleted) {
        return tl::unexpected(Error::not_found(config.id));
    }

    switch (config.status) {
        case ServerStatus::Inactive:
            return StopResult{ServerStatus::Inactive};
        case ServerStatus::Error:
            config.status = ServerStatus::Inactive;
            config.last_error.reset();
            touch(config);
            record->publish();
            MCPMUX_LOG_INFO(std::format("[{}] Cleared error state", config.id));
            return StopResult{ServerStatus::Inactive};
        case ServerStatus::Starting:
        case ServerStatus::Active:
        case ServerStatus::Stopping:
            break;
    }

    const bool was_starting = (config.status == ServerStatus::Starting);
    config.status = ServerStatus::Stopping;
    touch(config);
    record->publish();

    std::shared_ptr<IChannel> channel;
    if (record->pending) {
        channel = record->pending->cancel();
        record->pending.reset();
    }
    if (record->connection) {
        channel = record->connection->channel;
        record->connection.reset();
    }

    if (channel) {
        // In-flight calls fail with Cancelled right away
        channel->cancel();
        teardown = std::move(channel);
    }

    config.status = ServerStatus::Inactive;
    config.restart_required = false;
    config.server_info.reset();
    clear_capabilities(config);
    touch(config);
    record->publish();

    MCPMUX_LOG_INFO(std::format("[{}] Stopped", config.id));

    if (was_starting) {
        resolve_waiters(record, tl::unexpected(Error::cancelled(
            std::format("Server '{}' was stopped while starting", config.id))));
    }
    return StopResult{ServerStatus::Inactive};
}

// ─────────────────────────────────────────────────────────────────────────────
// Delete / Update
// ─────────────────────────────────────────────────────────────────────────────

Result<DeleteResult> ConnectionRegistry::remove(const std::string& id) {
    const auto record = find(id);
    if (!record) {
        return tl::unexpected(Error::not_found(id));
    }

    return run_on_strand(record, [this, record, &id]() -> Result<DeleteResult> {
        if (record->deleted) {
            return tl::unexpected(Error::not_found(id));
        }
        if (record->config.status != ServerStatus::Inactive) {
            return tl::unexpected(Error::precondition_failed(std::format(
                "Server '{}' is {}; stop it before deleting", id, to_string(record->config.status))));
        }

        record->deleted = true;
        {
            std::lock_guard lock(records_mutex_);
            records_.erase(id);
        }
        MCPMUX_LOG_INFO(std::format("[{}] Deleted", id));
        return DeleteResult{true};
    });
}

Result<ServerConfig> ConnectionRegistry::update(const std::string& id, const ServerUpdate& update) {
    const auto record = find(id);
    if (!record) {
        return tl::unexpected(Error::not_found(id));
    }

    return run_on_strand(record, [record, &id, &update]() -> Result<ServerConfig> {
        if (record->deleted) {
            return tl::unexpected(Error::not_found(id));
        }

        auto& config = record->config;
        const bool live = (config.status == ServerStatus::Starting || config.status == ServerStatus::Active);
        if (live && update.changes_connection(config)) {
            config.restart_required = true;
            MCPMUX_LOG_INFO(std::format("[{}] Connection settings changed; restart required", id));
        }

        update.apply_to(config);
        touch(config);
        record->publish();
        return config;
    });
}

}  // namespace mcpmux
