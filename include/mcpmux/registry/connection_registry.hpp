#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Connection Registry
// ═══════════════════════════════════════════════════════════════════════════
// Owns every ServerConfig and its live connection.
//
// Every lifecycle mutation of a record runs on that record's strand, so
// interleaved start/stop/update/delete calls for one server are serialized
// while different servers never wait on each other. The blocking part of a
// start (spawn + handshake) runs on its own worker thread and reports back
// onto the strand; a stop can therefore run while the handshake is still in
// flight and cancel it. Process teardown never runs on a strand: stop()
// closes the channel on the calling thread once the record is inactive, and
// late teardowns go to a worker thread.
//
// Readers never touch strand-confined state: each record publishes an
// immutable snapshot plus, while active, its protocol client.

#include "mcpmux/client/protocol_client.hpp"
#include "mcpmux/config/hub_config.hpp"
#include "mcpmux/error.hpp"
#include "mcpmux/host/host_profile.hpp"
#include "mcpmux/registry/server_config.hpp"
#include "mcpmux/transport/transport_adapter.hpp"

#include <asio/strand.hpp>
#include <asio/thread_pool.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace mcpmux {

class ConnectionRegistry {
public:
    ConnectionRegistry(HubConfig config, HostProfile host, std::shared_ptr<ITransportAdapter> adapter);

    /// Stops every server and joins every worker thread
    ~ConnectionRegistry();

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /// Store `config` as inactive. An empty or taken id is replaced by a fresh one.
    [[nodiscard]] ServerConfig add(ServerConfig config);

    [[nodiscard]] Result<StartResult> start(const std::string& id);
    [[nodiscard]] Result<StopResult> stop(const std::string& id);
    [[nodiscard]] Result<DeleteResult> remove(const std::string& id);
    [[nodiscard]] Result<ServerConfig> update(const std::string& id, const ServerUpdate& update);

    // ─────────────────────────────────────────────────────────────────────────
    // Queries (snapshot reads, never block on lifecycle work)
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] Result<ServerConfig> get(const std::string& id) const;

    /// All servers in insertion order
    [[nodiscard]] std::vector<ServerConfig> list() const;

    /// Client of an active server. NotFound / NotConnected otherwise.
    [[nodiscard]] Result<std::shared_ptr<ProtocolClient>> client_for(const std::string& id) const;

    [[nodiscard]] const HubConfig& config() const noexcept { return config_; }
    [[nodiscard]] const HostProfile& host() const noexcept { return host_; }

private:
    using Strand = asio::strand<asio::thread_pool::executor_type>;

    struct Connection {
        std::shared_ptr<IChannel> channel;
        std::shared_ptr<ProtocolClient> client;
    };

    /// One open + handshake run. stop() cancels it through here.
    struct StartAttempt {
        std::mutex mutex;
        bool cancelled{false};
        std::shared_ptr<IChannel> channel;

        /// Mark cancelled; returns the channel (if already opened) for teardown
        std::shared_ptr<IChannel> cancel();
    };

    /// Successful outcome of a start attempt
    struct Established {
        OpenedChannel opened;
        std::shared_ptr<ProtocolClient> client;
        Capabilities capabilities;
    };

    struct Record {
        Record(asio::thread_pool& pool, std::uint64_t sequence);

        Strand strand;
        const std::uint64_t sequence;

        // ── Strand-confined ──
        ServerConfig config;
        std::shared_ptr<Connection> connection;
        std::shared_ptr<StartAttempt> pending;
        std::vector<std::promise<Result<StartResult>>> waiters;
        bool deleted{false};

        // ── Published ──
        mutable std::mutex published_mutex;
        std::shared_ptr<const ServerConfig> snapshot;
        std::shared_ptr<ProtocolClient> live_client;

        /// Copy the strand-confined state into the published fields
        void publish();
    };

    using RecordPtr = std::shared_ptr<Record>;

    [[nodiscard]] RecordPtr find(const std::string& id) const;
    [[nodiscard]] std::string unique_id(const std::string& requested) const;

    template <typename Fn>
    auto run_on_strand(const RecordPtr& record, Fn&& fn);

    // Strand jobs
    [[nodiscard]] std::future<Result<StartResult>> begin_start(const RecordPtr& record);
    [[nodiscard]] Result<void> launch_attempt(const RecordPtr& record);
    void finish_start(const RecordPtr& record,
                      const std::shared_ptr<StartAttempt>& attempt,
                      Result<Established> outcome);
    /// Settles the record as inactive; the channel to close is handed back in `teardown`
    [[nodiscard]] Result<StopResult> stop_on_strand(const RecordPtr& record,
                                                    std::shared_ptr<IChannel>& teardown);
    void resolve_waiters(const RecordPtr& record, const Result<StartResult>& outcome);

    // Worker threads
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    /// Run `body` on a registry-owned thread. Throws std::system_error.
    void spawn_worker(std::function<void()> body);
    void join_workers(bool finished_only);
    void close_later(const std::string& id, std::shared_ptr<IChannel> channel);


    void run_start_attempt(RecordPtr record, std::shared_ptr<StartAttempt> attempt, ServerConfig config);
    [[nodiscard]] Result<Established> establish(const ServerConfig& config, StartAttempt& attempt);

    HubConfig config_;
    HostProfile host_;
    std::shared_ptr<ITransportAdapter> adapter_;

    asio::thread_pool pool_;

    // Guards only the id -> record map
    mutable std::mutex records_mutex_;
    std::map<std::string, RecordPtr> records_;
    std::uint64_t next_sequence_{0};

    // Start attempts and deferred teardowns; finished ones are joined on the next spawn
    std::mutex workers_mutex_;
    std::vector<Worker> workers_;
};

}  // namespace mcpmux
