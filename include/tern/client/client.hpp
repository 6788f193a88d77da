#pragma once

#include <tern/bridge/foreign.hpp>
#include <tern/bridge/marshal.hpp>
#include <tern/bridge/pending_call.hpp>
#include <tern/config/client_config.hpp>
#include <tern/coro/cancel_token.hpp>
#include <tern/coro/task.hpp>
#include <tern/errors/error.hpp>
#include <tern/errors/host_error.hpp>
#include <tern/io/io_context.hpp>
#include <tern/log/logger.hpp>
#include <tern/log/macros.hpp>
#include <tern/observe/metrics.hpp>
#include <tern/observe/tracing.hpp>
#include <tern/pipeline/pipeline.hpp>
#include <tern/pool/connection_pool.hpp>
#include <tern/runtime/scheduler.hpp>
#include <tern/time/timer.hpp>

#include <fmt/format.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

namespace tern::client {

/// Per-call options of the transport entry points
struct call_options {
    /// Cancelled by the host to abandon the call
    coro::cancel_token cancel;
    /// Replaces the total timeout of this call
    std::optional<std::chrono::milliseconds> timeout;
};

/// Owns the runtime, the connection pool and the request pipeline.
///
/// One shared instance per process (try_instance()), created on first use
/// from the environment and torn down at exit. After a fork the child gets
/// a fresh instance; the parent's is never touched again there. Tests and
/// embedders can also create() private instances.
class client : public std::enable_shared_from_this<client> {
    struct private_tag {};

public:
    explicit client(private_tag, config::client_config cfg)
        : config_(std::move(cfg))
        , sched_(config_.worker_threads)
        , marshal_(sched_, bridge::marshal_options{config_.user_agent, config_.prefetch_streams,
                                                   bridge::prefetch_stream::default_capacity}) {
        log::logger::instance().set_level(config_.log_level);
        sched_.start();
        io_.start();
        pool_ = std::make_shared<pool::connection_pool>(io_, pool_config_for(config_));
        pool_->start_reaper(sched_);
        tracer_ = std::make_shared<observe::tracer>();
        metrics_ = std::make_shared<observe::metrics_registry>();
        pipeline_ = std::make_unique<pipeline::request_pipeline>(
            io_, pool_, pipeline::pipeline_options{config_.timeouts, config_.retry}, tracer_, metrics_);
    }

    /// May run on one of this client's own workers when a request task
    /// holds the last reference; the scheduler then detaches that worker.
    ~client() { shutdown(); }

    client(const client&) = delete;
    client& operator=(const client&) = delete;

    /// A standalone client. Fails on invalid settings or when the TLS or
    /// runtime setup fails.
    static errors::result<std::shared_ptr<client>> create(config::client_config cfg) {
        if (auto ok = cfg.validate(); !ok) {
            return std::unexpected(std::move(ok.error()));
        }
        try {
            return std::make_shared<client>(private_tag{}, std::move(cfg));
        } catch (const std::exception& e) {
            TERN_LOG_ERROR("client initialization failed: {}", e.what());
            return std::unexpected(errors::internal_error(std::string("initialization failed: ") + e.what()));
        }
    }

    /// The process-wide client, created on first call.
    static errors::result<std::shared_ptr<client>> try_instance() {
        auto& r = registry();
        pid_t pid = ::getpid();
        if (auto inst = r.instance.load(std::memory_order_acquire);
            inst && r.pid.load(std::memory_order_acquire) == pid) {
            return inst;
        }

        std::lock_guard<std::mutex> lock(r.mutex);
        auto inst = r.instance.load(std::memory_order_acquire);
        if (inst && r.pid.load(std::memory_order_relaxed) == pid) {
            return inst;
        }
        if (inst) {
            // Threads of the parent do not exist in this process; its
            // client can neither be used nor safely destroyed.
            TERN_LOG_WARNING("process forked (pid {} -> {}), creating a new client",
                             r.pid.load(std::memory_order_relaxed), pid);
            r.orphans->push_back(std::move(inst));
            r.instance.store(nullptr, std::memory_order_release);
        }

        auto cfg = config::load_from_env();
        if (!cfg) {
            r.init_error = cfg.error().describe();
            return std::unexpected(std::move(cfg.error()));
        }
        auto made = create(std::move(*cfg));
        if (!made) {
            r.init_error = made.error().describe();
            return std::unexpected(std::move(made.error()));
        }
        r.init_error.clear();
        r.pid.store(pid, std::memory_order_release);
        r.instance.store(*made, std::memory_order_release);
        if (!r.exit_hook) {
            r.exit_hook = true;
            std::atexit(&client::teardown);
        }
        TERN_LOG_INFO("tern client ready ({} workers, pid {})", (*made)->config().worker_threads, pid);
        return *made;
    }

    /// Why the last try_instance() failed, empty if it did not
    static std::string last_init_error() {
        auto& r = registry();
        std::lock_guard<std::mutex> lock(r.mutex);
        return r.init_error;
    }

    /// Shut the shared instance down. Registered with atexit().
    static void teardown() {
        auto& r = registry();
        std::shared_ptr<client> inst;
        {
            std::lock_guard<std::mutex> lock(r.mutex);
            inst = r.instance.exchange(nullptr, std::memory_order_acq_rel);
            if (inst && r.pid.load(std::memory_order_relaxed) != ::getpid()) {
                r.orphans->push_back(std::move(inst));
                return;
            }
        }
        if (inst) {
            inst->shutdown();
        }
    }

    /// Start a request for a foreign caller. Never throws; every failure
    /// arrives through the pending call.
    std::shared_ptr<bridge::pending_call> handle_async(bridge::foreign_request in, call_options opts = {}) {
        auto call = bridge::make_pending_call();
        if (shut_down_.load(std::memory_order_acquire)) {
            call->fail(errors::cancelled_error("client is shut down"));
            return call;
        }
        auto req = marshal_.to_descriptor(std::move(in));
        if (!req) {
            call->fail(req.error());
            return call;
        }
        if (opts.timeout) {
            req->overrides.total_timeout = *opts.timeout;
        }
        auto mode = marshal_.mode_for(req->extensions);
        auto h = run_call(shared_from_this(), std::move(*req), mode, std::move(opts.cancel), call).release();
        if (!sched_.spawn(h)) {
            h.destroy();
            call->fail(errors::cancelled_error("client is shut down"));
        }
        return call;
    }

    /// Blocking variant for synchronous callers. Must not be called from a
    /// scheduler worker.
    std::expected<bridge::foreign_response, errors::host_error>
    handle_request(bridge::foreign_request in, call_options opts = {}) {
        return handle_async(std::move(in), std::move(opts))->wait();
    }

    /// Native entry point: run a typed request through the pipeline
    coro::task<errors::result<http::response>> send(http::request_descriptor req, coro::cancel_token token = {}) {
        return pipeline_->run(std::move(req), std::move(token));
    }

    /// The shared client outlives its users; closing it does nothing.
    void close() noexcept {}

    /// Drain the pool, then stop the reactor and the workers
    void shutdown() {
        if (shut_down_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        pool_->drain();
        io_.stop();
        sched_.shutdown();
        TERN_LOG_INFO("tern client shut down");
    }

    const config::client_config& config() const noexcept { return config_; }
    pool::connection_pool& pool() noexcept { return *pool_; }
    observe::metrics_registry& metrics() noexcept { return *metrics_; }
    observe::tracer& tracer() noexcept { return *tracer_; }
    runtime::scheduler& scheduler() noexcept { return sched_; }
    io::io_context& io() noexcept { return io_; }

private:
    static pool::pool_config pool_config_for(const config::client_config& cfg) {
        pool::pool_config pc;
        pc.max_idle_per_host = cfg.pool_max_idle_per_host;
        pc.idle_timeout = cfg.pool_idle_timeout;
        pc.http2 = cfg.http2;
        pc.http2_prior_knowledge = cfg.http2_prior_knowledge;
        pc.tls.verify_peer = cfg.verify_certificates;
        pc.tls.ca_file = cfg.ca_file;
        return pc;
    }

    static coro::task<void> run_call(std::shared_ptr<client> self, http::request_descriptor req,
                                     bridge::response_mode mode, coro::cancel_token external,
                                     std::shared_ptr<bridge::pending_call> call) {
        auto source = coro::cancel_source::linked(external, call->token());
        auto request_ext = req.extensions;
        auto total = self->pipeline_->total_for(req);
        auto deadline = io::clock::now() + total;
        errors::result<bridge::foreign_response> out;
        try {
            auto resp = co_await self->pipeline_->run(std::move(req), source.get_token());
            if (!resp) {
                out = std::unexpected(std::move(resp.error()));
            } else if (mode == bridge::response_mode::buffered) {
                // the total deadline runs on until the body is drained
                auto attempts = http::ext_int(resp->extensions, http::ext::attempts).value_or(1);
                auto body_source = coro::cancel_source::linked(source.get_token());
                time::deadline_guard guard(self->io_, deadline, body_source);
                out = co_await self->marshal_.to_foreign(std::move(*resp), std::move(request_ext), mode,
                                                         body_source.get_token());
                guard.disarm();
                if (!out && guard.expired() && !source.get_token().is_cancelled()) {
                    out = std::unexpected(body_timeout(std::move(out.error()), total, attempts));
                }
            } else {
                // streamed bodies are bounded per read by the read timeout
                out = co_await self->marshal_.to_foreign(std::move(*resp), std::move(request_ext), mode,
                                                         source.get_token(), self);
            }
        } catch (const std::exception& e) {
            TERN_LOG_ERROR("request task raised: {}", e.what());
            out = std::unexpected(errors::internal_error(e.what()));
        } catch (...) {
            TERN_LOG_ERROR("request task raised a non-standard exception");
            out = std::unexpected(errors::internal_error("unknown exception in request task"));
        }
        if (out) {
            call->complete(std::move(*out));
        } else {
            call->fail(out.error());
        }
    }

    static errors::error body_timeout(errors::error cause, std::chrono::milliseconds total, int64_t attempts) {
        if (cause.kind == errors::error_kind::timeout && cause.phase == errors::timeout_phase::total) {
            return cause;
        }
        auto e = errors::timeout_error(errors::timeout_phase::total,
            fmt::format("no response within {}ms", total.count()));
        e.attempts = static_cast<uint32_t>(attempts);
        e.response_started = true;
        e.context = std::move(cause.context);
        e.with_context(fmt::format("body interrupted: {}", errors::kind_name(cause.kind)));
        return e;
    }

    struct registry_state {
        std::mutex mutex;
        std::atomic<std::shared_ptr<client>> instance;
        std::atomic<pid_t> pid{0};
        std::string init_error;
        bool exit_hook = false;
        /// Clients inherited across fork()
        std::unique_ptr<std::vector<std::shared_ptr<client>>> orphans =
            std::make_unique<std::vector<std::shared_ptr<client>>>();

        ~registry_state() {
            if (auto inst = instance.exchange(nullptr); inst && pid.load() != ::getpid()) {
                orphans->push_back(std::move(inst));
            }
            // Their threads do not exist in this process: leaked, never
            // destroyed.
            if (!orphans->empty()) {
                static_cast<void>(orphans.release());
            }
        }
    };

    // Constructed before teardown() is registered with atexit, so destroyed
    // after it runs.
    static registry_state& registry() {
        static registry_state r;
        return r;
    }

    config::client_config config_;
    runtime::scheduler sched_;
    io::io_context io_;
    std::shared_ptr<pool::connection_pool> pool_;
    std::shared_ptr<observe::tracer> tracer_;
    std::shared_ptr<observe::metrics_registry> metrics_;
    std::unique_ptr<pipeline::request_pipeline> pipeline_;
    bridge::marshal marshal_;
    std::atomic<bool> shut_down_{false};
};

} // namespace tern::client
