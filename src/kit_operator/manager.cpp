#include "kit_operator/manager.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "kit_operator/logging.hpp"

namespace kit_operator {

namespace {

SteadyClock::duration to_steady(Duration duration) {
    return std::chrono::duration_cast<SteadyClock::duration>(duration);
}

}  // namespace

Manager::Manager(ManagerConfig config, ObjectClient& client, std::shared_ptr<spdlog::logger> logger)
    : config_(config),
      client_(client),
      logger_(std::move(logger)),
      dispatcher_(client_, registry_, config_.wait_requeue_delay),
      backoff_(config_.backoff) {
    if (!logger_) {
        throw std::invalid_argument("Manager requires a logger");
    }
    if (config_.worker_count == 0) {
        throw std::invalid_argument("Manager requires at least one worker");
    }
}

Manager::~Manager() {
    if (subscription_id_.has_value()) {
        client_.unsubscribe(subscription_id_.value());
    }
    work_queue_.shutdown();
    join_workers();
}

Runnable& Manager::register_controllers(ReconcilerList controllers) {
    if (flag_started_.load()) {
        throw std::logic_error("Controllers must be registered before start");
    }
    for (ReconcilerPtr& controller : controllers) {
        logger_->info("Registering controller {} for {}", controller->name(), to_string(controller->kind()));
        registry_.add(std::move(controller));
    }
    return *this;
}

void Manager::start(std::stop_token stop_token) {
    if (flag_started_.exchange(true)) {
        throw std::logic_error("Manager already started");
    }
    if (registry_.size() == 0) {
        throw std::logic_error("Manager started without controllers");
    }

    logger_->info("Starting manager with {} workers and {} controllers", config_.worker_count, registry_.size());
    subscription_id_ = client_.subscribe([this](const ObjectKey& key) {
        work_queue_.add(key);
    });
    enqueue_all();

    for (std::size_t index = 0; index < config_.worker_count; ++index) {
        list_workers_.emplace_back(&Manager::worker_loop, this, index, stop_token);
    }

    std::mutex wait_mutex;
    std::condition_variable_any wait_condition;
    auto next_resync = SteadyClock::now() + to_steady(config_.resync_period);
    while (!stop_token.stop_requested()) {
        std::unique_lock lock(wait_mutex);
        static_cast<void>(wait_condition.wait_until(lock, stop_token, next_resync, [] { return false; }));
        if (stop_token.stop_requested()) {
            break;
        }
        if (SteadyClock::now() >= next_resync) {
            logger_->debug("Periodic resync");
            enqueue_all();
            next_resync = SteadyClock::now() + to_steady(config_.resync_period);
        }
    }

    logger_->info("Stopping manager");
    client_.unsubscribe(subscription_id_.value());
    subscription_id_.reset();
    work_queue_.shutdown();
    join_workers();
    logger_->info("Manager stopped after {} reconciles", reconcile_count_.load());
}

std::size_t Manager::reconcile_count() const noexcept {
    return reconcile_count_.load();
}

void Manager::worker_loop(std::size_t worker_index, std::stop_token stop_token) {
    logger_->debug("Worker {} started", worker_index);
    while (true) {
        std::optional<ObjectKey> key = work_queue_.get();
        if (!key.has_value()) {
            break;
        }
        process(key.value(), stop_token);
        work_queue_.done(key.value());
    }
    logger_->debug("Worker {} exiting", worker_index);
}

void Manager::process(const ObjectKey& key, std::stop_token stop_token) {
    const std::size_t sequence = ++reconcile_count_;
    const Reconciler* reconciler = registry_.find(key.kind);
    const std::string scope = fmt::format(
        "{}/{}/{}#{}",
        reconciler == nullptr ? std::string{to_string(key.kind)} : reconciler->name(),
        key.namespace_name,
        key.name,
        sequence
    );
    const ReconcileContext ctx{
        make_scoped_logger(logger_, scope),
        std::move(stop_token),
        SteadyClock::now() + to_steady(config_.reconcile_timeout)
    };

    const DispatchOutcome outcome = dispatcher_.dispatch(ctx, key);
    switch (outcome.action) {
        case DispatchOutcome::Action::Forget:
            backoff_.forget(key);
            break;
        case DispatchOutcome::Action::RequeueAfter:
            backoff_.forget(key);
            work_queue_.add_after(key, outcome.delay);
            break;
        case DispatchOutcome::Action::Backoff: {
            const Duration delay = backoff_.when(key);
            ctx.logger().debug("Retrying in {:.3f}s", delay.count());
            work_queue_.add_after(key, delay);
            break;
        }
    }
}

void Manager::enqueue_all() {
    for (const Object& object : client_.list()) {
        work_queue_.add(object.key());
    }
}

void Manager::join_workers() {
    for (std::thread& worker : list_workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    list_workers_.clear();
}

}  // namespace kit_operator
