// === Manager =================================================================
//
// Registration shim and worker pool. Controllers are registered once; start()
// subscribes to object changes, feeds the work queue, runs the workers and a
// periodic resync, and blocks until the stop token fires.

#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/logger.h>

#include "kit_operator/dispatcher.hpp"
#include "kit_operator/object_store.hpp"
#include "kit_operator/reconciler.hpp"
#include "kit_operator/work_queue.hpp"

namespace kit_operator {

/**
 * @brief Tunables for the reconcile engine, populated from Configuration.
 */
struct ManagerConfig final {
    std::size_t worker_count{4};
    Duration wait_requeue_delay{Duration{5.0}};
    BackoffConfig backoff{};
    Duration resync_period{Duration{300.0}};
    Duration reconcile_timeout{Duration{30.0}};
};

/** @brief Something that runs until told to stop. */
class Runnable {
  public:
    virtual ~Runnable() = default;

    /** @brief Block until @p stop_token is signalled; throws on startup failure. */
    virtual void start(std::stop_token stop_token) = 0;
};

class Manager final : public Runnable {
  public:
    Manager(ManagerConfig config, ObjectClient& client, std::shared_ptr<spdlog::logger> logger);
    ~Manager() override;

    Manager(const Manager&) = delete;
    Manager& operator=(const Manager&) = delete;

    /** @brief Register one controller per kind; throws on a duplicate kind. */
    Runnable& register_controllers(ReconcilerList controllers);

    void start(std::stop_token stop_token) override;

    /** @brief Number of reconcile passes completed since start. */
    [[nodiscard]] std::size_t reconcile_count() const noexcept;

  private:
    void worker_loop(std::size_t worker_index, std::stop_token stop_token);
    void process(const ObjectKey& key, std::stop_token stop_token);
    void enqueue_all();
    void join_workers();

    ManagerConfig config_;
    ObjectClient& client_;
    std::shared_ptr<spdlog::logger> logger_;
    ControllerRegistry registry_;
    Dispatcher dispatcher_;
    WorkQueue work_queue_;
    ExponentialBackoff backoff_;
    std::vector<std::thread> list_workers_;
    std::optional<SubscriptionId> subscription_id_{};
    std::atomic<bool> flag_started_{false};
    std::atomic<std::size_t> reconcile_count_{0};
};

}  // namespace kit_operator
