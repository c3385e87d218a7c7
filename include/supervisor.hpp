#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "model/pipe_spec.hpp"
#include "util/error.hpp"
#include "worker/forwarding_worker.hpp"

/**
 * @brief Outcome of a worker that stopped.
 */
struct WorkerReport {
    std::string path;
    std::string tag;
    Failure failure;
};

/**
 * @brief Runs one ForwardingWorker thread per configured pipe.
 *
 * A worker that fails is reported and logged; the others keep running.
 * Failed workers are not restarted.
 */
class Supervisor {
public:
    /**
     * @param syslogSocket explicit log socket for every worker, empty for the default endpoints.
     */
    explicit Supervisor(std::string syslogSocket = std::string());

    /** @brief Detaches workers still running; each thread keeps its own worker alive. */
    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    /**
     * @brief Create and resolve one worker per spec; nothing is started yet.
     * @param specs pipes in configuration order.
     * @param failure first configuration failure found.
     * @return true if every spec resolved.
     */
    bool resolveAll(const std::vector<PipeSpec>& specs, Failure& failure);

    /** @brief Start a thread for each resolved worker. */
    void start();

    /**
     * @brief Block until every worker has stopped.
     *
     * With no workers this idles forever, keeping the process resident.
     * @return EXIT_FAILURE once all workers are gone, or at once if start() was never called.
     */
    int wait();

    /** @brief Snapshot of the workers that already stopped, in stop order. */
    std::vector<WorkerReport> finished() const;

    std::size_t workerCount() const { return workers_.size(); }

private:
    struct ReportLog {
        std::mutex mutex;
        std::vector<WorkerReport> reports;
    };

    static void runWorker(const std::shared_ptr<ForwardingWorker>& worker,
                          const std::shared_ptr<ReportLog>& log);

    std::string syslogSocket_;
    std::vector<std::shared_ptr<ForwardingWorker>> workers_;
    std::vector<std::thread> threads_;
    std::shared_ptr<ReportLog> reports_;
};
