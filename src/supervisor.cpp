#include "supervisor.hpp"

#include "util/error.hpp"

#include <cstdlib>
#include <string>
#include <unistd.h>
#include <utility>

Supervisor::Supervisor(std::string syslogSocket)
    : syslogSocket_(std::move(syslogSocket)), reports_(std::make_shared<ReportLog>()) {}

Supervisor::~Supervisor() {
    // Workers have no cancellation point; process exit reclaims them.
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.detach();
        }
    }
}

bool Supervisor::resolveAll(const std::vector<PipeSpec>& specs, Failure& failure) {
    workers_.clear();
    workers_.reserve(specs.size());
    for (const auto& spec : specs) {
        auto worker = std::make_shared<ForwardingWorker>(spec, syslogSocket_);
        if (!worker->resolve(failure)) {
            workers_.clear();
            return false;
        }
        workers_.push_back(std::move(worker));
    }
    return true;
}

void Supervisor::runWorker(const std::shared_ptr<ForwardingWorker>& worker,
                           const std::shared_ptr<ReportLog>& log) {
    Failure failure = worker->run();
    logError("worker stopped (" + std::string(errorKindName(failure.kind)) + ", "
             + std::to_string(worker->forwardedCount()) + " records forwarded): " + failure.message);

    WorkerReport report;
    report.path = worker->spec().path;
    report.tag = worker->spec().tag;
    report.failure = std::move(failure);
    std::lock_guard<std::mutex> lock(log->mutex);
    log->reports.push_back(std::move(report));
}

void Supervisor::start() {
    threads_.reserve(workers_.size());
    for (const auto& worker : workers_) {
        std::shared_ptr<ReportLog> log = reports_;
        threads_.emplace_back([worker, log]() { runWorker(worker, log); });
    }
}

int Supervisor::wait() {
    if (workers_.empty()) {
        // Nothing to forward, but callers expect the process to stay up.
        while (true) {
            ::pause();
        }
    }
    if (threads_.empty()) {
        logError("workers were never started");
        return EXIT_FAILURE;
    }
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    logError("all workers stopped");
    return EXIT_FAILURE;
}

std::vector<WorkerReport> Supervisor::finished() const {
    std::lock_guard<std::mutex> lock(reports_->mutex);
    return reports_->reports;
}
