#include "supervisor.hpp"

#include "ipc/fifo.hpp"
#include "test_support.hpp"

#include <cassert>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <signal.h>
#include <string>
#include <sys/stat.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

using testsupport::SinkSocket;
using testsupport::TempDir;
using testsupport::endsWith;
using testsupport::writeToFifo;

namespace {

PipeSpec makeSpec(const std::string& path, const std::string& facility,
                  const std::string& severity, const std::string& tag) {
    PipeSpec spec;
    spec.path = path;
    spec.facility = facility;
    spec.severity = severity;
    spec.tag = tag;
    return spec;
}

std::vector<WorkerReport> waitForReports(const Supervisor& supervisor, size_t count) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    std::vector<WorkerReport> reports = supervisor.finished();
    while (reports.size() < count && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        reports = supervisor.finished();
    }
    return reports;
}

void testConfigurationErrorStartsNothing() {
    TempDir dir;
    assert(dir.ok());
    std::vector<PipeSpec> specs = {
        makeSpec(dir.file("good"), "local6", "info", "app"),
        makeSpec(dir.file("bad"), "local6", "verbose", "app"),
    };

    Supervisor supervisor(dir.file("log.sock"));
    Failure failure;
    assert(!supervisor.resolveAll(specs, failure));
    assert(failure.kind == ErrorKind::Configuration);
    assert(failure.message == "Configuration error: " + dir.file("bad") + " has unknown severity (verbose)");
    assert(supervisor.workerCount() == 0);

    struct stat st {};
    assert(::stat(dir.file("good").c_str(), &st) == -1 && "validation happens before any FIFO exists");

    PipeSpec pathless = makeSpec("", "local6", "info", "app");
    std::vector<PipeSpec> withPathless = {makeSpec(dir.file("good"), "local6", "info", "app"), pathless};
    assert(!supervisor.resolveAll(withPathless, failure));
    assert(failure.kind == ErrorKind::Configuration);
    assert(failure.message == "Configuration error: pipe has no path set");
    assert(supervisor.workerCount() == 0);
    assert(::stat(dir.file("good").c_str(), &st) == -1);
}

void testEmptyPipeListStaysResident() {
    // Runs before any test starts a thread, so the child is a clean fork.
    pid_t pid = ::fork();
    assert(pid >= 0);
    if (pid == 0) {
        Supervisor supervisor;
        Failure failure;
        if (!supervisor.resolveAll({}, failure)) {
            ::_exit(2);
        }
        supervisor.start();
        ::_exit(supervisor.wait());
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    int status = 0;
    assert(::waitpid(pid, &status, WNOHANG) == 0 && "no pipes configured must not exit");

    assert(::kill(pid, SIGKILL) == 0);
    assert(::waitpid(pid, &status, 0) == pid);
    assert(WIFSIGNALED(status) && WTERMSIG(status) == SIGKILL);
}

void testWaitWithoutStartFails() {
    TempDir dir;
    Supervisor supervisor(dir.file("log.sock"));
    Failure failure;
    assert(supervisor.resolveAll({makeSpec(dir.file("access_log"), "local6", "info", "nginx")}, failure));
    assert(supervisor.workerCount() == 1);
    assert(supervisor.wait() == EXIT_FAILURE);
    assert(supervisor.finished().empty());
}

void testAllWorkersFailed() {
    TempDir dir;
    {
        std::ofstream out(dir.file("plain"));
        out << "x";
    }
    // No log socket is listening, so every worker stops right after starting.
    std::vector<PipeSpec> specs = {
        makeSpec(dir.file("plain"), "user", "notice", "one"),
        makeSpec(dir.file("other"), "user", "notice", "two"),
    };
    Supervisor supervisor(dir.file("missing.sock"));
    Failure failure;
    assert(supervisor.resolveAll(specs, failure));
    assert(supervisor.workerCount() == 2);
    supervisor.start();
    assert(supervisor.wait() == EXIT_FAILURE);

    std::vector<WorkerReport> reports = supervisor.finished();
    assert(reports.size() == 2);
    for (const auto& report : reports) {
        assert(report.failure.kind == ErrorKind::Io);
    }
}

void testFailingWorkerIsIsolated() {
    TempDir dir;
    SinkSocket sink(dir.file("log.sock"));
    assert(sink.ok());

    const std::string conflicting = dir.file("not_a_fifo");
    {
        std::ofstream out(conflicting);
        out << "keep\n";
    }
    const std::string healthy = dir.file("access_log");
    Failure failure;
    assert(Fifo::ensureNode(healthy, failure));

    std::vector<PipeSpec> specs = {
        makeSpec(conflicting, "local6", "err", "broken"),
        makeSpec(healthy, "local6", "info", "nginx"),
    };

    Supervisor supervisor(dir.file("log.sock"));
    assert(supervisor.resolveAll(specs, failure));
    supervisor.start();

    std::vector<WorkerReport> reports = waitForReports(supervisor, 1);
    assert(reports.size() == 1);
    assert(reports[0].path == conflicting);
    assert(reports[0].tag == "broken");
    assert(reports[0].failure.kind == ErrorKind::PathConflict);

    assert(writeToFifo(healthy, "still forwarding\n"));
    std::string message;
    assert(sink.receive(message, 2000));
    assert(message.find(" nginx[") != std::string::npos);
    assert(endsWith(message, "]: still forwarding"));
    assert(supervisor.finished().size() == 1 && "the sibling keeps running");
}

} // namespace

int main() {
    testEmptyPipeListStaysResident();
    testConfigurationErrorStartsNothing();
    testWaitWithoutStartFails();
    testAllWorkersFailed();
    testFailingWorkerIsIsolated();
    std::cout << "supervisor test ok\n";
    return 0;
}
