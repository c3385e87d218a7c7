#include "model/pipe_spec.hpp"

#include "model/priority.hpp"

bool validatePipeSpec(const PipeSpec& spec, int& priority, Failure& failure) {
    if (spec.path.empty()) {
        return fail(failure, ErrorKind::Configuration, "Configuration error: pipe has no path set");
    }
    const std::string prefix = "Configuration error: " + spec.path;

    if (spec.facility.empty()) {
        return fail(failure, ErrorKind::Configuration, prefix + " has no facility set");
    }
    int facility = 0;
    if (!resolveFacility(spec.facility, facility)) {
        return fail(failure, ErrorKind::Configuration,
                    prefix + " has unknown facility (" + spec.facility + ")");
    }

    if (spec.severity.empty()) {
        return fail(failure, ErrorKind::Configuration, prefix + " has no severity set");
    }
    int severity = 0;
    if (!resolveSeverity(spec.severity, severity)) {
        return fail(failure, ErrorKind::Configuration,
                    prefix + " has unknown severity (" + spec.severity + ")");
    }

    priority = encodePriority(facility, severity);
    return true;
}
