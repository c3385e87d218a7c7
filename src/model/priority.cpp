#include "model/priority.hpp"

#include <syslog.h>

#include <map>
#include <utility>

namespace {
using Entry = std::pair<const char*, int>;

// Built on first use; C++11 guarantees thread-safe initialisation and nothing
// writes to the tables afterwards.
const std::vector<Entry>& facilityEntries() {
    static const std::vector<Entry> entries = {
        {"kern", LOG_KERN},
        {"user", LOG_USER},
        {"mail", LOG_MAIL},
        {"daemon", LOG_DAEMON},
        {"auth", LOG_AUTH},
        {"syslog", LOG_SYSLOG},
        {"lpr", LOG_LPR},
        {"news", LOG_NEWS},
        {"uucp", LOG_UUCP},
        {"authpriv", LOG_AUTHPRIV},
        {"ftp", LOG_FTP},
        {"cron", LOG_CRON},
        {"local0", LOG_LOCAL0},
        {"local1", LOG_LOCAL1},
        {"local2", LOG_LOCAL2},
        {"local3", LOG_LOCAL3},
        {"local4", LOG_LOCAL4},
        {"local5", LOG_LOCAL5},
        {"local6", LOG_LOCAL6},
        {"local7", LOG_LOCAL7},
    };
    return entries;
}

const std::vector<Entry>& severityEntries() {
    static const std::vector<Entry> entries = {
        {"emerg", LOG_EMERG},
        {"alert", LOG_ALERT},
        {"crit", LOG_CRIT},
        {"err", LOG_ERR},
        {"warning", LOG_WARNING},
        {"notice", LOG_NOTICE},
        {"info", LOG_INFO},
        {"debug", LOG_DEBUG},
    };
    return entries;
}

std::map<std::string, int> buildIndex(const std::vector<Entry>& entries) {
    std::map<std::string, int> index;
    for (const auto& entry : entries) {
        index.emplace(entry.first, entry.second);
    }
    return index;
}

bool lookup(const std::map<std::string, int>& index, const std::string& name, int& code) {
    auto it = index.find(name);
    if (it == index.end()) {
        return false;
    }
    code = it->second;
    return true;
}

std::vector<std::string> namesOf(const std::vector<Entry>& entries) {
    std::vector<std::string> names;
    names.reserve(entries.size());
    for (const auto& entry : entries) {
        names.emplace_back(entry.first);
    }
    return names;
}
} // namespace

bool resolveFacility(const std::string& name, int& code) {
    static const std::map<std::string, int> index = buildIndex(facilityEntries());
    return lookup(index, name, code);
}

bool resolveSeverity(const std::string& name, int& code) {
    static const std::map<std::string, int> index = buildIndex(severityEntries());
    return lookup(index, name, code);
}

int encodePriority(int facilityCode, int severityCode) {
    // Facility lives above LOG_PRIMASK, severity inside it.
    return (facilityCode & LOG_FACMASK) | (severityCode & LOG_PRIMASK);
}

std::vector<std::string> facilityNames() {
    return namesOf(facilityEntries());
}

std::vector<std::string> severityNames() {
    return namesOf(severityEntries());
}
