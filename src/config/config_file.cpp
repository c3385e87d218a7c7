#include "config/config_file.hpp"

#include <fstream>
#include <istream>
#include <ostream>
#include <set>
#include <utility>

namespace {
std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return std::string();
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

/** @brief Drop a trailing `# comment` from a line that holds no strings. */
std::string stripComment(const std::string& s) {
    auto pos = s.find('#');
    return pos == std::string::npos ? s : s.substr(0, pos);
}

enum class ValueResult {
    String,
    NotString,
    Malformed
};

/**
 * @brief Parse a basic ("...") or literal ('...') string value.
 * @param text everything after '=', already trimmed.
 * @param out decoded string.
 * @param err reason when Malformed.
 */
ValueResult parseValue(const std::string& text, std::string& out, std::string& err) {
    if (text.empty()) {
        err = "missing value";
        return ValueResult::Malformed;
    }
    char quote = text[0];
    if (quote != '"' && quote != '\'') {
        return ValueResult::NotString;
    }

    out.clear();
    size_t i = 1;
    bool closed = false;
    for (; i < text.size(); ++i) {
        char c = text[i];
        if (c == quote) {
            closed = true;
            ++i;
            break;
        }
        if (quote == '"' && c == '\\') {
            if (i + 1 >= text.size()) break;
            char next = text[++i];
            switch (next) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case 'n': out.push_back('\n'); break;
                case 't': out.push_back('\t'); break;
                case 'r': out.push_back('\r'); break;
                default:
                    err = std::string("unsupported escape \\") + next;
                    return ValueResult::Malformed;
            }
            continue;
        }
        out.push_back(c);
    }
    if (!closed) {
        err = "unterminated string";
        return ValueResult::Malformed;
    }

    std::string rest = trim(text.substr(i));
    if (!rest.empty() && rest[0] != '#') {
        err = "unexpected text after value";
        return ValueResult::Malformed;
    }
    return ValueResult::String;
}

std::string* pipeField(PipeSpec& pipe, const std::string& key) {
    if (key == "path") return &pipe.path;
    if (key == "facility") return &pipe.facility;
    if (key == "severity") return &pipe.severity;
    if (key == "tag") return &pipe.tag;
    return nullptr;
}
} // namespace

bool parseConfigStream(std::istream& in, std::vector<PipeSpec>& pipes, std::string& err) {
    std::vector<PipeSpec> parsed;
    bool inPipe = false;
    std::set<std::string> seenKeys;

    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        const std::string where = "line " + std::to_string(lineNo) + ": ";
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        if (line[0] == '[') {
            std::string header = trim(stripComment(line));
            size_t n = header.size();
            bool array = n >= 4 && header.compare(0, 2, "[[") == 0 &&
                         header.compare(n - 2, 2, "]]") == 0;
            if (!array && (n < 2 || header[n - 1] != ']')) {
                err = where + "malformed table header";
                return false;
            }
            std::string name = array ? trim(header.substr(2, n - 4)) : trim(header.substr(1, n - 2));
            inPipe = array && name == "pipe";
            if (inPipe) {
                parsed.emplace_back();
                seenKeys.clear();
            }
            continue;
        }

        auto pos = line.find('=');
        if (pos == std::string::npos) {
            err = where + "expected key = value";
            return false;
        }
        std::string key = trim(line.substr(0, pos));
        if (key.empty()) {
            err = where + "missing key";
            return false;
        }

        std::string value;
        std::string valueErr;
        ValueResult result = parseValue(trim(line.substr(pos + 1)), value, valueErr);
        if (result == ValueResult::Malformed) {
            err = where + valueErr;
            return false;
        }
        if (!inPipe) continue;

        std::string* field = pipeField(parsed.back(), key);
        if (field == nullptr) continue;
        if (result != ValueResult::String) {
            err = where + "value for '" + key + "' must be a string";
            return false;
        }
        if (!seenKeys.insert(key).second) {
            err = where + "duplicate key '" + key + "'";
            return false;
        }
        *field = value;
    }
    if (in.bad()) {
        err = "read failed";
        return false;
    }

    pipes = std::move(parsed);
    return true;
}

bool parseConfigFile(const std::string& path, std::vector<PipeSpec>& pipes, std::string& err) {
    std::ifstream in(path);
    if (!in) {
        err = "Cannot open config file: " + path;
        return false;
    }
    if (!parseConfigStream(in, pipes, err)) {
        err = path + ": " + err;
        return false;
    }
    return true;
}

void printConfigExample(std::ostream& out, const std::string& configPath) {
    out << "Write configuration file like this:\n"
        << "---\n"
        << "[[pipe]]\n"
        << "path = \"/tmp/access_log\"\n"
        << "facility = \"local6\"\n"
        << "severity = \"info\"\n"
        << "tag = \"nginx\"\n"
        << "\n"
        << "[[pipe]]\n"
        << "path = \"/tmp/error_log\"\n"
        << "facility = \"local6\"\n"
        << "severity = \"err\"\n"
        << "tag = \"nginx\"\n"
        << "---\n"
        << "save in " << configPath << std::endl;
}
