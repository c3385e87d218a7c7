#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include "model/pipe_spec.hpp"

/**
 * @brief Load [[pipe]] records from a logpipe configuration file.
 *
 * The file is the TOML subset operators write for logpipe: `[[pipe]]`
 * headers followed by `key = "value"` lines. Keys other than path, facility,
 * severity and tag are ignored, as are keys outside a [[pipe]] table.
 * @param path config file path.
 * @param pipes receives the records in file order (replaced, not appended).
 * @param err error message on failure.
 * @return true if the file was read and parsed.
 */
bool parseConfigFile(const std::string& path, std::vector<PipeSpec>& pipes, std::string& err);

/**
 * @brief Same as parseConfigFile, reading from an already open stream.
 */
bool parseConfigStream(std::istream& in, std::vector<PipeSpec>& pipes, std::string& err);

/**
 * @brief Print an example configuration and where logpipe expects it.
 */
void printConfigExample(std::ostream& out, const std::string& configPath);
