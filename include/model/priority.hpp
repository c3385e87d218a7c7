#pragma once

#include <string>
#include <vector>

/**
 * @brief Look up a syslog facility code by name (kern, user, ..., local7).
 * @param name facility name, case sensitive.
 * @param code receives the <syslog.h> facility value (already shifted).
 * @return true if the name is known.
 */
bool resolveFacility(const std::string& name, int& code);

/**
 * @brief Look up a syslog severity code by name (emerg ... debug).
 * @param name severity name, case sensitive.
 * @param code receives the severity value 0-7.
 * @return true if the name is known.
 */
bool resolveSeverity(const std::string& name, int& code);

/**
 * @brief Combine facility and severity into the wire priority (facility | severity).
 */
int encodePriority(int facilityCode, int severityCode);

/** @brief Every recognised facility name, in table order. */
std::vector<std::string> facilityNames();

/** @brief Every recognised severity name, most to least urgent. */
std::vector<std::string> severityNames();
