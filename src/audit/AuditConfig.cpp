//===----------------------------------------------------------------------===//
//
// Part of the Vigil project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Reads the audit runtime's environment overrides.  Accepted spellings follow
// the other VIGIL_* switches: 1/true/on enable, 0/false/off disable, anything
// else keeps the default.
//
//===----------------------------------------------------------------------===//

#include "audit/AuditConfig.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace vigil::audit
{

std::optional<bool> parseFlag(std::string_view text)
{
    std::string v{text};
    std::transform(v.begin(),
                   v.end(),
                   v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "1" || v == "true" || v == "on" || v == "yes")
        return true;
    if (v == "0" || v == "false" || v == "off" || v == "no")
        return false;
    return std::nullopt;
}

AuditConfig AuditConfig::fromEnvironment(const EnvLookup &lookup)
{
    const EnvLookup getenvFn = lookup ? lookup : EnvLookup([](const char *name) -> const char *
                                                           { return std::getenv(name); });

    AuditConfig config;
    if (const char *trace = getenvFn("VIGIL_AUDIT_TRACE"))
    {
        if (auto flag = parseFlag(trace))
            config.traceDispatch = *flag;
    }
    if (const char *level = getenvFn("VIGIL_LOG_LEVEL"))
        config.logLevel = support::parseLogLevel(level);

    if (config.traceDispatch && !config.logLevel)
        config.logLevel = support::LogLevel::Debug;
    return config;
}

} // namespace vigil::audit
