#include "cli/ParseArgsInternals.h"
#include "pytdc/exceptions/usage_error.h"

#include <string>

namespace pytdc::cli::detail {
    /***
     * Name: pytdc::cli::detail::applyPrefixedOptions
     * Purpose: Parse and apply --key=value options like name/python-version/platform.
     */
    bool applyPrefixedOptions(std::string_view arg, Options &out) {
        if (constexpr std::string_view namePrefix{"--name="}; arg.rfind(namePrefix, 0) == 0) {
            out.moduleName = std::string(arg.substr(namePrefix.size()));
            return true;
        }

        if (constexpr std::string_view versionPrefix{"--python-version="}; arg.rfind(versionPrefix, 0) == 0) {
            const std::string_view value = arg.substr(versionPrefix.size());
            if (!parseVersionValue(value, out.targetVersion)) {
                throw exceptions::UsageError("invalid --python-version value '" + std::string(value) + "'");
            }
            return true;
        }

        if (constexpr std::string_view platformPrefix{"--platform="}; arg.rfind(platformPrefix, 0) == 0) {
            out.targetPlatform = std::string(arg.substr(platformPrefix.size()));
            return true;
        }
        return false;
    }
} // namespace pytdc::cli::detail
