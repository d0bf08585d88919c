#pragma once

#include <optional>
#include <string>
#include <vector>

namespace pytdc::cli {

    struct Options {
        bool showHelp{false};
        bool metrics{false};          // --metrics
        bool metricsJson{false};      // --metrics-json
        bool dumpAst{false};          // --dump-ast
        std::string outputFile{};     // -o <file>; empty writes to stdout
        std::vector<std::string> inputs{};
        std::optional<std::string> moduleName{};       // --name=<module>
        std::vector<int> targetVersion{2, 7, 6};       // --python-version=<a.b[.c]>
        std::string targetPlatform{"linux"};           // --platform=<name>
    };

} // namespace pytdc::cli
