#pragma once

#include <string>
#include <vector>

namespace code_sentinel {
namespace common {

class PathManager {
public:
    static PathManager& instance();

    std::string getUserConfigDir() const;
    std::string getUserConfigFile() const;
    std::string getLogDir() const;
    std::string getDefaultLogFile() const;

    // Ordered, most specific first. An explicit --config path is handled by the caller.
    std::vector<std::string> getConfigSearchPaths() const;

private:
    PathManager() = default;

    std::string getXdgConfigHome() const;
    std::string getXdgStateHome() const;
};

}}
