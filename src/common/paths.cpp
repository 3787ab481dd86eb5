#include "code_sentinel/common/paths.hpp"
#include "code_sentinel/common/constants.hpp"
#include <cstdlib>
#include <cstring>

namespace code_sentinel {
namespace common {

PathManager& PathManager::instance() {
    static PathManager instance;
    return instance;
}

std::vector<std::string> PathManager::getConfigSearchPaths() const {
    std::vector<std::string> paths;

    if (const char* env = std::getenv(constants::system::CONFIG_ENV_VAR)) {
        if (strlen(env) > 0) {
            paths.push_back(env);
        }
    }

    paths.push_back(std::string("./") + constants::system::LOCAL_CONFIG_FILE);

    std::string user_file = getUserConfigFile();
    if (!user_file.empty()) {
        paths.push_back(user_file);
    }

    paths.push_back(constants::system::SYSTEM_CONFIG_FILE);
    return paths;
}

std::string PathManager::getUserConfigDir() const {
    std::string base = getXdgConfigHome();
    if (base.empty()) {
        return "";
    }
    return base + "/" + constants::system::APPLICATION_NAME;
}

std::string PathManager::getUserConfigFile() const {
    std::string dir = getUserConfigDir();
    return dir.empty() ? "" : dir + "/config.toml";
}

std::string PathManager::getLogDir() const {
    std::string base = getXdgStateHome();
    if (base.empty()) {
        return "./logs";
    }
    return base + "/" + constants::system::APPLICATION_NAME;
}

std::string PathManager::getDefaultLogFile() const {
    return getLogDir() + "/" + constants::system::APPLICATION_NAME + ".log";
}

std::string PathManager::getXdgConfigHome() const {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && strlen(xdg) > 0) {
        return xdg;
    }
    const char* home = std::getenv("HOME");
    return home ? std::string(home) + "/.config" : "";
}

std::string PathManager::getXdgStateHome() const {
    const char* xdg = std::getenv("XDG_STATE_HOME");
    if (xdg && strlen(xdg) > 0) {
        return xdg;
    }
    const char* home = std::getenv("HOME");
    return home ? std::string(home) + "/.local/state" : "";
}

}}
