/*---------------------------------------------------------*/
/*                                                         */
/*   termdeck_config.cpp - Application configuration       */
/*                                                         */
/*---------------------------------------------------------*/

#include "termdeck_config.h"
#include "workspace/json_value.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace {

std::string envOr(const char* name, const std::string& fallback)
{
    const char* value = std::getenv(name);
    return (value && *value) ? std::string(value) : fallback;
}

} // namespace

TermDeckConfig::TermDeckConfig() = default;

bool TermDeckConfig::load(const std::string& configPath)
{
    std::string path = configPath;
    bool explicitPath = !path.empty();
    if (path.empty()) {
        const char* env = std::getenv("TERMDECK_CONFIG");
        explicitPath = env && *env;
        path = explicitPath ? env : "termdeck.json";
    }

    bool ok = true;
    std::ifstream candidate(path);
    if (candidate.is_open()) {
        candidate.close();
        ok = loadFromFile(path);
    } else if (explicitPath) {
        // A missing default file is fine; a missing named one is not.
        fprintf(stderr, "[config] cannot open %s, using defaults\n", path.c_str());
        validationErrors.push_back("Could not open config file: " + path);
        ok = false;
    }
    applyEnvironment();
    return ok;
}

bool TermDeckConfig::loadFromFile(const std::string& configPath)
{
    std::ifstream file(configPath);
    if (!file.is_open()) {
        validationErrors.push_back("Could not open config file: " + configPath);
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (!loadFromString(buffer.str())) {
        fprintf(stderr, "[config] %s: %s\n", configPath.c_str(),
                validationErrors.empty() ? "invalid" : validationErrors.back().c_str());
        return false;
    }
    fprintf(stderr, "[config] loaded %s\n", configPath.c_str());
    return true;
}

bool TermDeckConfig::loadFromString(const std::string& jsonConfig)
{
    JsonValue json;
    std::string error;
    if (!JsonValue::parse(jsonConfig, json, &error)) {
        validationErrors.push_back("Invalid JSON: " + error);
        return false;
    }
    if (!json.isObject()) {
        validationErrors.push_back("Config root must be an object");
        return false;
    }

    // Nothing is applied unless the whole document is valid.
    TermDeckConfig next(*this);
    if (json.get("storeDir").isString()) next.storeDir = json.get("storeDir").asString();
    if (json.get("socketPath").isString()) next.socketPath = json.get("socketPath").asString();
    if (json.get("logPath").isString()) next.logPath = json.get("logPath").asString();
    if (json.get("shell").isString()) next.shell = json.get("shell").asString();
    if (json.get("edgeThreshold").isNumber()) next.edgeThreshold = json.get("edgeThreshold").asInt(-1);
    if (json.get("restartDelayMs").isNumber()) next.restartDelayMs = json.get("restartDelayMs").asInt(-1);
    if (json.get("scrollbackBytes").isNumber()) {
        double bytes = json.get("scrollbackBytes").asNumber();
        if (bytes > 0)
            next.scrollbackBytes = static_cast<size_t>(bytes);
    }
    if (!next.isValid()) {
        validationErrors = next.validationErrors;
        return false;
    }
    *this = next;
    return true;
}

void TermDeckConfig::applyEnvironment()
{
    storeDir = envOr("TERMDECK_STORE_DIR", storeDir);
    socketPath = envOr("TERMDECK_SOCKET", socketPath);
    logPath = envOr("TERMDECK_LOG", logPath);
    shell = envOr("SHELL", shell);
}

std::string TermDeckConfig::toJson() const
{
    JsonValue json = JsonValue::object();
    json.set("storeDir", JsonValue::string(storeDir));
    json.set("socketPath", JsonValue::string(socketPath));
    json.set("logPath", JsonValue::string(logPath));
    json.set("shell", JsonValue::string(shell));
    json.set("edgeThreshold", JsonValue::number(edgeThreshold));
    json.set("restartDelayMs", JsonValue::number(restartDelayMs));
    json.set("scrollbackBytes", JsonValue::number(double(scrollbackBytes)));
    return json.dump(2);
}

WorkspaceSettings TermDeckConfig::workspaceSettings() const
{
    WorkspaceSettings settings;
    settings.edgeThreshold = edgeThreshold;
    settings.restartDelayMs = restartDelayMs;
    settings.scrollbackBytes = scrollbackBytes;
    return settings;
}

bool TermDeckConfig::isValid() const
{
    validationErrors.clear();
    if (storeDir.empty())
        validationErrors.push_back("storeDir must not be empty");
    if (socketPath.empty())
        validationErrors.push_back("socketPath must not be empty");
    if (edgeThreshold < 0)
        validationErrors.push_back("edgeThreshold must be >= 0");
    if (restartDelayMs < 0)
        validationErrors.push_back("restartDelayMs must be >= 0");
    return validationErrors.empty();
}
