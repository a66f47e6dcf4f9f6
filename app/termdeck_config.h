/*---------------------------------------------------------*/
/*                                                         */
/*   termdeck_config.h - Application configuration         */
/*                                                         */
/*---------------------------------------------------------*/

#ifndef TERMDECK_CONFIG_H
#define TERMDECK_CONFIG_H

#include "workspace/terminal_workspace.h"

#include <string>
#include <vector>

class TermDeckConfig {
public:
    TermDeckConfig();

    // Defaults, then the JSON file ($TERMDECK_CONFIG or ./termdeck.json when
    // `configPath` is empty), then environment overrides.
    bool load(const std::string& configPath = std::string());

    bool loadFromFile(const std::string& configPath);
    bool loadFromString(const std::string& jsonConfig);
    void applyEnvironment();
    std::string toJson() const;

    std::string storeDir = "projects";
    std::string socketPath = "/tmp/termdeck.sock";
    std::string logPath = "termdeck.log";
    std::string shell = "/bin/sh";
    int edgeThreshold = 1;
    int restartDelayMs = 300;
    size_t scrollbackBytes = TerminalRenderState::kDefaultLimit;

    WorkspaceSettings workspaceSettings() const;

    bool isValid() const;
    const std::vector<std::string>& getValidationErrors() const { return validationErrors; }

private:
    mutable std::vector<std::string> validationErrors;
};

#endif // TERMDECK_CONFIG_H
