#include "termdeck_config.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>

#include <unistd.h>

static int failures = 0;

static void check(const char* name, bool cond) {
    if (cond) {
        std::cout << "  PASS: " << name << "\n";
    } else {
        std::cerr << "  FAIL: " << name << "\n";
        failures++;
    }
}

int main() {
    unsetenv("TERMDECK_CONFIG");
    unsetenv("TERMDECK_STORE_DIR");
    unsetenv("TERMDECK_SOCKET");
    unsetenv("TERMDECK_LOG");

    std::cout << "[defaults]\n";
    {
        TermDeckConfig config;
        check("default store dir", config.storeDir == "projects");
        check("default socket", config.socketPath == "/tmp/termdeck.sock");
        check("default restart delay", config.restartDelayMs == 300);
        check("defaults are valid", config.isValid());
        WorkspaceSettings s = config.workspaceSettings();
        check("settings mirror config", s.edgeThreshold == 1 && s.restartDelayMs == 300 &&
                                            s.scrollbackBytes == TerminalRenderState::kDefaultLimit);
    }

    std::cout << "\n[json]\n";
    {
        TermDeckConfig config;
        check("full document", config.loadFromString(
            "{\"storeDir\":\"/var/lib/td\",\"socketPath\":\"/run/td.sock\",\"edgeThreshold\":3,"
            "\"restartDelayMs\":50,\"scrollbackBytes\":4096,\"unknownKey\":true}"));
        check("store dir read", config.storeDir == "/var/lib/td");
        check("socket read", config.socketPath == "/run/td.sock");
        check("numbers read", config.edgeThreshold == 3 && config.restartDelayMs == 50 &&
                                  config.scrollbackBytes == 4096);
        check("untouched keys keep defaults", config.logPath == "termdeck.log");

        TermDeckConfig copy;
        check("toJson reloads", copy.loadFromString(config.toJson()) && copy.storeDir == "/var/lib/td" &&
                                    copy.scrollbackBytes == 4096);
    }
    {
        TermDeckConfig config;
        check("malformed JSON rejected", !config.loadFromString("{storeDir:"));
        check("error recorded", !config.getValidationErrors().empty());
        check("non-object rejected", !config.loadFromString("[1,2]"));
        check("negative threshold rejected", !config.loadFromString("{\"edgeThreshold\":-1}"));
        check("empty socket rejected", !config.loadFromString("{\"edgeThreshold\":1,\"socketPath\":\"\"}"));
        check("negative restart delay rejected",
              !config.loadFromString("{\"restartDelayMs\":-5,\"storeDir\":\"elsewhere\"}") &&
                  config.getValidationErrors().back() == "restartDelayMs must be >= 0");
        check("rejected document leaves every value alone", config.restartDelayMs == 300 &&
                                                                config.storeDir == "projects" &&
                                                                config.edgeThreshold == 1 &&
                                                                config.isValid());
        TermDeckConfig other;
        check("non-positive scrollback ignored", other.loadFromString("{\"scrollbackBytes\":0}") &&
                                                     other.scrollbackBytes == TerminalRenderState::kDefaultLimit);
    }

    std::cout << "\n[files and environment]\n";
    {
        std::string path = "/tmp/termdeck_config_test_" + std::to_string(getpid()) + ".json";
        std::ofstream(path) << "{\"storeDir\":\"from-file\",\"logPath\":\"file.log\"}";
        setenv("TERMDECK_LOG", "env.log", 1);

        TermDeckConfig config;
        check("explicit file loads", config.load(path));
        check("file value applied", config.storeDir == "from-file");
        check("environment overrides the file", config.logPath == "env.log");

        setenv("TERMDECK_CONFIG", path.c_str(), 1);
        TermDeckConfig viaEnv;
        check("file named by TERMDECK_CONFIG", viaEnv.load() && viaEnv.storeDir == "from-file");
        unsetenv("TERMDECK_CONFIG");
        unsetenv("TERMDECK_LOG");
        std::remove(path.c_str());

        TermDeckConfig missing;
        check("missing explicit file reported", !missing.load(path));
        check("defaults kept", missing.storeDir == "projects");
    }

    std::cout << "\n=== Results: " << (failures == 0 ? "ALL PASSED" : "FAILURES") << " ===\n";
    return failures;
}
