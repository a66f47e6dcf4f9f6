#pragma once

#include <map>
#include <string>
#include <vector>

class TTermDeckApp;

struct CommandCapability {
    const char* name;
    const char* description;
    const char* params;
};

const std::vector<CommandCapability>& get_command_capabilities();
std::string get_command_capabilities_json();
std::string exec_registry_command(
    TTermDeckApp& app,
    const std::string& name,
    const std::map<std::string, std::string>& kv);
