#pragma once
#include <string>
#include <unordered_map>

namespace msgstream {

// How a provider-executed ("server") tool is surfaced to callers.
struct ServerToolRule {
    std::string display_name;
    // Prepend {"type":"<raw name>", to the first argument fragment so the
    // assembled input carries its own discriminator.
    bool inject_type = false;
};

// Strategy table keyed by the raw provider tool name. Names without a rule
// pass through unchanged and get no framing fix.
class ServerToolTable {
public:
    // Table preloaded with the code-execution variants
    static ServerToolTable with_builtins();

    void set_rule(const std::string& raw_name, ServerToolRule rule);
    const ServerToolRule* find(const std::string& raw_name) const;

    std::string display_name(const std::string& raw_name) const;
    bool injects_type(const std::string& raw_name) const;

    size_t size() const { return rules_.size(); }

private:
    std::unordered_map<std::string, ServerToolRule> rules_;
};

} // namespace msgstream
