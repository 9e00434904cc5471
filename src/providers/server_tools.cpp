#include "server_tools.hpp"

namespace msgstream {

ServerToolTable ServerToolTable::with_builtins() {
    ServerToolTable table;
    // Both sub-kinds are one public tool; the raw name selects the input variant.
    table.set_rule("bash_code_execution", {"code_execution", true});
    table.set_rule("text_editor_code_execution", {"code_execution", true});
    return table;
}

void ServerToolTable::set_rule(const std::string& raw_name, ServerToolRule rule) {
    rules_[raw_name] = std::move(rule);
}

const ServerToolRule* ServerToolTable::find(const std::string& raw_name) const {
    auto it = rules_.find(raw_name);
    if (it == rules_.end()) return nullptr;
    return &it->second;
}

std::string ServerToolTable::display_name(const std::string& raw_name) const {
    const auto* rule = find(raw_name);
    if (rule == nullptr || rule->display_name.empty()) return raw_name;
    return rule->display_name;
}

bool ServerToolTable::injects_type(const std::string& raw_name) const {
    const auto* rule = find(raw_name);
    return rule != nullptr && rule->inject_type;
}

} // namespace msgstream
