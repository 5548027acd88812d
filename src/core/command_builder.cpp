#include "core/command_builder.hpp"

namespace autom8_tui {

std::vector<std::string> CommandBuilder::build_argv(const RunRequest& request) const {
    std::vector<std::string> argv;
    argv.push_back(options_.executable);
    if (!request.inventory_path.empty()) {
        argv.push_back("-i");
        argv.push_back(request.inventory_path);
    }
    argv.push_back(request.playbook_path);
    if (!request.hosts.empty()) {
        argv.push_back("--limit");
        argv.push_back(join_limit(request.hosts));
    }
    if (request.use_vault && !options_.vault_password_arg.empty()) {
        argv.push_back(options_.vault_password_arg);
    }
    argv.insert(argv.end(), options_.extra_args.begin(), options_.extra_args.end());
    return argv;
}

std::string CommandBuilder::preview(const RunRequest& request) const {
    std::string text;
    for (const auto& arg : build_argv(request)) {
        if (!text.empty()) {
            text += ' ';
        }
        text += shell_quote(arg);
    }
    return text;
}

std::string CommandBuilder::join_limit(const std::vector<std::string>& hosts) {
    std::string joined;
    for (const auto& host : hosts) {
        if (!joined.empty()) {
            joined += ',';
        }
        joined += host;
    }
    return joined;
}

std::string CommandBuilder::shell_quote(const std::string& arg) {
    if (arg.empty()) {
        return "''";
    }
    bool safe = true;
    for (char c : arg) {
        bool plain = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                     c == '-' || c == '_' || c == '.' || c == '/' || c == ',' || c == '=' || c == ':' ||
                     c == '@' || c == '+';
        if (!plain) {
            safe = false;
            break;
        }
    }
    if (safe) {
        return arg;
    }
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

} // namespace autom8_tui
