#include <mcp_cli/cli/command_router.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iostream>
#include <set>

namespace mcp_cli {

namespace {

// Routing failures are usage errors, same exit code as a bad config.
constexpr int kExitUsage = 2;

bool HasJsonFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::string_view{argv[i]} == "--json") return true;
    }
    return false;
}

void PrintJsonError(const std::string& message, std::ostream& out) {
    nlohmann::json j = {{"error", {{"category", "validation"}, {"message", message}}}};
    out << j.dump() << "\n";
}

// Consume one "--key", "--key=value" or "--key value" token starting at i.
void ParseFlag(int argc, const char* const* argv, int& i,
               std::map<std::string, std::string>& flags) {
    std::string_view arg{argv[i]};
    auto eq = arg.find('=');
    if (eq != std::string_view::npos) {
        flags[std::string(arg.substr(2, eq - 2))] = std::string(arg.substr(eq + 1));
        ++i;
        return;
    }
    auto key = std::string(arg.substr(2));
    if (CommandRouter::IsBooleanFlag(arg)) {
        flags[key] = "true";
        ++i;
    } else if (i + 1 < argc &&
               std::string_view{argv[i + 1]}.substr(0, 2) != "--") {
        flags[key] = argv[i + 1];
        i += 2;
    } else {
        flags[key] = "true";
        ++i;
    }
}

} // namespace

bool CommandRouter::IsBooleanFlag(std::string_view arg) {
    return arg == "--color" || arg == "--no-color" ||
           arg == "--json" || arg == "--help" || arg == "--quiet";
}

void CommandRouter::Register(const std::string& group,
                             const std::string& action,
                             const std::string& description,
                             CommandHandler handler) {
    CommandInfo info;
    info.group = group;
    info.action = action;
    info.description = description;
    info.handler = std::move(handler);
    commands_[group + ":" + action] = std::move(info);
}

void CommandRouter::Register(const std::string& group,
                             const std::string& action,
                             const std::string& description,
                             CommandHandler handler,
                             CommandHelp help) {
    CommandInfo info;
    info.group = group;
    info.action = action;
    info.description = description;
    info.handler = std::move(handler);
    info.help = std::move(help);
    commands_[group + ":" + action] = std::move(info);
}

void CommandRouter::SetGroupDescription(const std::string& group,
                                        const std::string& description) {
    group_descriptions_[group] = description;
}

void CommandRouter::SetGroupExamples(const std::string& group,
                                     std::vector<std::string> examples) {
    group_examples_[group] = std::move(examples);
}

void CommandRouter::SetDefaultAction(const std::string& group,
                                     const std::string& action) {
    default_actions_[group] = action;
}

int CommandRouter::Dispatch(int argc, const char* const* argv) const {
    return Dispatch(argc, argv, std::cout, std::cerr);
}

int CommandRouter::Dispatch(int argc, const char* const* argv,
                            std::ostream& out, std::ostream& err) const {
    bool json_mode = HasJsonFlag(argc, argv);
    auto parse_result = Parse(argc, argv);
    if (parse_result.IsErr()) {
        const auto& message = parse_result.Error();

        // "Missing action for group 'X'" on a known group shows group help,
        // unless the group has a default action that takes no arguments.
        const std::string prefix = "Missing action for group '";
        auto pos = message.find(prefix);
        if (pos != std::string::npos) {
            auto start = pos + prefix.size();
            auto end = message.find('\'', start);
            if (end != std::string::npos) {
                auto group = message.substr(start, end - start);
                if (HasGroup(group)) {
                    if (json_mode) {
                        PrintJsonError("Missing action for group '" + group + "'", err);
                        return kExitUsage;
                    }
                    PrintGroupHelp(group, out);
                    return 0;
                }
            }
        }

        if (json_mode) {
            PrintJsonError(message, err);
        } else {
            err << "Error: " << message << "\n";
            PrintHelp(err);
        }
        return kExitUsage;
    }

    auto args = std::move(parse_result).Value();
    json_mode = json_mode || args.flags.count("json") > 0;

    if (args.action.empty()) {
        if (args.flags.count("help") > 0) {
            if (!HasGroup(args.group)) {
                if (json_mode) {
                    PrintJsonError("Unknown command group '" + args.group + "'", err);
                } else {
                    err << "Error: unknown command group '" << args.group << "'\n";
                    PrintHelp(err);
                }
                return kExitUsage;
            }
            PrintGroupHelp(args.group, out);
            return 0;
        }
        auto def_it = default_actions_.find(args.group);
        if (def_it == default_actions_.end()) {
            if (json_mode) {
                PrintJsonError("Missing action for group '" + args.group + "'", err);
            } else {
                err << "Error: Missing action for group '" << args.group
                    << "'. Usage: mcp-cli " << args.group << " <action> [args]\n";
                PrintHelp(err);
            }
            return kExitUsage;
        }
        args.action = def_it->second;
    }

    if (args.action == "--help" || args.action == "-h" || args.action == "help") {
        if (!HasGroup(args.group)) {
            if (json_mode) {
                PrintJsonError("Unknown command group '" + args.group + "'", err);
            } else {
                err << "Error: unknown command group '" << args.group << "'\n";
                PrintHelp(err);
            }
            return kExitUsage;
        }
        PrintGroupHelp(args.group, out);
        return 0;
    }

    auto key = args.group + ":" + args.action;
    auto it = commands_.find(key);

    // Default action fallback: treat the parsed "action" as the first
    // positional argument.
    if (it == commands_.end()) {
        auto def_it = default_actions_.find(args.group);
        if (def_it != default_actions_.end()) {
            args.positional.insert(args.positional.begin(), args.action);
            args.action = def_it->second;
            key = args.group + ":" + args.action;
            it = commands_.find(key);
        }
    }

    if (args.flags.count("help") > 0) {
        if (it != commands_.end()) {
            PrintCommandHelp(args.group, args.action, out);
            return 0;
        }
        if (HasGroup(args.group)) {
            PrintGroupHelp(args.group, out);
            return 0;
        }
    }

    if (it == commands_.end()) {
        if (json_mode) {
            PrintJsonError("Unknown command '" + args.group + " " + args.action + "'", err);
        } else {
            err << "Error: unknown command '" << args.group << " " << args.action << "'\n";
            if (HasGroup(args.group)) {
                PrintGroupHelp(args.group, err);
            } else {
                PrintHelp(err);
            }
        }
        return kExitUsage;
    }

    return it->second.handler(args);
}

Result<CommandArgs, std::string> CommandRouter::Parse(
    int argc, const char* const* argv) {
    CommandArgs args;
    int i = 1;

    // Global flags before the group.
    while (i < argc) {
        std::string_view arg{argv[i]};
        if (arg == "-v" || arg == "-vv" || arg == "-q") {
            ++i;
            continue;
        }
        if (arg.substr(0, 2) != "--") {
            break;
        }
        ParseFlag(argc, argv, i, args.flags);
    }

    if (i >= argc) {
        return Result<CommandArgs, std::string>::Err(
            "Missing command group. Usage: mcp-cli <group> <action> [args]");
    }
    args.group = argv[i++];

    if (i >= argc) {
        return Result<CommandArgs, std::string>::Err(
            "Missing action for group '" + args.group +
            "'. Usage: mcp-cli " + args.group + " <action> [args]");
    }
    if (std::string_view{argv[i]}.substr(0, 2) != "--") {
        args.action = argv[i++];
    }

    while (i < argc) {
        std::string_view arg{argv[i]};
        if (arg.substr(0, 2) == "--") {
            ParseFlag(argc, argv, i, args.flags);
        } else {
            args.positional.emplace_back(argv[i]);
            ++i;
        }
    }

    return Result<CommandArgs, std::string>::Ok(std::move(args));
}

std::vector<std::string> CommandRouter::Groups() const {
    std::set<std::string> groups;
    for (const auto& [key, info] : commands_) {
        groups.insert(info.group);
    }
    return {groups.begin(), groups.end()};
}

bool CommandRouter::HasGroup(const std::string& group) const {
    return std::any_of(commands_.begin(), commands_.end(),
                       [&group](const auto& entry) { return entry.second.group == group; });
}

std::vector<CommandInfo> CommandRouter::CommandsForGroup(
    const std::string& group) const {
    std::vector<CommandInfo> result;
    for (const auto& [key, info] : commands_) {
        if (info.group == group) {
            result.push_back(info);
        }
    }
    std::sort(result.begin(), result.end(),
              [](const CommandInfo& a, const CommandInfo& b) {
                  return a.action < b.action;
              });
    return result;
}

std::string CommandRouter::GroupDescription(const std::string& group) const {
    auto it = group_descriptions_.find(group);
    return (it != group_descriptions_.end()) ? it->second : "";
}

std::vector<std::string> CommandRouter::GroupExamples(const std::string& group) const {
    auto it = group_examples_.find(group);
    return (it != group_examples_.end()) ? it->second : std::vector<std::string>{};
}

void CommandRouter::PrintHelp(std::ostream& out) const {
    out << "\nUsage: mcp-cli [options] <group> <action> [flags]\n\n";
    out << "Available commands:\n";

    for (const auto& group : Groups()) {
        out << "\n  " << group << ":\n";
        for (const auto& cmd : CommandsForGroup(group)) {
            out << "    " << cmd.action;
            if (!cmd.description.empty()) {
                out << " - " << cmd.description;
            }
            out << "\n";
        }
    }
    out << "\n";
}

void CommandRouter::PrintGroupHelp(const std::string& group,
                                   std::ostream& out) const {
    auto desc = GroupDescription(group);
    if (desc.empty()) {
        desc = group;
    }
    out << "mcp-cli " << group << " - " << desc << "\n";

    out << "\nActions:\n";
    auto cmds = CommandsForGroup(group);
    size_t max_len = 0;
    for (const auto& cmd : cmds) {
        max_len = std::max(max_len, cmd.action.size());
    }
    for (const auto& cmd : cmds) {
        out << "  " << cmd.action;
        out << std::string(max_len - cmd.action.size() + 6, ' ');
        out << cmd.description << "\n";
    }

    auto examples = GroupExamples(group);
    if (!examples.empty()) {
        out << "\nExamples:\n";
        for (const auto& ex : examples) {
            out << "  " << ex << "\n";
        }
    }

    auto def_it = default_actions_.find(group);
    if (def_it != default_actions_.end()) {
        out << "\nShorthand: the '" << def_it->second
            << "' action is the default, so 'mcp-cli " << group
            << " <args>' is equivalent to 'mcp-cli " << group
            << " " << def_it->second << " <args>'.\n";
    }

    out << "\nUse \"mcp-cli " << group
        << " <action> --help\" for details on a specific action.\n";
}

void CommandRouter::PrintCommandHelp(const std::string& group,
                                     const std::string& action,
                                     std::ostream& out) const {
    auto it = commands_.find(group + ":" + action);
    if (it == commands_.end()) {
        out << "Error: unknown command '" << group << " " << action << "'\n";
        return;
    }

    const auto& cmd = it->second;
    out << "mcp-cli " << group << " " << action << " - " << cmd.description << "\n";

    if (!cmd.help) {
        out << "\nNo detailed help available for this command.\n";
        return;
    }

    const auto& help = *cmd.help;

    if (!help.usage.empty()) {
        out << "\nUsage:\n  " << help.usage << "\n";
    }

    if (!help.args_description.empty()) {
        out << "\nArguments:\n  " << help.args_description << "\n";
    }

    if (!help.flags.empty()) {
        out << "\nFlags:\n";
        std::vector<std::string> flag_displays;
        size_t max_len = 0;
        for (const auto& f : help.flags) {
            std::string display = "--" + f.name;
            if (!f.placeholder.empty()) {
                display += " " + f.placeholder;
            }
            max_len = std::max(max_len, display.size());
            flag_displays.push_back(std::move(display));
        }
        for (size_t i = 0; i < help.flags.size(); ++i) {
            out << "  " << flag_displays[i];
            out << std::string(max_len - flag_displays[i].size() + 4, ' ');
            out << help.flags[i].description;
            if (help.flags[i].required) {
                out << " (required)";
            }
            out << "\n";
        }
    }

    if (!help.long_description.empty()) {
        out << "\n" << help.long_description << "\n";
    }

    if (!help.examples.empty()) {
        out << "\nExamples:\n";
        for (const auto& ex : help.examples) {
            out << "  " << ex << "\n";
        }
    }
}

} // namespace mcp_cli
