#include "tui_config.hpp"
#include "tui_errors.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace autom8_tui {

namespace {

std::string resolve_path(const std::string &root, const std::string &path) {
  if (path.empty())
    return path;
  fs::path p(path);
  if (p.is_absolute())
    return p.lexically_normal().string();
  return (fs::path(root) / p).lexically_normal().string();
}

std::vector<std::string> string_list(const YAML::Node &node, const std::string &key) {
  std::vector<std::string> items;
  if (node.IsScalar()) {
    items.push_back(node.as<std::string>());
    return items;
  }
  if (!node.IsSequence())
    throw ConfigError("'" + key + "' must be a string or a list of strings");
  items.reserve(node.size());
  for (const auto &item : node)
    items.emplace_back(item.as<std::string>());
  return items;
}

long positive_number(const YAML::Node &node, const std::string &key) {
  long value = node.as<long>();
  if (value <= 0)
    throw ConfigError("'" + key + "' must be a positive number");
  return value;
}

void load_execution(const YAML::Node &node, AppConfig &config) {
  if (!node.IsMap())
    throw ConfigError("'execution' must be a mapping");
  auto &exec = config.execution;
  exec.executable = node["executable"].as<std::string>(exec.executable);
  exec.vault_password_arg = node["vault_password_arg"].as<std::string>(exec.vault_password_arg);
  if (node["extra_args"])
    exec.extra_args = string_list(node["extra_args"], "execution.extra_args");
  if (node["working_dir"])
    exec.working_dir = resolve_path(config.project_root, node["working_dir"].as<std::string>());
  if (node["cancel_grace_ms"])
    exec.cancel_grace = std::chrono::milliseconds(positive_number(node["cancel_grace_ms"], "execution.cancel_grace_ms"));
  if (node["environment"]) {
    if (!node["environment"].IsMap())
      throw ConfigError("'execution.environment' must be a mapping");
    for (const auto &item : node["environment"])
      exec.environment[item.first.as<std::string>()] = item.second.as<std::string>("");
  }
}

void load_keys(const YAML::Node &node, AppConfig &config) {
  if (!node.IsMap())
    throw ConfigError("'keys' must be a mapping");
  for (const auto &item : node) {
    std::string name = item.first.as<std::string>();
    auto command = command_from_name(name);
    if (!command)
      throw ConfigError("unknown key binding command '" + name + "'");
    config.keys.bind(*command, string_list(item.second, "keys." + name));
  }
}

} // namespace

AppConfig AppConfig::defaults_for(const std::string &project_root) {
  AppConfig config;
  config.project_root = project_root;
  config.inventory_path = resolve_path(project_root, "inventory");
  config.playbooks_dir = resolve_path(project_root, "playbooks");
  config.execution.working_dir = project_root;
  config.log.file = resolve_path(project_root, config.log.file);
  return config;
}

CommandLineOptions parse_command_line(int argc, const char *const argv[]) {
  CommandLineOptions options;
  auto value_of = [&](int &i, const std::string &flag) -> std::string {
    if (i + 1 >= argc)
      throw ConfigError("option " + flag + " requires a value");
    return argv[++i];
  };

  for (int i = 1; i < argc; ++i) {
    std::string arg(argv[i]);
    std::string inline_value;
    bool has_inline = false;
    if (arg.rfind("--", 0) == 0) {
      auto eq = arg.find('=');
      if (eq != std::string::npos) {
        inline_value = arg.substr(eq + 1);
        arg = arg.substr(0, eq);
        has_inline = true;
      }
    }
    auto take = [&](const std::string &flag) { return has_inline ? inline_value : value_of(i, flag); };

    if (arg == "--help" || arg == "-h") {
      options.show_help = true;
    } else if (arg == "--version" || arg == "-v") {
      options.show_version = true;
    } else if (arg == "--vault") {
      options.vault = true;
    } else if (arg == "--debug" || arg == "-d") {
      ++options.debug;
    } else if (arg.size() > 2 && arg[0] == '-' && arg[1] == 'd' && arg.find_first_not_of('d', 1) == std::string::npos) {
      options.debug += static_cast<int>(arg.size() - 1);  // -dd
    } else if (arg == "--config" || arg == "-c") {
      options.config_path = take(arg);
    } else if (arg == "--inventory" || arg == "-i") {
      options.inventory = take(arg);
    } else if (arg == "--playbook" || arg == "-p") {
      options.playbook = take(arg);
    } else if (arg == "--site") {
      options.site = take(arg);
    } else if (arg == "--targets") {
      options.targets = take(arg);
    } else if (arg == "--cwd") {
      options.cwd = take(arg);
    } else {
      throw ConfigError("unknown option: " + arg);
    }
  }
  return options;
}

std::string find_project_root(const std::string &start_dir) {
  std::error_code ec;
  fs::path start = fs::absolute(start_dir, ec).lexically_normal();
  if (ec)
    return start_dir;
  for (fs::path dir = start;; dir = dir.parent_path()) {
    if (fs::is_directory(dir / "playbooks", ec) || fs::is_directory(dir / "inventory", ec) ||
        fs::exists(dir / CONFIG_FILE_NAME, ec))
      return dir.string();
    if (dir == dir.root_path() || dir.parent_path() == dir)
      break;
  }
  return start.string();
}

std::optional<std::string> find_config_file(const std::string &project_root,
                                            const std::optional<std::string> &explicit_path) {
  if (explicit_path) {
    if (!std::ifstream(*explicit_path).good())
      throw ConfigError("config file not readable: " + *explicit_path);
    return *explicit_path;
  }

  std::vector<std::string> possible_paths = {
      (fs::path(project_root) / CONFIG_FILE_NAME).string(),
      (fs::path(project_root) / "config" / CONFIG_FILE_NAME).string()};
  if (const char *home = std::getenv("HOME"))
    possible_paths.push_back((fs::path(home) / ".config" / "autom8" / CONFIG_FILE_NAME).string());

  for (const auto &path : possible_paths)
    if (std::ifstream(path).good())
      return path;
  return std::nullopt;
}

AppConfig load_app_config(const std::string &file_path, AppConfig config) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(file_path);
  } catch (const YAML::Exception &e) {
    throw ConfigError("Failed to load YAML file: " + std::string(e.what()));
  }
  config.config_path = file_path;
  if (!root || root.IsNull())
    return config;
  if (!root.IsMap())
    throw ConfigError("config file " + file_path + " is not a YAML mapping");

  try {
    const std::string &base = config.project_root;
    if (root["inventory"])
      config.inventory_path = resolve_path(base, root["inventory"].as<std::string>());
    if (root["playbooks"])
      config.playbooks_dir = resolve_path(base, root["playbooks"].as<std::string>());
    config.inventory_command = root["inventory_command"].as<std::string>(config.inventory_command);
    if (root["output_capacity"])
      config.output_capacity = static_cast<std::size_t>(positive_number(root["output_capacity"], "output_capacity"));
    config.clear_output_on_run = root["clear_output_on_run"].as<bool>(config.clear_output_on_run);
    config.ask_vault = root["ask_vault"].as<bool>(config.ask_vault);
    config.default_site = root["default_site"].as<std::string>(config.default_site);
    config.default_playbook = root["default_playbook"].as<std::string>(config.default_playbook);
    if (root["default_targets"])
      config.default_targets = string_list(root["default_targets"], "default_targets");

    if (root["execution"])
      load_execution(root["execution"], config);

    if (const auto redraw = root["redraw"]) {
      if (redraw["mode"])
        config.redraw.mode = parse_redraw_mode(redraw["mode"].as<std::string>());
      if (redraw["interval_ms"])
        config.redraw.interval = std::chrono::milliseconds(positive_number(redraw["interval_ms"], "redraw.interval_ms"));
    }

    if (const auto log = root["log"]) {
      if (log["file"])
        config.log.file = resolve_path(base, log["file"].as<std::string>());
      config.log.level = log["level"].as<std::string>(config.log.level);
    }

    if (root["keys"])
      load_keys(root["keys"], config);
  } catch (const YAML::Exception &e) {
    throw ConfigError("Invalid value in " + file_path + ": " + e.what());
  }
  return config;
}

void apply_command_line(AppConfig &config, const CommandLineOptions &options) {
  // 命令行路径相对当前目录
  if (options.inventory)
    config.inventory_path = fs::absolute(*options.inventory).lexically_normal().string();
  if (options.playbook)
    config.default_playbook = *options.playbook;
  if (options.site)
    config.default_site = *options.site;
  if (options.targets)
    config.default_targets = split_list(*options.targets);
  if (options.vault)
    config.ask_vault = true;
  config.debug_level = options.debug;
}

std::vector<std::string> split_list(const std::string &text, char separator) {
  std::vector<std::string> items;
  std::string current;
  auto flush = [&]() {
    auto begin = current.find_first_not_of(" \t");
    auto end = current.find_last_not_of(" \t");
    if (begin != std::string::npos)
      items.push_back(current.substr(begin, end - begin + 1));
    current.clear();
  };
  for (char c : text) {
    if (c == separator)
      flush();
    else
      current.push_back(c);
  }
  flush();
  return items;
}

} // namespace autom8_tui
