#pragma once
#include "core/execution_types.hpp"
#include "core/output_buffer.hpp"
#include "core/redraw_scheduler.hpp"
#include "tui_keys.hpp"
#include <optional>
#include <string>
#include <vector>

namespace autom8_tui {

constexpr const char *AUTOM8_VERSION = "1.0.0";
constexpr const char *CONFIG_FILE_NAME = "autom8.yaml";

struct LogOptions {
  std::string file = "logs/autom8.log";
  std::string level = "info";
};

/**
 * @brief 应用配置
 * 默认值 <- autom8.yaml <- 命令行，相对路径按项目根目录解析
 */
struct AppConfig {
  std::string project_root;
  std::string config_path;  // 实际加载的配置文件，未找到时为空

  std::string inventory_path;
  std::string playbooks_dir;
  std::string inventory_command = "ansible-inventory";  // 为空时只读YAML

  ExecutionOptions execution;
  std::size_t output_capacity = OutputBuffer::DEFAULT_CAPACITY;
  bool clear_output_on_run = true;
  RedrawOptions redraw;
  LogOptions log;
  KeyBindings keys = KeyBindings::defaults();

  std::string default_site;
  std::vector<std::string> default_targets;
  std::string default_playbook;
  bool ask_vault = false;
  int debug_level = 0;

  /** 以项目根目录为基础的默认配置 */
  static AppConfig defaults_for(const std::string &project_root);
};

struct CommandLineOptions {
  bool show_help = false;
  bool show_version = false;
  bool vault = false;
  int debug = 0;
  std::optional<std::string> config_path;
  std::optional<std::string> inventory;
  std::optional<std::string> playbook;
  std::optional<std::string> site;
  std::optional<std::string> targets;
  std::optional<std::string> cwd;
};

/** @throws ConfigError 未知选项或缺少参数值 */
CommandLineOptions parse_command_line(int argc, const char *const argv[]);

/**
 * @brief 从起始目录向上寻找包含 playbooks/、inventory/ 或 autom8.yaml 的目录
 * 都没有找到时返回起始目录
 */
std::string find_project_root(const std::string &start_dir);

/** 按候选路径顺序查找配置文件 */
std::optional<std::string> find_config_file(const std::string &project_root,
                                            const std::optional<std::string> &explicit_path);

/**
 * @brief 在 base 之上叠加配置文件中的值
 * @throws ConfigError 文件无法解析或值非法
 */
AppConfig load_app_config(const std::string &file_path, AppConfig base);

void apply_command_line(AppConfig &config, const CommandLineOptions &options);

std::vector<std::string> split_list(const std::string &text, char separator = ',');

} // namespace autom8_tui
