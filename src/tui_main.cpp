#include "core/execution_engine.hpp"
#include "core/output_buffer.hpp"
#include "core/trace.hpp"
#include "tui_catalog.hpp"
#include "tui_config.hpp"
#include "tui_core.hpp"
#include "tui_errors.hpp"
#include "tui_logic.hpp"
#include "tui_render.hpp"
#include <filesystem>
#include <iostream>

using namespace autom8_tui;

namespace fs = std::filesystem;

void show_help() {
  std::cout << "AutoM8 - 交互式 Ansible 剧本运行工具\n\n用法: autom8 [选项]\n\n选项:\n";
  std::cout << "  --help, -h              显示此帮助信息\n"
               "  --version, -v           显示版本信息\n"
               "  --config, -c <文件>     指定配置文件\n"
               "  --inventory, -i <路径>  清单文件或目录\n"
               "  --playbook, -p <名称>   预选剧本\n"
               "  --site <名称>           预选站点\n"
               "  --targets <a,b>         预选目标类型\n"
               "  --vault                 默认开启vault口令\n"
               "  --debug, -d             提高日志级别（可重复）\n"
               "  --cwd <目录>            项目根目录\n\n交互控制:\n";
  std::cout << "  Tab/Shift+Tab  切换窗格\n  上下键         上下导航\n  空格/Enter     选择\n"
               "  r/F5           运行剧本\n  k              取消运行\n  v              切换vault模式\n"
               "  h              帮助\n  q              退出程序\n\n";
}

void show_version() { std::cout << "AutoM8 v" << AUTOM8_VERSION << "\nAnsible Made Easy\n"; }

int main(int argc, char *argv[]) {
  CommandLineOptions options;
  try {
    options = parse_command_line(argc, argv);
  } catch (const ConfigError &e) {
    std::cerr << "参数错误: " << e.what() << "\n使用 --help 查看可用选项\n";
    return 2;
  }

  if (options.show_help) {
    show_help();
    return 0;
  }
  if (options.show_version) {
    show_version();
    return 0;
  }

  try {
    std::string start_dir = options.cwd ? fs::absolute(*options.cwd).lexically_normal().string()
                                        : fs::current_path().string();
    std::string project_root = options.cwd ? start_dir : find_project_root(start_dir);

    AppConfig config = AppConfig::defaults_for(project_root);
    if (auto config_file = find_config_file(project_root, options.config_path)) {
      config = load_app_config(*config_file, config);
    } else if (options.config_path) {
      std::cerr << "错误: 无法找到配置文件: " << *options.config_path << std::endl;
      return 1;
    }
    apply_command_line(config, options);

    trace::init(config.log.file, trace::lowered_level(config.log.level, config.debug_level));
    AUTOM8_TRACE_INFO("STARTUP", std::string("AutoM8 v") + AUTOM8_VERSION + " root=" + config.project_root);
    if (!config.config_path.empty())
      AUTOM8_TRACE_INFO("STARTUP", "Config: " + config.config_path);

    OutputBuffer buffer(config.output_capacity);
    ExecutionEngine engine(buffer, config.execution);

    UIState state;
    state.load_catalog(load_catalog(config));
    state.apply_defaults(config);

    UILogic logic(state, engine, buffer, config);
    UIRenderer renderer(state, logic, engine, buffer, config);

    int exit_code = renderer.run();
    logic.shutdown();

    AUTOM8_TRACE_INFO("SHUTDOWN", "Exit code " + std::to_string(exit_code));
    trace::shutdown();
    return exit_code;

  } catch (const std::exception &e) {
    AUTOM8_TRACE_ERROR("STARTUP", e.what());
    trace::shutdown();
    std::cerr << "启动错误: " << e.what() << std::endl;
    return 1;
  }
}
