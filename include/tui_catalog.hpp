#pragma once
#include "tui_types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace autom8_tui {

struct AppConfig;

/**
 * @brief 读取Ansible YAML清单
 *
 * 路径可以是单个文件或目录（递归合并所有 *.yml/*.yaml 和名为 hosts 的
 * 文件，跳过 group_vars/host_vars）。根为 all 组；all 的子组为站点，站点
 * 的子组为目标类型，更深的嵌套组展开到所属目标类型中。
 * 目录中无法按YAML解析的 hosts 文件（INI格式）被跳过。
 *
 * @throws CatalogLoadError 路径不存在或任一文件格式错误
 */
std::vector<Site> load_inventory(const std::string &inventory_path);

/**
 * @brief 把 `ansible-inventory --list` 输出的扁平组表转成站点
 *
 * children 和 hosts 可以是列表或映射，地址取自 _meta.hostvars 的
 * ansible_host。组之间的循环引用只展开一次。
 *
 * @throws CatalogLoadError 不是JSON对象或其中没有任何组
 */
std::vector<Site> sites_from_inventory_list(const std::string &json_text);

/**
 * @brief 运行 `<command> -i <inventory_path> --list` 读取清单
 * 命令不可用、失败、超时、输出无法解析或没有站点时返回空，原因写入 reason
 */
std::optional<std::vector<Site>> query_ansible_inventory(const std::string &command,
                                                         const std::string &inventory_path,
                                                         const std::string &working_dir, std::string *reason);

/**
 * @brief 递归发现剧本文件
 * 格式错误的文件仍然保留（无元数据），原因写入 warnings
 * @throws CatalogLoadError 目录不存在
 */
std::vector<Playbook> load_playbooks(const std::string &playbooks_dir,
                                     std::vector<std::string> *warnings = nullptr);

/**
 * 启动和重新加载时调用，从不抛异常，错误记录在 Catalog::errors
 * 配置了 inventory_command 时先查询 ansible-inventory，不可用再读YAML
 */
Catalog load_catalog(const AppConfig &config);

} // namespace autom8_tui
