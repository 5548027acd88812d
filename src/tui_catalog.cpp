#include "tui_catalog.hpp"
#include "core/process_capture.hpp"
#include "core/trace.hpp"
#include "tui_config.hpp"
#include "tui_errors.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <map>
#include <set>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace autom8_tui {

// ==================== Catalog 查询 ====================

int Catalog::find_site(const std::string &name) const {
  for (size_t i = 0; i < sites.size(); ++i)
    if (sites[i].name == name || sites[i].display == name)
      return static_cast<int>(i);
  return -1;
}

int Catalog::find_playbook(const std::string &name) const {
  for (size_t i = 0; i < playbooks.size(); ++i) {
    const auto &playbook = playbooks[i];
    if (playbook.name == name || fs::path(playbook.name).stem().string() == name)
      return static_cast<int>(i);
  }
  return -1;
}

bool Catalog::has_host(const std::string &name) const {
  for (const auto &site : sites)
    for (const auto &type : site.target_types)
      for (const auto &host : type.hosts)
        if (host.name == name)
          return true;
  return false;
}

namespace {

// 不作为站点/目标类型处理的保留键
const std::vector<std::string> RESERVED_KEYS = {"hosts", "children", "vars"};
const std::vector<std::string> SKIPPED_GROUPS = {"all", "ungrouped", "_meta"};
const std::vector<std::string> SKIPPED_INVENTORY_DIRS = {"group_vars", "host_vars"};
const std::vector<std::string> SKIPPED_PLAYBOOK_DIRS = {"roles", "group_vars", "host_vars"};
const std::chrono::milliseconds INVENTORY_QUERY_TIMEOUT{30000};

bool contains(const std::vector<std::string> &items, const std::string &value) {
  return std::find(items.begin(), items.end(), value) != items.end();
}

bool is_yaml_file(const fs::path &path) {
  auto ext = path.extension().string();
  return ext == ".yml" || ext == ".yaml";
}

bool is_hosts_file(const fs::path &path) { return path.filename() == "hosts"; }

struct HostEntry {
  std::string name;
  std::string address;
};

// 合并多文件时的中间结构，保持首次出现的顺序
struct GroupNode {
  std::string name;
  std::string display;
  std::vector<HostEntry> hosts;
  std::vector<GroupNode> children;

  GroupNode &child(const std::string &child_name) {
    for (auto &node : children)
      if (node.name == child_name)
        return node;
    children.push_back(GroupNode{child_name, "", {}, {}});
    return children.back();
  }

  void add_host(const std::string &host_name, const std::string &address) {
    for (auto &entry : hosts) {
      if (entry.name == host_name) {
        if (!address.empty())
          entry.address = address;
        return;
      }
    }
    hosts.push_back(HostEntry{host_name, address});
  }
};

std::string scalar_or_empty(const YAML::Node &node, const char *key) {
  if (!node.IsMap() || !node[key] || !node[key].IsScalar())
    return "";
  return node[key].as<std::string>("");
}

void merge_group(GroupNode &target, const YAML::Node &node) {
  if (!node || !node.IsMap())
    return;

  if (auto vars = node["vars"]) {
    std::string display = scalar_or_empty(vars, "site_name");
    if (display.empty())
      display = scalar_or_empty(vars, "display_name");
    if (!display.empty())
      target.display = display;
  }

  if (auto hosts = node["hosts"]) {
    if (hosts.IsMap()) {
      for (const auto &item : hosts)
        target.add_host(item.first.as<std::string>(), scalar_or_empty(item.second, "ansible_host"));
    } else if (hosts.IsSequence()) {
      for (const auto &item : hosts)
        if (item.IsScalar())
          target.add_host(item.as<std::string>(), "");
    }
  }

  if (auto children = node["children"]) {
    if (children.IsMap())
      for (const auto &item : children)
        merge_group(target.child(item.first.as<std::string>()), item.second);
  }

  // 非保留键且值为映射：视为隐式子组
  for (const auto &item : node) {
    std::string key = item.first.as<std::string>("");
    if (key.empty() || contains(RESERVED_KEYS, key))
      continue;
    if (item.second.IsMap() || item.second.IsNull())
      merge_group(target.child(key), item.second);
  }
}

// skip_non_yaml: 目录中发现的 hosts 文件多半是INI格式，解析失败时跳过
void merge_inventory_file(GroupNode &root, const fs::path &file, bool skip_non_yaml) {
  YAML::Node doc;
  try {
    doc = YAML::LoadFile(file.string());
  } catch (const YAML::Exception &e) {
    if (skip_non_yaml) {
      AUTOM8_TRACE_WARN("INVENTORY", "Skipping non-YAML inventory file " + file.string());
      return;
    }
    throw CatalogLoadError("Failed to load inventory file " + file.string() + ": " + e.what());
  }
  if (!doc || doc.IsNull())
    return;
  if (!doc.IsMap()) {
    if (skip_non_yaml) {
      AUTOM8_TRACE_WARN("INVENTORY", "Skipping non-YAML inventory file " + file.string());
      return;
    }
    throw CatalogLoadError("Inventory file " + file.string() + " is not a YAML mapping");
  }

  try {
    if (doc["all"])
      merge_group(root, doc["all"]);
    else
      merge_group(root, doc);
  } catch (const YAML::Exception &e) {
    throw CatalogLoadError("Malformed inventory file " + file.string() + ": " + e.what());
  }
}

void collect_hosts(const GroupNode &group, std::vector<std::string> chain,
                   std::vector<Host> &out) {
  chain.push_back(group.name);
  for (const auto &entry : group.hosts) {
    auto existing = std::find_if(out.begin(), out.end(),
                                 [&](const Host &host) { return host.name == entry.name; });
    if (existing != out.end())
      continue;
    out.push_back(Host{entry.name, entry.address.empty() ? entry.name : entry.address, chain});
  }
  for (const auto &child : group.children)
    collect_hosts(child, chain, out);
}

Site build_site(const GroupNode &group) {
  Site site;
  site.name = group.name;
  site.display = group.display;

  if (!group.hosts.empty()) {
    TargetType direct;
    direct.name = "ungrouped";
    for (const auto &entry : group.hosts)
      direct.hosts.push_back(Host{entry.name, entry.address.empty() ? entry.name : entry.address,
                                  {group.name}});
    site.target_types.push_back(std::move(direct));
  }

  for (const auto &child : group.children) {
    TargetType type;
    type.name = child.name;
    collect_hosts(child, {group.name}, type.hosts);
    if (!type.hosts.empty())
      site.target_types.push_back(std::move(type));
  }
  return site;
}

std::vector<Site> sites_from_tree(const GroupNode &root) {
  std::vector<Site> sites;
  for (const auto &group : root.children) {
    if (contains(SKIPPED_GROUPS, group.name))
      continue;
    Site site = build_site(group);
    if (!site.target_types.empty())
      sites.push_back(std::move(site));
  }

  // all 下直接挂的主机和 ungrouped 组归入 "ungrouped" 站点
  GroupNode loose{"ungrouped", "", root.hosts, {}};
  for (const auto &group : root.children)
    if (group.name == "ungrouped")
      for (const auto &entry : group.hosts)
        loose.add_host(entry.name, entry.address);
  if (!loose.hosts.empty())
    sites.push_back(build_site(loose));
  return sites;
}

// ansible-inventory 的 children/hosts 既可能是列表也可能是映射
std::vector<std::string> member_names(const YAML::Node &node) {
  std::vector<std::string> names;
  if (!node)
    return names;
  if (node.IsSequence()) {
    for (const auto &item : node)
      if (item.IsScalar())
        names.push_back(item.as<std::string>());
  } else if (node.IsMap()) {
    for (const auto &item : node)
      names.push_back(item.first.as<std::string>());
  }
  return names;
}

struct InventoryList {
  std::map<std::string, YAML::Node> groups;
  YAML::Node hostvars;

  std::string address_of(const std::string &host) const {
    if (!hostvars || !hostvars.IsMap() || !hostvars[host])
      return "";
    return scalar_or_empty(hostvars[host], "ansible_host");
  }

  void expand(GroupNode &target, const std::string &name, std::set<std::string> seen) const {
    if (!seen.insert(name).second)
      return;
    auto it = groups.find(name);
    if (it == groups.end())
      return;
    for (const auto &child : member_names(it->second["children"]))
      expand(target.child(child), child, seen);
    for (const auto &host : member_names(it->second["hosts"]))
      target.add_host(host, address_of(host));
  }
};

} // namespace

std::vector<Site> sites_from_inventory_list(const std::string &json_text) {
  InventoryList list;
  std::string root_name;
  try {
    YAML::Node data = YAML::Load(json_text);
    if (!data || !data.IsMap())
      throw CatalogLoadError("ansible-inventory output is not a JSON object");
    for (const auto &item : data) {
      std::string name = item.first.as<std::string>();
      if (name == "_meta") {
        if (item.second.IsMap() && item.second["hostvars"])
          list.hostvars = item.second["hostvars"];
        continue;
      }
      if (!item.second.IsMap())
        continue;
      list.groups.emplace(name, item.second);
      if (root_name.empty())
        root_name = name;
    }
  } catch (const YAML::Exception &e) {
    throw CatalogLoadError(std::string("Malformed ansible-inventory output: ") + e.what());
  }
  if (list.groups.empty())
    throw CatalogLoadError("ansible-inventory output has no groups");
  if (list.groups.count("all"))
    root_name = "all";

  GroupNode root{"all", "", {}, {}};
  try {
    list.expand(root, root_name, {});
  } catch (const YAML::Exception &e) {
    throw CatalogLoadError(std::string("Malformed ansible-inventory output: ") + e.what());
  }
  return sites_from_tree(root);
}

std::optional<std::vector<Site>> query_ansible_inventory(const std::string &command,
                                                         const std::string &inventory_path,
                                                         const std::string &working_dir, std::string *reason) {
  auto fail = [&](const std::string &why) -> std::optional<std::vector<Site>> {
    if (reason)
      *reason = why;
    return std::nullopt;
  };

  CapturedOutput captured =
      capture_command({command, "-i", inventory_path, "--list"}, working_dir, INVENTORY_QUERY_TIMEOUT);
  if (!captured.launched)
    return fail(command + " unavailable: " + captured.error);
  if (!captured.succeeded())
    return fail(command + " failed" +
                (captured.error.empty() ? " with exit " + std::to_string(captured.exit_code.value_or(-1))
                                        : ": " + captured.error));

  std::vector<Site> sites;
  try {
    sites = sites_from_inventory_list(captured.output);
  } catch (const CatalogLoadError &e) {
    return fail(e.what());
  }
  if (sites.empty())
    return fail(command + " returned no sites");

  AUTOM8_TRACE_INFO("INVENTORY", "Loaded " + std::to_string(sites.size()) + " site(s) via " + command +
                                     " from " + inventory_path);
  return sites;
}

std::vector<Site> load_inventory(const std::string &inventory_path) {
  fs::path path(inventory_path);
  std::error_code ec;
  if (!fs::exists(path, ec))
    throw CatalogLoadError("Inventory not found: " + inventory_path);

  std::vector<fs::path> files;
  const bool from_directory = fs::is_directory(path, ec);
  if (from_directory) {
    auto it = fs::recursive_directory_iterator(path, ec);
    if (ec)
      throw CatalogLoadError("Cannot read inventory directory " + inventory_path + ": " + ec.message());
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
      if (ec)
        throw CatalogLoadError("Cannot read inventory directory " + inventory_path + ": " + ec.message());
      if (it->is_directory() && contains(SKIPPED_INVENTORY_DIRS, it->path().filename().string())) {
        it.disable_recursion_pending();
        continue;
      }
      if (it->is_regular_file() && (is_yaml_file(it->path()) || is_hosts_file(it->path())))
        files.push_back(it->path());
    }
    std::sort(files.begin(), files.end());
  } else {
    files.push_back(path);
  }

  GroupNode root{"all", "", {}, {}};
  for (const auto &file : files)
    merge_inventory_file(root, file, from_directory && is_hosts_file(file));

  std::vector<Site> sites = sites_from_tree(root);

  AUTOM8_TRACE_INFO("INVENTORY", "Loaded " + std::to_string(sites.size()) + " site(s) from " +
                                     std::to_string(files.size()) + " file(s) under " + inventory_path);
  return sites;
}

std::vector<Playbook> load_playbooks(const std::string &playbooks_dir, std::vector<std::string> *warnings) {
  fs::path root(playbooks_dir);
  std::error_code ec;
  if (!fs::is_directory(root, ec))
    throw CatalogLoadError("Playbooks directory not found: " + playbooks_dir);

  std::vector<Playbook> playbooks;
  auto it = fs::recursive_directory_iterator(root, ec);
  if (ec)
    throw CatalogLoadError("Cannot read playbooks directory " + playbooks_dir + ": " + ec.message());
  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec)
      throw CatalogLoadError("Cannot read playbooks directory " + playbooks_dir + ": " + ec.message());
    if (it->is_directory() && contains(SKIPPED_PLAYBOOK_DIRS, it->path().filename().string())) {
      it.disable_recursion_pending();
      continue;
    }
    if (!it->is_regular_file() || !is_yaml_file(it->path()))
      continue;

    Playbook playbook;
    playbook.name = fs::relative(it->path(), root).generic_string();
    playbook.path = fs::absolute(it->path()).lexically_normal().string();

    try {
      YAML::Node doc = YAML::LoadFile(it->path().string());
      // 不是 play 列表的YAML（变量文件等）不算剧本
      if (!doc.IsSequence() || doc.size() == 0 || !doc[0].IsMap())
        continue;
      const YAML::Node first = doc[0];
      if (!first["hosts"] && !first["import_playbook"] && !first["ansible.builtin.import_playbook"])
        continue;
      playbook.description = scalar_or_empty(first, "name");
      for (const auto &play : doc) {
        if (!play.IsMap() || !play["vars_prompt"] || !play["vars_prompt"].IsSequence())
          continue;
        for (const auto &prompt : play["vars_prompt"]) {
          std::string var = scalar_or_empty(prompt, "name");
          if (!var.empty() && !contains(playbook.required_vars, var))
            playbook.required_vars.push_back(var);
        }
      }
    } catch (const YAML::Exception &e) {
      std::string warning = "Malformed playbook " + playbook.name + ": " + e.what();
      AUTOM8_TRACE_WARN("PLAYBOOKS", warning);
      if (warnings)
        warnings->push_back(warning);
    }
    playbooks.push_back(std::move(playbook));
  }

  std::sort(playbooks.begin(), playbooks.end(),
            [](const Playbook &a, const Playbook &b) { return a.name < b.name; });
  AUTOM8_TRACE_INFO("PLAYBOOKS", "Discovered " + std::to_string(playbooks.size()) +
                                     " playbook(s) under " + playbooks_dir);
  return playbooks;
}

Catalog load_catalog(const AppConfig &config) {
  Catalog catalog;
  catalog.inventory_path = config.inventory_path;
  catalog.playbooks_dir = config.playbooks_dir;

  std::optional<std::vector<Site>> queried;
  if (!config.inventory_command.empty()) {
    std::string reason;
    queried = query_ansible_inventory(config.inventory_command, config.inventory_path, config.project_root, &reason);
    if (!queried)
      AUTOM8_TRACE_INFO("INVENTORY", reason + ", falling back to YAML");
  }

  if (queried) {
    catalog.sites = std::move(*queried);
  } else {
    try {
      catalog.sites = load_inventory(config.inventory_path);
    } catch (const CatalogLoadError &e) {
      AUTOM8_TRACE_ERROR("INVENTORY", e.what());
      catalog.errors.push_back(e.what());
    }
  }

  try {
    catalog.playbooks = load_playbooks(config.playbooks_dir, &catalog.errors);
  } catch (const CatalogLoadError &e) {
    AUTOM8_TRACE_ERROR("PLAYBOOKS", e.what());
    catalog.errors.push_back(e.what());
  }
  return catalog;
}

} // namespace autom8_tui
