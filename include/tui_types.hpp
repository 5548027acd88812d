#pragma once
#include <cstddef>
#include <set>
#include <string>
#include <vector>

namespace autom8_tui {

struct Host {
  std::string name;
  std::string address;
  std::vector<std::string> groups;

  std::string display_name() const {
    return address.empty() || address == name ? name : name + " (" + address + ")";
  }
};

struct TargetType {
  std::string name;
  std::vector<Host> hosts;

  std::string display_name() const {
    return name + " (" + std::to_string(hosts.size()) + ")";
  }
};

struct Site {
  std::string name;
  std::string display;
  std::vector<TargetType> target_types;

  std::string display_name() const { return display.empty() ? name : display; }
  std::size_t host_count() const {
    std::size_t count = 0;
    for (const auto &type : target_types)
      count += type.hosts.size();
    return count;
  }
};

struct Playbook {
  std::string name;
  std::string path;
  std::string description;
  std::vector<std::string> required_vars;
};

struct Catalog {
  std::string inventory_path;
  std::string playbooks_dir;
  std::vector<Site> sites;
  std::vector<Playbook> playbooks;
  std::vector<std::string> errors;

  int find_site(const std::string &name) const;
  int find_playbook(const std::string &name) const;
  bool has_host(const std::string &name) const;
};

struct Selection {
  int site_index = 0;
  int target_type_index = 0;
  std::set<std::string> hosts;
  std::string playbook;
  bool vault_mode = false;

  std::vector<std::string> host_list() const {
    return std::vector<std::string>(hosts.begin(), hosts.end());
  }
};

inline const Site *current_site(const Catalog &catalog, const Selection &selection) {
  if (selection.site_index < 0 || selection.site_index >= static_cast<int>(catalog.sites.size()))
    return nullptr;
  return &catalog.sites[selection.site_index];
}

inline const TargetType *current_target_type(const Catalog &catalog, const Selection &selection) {
  const Site *site = current_site(catalog, selection);
  if (!site || selection.target_type_index < 0 ||
      selection.target_type_index >= static_cast<int>(site->target_types.size()))
    return nullptr;
  return &site->target_types[selection.target_type_index];
}

} // namespace autom8_tui
