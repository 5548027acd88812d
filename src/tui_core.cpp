#include "tui_core.hpp"
#include "tui_config.hpp"
#include <algorithm>

namespace autom8_tui {

void UIState::set_notice(std::string text, NoticeLevel level) {
  notice = Notice{std::move(text), level, std::chrono::steady_clock::now() + NOTICE_DURATION};
}

const Notice *UIState::active_notice() const {
  if (!notice || std::chrono::steady_clock::now() >= notice->expires_at)
    return nullptr;
  return &*notice;
}

void UIState::load_catalog(Catalog new_catalog) {
  std::string site_name;
  std::string type_name;
  if (const Site *site = current_site(catalog, selection))
    site_name = site->name;
  if (const TargetType *type = current_target_type(catalog, selection))
    type_name = type->name;

  catalog = std::move(new_catalog);

  selection.site_index = 0;
  selection.target_type_index = 0;
  int site_index = site_name.empty() ? -1 : catalog.find_site(site_name);
  if (site_index >= 0) {
    selection.site_index = site_index;
    const auto &types = catalog.sites[site_index].target_types;
    for (size_t i = 0; i < types.size(); ++i)
      if (types[i].name == type_name)
        selection.target_type_index = static_cast<int>(i);
  }

  for (auto it = selection.hosts.begin(); it != selection.hosts.end();) {
    if (catalog.has_host(*it))
      ++it;
    else
      it = selection.hosts.erase(it);
  }
  if (!selection.playbook.empty() && catalog.find_playbook(selection.playbook) < 0)
    selection.playbook.clear();

  focus.clamp_cursors(catalog, selection);
}

void UIState::apply_defaults(const AppConfig &config) {
  selection.vault_mode = config.ask_vault;

  if (!config.default_site.empty()) {
    int index = catalog.find_site(config.default_site);
    if (index >= 0) {
      selection.site_index = index;
      selection.target_type_index = 0;
    } else {
      set_notice("Unknown site: " + config.default_site, NoticeLevel::WARNING);
    }
  }

  std::vector<std::string> unknown;
  for (const auto &host : config.default_targets) {
    if (catalog.has_host(host))
      selection.hosts.insert(host);
    else
      unknown.push_back(host);
  }
  if (!unknown.empty()) {
    std::string text = "Unknown host(s):";
    for (const auto &host : unknown)
      text += " " + host;
    set_notice(text, NoticeLevel::WARNING);
  }

  if (!config.default_playbook.empty()) {
    int index = catalog.find_playbook(config.default_playbook);
    if (index >= 0) {
      selection.playbook = catalog.playbooks[index].name;
      focus.set_cursor(PaneId::PLAYBOOKS, static_cast<size_t>(index));
    } else {
      set_notice("Unknown playbook: " + config.default_playbook, NoticeLevel::WARNING);
    }
  }

  if (!catalog.errors.empty())
    set_notice(catalog.errors.front(), NoticeLevel::ERROR);
}

const Playbook *UIState::chosen_playbook() const {
  int index = catalog.find_playbook(selection.playbook);
  return index < 0 || selection.playbook.empty() ? nullptr : &catalog.playbooks[index];
}

} // namespace autom8_tui
