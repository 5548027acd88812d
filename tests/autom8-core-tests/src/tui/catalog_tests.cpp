#include <catch2/catch.hpp>

#include <tui_catalog.hpp>
#include <tui_config.hpp>
#include <tui_errors.hpp>

#include "test_support.hpp"

namespace catalog_tests {

using namespace autom8_tui;
using test_support::TempDir;

const char* const INVENTORY = R"(all:
  hosts:
    bastion:
  children:
    DC1:
      vars:
        site_name: Data Center 1
      children:
        Switches:
          hosts:
            sw1:
              ansible_host: 10.0.0.1
            sw2:
        Routers:
          hosts:
            rt1:
    DC2:
      hosts:
        lonely:
)";

TEST_CASE("Inventory groups become sites and target types", "[catalog]") {
    TempDir dir;
    auto file = dir.write("hosts.yml", INVENTORY);

    auto sites = load_inventory(file.string());
    REQUIRE(sites.size() == 3);

    const Site& dc1 = sites[0];
    CHECK(dc1.name == "DC1");
    CHECK(dc1.display_name() == "Data Center 1");
    REQUIRE(dc1.target_types.size() == 2);
    CHECK(dc1.target_types[0].name == "Switches");
    REQUIRE(dc1.target_types[0].hosts.size() == 2);
    CHECK(dc1.target_types[0].hosts[0].name == "sw1");
    CHECK(dc1.target_types[0].hosts[0].address == "10.0.0.1");
    CHECK(dc1.target_types[0].hosts[1].name == "sw2");
    CHECK(dc1.target_types[0].display_name() == "Switches (2)");
    CHECK(dc1.target_types[1].name == "Routers");
    CHECK(dc1.host_count() == 3);

    CHECK(sites[1].name == "DC2");
    REQUIRE(sites[1].target_types.size() == 1);
    CHECK(sites[1].target_types[0].name == "ungrouped");

    CHECK(sites[2].name == "ungrouped");
    CHECK(sites[2].target_types[0].hosts[0].name == "bastion");
}

TEST_CASE("Inventory directories merge files and skip variable directories", "[catalog]") {
    TempDir dir;
    dir.write("inventory/dc1.yml", "DC1:\n  children:\n    Switches:\n      hosts:\n        sw1:\n");
    dir.write("inventory/dc1-more.yaml", "DC1:\n  children:\n    Switches:\n      hosts:\n        sw2:\n");
    dir.write("inventory/group_vars/all.yml", "this: [is not parsed\n");

    auto sites = load_inventory((dir.path() / "inventory").string());
    REQUIRE(sites.size() == 1);
    REQUIRE(sites[0].target_types.size() == 1);
    CHECK(sites[0].target_types[0].hosts.size() == 2);
}

TEST_CASE("Malformed or missing inventory raises CatalogLoadError", "[catalog]") {
    TempDir dir;
    auto broken = dir.write("broken.yml", "all: [unclosed\n");
    CHECK_THROWS_AS(load_inventory(broken.string()), CatalogLoadError);
    CHECK_THROWS_AS(load_inventory((dir.path() / "missing.yml").string()), CatalogLoadError);
}

TEST_CASE("Playbook discovery reads plays and keeps malformed files", "[catalog]") {
    TempDir dir;
    dir.write("playbooks/site.yml",
              "- name: Configure switches\n"
              "  hosts: all\n"
              "  vars_prompt:\n"
              "    - name: vlan_id\n"
              "      prompt: VLAN?\n"
              "  tasks: []\n");
    dir.write("playbooks/nested/ping.yml", "- import_playbook: ../site.yml\n");
    dir.write("playbooks/vars/common.yml", "ntp_server: 10.0.0.5\n");
    dir.write("playbooks/roles/base/tasks/main.yml", "- name: task\n  hosts: all\n");
    dir.write("playbooks/broken.yml", "- name: [oops\n");
    dir.write("playbooks/README.md", "not yaml\n");

    std::vector<std::string> warnings;
    auto playbooks = load_playbooks((dir.path() / "playbooks").string(), &warnings);
    REQUIRE(playbooks.size() == 3);
    CHECK(playbooks[0].name == "broken.yml");
    CHECK(playbooks[1].name == "nested/ping.yml");
    CHECK(playbooks[2].name == "site.yml");
    CHECK(playbooks[2].description == "Configure switches");
    CHECK(playbooks[2].required_vars == std::vector<std::string>{"vlan_id"});
    CHECK(warnings.size() == 1);

    CHECK_THROWS_AS(load_playbooks((dir.path() / "nope").string()), CatalogLoadError);
}

const char* const INVENTORY_LIST = R"({
  "_meta": {"hostvars": {"sw1": {"ansible_host": "10.0.0.1"}, "rt1": {}}},
  "all": {"children": ["ungrouped", "DC1"]},
  "DC1": {"children": {"Switches": {}, "Routers": {}}},
  "Switches": {"hosts": ["sw1", "sw2"]},
  "Routers": {"hosts": {"rt1": {}}, "children": ["DC1"]},
  "ungrouped": {"hosts": ["bastion"]}
})";

TEST_CASE("ansible-inventory list output becomes sites", "[catalog][ansible-inventory]") {
    auto sites = sites_from_inventory_list(INVENTORY_LIST);
    REQUIRE(sites.size() == 2);

    const Site& dc1 = sites[0];
    CHECK(dc1.name == "DC1");
    REQUIRE(dc1.target_types.size() == 2);
    CHECK(dc1.target_types[0].name == "Switches");
    REQUIRE(dc1.target_types[0].hosts.size() == 2);
    CHECK(dc1.target_types[0].hosts[0].address == "10.0.0.1");
    CHECK(dc1.target_types[0].hosts[1].address == "sw2");
    // Routers -> DC1 的循环只展开一次
    CHECK(dc1.target_types[1].name == "Routers");
    CHECK(dc1.target_types[1].hosts.size() == 1);

    CHECK(sites[1].name == "ungrouped");
    CHECK(sites[1].target_types[0].hosts[0].name == "bastion");

    CHECK_THROWS_AS(sites_from_inventory_list("[1, 2]"), CatalogLoadError);
    CHECK_THROWS_AS(sites_from_inventory_list("{\"_meta\": {}}"), CatalogLoadError);
    CHECK_THROWS_AS(sites_from_inventory_list("{\"all\": [unclosed"), CatalogLoadError);
}

TEST_CASE("load_catalog prefers the inventory command for INI inventories", "[catalog][ansible-inventory]") {
    TempDir dir;
    auto ini = dir.write("inventory/hosts", "[Switches]\nsw1\nsw2\n\n[DC1:children]\nSwitches\n");
    dir.write("playbooks/ping.yml", "- hosts: all\n  tasks: []\n");

    AppConfig config = AppConfig::defaults_for(dir.path().string());
    config.inventory_path = ini.string();
    config.inventory_command = dir.write_script("fake-inventory",
        "[ \"$1\" = -i ] && [ \"$2\" = '" + ini.string() + "' ] && [ \"$3\" = --list ] || exit 2\n"
        "echo 'deprecation noise' >&2\n"
        "cat <<'EOF'\n"
        "{\"all\": {\"children\": [\"DC1\"]}, \"DC1\": {\"children\": [\"Switches\"]},\n"
        " \"Switches\": {\"hosts\": [\"sw1\", \"sw2\"]}}\n"
        "EOF\n").string();

    Catalog catalog = load_catalog(config);
    CHECK(catalog.errors.empty());
    REQUIRE(catalog.sites.size() == 1);
    CHECK(catalog.sites[0].name == "DC1");
    CHECK(catalog.sites[0].host_count() == 2);

    // 直接指定的INI文件不能按YAML读取
    CHECK_THROWS_AS(load_inventory(ini.string()), CatalogLoadError);
}

TEST_CASE("load_catalog falls back to YAML when the inventory command fails", "[catalog][ansible-inventory]") {
    TempDir dir;
    dir.write("inventory/dc1.yml", "DC1:\n  children:\n    Switches:\n      hosts:\n        sw1:\n");
    dir.write("inventory/hosts", "[Routers]\nrt1 ansible_host=10.0.0.9\n");
    dir.write("playbooks/ping.yml", "- hosts: all\n  tasks: []\n");

    AppConfig config = AppConfig::defaults_for(dir.path().string());

    SECTION("command exits non-zero") {
        config.inventory_command = dir.write_script("fake-inventory", "echo '{}'\nexit 1\n").string();
    }
    SECTION("command prints no groups") {
        config.inventory_command = dir.write_script("fake-inventory", "echo '{\"_meta\": {}}'\n").string();
    }
    SECTION("command missing") {
        config.inventory_command = (dir.path() / "no-such-inventory-tool").string();
    }
    SECTION("command disabled") {
        config.inventory_command.clear();
    }

    Catalog catalog = load_catalog(config);
    CHECK(catalog.errors.empty());
    REQUIRE(catalog.sites.size() == 1);
    CHECK(catalog.sites[0].target_types[0].hosts[0].name == "sw1");
}

TEST_CASE("load_catalog records errors instead of throwing", "[catalog]") {
    TempDir dir;
    dir.write("playbooks/ping.yml", "- hosts: all\n  tasks: []\n");
    AppConfig config = AppConfig::defaults_for(dir.path().string());

    Catalog catalog = load_catalog(config);
    CHECK(catalog.sites.empty());
    CHECK(catalog.errors.size() == 1);
    CHECK(catalog.playbooks.size() == 1);
    CHECK(catalog.find_playbook("ping") == 0);
    CHECK(catalog.find_playbook("ping.yml") == 0);
    CHECK(catalog.find_playbook("deploy") == -1);
}

} // namespace catalog_tests
