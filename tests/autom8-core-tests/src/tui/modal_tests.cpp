#include <catch2/catch.hpp>

#include <tui_modal.hpp>

#include <variant>

namespace modal_tests {

using namespace autom8_tui;
using Code = KeyEvent::Code;

KeyEvent ch(char c) {
    return KeyEvent::of_char(c);
}

TEST_CASE("HostSelectionModal toggles hosts and confirms", "[modal][hosts]") {
    HostSelectionModal modal("Select Hosts", {"sw1", "sw2", "sw3"}, {"sw2"});
    CHECK(modal.checked_count() == 1);
    CHECK(modal.row_count() == 4);

    SECTION("row 0 selects everything") {
        CHECK(modal.handle_key(ch(' ')) == ModalOutcome::PENDING);
        CHECK(modal.all_checked());
        modal.handle_key(ch(' '));
        CHECK(modal.checked_count() == 0);
    }

    SECTION("single rows toggle and Enter confirms") {
        modal.handle_key(KeyEvent::of(Code::ARROW_DOWN));
        modal.handle_key(ch(' '));
        modal.handle_key(ch('j'));
        modal.handle_key(ch(' '));
        CHECK(modal.handle_key(KeyEvent::of(Code::RETURN)) == ModalOutcome::CONFIRMED);
        CHECK(modal.checked_hosts() == std::set<std::string>{"sw1"});
    }

    SECTION("cursor wraps around") {
        modal.handle_key(KeyEvent::of(Code::ARROW_UP));
        CHECK(modal.cursor() == 3);
        modal.handle_key(KeyEvent::of(Code::ARROW_DOWN));
        CHECK(modal.cursor() == 0);
        modal.handle_key(KeyEvent::of(Code::END));
        CHECK(modal.cursor() == 3);
    }

    SECTION("Esc cancels") {
        CHECK(modal.handle_key(KeyEvent::of(Code::ESCAPE)) == ModalOutcome::CANCELLED);
    }
}

TEST_CASE("HostSelectionModal scroll window follows the cursor", "[modal][hosts]") {
    std::vector<std::string> hosts;
    for (int i = 0; i < 30; ++i) {
        hosts.push_back("host" + std::to_string(i));
    }
    HostSelectionModal modal("Select Hosts", hosts, {});
    modal.window().set_visible_rows(5);
    modal.handle_key(KeyEvent::of(Code::PAGE_DOWN));
    modal.handle_key(KeyEvent::of(Code::PAGE_DOWN));
    CHECK(modal.cursor() == 8);
    CHECK(modal.window().top() == 4);
}

TEST_CASE("VaultPasswordModal masks input and clears it on cancel", "[modal][vault][secret]") {
    VaultPasswordModal modal;
    for (char c : std::string("q1w2e3r4")) {
        CHECK(modal.handle_key(ch(c)) == ModalOutcome::PENDING);
    }
    CHECK(modal.length() == 8);
    CHECK(modal.masked() == "********");

    CHECK(modal.handle_key(KeyEvent::of(Code::ESCAPE)) == ModalOutcome::CANCELLED);
    CHECK(modal.secret_cleared());
    CHECK(modal.length() == 0);
}

TEST_CASE("VaultPasswordModal refuses an empty passphrase", "[modal][vault]") {
    VaultPasswordModal modal;
    CHECK(modal.handle_key(KeyEvent::of(Code::RETURN)) == ModalOutcome::PENDING);
    CHECK(modal.hint() == "Passphrase is empty");

    modal.handle_key(ch('a'));
    CHECK(modal.hint().empty());
    modal.handle_key(ch('b'));
    modal.handle_key(KeyEvent::of(Code::BACKSPACE));
    CHECK(modal.masked() == "*");
    CHECK(modal.handle_key(KeyEvent::of(Code::RETURN)) == ModalOutcome::CONFIRMED);

    SecretBuffer secret = modal.take_secret();
    CHECK(std::string(secret.data(), secret.size()) == "a");
    CHECK(modal.secret_cleared());
}

TEST_CASE("VaultPasswordModal keeps multi-byte characters whole", "[modal][vault][secret]") {
    VaultPasswordModal modal;
    const KeyEvent e_acute{Code::CHARACTER, "\xC3\xA9"};     // é
    const KeyEvent euro{Code::CHARACTER, "\xE2\x82\xAC"};    // €

    modal.handle_key(e_acute);
    modal.handle_key(ch('a'));
    modal.handle_key(euro);
    CHECK(modal.hint().empty());
    CHECK(modal.length() == 3);
    CHECK(modal.masked() == "***");

    // 退格删除整个字符，不会留下半个UTF-8序列
    modal.handle_key(KeyEvent::of(Code::BACKSPACE));
    CHECK(modal.length() == 2);
    modal.handle_key(KeyEvent{Code::CHARACTER, "\xC3"});
    CHECK(modal.hint() == "Unsupported character ignored");
    CHECK(modal.length() == 2);

    REQUIRE(modal.handle_key(KeyEvent::of(Code::RETURN)) == ModalOutcome::CONFIRMED);
    SecretBuffer secret = modal.take_secret();
    CHECK(std::string(secret.data(), secret.size()) == "\xC3\xA9" "a");
}

TEST_CASE("ConfirmModal answers", "[modal]") {
    ConfirmModal modal(ConfirmPurpose::QUIT_WHILE_RUNNING, "Quit", "Really?");
    CHECK(modal.handle_key(ch('x')) == ModalOutcome::PENDING);
    CHECK(modal.handle_key(ch('y')) == ModalOutcome::CONFIRMED);
    CHECK(modal.handle_key(ch('n')) == ModalOutcome::CANCELLED);
    CHECK(modal.handle_key(KeyEvent::of(Code::ESCAPE)) == ModalOutcome::CANCELLED);
}

TEST_CASE("ModalStack routes keys to the top modal", "[modal]") {
    ModalStack modals;
    CHECK(modals.handle_key(ch('a')) == ModalOutcome::PENDING);

    modals.push(TextModal("Help", {"line"}));
    modals.push(VaultPasswordModal());
    CHECK(modals.top_kind() == ModalKind::VAULT_PASSWORD);

    modals.handle_key(ch('z'));
    CHECK(std::get<VaultPasswordModal>(modals.top()).length() == 1);

    modals.pop();
    CHECK(modals.top_kind() == ModalKind::TEXT);
    CHECK(modals.handle_key(ch('q')) == ModalOutcome::CONFIRMED);
    modals.clear();
    CHECK(modals.empty());
}

} // namespace modal_tests
