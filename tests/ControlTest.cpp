#include "FakeScreen.hpp"
#include "TempDir.hpp"
#include "ipc/Control.hpp"
#include "ipc/Events.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <cstring>
#include <functional>
#include <optional>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <thread>

using namespace std::chrono_literals;

// polls the server on this thread until done is set or the deadline passes
static void pumpUntil(CControlServer& server, const std::atomic<bool>& done, std::function<void()> onIdle = nullptr) {
    const auto DEADLINE = std::chrono::steady_clock::now() + 3s;
    while (!done && std::chrono::steady_clock::now() < DEADLINE) {
        if (onIdle)
            onIdle();

        std::vector<pollfd> fds;
        for (const auto FD : server.pollFDs()) {
            fds.push_back({.fd = FD, .events = POLLIN, .revents = 0});
        }

        if (poll(fds.data(), fds.size(), 20) <= 0)
            continue;

        for (auto& p : fds) {
            if (p.revents)
                server.dispatch(p.fd, p.revents);
        }
    }
}

class ControlTest : public ::testing::Test {
  protected:
    void SetUp() override {
        ASSERT_TRUE(m_dir.good());
        m_pHistory = std::make_unique<CHistoryStore>(m_dir.path("history.json"));
    }

    nlohmann::json run(const std::string& line) {
        const SControlContext CTX = {.engine = m_pEngine.get(), .history = m_pHistory.get(), .hotkeyLabel = "Super+Shift+C", .hotkeyRegistered = true};
        return NControl::handle(line, CTX);
    }

    CTempDir                         m_dir;
    std::unique_ptr<CHistoryStore>   m_pHistory;
    std::unique_ptr<CPickModeEngine> m_pEngine;
};

TEST(ControlParsing, SplitCommand) {
    EXPECT_EQ(NControl::splitCommand("  label 1-abc  my  color\n"), (std::pair<std::string, std::string>{"label", "1-abc  my  color"}));
    EXPECT_EQ(NControl::splitCommand("status\r\n"), (std::pair<std::string, std::string>{"status", ""}));
    EXPECT_EQ(NControl::splitCommand("   "), (std::pair<std::string, std::string>{"", ""}));
}

TEST_F(ControlTest, UnknownAndEmptyRequests) {
    const auto UNKNOWN = run("frobnicate");
    EXPECT_EQ(UNKNOWN["ok"], false);
    EXPECT_EQ(UNKNOWN["kind"], "InvalidArgument");

    EXPECT_EQ(run("")["ok"], false);
}

TEST_F(ControlTest, StatusWithoutEngine) {
    const auto STATUS = run("status");
    EXPECT_EQ(STATUS["ok"], true);
    EXPECT_EQ(STATUS["state"], "unavailable");
    EXPECT_EQ(STATUS["hotkey"]["label"], "Super+Shift+C");
    EXPECT_EQ(STATUS["hotkey"]["registered"], true);
    EXPECT_EQ(STATUS["history"]["count"], 0);

    EXPECT_EQ(run("pick")["ok"], false);
    EXPECT_EQ(run("hotkey")["label"], "Super+Shift+C");
}

TEST_F(ControlTest, HistoryCommands) {
    const auto ENTRY = m_pHistory->add(SColorInfo{.hex = "#FF8800", .rgb = {255, 0x88, 0}});
    ASSERT_TRUE(ENTRY.has_value());

    auto listed = run("history");
    ASSERT_EQ(listed["entries"].size(), 1u);
    EXPECT_EQ(listed["entries"][0]["hex"], "#FF8800");
    EXPECT_EQ(listed["entries"][0]["id"], ENTRY->id);

    EXPECT_EQ(run("label " + ENTRY->id + " warm orange")["ok"], true);
    EXPECT_EQ(m_pHistory->entries()[0].label, "warm orange");

    const auto BADLABEL = run("label 1-nothere00 x");
    EXPECT_EQ(BADLABEL["ok"], false);
    EXPECT_EQ(BADLABEL["kind"], "InvalidArgument");

    EXPECT_EQ(run("remove 1-nothere00")["ok"], true);
    EXPECT_EQ(run("remove")["ok"], false);
    EXPECT_EQ(run("remove " + ENTRY->id)["ok"], true);
    EXPECT_EQ(m_pHistory->size(), 0u);

    const auto SAVED = run(R"(save [{"id": "9-zzzzzzzzz", "rgb": [1, 2, 3], "timestamp": 9}, {"id": "bad"}])");
    EXPECT_EQ(SAVED["ok"], true);
    EXPECT_EQ(SAVED["count"], 1);
    EXPECT_EQ(SAVED["skipped"], 1);
    EXPECT_EQ(m_pHistory->entries()[0].hex, "#010203");

    EXPECT_EQ(run("save {}")["ok"], false);

    EXPECT_EQ(run("clear")["ok"], true);
    EXPECT_EQ(m_pHistory->size(), 0u);
}

TEST_F(ControlTest, PickAndCancel) {
    CFakeCursor cursor;
    m_pEngine = std::make_unique<CPickModeEngine>(makeShared<CFakeScreen>(100, 100, gradientPixel), &cursor, nullptr);

    const auto PICK = run("pick");
    EXPECT_EQ(PICK["ok"], true);
    EXPECT_EQ(PICK["armed"], true);
    EXPECT_EQ(run("pick")["armed"], false);

    EXPECT_EQ(run("cancel")["cancelled"], true);
    EXPECT_TRUE(m_pEngine->waitForIdle(2s));
    EXPECT_EQ(run("status")["state"], "idle");

    m_pEngine.reset();
}

TEST_F(ControlTest, SocketRoundTrip) {
    const auto     PATH = m_dir.path("ctl.sock");
    CControlServer server(PATH, [this](const std::string& line, FControlReply reply) { reply(NEvents::dump(run(line))); });
    ASSERT_TRUE(server.listen().has_value());

    // a second instance must not steal the socket
    CControlServer second(PATH, [](const std::string&, FControlReply reply) { reply("{}"); });
    EXPECT_FALSE(second.listen().has_value());

    std::atomic<int>  code = -1;
    std::atomic<bool> done = false;
    std::thread       client([&]() {
        code = NControl::send(PATH, "status");
        done = true;
    });

    pumpUntil(server, done);

    client.join();
    EXPECT_EQ(code.load(), 0);
}

TEST_F(ControlTest, DeferredReplyKeepsTheClientWaiting) {
    const auto                   PATH = m_dir.path("deferred.sock");
    std::optional<FControlReply> pending;
    auto server = std::make_unique<CControlServer>(PATH, [&](const std::string&, FControlReply reply) { pending = reply; });
    ASSERT_TRUE(server->listen().has_value());

    std::atomic<int>  code = -1;
    std::atomic<bool> done = false;
    std::thread       client([&]() {
        code = NControl::send(PATH, "clear");
        done = true;
    });

    // the request is in, the client is no longer polled but still connected
    std::atomic<bool> received = false;
    pumpUntil(*server, received, [&]() { received = pending.has_value(); });

    if (!pending) {
        server.reset();
        client.join();
        FAIL() << "the handler never saw the request";
    }

    EXPECT_EQ(server->pollFDs().size(), 1u);
    EXPECT_FALSE(done.load());

    (*pending)(R"({"ok":true})");
    // a second answer for the same client goes nowhere
    (*pending)(R"({"ok":false})");

    client.join();
    EXPECT_EQ(code.load(), 0);
}

TEST_F(ControlTest, ReplyAfterServerIsGoneIsIgnored) {
    const auto                   PATH = m_dir.path("gone.sock");
    std::optional<FControlReply> pending;
    std::atomic<bool>            received = false;
    std::atomic<int>             code     = -1;

    auto server = std::make_unique<CControlServer>(PATH, [&](const std::string&, FControlReply reply) { pending = reply; });
    ASSERT_TRUE(server->listen().has_value());

    std::thread client([&]() { code = NControl::send(PATH, "clear"); });

    pumpUntil(*server, received, [&]() { received = pending.has_value(); });
    server.reset();
    client.join();

    ASSERT_TRUE(pending.has_value());
    (*pending)(R"({"ok":true})");

    // dropped without an answer
    EXPECT_EQ(code.load(), 1);
}

TEST_F(ControlTest, InvalidUTF8RequestsGetAnErrorReply) {
    const auto ENTRY = m_pHistory->add(SColorInfo{.hex = "#FF8800", .rgb = {255, 0x88, 0}});
    ASSERT_TRUE(ENTRY.has_value());

    const SControlContext CTX = {.engine = nullptr, .history = m_pHistory.get()};

    std::string           line;
    ASSERT_NO_THROW(line = NControl::reply("label " + ENTRY->id + " \xff\xfe", CTX));
    auto reply = nlohmann::json::parse(line);
    EXPECT_EQ(reply["ok"], false);
    EXPECT_EQ(reply["kind"], "InvalidArgument");
    EXPECT_FALSE(m_pHistory->entries()[0].label.has_value());

    ASSERT_NO_THROW(line = NControl::reply("\xff", CTX));
    reply = nlohmann::json::parse(line);
    EXPECT_EQ(reply["ok"], false);
    EXPECT_NE(reply["error"].get<std::string>().find("\xef\xbf\xbd"), std::string::npos);

    // the file is still readable
    CHistoryStore reloaded(m_pHistory->path());
    EXPECT_EQ(*reloaded.load(), 1u);
}

TEST(ControlParsing, WritesHistory) {
    EXPECT_TRUE(NControl::writesHistory("save []"));
    EXPECT_TRUE(NControl::writesHistory("  label 1-abc x"));
    EXPECT_TRUE(NControl::writesHistory("remove 1-abc"));
    EXPECT_TRUE(NControl::writesHistory("clear\n"));
    EXPECT_FALSE(NControl::writesHistory("history"));
    EXPECT_FALSE(NControl::writesHistory("status"));
    EXPECT_FALSE(NControl::writesHistory("pick"));
}

TEST_F(ControlTest, StaleSocketIsReplaced) {
    const auto PATH = m_dir.path("stale.sock");
    {
        CControlServer first(PATH, [](const std::string&, FControlReply reply) { reply("{}"); });
        ASSERT_TRUE(first.listen().has_value());
    }

    // the first server unlinked its socket; leave a dead one behind instead
    const int FD = socket(AF_UNIX, SOCK_STREAM, 0);
    ASSERT_GE(FD, 0);
    sockaddr_un addr = {.sun_family = AF_UNIX};
    strncpy(addr.sun_path, PATH.c_str(), sizeof(addr.sun_path) - 1);
    ASSERT_EQ(bind(FD, (sockaddr*)&addr, sizeof(addr)), 0);
    close(FD);

    CControlServer second(PATH, [](const std::string&, FControlReply reply) { reply("{}"); });
    EXPECT_TRUE(second.listen().has_value());
}

TEST(ControlClient, NobodyListening) {
    EXPECT_EQ(NControl::send("/tmp/hyprsnap-test-nobody-here.sock", "status"), 1);
}
