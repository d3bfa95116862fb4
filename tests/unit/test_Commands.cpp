#include <gtest/gtest.h>
#include "shell/commands.hpp"
#include "shell/Router.hpp"
#include "runtime/Deps.hpp"
#include "config/Config.hpp"
#include "index/Reconciler.hpp"
#include "fakes/FakeClient.hpp"
#include "fakes/FakeTransport.hpp"
#include "fakes/MemoryStore.hpp"
#include "fakes/testDirs.hpp"

#include <filesystem>

using namespace ts;
using namespace ts::shell;
using ts::runtime::Deps;
namespace fs = std::filesystem;

class CommandsTest : public ::testing::Test {
protected:
    fs::path test_dir;
    config::Config cfg;
    std::shared_ptr<test::MemoryStore> store = std::make_shared<test::MemoryStore>();
    std::shared_ptr<test::FakeTransport> transport = std::make_shared<test::FakeTransport>();
    std::shared_ptr<test::FakeClient> client = std::make_shared<test::FakeClient>();
    Router router;

    void SetUp() override {
        test_dir = test::makeTestDir();
        cfg.storage.downloads_dir = test_dir;
        Deps::reset();
        registerAllCommands(router);
    }

    void TearDown() override {
        Deps::reset();
        fs::remove_all(test_dir);
    }

    void initDeps(const bool withRemote = true) {
        Deps::init(cfg, store, withRemote ? transport : nullptr, withRemote ? client : nullptr);
    }

    void serve(const std::string& ticket, const std::string& name, const std::string& body) {
        const auto url = "https://files/" + ticket + "/" + name;
        transport->on(url, body);
        client->attachments[ticket].push_back({url, "2024-03-05T10:00:00Z", name, name});
    }
};

TEST_F(CommandsTest, WhoamiBeforeLogin) {
    initDeps();
    const auto res = router.execute({"whoami"});

    EXPECT_EQ(res.exit_code, 0);
    EXPECT_EQ(res.stdout_text, "Not logged in\n");
}

TEST_F(CommandsTest, LoginStoresSessionAndFetches) {
    initDeps();
    client->assignees["agent@example.com"] = "42";
    client->openTickets["42"] = {"101"};
    serve("101", "trace.txt", "stack trace");

    const auto res = router.execute({"login", "agent@example.com"});

    EXPECT_EQ(res.exit_code, 0) << res.stderr_text;
    EXPECT_NE(res.stdout_text.find("Logged in as agent@example.com"), std::string::npos);
    EXPECT_EQ(store->data.at(LAST_EMAIL_KEY), "agent@example.com");
    EXPECT_EQ(store->data.at(LAST_ID_KEY), "42");
    EXPECT_TRUE(fs::exists(test_dir / "tickets" / "101" / "2024-03-05" / "trace.txt"));

    const auto who = router.execute({"whoami"});
    EXPECT_EQ(who.stdout_text, "agent@example.com (assignee 42)\n");
}

TEST_F(CommandsTest, LoginWithUnknownEmailFails) {
    initDeps();
    const auto res = router.execute({"login", "ghost@example.com"});

    EXPECT_EQ(res.exit_code, 1);
    EXPECT_FALSE(store->data.contains(LAST_ID_KEY));
}

TEST_F(CommandsTest, FetchNeedsStoredAssignee) {
    initDeps();
    EXPECT_EQ(router.execute({"fetch"}).exit_code, 1);
}

TEST_F(CommandsTest, RemoteCommandsNeedCredentials) {
    initDeps(false);
    const auto res = router.execute({"attachments", "101"});

    EXPECT_EQ(res.exit_code, 1);
    EXPECT_NE(res.stderr_text.find("credentials"), std::string::npos);
    EXPECT_EQ(router.execute({"list"}).exit_code, 0);
}

TEST_F(CommandsTest, UsageErrors) {
    initDeps();
    EXPECT_EQ(router.execute({"attachments"}).exit_code, 2);
    EXPECT_EQ(router.execute({"remove"}).exit_code, 2);
    EXPECT_EQ(router.execute({"login"}).exit_code, 2);
    EXPECT_EQ(router.execute({"reset"}).exit_code, 2);
}

TEST_F(CommandsTest, AttachmentsThenListThenRemove) {
    initDeps();
    serve("101", "a.txt", "alpha");
    serve("102", "b.txt", "beta");

    ASSERT_EQ(router.execute({"attachments", "101", "102"}).exit_code, 0);

    const auto list = router.execute({"list"});
    EXPECT_NE(list.stdout_text.find("101\t1 attachment(s)"), std::string::npos);
    EXPECT_NE(list.stdout_text.find("102\t1 attachment(s)"), std::string::npos);

    const auto removed = router.execute({"rm", "101", "999"});
    EXPECT_EQ(removed.exit_code, 0);
    EXPECT_NE(removed.stdout_text.find("Removed: 101"), std::string::npos);
    EXPECT_NE(removed.stdout_text.find("Not found: 999"), std::string::npos);
    EXPECT_FALSE(fs::exists(test_dir / "tickets" / "101"));
    EXPECT_TRUE(fs::exists(test_dir / "tickets" / "102"));
}

TEST_F(CommandsTest, ScrubRemovesClosedTickets) {
    initDeps();
    serve("1", "a.txt", "one");
    serve("2", "b.txt", "two");
    serve("3", "c.txt", "three");
    ASSERT_EQ(router.execute({"attachments", "1", "2", "3"}).exit_code, 0);
    client->statuses = {{"1", "solved"}, {"2", "open"}, {"3", "closed"}};

    const auto res = router.execute({"scrub"});

    EXPECT_EQ(res.exit_code, 0);
    ASSERT_EQ(client->statusRequests.size(), 1u);
    EXPECT_EQ(client->statusRequests[0], (std::vector<std::string>{"1", "2", "3"}));

    const auto snap = Deps::get().reconciler->snapshot();
    EXPECT_EQ(snap.size(), 1u);
    EXPECT_TRUE(snap.contains("2"));
}

TEST_F(CommandsTest, ResetNeedsConfirmation) {
    initDeps();
    serve("101", "a.txt", "alpha");
    ASSERT_EQ(router.execute({"attachments", "101"}).exit_code, 0);

    EXPECT_EQ(router.execute({"reset"}).exit_code, 2);
    EXPECT_FALSE(Deps::get().reconciler->snapshot().empty());

    EXPECT_EQ(router.execute({"reset", "--yes"}).exit_code, 0);
    EXPECT_TRUE(Deps::get().reconciler->snapshot().empty());
}

TEST_F(CommandsTest, ConfigPrintsJson) {
    initDeps();
    const auto res = router.execute({"config"});

    EXPECT_EQ(res.exit_code, 0);
    EXPECT_NE(res.stdout_text.find("\"closed_statuses\""), std::string::npos);
    EXPECT_NE(res.stdout_text.find("\"api_token\""), std::string::npos);
}

TEST_F(CommandsTest, HelpListsCommands) {
    initDeps();
    const auto res = router.execute({"--help"});

    EXPECT_EQ(res.exit_code, 0);
    for (const auto* name : {"login <email>", "attachments <ticketId>...", "scrub", "reset --yes"})
        EXPECT_NE(res.stdout_text.find(name), std::string::npos) << name;
}
