#include <gtest/gtest.h>
#include "index/Reconciler.hpp"
#include "fakes/MemoryStore.hpp"
#include "fakes/testDirs.hpp"

#include <filesystem>

using namespace ts::index;
using namespace ts::index::model;
using ts::test::MemoryStore;
namespace fs = std::filesystem;

namespace {

TicketEntry entryWith(const std::string& hash, const std::string& fileName = "file.txt") {
    return TicketEntry{{AttachmentRecord{"https://files/" + hash, "2024-03-05T10:00:00Z", fileName, hash}}};
}

}

class ReconcilerTest : public ::testing::Test {
protected:
    std::shared_ptr<MemoryStore> store;
    std::unique_ptr<Reconciler> reconciler;
    fs::path test_dir;

    void SetUp() override {
        test_dir = ts::test::makeTestDir();
        store = std::make_shared<MemoryStore>();
        reconciler = std::make_unique<Reconciler>(store, test_dir / "tickets");
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    fs::path makeTicketFolder(const std::string& id) const {
        const auto dir = test_dir / "tickets" / id / "2024-03-05";
        fs::create_directories(dir);
        ts::test::writeTextFile(dir / "file.txt", "content");
        return test_dir / "tickets" / id;
    }
};

TEST_F(ReconcilerTest, AddInsertsNewTickets) {
    const auto res = reconciler->add({{"T1", entryWith("h1")}, {"T2", entryWith("h2")}});

    EXPECT_EQ(res.addedTickets, (std::vector<std::string>{"T1", "T2"}));
    EXPECT_TRUE(res.alreadyPresentTickets.empty());

    const auto snap = reconciler->snapshot();
    ASSERT_EQ(snap.size(), 2u);
    EXPECT_EQ(snap.at("T1"), entryWith("h1"));
    EXPECT_TRUE(store->data.at(Reconciler::INDEX_KEY).contains("T2"));
}

TEST_F(ReconcilerTest, ExistingTicketIsNotMerged) {
    reconciler->add({{"T1", entryWith("h1")}});

    const auto res = reconciler->add({{"T1", entryWith("h9", "new.txt")}});

    EXPECT_TRUE(res.addedTickets.empty());
    EXPECT_EQ(res.alreadyPresentTickets, (std::vector<std::string>{"T1"}));
    EXPECT_EQ(reconciler->snapshot().at("T1"), entryWith("h1"));
}

TEST_F(ReconcilerTest, EmptyEntriesAreNotRetained) {
    const auto res = reconciler->add({{"T1", TicketEntry{}}});

    EXPECT_TRUE(res.addedTickets.empty());
    EXPECT_TRUE(reconciler->snapshot().empty());
    EXPECT_EQ(store->writes, 0u);
}

TEST_F(ReconcilerTest, RemoveDeletesEntryAndFolder) {
    reconciler->add({{"T1", entryWith("h1")}, {"T2", entryWith("h2")}});
    const auto folder = makeTicketFolder("T1");

    const auto res = reconciler->remove("T1");

    EXPECT_EQ(res.removed, (std::vector<std::string>{"T1"}));
    EXPECT_TRUE(res.failedDeletions.empty());
    EXPECT_FALSE(fs::exists(folder));
    EXPECT_FALSE(reconciler->snapshot().contains("T1"));
    EXPECT_TRUE(reconciler->snapshot().contains("T2"));

    const auto writesBefore = store->writes;
    const auto again = reconciler->remove("T1");
    EXPECT_TRUE(again.removed.empty());
    EXPECT_EQ(again.notFound, (std::vector<std::string>{"T1"}));
    EXPECT_EQ(store->writes, writesBefore);
}

TEST_F(ReconcilerTest, RemoveToleratesMissingFolder) {
    reconciler->add({{"T1", entryWith("h1")}});

    const auto res = reconciler->remove(std::vector<std::string>{"T1", "T404"});

    EXPECT_EQ(res.removed, (std::vector<std::string>{"T1"}));
    EXPECT_EQ(res.notFound, (std::vector<std::string>{"T404"}));
    EXPECT_TRUE(res.failedDeletions.empty());
}

TEST_F(ReconcilerTest, RemovePersistsOncePerBatch) {
    reconciler->add({{"A", entryWith("a")}, {"B", entryWith("b")}, {"C", entryWith("c")}});
    const auto writesBefore = store->writes;

    reconciler->remove(std::vector<std::string>{"A", "B", "C"});

    EXPECT_EQ(store->writes, writesBefore + 1);
    EXPECT_TRUE(reconciler->snapshot().empty());
}

TEST_F(ReconcilerTest, FolderDeletionFailureKeepsIndexUpdated) {
    const auto root = test_dir / "tickets";
    Reconciler failing(store, root, [&](const fs::path& dir, std::error_code& ec) {
        if (dir == root / "B") {
            ec = std::make_error_code(std::errc::permission_denied);
            return;
        }
        fs::remove_all(dir, ec);
    });
    failing.add({{"A", entryWith("a")}, {"B", entryWith("b")}, {"C", entryWith("c")}, {"D", entryWith("d")}});
    const auto a = makeTicketFolder("A");
    const auto b = makeTicketFolder("B");
    const auto c = makeTicketFolder("C");
    const auto writesBefore = store->writes;

    const auto res = failing.remove(std::vector<std::string>{"A", "B", "C"});

    EXPECT_EQ(res.removed, (std::vector<std::string>{"A", "B", "C"}));
    ASSERT_EQ(res.failedDeletions.size(), 1u);
    EXPECT_EQ(res.failedDeletions[0].ticketId, "B");
    EXPECT_FALSE(res.failedDeletions[0].error.empty());
    EXPECT_FALSE(res.notices.empty());

    EXPECT_EQ(store->writes, writesBefore + 1);
    const auto persisted = store->data.at(Reconciler::INDEX_KEY);
    EXPECT_FALSE(persisted.contains("A"));
    EXPECT_FALSE(persisted.contains("B"));
    EXPECT_FALSE(persisted.contains("C"));
    EXPECT_TRUE(persisted.contains("D"));

    EXPECT_FALSE(fs::exists(a));
    EXPECT_TRUE(fs::exists(b));
    EXPECT_FALSE(fs::exists(c));
}

TEST_F(ReconcilerTest, PathLikeIdsAreRejected) {
    reconciler->add({{"T1", entryWith("h1")}});
    const auto folder = makeTicketFolder("T1");

    const auto res = reconciler->remove(std::vector<std::string>{"..", "T1/..", ""});

    EXPECT_TRUE(res.removed.empty());
    EXPECT_EQ(res.notFound.size(), 3u);
    EXPECT_TRUE(fs::exists(folder));
    EXPECT_TRUE(fs::exists(test_dir / "tickets"));
}

TEST_F(ReconcilerTest, ScrubRemovesOnlyClosedTickets) {
    reconciler->add({{"1", entryWith("h1")}, {"2", entryWith("h2")}, {"3", entryWith("h3")}});
    makeTicketFolder("1");
    makeTicketFolder("2");
    makeTicketFolder("3");

    const auto res = reconciler->scrubByStatus({{"1", "solved"}, {"2", "open"}, {"3", "Closed"}});

    EXPECT_EQ(res.removed, (std::vector<std::string>{"1", "3"}));
    const auto snap = reconciler->snapshot();
    EXPECT_EQ(snap.size(), 1u);
    EXPECT_TRUE(snap.contains("2"));
    EXPECT_TRUE(fs::exists(test_dir / "tickets" / "2"));
    EXPECT_FALSE(fs::exists(test_dir / "tickets" / "1"));
    EXPECT_FALSE(fs::exists(test_dir / "tickets" / "3"));
}

TEST_F(ReconcilerTest, ScrubWithNothingClosedIsNoOp) {
    reconciler->add({{"1", entryWith("h1")}});
    const auto writesBefore = store->writes;

    const auto res = reconciler->scrubByStatus({{"1", "pending"}});

    EXPECT_TRUE(res.removed.empty());
    EXPECT_FALSE(res.notices.empty());
    EXPECT_EQ(store->writes, writesBefore);
    EXPECT_TRUE(reconciler->snapshot().contains("1"));
}

TEST_F(ReconcilerTest, ScrubHonoursCustomClosedSet) {
    reconciler->add({{"1", entryWith("h1")}, {"2", entryWith("h2")}});

    const auto res = reconciler->scrubByStatus({{"1", "solved"}, {"2", "closed"}}, {"solved"});

    EXPECT_EQ(res.removed, (std::vector<std::string>{"1"}));
}

TEST_F(ReconcilerTest, PersistenceFailureLeavesFoldersAlone) {
    reconciler->add({{"T1", entryWith("h1")}});
    const auto folder = makeTicketFolder("T1");
    store->failWrites = true;

    EXPECT_THROW(reconciler->remove("T1"), PersistenceError);
    EXPECT_TRUE(fs::exists(folder));
    EXPECT_TRUE(reconciler->snapshot().contains("T1"));
}

TEST_F(ReconcilerTest, ResetClearsIndexOnly) {
    reconciler->add({{"T1", entryWith("h1")}});
    const auto folder = makeTicketFolder("T1");

    reconciler->reset();

    EXPECT_TRUE(reconciler->snapshot().empty());
    EXPECT_EQ(store->data.at(Reconciler::INDEX_KEY), nlohmann::json::object());
    EXPECT_TRUE(fs::exists(folder));
}

TEST_F(ReconcilerTest, KnownHashesCoverWholeIndex) {
    reconciler->add({{"T1", TicketEntry{{{"u1", "", "a", "h1"}, {"u2", "", "b", "h2"}}}}, {"T2", entryWith("h3")}});

    EXPECT_EQ(reconciler->knownHashes(), (std::unordered_set<std::string>{"h1", "h2", "h3"}));
}
