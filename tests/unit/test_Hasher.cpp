#include <gtest/gtest.h>
#include "crypto/Hasher.hpp"
#include "log/Registry.hpp"
#include "fakes/testDirs.hpp"

#include <spdlog/sinks/ringbuffer_sink.h>

#include <filesystem>

using ts::crypto::Hasher;
namespace fs = std::filesystem;

namespace {
constexpr auto EMPTY_SHA256 = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
constexpr auto ABC_SHA256 = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
}

TEST(HasherTest, KnownDigests) {
    EXPECT_EQ(Hasher::sha256Hex(""), EMPTY_SHA256);
    EXPECT_EQ(Hasher::sha256Hex("abc"), ABC_SHA256);
}

TEST(HasherTest, IncrementalMatchesOneShot) {
    const std::string data = "The quick brown fox jumps over the lazy dog";

    Hasher h;
    for (size_t i = 0; i < data.size(); i += 5) h.update(std::string_view(data).substr(i, 5));

    EXPECT_EQ(h.finalHex(), Hasher::sha256Hex(data));
    EXPECT_TRUE(h.finalized());
}

TEST(HasherTest, CannotReuseAfterFinal) {
    Hasher h;
    h.update("abc");
    ASSERT_EQ(h.finalHex(), ABC_SHA256);

    EXPECT_THROW(h.update("more"), std::logic_error);
    EXPECT_THROW((void)h.finalHex(), std::logic_error);
}

TEST(HasherTest, HashFileMatchesContent) {
    const auto dir = ts::test::makeTestDir();
    const auto file = dir / "blob.bin";

    std::string content(20000, '\0');
    for (size_t i = 0; i < content.size(); ++i) content[i] = static_cast<char>(i % 251);
    ts::test::writeTextFile(file, content);

    EXPECT_EQ(Hasher::hashFile(file), Hasher::sha256Hex(content));
    fs::remove_all(dir);
}

TEST(HasherTest, HashFileMissingThrows) {
    EXPECT_THROW((void)Hasher::hashFile("/nonexistent/ticketsync/file"), std::runtime_error);
}

TEST(HasherTest, HashFileFailureIsLogged) {
    const auto logger = ts::log::Registry::crypto();
    const auto sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(8);
    logger->sinks().push_back(sink);

    EXPECT_THROW((void)Hasher::hashFile("/nonexistent/ticketsync/file"), std::runtime_error);
    logger->sinks().pop_back();

    const auto lines = sink->last_formatted();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("/nonexistent/ticketsync/file"), std::string::npos);
    EXPECT_NE(lines[0].find("[Hasher]"), std::string::npos);
}
