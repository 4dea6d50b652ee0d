#include <gtest/gtest.h>

#include <cctype>
#include <string>
#include <thread>
#include <vector>

#include "cache/cache.hpp"
#include "test_helpers.hpp"

using cache::LocalMirror;
using test_helpers::TempDir;

TEST(Cache, DisabledMirrorReturnsInput)
{
    TempDir dir;
    LocalMirror mirror(dir.path() / "cache", false);
    std::string source = dir.file("book.xlsx");
    test_helpers::writeFile(source, "payload");
    EXPECT_EQ(mirror.ensureLocalCopy(source), source);
    EXPECT_EQ(mirror.copiesMade(), 0u);
}

TEST(Cache, NameIsHashPlusBasename)
{
    TempDir dir;
    LocalMirror mirror(dir.path() / "cache", true);
    std::string name = mirror.cacheNameFor("/mnt/share/finance/Budget.xlsx");
    ASSERT_EQ(name.size(), 16u + 1u + std::string("Budget.xlsx").size());
    for (int i = 0; i < 16; ++i)
        EXPECT_TRUE(std::isxdigit(static_cast<unsigned char>(name[i])));
    EXPECT_EQ(name.substr(16), "_Budget.xlsx");
    EXPECT_NE(name, mirror.cacheNameFor("/mnt/share/hr/Budget.xlsx"));
}

TEST(Cache, CopiesOnceWhileFresh)
{
    TempDir dir;
    LocalMirror mirror(dir.path() / "cache", true);
    std::string source = dir.file("book.xlsx");
    test_helpers::writeFile(source, "version one");

    std::string local = mirror.ensureLocalCopy(source);
    EXPECT_NE(local, source);
    EXPECT_EQ(test_helpers::readFile(local), "version one");
    EXPECT_EQ(mirror.ensureLocalCopy(source), local);
    EXPECT_EQ(mirror.copiesMade(), 1u);
}

TEST(Cache, RefreshesStaleCopy)
{
    TempDir dir;
    LocalMirror mirror(dir.path() / "cache", true);
    std::string source = dir.file("book.xlsx");
    test_helpers::writeFile(source, "version one");
    std::string local = mirror.ensureLocalCopy(source);

    test_helpers::writeFile(source, "version two");
    std::filesystem::last_write_time(source, std::filesystem::last_write_time(local) + std::chrono::seconds(10));

    EXPECT_EQ(mirror.ensureLocalCopy(source), local);
    EXPECT_EQ(test_helpers::readFile(local), "version two");
    EXPECT_EQ(mirror.copiesMade(), 2u);
}

TEST(Cache, MissingSourceFallsBackToNetworkPath)
{
    TempDir dir;
    LocalMirror mirror(dir.path() / "cache", true);
    std::string missing = dir.file("gone.xlsx");
    EXPECT_EQ(mirror.ensureLocalCopy(missing), missing);
    EXPECT_EQ(mirror.copiesMade(), 0u);
}

TEST(Cache, ConcurrentRequestsCopyEachFileOnce)
{
    TempDir dir;
    LocalMirror mirror(dir.path() / "cache", true);

    std::vector<std::string> sources;
    for (int i = 0; i < 8; ++i)
    {
        std::string source = dir.file("book" + std::to_string(i) + ".xlsx");
        test_helpers::writeFile(source, std::string(64 * 1024, static_cast<char>('a' + i)));
        sources.push_back(source);
    }

    std::vector<std::string> results(sources.size() * 2);
    std::vector<std::thread> threads;
    for (std::size_t t = 0; t < results.size(); ++t)
    {
        threads.emplace_back([&mirror, &sources, &results, t]()
                             { results[t] = mirror.ensureLocalCopy(sources[t % sources.size()]); });
    }
    for (auto &thread : threads)
        thread.join();

    EXPECT_EQ(mirror.copiesMade(), sources.size());
    for (std::size_t t = 0; t < results.size(); ++t)
    {
        const std::string &source = sources[t % sources.size()];
        EXPECT_NE(results[t], source);
        EXPECT_EQ(test_helpers::readFile(results[t]), test_helpers::readFile(source));
    }
}
