#include "container/packer.hpp"
#include "container/types.hpp"
#include "container/unpacker.hpp"
#include "utils/errors.hpp"

#include <gtest/gtest.h>

#include <array>
#include <cstdio>
#include <cstring>
#include <sstream>
#include <string>
#include <vector>

namespace {

using arcstream::container::ContainerEntry;
using arcstream::container::ContainerPacker;
using arcstream::container::ContainerUnpacker;
using arcstream::container::EntryType;
using arcstream::container::kBlockSize;

struct Member {
    ContainerEntry entry;
    std::string content;
    bool incomplete {false};
};

ContainerEntry fileEntry(const std::string& path, std::uint64_t size)
{
    ContainerEntry entry;
    entry.path = path;
    entry.size = size;
    entry.modifiedTime = 1700000000;
    return entry;
}

std::vector<Member> unpackAll(const std::string& data)
{
    std::istringstream input(data);
    ContainerUnpacker unpacker(input);
    std::vector<Member> members;

    ContainerEntry entry;
    while (true) {
        const bool more = unpacker.next(entry);
        if (const auto incomplete = unpacker.takeIncomplete()) {
            if (!members.empty() && members.back().entry.path == *incomplete) {
                members.back().incomplete = true;
            }
        }
        if (!more) {
            break;
        }

        Member member {entry, {}};
        char buffer[333];
        while (const auto got = unpacker.read(buffer, sizeof(buffer))) {
            member.content.append(buffer, got);
        }
        members.push_back(std::move(member));
    }
    return members;
}

// Minimal ustar header with a valid checksum.
std::array<char, kBlockSize> rawHeader(const std::string& name, std::uint64_t size, char type)
{
    std::array<char, kBlockSize> block {};
    std::memcpy(block.data(), name.data(), std::min<std::size_t>(name.size(), 100));
    std::snprintf(block.data() + 100, 8, "%07o", 0644);
    std::snprintf(block.data() + 108, 8, "%07o", 0);
    std::snprintf(block.data() + 116, 8, "%07o", 0);
    std::snprintf(block.data() + 124, 12, "%011llo", static_cast<unsigned long long>(size));
    std::snprintf(block.data() + 136, 12, "%011o", 0);
    block[156] = type;
    std::memcpy(block.data() + 257, "ustar", 6);
    std::memcpy(block.data() + 263, "00", 2);

    std::memset(block.data() + 148, ' ', 8);
    unsigned int sum = 0;
    for (const char byte : block) {
        sum += static_cast<unsigned char>(byte);
    }
    std::snprintf(block.data() + 148, 8, "%06o", sum);
    block[155] = ' ';
    return block;
}

std::string padded(const std::string& content)
{
    auto result = content;
    result.append((kBlockSize - content.size() % kBlockSize) % kBlockSize, '\0');
    return result;
}

} // namespace

TEST(ContainerTest, PacksAndUnpacksFilesAndDirectories)
{
    std::ostringstream sink;
    ContainerPacker packer(sink, 100);

    ContainerEntry directory;
    directory.path = "project";
    directory.type = EntryType::Directory;
    directory.mode = 0755;
    packer.addDirectory(directory);

    const std::string readme = "read me first\n";
    std::istringstream readmeStream(readme);
    packer.addFile(fileEntry("project/README", readme.size()), readmeStream);

    const std::string binary(1500, '\x7f');
    std::istringstream binaryStream(binary);
    packer.addFile(fileEntry("project/data/blob.bin", binary.size()), binaryStream);

    std::istringstream emptyStream;
    packer.addFile(fileEntry("project/empty", 0), emptyStream);
    packer.finish();

    EXPECT_EQ(packer.entryCount(), 4U);
    EXPECT_EQ(sink.str().size() % kBlockSize, 0U);
    EXPECT_EQ(packer.bytesWritten(), sink.str().size());

    const auto members = unpackAll(sink.str());
    ASSERT_EQ(members.size(), 4U);

    EXPECT_EQ(members[0].entry.path, "project/");
    EXPECT_EQ(members[0].entry.type, EntryType::Directory);
    EXPECT_EQ(members[0].entry.mode, 0755U);

    EXPECT_EQ(members[1].entry.path, "project/README");
    EXPECT_EQ(members[1].content, readme);
    EXPECT_EQ(members[1].entry.modifiedTime, 1700000000);

    EXPECT_EQ(members[2].entry.path, "project/data/blob.bin");
    EXPECT_EQ(members[2].content, binary);

    EXPECT_EQ(members[3].entry.path, "project/empty");
    EXPECT_TRUE(members[3].content.empty());
}

TEST(ContainerTest, WritesUstarMagicAndTwoZeroBlocksAtTheEnd)
{
    std::ostringstream sink;
    ContainerPacker packer(sink);
    std::istringstream content("abc");
    packer.addFile(fileEntry("a.txt", 3), content);
    packer.finish();

    const auto data = sink.str();
    ASSERT_EQ(data.size(), 4 * kBlockSize);
    EXPECT_EQ(data.compare(257, 5, "ustar"), 0);
    EXPECT_EQ(data.substr(2 * kBlockSize), std::string(2 * kBlockSize, '\0'));
}

TEST(ContainerTest, KeepsLongPathsIntact)
{
    const std::string splittable = std::string(120, 'd') + "/" + std::string(90, 'f');
    const std::string unsplittable = "root/" + std::string(180, 'x') + ".txt";

    std::ostringstream sink;
    ContainerPacker packer(sink);
    std::istringstream first("one");
    packer.addFile(fileEntry(splittable, 3), first);
    std::istringstream second("two");
    packer.addFile(fileEntry(unsplittable, 3), second);
    packer.finish();

    const auto members = unpackAll(sink.str());
    ASSERT_EQ(members.size(), 2U);
    EXPECT_EQ(members[0].entry.path, splittable);
    EXPECT_EQ(members[0].content, "one");
    EXPECT_EQ(members[1].entry.path, unsplittable);
    EXPECT_EQ(members[1].content, "two");
}

TEST(ContainerTest, SkipsUnreadContentWhenAdvancing)
{
    std::ostringstream sink;
    ContainerPacker packer(sink);
    std::istringstream first(std::string(2000, 'a'));
    packer.addFile(fileEntry("first", 2000), first);
    std::istringstream second("second");
    packer.addFile(fileEntry("second", 6), second);
    packer.finish();

    std::istringstream input(sink.str());
    ContainerUnpacker unpacker(input);
    ContainerEntry entry;

    ASSERT_TRUE(unpacker.next(entry));
    char buffer[10];
    EXPECT_EQ(unpacker.read(buffer, sizeof(buffer)), sizeof(buffer));
    EXPECT_EQ(unpacker.remaining(), 1990U);

    ASSERT_TRUE(unpacker.next(entry));
    EXPECT_EQ(entry.path, "second");
    EXPECT_FALSE(unpacker.next(entry));
}

TEST(ContainerTest, ShortContentIsPaddedAndFlaggedIncomplete)
{
    std::ostringstream sink;
    ContainerPacker packer(sink);

    std::istringstream shrunk("only ten b");
    EXPECT_THROW(packer.addFile(fileEntry("shrunk.txt", 100), shrunk), arcstream::container::ShortEntryError);

    std::istringstream next("next");
    packer.addFile(fileEntry("next.txt", 4), next);
    packer.finish();

    const auto members = unpackAll(sink.str());
    ASSERT_EQ(members.size(), 2U);
    EXPECT_EQ(members[0].content.size(), 100U);
    EXPECT_EQ(members[0].content.substr(0, 10), "only ten b");
    EXPECT_TRUE(members[0].incomplete);
    EXPECT_EQ(members[1].content, "next");
    EXPECT_FALSE(members[1].incomplete);
}

TEST(ContainerTest, IncompleteMarkerBeforeTheEndIsReported)
{
    std::ostringstream sink;
    ContainerPacker packer(sink);
    std::istringstream shrunk("abc");
    EXPECT_THROW(packer.addFile(fileEntry("last.bin", 2000), shrunk), arcstream::container::ShortEntryError);
    packer.finish();

    const auto members = unpackAll(sink.str());
    ASSERT_EQ(members.size(), 1U);
    EXPECT_TRUE(members[0].incomplete);
}

TEST(ContainerTest, ChecksumMismatchIsAFormatError)
{
    std::ostringstream sink;
    ContainerPacker packer(sink);
    std::istringstream content("payload");
    packer.addFile(fileEntry("file.txt", 7), content);
    packer.finish();

    auto data = sink.str();
    data[0] = 'g';

    EXPECT_THROW(unpackAll(data), arcstream::ContainerFormatError);
}

TEST(ContainerTest, TruncatedStreamIsAFormatError)
{
    std::ostringstream sink;
    ContainerPacker packer(sink);
    std::istringstream content(std::string(4000, 'z'));
    packer.addFile(fileEntry("big.bin", 4000), content);
    packer.finish();

    EXPECT_THROW(unpackAll(sink.str().substr(0, 2048)), arcstream::ContainerFormatError);
    EXPECT_THROW(unpackAll(sink.str().substr(0, 300)), arcstream::ContainerFormatError);
}

TEST(ContainerTest, MissingEndOfArchiveMarkerIsAFormatError)
{
    std::ostringstream sink;
    ContainerPacker packer(sink);
    std::istringstream content("complete record");
    packer.addFile(fileEntry("whole.txt", 15), content);
    packer.finish();

    const auto withoutMarker = sink.str().substr(0, 2 * kBlockSize);
    EXPECT_THROW(unpackAll(withoutMarker), arcstream::ContainerFormatError);
    EXPECT_THROW(unpackAll({}), arcstream::ContainerFormatError);
}

TEST(ContainerTest, ReadsGnuLongNamesAndIgnoresGlobalHeaders)
{
    const std::string longName = "deep/" + std::string(200, 'n') + "/file.txt";
    std::string data;

    const auto global = rawHeader("pax_global_header", 17, 'g');
    data.append(global.data(), global.size());
    data += padded("17 comment=hello\n");

    const auto longLink = rawHeader("././@LongLink", longName.size() + 1, 'L');
    data.append(longLink.data(), longLink.size());
    data += padded(longName + '\0');

    const auto file = rawHeader("truncated-name", 5, '0');
    data.append(file.data(), file.size());
    data += padded("hello");

    const auto symlink = rawHeader("link", 0, '2');
    data.append(symlink.data(), symlink.size());
    data.append(2 * kBlockSize, '\0');

    const auto members = unpackAll(data);
    ASSERT_EQ(members.size(), 2U);
    EXPECT_EQ(members[0].entry.path, longName);
    EXPECT_EQ(members[0].content, "hello");
    EXPECT_EQ(members[1].entry.type, EntryType::Symlink);
}
