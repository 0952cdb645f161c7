#include "compression/zstd/codec.hpp"
#include "compression/zstd/format_tag.hpp"
#include "compression/zstd/stream_buffer.hpp"
#include "container/packer.hpp"
#include "engine/archive_engine.hpp"
#include "integrity/hash_verifier.hpp"
#include "utils/errors.hpp"

#include <minizip-ng/mz.h>
#include <minizip-ng/mz_zip.h>
#include <minizip-ng/mz_zip_rw.h>

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using namespace arcstream::engine;
using arcstream::compression::zstd::PayloadKind;

class ScopedTempDir {
public:
    explicit ScopedTempDir(const std::string& prefix)
    {
        const auto unique = prefix + "_" + std::to_string(
            std::chrono::steady_clock::now().time_since_epoch().count());
        path_ = std::filesystem::temp_directory_path() / unique;
        std::filesystem::create_directories(path_);
    }

    ~ScopedTempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

void writeBinaryFile(const std::filesystem::path& path, const std::string& content)
{
    std::filesystem::create_directories(path.parent_path());
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    output.write(content.data(), static_cast<std::streamsize>(content.size()));
}

std::string readBinaryFile(const std::filesystem::path& path)
{
    std::ifstream input(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
}

std::map<std::string, std::string> collectFiles(const std::filesystem::path& root)
{
    std::map<std::string, std::string> files;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(root)) {
        if (entry.is_regular_file()) {
            files[entry.path().lexically_relative(root).generic_string()] = readBinaryFile(entry.path());
        }
    }
    return files;
}

std::string makeText(std::size_t size)
{
    std::string text;
    while (text.size() < size) {
        text += "The quick brown fox jumps over the lazy dog. " + std::to_string(text.size() % 97) + "\n";
    }
    text.resize(size);
    return text;
}

std::string makeNoise(std::size_t size, std::uint32_t seed)
{
    std::mt19937 generator(seed);
    std::uniform_int_distribution<int> distribution(0, 255);
    std::string data(size, '\0');
    for (auto& byte : data) {
        byte = static_cast<char>(distribution(generator));
    }
    return data;
}

EngineConfig smallChunks()
{
    EngineConfig config;
    config.chunkSize = 16 * 1024;
    config.parallelThreads = 2;
    return config;
}

void buildTree(const std::filesystem::path& root)
{
    writeBinaryFile(root / "readme.md", makeText(5000));
    writeBinaryFile(root / "src" / "main.cpp", "int main() { return 0; }\n");
    writeBinaryFile(root / "src" / "lib" / "util.cpp", makeText(70000));
    writeBinaryFile(root / "assets" / "noise.bin", makeNoise(40000, 5));
    writeBinaryFile(root / "empty.txt", "");
    std::filesystem::create_directories(root / "empty_dir");
}

// Tagged folder archive whose records are written by `fill`.
void writeContainerArchive(const std::filesystem::path& archive,
                           const std::function<void(arcstream::container::ContainerPacker&)>& fill)
{
    std::ofstream output(archive, std::ios::binary | std::ios::trunc);
    arcstream::compression::zstd::writeFormatTag(output, PayloadKind::Container);
    arcstream::compression::zstd::CompressingStreamBuf buffer(output, 3);
    std::ostream sink(&buffer);
    arcstream::container::ContainerPacker packer(sink);
    fill(packer);
    packer.finish();
    buffer.finish();
}

void addMember(arcstream::container::ContainerPacker& packer, const std::string& path, const std::string& content)
{
    arcstream::container::ContainerEntry entry;
    entry.path = path;
    entry.size = content.size();
    std::istringstream input(content);
    packer.addFile(entry, input);
}

} // namespace

TEST(ArchiveEngineTest, SingleFileRoundTripAtEveryLevelBand)
{
    ScopedTempDir temp("engine_single");
    const auto source = temp.path() / "document.txt";
    const auto original = makeText(150000) + makeNoise(20000, 1);
    writeBinaryFile(source, original);

    const ArchiveEngine engine(smallChunks());
    for (const int level : {1, 3, 12, 22}) {
        const auto archive = temp.path() / ("document." + std::to_string(level) + ".zst");
        const auto restored = temp.path() / ("restored." + std::to_string(level) + ".txt");

        CompressOptions options;
        options.level = level;
        const auto compressed = engine.compressFile(source, archive, options);
        EXPECT_EQ(compressed.originalSize, original.size());
        EXPECT_EQ(compressed.compressedSize, std::filesystem::file_size(archive));
        EXPECT_EQ(compressed.filesProcessed, 1U);

        const auto result = engine.decompress(archive, restored);
        EXPECT_TRUE(result.success);
        EXPECT_EQ(result.kind, PayloadKind::SingleFile);
        EXPECT_TRUE(result.tagged);
        EXPECT_EQ(result.integrity, IntegrityStatus::Verified);
        EXPECT_EQ(readBinaryFile(restored), original) << "level " << level;
    }
}

TEST(ArchiveEngineTest, HigherLevelCompressesAtLeastAsWell)
{
    ScopedTempDir temp("engine_levels");
    const auto source = temp.path() / "text.log";
    writeBinaryFile(source, makeText(400000));

    const ArchiveEngine engine(smallChunks());
    CompressOptions fast;
    fast.level = 1;
    CompressOptions strong;
    strong.level = 22;

    const auto fastResult = engine.compressFile(source, temp.path() / "fast.zst", fast);
    const auto strongResult = engine.compressFile(source, temp.path() / "strong.zst", strong);

    EXPECT_GE(strongResult.compressionRatio(), fastResult.compressionRatio());
    EXPECT_GT(fastResult.compressionRatio(), 1.0);
}

TEST(ArchiveEngineTest, WritesSidecarOnlyWhenHashing)
{
    ScopedTempDir temp("engine_sidecar");
    const auto source = temp.path() / "photo.raw";
    writeBinaryFile(source, makeNoise(10000, 2));

    const ArchiveEngine engine(smallChunks());
    const auto hashed = engine.compressFile(source, temp.path() / "hashed.zst");
    ASSERT_TRUE(hashed.digest.has_value());

    const auto sidecar = arcstream::integrity::readSidecar(temp.path() / "hashed.zst.sha256");
    ASSERT_TRUE(sidecar.has_value());
    EXPECT_EQ(sidecar->digest, *hashed.digest);
    EXPECT_EQ(sidecar->originalName, "photo.raw");

    CompressOptions noHash;
    noHash.computeHash = false;
    engine.compressFile(source, temp.path() / "plain.zst", noHash);
    EXPECT_FALSE(std::filesystem::exists(temp.path() / "plain.zst.sha256"));

    const auto result = engine.decompress(temp.path() / "plain.zst", temp.path() / "plain.raw");
    EXPECT_EQ(result.integrity, IntegrityStatus::NotChecked);
}

TEST(ArchiveEngineTest, TamperedSidecarWarnsButKeepsOutput)
{
    ScopedTempDir temp("engine_tamper");
    const auto source = temp.path() / "ledger.csv";
    const auto original = makeText(30000);
    writeBinaryFile(source, original);

    const ArchiveEngine engine(smallChunks());
    const auto archive = temp.path() / "ledger.csv.zst";
    engine.compressFile(source, archive);

    const auto sidecarPath = arcstream::integrity::sidecarPathFor(archive);
    auto sidecar = readBinaryFile(sidecarPath);
    sidecar[0] = sidecar[0] == '0' ? '1' : '0';
    writeBinaryFile(sidecarPath, sidecar);

    std::vector<ProgressEvent> warnings;
    const ProgressReporter reporter([&warnings](const ProgressEvent& event) {
        if (event.stage == ProgressStage::Warning) {
            warnings.push_back(event);
        }
    });

    const auto restored = temp.path() / "restored.csv";
    const auto result = engine.decompress(archive, restored, DecompressOptions {}, reporter);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.integrity, IntegrityStatus::Mismatch);
    EXPECT_FALSE(result.warnings.empty());
    EXPECT_EQ(warnings.size(), 1U);
    EXPECT_EQ(readBinaryFile(restored), original);

    writeBinaryFile(sidecarPath, "definitely not hex\n");
    const auto unreadable = engine.decompress(archive, temp.path() / "again.csv");
    EXPECT_TRUE(unreadable.success);
    EXPECT_EQ(unreadable.integrity, IntegrityStatus::Unavailable);

    DecompressOptions skip;
    skip.verifyHash = false;
    EXPECT_EQ(engine.decompress(archive, temp.path() / "skip.csv", skip).integrity, IntegrityStatus::NotChecked);
}

TEST(ArchiveEngineTest, FolderRoundTripRecreatesTheFolder)
{
    ScopedTempDir temp("engine_folder");
    const auto source = temp.path() / "project";
    buildTree(source);

    const ArchiveEngine engine(smallChunks());
    const auto archive = temp.path() / "project.tar.zst";
    const auto compressed = engine.compressFolder(source, archive);

    EXPECT_EQ(compressed.filesProcessed, 5U);
    EXPECT_TRUE(compressed.outcomes.empty());
    EXPECT_FALSE(std::filesystem::exists(arcstream::integrity::sidecarPathFor(archive)));

    const auto output = temp.path() / "restored";
    const auto result = engine.decompress(archive, output);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.kind, PayloadKind::Container);
    EXPECT_EQ(result.extractedCount, 5U);
    EXPECT_EQ(collectFiles(output / "project"), collectFiles(source));
    EXPECT_TRUE(std::filesystem::is_directory(output / "project" / "empty_dir"));
}

TEST(ArchiveEngineTest, FolderWithOneFileStillProducesADirectory)
{
    ScopedTempDir temp("engine_one");
    const auto source = temp.path() / "solo";
    writeBinaryFile(source / "only.txt", "just me");

    const ArchiveEngine engine(smallChunks());
    engine.compressFolder(source, temp.path() / "solo.zst");
    const auto result = engine.decompress(temp.path() / "solo.zst", temp.path() / "out");

    EXPECT_TRUE(std::filesystem::is_directory(temp.path() / "out" / "solo"));
    EXPECT_EQ(readBinaryFile(temp.path() / "out" / "solo" / "only.txt"), "just me");
    EXPECT_EQ(result.extractedCount, 1U);
}

TEST(ArchiveEngineTest, SingleFileArchiveNeverCreatesADirectory)
{
    ScopedTempDir temp("engine_nodir");
    const auto source = temp.path() / "plain.txt";
    writeBinaryFile(source, "a single file");

    const ArchiveEngine engine(smallChunks());
    engine.compressFile(source, temp.path() / "plain.zst");
    const auto result = engine.decompress(temp.path() / "plain.zst", temp.path() / "restored.txt");

    EXPECT_TRUE(std::filesystem::is_regular_file(result.output));
    EXPECT_EQ(result.output, temp.path() / "restored.txt");

    std::filesystem::create_directories(temp.path() / "into");
    const auto intoDirectory = engine.decompress(temp.path() / "plain.zst", temp.path() / "into");
    EXPECT_EQ(intoDirectory.output, temp.path() / "into" / "plain");
    EXPECT_EQ(readBinaryFile(intoDirectory.output), "a single file");
}

TEST(ArchiveEngineTest, ExcludedPathsNeverReachTheArchive)
{
    ScopedTempDir temp("engine_exclude");
    const auto source = temp.path() / "repo";
    buildTree(source);
    writeBinaryFile(source / "build" / "output.o", "object");
    writeBinaryFile(source / "src" / "scratch.tmp", "scratch");

    const ArchiveEngine engine(smallChunks());
    CompressOptions options;
    options.excludePatterns = {"build", ".tmp"};
    const auto compressed = engine.compressFolder(source, temp.path() / "repo.zst", options);
    EXPECT_EQ(compressed.filesProcessed, 5U);

    engine.decompress(temp.path() / "repo.zst", temp.path() / "out");
    for (const auto& [name, content] : collectFiles(temp.path() / "out")) {
        EXPECT_EQ(name.find("build"), std::string::npos) << name;
        EXPECT_EQ(name.find(".tmp"), std::string::npos) << name;
    }
    EXPECT_FALSE(std::filesystem::exists(temp.path() / "out" / "repo" / "build"));
}

TEST(ArchiveEngineTest, FolderSymlinksAreSkippedWithAnOutcome)
{
    ScopedTempDir temp("engine_symlink");
    const auto source = temp.path() / "linked";
    writeBinaryFile(source / "target.txt", "target");

    std::error_code ec;
    std::filesystem::create_symlink(source / "target.txt", source / "alias.txt", ec);
    if (ec) {
        GTEST_SKIP() << "symlinks unavailable: " << ec.message();
    }

    const ArchiveEngine engine(smallChunks());
    const auto compressed = engine.compressFolder(source, temp.path() / "linked.zst");

    EXPECT_EQ(compressed.filesProcessed, 1U);
    ASSERT_EQ(compressed.outcomes.size(), 1U);
    EXPECT_EQ(compressed.outcomes.front().status, MemberStatus::Skipped);
    EXPECT_EQ(compressed.outcomes.front().name, "linked/alias.txt");
}

TEST(ArchiveEngineTest, LegacyUntaggedArchivesAreSniffed)
{
    ScopedTempDir temp("engine_legacy");
    const auto single = temp.path() / "legacy.zst";
    const auto folder = temp.path() / "legacy-folder.zst";
    const auto text = makeText(20000);

    {
        std::ofstream output(single, std::ios::binary);
        std::istringstream input(text);
        arcstream::compression::zstd::compressStream(input, output, 3);
    }
    {
        std::ofstream output(folder, std::ios::binary);
        arcstream::compression::zstd::CompressingStreamBuf buffer(output, 3);
        std::ostream sink(&buffer);
        arcstream::container::ContainerPacker packer(sink);
        arcstream::container::ContainerEntry entry;
        entry.path = "old/notes.txt";
        entry.size = text.size();
        std::istringstream content(text);
        packer.addFile(entry, content);
        packer.finish();
        buffer.finish();
    }

    const ArchiveEngine engine(smallChunks());

    const auto singleResult = engine.decompress(single, temp.path() / "legacy.txt");
    EXPECT_FALSE(singleResult.tagged);
    EXPECT_EQ(singleResult.kind, PayloadKind::SingleFile);
    EXPECT_EQ(readBinaryFile(temp.path() / "legacy.txt"), text);

    const auto folderResult = engine.decompress(folder, temp.path() / "out");
    EXPECT_FALSE(folderResult.tagged);
    EXPECT_EQ(folderResult.kind, PayloadKind::Container);
    EXPECT_EQ(readBinaryFile(temp.path() / "out" / "old" / "notes.txt"), text);
}

TEST(ArchiveEngineTest, CorruptArchiveLeavesNoPartialOutput)
{
    ScopedTempDir temp("engine_corrupt");
    writeBinaryFile(temp.path() / "big.bin", makeNoise(300000, 9));
    buildTree(temp.path() / "tree");

    const ArchiveEngine engine(smallChunks());
    engine.compressFile(temp.path() / "big.bin", temp.path() / "big.zst");
    engine.compressFolder(temp.path() / "tree", temp.path() / "tree.zst");

    auto single = readBinaryFile(temp.path() / "big.zst");
    writeBinaryFile(temp.path() / "big.zst", single.substr(0, single.size() / 2));
    EXPECT_THROW(engine.decompress(temp.path() / "big.zst", temp.path() / "big.out"), arcstream::ExtractionError);
    EXPECT_FALSE(std::filesystem::exists(temp.path() / "big.out"));

    auto folder = readBinaryFile(temp.path() / "tree.zst");
    writeBinaryFile(temp.path() / "tree.zst", folder.substr(0, folder.size() - 40));
    EXPECT_THROW(engine.decompress(temp.path() / "tree.zst", temp.path() / "tree.out"), arcstream::ExtractionError);
    EXPECT_FALSE(std::filesystem::exists(temp.path() / "tree.out"));
}

TEST(ArchiveEngineTest, WholeOperationFailuresAreTyped)
{
    ScopedTempDir temp("engine_errors");
    const ArchiveEngine engine(smallChunks());

    EXPECT_THROW(engine.compressFile(temp.path() / "missing.txt", temp.path() / "out.zst"),
                 arcstream::CompressionError);
    EXPECT_FALSE(std::filesystem::exists(temp.path() / "out.zst"));

    EXPECT_THROW(engine.compressFolder(temp.path() / "missing", temp.path() / "out.zst"),
                 arcstream::CompressionError);
    EXPECT_THROW(engine.decompress(temp.path() / "missing.zst", temp.path() / "x"), arcstream::ExtractionError);
    EXPECT_THROW(engine.extractZip(temp.path() / "missing.zip", temp.path() / "x"), arcstream::ExtractionError);

    writeBinaryFile(temp.path() / "input.txt", "data");
    CompressOptions badLevel;
    badLevel.level = 40;
    EXPECT_THROW(engine.compressFile(temp.path() / "input.txt", temp.path() / "bad.zst", badLevel),
                 std::invalid_argument);
    EXPECT_FALSE(std::filesystem::exists(temp.path() / "bad.zst"));

    EngineConfig broken;
    broken.chunkSize = 0;
    EXPECT_THROW(ArchiveEngine {broken}, std::invalid_argument);
}

TEST(ArchiveEngineTest, ExtractZipReportsPartialSuccess)
{
    ScopedTempDir temp("engine_zip");
    const auto archive = temp.path() / "five.zip";

    void* writer = mz_zip_writer_create();
    ASSERT_EQ(mz_zip_writer_open_file(writer, archive.string().c_str(), 0, 0), MZ_OK);
    mz_zip_writer_set_compress_method(writer, MZ_COMPRESS_METHOD_STORE);
    const std::vector<std::pair<std::string, std::string>> members = {
        {"one.txt", "first member"},
        {"two.txt", "second member"},
        {"bad.txt", "CORRUPT-THIS-PAYLOAD-PLEASE"},
        {"three.txt", "third member"},
        {"four.txt", "fourth member"},
    };
    for (const auto& [name, content] : members) {
        mz_zip_file info {};
        info.filename = name.c_str();
        info.compression_method = MZ_COMPRESS_METHOD_STORE;
        info.modified_date = std::time(nullptr);
        info.uncompressed_size = static_cast<int64_t>(content.size());
        ASSERT_EQ(mz_zip_writer_add_buffer(writer, const_cast<char*>(content.data()),
                                           static_cast<int32_t>(content.size()), &info),
                  MZ_OK);
    }
    ASSERT_EQ(mz_zip_writer_close(writer), MZ_OK);
    mz_zip_writer_delete(&writer);

    auto bytes = readBinaryFile(archive);
    const auto position = bytes.find("CORRUPT-THIS-PAYLOAD-PLEASE");
    ASSERT_NE(position, std::string::npos);
    bytes[position + 3] = 'X';
    writeBinaryFile(archive, bytes);

    const ArchiveEngine engine(smallChunks());
    const auto result = engine.extractZip(archive, temp.path() / "out");

    EXPECT_EQ(result.extractedCount, 4U);
    ASSERT_EQ(result.failures.size(), 1U);
    EXPECT_EQ(result.failures.front().member, "bad.txt");
    EXPECT_FALSE(result.succeeded());

    EngineConfig noVerify = smallChunks();
    noVerify.verifyIntegrity = false;
    const auto unchecked = ArchiveEngine(noVerify).extractZip(archive, temp.path() / "out2");
    EXPECT_FALSE(unchecked.corruptedMember.has_value());
}

TEST(ArchiveEngineTest, BatchCompressionIsolatesFailures)
{
    ScopedTempDir temp("engine_batch");
    std::vector<CompressionJob> jobs;
    for (int index = 0; index < 4; ++index) {
        const auto source = temp.path() / ("file" + std::to_string(index) + ".txt");
        writeBinaryFile(source, makeText(10000 + index * 1000));
        CompressionJob job;
        job.source = source;
        job.destination = temp.path() / ("file" + std::to_string(index) + ".zst");
        job.level = 1 + index * 5;
        job.chunkSize = 4096;
        jobs.push_back(job);
    }
    CompressionJob missing;
    missing.source = temp.path() / "missing.txt";
    missing.destination = temp.path() / "missing.zst";
    jobs.insert(jobs.begin() + 2, missing);

    const ArchiveEngine engine(smallChunks());
    const auto outcomes = engine.compressFiles(jobs, 3);

    ASSERT_EQ(outcomes.size(), jobs.size());
    for (std::size_t index = 0; index < outcomes.size(); ++index) {
        EXPECT_EQ(outcomes[index].job.source, jobs[index].source);
        if (index == 2) {
            EXPECT_FALSE(outcomes[index].result.has_value());
            EXPECT_FALSE(outcomes[index].error.empty());
            continue;
        }
        ASSERT_TRUE(outcomes[index].result.has_value()) << outcomes[index].error;
        const auto result = engine.decompress(jobs[index].destination, temp.path() / ("r" + std::to_string(index)));
        EXPECT_EQ(readBinaryFile(result.output), readBinaryFile(jobs[index].source));
    }
}

TEST(ArchiveEngineTest, InspectDescribesArchives)
{
    ScopedTempDir temp("engine_inspect");
    writeBinaryFile(temp.path() / "a.txt", "inspect me");
    buildTree(temp.path() / "dir");

    const ArchiveEngine engine(smallChunks());
    engine.compressFile(temp.path() / "a.txt", temp.path() / "a.zst");
    engine.compressFolder(temp.path() / "dir", temp.path() / "dir.zst");

    const auto file = engine.inspect(temp.path() / "a.zst");
    EXPECT_TRUE(file.tagged);
    EXPECT_EQ(file.kind, std::optional<PayloadKind>(PayloadKind::SingleFile));
    ASSERT_TRUE(file.sidecar.has_value());
    EXPECT_EQ(file.sidecar->originalName, "a.txt");

    const auto folder = engine.inspect(temp.path() / "dir.zst");
    EXPECT_EQ(folder.kind, std::optional<PayloadKind>(PayloadKind::Container));
    EXPECT_FALSE(folder.sidecar.has_value());
    EXPECT_EQ(folder.compressedSize, std::filesystem::file_size(temp.path() / "dir.zst"));
}

TEST(ArchiveEngineTest, ReportsProgressForChunkedWork)
{
    ScopedTempDir temp("engine_progress");
    writeBinaryFile(temp.path() / "big.txt", makeText(100000));

    std::vector<ProgressStage> stages;
    const ProgressReporter reporter([&stages](const ProgressEvent& event) {
        stages.push_back(event.stage);
        throw std::runtime_error("consumer failures must not matter");
    });

    const ArchiveEngine engine(smallChunks());
    EXPECT_NO_THROW(engine.compressFile(temp.path() / "big.txt", temp.path() / "big.zst", {}, reporter));

    ASSERT_FALSE(stages.empty());
    EXPECT_EQ(stages.front(), ProgressStage::Started);
    EXPECT_EQ(stages.back(), ProgressStage::Completed);
    EXPECT_GE(std::count(stages.begin(), stages.end(), ProgressStage::Chunk), 6);
}

TEST(ArchiveEngineTest, ArchiveCutDownToItsTagIsRejected)
{
    ScopedTempDir temp("engine_tag_only");
    writeBinaryFile(temp.path() / "note.txt", makeText(50000));
    writeBinaryFile(temp.path() / "folder" / "inside.txt", makeText(50000));

    const ArchiveEngine engine(smallChunks());
    engine.compressFile(temp.path() / "note.txt", temp.path() / "note.zst");
    engine.compressFolder(temp.path() / "folder", temp.path() / "folder.zst");

    std::filesystem::resize_file(temp.path() / "note.zst", arcstream::compression::zstd::kTagFrameSize);
    std::filesystem::resize_file(temp.path() / "folder.zst", arcstream::compression::zstd::kTagFrameSize);

    EXPECT_THROW(engine.decompress(temp.path() / "note.zst", temp.path() / "note.out"), arcstream::ExtractionError);
    EXPECT_FALSE(std::filesystem::exists(temp.path() / "note.out"));

    EXPECT_THROW(engine.decompress(temp.path() / "folder.zst", temp.path() / "folder.out"),
                 arcstream::ExtractionError);
    EXPECT_FALSE(std::filesystem::exists(temp.path() / "folder.out"));
}

TEST(ArchiveEngineTest, ContainerWithoutEndMarkerIsRejected)
{
    ScopedTempDir temp("engine_no_marker");
    const auto archive = temp.path() / "cut.zst";
    {
        std::ofstream output(archive, std::ios::binary);
        arcstream::compression::zstd::writeFormatTag(output, PayloadKind::Container);
        arcstream::compression::zstd::CompressingStreamBuf buffer(output, 3);
        std::ostream sink(&buffer);
        arcstream::container::ContainerPacker packer(sink);
        addMember(packer, "cut/a.txt", "complete member");
        sink.flush();
        buffer.finish();
    }

    const ArchiveEngine engine(smallChunks());
    EXPECT_THROW(engine.decompress(archive, temp.path() / "out"), arcstream::ContainerFormatError);
    EXPECT_FALSE(std::filesystem::exists(temp.path() / "out"));
}

TEST(ArchiveEngineTest, FolderArchiveMembersCannotEscapeTheOutputRoot)
{
    ScopedTempDir temp("engine_traversal");
    const auto archive = temp.path() / "hostile.zst";
    const auto absoluteTarget = temp.path() / "absolute-target.txt";

    writeContainerArchive(archive, [&absoluteTarget](arcstream::container::ContainerPacker& packer) {
        addMember(packer, "../escaped.txt", "outside");
        addMember(packer, absoluteTarget.generic_string(), "absolute");
        addMember(packer, "bundle/../../../deep-escape.txt", "nested");
        addMember(packer, "bundle/good.txt", "inside");
    });

    const ArchiveEngine engine(smallChunks());
    const auto output = temp.path() / "out";
    const auto result = engine.decompress(archive, output);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.extractedCount, 1U);
    EXPECT_EQ(countStatus(result.outcomes, MemberStatus::Rejected), 3U);
    EXPECT_EQ(readBinaryFile(output / "bundle" / "good.txt"), "inside");
    EXPECT_FALSE(std::filesystem::exists(temp.path() / "escaped.txt"));
    EXPECT_FALSE(std::filesystem::exists(absoluteTarget));
    EXPECT_FALSE(std::filesystem::exists(temp.path().parent_path() / "deep-escape.txt"));
}

TEST(ArchiveEngineTest, MembersThatEndedEarlyAreNotExtracted)
{
    ScopedTempDir temp("engine_incomplete");
    const auto archive = temp.path() / "shrunk.zst";

    writeContainerArchive(archive, [](arcstream::container::ContainerPacker& packer) {
        addMember(packer, "set/before.txt", "before");
        arcstream::container::ContainerEntry shrunk;
        shrunk.path = "set/shrunk.log";
        shrunk.size = 5000;
        std::istringstream partial("only the first bytes");
        EXPECT_THROW(packer.addFile(shrunk, partial), arcstream::container::ShortEntryError);
        addMember(packer, "set/after.txt", "after");
    });

    const ArchiveEngine engine(smallChunks());
    const auto output = temp.path() / "out";
    const auto result = engine.decompress(archive, output);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.extractedCount, 2U);
    EXPECT_FALSE(std::filesystem::exists(output / "set" / "shrunk.log"));
    EXPECT_EQ(readBinaryFile(output / "set" / "before.txt"), "before");
    EXPECT_EQ(readBinaryFile(output / "set" / "after.txt"), "after");

    ASSERT_EQ(countStatus(result.outcomes, MemberStatus::Failed), 1U);
    for (const auto& outcome : result.outcomes) {
        if (outcome.status == MemberStatus::Failed) {
            EXPECT_EQ(outcome.name, "set/shrunk.log");
        }
    }
}

TEST(ArchiveEngineTest, UnreadableSubfolderDoesNotAbortFolderCompression)
{
    ScopedTempDir temp("engine_locked");
    const auto source = temp.path() / "tree";
    writeBinaryFile(source / "readable.txt", "fine");
    writeBinaryFile(source / "locked" / "secret.txt", "hidden");

    std::filesystem::permissions(source / "locked", std::filesystem::perms::none);
    std::error_code ec;
    std::filesystem::directory_iterator attempt(source / "locked", ec);
    if (!ec) {
        std::filesystem::permissions(source / "locked", std::filesystem::perms::owner_all);
        GTEST_SKIP() << "directory permissions are not enforced for this user";
    }

    const ArchiveEngine engine(smallChunks());
    const auto compressed = engine.compressFolder(source, temp.path() / "tree.zst");
    std::filesystem::permissions(source / "locked", std::filesystem::perms::owner_all);

    EXPECT_EQ(compressed.filesProcessed, 1U);
    ASSERT_EQ(compressed.outcomes.size(), 1U);
    EXPECT_EQ(compressed.outcomes.front().name, "tree/locked");
    EXPECT_EQ(compressed.outcomes.front().status, MemberStatus::Failed);

    engine.decompress(temp.path() / "tree.zst", temp.path() / "out");
    EXPECT_EQ(readBinaryFile(temp.path() / "out" / "tree" / "readable.txt"), "fine");
}
