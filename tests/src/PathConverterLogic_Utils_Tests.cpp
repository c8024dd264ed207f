#include "pch.h"
#include "TestFixtures.h"
#include "../../src/Logic/PathConverterLogic.h"
#include <string>
#include <vector>

namespace fs = std::filesystem;

TEST(PathConverterLogicUtils, DescribeError)
{
    EXPECT_EQ(PathConverterLogic::DescribeError(PathConvertError::InvalidUtf8Path, "some/path"),
              "path contains invalid utf-8 characters: some/path");
    EXPECT_EQ(PathConverterLogic::DescribeError(PathConvertError::InvalidPath, ".."),
              "paths must contain either a stem or an extension or both: '..'");
    EXPECT_EQ(PathConverterLogic::DescribeError(PathConvertError::None, "x"), "");
}

TEST(PathConverterLogicUtils, FormatMapping)
{
    RenameOperation op{"dir/Some File.txt", "dir/some_file.txt"};
    EXPECT_EQ(PathConverterLogic::FormatMapping(op), "'dir/Some File.txt' -> 'dir/some_file.txt'");
}

TEST(PathConverterLogicUtils, IsFailure)
{
    EXPECT_TRUE(PathConverterLogic::IsFailure(RenameStatus::ConversionFailed));
    EXPECT_TRUE(PathConverterLogic::IsFailure(RenameStatus::RenameFailed));
    EXPECT_FALSE(PathConverterLogic::IsFailure(RenameStatus::Renamed));
    EXPECT_FALSE(PathConverterLogic::IsFailure(RenameStatus::DryRun));
    EXPECT_FALSE(PathConverterLogic::IsFailure(RenameStatus::Unchanged));
    EXPECT_FALSE(PathConverterLogic::IsFailure(RenameStatus::SkippedDestinationExists));
}

TEST(PathConverterLogicUtils, ShouldPrintMapping)
{
    // Dry run: every processed path is listed, including ones already in the target convention
    EXPECT_TRUE(PathConverterLogic::ShouldPrintMapping(RenameStatus::DryRun, false, true));
    EXPECT_TRUE(PathConverterLogic::ShouldPrintMapping(RenameStatus::Unchanged, false, true));

    // Real run: mappings only when verbose
    EXPECT_FALSE(PathConverterLogic::ShouldPrintMapping(RenameStatus::Renamed, false, false));
    EXPECT_FALSE(PathConverterLogic::ShouldPrintMapping(RenameStatus::Unchanged, false, false));
    EXPECT_TRUE(PathConverterLogic::ShouldPrintMapping(RenameStatus::Renamed, true, false));
    EXPECT_TRUE(PathConverterLogic::ShouldPrintMapping(RenameStatus::Unchanged, true, false));

    // Skips and failures go through the log instead
    EXPECT_FALSE(PathConverterLogic::ShouldPrintMapping(RenameStatus::SkippedDestinationExists, true, true));
    EXPECT_FALSE(PathConverterLogic::ShouldPrintMapping(RenameStatus::RenameFailed, true, true));
}

TEST_F(PathConverterFilesystemTest, WriteHistoryLog_RecordsOnlyPerformedRenames)
{
    fs::path logPath = tempTestDir / "history" / "rename_history.log";

    RenameOutcome renamed;
    renamed.op = {"a/Some File.txt", "a/some_file.txt"};
    renamed.status = RenameStatus::Renamed;
    RenameOutcome skipped;
    skipped.op = {"a/Other File.txt", "a/other_file.txt"};
    skipped.status = RenameStatus::SkippedDestinationExists;

    ConversionRequest request;
    request.to = Convention::SnakeCase;
    ASSERT_TRUE(PathConverterLogic::writeHistoryLog(logPath, {renamed, skipped}, request));

    std::string log = ReadFile(logPath);
    EXPECT_EQ(log.front(), '[');
    EXPECT_NE(log.find("] auto -> snake, 1 renamed\n"), std::string::npos);
    EXPECT_NE(log.find("  'a/Some File.txt' -> 'a/some_file.txt'\n"), std::string::npos);
    EXPECT_EQ(log.find("Other File.txt"), std::string::npos);
}

TEST_F(PathConverterFilesystemTest, WriteHistoryLog_RecordsSourceConventionAndAppends)
{
    fs::path logPath = tempTestDir / "rename_history.log";

    RenameOutcome renamed;
    renamed.op = {"a/someFile.txt", "a/some-file.txt"};
    renamed.status = RenameStatus::Renamed;

    ConversionRequest request;
    request.from = Convention::CamelCase;
    request.to = Convention::KebabCase;
    ASSERT_TRUE(PathConverterLogic::writeHistoryLog(logPath, {renamed}, request));
    ASSERT_TRUE(PathConverterLogic::writeHistoryLog(logPath, {renamed}, request));

    std::string log = ReadFile(logPath);
    const std::string header = "] camel -> kebab, 1 renamed";
    size_t first = log.find(header);
    ASSERT_NE(first, std::string::npos);
    EXPECT_NE(log.find(header, first + 1), std::string::npos);
}

TEST_F(PathConverterFilesystemTest, WriteHistoryLog_NothingToWrite)
{
    fs::path logPath = tempTestDir / "rename_history.log";

    RenameOutcome dryRun;
    dryRun.op = {"a/Some File.txt", "a/some_file.txt"};
    dryRun.status = RenameStatus::DryRun;

    EXPECT_TRUE(PathConverterLogic::writeHistoryLog(logPath, {dryRun}, ConversionRequest{}));
    EXPECT_FALSE(fs::exists(logPath));
}
