#include "pch.h"
#include "../../src/Logic/PathConverterLogic.h"
#include <string>
#include <vector>

namespace
{
std::vector<std::string> Words(const std::vector<wxString> &words)
{
    std::vector<std::string> out;
    for (const auto &w : words)
    {
        out.push_back(std::string(w.utf8_str().data()));
    }
    return out;
}

std::string Convert(const std::vector<wxString> &words, Convention to)
{
    return std::string(PathConverterLogic::ConvertCase(words, to).utf8_str().data());
}
} // namespace

TEST(PathConverterLogicCase, HeuristicSplitsOnSeparators)
{
    EXPECT_EQ(Words(PathConverterLogic::SplitWords("Some File")), (std::vector<std::string>{"Some", "File"}));
    EXPECT_EQ(Words(PathConverterLogic::SplitWords("some-file_name here")), (std::vector<std::string>{"some", "file", "name", "here"}));
    EXPECT_EQ(Words(PathConverterLogic::SplitWords("__a__")), (std::vector<std::string>{"a"}));
    EXPECT_TRUE(PathConverterLogic::SplitWords("_-_").empty());
}

TEST(PathConverterLogicCase, HeuristicSplitsOnCaseAndDigits)
{
    EXPECT_EQ(Words(PathConverterLogic::SplitWords("someFile")), (std::vector<std::string>{"some", "File"}));
    EXPECT_EQ(Words(PathConverterLogic::SplitWords("HTMLFile")), (std::vector<std::string>{"HTML", "File"}));
    EXPECT_EQ(Words(PathConverterLogic::SplitWords("file2")), (std::vector<std::string>{"file", "2"}));
    EXPECT_EQ(Words(PathConverterLogic::SplitWords("2nd")), (std::vector<std::string>{"2", "nd"}));
    EXPECT_EQ(Words(PathConverterLogic::SplitWords("SOME")), (std::vector<std::string>{"SOME"}));
}

TEST(PathConverterLogicCase, PunctuationStaysInsideWords)
{
    EXPECT_EQ(Words(PathConverterLogic::SplitWords("My Archive.tar")), (std::vector<std::string>{"My", "Archive.tar"}));
}

TEST(PathConverterLogicCase, KnownSourceUsesOnlyItsBoundaries)
{
    EXPECT_EQ(Words(PathConverterLogic::SplitWords("some_file", Convention::SnakeCase)), (std::vector<std::string>{"some", "file"}));
    EXPECT_EQ(Words(PathConverterLogic::SplitWords("someFile-x", Convention::SnakeCase)), (std::vector<std::string>{"someFile-x"}));
    EXPECT_EQ(Words(PathConverterLogic::SplitWords("SomeFile", Convention::UpperCamelCase)), (std::vector<std::string>{"Some", "File"}));
    EXPECT_EQ(Words(PathConverterLogic::SplitWords("SomeFile", Convention::FlatCase)), (std::vector<std::string>{"SomeFile"}));
    EXPECT_EQ(Words(PathConverterLogic::SplitWords("some-file", Convention::KebabCase)), (std::vector<std::string>{"some", "file"}));
    EXPECT_EQ(Words(PathConverterLogic::SplitWords("Some File_x", Convention::TitleCase)), (std::vector<std::string>{"Some", "File_x"}));
}

TEST(PathConverterLogicCase, JoinsWithTargetRules)
{
    const std::vector<wxString> words = {"some", "FILE", "name"};
    EXPECT_EQ(Convert(words, Convention::TitleCase), "Some File Name");
    EXPECT_EQ(Convert(words, Convention::FlatCase), "somefilename");
    EXPECT_EQ(Convert(words, Convention::UpperFlatCase), "SOMEFILENAME");
    EXPECT_EQ(Convert(words, Convention::CamelCase), "someFileName");
    EXPECT_EQ(Convert(words, Convention::UpperCamelCase), "SomeFileName");
    EXPECT_EQ(Convert(words, Convention::SnakeCase), "some_file_name");
    EXPECT_EQ(Convert(words, Convention::UpperSnakeCase), "SOME_FILE_NAME");
    EXPECT_EQ(Convert(words, Convention::KebabCase), "some-file-name");
}

TEST(PathConverterLogicCase, SingleWordOnlyChangesCase)
{
    const std::vector<wxString> words = {"Report"};
    EXPECT_EQ(Convert(words, Convention::SnakeCase), "report");
    EXPECT_EQ(Convert(words, Convention::CamelCase), "report");
    EXPECT_EQ(Convert(words, Convention::UpperSnakeCase), "REPORT");
    EXPECT_EQ(Convert(words, Convention::TitleCase), "Report");
    EXPECT_EQ(Convert({}, Convention::KebabCase), "");
}
