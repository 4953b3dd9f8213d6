#include "test_base.hpp"
#include "core/command_processor.hpp"

class CommandProcessorTest : public TestBase
{
};

TEST_F(CommandProcessorTest, PlaceholderIsReplacedByQuotedParameter)
{
    CommandProcessor processor("convert {path} --out {path}.flac");
    EXPECT_EQ(processor.shellScript(), "convert \"$1\" --out \"$1\".flac");

    CommandProcessor appended("ingest --fast");
    EXPECT_EQ(appended.shellScript(), "ingest --fast \"$1\"");
}

TEST_F(CommandProcessorTest, SuccessfulCommandReportsExitCode)
{
    std::string input = createFile("take one.wav", "audio");
    std::string copy = rootDir() + "/copied.wav";

    CommandProcessor processor("cp {path} '" + copy + "'");
    ProcessingResult result = processor(input);

    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(result.payload["exit_code"], 0);
    EXPECT_EQ(result.payload["command"], processor.commandTemplate());
    EXPECT_EQ(readFile(copy), "audio");
}

TEST_F(CommandProcessorTest, NonZeroExitIsFailure)
{
    CommandProcessor processor("exit 3;");
    ProcessingResult result = processor(createFile("a.wav"));

    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error_message.find("code 3"), std::string::npos);
}

TEST_F(CommandProcessorTest, FileNamesAreNotInterpretedByTheShell)
{
    // Would create ./auto_ingest_injected.wav in the working directory if spliced into the script
    const std::string marker = "auto_ingest_injected.wav";
    std::string hostile = createFile("x; touch " + marker);

    CommandProcessor processor("test -f");
    ProcessingResult result = processor(hostile);

    EXPECT_TRUE(result.success) << result.error_message;
    EXPECT_FALSE(std::filesystem::exists(marker));
    std::filesystem::remove(marker);
}

TEST_F(CommandProcessorTest, RecordOnlyWhenNoCommandConfigured)
{
    ProcessingCallback callback = CommandProcessor::fromCommand("");
    ProcessingResult result = callback(pathInWatch("a.wav"));

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.payload["status"], "success");
}
