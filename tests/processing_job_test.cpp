#include <gtest/gtest.h>

#include <fstream>
#include <string>

#include "ProcessingJob.h"
#include "TestUtils.h"

TEST(ProcessingJobTest, ParsesValidInput) {
    ProcessingJob job;
    std::string error;
    ASSERT_TRUE(parseProcessingJob("/videos/in.mp4", "/videos/out.mp4", "-35", "750", job, error))
            << error;
    EXPECT_EQ(job.inputPath, "/videos/in.mp4");
    EXPECT_EQ(job.outputPath, "/videos/out.mp4");
    EXPECT_EQ(job.thresholdDb, -35);
    EXPECT_EQ(job.minSilenceMs, 750);
}

TEST(ProcessingJobTest, DefaultsMatchTheForm) {
    ProcessingJob job;
    EXPECT_EQ(job.thresholdDb, -40);
    EXPECT_EQ(job.minSilenceMs, 500);
    EXPECT_EQ(job.config.analysisFormat.sampleRate, 44100);
    EXPECT_EQ(job.config.analysisFormat.channels, 1);
    EXPECT_EQ(job.config.spliceSettings.videoEncoder, "libx264");
    EXPECT_EQ(job.config.spliceSettings.audioEncoder, "aac");
    EXPECT_EQ(job.config.spliceSettings.audioBitRate, 128000);
}

TEST(ProcessingJobTest, WhitespaceAroundNumbersIsAccepted) {
    ProcessingJob job;
    std::string error;
    ASSERT_TRUE(parseProcessingJob("a.mp4", "b.mp4", " -40 ", "\t500\n", job, error)) << error;
    EXPECT_EQ(job.thresholdDb, -40);
    EXPECT_EQ(job.minSilenceMs, 500);
}

TEST(ProcessingJobTest, PositiveThresholdIsAccepted) {
    ProcessingJob job;
    std::string error;
    ASSERT_TRUE(parseProcessingJob("a.mp4", "b.mp4", "3", "100", job, error)) << error;
    EXPECT_EQ(job.thresholdDb, 3);
}

TEST(ProcessingJobTest, MissingPathsAreRejected) {
    ProcessingJob job;
    std::string error;
    EXPECT_FALSE(parseProcessingJob("", "b.mp4", "-40", "500", job, error));
    EXPECT_EQ(error, "Select both the input and the output paths!");

    error.clear();
    EXPECT_FALSE(parseProcessingJob("a.mp4", "   ", "-40", "500", job, error));
    EXPECT_EQ(error, "Select both the input and the output paths!");
}

TEST(ProcessingJobTest, OutputSameAsInputIsRejected) {
    ProcessingJob job;
    std::string error;
    EXPECT_FALSE(parseProcessingJob("talk.mp4", "talk.mp4", "-40", "500", job, error));
    EXPECT_EQ(error, "The output file must be different from the input file!");
}

TEST(ProcessingJobTest, OutputEquivalentToInputIsRejected) {
    ScratchDir dir;
    const std::string input = dir.file("talk.mp4");
    {
        std::ofstream(input, std::ios::binary) << "video";
    }
    const std::string sameFile = dir.path() + "/./talk.mp4";

    ProcessingJob job;
    std::string error;
    EXPECT_FALSE(parseProcessingJob(input, sameFile, "-40", "500", job, error));
    EXPECT_EQ(error, "The output file must be different from the input file!");

    error.clear();
    EXPECT_TRUE(parseProcessingJob(input, dir.file("talk-cut.mp4"), "-40", "500", job, error))
            << error;
}

TEST(ProcessingJobTest, NonIntegerThresholdIsRejected) {
    for (const char* text : {"", "abc", "-40dB", "12.5", "- 40"}) {
        ProcessingJob job;
        std::string error;
        EXPECT_FALSE(parseProcessingJob("a.mp4", "b.mp4", text, "500", job, error)) << text;
        EXPECT_EQ(error, "Silence threshold must be a whole number of dB, got '" +
                                 std::string(text) + "'");
    }
}

TEST(ProcessingJobTest, NonIntegerMinimumSilenceIsRejected) {
    for (const char* text : {"", "half", "500ms", "0.5", "99999999999999999999"}) {
        ProcessingJob job;
        std::string error;
        EXPECT_FALSE(parseProcessingJob("a.mp4", "b.mp4", "-40", text, job, error)) << text;
        EXPECT_EQ(error, "Minimum silence must be a whole number of milliseconds, got '" +
                                 std::string(text) + "'");
    }
}

TEST(ProcessingJobTest, MinimumSilenceMustBePositive) {
    for (const char* text : {"0", "-10"}) {
        ProcessingJob job;
        std::string error;
        EXPECT_FALSE(parseProcessingJob("a.mp4", "b.mp4", "-40", text, job, error)) << text;
        EXPECT_EQ(error, "Minimum silence must be greater than 0 ms");
    }
}

TEST(ProcessingJobTest, FailedParseLeavesJobUntouched) {
    ProcessingJob job;
    job.inputPath = "keep.mp4";
    std::string error;
    EXPECT_FALSE(parseProcessingJob("a.mp4", "b.mp4", "loud", "500", job, error));
    EXPECT_EQ(job.inputPath, "keep.mp4");
}
