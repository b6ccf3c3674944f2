#include "ProcessingJob.h"

#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace {

bool isBlank(const std::string& s) {
    for (unsigned char c : s) {
        if (!std::isspace(c))
            return false;
    }
    return true;
}

bool parseInt(const std::string& text, int& out) {
    const char* begin = text.c_str();
    char* end = nullptr;
    errno = 0;
    long value = std::strtol(begin, &end, 10);
    if (end == begin || errno == ERANGE || value < INT_MIN || value > INT_MAX)
        return false;
    while (*end != '\0') {
        if (!std::isspace(static_cast<unsigned char>(*end)))
            return false;
        ++end;
    }
    out = static_cast<int>(value);
    return true;
}

}  // namespace

bool parseProcessingJob(const std::string& inputPath, const std::string& outputPath,
                        const std::string& thresholdText, const std::string& minSilenceText,
                        ProcessingJob& job, std::string& error) {
    if (isBlank(inputPath) || isBlank(outputPath)) {
        error = "Select both the input and the output paths!";
        return false;
    }
    std::error_code ec;
    if (inputPath == outputPath || std::filesystem::equivalent(inputPath, outputPath, ec)) {
        error = "The output file must be different from the input file!";
        return false;
    }

    int thresholdDb = 0;
    if (!parseInt(thresholdText, thresholdDb)) {
        error = "Silence threshold must be a whole number of dB, got '" + thresholdText + "'";
        return false;
    }
    int minSilenceMs = 0;
    if (!parseInt(minSilenceText, minSilenceMs)) {
        error = "Minimum silence must be a whole number of milliseconds, got '" +
                minSilenceText + "'";
        return false;
    }
    if (minSilenceMs <= 0) {
        error = "Minimum silence must be greater than 0 ms";
        return false;
    }

    job = ProcessingJob{};
    job.inputPath = inputPath;
    job.outputPath = outputPath;
    job.thresholdDb = thresholdDb;
    job.minSilenceMs = minSilenceMs;
    return true;
}
