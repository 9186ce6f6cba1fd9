#include "gtest/gtest.h"
#include "core/BatchConverter.h"

#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#ifndef _WIN32
#include <sys/stat.h>
#include <unistd.h>
#endif

using namespace ImageConverter;

namespace {

/**
 * Writes the source name into the destination, or fails for sources whose
 * file name is listed in failFor.
 */
class FakeCodec : public ImageCodec {
public:
    std::vector<std::string> failFor;
    std::vector<fs::path> calls;

    void decodeThenEncode(const fs::path& source, const fs::path& destination,
                          const ImageFormat& format, const EncodeOptions&) override {
        calls.push_back(source);
        for (const auto& name : failFor) {
            if (source.filename() == name) {
                throw ConversionError("unable to decode image");
            }
        }
        std::ofstream out(destination, std::ios::binary);
        out << format.name << ":" << source.filename().string();
    }
};

} // namespace

class BatchConverterTest : public ::testing::Test {
protected:
    fs::path testDir;
    fs::path inDir;
    fs::path outDir;
    FakeCodec codec;

    void SetUp() override {
        testDir = fs::temp_directory_path() / "imgconv_tests" / ::testing::UnitTest::GetInstance()->current_test_info()->name();
        inDir = testDir / "in";
        outDir = testDir / "out";
        fs::create_directories(inDir);
        fs::create_directories(outDir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::permissions(outDir, fs::perms::owner_all, fs::perm_options::add, ec);
        fs::remove_all(testDir, ec);
    }

    fs::path createSource(const std::string& name) {
        fs::path path = inDir / name;
        std::ofstream f(path);
        f << "pixels";
        return path;
    }

    ConversionRequest makeRequest(const std::vector<fs::path>& sources, const std::string& format) {
        ConversionRequest request;
        request.sources = sources;
        request.targetFormat = format;
        request.destinationDir = outDir;
        return request;
    }

    std::size_t filesIn(const fs::path& dir) {
        std::size_t count = 0;
        for (const auto& entry : fs::directory_iterator(dir)) {
            if (entry.is_regular_file()) ++count;
        }
        return count;
    }
};

TEST_F(BatchConverterTest, ReportFollowsRequestOrder) {
    std::vector<fs::path> sources = {createSource("c.png"), createSource("a.png"), createSource("b.png")};
    BatchConverter converter(codec);

    BatchReport report = converter.convertBatch(makeRequest(sources, "bmp"));

    ASSERT_EQ(report.size(), sources.size());
    for (std::size_t i = 0; i < sources.size(); ++i) {
        ASSERT_EQ(report[i].source, sources[i]);
        ASSERT_TRUE(report[i].ok());
    }
    ASSERT_EQ(report[0].destination, outDir / "c.bmp");
}

TEST_F(BatchConverterTest, MissingSourceDoesNotAffectOthers) {
    std::vector<fs::path> sources = {createSource("cat.png"), inDir / "missing.jpg", createSource("dog.bmp")};
    BatchConverter converter(codec);

    BatchReport report = converter.convertBatch(makeRequest(sources, "jpeg"));

    ASSERT_EQ(report.size(), 3u);
    ASSERT_TRUE(report[0].ok());
    ASSERT_FALSE(report[1].ok());
    ASSERT_EQ(report[1].reason, "source not found");
    ASSERT_TRUE(report[2].ok());
    ASSERT_EQ(report[2].destination, outDir / "dog.jpg");

    // The codec is never asked about the missing file
    ASSERT_EQ(codec.calls.size(), 2u);
    ASSERT_TRUE(fs::exists(outDir / "cat.jpg"));
    ASSERT_TRUE(fs::exists(outDir / "dog.jpg"));
    ASSERT_EQ(filesIn(outDir), 2u);
}

TEST_F(BatchConverterTest, CodecFailureIsRecordedAndBatchContinues) {
    codec.failFor = {"broken.png"};
    std::vector<fs::path> sources = {createSource("broken.png"), createSource("fine.png")};
    BatchConverter converter(codec);

    BatchReport report = converter.convertBatch(makeRequest(sources, "png"));

    ASSERT_FALSE(report[0].ok());
    ASSERT_EQ(report[0].reason, "unable to decode image");
    ASSERT_TRUE(report[1].ok());
    ASSERT_EQ(report.failed(), 1u);
}

TEST_F(BatchConverterTest, DirectoryAsSourceIsUnreadable) {
    fs::create_directories(inDir / "folder.png");
    BatchConverter converter(codec);

    BatchReport report = converter.convertBatch(makeRequest({inDir / "folder.png"}, "png"));

    ASSERT_EQ(report.size(), 1u);
    ASSERT_EQ(report[0].reason, "source unreadable");
}

TEST_F(BatchConverterTest, UnsupportedFormatIsValidationError) {
    BatchConverter converter(codec);
    auto request = makeRequest({createSource("a.png")}, "gif");

    try {
        converter.convertBatch(request);
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        ASSERT_EQ(std::string(e.what()), "unsupported target format: gif");
    }
    ASSERT_TRUE(codec.calls.empty());
    ASSERT_EQ(filesIn(outDir), 0u);
}

TEST_F(BatchConverterTest, EmptySourcesIsValidationError) {
    BatchConverter converter(codec);
    ASSERT_THROW(converter.convertBatch(makeRequest({}, "png")), ValidationError);
}

TEST_F(BatchConverterTest, MissingDestinationIsValidationError) {
    BatchConverter converter(codec);
    auto request = makeRequest({createSource("a.png")}, "png");
    request.destinationDir = testDir / "does_not_exist";

    ASSERT_THROW(converter.convertBatch(request), ValidationError);
    ASSERT_FALSE(fs::exists(request.destinationDir));
}

TEST_F(BatchConverterTest, FileAsDestinationIsValidationError) {
    BatchConverter converter(codec);
    auto request = makeRequest({createSource("a.png")}, "png");
    request.destinationDir = createSource("not_a_dir.txt");

    try {
        converter.convertBatch(request);
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        ASSERT_EQ(std::string(e.what()), "destination is not a directory: " + request.destinationDir.string());
    }
    ASSERT_TRUE(codec.calls.empty());
}

TEST_F(BatchConverterTest, UnwritableDestinationIsValidationError) {
#ifdef _WIN32
    GTEST_SKIP() << "POSIX permissions only";
#else
    if (::geteuid() == 0) {
        GTEST_SKIP() << "root can write to read-only directories";
    }
    fs::permissions(outDir, fs::perms::owner_read | fs::perms::owner_exec, fs::perm_options::replace);

    BatchConverter converter(codec);
    auto request = makeRequest({createSource("photo.png")}, "tiff");

    ASSERT_THROW(converter.convertBatch(request), ValidationError);
    ASSERT_TRUE(codec.calls.empty());

    fs::permissions(outDir, fs::perms::owner_all, fs::perm_options::add);
    ASSERT_EQ(filesIn(outDir), 0u);
#endif
}

TEST_F(BatchConverterTest, DuplicateSourcesProduceTwoOutcomes) {
    fs::path a = createSource("a.png");
    BatchConverter converter(codec);

    BatchReport report = converter.convertBatch(makeRequest({a, a}, "png"));

    ASSERT_EQ(report.size(), 2u);
    ASSERT_EQ(report[0].destination, outDir / "a.png");
    ASSERT_EQ(report[1].destination, outDir / "a.png");
    ASSERT_EQ(report.succeeded(), 2u);
    ASSERT_EQ(filesIn(outDir), 1u);
}

TEST_F(BatchConverterTest, SameStemFromDifferentFoldersIsNotOverwritten) {
    fs::create_directories(inDir / "a");
    fs::create_directories(inDir / "b");
    fs::path first = createSource("a/x.png");
    fs::path second = createSource("b/x.png");
    fs::path other = createSource("y.png");
    BatchConverter converter(codec);

    BatchReport report = converter.convertBatch(makeRequest({first, second, other}, "bmp"));

    ASSERT_EQ(report.size(), 3u);
    ASSERT_TRUE(report[0].ok());
    ASSERT_FALSE(report[1].ok());
    ASSERT_EQ(report[1].destination, outDir / "x.bmp");
    ASSERT_EQ(report[1].reason, "destination collides with " + BatchConverter::sourceIdentity(first).string());
    ASSERT_TRUE(report[2].ok());
    ASSERT_EQ(report.failed(), 1u);

    // Only the first file reached the codec and its output is intact
    ASSERT_EQ(codec.calls, (std::vector<fs::path>{first, other}));
    std::ifstream in(outDir / "x.bmp");
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    ASSERT_EQ(content, "bmp:x.png");
}

TEST_F(BatchConverterTest, FailedFileDoesNotReserveItsName) {
    codec.failFor = {"x.png"};
    fs::create_directories(inDir / "a");
    fs::path broken = createSource("a/x.png");
    fs::path good = createSource("x.bmp");
    BatchConverter converter(codec);

    BatchReport report = converter.convertBatch(makeRequest({broken, good}, "jpeg"));

    ASSERT_FALSE(report[0].ok());
    ASSERT_EQ(report[0].reason, "unable to decode image");
    ASSERT_TRUE(report[1].ok());
    ASSERT_TRUE(fs::exists(outDir / "x.jpg"));
}

TEST_F(BatchConverterTest, SameSourceSpelledDifferentlyIsADuplicate) {
    fs::path a = createSource("a.png");
    fs::path spelled = inDir / "." / "a.png";
    BatchConverter converter(codec);

    BatchReport report = converter.convertBatch(makeRequest({a, spelled}, "png"));

    ASSERT_EQ(report.succeeded(), 2u);
    ASSERT_EQ(codec.calls.size(), 2u);
}

TEST_F(BatchConverterTest, ProgressReportsEveryFile) {
    std::vector<fs::path> sources = {createSource("a.png"), inDir / "gone.png", createSource("b.png")};
    BatchConverter converter(codec);

    std::vector<std::size_t> completed;
    std::vector<bool> results;
    converter.convertBatch(makeRequest(sources, "jpg"),
        [&](std::size_t done, std::size_t total, const ConversionOutcome& outcome) {
            ASSERT_EQ(total, 3u);
            completed.push_back(done);
            results.push_back(outcome.ok());
        });

    ASSERT_EQ(completed, (std::vector<std::size_t>{1, 2, 3}));
    ASSERT_EQ(results, (std::vector<bool>{true, false, true}));
}

TEST_F(BatchConverterTest, DestinationUsesStemAndFormatExtension) {
    auto jpeg = *ImageFormat::fromString("jpeg");
    ASSERT_EQ(BatchConverter::destinationFor("/pics/holiday.final.PNG", "/out", jpeg),
              fs::path("/out") / "holiday.final.jpg");

    auto tiff = *ImageFormat::fromString("tif");
    ASSERT_EQ(BatchConverter::destinationFor("scan", "/out", tiff), fs::path("/out") / "scan.tif");
}
