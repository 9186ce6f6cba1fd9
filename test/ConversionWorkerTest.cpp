#include "gtest/gtest.h"
#include "helpers/ConversionWorker.h"

#include <QCoreApplication>
#include <QSignalSpy>
#include <filesystem>
#include <memory>
#include <opencv2/opencv.hpp>

namespace fs = std::filesystem;
using namespace ImageConverter;

class ConversionWorkerTest : public ::testing::Test {
protected:
    static std::unique_ptr<QCoreApplication> app;
    fs::path testDir;

    static void SetUpTestSuite() {
        static int argc = 1;
        static char name[] = "imageconverter_tests";
        static char* argv[] = {name, nullptr};
        if (!QCoreApplication::instance()) {
            app = std::make_unique<QCoreApplication>(argc, argv);
        }
    }

    static void TearDownTestSuite() {
        app.reset();
    }

    void SetUp() override {
        testDir = fs::temp_directory_path() / "imgconv_tests" / ::testing::UnitTest::GetInstance()->current_test_info()->name();
        fs::create_directories(testDir / "out");
    }

    void TearDown() override {
        fs::remove_all(testDir);
    }

    fs::path createImage(const std::string& name) {
        fs::path path = testDir / name;
        cv::Mat img(12, 16, CV_8UC3, cv::Scalar(40, 80, 120));
        EXPECT_TRUE(cv::imwrite(path.string(), img));
        return path;
    }
};

std::unique_ptr<QCoreApplication> ConversionWorkerTest::app;

TEST_F(ConversionWorkerTest, ReportsEachFileThenFinishes) {
    ConversionRequest request;
    request.sources = {createImage("a.png"), testDir / "missing.png", createImage("b.bmp")};
    request.targetFormat = "jpeg";
    request.destinationDir = testDir / "out";

    ConversionWorker worker(request);
    QSignalSpy progress(&worker, &ConversionWorker::fileConverted);
    QSignalSpy finished(&worker, &ConversionWorker::batchFinished);
    QSignalSpy failed(&worker, &ConversionWorker::batchFailed);

    worker.start();
    ASSERT_TRUE(worker.wait(30000));

    ASSERT_EQ(progress.count(), 3);
    for (int i = 0; i < progress.count(); ++i) {
        const QList<QVariant> args = progress.at(i);
        ASSERT_EQ(args.at(0).toInt(), i + 1);
        ASSERT_EQ(args.at(1).toInt(), 3);
    }
    ASSERT_TRUE(progress.at(0).at(3).toBool());
    ASSERT_EQ(progress.at(0).at(4).toString(), "a.jpg");
    ASSERT_FALSE(progress.at(1).at(3).toBool());
    ASSERT_EQ(progress.at(1).at(4).toString(), "source not found");
    ASSERT_TRUE(progress.at(2).at(3).toBool());

    ASSERT_EQ(finished.count(), 1);
    ASSERT_EQ(failed.count(), 0);
    const BatchReport report = finished.at(0).at(0).value<BatchReport>();
    ASSERT_EQ(report.size(), 3u);
    ASSERT_EQ(report.succeeded(), 2u);
    ASSERT_TRUE(fs::exists(testDir / "out" / "b.jpg"));
}

TEST_F(ConversionWorkerTest, RejectedRequestOnlyFails) {
    ConversionRequest request;
    request.sources = {createImage("a.png")};
    request.targetFormat = "png";
    request.destinationDir = testDir / "nowhere";

    ConversionWorker worker(request);
    QSignalSpy progress(&worker, &ConversionWorker::fileConverted);
    QSignalSpy finished(&worker, &ConversionWorker::batchFinished);
    QSignalSpy failed(&worker, &ConversionWorker::batchFailed);

    worker.start();
    ASSERT_TRUE(worker.wait(30000));

    ASSERT_EQ(progress.count(), 0);
    ASSERT_EQ(finished.count(), 0);
    ASSERT_EQ(failed.count(), 1);
    ASSERT_EQ(failed.at(0).at(0).toString().toStdString(),
              "destination directory does not exist: " + request.destinationDir.string());
}
