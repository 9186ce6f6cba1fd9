#include "gtest/gtest.h"
#include "utils/CliRequestSource.h"

#include <fstream>

using namespace ImageConverter;

class CliRequestSourceTest : public ::testing::Test {
protected:
    fs::path testDir;

    void SetUp() override {
        testDir = fs::temp_directory_path() / "imgconv_tests" / ::testing::UnitTest::GetInstance()->current_test_info()->name();
        fs::create_directories(testDir);
    }

    void TearDown() override {
        fs::remove_all(testDir);
    }

    void createFile(const fs::path& path) {
        std::ofstream f(path);
        f << "x";
    }

    ArgParser::Arguments convertArgs(const std::vector<std::string>& inputs) {
        ArgParser::Arguments args;
        args.command = "convert";
        args.vectorArgs["input_path"] = inputs;
        args.stringArgs["output_format"] = "jpeg";
        args.stringArgs["output_path"] = (testDir / "out").string();
        args.boolArgs["recursive"] = false;
        return args;
    }
};

TEST_F(CliRequestSourceTest, BuildsRequestOnce) {
    createFile(testDir / "a.png");
    CliRequestSource source(convertArgs({(testDir / "a.png").string(), (testDir / "missing.bmp").string()}));

    auto request = source.nextRequest();
    ASSERT_TRUE(request.has_value());
    ASSERT_EQ(request->sources.size(), 2u);
    ASSERT_EQ(request->targetFormat, "jpeg");
    ASSERT_EQ(request->destinationDir, testDir / "out");

    ASSERT_FALSE(source.nextRequest().has_value());
}

TEST_F(CliRequestSourceTest, ExpandsDirectories) {
    fs::create_directories(testDir / "album" / "nested");
    createFile(testDir / "album" / "b.png");
    createFile(testDir / "album" / "a.bmp");
    createFile(testDir / "album" / "readme.txt");
    createFile(testDir / "album" / "nested" / "c.tif");

    auto args = convertArgs({(testDir / "album").string()});
    CliRequestSource flat(args);
    auto request = flat.nextRequest();
    ASSERT_TRUE(request.has_value());
    ASSERT_EQ(request->sources.size(), 2u);
    ASSERT_EQ(request->sources[0].filename(), "a.bmp");

    args.boolArgs["recursive"] = true;
    CliRequestSource deep(args);
    ASSERT_EQ(deep.nextRequest()->sources.size(), 3u);
}

TEST_F(CliRequestSourceTest, EncoderOptionsFallBackToDefaults) {
    createFile(testDir / "a.png");
    EncodeOptions defaults;
    defaults.jpegQuality = 70;
    defaults.webpQuality = 70;
    defaults.pngCompression = 6;

    auto args = convertArgs({(testDir / "a.png").string()});
    CliRequestSource fromDefaults(args, defaults);
    auto request = fromDefaults.nextRequest();
    ASSERT_EQ(request->options.jpegQuality, 70);
    ASSERT_EQ(request->options.pngCompression, 6);

    args.intArgs["quality"] = 40;
    CliRequestSource explicitQuality(args, defaults);
    request = explicitQuality.nextRequest();
    ASSERT_EQ(request->options.jpegQuality, 40);
    ASSERT_EQ(request->options.webpQuality, 40);
    ASSERT_EQ(request->options.pngCompression, 6);
}

TEST_F(CliRequestSourceTest, ToneMappingAndBackgroundOverrides) {
    createFile(testDir / "a.hdr");
    EncodeOptions defaults;
    defaults.exposure = 0.5;
    defaults.background = RgbColor{0, 0, 0};

    auto args = convertArgs({(testDir / "a.hdr").string()});
    CliRequestSource fromDefaults(args, defaults);
    auto request = fromDefaults.nextRequest();
    ASSERT_DOUBLE_EQ(request->options.exposure, 0.5);
    ASSERT_DOUBLE_EQ(request->options.gamma, 2.2);
    ASSERT_EQ(request->options.background, (RgbColor{0, 0, 0}));

    args.doubleArgs["exposure"] = 2.0;
    args.doubleArgs["gamma"] = 1.8;
    args.stringArgs["background"] = "#336699";
    CliRequestSource overridden(args, defaults);
    request = overridden.nextRequest();
    ASSERT_DOUBLE_EQ(request->options.exposure, 2.0);
    ASSERT_DOUBLE_EQ(request->options.gamma, 1.8);
    ASSERT_EQ(request->options.background, (RgbColor{0x33, 0x66, 0x99}));
}

TEST_F(CliRequestSourceTest, NothingToConvert) {
    fs::create_directories(testDir / "empty");
    CliRequestSource source(convertArgs({(testDir / "empty").string()}));
    ASSERT_FALSE(source.nextRequest().has_value());

    ArgParser::Arguments gui;
    gui.command = "gui";
    CliRequestSource guiSource(gui);
    ASSERT_FALSE(guiSource.nextRequest().has_value());
}
