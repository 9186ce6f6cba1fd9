#include "ArgParser.h"
#include "Definitions.h"
#include "core/ConversionTypes.h"
#include <iostream>

using namespace std;

namespace ImageConverter {

namespace def = Definitions;

// --- Helper Functions ---

// Function to check if a required argument is present
static bool checkRequired(const cxxopts::ParseResult& result, const std::string& name, const std::string& command) {
    if (!result.count(name)) {
        cerr << "Argument error: --" << name << " is required for command '" << command << "'" << endl;
        return false;
    }
    return true;
}

// --- ArgParser Implementation ---

ArgParser::ArgParser()
    : m_options(def::APP_NAME, "Convert image files to another format.")
{
    m_options.positional_help("[convert|gui] [options]");
    m_options.add_options()
        ("h,help", "Display this help menu");
}

ArgParser::Arguments ArgParser::parseArgs(int argc, char** argv) {
    // The command word is optional; everything after it belongs to the command
    std::string command = "gui";
    int skipped = 0;
    if (argc > 1 && argv[1][0] != '-') {
        command = argv[1];
        skipped = 1;
    } else if (argc > 1) {
        const std::string first = argv[1];
        if (first == "-h" || first == "--help") {
            std::cout << m_options.help() << std::endl;
            std::cout << "Commands:\n  convert   Convert image files headless\n"
                      << "  gui       Launch the graphical converter (default)\n" << std::endl;
            throw HelpRequested();
        }
    }

    cxxopts::Options commandOptions(def::APP_NAME + " " + command, "Arguments for " + command);
    if (command == "convert") addConvertArgs(commandOptions);
    else if (command == "gui") addGuiArgs(commandOptions);
    else throw std::runtime_error("Unknown command: " + command);

    // Shift argv so the command word takes the program name's slot
    int subArgc = argc - skipped;
    char** subArgv = argv + skipped;

    try {
        auto result = commandOptions.parse(subArgc, subArgv);

        if (result.count("help")) {
            std::cout << commandOptions.help() << std::endl;
            throw HelpRequested();
        }

        // --- Custom Requirement Checks ---
        if (command == "convert" && !checkRequired(result, "input_path", command)) throw std::runtime_error("Missing required args.");
        if (command == "convert" && !checkRequired(result, "output_path", command)) throw std::runtime_error("Missing required args.");

        return mapResults(result, command);

    } catch (const std::runtime_error&) {
        throw;
    } catch (const std::exception& e) {
        // cxxopts reports bad options with its own exception types
        cerr << "Error parsing arguments: " << e.what() << endl;
        throw std::runtime_error(std::string("Error parsing arguments: ") + e.what());
    }
}

void ArgParser::addConvertArgs(cxxopts::Options& options) {
    options.positional_help("<input files or directories...>");
    options.add_options()
        ("h,help", "Display this help menu")
        ("input_path", "Image files (or directories of images) to convert", cxxopts::value<std::vector<std::string>>())
        ("f,output_format", "The format to convert the image(s) to (png|jpeg|tiff|bmp|webp|hdr|exr)", cxxopts::value<std::string>()->default_value(def::DEFAULT_OUTPUT_FORMAT))
        ("o,output_path", "The existing directory to write the converted image(s) to", cxxopts::value<std::string>())
        ("r,recursive", "Search input directories recursively", cxxopts::value<bool>()->implicit_value("true")->default_value("false"))
        ("quality", "JPEG/WebP quality (0-100, defaults to the saved setting)", cxxopts::value<int>())
        ("png_compression", "PNG compression level (0-9, defaults to the saved setting)", cxxopts::value<int>())
        ("exposure", "Exposure multiplier applied to HDR/EXR sources before tone mapping", cxxopts::value<double>())
        ("gamma", "Gamma used when tone mapping HDR/EXR sources", cxxopts::value<double>())
        ("background", "Colour behind transparent pixels for formats without alpha (#RRGGBB or R,G,B)", cxxopts::value<std::string>())
        ("config", "Settings file to use instead of the default location", cxxopts::value<std::string>()->default_value(""));
    options.parse_positional("input_path");
}

void ArgParser::addGuiArgs(cxxopts::Options& options) {
    options.add_options()
        ("h,help", "Display this help menu")
        ("theme", "Colour theme: 'dark'|'light' (defaults to the saved setting)", cxxopts::value<std::string>()->default_value(""))
        ("config", "Settings file to use instead of the default location", cxxopts::value<std::string>()->default_value(""));
}

ArgParser::Arguments ArgParser::mapResults(const cxxopts::ParseResult& result, const std::string& command) {
    Arguments args;
    args.command = command;
    args.stringArgs["config"] = result["config"].as<std::string>();

    // --- Convert Command ---
    if (command == "convert") {
        args.vectorArgs["input_path"] = result["input_path"].as<std::vector<std::string>>();
        args.stringArgs["output_format"] = result["output_format"].as<std::string>();
        args.stringArgs["output_path"] = result["output_path"].as<std::string>();
        args.boolArgs["recursive"] = result["recursive"].as<bool>();
        // Encoder options are only recorded when given, so saved settings can fill the rest
        if (result.count("quality")) args.intArgs["quality"] = result["quality"].as<int>();
        if (result.count("png_compression")) args.intArgs["png_compression"] = result["png_compression"].as<int>();
        for (const char* key : {"exposure", "gamma"}) {
            if (!result.count(key)) continue;
            const double value = result[key].as<double>();
            if (!(value > 0.0)) {
                throw std::runtime_error(std::string("Invalid --") + key + ": must be greater than 0");
            }
            args.doubleArgs[key] = value;
        }
        if (result.count("background")) {
            const std::string color = result["background"].as<std::string>();
            if (!RgbColor::fromString(color)) {
                throw std::runtime_error("Invalid --background colour: " + color);
            }
            args.stringArgs["background"] = color;
        }
    }

    // --- GUI Command ---
    else if (command == "gui") {
        args.stringArgs["theme"] = result["theme"].as<std::string>();
    }

    return args;
}

} // namespace ImageConverter
