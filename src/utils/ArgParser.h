#ifndef IMAGE_CONVERTER_ARG_PARSER_H
#define IMAGE_CONVERTER_ARG_PARSER_H

#include <string>
#include <vector>
#include <map>
#include <stdexcept>
#include <cxxopts.hpp> // Requires cxxopts dependency

namespace ImageConverter {

/**
 * @brief Utility class to parse command line arguments using cxxopts.
 *
 * The first argument selects the command ("convert" or "gui"); without one
 * the GUI is launched.
 */
class ArgParser {
public:
    /**
     * @brief Structure to hold the result of the parsed arguments.
     */
    struct Arguments {
        std::string command;
        std::map<std::string, std::string> stringArgs;
        std::map<std::string, std::vector<std::string>> vectorArgs;
        std::map<std::string, bool> boolArgs;
        std::map<std::string, int> intArgs;
        std::map<std::string, double> doubleArgs;
    };

    /**
     * @brief Thrown after the help text was printed; not an error.
     */
    class HelpRequested : public std::runtime_error {
    public:
        HelpRequested() : std::runtime_error("Help displayed.") {}
    };

    ArgParser();

    /**
     * @brief Parses the raw command line arguments.
     * @param argc The argument count.
     * @param argv The argument values.
     * @return The Arguments struct containing the parsed values.
     * @throws HelpRequested if -h/--help was given.
     * @throws std::runtime_error on unknown commands, bad or missing options.
     */
    Arguments parseArgs(int argc, char** argv);

private:
    cxxopts::Options m_options;

    /**
     * @brief Adds arguments specific to the 'convert' command.
     */
    void addConvertArgs(cxxopts::Options& options);

    /**
     * @brief Adds arguments specific to the 'gui' command.
     */
    void addGuiArgs(cxxopts::Options& options);

    /**
     * @brief Extracts and maps results from cxxopts::ParseResult into Arguments structure.
     */
    Arguments mapResults(const cxxopts::ParseResult& result, const std::string& command);
};

} // namespace ImageConverter

#endif // IMAGE_CONVERTER_ARG_PARSER_H
