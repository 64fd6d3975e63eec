/**
 * @file LoopBinderApp.hpp
 * @brief Command line front end and composition root of LoopBinder.
 */

#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace loopbinder::app {

/**
 * @struct CommandLine
 * @brief Parsed program arguments.
 */
struct CommandLine {
    std::filesystem::path configPath;     ///< Empty: default settings location.
    std::filesystem::path initConfigPath; ///< Non-empty: write a template and exit.
    std::vector<int> stages;              ///< Empty: stages from the settings file.
    bool help = false;
};

/**
 * @class LoopBinderApp
 * @brief Wires configuration, logging and the document engine into one pipeline run.
 */
class LoopBinderApp {
public:
    static constexpr int kExitOk = 0;
    static constexpr int kExitSetupError = 1;
    static constexpr int kExitUsage = 2;

    explicit LoopBinderApp(CommandLine options);

    /**
     * @brief Executes the requested command.
     * @return Process exit code.
     */
    int Run();

    /**
     * @brief Parses argv.
     * @param error Filled with a message when nullopt is returned.
     */
    static std::optional<CommandLine> ParseArguments(const std::vector<std::string>& args, std::string& error);

    static void PrintUsage(std::ostream& out);

private:
    CommandLine m_options;

    int RunPipeline();
};

} // namespace loopbinder::app
