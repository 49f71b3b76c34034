#pragma once

#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stencil
{
    struct CommandLineOptions
    {
        std::vector<std::string> inputPaths;
        std::vector<std::string> componentDescriptors;
        std::string outputPath;
        std::string emitKind{"tree"};
        std::string builderName{"builder"};
        bool showHelp{false};
        bool showVersion{false};
        bool verify{true};
        bool showDiagnosticsOnly{false};
    };

    class CommandLineParser
    {
    public:
        std::optional<CommandLineOptions> parse(int argc, char** argv) const
        {
            CommandLineOptions options;

            for (int index = 1; index < argc; ++index)
            {
                std::string_view argument{argv[index]};

                if (argument == "--help")
                {
                    options.showHelp = true;
                    return options;
                }

                if (argument == "--version")
                {
                    options.showVersion = true;
                    return options;
                }

                if (argument.rfind("--emit=", 0) == 0)
                {
                    options.emitKind = std::string{argument.substr(7)};
                    if (options.emitKind != "tree" && options.emitKind != "render")
                    {
                        std::cerr << "STENCIL-E1003 UnknownEmitKind: expected 'tree' or 'render' but found '"
                                  << options.emitKind << "'.\n";
                        return std::nullopt;
                    }
                    continue;
                }

                if (argument.rfind("--component=", 0) == 0)
                {
                    constexpr std::string_view componentOpt = "--component=";
                    const auto descriptor = argument.substr(componentOpt.size());
                    if (descriptor.empty())
                    {
                        std::cerr << "STENCIL-E1005 MissingComponent: --component requires a descriptor name.\n";
                        return std::nullopt;
                    }
                    options.componentDescriptors.emplace_back(descriptor);
                    continue;
                }

                if (argument.rfind("--builder-name=", 0) == 0)
                {
                    constexpr std::string_view builderOpt = "--builder-name=";
                    options.builderName = std::string{argument.substr(builderOpt.size())};
                    if (options.builderName.empty())
                    {
                        std::cerr << "STENCIL-E1004 MissingBuilderName: --builder-name requires a non-empty name.\n";
                        return std::nullopt;
                    }
                    continue;
                }

                if (argument == "--no-verify")
                {
                    options.verify = false;
                    continue;
                }

                if (argument == "--check")
                {
                    options.showDiagnosticsOnly = true;
                    continue;
                }

                if (argument.rfind("-o", 0) == 0)
                {
                    if (argument.size() > 2)
                    {
                        options.outputPath = std::string{argument.substr(2)};
                    }
                    else if (index + 1 < argc)
                    {
                        options.outputPath = std::string{argv[++index]};
                    }
                    else
                    {
                        std::cerr << "STENCIL-E1000 MissingOutput: expected path after -o option.\n";
                        return std::nullopt;
                    }

                    continue;
                }

                if (!argument.empty() && argument[0] == '-')
                {
                    std::cerr << "STENCIL-E1001 UnknownOption: unrecognised option '" << argument << "'.\n";
                    return std::nullopt;
                }

                options.inputPaths.emplace_back(argument);
            }

            if (!options.showHelp && !options.showVersion && options.inputPaths.empty())
            {
                std::cerr << "STENCIL-E1002 MissingInput: at least one input file is required.\n";
                return std::nullopt;
            }

            return options;
        }
    };
} // namespace stencil
