#include "../emit/render_writer.hpp"
#include "../ir/passes/component_classifier.hpp"
#include "../ir/printer.hpp"
#include "command_line.hpp"
#include "pipeline.hpp"

#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#ifndef STENCIL_BUILD_PROFILE
#define STENCIL_BUILD_PROFILE "local"
#endif

namespace stencil
{
    void printHelp()
    {
        std::cout << "stencilc - template markup structuring compiler\n"
                  << "Usage: stencilc [options] <input>...\n\n"
                  << "Options:\n"
                  << "  --help                 Show this help text and exit.\n"
                  << "  --version              Show version information and exit.\n"
                  << "  --emit=<kind>          Select output kind (tree, render). Default: tree.\n"
                  << "  --component=<name>     Treat constructs bound to this descriptor as components.\n"
                  << "  --builder-name=<name>  Name of the outermost render target. Default: builder.\n"
                  << "  --no-verify            Skip IR verification after the structuring passes.\n"
                  << "  --check                Report diagnostics only; write no output.\n"
                  << "  -o <path>              Write output to the specified path.\n";
    }

    void printVersion()
    {
        std::cout << "stencilc (build profile: " << STENCIL_BUILD_PROFILE << ")\n";
    }

    std::optional<std::string> loadFile(const std::string& path)
    {
        std::ifstream stream(path, std::ios::binary);
        if (!stream)
        {
            return std::nullopt;
        }

        std::ostringstream buffer;
        buffer << stream.rdbuf();
        return buffer.str();
    }

    void reportDiagnostics(const std::string& path, const std::vector<ir::Diagnostic>& diagnostics)
    {
        for (const auto& diagnostic : diagnostics)
        {
            std::cerr << diagnostic.code << ' ' << path;
            if (diagnostic.span.has_value())
            {
                std::cerr << " L" << diagnostic.span->begin.line << ":C" << diagnostic.span->begin.column;
            }
            std::cerr << " -> " << diagnostic.message << '\n';
        }
    }

    void reportInternalErrors(const std::string& path, const std::vector<ir::InternalError>& errors)
    {
        std::cerr << "STENCIL-E4000 InternalCompilerError: '" << path << "' was abandoned.\n";
        for (const auto& error : errors)
        {
            std::cerr << error.code << " internal invariant violation in " << error.stage << ": " << error.detail
                      << '\n';
        }
    }

    bool emitDocument(const std::string& path,
                      const CompilationResult& result,
                      const CommandLineOptions& options,
                      std::ostream& out)
    {
        if (options.emitKind == "render")
        {
            emit::RenderWriter writer{options.builderName};
            const bool written = writer.write(result.document);
            reportDiagnostics(path, writer.diagnostics());
            if (!written)
            {
                reportInternalErrors(path, writer.errors());
                return false;
            }

            out << writer.output();
            return writer.diagnostics().empty();
        }

        ir::print(result.document, out);
        return true;
    }

    int runCompiler(const CommandLineOptions& options)
    {
        if (!options.outputPath.empty() && options.inputPaths.size() > 1)
        {
            std::cerr << "STENCIL-E3002 OutputSingleInput: -o requires a single input template.\n";
            return 1;
        }

        std::cout << "[information] Starting stencilc pipeline.\n";
        std::cout << "  emit: " << options.emitKind << "\n";
        if (!options.outputPath.empty())
        {
            std::cout << "  output: " << options.outputPath << "\n";
        }

        // Orphan lowering keeps a construct only when one of its descriptors is listed here.
        const passes::DescriptorClassifier classifier{options.componentDescriptors};
        if (!options.componentDescriptors.empty())
        {
            std::cout << "  components: " << options.componentDescriptors.size() << "\n";
        }

        PipelineOptions pipelineOptions;
        pipelineOptions.verify = options.verify;

        int exitCode = 0;
        for (const auto& path : options.inputPaths)
        {
            std::cout << "  input: " << path << "\n";

            const auto content = loadFile(path);
            if (!content.has_value())
            {
                std::cerr << "STENCIL-E3000 InputReadFailed: unable to open '" << path << "'.\n";
                exitCode = 1;
                continue;
            }

            const CompilationResult result = compileTemplate(*content, path, classifier, pipelineOptions);
            reportDiagnostics(path, result.diagnostics);

            if (!result.usable())
            {
                reportInternalErrors(path, result.internalErrors);
                exitCode = 1;
                continue;
            }

            if (result.hasErrors())
            {
                exitCode = 1;
            }

            const auto& root = result.document.node(result.document.root());
            std::cout << "[notice] Structured '" << path << "' into " << root.children.size()
                      << " top-level node(s).\n";

            if (options.showDiagnosticsOnly)
            {
                continue;
            }

            if (options.outputPath.empty())
            {
                std::cout << "[debug] " << options.emitKind << " output:\n";
                if (!emitDocument(path, result, options, std::cout))
                {
                    exitCode = 1;
                }
                continue;
            }

            std::ofstream out(options.outputPath, std::ios::binary);
            if (!out)
            {
                std::cerr << "STENCIL-E3001 OutputWriteFailed: unable to open '" << options.outputPath << "'.\n";
                exitCode = 1;
                continue;
            }

            if (!emitDocument(path, result, options, out))
            {
                exitCode = 1;
                continue;
            }
            std::cout << "[notice] Output written to " << options.outputPath << '\n';
        }

        return exitCode;
    }
} // namespace stencil

int main(int argc, char** argv)
{
    stencil::CommandLineParser parser;
    const auto options = parser.parse(argc, argv);

    if (!options.has_value())
    {
        return 1;
    }

    if (options->showHelp)
    {
        stencil::printHelp();
        return 0;
    }

    if (options->showVersion)
    {
        stencil::printVersion();
        return 0;
    }

    return stencil::runCompiler(options.value());
}
