/**
 * @file LoopBinderApp.cpp
 * @brief Implementation of the LoopBinderApp class.
 */
#include "app/LoopBinderApp.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

#include "application/PipelineOrchestrator.hpp"
#include "application/RunContext.hpp"
#include "domain/PipelineErrors.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/ContentHasher.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/PdfToolkit.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/RunLog.hpp"
#include "infrastructure/SafeCopier.hpp"

namespace loopbinder::app {

namespace {

std::optional<int> ParseStage(const std::string& value) {
    if (value.size() != 1 || !std::isdigit(static_cast<unsigned char>(value[0]))) return std::nullopt;
    int stage = value[0] - '0';
    if (stage < 1 || stage > 7) return std::nullopt;
    return stage;
}

void PrintSummary(const application::RunSummary& s) {
    std::cout << "\n[LoopBinder] Run complete\n"
              << "  Entities OK:        " << s.entitiesOk << "\n"
              << "  Entities MISSING:   " << s.entitiesMissing << "\n"
              << "  Open issues:        " << s.openIssues << "\n"
              << "  Folders c/r/m:      " << s.foldersCreated << "/" << s.foldersRenamed << "/" << s.foldersMerged << "\n"
              << "  Documents copied:   " << s.documentsCopied << "\n"
              << "  Pages extracted:    " << s.pagesExtracted << "\n"
              << "  Backups created:    " << s.backupsCreated << "\n"
              << "  Documents removed:  " << s.documentsRemoved << "\n"
              << "  Merges written:     " << s.mergesWritten << " (cached: " << s.mergesCached << ")\n"
              << "  Orphans removed:    " << s.orphanFoldersRemoved << "\n"
              << "  Errors:             " << s.errors << std::endl;
}

} // namespace

LoopBinderApp::LoopBinderApp(CommandLine options) : m_options(std::move(options)) {}

void LoopBinderApp::PrintUsage(std::ostream& out) {
    out << "Usage: loopbinder [--config <settings.json>] [--stage <1-7>]...\n"
        << "       loopbinder --init-config <settings.json>\n"
        << "\n"
        << "  --config <path>       Settings file (default: "
        << infrastructure::PathUtils::GetDefaultSettingsPath().string() << ")\n"
        << "  --init-config <path>  Write a settings template and exit\n"
        << "  --stage <n>           Run only stage n; repeatable\n"
        << "  -h, --help            Show this help\n"
        << "\n"
        << "Stages: 1 reconcile & fetch, 2 candidate tables, 3 extract ranges,\n"
        << "        4 backup copies, 5 cleanup redundancy, 6 merge, 7 verify\n";
}

std::optional<CommandLine> LoopBinderApp::ParseArguments(const std::vector<std::string>& args, std::string& error) {
    CommandLine options;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto next = [&](std::string& value) {
            if (i + 1 >= args.size()) {
                error = arg + " requires a value";
                return false;
            }
            value = args[++i];
            return true;
        };

        std::string value;
        if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else if (arg == "--config") {
            if (!next(value)) return std::nullopt;
            options.configPath = value;
        } else if (arg == "--init-config") {
            if (!next(value)) return std::nullopt;
            options.initConfigPath = value;
        } else if (arg == "--stage") {
            if (!next(value)) return std::nullopt;
            auto stage = ParseStage(value);
            if (!stage) {
                error = "invalid stage '" + value + "' (expected 1-7)";
                return std::nullopt;
            }
            options.stages.push_back(*stage);
        } else {
            error = "unknown argument '" + arg + "'";
            return std::nullopt;
        }
    }

    std::sort(options.stages.begin(), options.stages.end());
    options.stages.erase(std::unique(options.stages.begin(), options.stages.end()), options.stages.end());
    return options;
}

int LoopBinderApp::Run() {
    if (m_options.help) {
        PrintUsage(std::cout);
        return kExitOk;
    }

    if (!m_options.initConfigPath.empty()) {
        try {
            infrastructure::ConfigLoader::WriteTemplate(m_options.initConfigPath);
        } catch (const domain::PipelineError& e) {
            std::cerr << "[LoopBinder] " << e.what() << std::endl;
            return kExitSetupError;
        }
        std::cout << "[LoopBinder] Settings template written to " << m_options.initConfigPath.string() << std::endl;
        return kExitOk;
    }

    return RunPipeline();
}

int LoopBinderApp::RunPipeline() {
    const auto settingsPath = m_options.configPath.empty()
        ? infrastructure::PathUtils::GetDefaultSettingsPath()
        : m_options.configPath;

    infrastructure::RunConfig config;
    try {
        config = infrastructure::ConfigLoader::Load(settingsPath);
    } catch (const domain::SetupError& e) {
        std::cerr << "[LoopBinder] " << e.what() << std::endl;
        return kExitSetupError;
    }
    if (!m_options.stages.empty()) config.stages = m_options.stages;

    infrastructure::RunLog log(config.logDirectory);
    infrastructure::PersistenceService persistence;
    infrastructure::ContentHasher hasher;
    infrastructure::SafeCopier copier(config.copyIdentity);
    infrastructure::PdfToolkit engine(config.toolDirectory);
    application::RunSummary summary;
    application::RunContext context{config, log, engine, copier, hasher, persistence, summary};

    log.action("[LoopBinder] Settings: " + settingsPath.string());
    if (config.copyIdentity == infrastructure::CopyIdentity::Digest) {
        log.action("[LoopBinder] copy_identity=digest: existing files are compared by SHA-256, not size");
    }

    application::PipelineOrchestrator orchestrator(context);
    try {
        orchestrator.preflight();
    } catch (const domain::SetupError& e) {
        log.error("[Preflight] " + std::string(e.what()));
        return kExitSetupError;
    }

    PrintSummary(orchestrator.run());
    return kExitOk;
}

} // namespace loopbinder::app
