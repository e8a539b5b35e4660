/**
 * Noos - Timeline aggregator for RSS and Atom feeds
 * 
 * Copyright (C) 2025
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFuture>
#include <spdlog/spdlog.h>

#include "core/Logging.hpp"
#include "core/TimeFormat.hpp"
#include "core/TimelineStore.hpp"
#include "core/config/ConfigManager.hpp"
#include "core/platform/Platform.hpp"
#include "feeds/ChannelList.hpp"
#include "feeds/FeedCache.hpp"
#include "feeds/Ingestion.hpp"
#include "feeds/OpmlFile.hpp"
#include "network/FeedFetcher.hpp"
#include "render/TemplateLoader.hpp"

namespace {

constexpr const char* FEED_CACHE_FILE = "feeds.msgpack";

/**
 * Command line settings shared by all commands
 */
struct Options {
    std::optional<std::filesystem::path> itemTemplate;
    std::optional<std::filesystem::path> pageTemplate;
    std::optional<std::filesystem::path> outputFile;
    bool offline = false;
};

std::optional<std::filesystem::path> optionalPath(const QCommandLineParser& parser,
                                                  const QCommandLineOption& option) {
    if (!parser.isSet(option)) {
        return std::nullopt;
    }
    return std::filesystem::path(parser.value(option).toStdString());
}

/**
 * Fetch all channels concurrently, ingesting each as soon as it arrives
 */
std::vector<noos::ParsedFeed> fetchChannels(
    const std::vector<std::string>& urls,
    const noos::ProgramConfig& program,
    noos::TimelineStore& store
) {
    const std::int64_t ingestedAt = noos::toUnixSeconds(std::chrono::system_clock::now());

    std::vector<QFuture<std::optional<noos::ParsedFeed>>> pending;
    pending.reserve(urls.size());
    for (const auto& url : urls) {
        pending.push_back(
            noos::fetchFeed(url, program.fetchTimeoutMs, program.maxItemsPerFeed)
                .then([&store, ingestedAt](std::optional<noos::ParsedFeed> feed) {
                    if (feed) {
                        noos::ingestFeed(store, *feed, ingestedAt);
                    }
                    return feed;
                }));
    }

    std::vector<noos::ParsedFeed> feeds;
    for (auto& future : pending) {
        future.waitForFinished();
        auto feed = future.result();
        if (feed) {
            feeds.push_back(std::move(*feed));
        }
    }

    spdlog::info("Fetched {} of {} channels", feeds.size(), urls.size());
    return feeds;
}

int runDump(const noos::ConfigManager& config, const Options& options) {
    const auto& program = config.programConfig();

    spdlog::info("Loading HTML templates...");
    std::optional<noos::ItemTemplate> itemTemplate;
    std::optional<noos::PageTemplate> pageTemplate;
    try {
        itemTemplate.emplace(noos::loadItemTemplate(noos::itemTemplateSource(
            config.configDirectory(), options.itemTemplate, program.itemTemplate)));
        pageTemplate.emplace(noos::loadPageTemplate(noos::pageTemplateSource(
            config.configDirectory(), options.pageTemplate, program.pageTemplate)));
    } catch (const noos::TemplateError& e) {
        spdlog::error("{}", e.what());
        spdlog::error("Exiting...");
        return 1;
    }

    noos::TimelineStore store;
    auto cachePath = noos::Platform::getCachePath() / FEED_CACHE_FILE;

    if (options.offline) {
        spdlog::info("Loading feeds from cache...");
        auto feeds = noos::loadFeedCache(cachePath);
        if (!feeds) {
            spdlog::error("No usable feed cache at: {}", cachePath.string());
            return 1;
        }
        const std::int64_t ingestedAt = noos::toUnixSeconds(std::chrono::system_clock::now());
        for (const auto& feed : *feeds) {
            noos::ingestFeed(store, feed, ingestedAt);
        }
    } else {
        noos::ChannelList channels(config.channelsFile());
        if (!channels.load()) {
            return 1;
        }
        if (channels.urls().empty()) {
            spdlog::warn("No feeds subscribed, add one with 'noos feed add <url>'");
        }

        auto feeds = fetchChannels(channels.urls(), program, store);
        
        std::vector<noos::ParsedFeed> cached;
        std::error_code ec;
        if (feeds.size() < channels.urls().size() && std::filesystem::exists(cachePath, ec)) {
            auto previous = noos::loadFeedCache(cachePath);
            if (previous) {
                cached = std::move(*previous);
            }
        }
        
        auto merged = noos::mergeFeeds(channels.urls(), std::move(feeds), std::move(cached));
        if (!noos::saveFeedCache(cachePath, merged)) {
            spdlog::warn("Feed cache not updated");
        }
    }

    spdlog::info("Rendering HTML output from {} entries...", store.size());
    std::string html = pageTemplate->render(store, *itemTemplate);

    std::filesystem::path outputPath = options.outputFile.value_or(program.outputFile);
    spdlog::info("Writing output HTML to '{}'...", outputPath.string());
    std::ofstream output(outputPath, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        spdlog::error("Failed to open output file: {}", outputPath.string());
        return 1;
    }
    output << html;
    if (!output) {
        spdlog::error("Failed to write output file: {}", outputPath.string());
        return 1;
    }

    spdlog::info("Success! Exiting...");
    return 0;
}

int runFeed(const noos::ConfigManager& config, const QStringList& args) {
    if (args.isEmpty()) {
        std::cerr << "feed: expected one of list, add, remove, import, export\n";
        return 2;
    }

    const QString action = args.at(0);
    const bool needsArgument = action != "list";
    if (needsArgument && args.size() < 2) {
        std::cerr << "feed " << action.toStdString() << ": missing argument\n";
        return 2;
    }
    const std::string argument = needsArgument ? args.at(1).toStdString() : std::string();

    noos::ChannelList channels(config.channelsFile());
    if (!channels.load()) {
        return 1;
    }

    if (action == "list") {
        for (const auto& url : channels.urls()) {
            std::cout << url << '\n';
        }
        return 0;
    }

    if (action == "add") {
        if (!channels.add(argument)) {
            spdlog::info("Already subscribed to: {}", argument);
            return 0;
        }
        spdlog::info("Added feed: {}", argument);
        return channels.save() ? 0 : 1;
    }

    if (action == "remove") {
        if (!channels.remove(argument)) {
            spdlog::error("Not subscribed to: {}", argument);
            return 1;
        }
        spdlog::info("Removed feed: {}", argument);
        return channels.save() ? 0 : 1;
    }

    if (action == "import") {
        auto urls = noos::OpmlFile::importUrls(argument);
        if (!urls) {
            return 1;
        }
        std::size_t added = 0;
        for (const auto& url : *urls) {
            if (channels.add(url)) {
                ++added;
            }
        }
        spdlog::info("Imported {} new feeds ({} in file)", added, urls->size());
        return channels.save() ? 0 : 1;
    }

    if (action == "export") {
        return noos::OpmlFile::exportUrls(argument, channels.urls()) ? 0 : 1;
    }

    std::cerr << "feed: unknown action '" << action.toStdString() << "'\n";
    return 2;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("noos");
    app.setApplicationVersion("0.1.0");

    // Parse command line arguments
    QCommandLineParser parser;
    parser.setApplicationDescription("A pragmatic RSS aggregator rendering a single HTML timeline");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption verbosityOption(
        QStringList() << "v" << "verbosity",
        "Minimum log level: error, warn, info, debug, or 0-3",
        "level"
    );
    parser.addOption(verbosityOption);

    QCommandLineOption itemTemplateOption(
        "item-template",
        "Path to the html template for item/article rendering",
        "path"
    );
    parser.addOption(itemTemplateOption);

    QCommandLineOption pageTemplateOption(
        "page-template",
        "Path to the html template for the page surrounding the articles",
        "path"
    );
    parser.addOption(pageTemplateOption);

    QCommandLineOption configDirOption(
        QStringList() << "c" << "config-directory",
        "Configuration directory path",
        "path"
    );
    parser.addOption(configDirOption);

    QCommandLineOption fileOption(
        QStringList() << "f" << "file",
        "File to write the dumped HTML to",
        "path"
    );
    parser.addOption(fileOption);

    QCommandLineOption offlineOption(
        "offline",
        "Render from the feed cache instead of fetching"
    );
    parser.addOption(offlineOption);

    parser.addPositionalArgument("command", "dump (default), or feed list|add|remove|import|export", "[command]");
    parser.addPositionalArgument("args", "Command arguments", "[args...]");

    parser.process(app);

    std::optional<spdlog::level::level_enum> cliLevel;
    if (parser.isSet(verbosityOption)) {
        cliLevel = noos::parseLogLevel(parser.value(verbosityOption).toStdString());
        if (!cliLevel) {
            std::cerr << "Invalid log level '" << parser.value(verbosityOption).toStdString() << "'\n";
            return 2;
        }
    }

    // Setup logging
    noos::setupLogging(cliLevel.value_or(spdlog::level::info), noos::Platform::getDataPath() / "logs");

    // Initialize configuration
    std::filesystem::path configPath;
    if (parser.isSet(configDirOption)) {
        configPath = parser.value(configDirOption).toStdString();
    } else {
        configPath = noos::Platform::getConfigPath();
    }

    noos::ConfigManager configManager;
    if (!configManager.initialize(configPath)) {
        spdlog::error("Failed to initialize configuration");
        return 1;
    }

    if (!cliLevel) {
        auto configLevel = noos::parseLogLevel(configManager.programConfig().logVerbosity);
        if (configLevel) {
            noos::setConsoleLevel(*configLevel);
        } else {
            spdlog::warn("Ignoring invalid logVerbosity '{}' in config",
                         configManager.programConfig().logVerbosity);
        }
    }

    Options options;
    options.itemTemplate = optionalPath(parser, itemTemplateOption);
    options.pageTemplate = optionalPath(parser, pageTemplateOption);
    options.outputFile = optionalPath(parser, fileOption);
    options.offline = parser.isSet(offlineOption);

    QStringList positional = parser.positionalArguments();
    QString command = positional.isEmpty() ? QString("dump") : positional.takeFirst();

    if (command == "dump" || command == "d") {
        return runDump(configManager, options);
    }
    if (command == "feed") {
        return runFeed(configManager, positional);
    }

    std::cerr << "Unknown command: " << command.toStdString() << "\n\n"
              << parser.helpText().toStdString();
    return 2;
}
