#include "ConsoleUtils.hpp"
#include "VaultCommands.hpp"
#include "VaultContext.hpp"

#include "buffervault/LoggingCategories.hpp"
#include "buffervault/clipboard/qt/QtClipboardFactory.hpp"
#include "buffervault/config/Settings.hpp"
#include "buffervault/core/ClipboardMonitor.hpp"
#include "buffervault/core/HistoryService.hpp"

#include <CLI/CLI.hpp>
#include <QGuiApplication>
#include <QTimer>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>

#ifndef BUFFERVAULT_VERSION
#define BUFFERVAULT_VERSION "0.0.0"
#endif

namespace
{

using buffervault::log::lcCli;

constexpr std::chrono::milliseconds g_kSignalPollInterval{ 100 };

volatile std::sig_atomic_t g_stopRequested{ 0 };

extern "C" void requestStop(int /*signal*/)
{
    g_stopRequested = 1;
}

[[nodiscard]] buffervault::core::MonitorOptions monitorOptions(const buffervault::config::Settings& settings)
{
    buffervault::core::MonitorOptions options{};
    options.interval = settings.pollInterval;
    options.maxItemBytes = settings.maxItemSizeMb * buffervault::core::g_kBytesPerMiB;
    return options;
}

int runMonitor(int& argc, char** argv, const buffervault::config::Settings& settings,
               buffervault::core::HistoryStore& store)
{
    const QGuiApplication app{ argc, argv };
    auto clipboard = buffervault::clipboard::qt::makeQtClipboard();
    buffervault::core::ClipboardMonitor monitor{ *clipboard, store, monitorOptions(settings) };

    std::signal(SIGINT, requestStop);
    std::signal(SIGTERM, requestStop);

    QTimer stopPoll{};
    QObject::connect(&stopPoll, &QTimer::timeout, [&]() {
        if (g_stopRequested != 0)
        {
            QCoreApplication::quit();
        }
    });
    stopPoll.start(g_kSignalPollInterval);

    std::cout << "BufferVault v" << BUFFERVAULT_VERSION << "\n";
    std::cout << "Clipboard monitoring started. Press Ctrl+C to stop.\n" << std::flush;

    monitor.start();
    const int rc = QCoreApplication::exec();
    std::cout << "\nStopping BufferVault...\n";
    if (!monitor.stop())
    {
        // The detached loop still borrows the clipboard and the store; end without destroying them.
        qCWarning(lcCli) << "monitor loop is stuck, exiting without teardown";
        std::cout << "BufferVault stopped.\n" << std::flush;
        std::_Exit(rc);
    }
    std::cout << "BufferVault stopped.\n";
    return rc;
}

int runRestore(int& argc, char** argv, const buffervault::config::Settings& settings,
               buffervault::core::HistoryStore& store, std::size_t index)
{
    const QGuiApplication app{ argc, argv };
    auto clipboard = buffervault::clipboard::qt::makeQtClipboard();
    buffervault::core::ClipboardMonitor monitor{ *clipboard, store, monitorOptions(settings) };
    buffervault::core::HistoryService service{ store, &monitor, settings.maxHistoryItems };
    buffervault::ui::cli::VaultCommands commands{ service, std::cout, std::cerr };
    return commands.restore(index);
}

} // namespace

int main(int argc, char** argv)
{
    CLI::App app{ "BufferVault - encrypted clipboard history" };
    app.set_version_flag("--version", std::string{ "BufferVault v" } + BUFFERVAULT_VERSION);
    app.require_subcommand(1);

    std::string configPath{ "buffervault.ini" };
    std::string passwordSourceArg;
    std::string storagePathArg;
    bool noEncryption{ false };
    app.add_option("--config", configPath, "INI settings file")->capture_default_str();
    auto* passwordSourceOpt =
        app.add_option("--password-source", passwordSourceArg, "Where the vault password comes from")
            ->check(CLI::IsMember({ "machine", "prompt", "env" }));
    auto* storagePathOpt = app.add_option("--storage-path", storagePathArg, "Vault directory");
    app.add_flag("--no-encryption", noEncryption, "Store entries in plaintext");

    auto* subRun = app.add_subcommand("run", "Monitor the clipboard until interrupted");

    std::size_t limit{ buffervault::ui::cli::g_kDefaultHistoryLimit };
    auto* subHistory = app.add_subcommand("history", "List recent entries");
    subHistory->add_option("--limit", limit, "Number of entries to show")->capture_default_str();

    std::string query;
    auto* subSearch = app.add_subcommand("search", "Find entries containing text");
    subSearch->add_option("query", query, "Case-insensitive text")->required();

    std::size_t index{ 0 };
    auto* subRestore = app.add_subcommand("restore", "Copy an entry back to the clipboard");
    subRestore->add_option("index", index, "Entry index")->required();

    auto* subRemove = app.add_subcommand("remove", "Delete one entry");
    subRemove->add_option("index", index, "Entry index")->required();

    auto* subClear = app.add_subcommand("clear", "Delete the whole history");
    auto* subStats = app.add_subcommand("stats", "Show vault statistics");

    auto* subInspect = app.add_subcommand("inspect", "Decrypt an entry's ciphertext file");
    subInspect->add_option("index", index, "Entry index")->required();

    bool saveConfig{ false };
    auto* subConfig = app.add_subcommand("config", "Show the effective settings");
    subConfig->add_flag("--save", saveConfig, "Write them to the settings file");

    CLI11_PARSE(app, argc, argv);

    try
    {
        auto settings = buffervault::config::loadSettings(configPath);
        if (*passwordSourceOpt)
        {
            settings.passwordSource =
                buffervault::core::parsePasswordSource(passwordSourceArg).value_or(settings.passwordSource);
        }
        if (*storagePathOpt)
        {
            settings.storagePath = storagePathArg;
        }
        if (noEncryption)
        {
            settings.encryptionEnabled = false;
        }

        if (subConfig->parsed())
        {
            buffervault::ui::cli::printSettings(settings, std::cout);
            if (saveConfig)
            {
                buffervault::config::saveSettings(configPath, settings);
                std::cout << "Saved to " << configPath << "\n";
            }
            return 0;
        }

        auto ctx = buffervault::ui::cli::openVaultContext(settings, buffervault::ui::cli::readPassword);

        if (subRun->parsed())
        {
            return runMonitor(argc, argv, settings, *ctx.store);
        }
        if (subRestore->parsed())
        {
            return runRestore(argc, argv, settings, *ctx.store, index);
        }

        buffervault::core::HistoryService service{ *ctx.store, nullptr, settings.maxHistoryItems };
        buffervault::ui::cli::VaultCommands commands{ service, std::cout, std::cerr };
        if (subHistory->parsed())
        {
            return commands.history(limit);
        }
        if (subSearch->parsed())
        {
            return commands.search(query);
        }
        if (subRemove->parsed())
        {
            return commands.remove(index);
        }
        if (subClear->parsed())
        {
            return commands.clear();
        }
        if (subStats->parsed())
        {
            return commands.stats();
        }
        if (subInspect->parsed())
        {
            return commands.inspect(index);
        }
        return 1;
    }
    catch (const std::exception& e)
    {
        qCCritical(lcCli) << "fatal:" << e.what();
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }
}
