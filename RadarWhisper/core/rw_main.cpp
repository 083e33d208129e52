// rw_main.cpp

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <getopt.h>

#include "rw_fmod_playback.h"
#include "rw_logger.h"
#include "rw_player.h"
#include "rw_playlist_manager.h"
#include "rw_settings.h"
#include "rw_taglib_metadata.h"
#include "rw_utils.h"

namespace
{

volatile std::sig_atomic_t g_interrupted = 0;

void OnInterrupt(int)
{
    g_interrupted = 1;
}

struct CommandLine
{
    std::vector<std::string> arguments;
    std::string configFile = "radarwhisper_settings.json";
    bool shuffle = false;
    std::optional<RW::RepeatMode> repeatMode;
    std::optional<int> volume;
};

void PrintUsage(const char* program)
{
    std::cout << "Usage:\n"
              << "  " << program << " info <playlist>\n"
              << "  " << program << " convert <input playlist> <output playlist>\n"
              << "  " << program << " create <output playlist> <audio files...>\n"
              << "  " << program << " play <playlist> [--shuffle] [--repeat none|playlist|track] [--volume N]\n"
              << "Options:\n"
              << "  --config <file>   settings file (default radarwhisper_settings.json)\n"
              << "  --help            show this message\n";
}

bool ParseCommandLine(int argc, char* argv[], CommandLine& commandLine)
{
    static const struct option long_options[] = {
        { "shuffle", no_argument,       nullptr, 's' },
        { "repeat",  required_argument, nullptr, 'r' },
        { "volume",  required_argument, nullptr, 'v' },
        { "config",  required_argument, nullptr, 'c' },
        { "help",    no_argument,       nullptr, 'h' },
        { nullptr,   0,                 nullptr, 0 }
    };

    int opt;
    while ((opt = getopt_long(argc, argv, "sr:v:c:h", long_options, nullptr)) != -1)
    {
        switch (opt)
        {
            case 's':
                commandLine.shuffle = true;
                break;
            case 'r':
                commandLine.repeatMode = RW::RepeatModeFromString(optarg);
                if (!commandLine.repeatMode)
                {
                    std::cerr << "Unknown repeat mode: " << optarg << "\n";
                    return false;
                }
                break;
            case 'v':
            {
                char* end = nullptr;
                const long volume = std::strtol(optarg, &end, 10);
                if (end == optarg || *end != '\0' || volume < 0 || volume > 100)
                {
                    std::cerr << "Volume must be a number between 0 and 100.\n";
                    return false;
                }
                commandLine.volume = static_cast<int>(volume);
                break;
            }
            case 'c':
                commandLine.configFile = optarg;
                break;
            case 'h':
            case '?':
            default:
                return false;
        }
    }

    for (int i = optind; i < argc; ++i)
    {
        commandLine.arguments.push_back(argv[i]);
    }
    return !commandLine.arguments.empty();
}

void PrintPlaylist(const RW::Playlist& playlist)
{
    const RW::PlaylistStatistics stats = playlist.GetStatistics();

    std::cout << "Name:          " << stats.name << "\n"
              << "Id:            " << playlist.GetId() << "\n"
              << "Tracks:        " << stats.trackCount << "\n"
              << "Duration:      " << stats.totalDurationText << "\n"
              << "Created:       " << stats.creationDate << "\n"
              << "Last modified: " << stats.lastModified << "\n";

    if (!playlist.GetDescription().empty())
    {
        std::cout << "Description:   " << playlist.GetDescription() << "\n";
    }

    int index = 1;
    for (const auto& track : playlist.GetTracks())
    {
        std::cout << "  " << index++ << ". ";

        auto artist = track.GetArtist();
        if (artist && !artist->empty())
        {
            std::cout << *artist << " - ";
        }
        std::cout << track.GetDisplayTitle();

        if (auto duration = track.GetDurationMs())
        {
            std::cout << " [" << RW::FormatDuration(*duration / 1000) << "]";
        }
        std::cout << "\n";
    }
}

int RunInfo(RW::PlaylistManager& manager, const std::vector<std::string>& args)
{
    if (args.size() != 2)
    {
        return 2;
    }

    auto id = manager.LoadPlaylist(args[1]);
    if (!id)
    {
        return 1;
    }

    PrintPlaylist(*manager.GetPlaylist(*id));
    return 0;
}

int RunConvert(RW::PlaylistManager& manager, const std::vector<std::string>& args)
{
    if (args.size() != 3)
    {
        return 2;
    }

    auto id = manager.LoadPlaylist(args[1]);
    if (!id || !manager.SavePlaylist(*id, args[2]))
    {
        return 1;
    }

    std::cout << "Converted " << args[1] << " to " << args[2] << "\n";
    return 0;
}

int RunCreate(RW::PlaylistManager& manager, const std::vector<std::string>& args)
{
    if (args.size() < 3)
    {
        return 2;
    }

    const std::string id = manager.CreatePlaylist(RW::FileStemOf(args[1]));
    const std::vector<std::string> files(args.begin() + 2, args.end());

    const size_t added = manager.AddTracks(id, files);
    if (added == 0)
    {
        std::cerr << "None of the given files could be added.\n";
        return 1;
    }

    if (!manager.SavePlaylist(id, args[1]))
    {
        return 1;
    }

    std::cout << "Saved " << added << " of " << files.size() << " tracks to " << args[1] << "\n";
    return 0;
}

int RunPlay(RW::PlaylistManager& manager, RW::Settings& settings, const CommandLine& commandLine)
{
    const auto& args = commandLine.arguments;
    if (args.size() != 2)
    {
        return 2;
    }

    auto id = manager.LoadPlaylist(args[1]);
    if (!id)
    {
        return 1;
    }
    manager.SetCurrentPlaylist(*id);

    std::error_code ec;
    const auto playlistDirectory = std::filesystem::absolute(args[1], ec).parent_path();
    if (!ec)
    {
        settings.lastPlaylistDirectory = playlistDirectory.string();
    }

    if (commandLine.shuffle)
        settings.shuffle = true;
    if (commandLine.repeatMode)
        settings.repeatMode = *commandLine.repeatMode;
    if (commandLine.volume)
        settings.volume = *commandLine.volume;

    manager.SetRepeatMode(settings.repeatMode);
    manager.SetShuffleMode(settings.shuffle);

    RW::FmodPlaybackEngine engine;
    if (!engine.Initialize())
    {
        spdlog::error("Failed to initialize FMOD.");
        return -1;
    }

    RW::Player player(manager, engine);
    player.SetVolume(settings.volume);
    player.SetMuted(settings.muted);

    player.RegisterNowPlayingCallback([&manager](const RW::TrackSelection& selection) {
        const RW::Playlist* playlist = manager.GetCurrentPlaylist();
        std::cout << "[" << selection.index + 1 << "/" << (playlist ? playlist->GetTrackCount() : 0) << "] "
                  << selection.track.GetDisplayTitle() << std::endl;
    });

    if (!player.PlayCurrent())
    {
        engine.Shutdown();
        return 1;
    }

    std::signal(SIGINT, OnInterrupt);

    bool isRunning = true;
    auto lastTime = std::chrono::high_resolution_clock::now();

    while (isRunning)
    {
        auto currentTime = std::chrono::high_resolution_clock::now();
        float dt = std::chrono::duration<float>(currentTime - lastTime).count();
        lastTime = currentTime;

        engine.Update(dt);

        if (player.HasFinished() || g_interrupted) {
            isRunning = false;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(16));
    }

    player.Stop();
    engine.Shutdown();
    return 0;
}

} // namespace

int main(int argc, char* argv[])
{
    CommandLine commandLine;
    if (!ParseCommandLine(argc, argv, commandLine))
    {
        PrintUsage(argv[0]);
        return 2;
    }

    RW::Settings settings = RW::Settings::LoadFromFile(commandLine.configFile);
    RW::Logger::Init(settings.logLevel, settings.logFile);

    RW::TagLibMetadataProvider metadataProvider;
    RW::PlaylistManager manager(&metadataProvider);

    const std::string& command = commandLine.arguments.front();
    int result = 2;

    if (command == "info")
    {
        result = RunInfo(manager, commandLine.arguments);
    }
    else if (command == "convert")
    {
        result = RunConvert(manager, commandLine.arguments);
    }
    else if (command == "create")
    {
        result = RunCreate(manager, commandLine.arguments);
    }
    else if (command == "play")
    {
        result = RunPlay(manager, settings, commandLine);
        if (result == 0)
        {
            settings.SaveToFile(commandLine.configFile);
        }
    }
    else
    {
        spdlog::error("Unknown command '{}'.", command);
    }

    if (result == 2)
    {
        PrintUsage(argv[0]);
    }

    RW::Logger::Shutdown();
    return result;
}
