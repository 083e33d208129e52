#include "pch.h"

namespace RW {
    namespace Tests {

        class PlaylistCodecTests : public ::testing::Test {
        protected:
            Track MakeTrack(const std::string& path,
                            std::optional<std::string> title,
                            std::optional<std::string> artist,
                            std::optional<std::string> album,
                            std::optional<std::int64_t> durationMs) {
                Metadata metadata;
                if (title)
                    metadata[MetadataKeys::Title] = *title;
                if (artist)
                    metadata[MetadataKeys::Artist] = *artist;
                if (album)
                    metadata[MetadataKeys::Album] = *album;
                if (durationMs)
                    metadata[MetadataKeys::Duration] = *durationMs;
                return Track(path, metadata);
            }

            std::vector<std::pair<ErrorKind, std::string>> m_reported;

            PlaylistCodec::ErrorReporter Reporter() {
                return [this](ErrorKind kind, const std::string& message) {
                    m_reported.emplace_back(kind, message);
                };
            }

            TempDirectory m_dir;
        };

        TEST_F(PlaylistCodecTests, DetectsFormatByExtension) {
            ASSERT_EQ(PlaylistCodec::DetectFormat("list.json"), PlaylistFormat::Json);
            ASSERT_EQ(PlaylistCodec::DetectFormat("/a/b/List.M3U"), PlaylistFormat::M3U);
            ASSERT_EQ(PlaylistCodec::DetectFormat("list.m3u8"), PlaylistFormat::M3U);
            ASSERT_EQ(PlaylistCodec::DetectFormat("list.PLS"), PlaylistFormat::PLS);
            ASSERT_FALSE(PlaylistCodec::DetectFormat("list.txt").has_value());
            ASSERT_FALSE(PlaylistCodec::DetectFormat("list").has_value());
        }

        TEST_F(PlaylistCodecTests, NativeRoundTripPreservesPlaylist) {
            Playlist playlist("Road Trip");
            playlist.SetDescription("Long drive");
            playlist.SetCustomMetadata({ { "color", "blue" }, { "rating", 4 } });
            playlist.AddTrack(MakeTrack("/music/one.mp3", "One", "Band", "First", 215000));
            playlist.AddTrack(MakeTrack("relative/two.flac", "Two", std::nullopt, "Second", std::nullopt));
            playlist.AddTrack(MakeTrack("/music/three.ogg", std::nullopt, std::nullopt, std::nullopt, 1000));

            const std::string path = m_dir.File("road.json");
            PlaylistCodec::Save(playlist, path);
            Playlist loaded = PlaylistCodec::Load(path);

            ASSERT_EQ(loaded.GetName(), "Road Trip");
            ASSERT_EQ(loaded.GetId(), playlist.GetId());
            ASSERT_EQ(loaded.GetCreationDate(), playlist.GetCreationDate());
            ASSERT_EQ(loaded.GetLastModified(), playlist.GetLastModified());
            ASSERT_EQ(loaded.GetDescription(), "Long drive");
            ASSERT_EQ(loaded.GetCustomMetadata(), playlist.GetCustomMetadata());
            ASSERT_EQ(loaded.GetTrackCount(), 3u);

            for (size_t i = 0; i < loaded.GetTrackCount(); ++i) {
                const Track& original = playlist.GetTrack(i);
                const Track& restored = loaded.GetTrack(i);
                ASSERT_EQ(restored.GetFilePath(), original.GetFilePath());
                ASSERT_EQ(restored.GetId(), original.GetId());
                ASSERT_EQ(restored.GetTitle(), original.GetTitle());
                ASSERT_EQ(restored.GetArtist(), original.GetArtist());
                ASSERT_EQ(restored.GetAlbum(), original.GetAlbum());
                ASSERT_EQ(restored.GetDurationMs(), original.GetDurationMs());
            }

            ASSERT_EQ(loaded.GetTrack(1).GetMetadata().count(MetadataKeys::Artist), 0u);
        }

        TEST_F(PlaylistCodecTests, NativeWriterEmitsNullsForMissingFields) {
            Playlist playlist("Nulls");
            playlist.AddTrack(MakeTrack("/music/a.mp3", "A", std::nullopt, std::nullopt, std::nullopt));

            const auto j = PlaylistCodec::ToJson(playlist);
            const auto& track = j["tracks"][0];

            ASSERT_EQ(track["title"].get<std::string>(), "A");
            ASSERT_TRUE(track["artist"].is_null());
            ASSERT_TRUE(track["album"].is_null());
            ASSERT_TRUE(track["duration"].is_null());
            ASSERT_EQ(track["uuid"].get<std::string>(), playlist.GetTrack(0).GetId());
        }

        TEST_F(PlaylistCodecTests, NativeReaderFillsMissingIdentity) {
            const auto data = nlohmann::json::parse(R"({
                "name": "Bare",
                "tracks": [ { "file_path": "/music/a.mp3", "duration": 1500.7, "artist": null } ]
            })");

            Playlist playlist = PlaylistCodec::FromJson(data);

            ASSERT_EQ(playlist.GetName(), "Bare");
            ASSERT_EQ(playlist.GetId().size(), 36u);
            ASSERT_FALSE(playlist.GetCreationDate().empty());
            ASSERT_EQ(playlist.GetTrack(0).GetId().size(), 36u);
            ASSERT_EQ(playlist.GetTrack(0).GetDurationMs(), std::optional<std::int64_t>(1500));
            ASSERT_EQ(playlist.GetTrack(0).GetMetadata().count(MetadataKeys::Artist), 0u);
        }

        TEST_F(PlaylistCodecTests, NativeReaderDropsUnrepresentableDurations) {
            const auto data = nlohmann::json::parse(R"({
                "name": "Huge",
                "tracks": [
                    { "file_path": "/music/a.mp3", "duration": 1e30 },
                    { "file_path": "/music/b.mp3", "duration": 18446744073709551615 },
                    { "file_path": "/music/c.mp3", "duration": 2000 }
                ]
            })");

            Playlist playlist = PlaylistCodec::FromJson(data);

            ASSERT_EQ(playlist.GetTrackCount(), 3u);
            ASSERT_FALSE(playlist.GetTrack(0).GetDurationMs().has_value());
            ASSERT_FALSE(playlist.GetTrack(1).GetDurationMs().has_value());
            ASSERT_EQ(playlist.GetTrack(2).GetDurationMs(), std::optional<std::int64_t>(2000));
        }

        TEST_F(PlaylistCodecTests, NativeReaderRejectsMalformedRecords) {
            try {
                PlaylistCodec::FromJson({ { "tracks", nlohmann::json::array() } });
                FAIL() << "Expected a parse failure";
            }
            catch (const PlaylistError& e) {
                ASSERT_EQ(e.GetKind(), ErrorKind::ParseFailure);
            }

            const std::string path = m_dir.Write("broken.json", "{ \"name\": ");
            try {
                PlaylistCodec::Load(path);
                FAIL() << "Expected a parse failure";
            }
            catch (const PlaylistError& e) {
                ASSERT_EQ(e.GetKind(), ErrorKind::ParseFailure);
            }
        }

        TEST_F(PlaylistCodecTests, M3UWriterFormatsExtinfLines) {
            Playlist playlist("Mix");
            playlist.AddTrack(MakeTrack("/music/a.mp3", "Song A", "Artist A", std::nullopt, 125900));
            playlist.AddTrack(MakeTrack("/music/b.mp3", "Song B", std::string(), std::nullopt, 60000));
            playlist.AddTrack(MakeTrack("/music/c.mp3", "Song C", std::nullopt, std::nullopt, std::nullopt));

            std::ostringstream out;
            PlaylistCodec::WriteM3U(playlist, out);

            ASSERT_EQ(out.str(),
                "#EXTM3U\n"
                "#EXTINF:125,Artist A - Song A\n"
                "/music/a.mp3\n"
                "#EXTINF:60,Song B\n"
                "/music/b.mp3\n"
                "/music/c.mp3\n");
        }

        TEST_F(PlaylistCodecTests, M3URoundTripRecoversTitlesAndArtists) {
            const std::string a = m_dir.Touch("a.mp3");
            const std::string b = m_dir.Touch("b.mp3");

            Playlist playlist("Mix");
            playlist.AddTrack(MakeTrack(a, "Song A", "Artist A", std::nullopt, 125000));
            playlist.AddTrack(MakeTrack(b, "Song B", std::nullopt, std::nullopt, 60000));

            const std::string path = m_dir.File("mix.m3u8");
            PlaylistCodec::Save(playlist, path);
            Playlist loaded = PlaylistCodec::Load(path);

            ASSERT_EQ(loaded.GetName(), "mix");
            ASSERT_EQ(loaded.GetTrackCount(), 2u);
            ASSERT_EQ(loaded.GetTrack(0).GetFilePath(), a);
            ASSERT_EQ(loaded.GetTrack(0).GetTitle(), std::optional<std::string>("Song A"));
            ASSERT_EQ(loaded.GetTrack(0).GetArtist(), std::optional<std::string>("Artist A"));
            ASSERT_EQ(loaded.GetTrack(0).GetDurationMs(), std::optional<std::int64_t>(125000));
            ASSERT_EQ(loaded.GetTrack(1).GetFilePath(), b);
            ASSERT_FALSE(loaded.GetTrack(1).GetArtist().has_value());
            ASSERT_EQ(loaded.GetTrack(1).GetDurationMs(), std::optional<std::int64_t>(60000));
        }

        TEST_F(PlaylistCodecTests, M3UReaderResolvesRelativePathsAndSkipsMissing) {
            m_dir.Touch("music/one.mp3");
            m_dir.Touch("two.mp3");
            const std::string path = m_dir.Write("lists/set.m3u",
                "\xEF\xBB\xBF#EXTM3U\r\n"
                "#EXTINF:30,Band - One\r\n"
                "../music/one.mp3\r\n"
                "#EXTINF:12,Ghost\r\n"
                "../music/ghost.mp3\r\n"
                "\r\n"
                "# a comment\r\n"
                "../two.mp3\r\n");

            auto loaded = PlaylistCodec::Load(path, std::nullopt, Reporter());

            ASSERT_EQ(loaded.GetName(), "set");
            ASSERT_EQ(loaded.GetTrackCount(), 2u);

            const auto expectedOne = (m_dir.Path() / "music" / "one.mp3").lexically_normal().string();
            ASSERT_EQ(loaded.GetTrack(0).GetFilePath(), expectedOne);
            ASSERT_EQ(loaded.GetTrack(0).GetTitle(), std::optional<std::string>("One"));
            ASSERT_EQ(loaded.GetTrack(0).GetArtist(), std::optional<std::string>("Band"));

            // The EXTINF of the missing entry must not leak onto the next track.
            ASSERT_EQ(loaded.GetTrack(1).GetTitle(), std::optional<std::string>("two.mp3"));
            ASSERT_FALSE(loaded.GetTrack(1).GetDurationMs().has_value());

            ASSERT_EQ(m_reported.size(), 1u);
            ASSERT_EQ(m_reported[0].first, ErrorKind::NotFound);
            ASSERT_NE(m_reported[0].second.find("ghost.mp3"), std::string::npos);
        }

        TEST_F(PlaylistCodecTests, M3UReaderIgnoresUnrepresentableDurations) {
            m_dir.Touch("a.mp3");
            m_dir.Touch("b.mp3");
            m_dir.Touch("c.mp3");
            const std::string path = m_dir.Write("odd.m3u",
                "#EXTM3U\n"
                "#EXTINF:1e30,Artist - Title\n"
                "a.mp3\n"
                "#EXTINF:nan,Other - Name\n"
                "b.mp3\n"
                "#EXTINF:42.9,Last\n"
                "c.mp3\n");

            auto loaded = PlaylistCodec::Load(path, std::nullopt, Reporter());

            ASSERT_EQ(loaded.GetTrackCount(), 3u);
            ASSERT_FALSE(loaded.GetTrack(0).GetDurationMs().has_value());
            ASSERT_EQ(loaded.GetTrack(0).GetTitle(), std::optional<std::string>("Title"));
            ASSERT_EQ(loaded.GetTrack(0).GetArtist(), std::optional<std::string>("Artist"));
            ASSERT_FALSE(loaded.GetTrack(1).GetDurationMs().has_value());
            ASSERT_EQ(loaded.GetTrack(1).GetTitle(), std::optional<std::string>("Name"));
            ASSERT_EQ(loaded.GetTrack(2).GetDurationMs(), std::optional<std::int64_t>(42000));
            ASSERT_TRUE(m_reported.empty());
        }

        TEST_F(PlaylistCodecTests, M3UWithOnlyMissingFilesFails) {
            const std::string path = m_dir.Write("empty.m3u", "#EXTM3U\n/nowhere/a.mp3\n/nowhere/b.mp3\n");

            try {
                PlaylistCodec::Load(path, std::nullopt, Reporter());
                FAIL() << "Expected a parse failure";
            }
            catch (const PlaylistError& e) {
                ASSERT_EQ(e.GetKind(), ErrorKind::ParseFailure);
            }
            ASSERT_EQ(m_reported.size(), 2u);
        }

        TEST_F(PlaylistCodecTests, PLSWriterFormatsEntries) {
            Playlist playlist("Radio");
            playlist.AddTrack(MakeTrack("/music/a.mp3", "Song A", std::nullopt, std::nullopt, 61500));
            playlist.AddTrack(MakeTrack("/music/b.mp3", std::nullopt, std::nullopt, std::nullopt, std::nullopt));

            std::ostringstream out;
            PlaylistCodec::WritePLS(playlist, out);

            ASSERT_EQ(out.str(),
                "[playlist]\n"
                "NumberOfEntries=2\n"
                "File1=/music/a.mp3\n"
                "Title1=Song A\n"
                "Length1=61\n"
                "File2=/music/b.mp3\n"
                "Title2=b.mp3\n"
                "Length2=-1\n"
                "Version=2\n");
        }

        TEST_F(PlaylistCodecTests, PLSRoundTripPreservesPathsTitlesAndDurations) {
            const std::string a = m_dir.Touch("a.mp3");
            const std::string b = m_dir.Touch("b.mp3");

            Playlist playlist("Radio");
            playlist.AddTrack(MakeTrack(a, "Song A", std::nullopt, std::nullopt, 61000));
            playlist.AddTrack(MakeTrack(b, "Song B", std::nullopt, std::nullopt, std::nullopt));

            const std::string path = m_dir.File("radio.pls");
            PlaylistCodec::Save(playlist, path);
            Playlist loaded = PlaylistCodec::Load(path);

            ASSERT_EQ(loaded.GetName(), "radio");
            ASSERT_EQ(loaded.GetTrackCount(), 2u);
            ASSERT_EQ(loaded.GetTrack(0).GetFilePath(), a);
            ASSERT_EQ(loaded.GetTrack(0).GetTitle(), std::optional<std::string>("Song A"));
            ASSERT_EQ(loaded.GetTrack(0).GetDurationMs(), std::optional<std::int64_t>(61000));
            ASSERT_EQ(loaded.GetTrack(1).GetTitle(), std::optional<std::string>("Song B"));
            ASSERT_FALSE(loaded.GetTrack(1).GetDurationMs().has_value());
        }

        TEST_F(PlaylistCodecTests, PLSReaderOrdersByEntryNumberAndToleratesBadLengths) {
            m_dir.Touch("one.mp3");
            m_dir.Touch("two.mp3");
            m_dir.Touch("three.mp3");
            const std::string path = m_dir.Write("odd.pls",
                "[playlist]\n"
                "File3=three.mp3\n"
                "Length3=9223372036854775807\n"
                "File2=two.mp3\n"
                "Length2=abc\n"
                "File1=one.mp3\n"
                "Title1=First\n"
                "Length1=42\n"
                "FileX=ignored.mp3\n"
                "NumberOfEntries=3\n"
                "Version=2\n");

            Playlist loaded = PlaylistCodec::Load(path);

            ASSERT_EQ(loaded.GetTrackCount(), 3u);
            ASSERT_EQ(FileNameOf(loaded.GetTrack(0).GetFilePath()), "one.mp3");
            ASSERT_EQ(loaded.GetTrack(0).GetTitle(), std::optional<std::string>("First"));
            ASSERT_EQ(loaded.GetTrack(0).GetDurationMs(), std::optional<std::int64_t>(42000));
            ASSERT_EQ(loaded.GetTrack(1).GetTitle(), std::optional<std::string>("two.mp3"));
            ASSERT_FALSE(loaded.GetTrack(1).GetDurationMs().has_value());
            ASSERT_EQ(FileNameOf(loaded.GetTrack(2).GetFilePath()), "three.mp3");
            ASSERT_FALSE(loaded.GetTrack(2).GetDurationMs().has_value());
        }

        TEST_F(PlaylistCodecTests, PLSWithOnlyMissingFilesFails) {
            const std::string path = m_dir.Write("gone.pls", "[playlist]\nFile1=/nowhere/a.mp3\nNumberOfEntries=1\n");

            try {
                PlaylistCodec::Load(path, std::nullopt, Reporter());
                FAIL() << "Expected a parse failure";
            }
            catch (const PlaylistError& e) {
                ASSERT_EQ(e.GetKind(), ErrorKind::ParseFailure);
            }
            ASSERT_EQ(m_reported.size(), 1u);
        }

        TEST_F(PlaylistCodecTests, ExplicitFormatOverridesExtension) {
            const std::string a = m_dir.Touch("a.mp3");
            Playlist playlist("Forced");
            playlist.AddTrack(MakeTrack(a, "A", std::nullopt, std::nullopt, 1000));

            const std::string path = m_dir.File("forced.txt");
            PlaylistCodec::Save(playlist, path, PlaylistFormat::M3U);

            ASSERT_EQ(ReadFile(path).rfind("#EXTM3U", 0), 0u);
            ASSERT_EQ(PlaylistCodec::Load(path, PlaylistFormat::M3U).GetTrackCount(), 1u);
        }

        TEST_F(PlaylistCodecTests, LoadErrorsCarryKinds) {
            try {
                PlaylistCodec::Load(m_dir.File("absent.m3u"));
                FAIL() << "Expected not found";
            }
            catch (const PlaylistError& e) {
                ASSERT_EQ(e.GetKind(), ErrorKind::NotFound);
            }

            try {
                PlaylistCodec::Save(Playlist("x"), m_dir.File("x.wpl"));
                FAIL() << "Expected unsupported format";
            }
            catch (const PlaylistError& e) {
                ASSERT_EQ(e.GetKind(), ErrorKind::UnsupportedFormat);
            }

            try {
                PlaylistCodec::Save(Playlist("x"), m_dir.File("no/such/dir/x.json"));
                FAIL() << "Expected an I/O failure";
            }
            catch (const PlaylistError& e) {
                ASSERT_EQ(e.GetKind(), ErrorKind::IOFailure);
            }
        }

    }
}
