#include "pch.h"

namespace RW {
    namespace Tests {

        class PlaylistTests : public ::testing::Test {
        protected:
            void SetUp() override {
                m_playlist = std::make_unique<Playlist>("test_playlist");
            }

            void AddTrack(const std::string& path, std::optional<std::int64_t> durationMs = std::nullopt) {
                Metadata metadata;
                metadata[MetadataKeys::Title] = FileStemOf(path);
                if (durationMs)
                    metadata[MetadataKeys::Duration] = *durationMs;
                m_playlist->AddTrack(Track(path, metadata));
            }

            std::vector<std::string> Paths() const {
                std::vector<std::string> paths;
                for (const auto& track : m_playlist->GetTracks())
                    paths.push_back(track.GetFilePath());
                return paths;
            }

            std::unique_ptr<Playlist> m_playlist;
        };

        TEST_F(PlaylistTests, NewPlaylistHasIdentityAndTimestamps) {
            Playlist other("other");

            ASSERT_EQ(m_playlist->GetName(), "test_playlist");
            ASSERT_EQ(m_playlist->GetId().size(), 36u);
            ASSERT_NE(m_playlist->GetId(), other.GetId());
            ASSERT_FALSE(m_playlist->GetCreationDate().empty());
            ASSERT_EQ(m_playlist->GetCreationDate(), m_playlist->GetLastModified());
            ASSERT_TRUE(m_playlist->IsEmpty());
            ASSERT_TRUE(m_playlist->GetCustomMetadata().is_object());
        }

        TEST_F(PlaylistTests, RemoveTrackReturnsRemovedTrackAndCompacts) {
            AddTrack("/music/a.mp3");
            AddTrack("/music/b.mp3");
            AddTrack("/music/c.mp3");

            auto removed = m_playlist->RemoveTrack(1);

            ASSERT_TRUE(removed.has_value());
            ASSERT_EQ(removed->GetFilePath(), "/music/b.mp3");
            ASSERT_EQ(Paths(), (std::vector<std::string>{ "/music/a.mp3", "/music/c.mp3" }));
            ASSERT_FALSE(m_playlist->RemoveTrack(2).has_value());
            ASSERT_FALSE(m_playlist->RemoveTrack(-1).has_value());
        }

        TEST_F(PlaylistTests, MoveTrackToPosition) {
            AddTrack("track1");
            AddTrack("track2");
            AddTrack("track3");

            ASSERT_TRUE(m_playlist->MoveTrack(0, 2));
            ASSERT_EQ(Paths(), (std::vector<std::string>{ "track2", "track3", "track1" }));

            ASSERT_TRUE(m_playlist->MoveTrack(2, 0));
            ASSERT_EQ(Paths(), (std::vector<std::string>{ "track1", "track2", "track3" }));

            ASSERT_FALSE(m_playlist->MoveTrack(0, 3));
            ASSERT_FALSE(m_playlist->MoveTrack(-1, 0));
        }

        TEST_F(PlaylistTests, TotalDurationSumsIntegerDurations) {
            AddTrack("a", 61000);
            AddTrack("b");
            AddTrack("c", 3600000);

            Metadata realDuration;
            realDuration[MetadataKeys::Duration] = 5000.0;
            m_playlist->AddTrack(Track("d", realDuration));

            ASSERT_EQ(m_playlist->GetTotalDuration(), 3661000);

            const auto stats = m_playlist->GetStatistics();
            ASSERT_EQ(stats.name, "test_playlist");
            ASSERT_EQ(stats.trackCount, 4u);
            ASSERT_EQ(stats.totalDurationMs, 3661000);
            ASSERT_EQ(stats.totalDurationText, "1:01:01");
            ASSERT_EQ(stats.creationDate, m_playlist->GetCreationDate());
        }

        TEST_F(PlaylistTests, ClearEmptiesPlaylist) {
            AddTrack("a");
            AddTrack("b");

            m_playlist->Clear();

            ASSERT_TRUE(m_playlist->IsEmpty());
            ASSERT_EQ(m_playlist->GetStatistics().totalDurationText, "0:00");
        }

        TEST_F(PlaylistTests, SetTrackMetadataKeepsTrackId) {
            AddTrack("a");
            const std::string id = m_playlist->GetTrack(0).GetId();

            Metadata metadata;
            metadata[MetadataKeys::Title] = std::string("Renamed");

            ASSERT_TRUE(m_playlist->SetTrackMetadata(0, metadata));
            ASSERT_EQ(m_playlist->GetTrack(0).GetId(), id);
            ASSERT_EQ(m_playlist->GetTrack(0).GetTitle(), std::optional<std::string>("Renamed"));
            ASSERT_FALSE(m_playlist->SetTrackMetadata(1, metadata));
        }

        TEST(TrackTests, IdentityAndMetadataAccessors) {
            Metadata metadata;
            metadata[MetadataKeys::Title] = std::string("Song");
            metadata[MetadataKeys::Duration] = static_cast<std::int64_t>(1500);

            Track first("/music/song.mp3", metadata);
            Track second("/music/song.mp3", metadata);
            Track restored("/music/song.mp3", first.GetId(), {});

            ASSERT_NE(first, second);
            ASSERT_EQ(first, restored);
            ASSERT_EQ(first.GetDisplayTitle(), "Song");
            ASSERT_EQ(restored.GetDisplayTitle(), "song.mp3");
            ASSERT_EQ(first.GetDurationMs(), std::optional<std::int64_t>(1500));
            ASSERT_FALSE(first.GetArtist().has_value());
        }

        TEST(TrackTests, EmptyIdGeneratesFreshOne) {
            Track track("a.mp3", "", {});

            ASSERT_EQ(track.GetId().size(), 36u);
        }

        TEST(UtilsTests, FormatDuration) {
            ASSERT_EQ(FormatDuration(0), "0:00");
            ASSERT_EQ(FormatDuration(59), "0:59");
            ASSERT_EQ(FormatDuration(605), "10:05");
            ASSERT_EQ(FormatDuration(3600), "1:00:00");
            ASSERT_EQ(FormatDuration(-4), "0:00");
        }

        TEST(UtilsTests, FloatingDurationConversions) {
            ASSERT_EQ(TruncateToInt64(1500.9), std::optional<std::int64_t>(1500));
            ASSERT_EQ(TruncateToInt64(-2.5), std::optional<std::int64_t>(-2));
            ASSERT_FALSE(TruncateToInt64(1e30).has_value());
            ASSERT_FALSE(TruncateToInt64(std::nan("")).has_value());
            ASSERT_FALSE(TruncateToInt64(std::numeric_limits<double>::infinity()).has_value());

            ASSERT_EQ(SecondsToMilliseconds(12.7), std::optional<std::int64_t>(12000));
            ASSERT_FALSE(SecondsToMilliseconds(-1.0).has_value());
            ASSERT_FALSE(SecondsToMilliseconds(1e17).has_value());
            ASSERT_FALSE(SecondsToMilliseconds(std::nan("")).has_value());
        }

        TEST(TrackTests, OutOfRangeRealDurationIsUnknown) {
            Metadata metadata;
            metadata[MetadataKeys::Duration] = 1e30;

            Track track("/music/song.mp3", metadata);

            ASSERT_FALSE(track.GetDurationMs().has_value());
        }

        TEST(UtilsTests, UuidHasVersionFourLayout) {
            const std::string id = GenerateUuid();

            ASSERT_EQ(id.size(), 36u);
            ASSERT_EQ(id[8], '-');
            ASSERT_EQ(id[13], '-');
            ASSERT_EQ(id[14], '4');
            ASSERT_EQ(id[18], '-');
            ASSERT_EQ(id[23], '-');
            ASSERT_NE(std::string("89ab").find(id[19]), std::string::npos);
        }

        TEST(UtilsTests, StringHelpers) {
            ASSERT_EQ(Trim("  padded\r\n"), "padded");
            ASSERT_EQ(Trim(" \t "), "");
            ASSERT_EQ(ToLower("MiXeD.M3U"), "mixed.m3u");
            ASSERT_TRUE(StartsWith("#EXTINF:3,a", "#EXTINF:"));
            ASSERT_FALSE(StartsWith("#EXT", "#EXTINF:"));
            ASSERT_EQ(FileNameOf("/music/dir/song.flac"), "song.flac");
            ASSERT_EQ(FileStemOf("/music/dir/song.flac"), "song");
        }

    }
}
