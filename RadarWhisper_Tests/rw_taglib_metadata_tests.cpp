#include "pch.h"
#include "rw_taglib_metadata.h"

namespace RW {
    namespace Tests {

        class TagLibMetadataTests : public ::testing::Test {
        protected:
            TempDirectory m_dir;
            TagLibMetadataProvider m_provider;
        };

        TEST_F(TagLibMetadataTests, SupportedExtensionsIgnoreCase) {
            ASSERT_TRUE(TagLibMetadataProvider::IsSupported("/music/a.MP3"));
            ASSERT_TRUE(TagLibMetadataProvider::IsSupported("b.flac"));
            ASSERT_TRUE(TagLibMetadataProvider::IsSupported("c.Ogg"));
            ASSERT_FALSE(TagLibMetadataProvider::IsSupported("d.aiff"));
            ASSERT_FALSE(TagLibMetadataProvider::IsSupported("noextension"));
        }

        TEST_F(TagLibMetadataTests, MissingFileIsNotFound) {
            try {
                m_provider.GetMetadata(m_dir.File("absent.mp3"));
                FAIL() << "Expected not found";
            }
            catch (const PlaylistError& e) {
                ASSERT_EQ(e.GetKind(), ErrorKind::NotFound);
            }
        }

        TEST_F(TagLibMetadataTests, UnknownExtensionIsUnsupported) {
            const std::string path = m_dir.Touch("notes.txt");

            try {
                m_provider.GetMetadata(path);
                FAIL() << "Expected unsupported format";
            }
            catch (const PlaylistError& e) {
                ASSERT_EQ(e.GetKind(), ErrorKind::UnsupportedFormat);
            }
        }

        TEST_F(TagLibMetadataTests, UnreadableAudioFallsBackToFileStem) {
            const std::string path = m_dir.Touch("Some Song.mp3", "definitely not mpeg data");

            Metadata metadata = m_provider.GetMetadata(path);

            ASSERT_EQ(GetMetadataString(metadata, MetadataKeys::Title), std::optional<std::string>("Some Song"));
            ASSERT_EQ(GetMetadataString(metadata, "file_name"), std::optional<std::string>("Some Song.mp3"));
            ASSERT_EQ(GetMetadataString(metadata, "file_extension"), std::optional<std::string>("mp3"));
            ASSERT_EQ(GetMetadataInt(metadata, "file_size"), std::optional<std::int64_t>(24));
        }

    }
}
