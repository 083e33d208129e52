#pragma once

#include <filesystem>
#include <fstream>
#include <iterator>
#include <set>
#include <string>
#include <vector>

#include "rw_errors.h"
#include "rw_metadata_provider.h"
#include "rw_playback_engine.h"
#include "rw_utils.h"

namespace RW {
    namespace Tests {

        // Scratch directory removed with everything in it at scope exit.
        class TempDirectory {
        public:
            TempDirectory()
                : m_path(std::filesystem::temp_directory_path() / ("rw_tests_" + GenerateUuid())) {
                std::filesystem::create_directories(m_path);
            }

            ~TempDirectory() {
                std::error_code ec;
                std::filesystem::remove_all(m_path, ec);
            }

            TempDirectory(const TempDirectory&) = delete;
            TempDirectory& operator=(const TempDirectory&) = delete;

            const std::filesystem::path& Path() const { return m_path; }

            std::string File(const std::string& name) const { return (m_path / name).string(); }

            std::string Touch(const std::string& name, const std::string& content = "audio") const {
                const auto path = m_path / name;
                std::filesystem::create_directories(path.parent_path());
                std::ofstream out(path.string(), std::ios::binary);
                out << content;
                return path.string();
            }

            std::string Write(const std::string& name, const std::string& content) const {
                return Touch(name, content);
            }

        private:
            std::filesystem::path m_path;
        };

        inline std::string ReadFile(const std::string& path) {
            std::ifstream in(path, std::ios::binary);
            return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        }

        inline bool IsPermutation(const std::vector<int>& order, size_t count) {
            if (order.size() != count)
                return false;
            std::set<int> seen(order.begin(), order.end());
            return seen.size() == count && *seen.begin() == 0 && *seen.rbegin() == static_cast<int>(count) - 1;
        }

        // Title from the file stem, one second per character of the stem.
        // Paths containing "missing" do not exist, ".txt" files are unsupported.
        class FakeMetadataProvider : public MetadataProvider {
        public:
            Metadata GetMetadata(const std::string& filePath) override {
                ++lookups;
                if (filePath.find("missing") != std::string::npos)
                    throw PlaylistError(ErrorKind::NotFound, "File not found: " + filePath);
                if (filePath.size() >= 4 && filePath.compare(filePath.size() - 4, 4, ".txt") == 0)
                    throw PlaylistError(ErrorKind::UnsupportedFormat, "Unsupported file format: .txt");

                const std::string stem = FileStemOf(filePath);
                Metadata metadata;
                metadata[MetadataKeys::Title] = stem + titleSuffix;
                metadata[MetadataKeys::Artist] = std::string("Fake Artist");
                metadata[MetadataKeys::Duration] = static_cast<std::int64_t>(stem.size() * 1000);
                return metadata;
            }

            bool UpdateTags(const std::string&, const Metadata& tags) override {
                updated.push_back(tags);
                return true;
            }

            int lookups = 0;
            std::string titleSuffix;
            std::vector<Metadata> updated;
        };

        // Records every call; FinishTrack() plays the end-of-media notification.
        class FakePlaybackEngine : public PlaybackEngine {
        public:
            bool Load(const std::string& filePath) override {
                if (filePath.find("broken") != std::string::npos) {
                    NotifyError("Cannot open " + filePath);
                    return false;
                }
                loaded.push_back(filePath);
                m_state = PlaybackState::Stopped;
                return true;
            }

            bool Play() override {
                if (loaded.empty())
                    return false;
                m_state = PlaybackState::Playing;
                NotifyStateChanged(m_state);
                return true;
            }

            bool Pause() override {
                if (m_state != PlaybackState::Playing)
                    return false;
                m_state = PlaybackState::Paused;
                NotifyStateChanged(m_state);
                return true;
            }

            bool Stop() override {
                m_state = PlaybackState::Stopped;
                m_position = 0;
                NotifyStateChanged(m_state);
                return true;
            }

            bool Seek(std::int64_t positionMs) override {
                if (m_state == PlaybackState::Stopped)
                    return false;
                m_position = positionMs;
                NotifyPositionChanged(positionMs);
                return true;
            }

            void SetVolume(int volume) override { m_volume = volume; }
            int GetVolume() const override { return m_volume; }

            void Update(float) override {}

            PlaybackState GetState() const override { return m_state; }
            std::int64_t GetPosition() const override { return m_position; }
            std::int64_t GetDuration() const override { return 0; }

            void FinishTrack() {
                m_state = PlaybackState::Stopped;
                NotifyEndOfMedia();
            }

            std::vector<std::string> loaded;

        private:
            PlaybackState m_state = PlaybackState::Stopped;
            std::int64_t m_position = 0;
            int m_volume = 100;
        };

    }
}
