#include <gtest/gtest.h>

#include "vidingest/storage/local_storage.h"
#include "vidingest/upload/session_manager.h"

using vidingest::storage::LocalStorage;
using vidingest::upload::SessionManager;

TEST(PathSafety, AcceptsSimpleNames) {
    EXPECT_TRUE(LocalStorage::IsSafeName("3f2c9a1e-6c1b-4b7e-9d0e-1a2b3c4d5e6f"));
    EXPECT_TRUE(LocalStorage::IsSafeName("clip_01.mp4"));
}

TEST(PathSafety, RejectsTraversal) {
    EXPECT_FALSE(LocalStorage::IsSafeName("../secret"));
    EXPECT_FALSE(LocalStorage::IsSafeName(".."));
    EXPECT_FALSE(LocalStorage::IsSafeName("a/b"));
    EXPECT_FALSE(LocalStorage::IsSafeName(""));
}

TEST(PathSafety, ExtensionIsLowerCasedWithoutDot) {
    EXPECT_EQ(LocalStorage::ExtensionOf("Holiday.MP4"), "mp4");
    EXPECT_EQ(LocalStorage::ExtensionOf("archive.tar.mkv"), "mkv");
    EXPECT_EQ(LocalStorage::ExtensionOf("noext"), "");
    EXPECT_EQ(LocalStorage::ExtensionOf("trailing."), "");
}

TEST(PathSafety, SanitizeStripsDirectories) {
    EXPECT_EQ(SessionManager::SanitizeFilename("../../etc/passwd.mp4"), "passwd.mp4");
    EXPECT_EQ(SessionManager::SanitizeFilename("C:\\videos\\clip.mov"), "clip.mov");
}

TEST(PathSafety, SanitizeReplacesWhitespaceAndDropsOthers) {
    EXPECT_EQ(SessionManager::SanitizeFilename("my holiday video.mp4"), "my_holiday_video.mp4");
    EXPECT_EQ(SessionManager::SanitizeFilename("wow!*?.mp4"), "wow.mp4");
}

TEST(PathSafety, SanitizeTrimsDotsAndUnderscores) {
    EXPECT_EQ(SessionManager::SanitizeFilename(".hidden.mp4"), "hidden.mp4");
    EXPECT_EQ(SessionManager::SanitizeFilename("..."), "");
    EXPECT_EQ(SessionManager::SanitizeFilename("   "), "");
}
