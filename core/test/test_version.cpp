#include "test.hpp"

#include "folio/core/Version.hpp"

#include <cctype>

TEST(ProjectInfo, IdentifiesFolio)
{
    EXPECT_EQ(ProjectInfo::Name(), "Folio");
    EXPECT_EQ(ProjectInfo::NameAndVersion(), "Folio " + ProjectInfo::VersionString());
}

TEST(ProjectInfo, VersionStringIsDottedTriple)
{
    const std::string version = ProjectInfo::VersionString();
    EXPECT_EQ(version, std::to_string(ProjectInfo::VersionMajor()) + "." +
                           std::to_string(ProjectInfo::VersionMinor()) + "." +
                           std::to_string(ProjectInfo::VersionPatch()));
    EXPECT_GE(ProjectInfo::VersionMajor(), 0);
    EXPECT_GE(ProjectInfo::VersionMinor(), 0);
    EXPECT_GE(ProjectInfo::VersionPatch(), 0);
}

// Builds outside a git checkout report "unknown" for both hashes
TEST(ProjectInfo, ShortHashAbbreviatesFullHash)
{
    const std::string full = ProjectInfo::RepositoryHash();
    const std::string shortHash = ProjectInfo::RepositoryShortHash();
    ASSERT_FALSE(full.empty());
    ASSERT_FALSE(shortHash.empty());

    if (full == "unknown") {
        EXPECT_EQ(shortHash, "unknown");
        return;
    }
    EXPECT_EQ(shortHash.size(), 8u);
    EXPECT_EQ(full.compare(0, shortHash.size(), shortHash), 0);
    for (char c : full) {
        EXPECT_TRUE(std::isxdigit(static_cast<unsigned char>(c)) != 0);
    }
}
