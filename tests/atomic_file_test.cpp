#include <gtest/gtest.h>

#include "fastdrop/AtomicFile.h"
#include "test_support.h"

using FastDropTest::TempDirTest;
using FastDropTest::readFile;
using FastDropTest::writeFile;

TEST(AtomicFileTest, ComputePathsAddsPartSuffix)
{
    const auto p = FastDrop::computeAtomicFilePaths(std::filesystem::path("/tmp/example.txt"));

    EXPECT_EQ(p.finalPath, std::filesystem::path("/tmp/example.txt"));
    EXPECT_EQ(p.tempPath, std::filesystem::path("/tmp/example.txt.part"));
}

class AtomicFileDirTest : public TempDirTest {};

TEST_F(AtomicFileDirTest, AtomicRenameMovesTempToFinal)
{
    const auto finalPath = m_root / "final.bin";
    const auto tempPath = m_root / "final.bin.part";
    writeFile(tempPath, "hello");

    std::string err;
    ASSERT_TRUE(FastDrop::atomicRenameToFinal(tempPath, finalPath, err)) << err;

    EXPECT_TRUE(std::filesystem::exists(finalPath));
    EXPECT_FALSE(std::filesystem::exists(tempPath));
    EXPECT_EQ(readFile(finalPath), "hello");
}

TEST_F(AtomicFileDirTest, AtomicRenameNeverOverwrites)
{
    const auto finalPath = m_root / "taken.txt";
    const auto tempPath = m_root / "taken.txt.part";
    writeFile(finalPath, "original");
    writeFile(tempPath, "incoming");

    std::string err;
    EXPECT_FALSE(FastDrop::atomicRenameToFinal(tempPath, finalPath, err));
    EXPECT_FALSE(err.empty());
    EXPECT_EQ(readFile(finalPath), "original");
    EXPECT_TRUE(std::filesystem::exists(tempPath));
}

TEST_F(AtomicFileDirTest, AtomicRenameRequiresTempFile)
{
    std::string err;
    EXPECT_FALSE(FastDrop::atomicRenameToFinal(m_root / "absent.part", m_root / "absent", err));
}

TEST_F(AtomicFileDirTest, UniquePathSkipsExistingAndPartialNames)
{
    const auto desired = m_root / "report.pdf";
    EXPECT_EQ(FastDrop::generateUniquePath(desired), desired);

    writeFile(desired, "x");
    EXPECT_EQ(FastDrop::generateUniquePath(desired), m_root / "report (1).pdf");

    // An in-progress download also reserves its name
    writeFile(m_root / "report (1).pdf.part", "y");
    EXPECT_EQ(FastDrop::generateUniquePath(desired), m_root / "report (2).pdf");
}

TEST_F(AtomicFileDirTest, UniquePathIgnoresCallersOwnPartialFile)
{
    const auto desired = m_root / "test.txt";
    const auto paths = FastDrop::computeAtomicFilePaths(desired);
    writeFile(paths.tempPath, "in flight");

    EXPECT_EQ(FastDrop::generateUniquePath(desired, paths.tempPath), desired);
    EXPECT_EQ(FastDrop::generateUniquePath(desired), m_root / "test (1).txt");

    std::string error;
    ASSERT_TRUE(FastDrop::atomicRenameToFinal(paths.tempPath,
                                              FastDrop::generateUniquePath(desired, paths.tempPath),
                                              error)) << error;
    EXPECT_TRUE(std::filesystem::exists(desired));
    EXPECT_FALSE(std::filesystem::exists(paths.tempPath));
}
