#include <gtest/gtest.h>

#include <set>
#include <thread>
#include <vector>
#include "core/collision_resolver/collision_resolver.hpp"
#include "test_helpers.hpp"

using extsort::core::CollisionResolver;
using extsort::core::DestinationCandidate;
using extsort::core::Reservation;

TEST(DestinationCandidateTest, SuffixGoesBeforeExtension)
{
    auto c = DestinationCandidate::from_name("jpg", "a.jpg");
    EXPECT_EQ(c.filename(), "a.jpg");
    c.suffix_index = 2;
    EXPECT_EQ(c.filename(), "a (2).jpg");

    auto no_ext = DestinationCandidate::from_name("no_extension", "readme");
    no_ext.suffix_index = 1;
    EXPECT_EQ(no_ext.filename(), "readme (1)");

    auto dotfile = DestinationCandidate::from_name("no_extension", ".bashrc");
    dotfile.suffix_index = 1;
    EXPECT_EQ(dotfile.filename(), ".bashrc (1)");
}

TEST(CollisionResolverTest, FreeNameIsReturnedUnsuffixed)
{
    extsort::test::TempDir dst;
    CollisionResolver resolver{dst.path()};

    auto r = resolver.reserve("jpg", "a.jpg");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->path(), dst / "jpg" / "a.jpg");
    EXPECT_EQ(r->suffix_index(), 0u);
    EXPECT_TRUE(std::filesystem::is_directory(dst / "jpg"));
}

TEST(CollisionResolverTest, ConcurrentReservationsGetIncreasingSuffixes)
{
    extsort::test::TempDir dst;
    CollisionResolver resolver{dst.path()};

    auto first = resolver.reserve("jpg", "a.jpg");
    auto second = resolver.reserve("jpg", "a.jpg");
    auto third = resolver.reserve("jpg", "a.jpg");
    ASSERT_TRUE(first && second && third);

    EXPECT_EQ(first->filename(), "a.jpg");
    EXPECT_EQ(second->filename(), "a (1).jpg");
    EXPECT_EQ(third->filename(), "a (2).jpg");
    EXPECT_EQ(resolver.claimed_count("jpg"), 3u);
}

TEST(CollisionResolverTest, ExistingFilesFromPreviousRunAreSkipped)
{
    extsort::test::TempDir dst;
    extsort::test::write_file(dst / "pdf" / "doc.pdf", "old");
    extsort::test::write_file(dst / "pdf" / "doc (1).pdf", "old");

    CollisionResolver resolver{dst.path()};
    auto r = resolver.reserve("pdf", "doc.pdf");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->filename(), "doc (2).pdf");
}

TEST(CollisionResolverTest, AbandonedReservationIsReleased)
{
    extsort::test::TempDir dst;
    CollisionResolver resolver{dst.path()};

    {
        auto r = resolver.reserve("txt", "notes.txt");
        ASSERT_TRUE(r.has_value());
        EXPECT_EQ(resolver.claimed_count("txt"), 1u);
    }
    EXPECT_EQ(resolver.claimed_count("txt"), 0u);

    auto again = resolver.reserve("txt", "notes.txt");
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->filename(), "notes.txt");
}

TEST(CollisionResolverTest, CommittedNameStaysClaimed)
{
    extsort::test::TempDir dst;
    CollisionResolver resolver{dst.path()};

    {
        auto r = resolver.reserve("txt", "notes.txt");
        ASSERT_TRUE(r.has_value());
        r->commit();
    }
    auto next = resolver.reserve("txt", "notes.txt");
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->filename(), "notes (1).txt");
}

TEST(CollisionResolverTest, MovedReservationReleasesOnce)
{
    extsort::test::TempDir dst;
    CollisionResolver resolver{dst.path()};

    auto r = resolver.reserve("bin", "x.bin");
    ASSERT_TRUE(r.has_value());
    Reservation moved = std::move(*r);
    EXPECT_FALSE(r->active());
    EXPECT_TRUE(moved.active());

    moved.release();
    EXPECT_EQ(resolver.claimed_count("bin"), 0u);
}

TEST(CollisionResolverTest, BucketsAreIndependent)
{
    extsort::test::TempDir dst;
    CollisionResolver resolver{dst.path()};

    auto a = resolver.reserve("jpg", "a.jpg");
    auto b = resolver.reserve("JPG-other", "a.jpg");
    ASSERT_TRUE(a && b);
    EXPECT_EQ(a->filename(), "a.jpg");
    EXPECT_EQ(b->filename(), "a.jpg");
}

TEST(CollisionResolverTest, BucketPathBlockedByFileFails)
{
    extsort::test::TempDir dst;
    extsort::test::write_file(dst / "jpg", "not a directory");

    CollisionResolver resolver{dst.path()};
    auto r = resolver.reserve("jpg", "a.jpg");
    ASSERT_FALSE(r.has_value());
    EXPECT_TRUE(r.error().is_fatal());
}

class ConcurrentReserveTest : public ::testing::TestWithParam<int> {};

TEST_P(ConcurrentReserveTest, EveryTaskGetsDistinctName)
{
    const int n = GetParam();
    extsort::test::TempDir dst;
    CollisionResolver resolver{dst.path()};

    std::vector<std::string> names(static_cast<std::size_t>(n));
    std::vector<Reservation> held(static_cast<std::size_t>(n));
    {
        std::vector<std::jthread> threads;
        threads.reserve(static_cast<std::size_t>(n));
        for (int i = 0; i < n; ++i) {
            threads.emplace_back([&, i] {
                auto r = resolver.reserve("jpg", "same.jpg");
                if (r) {
                    names[static_cast<std::size_t>(i)] = r->filename();
                    held[static_cast<std::size_t>(i)] = std::move(*r);
                }
            });
        }
    }

    const std::set<std::string> unique(names.begin(), names.end());
    EXPECT_EQ(unique.size(), static_cast<std::size_t>(n));
    EXPECT_EQ(unique.count(""), 0u);
    EXPECT_EQ(unique.count("same.jpg"), 1u);
    for (int i = 1; i < n; ++i) {
        EXPECT_EQ(unique.count(fmt::format("same ({}).jpg", i)), 1u) << i;
    }
}

INSTANTIATE_TEST_SUITE_P(Fanout, ConcurrentReserveTest, ::testing::Values(2, 10, 100));
