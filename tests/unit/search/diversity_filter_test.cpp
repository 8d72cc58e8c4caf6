#include <gtest/gtest.h>

#include <mvsearch/search/diversity_filter.h>

using namespace mvsearch::search;

class DiversityFilterTest : public ::testing::Test {
protected:
    static MergedItem item(const std::string& id, const std::string& name,
                           const std::string& category, double score) {
        MergedItem m;
        m.id = id;
        m.combinedScore = score;
        if (!name.empty()) {
            m.payload.set("name", name);
        }
        if (!category.empty()) {
            m.payload.set("category", category);
        }
        return m;
    }
};

TEST_F(DiversityFilterTest, NonPositiveThresholdIsIdentity) {
    std::vector<MergedItem> items = {item("a", "Same", "cat", 0.9), item("b", "Same", "cat", 0.8)};
    auto out = applyDiversityFilter(items, 0.0);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[1].id, "b");
}

TEST_F(DiversityFilterTest, DuplicateNamesAreSkipped) {
    std::vector<MergedItem> items = {item("a", "Foo", "", 0.9), item("b", "Foo", "", 0.8),
                                     item("c", "Bar", "", 0.7)};
    auto out = applyDiversityFilter(items, 0.7);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].id, "a");
    EXPECT_EQ(out[1].id, "c");
}

TEST_F(DiversityFilterTest, DominantCategoryIsCapped) {
    std::vector<MergedItem> items = {
        item("a", "A", "editor", 0.9), item("b", "B", "editor", 0.8),
        item("c", "C", "linter", 0.7), item("d", "D", "editor", 0.6),
    };
    auto out = applyDiversityFilter(items, 0.5);

    // b: 1/1 editors selected > 0.5, skipped; c selected; d: 1/2 = 0.5, kept
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].id, "a");
    EXPECT_EQ(out[1].id, "c");
    EXPECT_EQ(out[2].id, "d");
}

TEST_F(DiversityFilterTest, UncategorizedItemsOnlyFaceNameRule) {
    std::vector<MergedItem> items = {item("a", "A", "", 0.9), item("b", "B", "", 0.8),
                                     item("c", "C", "", 0.7)};
    EXPECT_EQ(applyDiversityFilter(items, 0.1).size(), 3u);
}

TEST_F(DiversityFilterTest, PreservesOrder) {
    std::vector<MergedItem> items = {item("a", "A", "x", 0.9), item("b", "B", "y", 0.8),
                                     item("c", "C", "z", 0.7)};
    auto out = applyDiversityFilter(items);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].id, "a");
    EXPECT_EQ(out[2].id, "c");
}
