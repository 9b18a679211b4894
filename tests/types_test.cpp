#include <set>
#include <string_view>

#include <gtest/gtest.h>
#include <pmx/types.hpp>

using pmx::Stage;

TEST(StageTest, AllStagesInPipelineOrder) {
    ASSERT_EQ(pmx::all_stages.size(), pmx::stage_count);
    for (std::size_t i = 0; i < pmx::all_stages.size(); ++i) {
        EXPECT_EQ(static_cast<std::size_t>(pmx::all_stages[i]), i);
    }
    EXPECT_EQ(pmx::all_stages.front(), Stage::http);
    EXPECT_EQ(pmx::all_stages.back(), Stage::output);
}

TEST(StageTest, NamesAreDistinct) {
    std::set<std::string_view> names;
    std::set<std::string_view> labels;
    for (auto stage : pmx::all_stages) {
        names.insert(pmx::stage_name(stage));
        labels.insert(pmx::stage_label(stage));
    }
    EXPECT_EQ(names.size(), pmx::stage_count);
    EXPECT_EQ(labels.size(), pmx::stage_count);
}

TEST(StageTest, Labels) {
    EXPECT_EQ(pmx::stage_label(Stage::http), "HTTP Error");
    EXPECT_EQ(pmx::stage_label(Stage::data_source), "Data Source Error");
    EXPECT_EQ(pmx::stage_label(Stage::parse), "Parse Error");
    EXPECT_EQ(pmx::stage_label(Stage::normalization), "Normalization Error");
    EXPECT_EQ(pmx::stage_label(Stage::analysis), "Analysis Error");
    EXPECT_EQ(pmx::stage_label(Stage::output), "Output Error");
}

TEST(StageTest, NamesAreConstexpr) {
    static_assert(pmx::stage_name(Stage::normalization) == "normalization");
    static_assert(pmx::stage_label(Stage::http) == "HTTP Error");
    EXPECT_EQ(pmx::stage_name(Stage::data_source), "data_source");
}
