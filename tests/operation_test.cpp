#include <docpatch-cpp/operation.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace docpatch_cpp;

TEST(OpKind, round_trips_through_wire_names) {
    for (auto kind : {OpKind::add, OpKind::remove, OpKind::replace,
                      OpKind::move, OpKind::copy, OpKind::test}) {
        auto parsed = parse_op_kind(to_string_view(kind));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, kind);
    }
}

TEST(OpKind, unknown_names_are_rejected) {
    EXPECT_FALSE(parse_op_kind("merge").has_value());
    EXPECT_FALSE(parse_op_kind("ADD").has_value());
    EXPECT_FALSE(parse_op_kind("").has_value());
}

TEST(OpKind, only_test_is_read_only) {
    EXPECT_TRUE(is_mutating(OpKind::add));
    EXPECT_TRUE(is_mutating(OpKind::move));
    EXPECT_FALSE(is_mutating(OpKind::test));
    static_assert(!is_mutating(OpKind::test));
}

TEST(Operation, kind_and_paths) {
    const auto move = Operation{MoveOp{"/from", "/to"}};
    EXPECT_EQ(kind_of(move), OpKind::move);
    EXPECT_EQ(target_path(move), "/to");
    ASSERT_NE(source_path(move), nullptr);
    EXPECT_EQ(*source_path(move), "/from");

    const auto add = Operation{AddOp{"/x", 1}};
    EXPECT_EQ(kind_of(add), OpKind::add);
    EXPECT_EQ(target_path(add), "/x");
    EXPECT_EQ(source_path(add), nullptr);
}

TEST(Operation, equality_compares_values) {
    EXPECT_EQ((Operation{ReplaceOp{"/a", 1}}), (Operation{ReplaceOp{"/a", 1.0}}));
    EXPECT_NE((Operation{ReplaceOp{"/a", 1}}), (Operation{AddOp{"/a", 1}}));
    EXPECT_NE((Operation{CopyOp{"/a", "/b"}}), (Operation{CopyOp{"/b", "/a"}}));
}

TEST(Patch, operation_kinds_in_order) {
    const auto patch = Patch{
        AddOp{"/a", 1},
        TestOp{"/a", 1},
        RemoveOp{"/a"},
    };
    EXPECT_EQ(operation_kinds(patch), (std::vector<std::string>{"add", "test", "remove"}));
}

TEST(Patch, group_by_section_uses_first_token) {
    const auto patch = Patch{
        ReplaceOp{"/components/0/name", "pump"},
        AddOp{"/components/-", Object{}},
        ReplaceOp{"/project/title", "plant"},
        ReplaceOp{"", Object{}},
    };
    const auto groups = group_by_section(patch);
    ASSERT_EQ(groups.size(), 3u);
    EXPECT_EQ(groups.at("components").size(), 2u);
    EXPECT_EQ(groups.at("project").size(), 1u);
    EXPECT_EQ(groups.at("root").size(), 1u);
    EXPECT_EQ(target_path(groups.at("components")[1]), "/components/-");
}

TEST(Patch, group_by_section_tolerates_malformed_paths) {
    const auto groups = group_by_section(Patch{RemoveOp{"field/x"}});
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_TRUE(groups.contains("field"));
}
