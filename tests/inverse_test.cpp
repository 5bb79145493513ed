#include <docpatch-cpp/applier.hpp>
#include <docpatch-cpp/inverse.hpp>

#include <gtest/gtest.h>

#include <variant>

using namespace docpatch_cpp;

namespace {

auto sample() -> Value {
    return Object{
        {"field", 1},
        {"list", Array{"a", "b", "c"}},
        {"nested", Object{{"inner", Object{{"x", true}}}}},
    };
}

// Applies `patch`, then its inverse, and expects to land on `pre`.
void expect_round_trip(const Patch& patch, const Value& pre = sample()) {
    auto inverse = compute_inverse(patch, pre);
    ASSERT_TRUE(inverse) << describe(inverse.error());
    auto post = apply_patch(patch, pre);
    ASSERT_TRUE(post) << post.error().reason;
    auto restored = apply_patch(*inverse, *post);
    ASSERT_TRUE(restored) << restored.error().reason;
    EXPECT_EQ(*restored, pre);
}

}  // namespace

// -- inverse shapes -----------------------------------------------------------

TEST(ComputeInverse, replace_restores_old_value) {
    auto inverse = compute_inverse({ReplaceOp{"/field", 2}}, Value{Object{{"field", 1}}});
    ASSERT_TRUE(inverse);
    EXPECT_EQ(*inverse, (Patch{ReplaceOp{"/field", 1}}));
}

TEST(ComputeInverse, add_of_new_key_is_remove) {
    auto inverse = compute_inverse({AddOp{"/new", 1}}, sample());
    ASSERT_TRUE(inverse);
    EXPECT_EQ(*inverse, (Patch{RemoveOp{"/new"}}));
}

TEST(ComputeInverse, add_over_existing_key_is_replace) {
    auto inverse = compute_inverse({AddOp{"/field", 9}}, sample());
    ASSERT_TRUE(inverse);
    EXPECT_EQ(*inverse, (Patch{ReplaceOp{"/field", 1}}));
}

TEST(ComputeInverse, dash_becomes_concrete_index) {
    auto inverse = compute_inverse({AddOp{"/list/-", "d"}}, sample());
    ASSERT_TRUE(inverse);
    EXPECT_EQ(*inverse, (Patch{RemoveOp{"/list/3"}}));
}

TEST(ComputeInverse, remove_is_add_of_old_value) {
    auto inverse = compute_inverse({RemoveOp{"/nested/inner"}}, sample());
    ASSERT_TRUE(inverse);
    EXPECT_EQ(*inverse, (Patch{AddOp{"/nested/inner", Object{{"x", true}}}}));
}

TEST(ComputeInverse, test_contributes_nothing) {
    auto inverse = compute_inverse({TestOp{"/field", 1}}, sample());
    ASSERT_TRUE(inverse);
    EXPECT_TRUE(inverse->empty());
}

TEST(ComputeInverse, test_is_not_evaluated) {
    auto inverse = compute_inverse({TestOp{"/field", 99}}, sample());
    EXPECT_TRUE(inverse);
}

TEST(ComputeInverse, move_is_reverse_move) {
    auto inverse = compute_inverse({MoveOp{"/field", "/renamed"}}, sample());
    ASSERT_TRUE(inverse);
    EXPECT_EQ(*inverse, (Patch{MoveOp{"/renamed", "/field"}}));
}

TEST(ComputeInverse, move_onto_itself_has_empty_inverse) {
    auto inverse = compute_inverse({MoveOp{"/field", "/field"}}, sample());
    ASSERT_TRUE(inverse);
    EXPECT_TRUE(inverse->empty());
}

TEST(ComputeInverse, move_onto_existing_key_restores_displaced_value) {
    auto inverse = compute_inverse({MoveOp{"/field", "/list"}}, sample());
    ASSERT_TRUE(inverse);
    EXPECT_EQ(*inverse, (Patch{
        ReplaceOp{"/list", Array{"a", "b", "c"}},
        AddOp{"/field", 1},
    }));
}

TEST(ComputeInverse, inverses_come_in_reverse_order) {
    auto inverse = compute_inverse({AddOp{"/a", 1}, AddOp{"/b", 2}}, sample());
    ASSERT_TRUE(inverse);
    EXPECT_EQ(*inverse, (Patch{RemoveOp{"/b"}, RemoveOp{"/a"}}));
}

TEST(ComputeInverse, later_operations_see_earlier_effects) {
    auto inverse = compute_inverse({AddOp{"/a", 1}, ReplaceOp{"/a", 2}}, sample());
    ASSERT_TRUE(inverse);
    EXPECT_EQ(*inverse, (Patch{ReplaceOp{"/a", 1}, RemoveOp{"/a"}}));
}

TEST(ComputeInverse, does_not_modify_pre_image) {
    const auto pre = sample();
    (void)compute_inverse({RemoveOp{"/field"}, AddOp{"/list/0", 0}}, pre);
    EXPECT_EQ(pre, sample());
}

// -- round trips --------------------------------------------------------------

TEST(InverseRoundTrip, member_operations) {
    expect_round_trip({AddOp{"/new", Object{{"k", 1}}}, RemoveOp{"/field"}, ReplaceOp{"/nested/inner/x", 0}});
}

TEST(InverseRoundTrip, array_insertions_and_removals) {
    expect_round_trip({AddOp{"/list/0", "z"}, AddOp{"/list/-", "y"}, RemoveOp{"/list/2"}});
}

TEST(InverseRoundTrip, move_forward_within_array) {
    expect_round_trip({MoveOp{"/list/0", "/list/2"}});
}

TEST(InverseRoundTrip, move_backward_within_array) {
    expect_round_trip({MoveOp{"/list/2", "/list/0"}});
}

TEST(InverseRoundTrip, move_to_array_end) {
    expect_round_trip({MoveOp{"/list/0", "/list/-"}});
}

TEST(InverseRoundTrip, move_between_containers) {
    expect_round_trip({MoveOp{"/list/1", "/nested/inner/moved"}, MoveOp{"/field", "/list/0"}});
}

TEST(InverseRoundTrip, move_onto_existing_member) {
    expect_round_trip({MoveOp{"/nested/inner", "/field"}});
}

TEST(InverseRoundTrip, move_up_to_an_ancestor) {
    expect_round_trip({MoveOp{"/nested/inner/x", "/nested"}});
}

TEST(InverseRoundTrip, copy_into_array_and_member) {
    expect_round_trip({CopyOp{"/nested", "/list/1"}, CopyOp{"/list/0", "/field"}});
}

TEST(InverseRoundTrip, whole_document_replace) {
    expect_round_trip({ReplaceOp{"", Object{{"fresh", true}}}});
}

TEST(InverseRoundTrip, add_at_root) {
    expect_round_trip({AddOp{"", Object{}}, AddOp{"/x", 1}});
}

// -- failures -----------------------------------------------------------------

TEST(ComputeInverse, missing_path_in_pre_image_is_inverse_generation_error) {
    auto inverse = compute_inverse({RemoveOp{"/absent"}}, sample());
    ASSERT_FALSE(inverse);
    ASSERT_TRUE(std::holds_alternative<InverseGenerationError>(inverse.error()));
    EXPECT_EQ(std::get<InverseGenerationError>(inverse.error()).op_index, 0u);
}

TEST(ComputeInverse, missing_move_source_is_inverse_generation_error) {
    auto inverse = compute_inverse({ReplaceOp{"/field", 2}, MoveOp{"/absent", "/x"}}, sample());
    ASSERT_FALSE(inverse);
    ASSERT_TRUE(std::holds_alternative<InverseGenerationError>(inverse.error()));
    EXPECT_EQ(std::get<InverseGenerationError>(inverse.error()).op_index, 1u);
}

TEST(ComputeInverse, path_removed_by_earlier_operation_is_application_error) {
    auto inverse = compute_inverse({RemoveOp{"/field"}, ReplaceOp{"/field", 2}}, sample());
    ASSERT_FALSE(inverse);
    ASSERT_TRUE(std::holds_alternative<PatchApplicationError>(inverse.error()));
    EXPECT_EQ(std::get<PatchApplicationError>(inverse.error()).op_index, 1u);
}

TEST(ComputeInverse, index_past_end_is_inverse_generation_error) {
    auto inverse = compute_inverse({AddOp{"/list/7", 1}}, sample());
    ASSERT_FALSE(inverse);
    EXPECT_EQ(kind_of(inverse.error()), ErrorKind::inverse_generation);
}
