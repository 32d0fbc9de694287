// BSD 3-Clause License
//
// Copyright (c) 2021-2025, kcenon
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#include <gtest/gtest.h>
#include "kcenon/vsm/core/result_types.h"
#include "kcenon/vsm/core/error_codes.h"

#include <string>

using namespace kcenon::vsm;

/**
 * @brief Test basic Result pattern functionality
 */
class ResultTypesTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(ResultTypesTest, SuccessResultContainsValue) {
    auto result = make_success<int>(42);

    EXPECT_TRUE(result.is_ok());
    EXPECT_FALSE(result.is_err());
    EXPECT_EQ(result.value(), 42);
}

TEST_F(ResultTypesTest, ErrorResultContainsError) {
    auto result = make_error<int>(vsm_error_code::capacity_exceeded, "Test error");

    EXPECT_FALSE(result.is_ok());
    EXPECT_TRUE(result.is_err());
    EXPECT_EQ(error_code_of(result), vsm_error_code::capacity_exceeded);
    EXPECT_EQ(result.error().message, "Test error");
}

TEST_F(ResultTypesTest, ValueOrReturnsDefaultOnError) {
    auto error_result = make_error<double>(vsm_error_code::parse_error);
    EXPECT_DOUBLE_EQ(error_result.value_or(1.5), 1.5);

    auto success_result = make_success<double>(0.25);
    EXPECT_DOUBLE_EQ(success_result.value_or(1.5), 0.25);
}

TEST_F(ResultTypesTest, MapTransformsSuccessValue) {
    auto result = make_success<int>(10);
    auto mapped = result.map([](int x) { return x * 2; });

    EXPECT_TRUE(mapped.is_ok());
    EXPECT_EQ(mapped.value(), 20);
}

TEST_F(ResultTypesTest, MapPropagatesError) {
    auto result = make_error<int>(vsm_error_code::invalid_configuration);
    auto mapped = result.map([](int x) { return x * 2; });

    EXPECT_TRUE(mapped.is_err());
    EXPECT_EQ(error_code_of(mapped), vsm_error_code::invalid_configuration);
}

TEST_F(ResultTypesTest, VoidResultSuccessAndError) {
    auto ok = make_void_success();
    EXPECT_TRUE(ok.is_ok());

    auto failed = make_void_error(vsm_error_code::unknown_protocol_action, "warp_drive");
    EXPECT_TRUE(failed.is_err());
    EXPECT_EQ(error_code_of(failed), vsm_error_code::unknown_protocol_action);
    EXPECT_EQ(failed.error().message, "warp_drive");
}

TEST_F(ResultTypesTest, ErrorWithContextKeepsDetails) {
    auto result = make_error_with_context<std::string>(vsm_error_code::malformed_snapshot,
                                                       "bad snapshot", "coverage=1.4");
    ASSERT_TRUE(result.is_err());
    ASSERT_TRUE(result.error().details.has_value());
    EXPECT_EQ(result.error().details.value(), "coverage=1.4");
}

TEST_F(ResultTypesTest, ErrorInfoRoundTripsThroughCommonError) {
    error_info original(vsm_error_code::resource_denied, "no capacity", "adaptation");
    auto common_error = original.to_common_error();
    auto restored = error_info::from_common_error(common_error);

    EXPECT_EQ(restored.code, vsm_error_code::resource_denied);
    EXPECT_EQ(restored.message, "no capacity");
    ASSERT_TRUE(restored.context.has_value());
    EXPECT_EQ(restored.context.value(), "adaptation");
}

TEST_F(ResultTypesTest, ErrorCodesHaveReadableNames) {
    EXPECT_EQ(error_code_to_string(vsm_error_code::capacity_exceeded), "Capacity exceeded");
    EXPECT_EQ(error_code_to_string(vsm_error_code::parse_error), "Parse error");

    error_info defaulted(vsm_error_code::source_unavailable);
    EXPECT_EQ(defaulted.message, "Signal source unavailable");
}
