#include <protobuf/impl/sensitive_fields.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <csikit/csi/v1/csi.pb.h>
#include <tests/sanitizer_test.pb.h>

CSIKIT_NAMESPACE_BEGIN

namespace {

std::vector<std::string> Names(const std::vector<protobuf::impl::SensitiveField>& fields) {
    std::vector<std::string> result;
    for (const auto& field : fields) result.push_back(field.Name());
    return result;
}

}  // namespace

TEST(SensitiveFields, CsiRequests) {
    EXPECT_THAT(
        Names(protobuf::impl::FindSensitiveFields(*csi::v1::NodeStageVolumeRequest::descriptor())),
        testing::ElementsAre("csikit.csi.v1.NodeStageVolumeRequest.secrets")
    );
    EXPECT_THAT(
        Names(protobuf::impl::FindSensitiveFields(*csi::v1::ControllerPublishVolumeRequest::descriptor())),
        testing::ElementsAre("csikit.csi.v1.ControllerPublishVolumeRequest.secrets")
    );
    EXPECT_THAT(protobuf::impl::FindSensitiveFields(*csi::v1::NodeGetInfoRequest::descriptor()), testing::IsEmpty());
    EXPECT_THAT(
        protobuf::impl::FindSensitiveFields(*csi::v1::NodeUnstageVolumeRequest::descriptor()), testing::IsEmpty()
    );
}

TEST(SensitiveFields, DeclarationOrder) {
    EXPECT_THAT(
        Names(protobuf::impl::FindSensitiveFields(*tests::MultipleSecrets::descriptor())),
        testing::ElementsAre("csikit.tests.MultipleSecrets.secrets", "csikit.tests.MultipleSecrets.extra_secrets")
    );
}

TEST(SensitiveFields, AnnotationDecidesRegardlessOfShape) {
    EXPECT_THAT(
        Names(protobuf::impl::FindSensitiveFields(*tests::StringSecret::descriptor())),
        testing::ElementsAre("csikit.tests.StringSecret.token")
    );
}

TEST(SensitiveFields, AnnotationPresenceDecidesRegardlessOfValue) {
    const auto& field = *tests::DisabledSecret::descriptor()->FindFieldByName("secrets");
    EXPECT_TRUE(protobuf::impl::IsSensitive(field));
    EXPECT_THAT(
        Names(protobuf::impl::FindSensitiveFields(*tests::DisabledSecret::descriptor())),
        testing::ElementsAre("csikit.tests.DisabledSecret.secrets")
    );

    EXPECT_FALSE(protobuf::impl::IsSensitive(*tests::MultipleSecrets::descriptor()->FindFieldByName("labels")));
}

TEST(SensitiveFields, NestedMessagesAreNotInspected) {
    EXPECT_THAT(protobuf::impl::FindSensitiveFields(*tests::NestedRequest::descriptor()), testing::IsEmpty());
}

TEST(SensitiveFields, ContainsSensitiveFields) {
    EXPECT_TRUE(protobuf::impl::ContainsSensitiveFields(*csi::v1::NodeStageVolumeRequest::descriptor()));
    EXPECT_TRUE(protobuf::impl::ContainsSensitiveFields(*tests::NestedRequest::descriptor()));
    EXPECT_TRUE(protobuf::impl::ContainsSensitiveFields(*tests::NestedMalformed::descriptor()));
    EXPECT_TRUE(protobuf::impl::ContainsSensitiveFields(*tests::RequestTree::descriptor()));

    EXPECT_FALSE(protobuf::impl::ContainsSensitiveFields(*csi::v1::NodeGetInfoResponse::descriptor()));
    EXPECT_FALSE(protobuf::impl::ContainsSensitiveFields(*tests::PlainTree::descriptor()));
}

TEST(SensitiveFields, Shape) {
    const auto& stage = *csi::v1::NodeStageVolumeRequest::descriptor();
    EXPECT_TRUE(protobuf::impl::IsStringToStringMap(*stage.FindFieldByName("secrets")));
    EXPECT_TRUE(protobuf::impl::IsStringToStringMap(*stage.FindFieldByName("volume_context")));
    EXPECT_FALSE(protobuf::impl::IsStringToStringMap(*stage.FindFieldByName("volume_id")));

    EXPECT_FALSE(protobuf::impl::IsStringToStringMap(*tests::IntMapSecret::descriptor()->FindFieldByName("secrets")));
    EXPECT_FALSE(protobuf::impl::IsStringToStringMap(*tests::BytesMapSecret::descriptor()->FindFieldByName("secrets"))
    );
    EXPECT_FALSE(protobuf::impl::IsStringToStringMap(*tests::RepeatedSecret::descriptor()->FindFieldByName("secrets"))
    );
}

TEST(SensitiveFields, ReadWrite) {
    csi::v1::NodeStageVolumeRequest request;
    (*request.mutable_secrets())["username"] = "alice";
    (*request.mutable_secrets())["password"] = "p@ss";

    const protobuf::impl::SensitiveField field{*request.GetDescriptor()->FindFieldByName("secrets")};
    const auto values = field.Read(request);
    ASSERT_TRUE(values);
    EXPECT_EQ(*values, (utils::StringMap{{"password", "p@ss"}, {"username", "alice"}}));

    ASSERT_TRUE(field.Write(request, {{"token", "t0k3n"}}));
    EXPECT_EQ(request.secrets().size(), 1);
    EXPECT_EQ(request.secrets().at("token"), "t0k3n");

    ASSERT_TRUE(field.Write(request, {}));
    EXPECT_TRUE(request.secrets().empty());
}

TEST(SensitiveFields, ReadRejectsForeignOrMalformed) {
    const protobuf::impl::SensitiveField stage_secrets{
        *csi::v1::NodeStageVolumeRequest::descriptor()->FindFieldByName("secrets")};
    tests::MultipleSecrets other;
    (*other.mutable_secrets())["password"] = "p@ss";
    EXPECT_FALSE(stage_secrets.BelongsTo(other));
    EXPECT_TRUE(stage_secrets.BelongsTo(csi::v1::NodeStageVolumeRequest{}));
    EXPECT_FALSE(stage_secrets.Read(other));
    EXPECT_FALSE(stage_secrets.Write(other, {{"password", "x"}}));
    EXPECT_EQ(other.secrets().at("password"), "p@ss");

    tests::StringSecret string_secret;
    string_secret.set_token("t0k3n");
    const protobuf::impl::SensitiveField token{*string_secret.GetDescriptor()->FindFieldByName("token")};
    EXPECT_FALSE(token.Read(string_secret));
    EXPECT_FALSE(token.Write(string_secret, {}));
    EXPECT_EQ(string_secret.token(), "t0k3n");
}

CSIKIT_NAMESPACE_END
