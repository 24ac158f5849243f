#include "linkshare_protocol.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace linkshare;

TEST(Protocol, MetaWireShape) {
    ControlMessage m = msg::Meta{FileDescriptor{"movie.mkv", 10000000, "video/x-matroska"}};
    auto j = nlohmann::json::parse(encode_control(m));
    EXPECT_EQ(j["type"], "meta");
    EXPECT_EQ(j["meta"]["name"], "movie.mkv");
    EXPECT_EQ(j["meta"]["size"], 10000000u);
    EXPECT_EQ(j["meta"]["type"], "video/x-matroska");
}

TEST(Protocol, BareMessagesCarryOnlyType) {
    EXPECT_EQ(encode_control(msg::ReadyToReceive{}), R"({"type":"ready_to_receive"})");
    EXPECT_EQ(encode_control(msg::TransferCompleteAck{}), R"({"type":"transfer_complete_ack"})");
    EXPECT_EQ(encode_control(msg::End{}), R"({"type":"end"})");
    EXPECT_EQ(encode_control(msg::Cancelled{}), R"({"type":"transfer_cancelled"})");
}

TEST(Protocol, DecodesEveryType) {
    std::string err;
    auto meta = decode_control(R"({"type":"meta","meta":{"name":"a.txt","size":3,"type":"text/plain"}})", &err);
    ASSERT_TRUE(meta) << err;
    const auto& d = std::get<msg::Meta>(*meta).descriptor;
    EXPECT_EQ(d, (FileDescriptor{"a.txt", 3, "text/plain"}));

    EXPECT_TRUE(std::holds_alternative<msg::ReadyToReceive>(*decode_control(R"({"type":"ready_to_receive"})")));
    EXPECT_TRUE(std::holds_alternative<msg::TransferCompleteAck>(*decode_control(R"({"type":"transfer_complete_ack"})")));

    auto end = decode_control(R"({"type":"end","sha256":"abcd"})");
    ASSERT_TRUE(end);
    EXPECT_EQ(std::get<msg::End>(*end).sha256, "abcd");

    auto cancel = decode_control(R"({"type":"transfer_cancelled","origin":"receiver","reason":"declined"})");
    ASSERT_TRUE(cancel);
    EXPECT_EQ(std::get<msg::Cancelled>(*cancel).origin, msg::CancelOrigin::Receiver);
    EXPECT_EQ(std::get<msg::Cancelled>(*cancel).reason, "declined");
}

TEST(Protocol, OfferIdTravelsWithMetaAndReplies) {
    auto j = nlohmann::json::parse(encode_control(msg::Meta{FileDescriptor{"a.bin", 1, ""}, 7}));
    EXPECT_EQ(j["id"], 7u);
    EXPECT_EQ(encode_control(msg::ReadyToReceive{7}), R"({"id":7,"type":"ready_to_receive"})");

    auto meta = decode_control(R"({"type":"meta","id":7,"meta":{"name":"a.bin","size":1}})");
    ASSERT_TRUE(meta);
    EXPECT_EQ(std::get<msg::Meta>(*meta).offer_id, 7u);
    auto ready = decode_control(R"({"type":"ready_to_receive","id":7})");
    ASSERT_TRUE(ready);
    EXPECT_EQ(std::get<msg::ReadyToReceive>(*ready).offer_id, 7u);
    auto ack = decode_control(R"({"type":"transfer_complete_ack","id":9})");
    ASSERT_TRUE(ack);
    EXPECT_EQ(std::get<msg::TransferCompleteAck>(*ack).offer_id, 9u);

    // untagged replies decode as offer 0
    EXPECT_EQ(std::get<msg::ReadyToReceive>(*decode_control(R"({"type":"ready_to_receive"})")).offer_id, 0u);

    std::string err;
    EXPECT_FALSE(decode_control(R"({"type":"ready_to_receive","id":-1})", &err));
    EXPECT_FALSE(decode_control(R"({"type":"ready_to_receive","id":"7"})", &err));
}

TEST(Protocol, CancelWithoutOriginIsUnknown) {
    auto c = decode_control(R"({"type":"transfer_cancelled"})");
    ASSERT_TRUE(c);
    EXPECT_EQ(std::get<msg::Cancelled>(*c).origin, msg::CancelOrigin::Unknown);
}

TEST(Protocol, MetaWithoutTypeDefaultsToEmptyMediaType) {
    auto m = decode_control(R"({"type":"meta","meta":{"name":"x","size":0}})");
    ASSERT_TRUE(m);
    EXPECT_EQ(std::get<msg::Meta>(*m).descriptor.media_type, "");
    EXPECT_EQ(std::get<msg::Meta>(*m).descriptor.size, 0u);
}

TEST(Protocol, RejectsMalformedFrames) {
    std::string err;
    EXPECT_FALSE(decode_control("not json", &err));
    EXPECT_NE(err.find("invalid JSON"), std::string::npos);
    EXPECT_FALSE(decode_control("[1,2,3]", &err));
    EXPECT_FALSE(decode_control(R"({"kind":"meta"})", &err));
    EXPECT_FALSE(decode_control(R"({"type":"warp"})", &err));
    EXPECT_NE(err.find("warp"), std::string::npos);
    EXPECT_FALSE(decode_control(R"({"type":"meta"})", &err));
    EXPECT_FALSE(decode_control(R"({"type":"meta","meta":{"name":"x","size":-5}})", &err));
    EXPECT_FALSE(decode_control(R"({"type":"meta","meta":{"name":"x","size":"12"}})", &err));
    EXPECT_FALSE(decode_control(R"({"type":"meta","meta":{"size":12}})", &err));
}

TEST(Protocol, TypeNames) {
    EXPECT_STREQ(type_name(msg::Meta{}), "meta");
    EXPECT_STREQ(type_name(msg::End{}), "end");
    EXPECT_STREQ(type_name(msg::Cancelled{}), "transfer_cancelled");
}

TEST(Protocol, MediaTypeFromExtension) {
    EXPECT_EQ(guess_media_type("report.PDF"), "application/pdf");
    EXPECT_EQ(guess_media_type("song.mp3"), "audio/mpeg");
    EXPECT_EQ(guess_media_type("archive.tar.gz"), "application/gzip");
    EXPECT_EQ(guess_media_type("README"), "application/octet-stream");
    EXPECT_EQ(guess_media_type("trailing."), "application/octet-stream");
}

TEST(Protocol, SanitizedNamesStayInsideOutputDir) {
    EXPECT_EQ(sanitize_filename("../../etc/passwd"), "passwd");
    EXPECT_EQ(sanitize_filename("C:\\Users\\me\\photo.jpg"), "photo.jpg");
    EXPECT_EQ(sanitize_filename("we?ird*name.txt"), "we_ird_name.txt");
    EXPECT_EQ(sanitize_filename(".."), "file");
    EXPECT_EQ(sanitize_filename(""), "file");
    EXPECT_EQ(basename_only("/tmp/dir/a.bin"), "a.bin");
}
