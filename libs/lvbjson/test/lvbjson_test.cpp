#include "lvbtools/lvbjson.h"
#include "lvb_test_builder.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace lvbtools;
using lvbjson::json;

TEST(LvbJson, HexId) {
    EXPECT_EQ(lvbjson::hex_id(0xAB), "<000000AB>");
    EXPECT_EQ(lvbjson::hex_id(0xDEADBEEF), "<DEADBEEF>");
}

TEST(LvbJson, HexEncode) {
    std::vector<uint8_t> data = {0x00, 0x0F, 0xA0, 0xFF};
    EXPECT_EQ(lvbjson::hex_encode(data), "000fa0ff");
    EXPECT_EQ(lvbjson::hex_encode({}), "");
}

TEST(LvbJson, ParseKey) {
    auto id = lvbjson::parse_key("<DEADBEEF>");
    ASSERT_TRUE(std::holds_alternative<uint32_t>(id));
    EXPECT_EQ(std::get<uint32_t>(id), 0xDEADBEEFu);

    EXPECT_EQ(std::get<uint32_t>(lvbjson::parse_key("<00000001>")), 1u);

    // Lowercase digits, wrong length and missing brackets stay names.
    for (const char* s : {"<deadbeef>", "<ABC>", "DEADBEEF", "<DEADBEEF", "boss_01", ""}) {
        auto k = lvbjson::parse_key(s);
        ASSERT_TRUE(std::holds_alternative<std::string>(k)) << s;
        EXPECT_EQ(std::get<std::string>(k), s);
    }
}

TEST(LvbJson, InfoPayload) {
    lvb::Payload p = lvb::Info{.bdat_id = 0x10, .xfrm_index = 2, .shape = 3,
                               .sequential_id = 4, .hash_id = 0xCAFEBABE};
    auto j = lvbjson::payload_json(p);
    EXPECT_EQ(j.dump(), R"({"bdat_id":"<00000010>","shape":3,"sequential_id":4,"hash_id":"<CAFEBABE>"})");

    lvb::Payload legacy = lvb::LegacyInfo{.name_id = 1, .xfrm_index = 2, .shape = 9};
    EXPECT_EQ(lvbjson::payload_json(legacy).dump(), R"({"shape":9})");
}

TEST(LvbJson, RawBytesOnlyWhenRequested) {
    lvb::Payload p = lvb::Raw{.bytes = {0xAB, 0xCD}};
    EXPECT_EQ(lvbjson::payload_json(p).dump(), "{}");
    EXPECT_EQ(lvbjson::payload_json(p, {.include_bytes = true}).dump(), R"({"bytes":"abcd"})");
}

TEST(LvbJson, ExtensionFields) {
    lvb::Payload p = lvb::Extension{
        .type = "enemy",
        .fields = {{"level", int64_t{42}}, {"scale", 1.5}, {"tag", std::string("boss")}},
        .bytes = {1},
    };
    EXPECT_EQ(lvbjson::payload_json(p).dump(),
              R"({"type":"enemy","level":42,"scale":1.5,"tag":"boss"})");
    EXPECT_EQ(lvbjson::payload_json(p, {.include_bytes = true})["bytes"], "01");
}

TEST(LvbJson, ModernFullDump) {
    auto c = lvb::read(lvbtest::modern_sample());
    auto doc = lvbjson::to_json(c);

    EXPECT_EQ(doc["version"], 5);
    ASSERT_EQ(doc["sections"].size(), 1u);
    const auto& sec = doc["sections"][0];
    EXPECT_EQ(sec["magic"], "GMKE");
    ASSERT_EQ(sec["entries"].size(), 2u);

    const auto& boss = sec["entries"][0];
    EXPECT_EQ(boss["name"], "boss_01");
    EXPECT_EQ(boss["info"]["bdat_id"], "<00000100>");
    EXPECT_EQ(boss["info"]["hash_id"], "<AAAA0001>");
    ASSERT_EQ(boss["xform"].size(), 16u);
    EXPECT_EQ(boss["xform"][12], 10.0);
    EXPECT_EQ(boss["xform"][13], 20.0);
    EXPECT_FALSE(boss.contains("bytes"));

    const auto& other = sec["entries"][1];
    EXPECT_TRUE(other["name"].is_null());

    // Key order: name, info, xform, then payload fields.
    std::vector<std::string> keys;
    for (auto it = boss.begin(); it != boss.end(); ++it) keys.push_back(it.key());
    EXPECT_EQ(keys, (std::vector<std::string>{"name", "info", "xform"}));
}

TEST(LvbJson, FullDumpWithBytes) {
    auto c = lvb::read(lvbtest::modern_sample());
    auto doc = lvbjson::to_json(c, {.include_bytes = true});
    EXPECT_EQ(doc["sections"][0]["entries"][1]["bytes"], "090a0b0c0d0e0f10");
}

TEST(LvbJson, LegacyEntry) {
    auto c = lvb::read(lvbtest::legacy_sample());
    const auto* rock = c.gimmick("rock_b");
    ASSERT_NE(rock, nullptr);
    auto j = lvbjson::entry_json(c, *rock);
    EXPECT_EQ(j["name"], "rock_b");
    EXPECT_EQ(j["info"], (json{{"shape", 12}}));
    EXPECT_EQ(j["xform"][12], -1.0);

    auto doc = lvbjson::to_json(c);
    EXPECT_EQ(doc["version"], 4);
    ASSERT_EQ(doc["sections"].size(), 2u);
    EXPECT_EQ(doc["sections"][1]["magic"], "ROCK");
}

TEST(LvbJson, SectionJson) {
    auto c = lvb::read(lvbtest::legacy_sample());
    const auto* tree = c.section("TREE");
    ASSERT_NE(tree, nullptr);
    auto j = lvbjson::section_json(c, *tree, {.include_bytes = true});
    EXPECT_EQ(j["magic"], "TREE");
    ASSERT_EQ(j["entries"].size(), 1u);
    EXPECT_EQ(j["entries"][0]["bytes"], "aabbccdd");
}

TEST(LvbJson, NonUtf8MagicDumpsWithReplacement) {
    const std::string magic("\xC3\x28OB", 4);
    lvbtest::LvbBuilder b(5);
    b.section({.magic = "INFO", .entry_size = 16,
               .entries = {lvbtest::info_entry(1, 0, 0, 0, 0x42)}});
    b.section({.magic = "XFRM", .entry_size = 64,
               .entries = {lvbtest::xfrm_entry(lvbtest::translation(0, 0, 0))}});
    b.strings(lvbtest::StringTable{});
    b.section({.magic = magic, .entry_size = 1, .entries = {lvbtest::raw_entry({7})}});
    auto c = lvb::read(b.build());

    auto doc = lvbjson::to_json(c, {.include_bytes = true});
    ASSERT_EQ(doc["sections"].size(), 1u);
    EXPECT_THROW((void)doc.dump(), json::type_error);

    std::string out;
    ASSERT_NO_THROW(out = lvbjson::dump(doc));
    EXPECT_NE(out.find("\xEF\xBF\xBD"), std::string::npos);
    EXPECT_NE(out.find("OB"), std::string::npos);
    EXPECT_NE(out.find("\"07\""), std::string::npos);
}

TEST(LvbJson, NonUtf8ExtensionFieldDumps) {
    lvb::Payload p = lvb::Extension{.type = "enemy",
                                    .fields = {{"tag", std::string("\xFF\xFE")}}};
    EXPECT_NO_THROW((void)lvbjson::dump(lvbjson::payload_json(p), -1));
}

TEST(LvbJson, DumpIndent) {
    json j = {{"a", 1}};
    EXPECT_EQ(lvbjson::dump(j, -1), R"({"a":1})");
    EXPECT_EQ(lvbjson::dump(j), "{\n \"a\": 1\n}");
}
