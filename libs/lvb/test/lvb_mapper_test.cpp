#include "lvbtools/lvb_mapper.h"
#include "lvb_test_builder.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace lvbtools::lvb;

namespace {

Decoder extension_decoder(const std::string& type) {
    return [type](std::span<const uint8_t> entry) -> Payload {
        return Extension{.type = type,
                         .fields = {{"size", static_cast<int64_t>(entry.size())}},
                         .bytes = {entry.begin(), entry.end()}};
    };
}

} // namespace

TEST(LvbMapper, BuiltinInfoFollowsFormatFamily) {
    auto entry = lvbtest::info_entry(1, 2, 3, 4, 5);
    MapperRegistry reg;

    auto modern = reg.resolve("INFO", true);
    EXPECT_EQ(modern.kind, MapperKind::Builtin);
    EXPECT_TRUE(std::holds_alternative<Info>(modern.decode(entry)));

    auto legacy = reg.resolve("INFO", false);
    EXPECT_EQ(legacy.kind, MapperKind::Builtin);
    EXPECT_TRUE(std::holds_alternative<LegacyInfo>(legacy.decode(entry)));
}

TEST(LvbMapper, BuiltinSpecialSections) {
    MapperRegistry reg;
    auto dbg = lvbtest::debug_entry(1, 2, 3, 4);
    auto xf = lvbtest::xfrm_entry(lvbtest::translation(0, 0, 0));

    EXPECT_TRUE(std::holds_alternative<Debug>(reg.resolve("DEBI", true).decode(dbg)));
    EXPECT_TRUE(std::holds_alternative<Transform>(reg.resolve("XFRM", false).decode(xf)));
    EXPECT_TRUE(std::holds_alternative<Strings>(reg.resolve("STRG", true).decode(dbg)));
}

TEST(LvbMapper, UnknownMagicFallsBackToRaw) {
    MapperRegistry reg;
    auto m = reg.resolve("ENMY", true);
    EXPECT_EQ(m.kind, MapperKind::Raw);
    auto p = m.decode(std::vector<uint8_t>{1, 2, 3});
    ASSERT_TRUE(std::holds_alternative<Raw>(p));
    EXPECT_EQ(std::get<Raw>(p).bytes.size(), 3u);
}

TEST(LvbMapper, ResolversTriedInOrder) {
    MapperRegistry reg;
    std::vector<std::string> calls;
    reg.add_resolver([&](std::string_view magic, bool) -> std::optional<Decoder> {
        calls.push_back("first:" + std::string(magic));
        return std::nullopt;
    });
    reg.add_resolver([&](std::string_view magic, bool modern) -> std::optional<Decoder> {
        calls.push_back("second:" + std::string(magic));
        if (magic == "ENMY" && modern) return extension_decoder("enemy");
        return std::nullopt;
    });
    reg.add_resolver([&](std::string_view magic, bool) -> std::optional<Decoder> {
        calls.push_back("third:" + std::string(magic));
        return extension_decoder("shadowed");
    });
    EXPECT_EQ(reg.resolver_count(), 3u);

    auto m = reg.resolve("ENMY", true);
    EXPECT_EQ(m.kind, MapperKind::Extension);
    auto p = m.decode(std::vector<uint8_t>(12, 0));
    ASSERT_TRUE(std::holds_alternative<Extension>(p));
    EXPECT_EQ(std::get<Extension>(p).type, "enemy");
    EXPECT_EQ(calls, (std::vector<std::string>{"first:ENMY", "second:ENMY"}));

    // The legacy family is declined by the second resolver and lands on the third.
    calls.clear();
    auto legacy = reg.resolve("ENMY", false);
    EXPECT_EQ(std::get<Extension>(legacy.decode(std::vector<uint8_t>(4, 0))).type, "shadowed");
    EXPECT_EQ(calls.size(), 3u);
}

TEST(LvbMapper, BuiltinsWinOverResolvers) {
    MapperRegistry reg;
    bool called = false;
    reg.add_resolver([&](std::string_view, bool) -> std::optional<Decoder> {
        called = true;
        return extension_decoder("hijack");
    });
    auto m = reg.resolve("XFRM", true);
    EXPECT_EQ(m.kind, MapperKind::Builtin);
    EXPECT_FALSE(called);
}

TEST(LvbMapper, EmptyDecoderFromResolverIsSkipped) {
    MapperRegistry reg;
    reg.add_resolver([](std::string_view, bool) -> std::optional<Decoder> { return Decoder{}; });
    EXPECT_EQ(reg.resolve("ABCD", true).kind, MapperKind::Raw);
}

TEST(LvbMapper, SpecialMagics) {
    EXPECT_TRUE(is_special_magic("INFO"));
    EXPECT_TRUE(is_special_magic("XFRM"));
    EXPECT_TRUE(is_special_magic("DEBI"));
    EXPECT_TRUE(is_special_magic("STRG"));
    EXPECT_FALSE(is_special_magic("info"));
    EXPECT_FALSE(is_special_magic("GMKE"));
    EXPECT_STREQ(to_string(MapperKind::Extension), "extension");
}
