/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE GlyphSetTests
#include <boost/test/unit_test.hpp>

#include "events/RainEvent.hpp"
#include "utils/GlyphSet.hpp"
#include <algorithm>
#include <random>
#include <set>
#include <string>
#include <vector>

using namespace GlyphRain;

BOOST_AUTO_TEST_SUITE(Utf8Tests)

BOOST_AUTO_TEST_CASE(TestDecodeMixedWidths) {
  const auto glyphs = decodeUtf8("Aア◆\xF0\x9F\x98\x80");
  BOOST_REQUIRE_EQUAL(glyphs.size(), 4);
  BOOST_CHECK(glyphs[0] == U'A');
  BOOST_CHECK(glyphs[1] == U'ア');
  BOOST_CHECK(glyphs[2] == U'◆');
  BOOST_CHECK(glyphs[3] == char32_t{0x1F600});
}

BOOST_AUTO_TEST_CASE(TestDecodeSkipsInvalidBytes) {
  // Stray continuation byte, then a truncated three-byte sequence
  const auto glyphs = decodeUtf8("a\x80" "b\xE3\x82");
  BOOST_REQUIRE_EQUAL(glyphs.size(), 2);
  BOOST_CHECK(glyphs[0] == U'a');
  BOOST_CHECK(glyphs[1] == U'b');
}

BOOST_AUTO_TEST_CASE(TestEncode) {
  BOOST_CHECK_EQUAL(encodeUtf8(U'A'), "A");
  BOOST_CHECK_EQUAL(encodeUtf8(U'ア'), "\xE3\x82\xA2");
  BOOST_CHECK_EQUAL(encodeUtf8(char32_t{0x1F600}), "\xF0\x9F\x98\x80");
  BOOST_CHECK(encodeUtf8(char32_t{0x110000}).empty());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(GlyphSetTests)

BOOST_AUTO_TEST_CASE(TestCharacterSetNames) {
  BOOST_CHECK(characterSetFromString("katakana") == CharacterSet::Katakana);
  BOOST_CHECK(characterSetFromString("matrix") == CharacterSet::Matrix);
  BOOST_CHECK(characterSetFromString("numbers") == CharacterSet::Numeric);
  BOOST_CHECK(characterSetFromString("custom") == CharacterSet::Custom);
  BOOST_CHECK(!characterSetFromString("runes").has_value());
  BOOST_CHECK_EQUAL(characterSetToString(CharacterSet::Alphanumeric), "alphanumeric");
}

BOOST_AUTO_TEST_CASE(TestBuiltInSets) {
  BOOST_CHECK_EQUAL(GlyphSet(CharacterSet::Numeric).size(), 10);
  BOOST_CHECK_EQUAL(GlyphSet(CharacterSet::Alphanumeric).size(), 62);

  const GlyphSet katakana(CharacterSet::Katakana);
  BOOST_CHECK_GT(katakana.size(), 40);
  const auto &glyphs = katakana.glyphs();
  BOOST_CHECK(std::find(glyphs.begin(), glyphs.end(), U'ア') != glyphs.end());
}

BOOST_AUTO_TEST_CASE(TestCustomSetDropsWhitespace) {
  const GlyphSet custom(CharacterSet::Custom, "0 1\n");
  BOOST_CHECK(custom.characterSet() == CharacterSet::Custom);
  BOOST_REQUIRE_EQUAL(custom.size(), 2);
  BOOST_CHECK(custom.glyphs()[0] == U'0');
  BOOST_CHECK(custom.glyphs()[1] == U'1');
}

BOOST_AUTO_TEST_CASE(TestEmptyCustomFallsBackToKatakana) {
  const GlyphSet custom(CharacterSet::Custom, "   ");
  BOOST_CHECK_EQUAL(custom.size(), GlyphSet(CharacterSet::Katakana).size());
}

BOOST_AUTO_TEST_CASE(TestRandomGlyphStaysInSet) {
  const GlyphSet set(CharacterSet::Numeric);
  std::mt19937 rng(99);
  std::set<char32_t> seen;
  for (int i = 0; i < 500; ++i) {
    const char32_t glyph = set.randomGlyph(rng);
    BOOST_CHECK(glyph >= U'0' && glyph <= U'9');
    seen.insert(glyph);
  }
  BOOST_CHECK_EQUAL(seen.size(), 10);
}

BOOST_AUTO_TEST_CASE(TestSeededSequencesRepeat) {
  const GlyphSet set(CharacterSet::Katakana);
  std::mt19937 a(7);
  std::mt19937 b(7);
  for (int i = 0; i < 50; ++i) {
    BOOST_CHECK(set.randomGlyph(a) == set.randomGlyph(b));
  }
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(EventIdentityGlyphTests)

BOOST_AUTO_TEST_CASE(TestIdentitySpellsAgentSessionAndTime) {
  const RainEvent event("evt-1", 1712345678, RainEventKind::Error,
                        "sess-abc123", "Planner");
  std::mt19937 rng(3);
  std::vector<char32_t> glyphs;
  appendEventIdentityGlyphs(event, rng, glyphs);

  const std::vector<char32_t> expected{U'⚠', U'タ', U'シ', U'ア', U'A', U'B',
                                       U'C',  U'5', U'6', U'7', U'8'};
  BOOST_REQUIRE_EQUAL(glyphs.size(), expected.size());
  BOOST_CHECK(glyphs == expected);
}

BOOST_AUTO_TEST_CASE(TestAgentNameSkipsNonLetters) {
  const RainEvent event("evt-2", 42, RainEventKind::Spawn, "", "r2-d2");
  std::mt19937 rng(3);
  std::vector<char32_t> glyphs;
  appendEventIdentityGlyphs(event, rng, glyphs);

  // Symbol, two katakana, no session, two timestamp digits
  const std::vector<char32_t> expected{U'↕', U'ツ', U'エ', U'4', U'2'};
  BOOST_REQUIRE_EQUAL(glyphs.size(), expected.size());
  BOOST_CHECK(glyphs == expected);
}

BOOST_AUTO_TEST_CASE(TestSessionPunctuationReplaced) {
  const RainEvent event("evt-3", 7, RainEventKind::Generic, "x_-.");
  std::mt19937 rng(11);
  std::vector<char32_t> glyphs;
  appendEventIdentityGlyphs(event, rng, glyphs);

  BOOST_REQUIRE_EQUAL(glyphs.size(), 5);
  BOOST_CHECK(glyphs[1] == U'X');
  const std::u32string allowed = U"ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
  BOOST_CHECK(allowed.find(glyphs[2]) != std::u32string::npos);
  BOOST_CHECK(allowed.find(glyphs[3]) != std::u32string::npos);
  BOOST_CHECK(glyphs[4] == U'7');
}

BOOST_AUTO_TEST_CASE(TestUntimedEventsKeepSymbolOnly) {
  const RainEvent event({}, 0, RainEventKind::Complete, "session-9", "builder");
  std::mt19937 rng(5);
  std::vector<char32_t> glyphs;
  appendEventIdentityGlyphs(event, rng, glyphs);

  BOOST_REQUIRE_EQUAL(glyphs.size(), 1);
  BOOST_CHECK(glyphs[0] == eventKindSymbol(RainEventKind::Complete));
}

BOOST_AUTO_TEST_SUITE_END()
