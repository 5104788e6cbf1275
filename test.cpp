#include "nanoPattern.hpp"
#include "cx.hpp"
#include <cstring>
#include <string>
#include <gtest/gtest.h>

namespace {

using NanoPattern::Character;
using NanoPattern::CharacterClass;
using NanoPattern::InvertedCharacterClass;
using NanoPattern::Match;
using NanoPattern::MatchGroup;
using NanoPattern::Pattern;
using NanoPattern::Wildcard;
using NanoPattern::pattern_exception;

template <typename P>
auto MatchString(const P& pattern, const char* input) {
  return pattern.match(input, input + std::strlen(input));
}

template <typename P>
auto MatchString(const P& pattern, const std::string& input) {
  return pattern.match(input.data(), input.data() + input.size());
}

TEST(MatchGroupTest, Basic) {
  MatchGroup group(5, 10);
  EXPECT_EQ(group.begin, 5u);
  EXPECT_EQ(group.end, 10u);
  EXPECT_EQ(group.length(), 5u);
}

TEST(MatchGroupTest, EmptyRange) {
  MatchGroup group(3, 3);
  EXPECT_EQ(group.length(), 0u);
  EXPECT_EQ(group.text("abcdef"), "");
}

TEST(MatchGroupTest, ShiftedAndText) {
  const char* input = "helloworld";
  MatchGroup group = MatchGroup(0, 5).shifted(5);
  EXPECT_EQ(group, MatchGroup(5, 10));
  EXPECT_EQ(group.text(input), "world");
}

TEST(MatchTest, Empty) {
  auto match = Match<1>::empty();
  EXPECT_EQ(match.bytesConsumed, 0u);
  EXPECT_EQ(match.groupsMatched, 0u);
  EXPECT_FALSE(match.matched());
}

TEST(MatchTest, SingleGroup) {
  const char* input = "hello";
  Match<1> match(5, 1, {MatchGroup(0, 5)});
  EXPECT_EQ(match.bytesConsumed, 5u);
  EXPECT_EQ(match.groupsMatched, 1u);
  EXPECT_TRUE(match.matched());
  EXPECT_EQ(match.text(input, 0), "hello");
}

TEST(MatchTest, MultipleGroups) {
  const char* input = "helloworld";
  Match<2> match(10, 2, {MatchGroup(0, 10), MatchGroup(5, 10)});
  EXPECT_EQ(match.groupsMatched, 2u);
  EXPECT_EQ(match.text(input, 0), "helloworld");
  EXPECT_EQ(match.text(input, 1), "world");
}

TEST(MatchTest, EqualityIgnoresUnusedGroups) {
  Match<3> a(2, 1, {MatchGroup(0, 2), MatchGroup(0, 1), MatchGroup(1, 2)});
  Match<3> b(2, 1, {MatchGroup(0, 2)});
  EXPECT_TRUE(a == b);
  Match<3> c(2, 2, {MatchGroup(0, 2), MatchGroup(1, 2)});
  EXPECT_TRUE(a != c);
}

TEST(WildcardTest, EmptyInput) {
  auto result = MatchString(Wildcard<1>{}, "");
  EXPECT_EQ(result.bytesConsumed, 0u);
  EXPECT_EQ(result.groupsMatched, 0u);
}

TEST(WildcardTest, FirstByteOnly) {
  const char* input = "hello";
  auto result = MatchString(Wildcard<1>{}, input);
  EXPECT_EQ(result.bytesConsumed, 1u);
  EXPECT_EQ(result.groupsMatched, 1u);
  EXPECT_EQ(result.text(input, 0), "h");
}

TEST(WildcardTest, AnyByteValue) {
  for (int c = 0; c < 256; ++c) {
    const char input[1] = {static_cast<char>(c)};
    auto result = Wildcard<1>{}.match(input, input + 1);
    EXPECT_EQ(result.bytesConsumed, 1u) << "byte " << c;
    EXPECT_EQ(result.groups[0], MatchGroup(0, 1));
  }
}

TEST(CharacterTest, EmptyInput) {
  auto result = MatchString(Character<1>('a'), "");
  EXPECT_FALSE(result.matched());
  EXPECT_EQ(result.bytesConsumed, 0u);
}

TEST(CharacterTest, Matching) {
  const char* input = "abc";
  auto result = MatchString(Character<1>('a'), input);
  EXPECT_EQ(result.bytesConsumed, 1u);
  EXPECT_EQ(result.groupsMatched, 1u);
  EXPECT_EQ(result.groups[0], MatchGroup(0, 1));
  EXPECT_EQ(result.text(input, 0), "a");
}

TEST(CharacterTest, Mismatch) {
  auto result = MatchString(Character<1>('x'), "abc");
  EXPECT_EQ(result.bytesConsumed, 0u);
  EXPECT_EQ(result.groupsMatched, 0u);
}

TEST(CharacterTest, OnlyFirstByteIsInspected) {
  EXPECT_FALSE(MatchString(Character<1>('b'), "abc").matched());
}

TEST(CharacterTest, HighAndNulBytes) {
  EXPECT_TRUE(MatchString(Character<1>('\xff'), std::string("\xff\x01")).matched());
  EXPECT_TRUE(MatchString(Character<1>('\0'), std::string("\0a", 2)).matched());
  EXPECT_FALSE(MatchString(Character<1>('\0'), std::string("a\0", 2)).matched());
}

TEST(CharacterClassTest, EmptyInput) {
  EXPECT_FALSE(MatchString(CharacterClass<4>("abc"), "").matched());
}

TEST(CharacterClassTest, Membership) {
  CharacterClass<4> abc("abc");
  EXPECT_EQ(abc.size(), 3u);
  const char* input = "banana";
  auto result = MatchString(abc, input);
  EXPECT_EQ(result.bytesConsumed, 1u);
  EXPECT_EQ(result.groupsMatched, 1u);
  EXPECT_EQ(result.text(input, 0), "b");
  EXPECT_TRUE(MatchString(abc, "apple").matched());
  EXPECT_TRUE(MatchString(abc, "cherry").matched());
  EXPECT_FALSE(MatchString(abc, "date").matched());
}

TEST(CharacterClassTest, Digits) {
  CharacterClass<10> digits("0123456789");
  for (char c = '0'; c <= '9'; ++c) {
    const char input[2] = {c, 'x'};
    EXPECT_EQ(digits.match(input, input + 2).bytesConsumed, 1u);
  }
  EXPECT_FALSE(MatchString(digits, "x9").matched());
}

TEST(CharacterClassTest, SingleByteSet) {
  CharacterClass<1> x("x");
  EXPECT_TRUE(MatchString(x, "xyz").matched());
  EXPECT_FALSE(MatchString(x, "yz").matched());
}

TEST(CharacterClassTest, DuplicateEntries) {
  CharacterClass<4> aab("aab");
  EXPECT_TRUE(MatchString(aab, "a").matched());
  EXPECT_TRUE(MatchString(aab, "b").matched());
  EXPECT_FALSE(MatchString(aab, "c").matched());
}

TEST(CharacterClassTest, ExplicitCountAllowsNul) {
  CharacterClass<2> nulOrA("\0a", 2);
  EXPECT_TRUE(MatchString(nulOrA, std::string("\0", 1)).matched());
  EXPECT_TRUE(MatchString(nulOrA, "a").matched());
  EXPECT_FALSE(MatchString(nulOrA, "b").matched());
}

TEST(CharacterClassTest, RejectsEmptySet) {
  EXPECT_THROW(CharacterClass<4>(""), pattern_exception);
  EXPECT_THROW(CharacterClass<4>("abc", 0), pattern_exception);
  EXPECT_THROW(CharacterClass<4>(nullptr), pattern_exception);
}

TEST(CharacterClassTest, RejectsOverCapacity) {
  EXPECT_THROW(CharacterClass<4>("abcde"), pattern_exception);
  EXPECT_NO_THROW(CharacterClass<5>("abcde"));
}

TEST(InvertedCharacterClassTest, EmptyInput) {
  EXPECT_FALSE(MatchString(InvertedCharacterClass<4>("abc"), "").matched());
  EXPECT_FALSE(MatchString(InvertedCharacterClass<4>(""), "").matched());
}

TEST(InvertedCharacterClassTest, Exclusion) {
  InvertedCharacterClass<4> notAbc("abc");
  const char* input = "xyz";
  auto result = MatchString(notAbc, input);
  EXPECT_EQ(result.bytesConsumed, 1u);
  EXPECT_EQ(result.groupsMatched, 1u);
  EXPECT_EQ(result.text(input, 0), "x");
  EXPECT_FALSE(MatchString(notAbc, "apple").matched());
  EXPECT_FALSE(MatchString(notAbc, "banana").matched());
  EXPECT_FALSE(MatchString(notAbc, "cherry").matched());
}

TEST(InvertedCharacterClassTest, EmptyExclusionMatchesAnything) {
  InvertedCharacterClass<4> anything("");
  EXPECT_EQ(anything.size(), 0u);
  auto result = MatchString(anything, "x");
  EXPECT_EQ(result.bytesConsumed, 1u);
  EXPECT_EQ(result.groupsMatched, 1u);
  for (int c = 0; c < 256; ++c) {
    const char input[1] = {static_cast<char>(c)};
    EXPECT_EQ(anything.match(input, input + 1),
              Wildcard<4>{}.match(input, input + 1));
  }
}

TEST(InvertedCharacterClassTest, NewlineExclusion) {
  InvertedCharacterClass<2> line("\n\r");
  EXPECT_TRUE(MatchString(line, "c 1").matched());
  EXPECT_FALSE(MatchString(line, "\nc").matched());
  EXPECT_FALSE(MatchString(line, "\r\n").matched());
}

TEST(InvertedCharacterClassTest, RejectsOverCapacity) {
  EXPECT_THROW(InvertedCharacterClass<2>("abc"), pattern_exception);
}

TEST(PatternTest, DispatchesToEachLeaf) {
  const Pattern<4> wildcard = Wildcard<4>{};
  const Pattern<4> character = Character<4>('a');
  const Pattern<4> characterClass = CharacterClass<4>("ab");
  const Pattern<4> inverted = InvertedCharacterClass<4>("ab");
  EXPECT_EQ(wildcard.type, Pattern<4>::WILDCARD);
  EXPECT_EQ(character.type, Pattern<4>::CHARACTER);
  EXPECT_EQ(characterClass.type, Pattern<4>::CHARACTER_CLASS);
  EXPECT_EQ(inverted.type, Pattern<4>::INVERTED_CHARACTER_CLASS);

  EXPECT_EQ(MatchString(wildcard, "z").bytesConsumed, 1u);
  EXPECT_EQ(MatchString(character, "abc").bytesConsumed, 1u);
  EXPECT_EQ(MatchString(character, "bc").bytesConsumed, 0u);
  EXPECT_EQ(MatchString(characterClass, "bc").bytesConsumed, 1u);
  EXPECT_EQ(MatchString(characterClass, "cb").bytesConsumed, 0u);
  EXPECT_EQ(MatchString(inverted, "cb").bytesConsumed, 1u);
  EXPECT_EQ(MatchString(inverted, "bc").bytesConsumed, 0u);
}

TEST(PatternTest, LeafCapturesAndNullability) {
  const Pattern<2> character = Character<2>('a');
  const Pattern<2> inverted = InvertedCharacterClass<2>("");
  EXPECT_EQ(character.captures(), 1u);
  EXPECT_EQ(inverted.captures(), 1u);
  EXPECT_FALSE(character.nullable());
  EXPECT_FALSE(inverted.nullable());
}

}  // namespace
