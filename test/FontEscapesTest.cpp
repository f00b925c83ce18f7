/*
MIT License

Copyright (c) 2020 Christian Greyeyes

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*/

#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "RoffParseImpl.h"

namespace rpm = roff_parseman::impl;
using roff_parseman::Font;
using roff_parseman::FontState;

namespace {
	TEST(RoffPMFonts, SwitchAndReturn) {
		FontState state{};
		EXPECT_EQ(rpm::applyFontEscapes("Hello \\fBworld\\fP!", state, false), "Hello <b>world</b>!");
		EXPECT_EQ(state.current, Font::Roman);
		EXPECT_EQ(state.previous, Font::Bold);
	}

	TEST(RoffPMFonts, PreviousIsTwoTransitionsBack) {
		FontState state{};
		EXPECT_EQ(rpm::applyFontEscapes("\\fIa\\fBb\\fPc", state, true), "<i>a</i><b>b</b><i>c</i>");
		EXPECT_EQ(state, FontState{});
	}

	TEST(RoffPMFonts, StateCarriesAcrossLines) {
		FontState state{};
		EXPECT_EQ(rpm::applyFontEscapes("\\fBone", state, false), "<b>one");
		EXPECT_EQ(state.current, Font::Bold);
		EXPECT_EQ(rpm::applyFontEscapes("two\\fR", state, false), "two</b>");
	}

	TEST(RoffPMFonts, SameFontEmitsNothing) {
		FontState state{};
		EXPECT_EQ(rpm::applyFontEscapes("\\fBa\\fBb", state, true), "<b>ab</b>");
	}

	TEST(RoffPMFonts, LongAndNumericForms) {
		FontState state{};
		EXPECT_EQ(rpm::applyFontEscapes("\\f(CWcode\\fR", state, true), "code");
		EXPECT_EQ(rpm::applyFontEscapes("\\f[B]x\\f[]y", state, true), "<b>x</b>y");
		EXPECT_EQ(rpm::applyFontEscapes("\\f3x\\f1", state, true), "<b>x</b>");
		EXPECT_EQ(rpm::applyFontEscapes("\\f2x", state, true), "<i>x</i>");
	}

	TEST(RoffPMFonts, UnknownFontPassesThrough) {
		FontState state{};
		EXPECT_EQ(rpm::applyFontEscapes("\\fQx", state, true), "\\fQx");
		EXPECT_EQ(rpm::applyFontEscapes("tail\\f", state, true), "tail\\f");
	}

	TEST(RoffPMFonts, CloseFontResets) {
		FontState state{ Font::Italic, Font::Bold };
		EXPECT_EQ(rpm::closeFont(state), "</i>");
		EXPECT_EQ(state, FontState{});
		EXPECT_EQ(rpm::closeFont(state), "");
	}

	TEST(RoffPMFonts, FontMacroJoinsArguments) {
		EXPECT_EQ(rpm::fontMacro('B', { "bold", "text" }), "<b>bold text</b>");
		EXPECT_EQ(rpm::fontMacro('I', { "a<b" }), "<i>a&lt;b</i>");
		EXPECT_EQ(rpm::fontMacro('B', {}), "");
	}

	TEST(RoffPMFonts, AlternatingMacroCyclesFonts) {
		EXPECT_EQ(rpm::alternatingFontMacro("BR", { "ls", "(1)" }), "<b>ls</b>(1)");
		EXPECT_EQ(rpm::alternatingFontMacro("IB", { "a", "b", "c" }), "<i>a</i><b>b</b><i>c</i>");
		EXPECT_EQ(rpm::alternatingFontMacro("RI", { "\\-o", "file" }), "&ndash;o<i>file</i>");
	}
}
