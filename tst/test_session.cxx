/*
 * Copyright (c) 2017-2018, Marcin Konarski (amok at codestation.org)
 *
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 *   * Redistributions of source code must retain the above copyright notice,
 *     this list of conditions and the following disclaimer.
 *   * Redistributions in binary form must reproduce the above copyright
 *     notice, this list of conditions and the following disclaimer in the
 *     documentation and/or other materials provided with the distribution.
 *   * Neither the name of Redis nor the names of its contributors may be used
 *     to endorse or promote products derived from this software without
 *     specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 * AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 * IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
 * ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER OR CONTRIBUTORS BE
 * LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 * CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 * SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 * INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 * CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 * ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 * POSSIBILITY OF SUCH DAMAGE.
 */


#define BOOST_TEST_DYN_LINK

#include <boost/test/unit_test.hpp>
#include <string>

#include "session.hxx"
#include "renderer.hxx"
#include "unicodestring.hxx"
#include "fake_terminal.hxx"

using namespace simpleprompt;

typedef SimpleConsole::KEY KEY;
typedef SimpleConsole::KeyEvent KeyEvent;
typedef SimpleConsole::ReadLineOptions ReadLineOptions;

namespace {

struct SessionFixture {
    FakeTerminal terminal;
    Renderer renderer;
    Session::line_pool_t pool;
    Session session;
    std::string result;

    SessionFixture()
        : terminal(20, 10)
        , renderer(terminal)
        , pool()
        , session()
        , result() {
    }
    ~SessionFixture() {
        session.release();
    }
    void open(ReadLineOptions const& options) {
        renderer.update_window_size();
        renderer.sync_cursor_position();
        session.initialize(renderer, pool, options);
        session.prepare();
        renderer.commit();
    }
    bool type(std::string const& text) {
        UnicodeString units(text);
        bool submitted(session.process_input(KeyEvent::character(units[units.length() - 1]), units.get(), units.length(), result));
        renderer.commit();
        return submitted;
    }
    bool press(KEY key) {
        bool submitted(session.process_input(KeyEvent(key), nullptr, 0, result));
        renderer.commit();
        return submitted;
    }
    std::string input(int lineIndex) {
        return session.line(lineIndex).input().to_utf8();
    }
};

}

BOOST_FIXTURE_TEST_SUITE(TestSession, SessionFixture)

BOOST_AUTO_TEST_CASE(TestSingleLine) {

    open(ReadLineOptions::single_line());
    type("hello");

    BOOST_CHECK_EQUAL(terminal.row(0), "> hello");
    BOOST_CHECK(press(KEY::ENTER));
    BOOST_CHECK_EQUAL(result, "hello");
    BOOST_CHECK_EQUAL(session.line_count(), 1);
}

BOOST_AUTO_TEST_CASE(TestDelimiterKeptVerbatim) {

    open(ReadLineOptions());
    type("\"\"\"abc");

    BOOST_CHECK(!press(KEY::ENTER));
    BOOST_CHECK(session.mode() == Session::MODE::DELIMITER);
    BOOST_CHECK_EQUAL(session.line_count(), 2);
    BOOST_CHECK_EQUAL(session.location().line_index(), 1);

    type("plain");
    BOOST_CHECK(!press(KEY::ENTER));
    BOOST_CHECK_EQUAL(session.line_count(), 3);

    type("def\"\"\"");
    BOOST_CHECK(press(KEY::ENTER));
    BOOST_CHECK_EQUAL(result, "\"\"\"abc\nplain\ndef\"\"\"");
    BOOST_CHECK_EQUAL(terminal.row(1), "# plain");
}

BOOST_AUTO_TEST_CASE(TestBalancedDelimiterOnOneLine) {

    open(ReadLineOptions());
    type("\"\"\"x\"\"\"");

    BOOST_CHECK(press(KEY::ENTER));
    BOOST_CHECK_EQUAL(result, "\"\"\"x\"\"\"");
}

BOOST_AUTO_TEST_CASE(TestLineContinuationStitching) {

    open(ReadLineOptions::multi_line());
    type("A\\");
    BOOST_CHECK(!press(KEY::ENTER));
    BOOST_CHECK(session.mode() == Session::MODE::LINE_CONTINUATION);
    type("B\\");
    BOOST_CHECK(!press(KEY::ENTER));
    type("C");

    BOOST_CHECK(press(KEY::ENTER));
    BOOST_CHECK_EQUAL(result, "ABC");
    BOOST_CHECK_EQUAL(session.line_count(), 3);
    BOOST_CHECK(session.mode() == Session::MODE::SINGLELINE);
}

BOOST_AUTO_TEST_CASE(TestEditPreviousLine) {

    open(ReadLineOptions::multi_line());
    type("ab\\");
    press(KEY::ENTER);
    type("cd");
    press(KEY::UP);

    BOOST_CHECK_EQUAL(session.location().line_index(), 0);
    type("X");
    BOOST_CHECK_EQUAL(input(0), "abX\\");

    BOOST_CHECK(!press(KEY::ENTER));
    BOOST_CHECK_EQUAL(session.location().line_index(), 1);
    BOOST_CHECK_EQUAL(session.line_count(), 2);

    BOOST_CHECK(press(KEY::ENTER));
    BOOST_CHECK_EQUAL(result, "abXcd");
}

BOOST_AUTO_TEST_CASE(TestLengthCap) {

    ReadLineOptions options(ReadLineOptions::single_line());
    options.maxInputLength = 5;
    open(options);
    type("abcdef");

    BOOST_CHECK_EQUAL(session.input_length(), 5);
    BOOST_CHECK_EQUAL(session.remaining_length(), 0);
    type("g");
    BOOST_CHECK_EQUAL(input(0), "abcde");
    BOOST_CHECK(press(KEY::ENTER));
    BOOST_CHECK_EQUAL(result, "abcde");
}

BOOST_AUTO_TEST_CASE(TestLengthCapStopsNewLines) {

    ReadLineOptions options(ReadLineOptions::multi_line());
    options.maxInputLength = 3;
    open(options);
    type("ab\\");

    BOOST_CHECK(!press(KEY::ENTER));
    BOOST_CHECK_EQUAL(session.line_count(), 1);
    BOOST_CHECK_EQUAL(input(0), "ab\\");
}

BOOST_AUTO_TEST_CASE(TestEmptyInputRejected) {

    open(ReadLineOptions::single_line());

    BOOST_CHECK(!press(KEY::ENTER));
    BOOST_CHECK_EQUAL(session.line_count(), 1);
    BOOST_CHECK(session.is_empty_input());
    BOOST_CHECK_EQUAL(session.location().array_position(), 2);
    BOOST_CHECK(result.empty());
}

BOOST_AUTO_TEST_CASE(TestEmptyInputAllowed) {

    ReadLineOptions options(ReadLineOptions::single_line());
    options.allowEmptyLineInput = true;
    open(options);

    BOOST_CHECK(press(KEY::ENTER));
    BOOST_CHECK(result.empty());
}

BOOST_AUTO_TEST_CASE(TestBackspaceDeletesEmptyLine) {

    open(ReadLineOptions::multi_line());
    type("A\\");
    press(KEY::ENTER);
    BOOST_REQUIRE_EQUAL(session.line_count(), 2);

    press(KEY::BACKSPACE);

    BOOST_CHECK_EQUAL(session.line_count(), 1);
    BOOST_CHECK(session.mode() == Session::MODE::SINGLELINE);
    BOOST_CHECK_EQUAL(session.location().line_index(), 0);
    BOOST_CHECK_EQUAL(session.location().array_position(), session.line(0).length());
    BOOST_CHECK_EQUAL(terminal.row(1), "");

    press(KEY::BACKSPACE);
    BOOST_CHECK(press(KEY::ENTER));
    BOOST_CHECK_EQUAL(result, "A");
}

BOOST_AUTO_TEST_CASE(TestDeleteOnEmptyLastLine) {

    open(ReadLineOptions::multi_line());
    type("A\\");
    press(KEY::ENTER);
    BOOST_REQUIRE_EQUAL(session.line_count(), 2);

    press(KEY::DELETE);

    BOOST_CHECK_EQUAL(session.line_count(), 1);
    BOOST_CHECK_EQUAL(session.location().line_index(), 0);
    BOOST_CHECK_EQUAL(session.location().array_position(), session.line(0).length());
    BOOST_CHECK(!session.try_delete_line(0, false));
}

BOOST_AUTO_TEST_CASE(TestResetAfterRejection) {

    open(ReadLineOptions::multi_line());
    type("one\\");
    press(KEY::ENTER);
    type("two");
    BOOST_REQUIRE_EQUAL(session.line_count(), 2);

    session.reset();
    renderer.commit();

    BOOST_CHECK_EQUAL(session.line_count(), 1);
    BOOST_CHECK(session.is_empty_input());
    BOOST_CHECK(session.mode() == Session::MODE::SINGLELINE);
    BOOST_CHECK_EQUAL(terminal.row(0), ">");
    BOOST_CHECK_EQUAL(terminal.row(1), "");

    type("three");
    BOOST_CHECK(press(KEY::ENTER));
    BOOST_CHECK_EQUAL(result, "three");
}

BOOST_AUTO_TEST_CASE(TestMultiLinePrompt) {

    ReadLineOptions options(ReadLineOptions::single_line());
    options.prompt = "\x1b[1mTitle\x1b[0m\r\n$ ";
    open(options);

    BOOST_CHECK_EQUAL(session.line_count(), 2);
    BOOST_CHECK_EQUAL(session.first_input_index(), 1);
    BOOST_CHECK_EQUAL(terminal.row(0), "Title");

    type("x");
    BOOST_CHECK_EQUAL(terminal.row(1), "$ x");
    BOOST_CHECK(press(KEY::ENTER));
    BOOST_CHECK_EQUAL(result, "x");
}

BOOST_AUTO_TEST_CASE(TestMaskedInputNeverShown) {

    ReadLineOptions options(ReadLineOptions::single_line());
    options.maskingCharacter = U'*';
    open(options);
    terminal.clear_output();
    type("pw");

    BOOST_CHECK_EQUAL(terminal.row(0), "> **");
    BOOST_CHECK_EQUAL(terminal.output().find("pw"), std::string::npos);
    BOOST_CHECK_EQUAL(terminal.output().find('p'), std::string::npos);

    press(KEY::LEFT);
    type("q");
    BOOST_CHECK_EQUAL(terminal.row(0), "> ***");
    BOOST_CHECK(press(KEY::ENTER));
    BOOST_CHECK_EQUAL(result, "pqw");
}

BOOST_AUTO_TEST_CASE(TestWrappedInputOnScreen) {

    open(ReadLineOptions::single_line());
    type("abcdefghijklmnopqrstuvwxyz");

    BOOST_CHECK_EQUAL(terminal.row(0), "> abcdefghijklmnopqr");
    BOOST_CHECK_EQUAL(terminal.row(1), "stuvwxyz");
    BOOST_CHECK_EQUAL(terminal.cursor_top(), 1);
    BOOST_CHECK_EQUAL(terminal.cursor_left(), 8);

    press(KEY::HOME);
    press(KEY::DELETE);
    BOOST_CHECK_EQUAL(terminal.row(0), "> bcdefghijklmnopqrs");
    BOOST_CHECK_EQUAL(terminal.row(1), "tuvwxyz");
    BOOST_CHECK_EQUAL(terminal.cursor_top(), 0);
    BOOST_CHECK_EQUAL(terminal.cursor_left(), 2);
}

BOOST_AUTO_TEST_CASE(TestKillInput) {

    open(ReadLineOptions::single_line());
    type("abcdefghijklmnopqrstuvwxyz");
    session.process_input(KeyEvent::control('U'), nullptr, 0, result);
    renderer.commit();

    BOOST_CHECK(session.is_empty_input());
    BOOST_CHECK_EQUAL(terminal.row(0), ">");
    BOOST_CHECK_EQUAL(terminal.row(1), "");
}

BOOST_AUTO_TEST_CASE(TestCaretSkipsSurrogatePair) {

    open(ReadLineOptions::single_line());
    type("a\xf0\x9f\x98\x80" "b");
    Location& caret(session.location());
    BOOST_CHECK_EQUAL(session.line(0).length(), 6);
    BOOST_CHECK_EQUAL(session.line(0).width_of(0, session.line(0).length()), 6);
    BOOST_CHECK_EQUAL(caret.cursor_position(), 6);

    press(KEY::LEFT);
    BOOST_CHECK_EQUAL(caret.array_position(), 5);
    BOOST_CHECK_EQUAL(caret.cursor_position(), 5);
    press(KEY::LEFT);
    BOOST_CHECK_EQUAL(caret.array_position(), 3);
    BOOST_CHECK_EQUAL(caret.cursor_position(), 3);
    press(KEY::RIGHT);
    BOOST_CHECK_EQUAL(caret.array_position(), 5);
    press(KEY::LEFT);

    press(KEY::DELETE);
    BOOST_CHECK_EQUAL(input(0), "ab");
    BOOST_CHECK_EQUAL(session.line(0).length(), 4);
    BOOST_CHECK_EQUAL(session.line(0).width_of(0, session.line(0).length()), 4);
    BOOST_CHECK_EQUAL(caret.array_position(), 3);
    BOOST_CHECK_EQUAL(caret.cursor_position(), 3);

    type("\xf0\x9f\x98\x80");
    BOOST_CHECK_EQUAL(caret.array_position(), 5);
    BOOST_CHECK_EQUAL(caret.cursor_position(), 5);
    press(KEY::BACKSPACE);
    BOOST_CHECK_EQUAL(input(0), "ab");
    BOOST_CHECK_EQUAL(caret.array_position(), 3);
    BOOST_CHECK_EQUAL(terminal.cursor_left(), 3);
}

BOOST_AUTO_TEST_CASE(TestCaretCrossesRowBoundary) {

    open(ReadLineOptions::single_line());
    type("abcdefghijklmnopqrst");
    Location& caret(session.location());
    BOOST_CHECK_EQUAL(caret.row_index(), 1);
    BOOST_CHECK_EQUAL(caret.cursor_position(), 2);

    press(KEY::LEFT);
    press(KEY::LEFT);
    BOOST_CHECK_EQUAL(caret.array_position(), 20);
    BOOST_CHECK_EQUAL(caret.row_index(), 1);
    BOOST_CHECK_EQUAL(caret.cursor_position(), 0);

    press(KEY::LEFT);
    BOOST_CHECK_EQUAL(caret.array_position(), 19);
    BOOST_CHECK_EQUAL(caret.row_index(), 0);
    BOOST_CHECK_EQUAL(caret.cursor_position(), 19);
    BOOST_CHECK_EQUAL(terminal.cursor_top(), 0);
    BOOST_CHECK_EQUAL(terminal.cursor_left(), 19);

    press(KEY::RIGHT);
    BOOST_CHECK_EQUAL(caret.row_index(), 1);
    BOOST_CHECK_EQUAL(caret.cursor_position(), 0);
    BOOST_CHECK_EQUAL(terminal.cursor_top(), 1);
    BOOST_CHECK_EQUAL(terminal.cursor_left(), 0);
}

BOOST_AUTO_TEST_CASE(TestLeftRightStayOnLine) {

    open(ReadLineOptions::multi_line());
    type("A\\");
    press(KEY::ENTER);
    type("B");
    press(KEY::HOME);
    Location& caret(session.location());

    press(KEY::LEFT);
    BOOST_CHECK_EQUAL(caret.line_index(), 1);
    BOOST_CHECK_EQUAL(caret.array_position(), session.line(1).prompt_length());

    press(KEY::UP);
    press(KEY::END);
    press(KEY::RIGHT);
    BOOST_CHECK_EQUAL(caret.line_index(), 0);
    BOOST_CHECK_EQUAL(caret.array_position(), session.line(0).length());
}

BOOST_AUTO_TEST_CASE(TestOverflowScrollsAndUpRevealsHiddenLine) {

    terminal.set_size(20, 3);
    open(ReadLineOptions::multi_line());
    type("A\\");
    press(KEY::ENTER);
    type("B\\");
    press(KEY::ENTER);
    type("C\\");
    press(KEY::ENTER);
    type("D");

    BOOST_CHECK_EQUAL(session.line(0).top(), -1);
    BOOST_CHECK_EQUAL(session.line(3).top(), 2);
    BOOST_CHECK_EQUAL(terminal.row(0), "# B\\");
    BOOST_CHECK_EQUAL(terminal.row(2), "# D");

    press(KEY::UP);
    press(KEY::UP);
    press(KEY::UP);
    BOOST_CHECK_EQUAL(session.location().line_index(), 0);
    BOOST_CHECK_EQUAL(session.line(0).top(), 0);
    BOOST_CHECK_EQUAL(session.line(3).top(), 3);
    BOOST_CHECK_EQUAL(terminal.row(0), "> A\\");
    BOOST_CHECK_EQUAL(terminal.cursor_top(), 0);

    type("x");
    BOOST_CHECK_EQUAL(terminal.row(0), "> Ax\\");

    press(KEY::DOWN);
    press(KEY::DOWN);
    press(KEY::DOWN);
    BOOST_CHECK_EQUAL(session.line(3).top(), 2);
    BOOST_CHECK_EQUAL(terminal.row(2), "# D");
    BOOST_CHECK_EQUAL(terminal.cursor_top(), 2);

    BOOST_CHECK(press(KEY::ENTER));
    BOOST_CHECK_EQUAL(result, "AxBCD");
}

BOOST_AUTO_TEST_SUITE_END()
