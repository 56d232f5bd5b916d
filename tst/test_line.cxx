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

#include "line.hxx"
#include "unicodestring.hxx"

using namespace simpleprompt;

namespace {

/* Rows cover the buffer without gaps and only the last one may be partial. */
void check_rows(Line const& line) {
    Line::rows_t const& rows(line.rows());
    BOOST_REQUIRE(!rows.empty());
    BOOST_CHECK_EQUAL(rows.front().start(), 0);
    BOOST_CHECK_EQUAL(rows.back().end(), line.length());
    for (size_t i(0); i < rows.size(); ++i) {
        BOOST_CHECK_LE(rows[i].width(), line.window_width());
        BOOST_CHECK_EQUAL(rows[i].width(), line.width_of(rows[i].start(), rows[i].end()));
        if ((i + 1) < rows.size()) {
            BOOST_CHECK_EQUAL(rows[i].end(), rows[i + 1].start());
            BOOST_CHECK_EQUAL(rows[i].width(), line.window_width());
        }
    }
}

/* Incremental rewrap must agree with wrapping from scratch. */
void check_arrange(Line& line) {
    Line::rows_t incremental(line.rows());
    line.reset_rows();
    BOOST_REQUIRE_EQUAL(incremental.size(), line.rows().size());
    for (size_t i(0); i < incremental.size(); ++i) {
        BOOST_CHECK(incremental[i] == line.rows()[i]);
    }
}

int insert(Line& line, int pos, std::string const& text) {
    UnicodeString units(text);
    bool rowCountChanged(false);
    bool contentMoved(false);
    line.insert(pos, units.get(), units.length(), rowCountChanged, contentMoved);
    return units.length();
}

void remove(Line& line, int pos, int count) {
    int removedWidth(0);
    bool rowCountChanged(false);
    bool contentMoved(false);
    line.remove(pos, count, removedWidth, rowCountChanged, contentMoved);
}

}

BOOST_AUTO_TEST_SUITE(TestLine)

BOOST_AUTO_TEST_CASE(TestPromptOnly) {

    Line line;
    line.initialize(nullptr, 0, UnicodeString(std::string("> ")), true, 10);

    BOOST_CHECK_EQUAL(line.height(), 1);
    BOOST_CHECK_EQUAL(line.prompt_length(), 2);
    BOOST_CHECK_EQUAL(line.input_length(), 0);
    BOOST_CHECK_EQUAL(line.rows()[0].width(), 2);
    BOOST_CHECK_EQUAL(line.rows()[0].input_start(), 2);
}

BOOST_AUTO_TEST_CASE(TestWrapAtWindowWidth) {

    Line line;
    line.initialize(nullptr, 0, UnicodeString(std::string("> ")), true, 10);
    insert(line, 2, "abcdefghijkl");

    BOOST_CHECK_EQUAL(line.length(), 14);
    BOOST_CHECK_EQUAL(line.height(), 2);
    BOOST_CHECK_EQUAL(line.rows()[1].start(), 10);
    BOOST_CHECK_EQUAL(line.rows()[1].width(), 4);
    check_rows(line);
    check_arrange(line);
}

BOOST_AUTO_TEST_CASE(TestFullRowGetsEmptySuccessor) {

    Line line;
    line.initialize(nullptr, 0, UnicodeString(std::string("> ")), true, 10);
    insert(line, 2, "abcdefgh");

    BOOST_REQUIRE_EQUAL(line.height(), 2);
    BOOST_CHECK(line.rows()[1].is_empty());
    BOOST_CHECK_EQUAL(line.rows()[1].start(), 10);
    BOOST_CHECK_EQUAL(line.find_row(10), 1);
    BOOST_CHECK_EQUAL(line.column_of(10), 0);
    check_rows(line);
}

BOOST_AUTO_TEST_CASE(TestInsertInTheMiddlePushesRowsDown) {

    Line line;
    line.initialize(nullptr, 0, UnicodeString(std::string("> ")), true, 10);
    insert(line, 2, "0123456789012345");
    insert(line, 4, "XYZ");

    BOOST_CHECK_EQUAL(line.input().to_utf8(), "01XYZ23456789012345");
    BOOST_CHECK_EQUAL(line.height(), 3);
    check_rows(line);
    check_arrange(line);
}

BOOST_AUTO_TEST_CASE(TestInsertThenRemoveRestoresRows) {

    Line line;
    line.initialize(nullptr, 0, UnicodeString(std::string("$ ")), true, 8);
    insert(line, 2, "abcdefghijklmnopqrstu");
    Line::rows_t before(line.rows());
    int length(line.length());

    int count(insert(line, 7, "\xe4\xb8\xad\xe6\x96\x87xy"));
    check_arrange(line);
    remove(line, 7, count);

    BOOST_CHECK_EQUAL(line.length(), length);
    BOOST_REQUIRE_EQUAL(line.rows().size(), before.size());
    for (size_t i(0); i < before.size(); ++i) {
        BOOST_CHECK(line.rows()[i] == before[i]);
    }
}

BOOST_AUTO_TEST_CASE(TestRemoveAcrossRowBoundary) {

    Line line;
    line.initialize(nullptr, 0, UnicodeString(std::string("> ")), true, 5);
    insert(line, 2, "abcdefghijklm");
    remove(line, 4, 1);
    remove(line, 2, 1);

    BOOST_CHECK_EQUAL(line.input().to_utf8(), "bdefghijklm");
    check_rows(line);
    check_arrange(line);

    remove(line, 2, line.input_length());
    BOOST_CHECK_EQUAL(line.height(), 1);
    BOOST_CHECK_EQUAL(line.length(), 2);
    check_rows(line);
}

BOOST_AUTO_TEST_CASE(TestWideCharacterLeavesGap) {

    Line line;
    line.initialize(nullptr, 0, UnicodeString(std::string("> ")), true, 5);
    insert(line, 2, "ab\xe4\xb8\xad");

    BOOST_REQUIRE_EQUAL(line.height(), 2);
    BOOST_CHECK_EQUAL(line.rows()[0].width(), 4);
    BOOST_CHECK_EQUAL(line.rows()[1].start(), 4);
    BOOST_CHECK_EQUAL(line.rows()[1].width(), 2);
    check_arrange(line);
}

BOOST_AUTO_TEST_CASE(TestSurrogatePairNeverSplit) {

    Line line;
    line.initialize(nullptr, 0, UnicodeString(std::string("> ")), true, 4);
    insert(line, 2, "a\xf0\x9f\x98\x80" "b\xf0\x9f\x98\x80");

    for (Row const& row : line.rows()) {
        if (row.start() > 0 && row.start() < line.length()) {
            BOOST_CHECK(!is_low_surrogate(line.chars()[row.start()]));
        }
    }
    BOOST_CHECK_EQUAL(line.unit_length_at(3), 2);
    BOOST_CHECK_EQUAL(line.unit_length_before(5), 2);
    BOOST_CHECK_EQUAL(line.width_of(3, 5), 2);
    check_arrange(line);
}

BOOST_AUTO_TEST_CASE(TestResizeRewrapsWithoutLoss) {

    Line line;
    line.initialize(nullptr, 0, UnicodeString(), true, 80);
    insert(line, 0, std::string(60, 'x'));
    BOOST_CHECK_EQUAL(line.height(), 1);

    line.set_window_width(40);
    line.reset_rows();

    BOOST_CHECK_EQUAL(line.height(), 2);
    BOOST_CHECK_EQUAL(line.input_length(), 60);
    BOOST_CHECK_EQUAL(line.rows()[0].width(), 40);
    BOOST_CHECK_EQUAL(line.rows()[1].width(), 20);
    check_rows(line);
}

BOOST_AUTO_TEST_CASE(TestGraphemeWiderThanWindow) {

    Line line;
    line.initialize(nullptr, 0, UnicodeString(), true, 1);
    insert(line, 0, "a\xe4\xb8\xad" "b");

    BOOST_REQUIRE_EQUAL(line.height(), 4);
    BOOST_CHECK_EQUAL(line.rows()[1].width(), 2);
    BOOST_CHECK_EQUAL(line.rows()[2].start(), 2);
    BOOST_CHECK(line.rows()[3].is_empty());
    check_arrange(line);
}

BOOST_AUTO_TEST_CASE(TestTrimCursorIndex) {

    Line line;
    line.initialize(nullptr, 0, UnicodeString(std::string("> ")), true, 6);
    insert(line, 2, "abcdefgh");

    BOOST_REQUIRE_EQUAL(line.height(), 2);
    BOOST_CHECK_EQUAL(line.trim_cursor_index(0, 0), 2);
    BOOST_CHECK_EQUAL(line.trim_cursor_index(0, 3), 3);
    BOOST_CHECK_EQUAL(line.trim_cursor_index(0, 10), 5);
    BOOST_CHECK_EQUAL(line.trim_cursor_index(1, 1), 7);
    BOOST_CHECK_EQUAL(line.trim_cursor_index(1, 10), 10);
}

BOOST_AUTO_TEST_CASE(TestClearInputKeepsPrompt) {

    Line line;
    line.initialize(nullptr, 0, UnicodeString(std::string("prompt> ")), true, 5);
    insert(line, 8, "abcdef");
    line.clear_input();

    BOOST_CHECK_EQUAL(line.length(), 8);
    BOOST_CHECK_EQUAL(line.input_length(), 0);
    BOOST_CHECK_EQUAL(line.height(), 2);
    BOOST_CHECK_EQUAL(line.initial_row_index(), 1);
    check_rows(line);
}

BOOST_AUTO_TEST_SUITE_END()
