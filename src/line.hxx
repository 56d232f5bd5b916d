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


#ifndef SIMPLEPROMPT_LINE_HXX_INCLUDED
#define SIMPLEPROMPT_LINE_HXX_INCLUDED 1

#include <vector>

#include "simpleprompt.hxx"
#include "unicodestring.hxx"
#include "row.hxx"

namespace simpleprompt {

class Session;

/*
 * Logical line of the edit region: prompt text followed by user input,
 * wrapped into rows of at most window width columns.
 *
 * Surrogate pairs are atomic units, the high surrogate has zero width
 * and the low surrogate carries the width of the whole character.
 */
class Line {
public:
	typedef std::vector<Row> rows_t;
	typedef std::vector<char> char_widths_t;
private:
	Session* _session;
	UnicodeString _buffer;
	char_widths_t _widths;
	rows_t _rows;
	int _promptLength;
	int _index;
	int _top;
	int _windowWidth;
	bool _isInput;
public:
	Line( void );
	void initialize( Session* session_, int index_, UnicodeString const& prompt_, bool isInput_, int windowWidth_ );
	void release( void );

	/* Editing with screen updates, used for the line under the caret. */
	bool process_input( SimpleConsole::KeyEvent const& key_, char16_t const* chars_, int count_ );

	/* Buffer model. */
	int insert( int pos_, char16_t const* text_, int count_, bool& rowCountChanged_, bool& contentMoved_ );
	int remove( int pos_, int count_, int& removedWidth_, bool& rowCountChanged_, bool& contentMoved_ );
	void clear_input( void );
	void set_window_width( int windowWidth_ );
	void reset_rows( void );

	int find_row( int pos_ ) const;
	int column_of( int pos_ ) const;
	int width_of( int from_, int to_ ) const;
	int unit_length_at( int pos_ ) const;
	int unit_length_before( int pos_ ) const;
	int initial_row_index( void ) const;
	int trim_cursor_index( int rowIndex_, int column_ ) const;
	UnicodeString input( void ) const;

	char16_t const* chars( void ) const {
		return ( _buffer.get() );
	}
	char const* widths( void ) const {
		return ( _widths.data() );
	}
	rows_t const& rows( void ) const {
		return ( _rows );
	}
	int length( void ) const {
		return ( _buffer.length() );
	}
	int prompt_length( void ) const {
		return ( _promptLength );
	}
	int input_length( void ) const {
		return ( _buffer.length() - _promptLength );
	}
	int height( void ) const {
		return ( static_cast<int>( _rows.size() ) );
	}
	int top( void ) const {
		return ( _top );
	}
	void set_top( int top_ ) {
		_top = top_;
	}
	int index( void ) const {
		return ( _index );
	}
	void set_index( int index_ ) {
		_index = index_;
	}
	bool is_input( void ) const {
		return ( _isInput );
	}
	int window_width( void ) const {
		return ( _windowWidth );
	}
private:
	void arrange( int rowIndex_, bool& rowCountChanged_, bool& contentMoved_ );
	void update_input_starts( void );
	bool fits( Row const& row_, int width_ ) const;
	void insert_at_caret( char16_t const* text_, int count_ );
	void remove_at( int pos_, int count_ );
	void backspace( void );
	void delete_character( void );
	void kill_input( void );
	void repaint( int pos_, int rowIndex_, int oldHeight_, bool moved_ );
	Line( Line const& ) = delete;
	Line& operator = ( Line const& ) = delete;
};

}

#endif
