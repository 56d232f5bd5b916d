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


#ifndef SIMPLEPROMPT_RENDERER_HXX_INCLUDED
#define SIMPLEPROMPT_RENDERER_HXX_INCLUDED 1

#include <string>

#include "simpleprompt.hxx"
#include "escape.hxx"
#include "utf8string.hxx"

namespace simpleprompt {

class Terminal;
class Line;

/*
 * Accumulates terminal output for one update and keeps track
 * of where the terminal cursor is.
 *
 * Cursor coordinates are zero based, -1 means unknown.
 * Left equal to window width means the terminal is in pending wrap state
 * after filling a whole row.
 */
class Renderer {
public:
	static int const BUFFER_SIZE = 64 * 1024;
private:
	Terminal& _terminal;
	EscapeBuffer _buffer;
	Utf8String _utf8;
	int _windowWidth;
	int _windowHeight;
	int _cursorLeft;
	int _cursorTop;
	bool _cursorHidden;
public:
	explicit Renderer( Terminal& terminal_ );
	bool update_window_size( void );
	void sync_cursor_position( void );
	int window_width( void ) const {
		return ( _windowWidth );
	}
	int window_height( void ) const {
		return ( _windowHeight );
	}
	int cursor_left( void ) const {
		return ( _cursorLeft );
	}
	int cursor_top( void ) const {
		return ( _cursorTop );
	}
	void hide_cursor( void );
	void set_cursor_position( int left_, int top_ );
	void erase_to_end_of_line( void );
	void clear_row( int row_ );
	void erase_below( void );
	void scroll( int count_ );
	void new_line( void );
	void write_line( Line const& line_, SimpleConsole::ReadLineOptions const& options_, int start_, int end_, bool erase_ );
	void write_row_tail( Line const& line_, SimpleConsole::ReadLineOptions const& options_, int rowIndex_, int from_ );
	void write_text( std::string const& text_ );
	void commit( void );
private:
	void append( char const* str_ );
	void append( char const* data_, int size_ );
	void append_repeated( char const* data_, int size_, int count_ );
	void flush( void );
	void write_span( Line const& line_, SimpleConsole::ReadLineOptions const& options_, std::string const& mask_, int from_, int to_ );
	void advance( int width_ );
	Renderer( Renderer const& ) = delete;
	Renderer& operator = ( Renderer const& ) = delete;
};

}

#endif
