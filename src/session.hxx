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


#ifndef SIMPLEPROMPT_SESSION_HXX_INCLUDED
#define SIMPLEPROMPT_SESSION_HXX_INCLUDED 1

#include <string>
#include <vector>

#include "simpleprompt.hxx"
#include "unicodestring.hxx"
#include "line.hxx"
#include "location.hxx"
#include "pool.hxx"

namespace simpleprompt {

class Renderer;

/*
 * State of one read_line() call: the lines of the edit region,
 * the caret and the multi-line mode.
 */
class Session {
public:
	enum class MODE {
		SINGLELINE,
		DELIMITER,
		LINE_CONTINUATION
	};
	typedef Pool<Line> line_pool_t;
	typedef line_pool_t::item_t line_t;
	typedef std::vector<line_t> lines_t;
private:
	Renderer* _renderer;
	line_pool_t* _linePool;
	SimpleConsole::ReadLineOptions _options;
	UnicodeString _delimiter;
	UnicodeString _continuation;
	UnicodeString _multilinePrompt;
	lines_t _lines;
	Location _location;
	MODE _mode;
	int _firstInputIndex;
	bool _needsRedraw;
public:
	Session( void );
	void initialize( Renderer& renderer_, line_pool_t& linePool_, SimpleConsole::ReadLineOptions const& options_ );
	void release( void );
	void prepare( void );
	bool process_input( SimpleConsole::KeyEvent const& key_, char16_t const* chars_, int count_, std::string& result_ );
	void reset( void );
	void redraw( void );
	void move_to( int top_ );
	void arrange_window( void );
	void reset_rows( void );
	void finish( void );
	void height_changed( int lineIndex_, int diff_ );
	bool try_delete_line( int lineIndex_, bool backspace_ );
	void paint( Line const& line_, int start_, int end_, bool erase_ );
	void paint_row_tail( Line const& line_, int rowIndex_, int from_ );
	void ensure_visible( void );
	void reveal_row( int row_ );
	bool is_length_within_limit( int diff_ ) const;
	int remaining_length( void ) const;
	int input_length( void ) const;
	bool is_empty_input( void ) const;
	MODE mode( void ) const {
		return ( _mode );
	}
	int first_input_index( void ) const {
		return ( _firstInputIndex );
	}
	int line_count( void ) const {
		return ( static_cast<int>( _lines.size() ) );
	}
	Line& line( int index_ ) {
		return ( *_lines[index_] );
	}
	Line const& line( int index_ ) const {
		return ( *_lines[index_] );
	}
	Location& location( void ) {
		return ( _location );
	}
	Renderer& renderer( void ) {
		return ( *_renderer );
	}
	SimpleConsole::ReadLineOptions const& options( void ) const {
		return ( _options );
	}
	int top( void ) const;
	int bottom( void ) const;
	bool needs_redraw( void ) const {
		return ( _needsRedraw );
	}
	void set_needs_redraw( bool needsRedraw_ ) {
		_needsRedraw = needsRedraw_;
	}
private:
	Line& append_line( UnicodeString const& prompt_, bool isInput_ );
	bool ends_with_continuation( UnicodeString const& input_ ) const;
	std::string assemble( bool lineContinuation_ ) const;
	void clear_rows( int from_, int count_ );
	Session( Session const& ) = delete;
	Session& operator = ( Session const& ) = delete;
};

}

#endif
