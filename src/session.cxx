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


#include <algorithm>

#include "session.hxx"
#include "renderer.hxx"
#include "prompt.hxx"
#include "conversion.hxx"
#include "log.hxx"

namespace simpleprompt {

Session::Session( void )
	: _renderer( nullptr )
	, _linePool( nullptr )
	, _options()
	, _delimiter()
	, _continuation()
	, _multilinePrompt()
	, _lines()
	, _location()
	, _mode( MODE::SINGLELINE )
	, _firstInputIndex( 0 )
	, _needsRedraw( false ) {
}

void Session::initialize( Renderer& renderer_, line_pool_t& linePool_, SimpleConsole::ReadLineOptions const& options_ ) {
	_renderer = &renderer_;
	_linePool = &linePool_;
	_options = options_;
	_delimiter.assign( options_.multilineDelimiter );
	_continuation.clear();
	if ( options_.lineContinuation != 0 ) {
		_continuation.assign( code_point_to_utf8( options_.lineContinuation ) );
	}
	prompt_lines_t multilinePrompt( split_prompt( options_.multilinePrompt ) );
	_multilinePrompt = multilinePrompt.back();
	_mode = MODE::SINGLELINE;
	_firstInputIndex = 0;
	_needsRedraw = false;
	_location.attach( this );
}

void Session::release( void ) {
	for ( line_t& line : _lines ) {
		_linePool->give_back( std::move( line ) );
	}
	_lines.clear();
	_options = SimpleConsole::ReadLineOptions();
	_location.attach( nullptr );
	_renderer = nullptr;
	_linePool = nullptr;
	_mode = MODE::SINGLELINE;
	_firstInputIndex = 0;
	_needsRedraw = false;
}

Line& Session::append_line( UnicodeString const& prompt_, bool isInput_ ) {
	line_t line( _linePool->rent() );
	line->initialize( this, line_count(), prompt_, isInput_, _renderer->window_width() );
	_lines.push_back( std::move( line ) );
	return ( *_lines.back() );
}

/*
 * Lay out prompt lines below the current cursor position,
 * the last prompt line is the first input line.
 */
void Session::prepare( void ) {
	prompt_lines_t promptLines( split_prompt( _options.prompt ) );
	int top( std::max( 0, _renderer->cursor_top() ) );
	int const count( static_cast<int>( promptLines.size() ) );
	for ( int i( 0 ); i < count; ++ i ) {
		Line& line( append_line( promptLines[i], i == ( count - 1 ) ) );
		line.set_top( top );
		top += line.height();
	}
	_firstInputIndex = count - 1;
	_mode = MODE::SINGLELINE;
	ensure_visible();
	redraw();
	_location.reset();
	_location.set_cursor();
}

int Session::top( void ) const {
	return ( _lines.empty() ? 0 : _lines.front()->top() );
}

int Session::bottom( void ) const {
	if ( _lines.empty() ) {
		return ( 0 );
	}
	Line const& last( *_lines.back() );
	return ( last.top() + last.height() );
}

void Session::ensure_visible( void ) {
	int overflow( bottom() - _renderer->window_height() );
	if ( overflow <= 0 ) {
		return;
	}
	_renderer->scroll( overflow );
	for ( line_t& line : _lines ) {
		line->set_top( line->top() - overflow );
	}
}

/*
 * Shift the region so that given screen row lands inside the window
 * and repaint it, rows scrolled off the terminal are drawn again.
 */
void Session::reveal_row( int row_ ) {
	int shift( 0 );
	if ( row_ < 0 ) {
		shift = -row_;
	} else if ( row_ >= _renderer->window_height() ) {
		shift = _renderer->window_height() - 1 - row_;
	}
	if ( shift == 0 ) {
		return;
	}
	for ( line_t& line : _lines ) {
		line->set_top( line->top() + shift );
	}
	_renderer->set_cursor_position( 0, std::max( 0, top() ) );
	_renderer->erase_below();
	redraw();
	log_debug( "region shifted by %d rows", shift );
}

void Session::paint( Line const& line_, int start_, int end_, bool erase_ ) {
	_renderer->write_line( line_, _options, start_, end_, erase_ );
}

void Session::paint_row_tail( Line const& line_, int rowIndex_, int from_ ) {
	_renderer->write_row_tail( line_, _options, rowIndex_, from_ );
}

void Session::clear_rows( int from_, int count_ ) {
	for ( int i( 0 ); i < count_; ++ i ) {
		_renderer->clear_row( from_ + i );
	}
}

void Session::redraw( void ) {
	for ( line_t& line : _lines ) {
		paint( *line, 0, line->length(), true );
	}
}

/*
 * Place the whole region at given top row and paint it.
 */
void Session::move_to( int top_ ) {
	int top( std::max( 0, top_ ) );
	for ( line_t& line : _lines ) {
		line->set_top( top );
		top += line->height();
	}
	ensure_visible();
	redraw();
	_location.locate();
	_location.set_cursor();
	_needsRedraw = false;
}

/*
 * Window was resized: rewrap every line and repaint from a sane top row.
 */
void Session::arrange_window( void ) {
	int top( std::max( 0, std::min( this->top(), _renderer->window_height() - 1 ) ) );
	_renderer->set_cursor_position( 0, top );
	_renderer->erase_below();
	reset_rows();
	move_to( top );
}

void Session::reset_rows( void ) {
	for ( line_t& line : _lines ) {
		line->set_window_width( _renderer->window_width() );
		line->reset_rows();
	}
	_location.locate();
}

/*
 * Leave the cursor on a fresh row below the region.
 */
void Session::finish( void ) {
	if ( _lines.empty() ) {
		return;
	}
	if ( bottom() > _renderer->window_height() ) {
		reveal_row( bottom() - 1 );
	}
	Line const& last( *_lines.back() );
	_renderer->set_cursor_position( last.rows().back().width(), last.top() + last.height() - 1 );
	_renderer->new_line();
}

void Session::height_changed( int lineIndex_, int diff_ ) {
	int const count( line_count() );
	for ( int i( lineIndex_ + 1 ); i < count; ++ i ) {
		_lines[i]->set_top( _lines[i]->top() + diff_ );
	}
	ensure_visible();
	for ( int i( lineIndex_ + 1 ); i < count; ++ i ) {
		paint( *_lines[i], 0, _lines[i]->length(), true );
	}
	if ( diff_ < 0 ) {
		clear_rows( bottom(), -diff_ );
	}
}

/*
 * Remove an empty continuation line, caret goes to the end of the previous line
 * for backspace and to the start of the following line for delete.
 */
bool Session::try_delete_line( int lineIndex_, bool backspace_ ) {
	if ( ( lineIndex_ <= _firstInputIndex ) || ( lineIndex_ >= line_count() ) ) {
		return ( false );
	}
	line_t removed( std::move( _lines[lineIndex_] ) );
	_lines.erase( _lines.begin() + lineIndex_ );
	int diff( -removed->height() );
	_linePool->give_back( std::move( removed ) );
	int const count( line_count() );
	for ( int i( lineIndex_ ); i < count; ++ i ) {
		Line& line( *_lines[i] );
		line.set_index( i );
		line.set_top( line.top() + diff );
		paint( line, 0, line.length(), true );
	}
	clear_rows( bottom(), -diff );
	int target( lineIndex_ );
	bool end( backspace_ );
	if ( backspace_ ) {
		-- target;
	} else if ( target > ( count - 1 ) ) {
		target = count - 1;
		end = true;
	}
	if ( count <= ( _firstInputIndex + 1 ) ) {
		_mode = MODE::SINGLELINE;
	}
	_location.reset( *_lines[target], end );
	_location.set_cursor();
	return ( true );
}

int Session::input_length( void ) const {
	int length( 0 );
	bool first( true );
	for ( line_t const& line : _lines ) {
		if ( ! line->is_input() ) {
			continue;
		}
		if ( ! first ) {
			++ length;
		}
		first = false;
		length += line->input_length();
	}
	return ( length );
}

bool Session::is_length_within_limit( int diff_ ) const {
	return ( ( input_length() + diff_ ) <= _options.maxInputLength );
}

int Session::remaining_length( void ) const {
	return ( std::max( 0, _options.maxInputLength - input_length() ) );
}

bool Session::is_empty_input( void ) const {
	for ( line_t const& line : _lines ) {
		if ( line->input_length() > 0 ) {
			return ( false );
		}
	}
	return ( true );
}

bool Session::ends_with_continuation( UnicodeString const& input_ ) const {
	return ( ! _continuation.is_empty() && input_.ends_with( _continuation ) );
}

/*
 * Returns true when input is complete, assembled text is stored in result_.
 */
bool Session::process_input( SimpleConsole::KeyEvent const& key_, char16_t const* chars_, int count_, std::string& result_ ) {
	if ( _location.line_index() >= line_count() ) {
		return ( false );
	}
	Line& line( *_lines[_location.line_index()] );
	if ( ! line.process_input( key_, chars_, count_ ) ) {
		return ( false );
	}
	UnicodeString input( line.input() );
	if ( ! _delimiter.is_empty() && ( ( input.count( _delimiter ) % 2 ) != 0 ) ) {
		_mode = ( line.index() == _firstInputIndex ) ? MODE::DELIMITER : MODE::SINGLELINE;
	}
	bool lineContinuation( false );
	if ( _mode == MODE::SINGLELINE ) {
		if ( ends_with_continuation( input ) ) {
			_mode = MODE::LINE_CONTINUATION;
		}
	} else if ( _mode == MODE::LINE_CONTINUATION ) {
		if ( ! ends_with_continuation( input ) ) {
			lineContinuation = true;
			_mode = MODE::SINGLELINE;
		}
	}
	if ( _mode != MODE::SINGLELINE ) {
		if ( line.index() == ( line_count() - 1 ) ) {
			if ( ( line.input_length() == 0 ) || ! is_length_within_limit( 1 ) ) {
				return ( false );
			}
			int top( line.top() + line.height() );
			Line& next( append_line( _multilinePrompt, true ) );
			next.set_top( top );
			ensure_visible();
			paint( next, 0, next.length(), true );
			_location.reset( next, false );
			_location.set_cursor();
		} else {
			_location.change_line( 1 );
		}
		return ( false );
	}
	result_ = assemble( lineContinuation );
	return ( true );
}

std::string Session::assemble( bool lineContinuation_ ) const {
	UnicodeString text;
	int const count( line_count() );
	for ( int i( _firstInputIndex ); i < count; ++ i ) {
		UnicodeString input( _lines[i]->input() );
		if ( lineContinuation_ ) {
			if ( ( i < ( count - 1 ) ) && ends_with_continuation( input ) ) {
				input.resize( input.length() - _continuation.length() );
			}
		} else if ( i > _firstInputIndex ) {
			text.push_back( u'\n' );
		}
		text.append( input );
	}
	return ( text.to_utf8() );
}

/*
 * Back to a single empty input line, used when submitted text was rejected.
 */
void Session::reset( void ) {
	int oldBottom( bottom() );
	_mode = MODE::SINGLELINE;
	while ( line_count() > ( _firstInputIndex + 1 ) ) {
		_linePool->give_back( std::move( _lines.back() ) );
		_lines.pop_back();
	}
	Line& first( *_lines[_firstInputIndex] );
	first.clear_input();
	paint( first, 0, first.length(), true );
	clear_rows( bottom(), oldBottom - bottom() );
	_location.reset();
	_location.set_cursor();
	log_debug( "input rejected, session reset" );
}

}
