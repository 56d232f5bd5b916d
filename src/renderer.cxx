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
#include <stdexcept>
#include <vector>
#include <cstring>

#include "renderer.hxx"
#include "io.hxx"
#include "line.hxx"
#include "prompt.hxx"
#include "conversion.hxx"
#include "util.hxx"
#include "log.hxx"

namespace simpleprompt {

Renderer::Renderer( Terminal& terminal_ )
	: _terminal( terminal_ )
	, _buffer( BUFFER_SIZE )
	, _utf8()
	, _windowWidth( Terminal::DEFAULT_COLUMNS )
	, _windowHeight( Terminal::DEFAULT_ROWS )
	, _cursorLeft( -1 )
	, _cursorTop( -1 )
	, _cursorHidden( false ) {
}

bool Renderer::update_window_size( void ) {
	int width( std::max( 1, _terminal.get_screen_columns() ) );
	int height( std::max( 1, _terminal.get_screen_rows() ) );
	if ( ( width == _windowWidth ) && ( height == _windowHeight ) ) {
		return ( false );
	}
	log_debug( "window size %dx%d -> %dx%d", _windowWidth, _windowHeight, width, height );
	_windowWidth = width;
	_windowHeight = height;
	return ( true );
}

/*
 * Start of a new edit region: ask the terminal where the cursor is,
 * when it does not answer continue on a fresh bottom row.
 */
void Renderer::sync_cursor_position( void ) {
	flush();
	int left( 0 );
	int top( 0 );
	if ( _terminal.get_cursor_position( left, top ) ) {
		_cursorLeft = std::max( 0, std::min( left, _windowWidth - 1 ) );
		_cursorTop = std::max( 0, std::min( top, _windowHeight - 1 ) );
	} else if ( ( _cursorLeft < 0 ) || ( _cursorTop < 0 ) ) {
		scroll( 1 );
	}
	if ( _cursorLeft > 0 ) {
		new_line();
	}
}

void Renderer::hide_cursor( void ) {
	if ( ! _cursorHidden ) {
		append( ansi::HIDE_CURSOR );
		_cursorHidden = true;
	}
}

void Renderer::set_cursor_position( int left_, int top_ ) {
	int left( std::max( 0, std::min( left_, _windowWidth - 1 ) ) );
	int top( std::max( 0, std::min( top_, _windowHeight - 1 ) ) );
	if ( ( left == _cursorLeft ) && ( top == _cursorTop ) ) {
		return;
	}
	if ( ! _buffer.append_cursor_position( top, left ) ) {
		flush();
		if ( ! _buffer.append_cursor_position( top, left ) ) {
			log_debug( "output buffer too small for cursor positioning" );
		}
	}
	_cursorLeft = left;
	_cursorTop = top;
}

void Renderer::erase_to_end_of_line( void ) {
	append( ansi::ERASE_TO_END_OF_LINE );
}

void Renderer::clear_row( int row_ ) {
	if ( ( row_ < 0 ) || ( row_ >= _windowHeight ) ) {
		return;
	}
	set_cursor_position( 0, row_ );
	append( ansi::ERASE_LINE );
}

void Renderer::erase_below( void ) {
	append( ansi::ERASE_BELOW );
}

void Renderer::scroll( int count_ ) {
	if ( count_ <= 0 ) {
		return;
	}
	set_cursor_position( 0, _windowHeight - 1 );
	append_repeated( "\n", 1, count_ );
	_cursorLeft = 0;
	_cursorTop = _windowHeight - 1;
}

void Renderer::new_line( void ) {
	append( "\r\n" );
	_cursorLeft = 0;
	_cursorTop = std::min( _cursorTop + 1, _windowHeight - 1 );
}

void Renderer::advance( int width_ ) {
	_cursorLeft += width_;
	if ( _cursorLeft >= _windowWidth ) {
		_cursorLeft = _windowWidth;
	}
}

void Renderer::write_span( Line const& line_, SimpleConsole::ReadLineOptions const& options_, std::string const& mask_, int from_, int to_ ) {
	int const promptLength( line_.prompt_length() );
	if ( from_ < promptLength ) {
		int end( std::min( to_, promptLength ) );
		_utf8.assign( line_.chars() + from_, end - from_ );
		append( _utf8.get(), _utf8.size() );
		if ( std::find( line_.chars() + from_, line_.chars() + end, u'\033' ) != ( line_.chars() + end ) ) {
			append( ansi_color( SimpleConsole::Color::DEFAULT ) );
		}
		advance( line_.width_of( from_, end ) );
		from_ = end;
	}
	if ( from_ >= to_ ) {
		return;
	}
	bool colored( options_.inputColor != SimpleConsole::Color::DEFAULT );
	if ( colored ) {
		append( ansi_color( options_.inputColor ) );
	}
	int width( line_.width_of( from_, to_ ) );
	if ( ! mask_.empty() ) {
		append_repeated( mask_.data(), static_cast<int>( mask_.size() ), width );
	} else {
		_utf8.assign( line_.chars() + from_, to_ - from_ );
		append( _utf8.get(), _utf8.size() );
	}
	if ( colored ) {
		append( ansi_color( SimpleConsole::Color::DEFAULT ) );
	}
	advance( width );
}

/*
 * Paint [start, end) of a line row by row, rows outside of the window are skipped.
 * With erase the rest of the last row is cleared.
 */
void Renderer::write_line( Line const& line_, SimpleConsole::ReadLineOptions const& options_, int start_, int end_, bool erase_ ) {
	std::string mask( options_.maskingCharacter != 0 ? code_point_to_utf8( options_.maskingCharacter ) : std::string() );
	Line::rows_t const& rows( line_.rows() );
	int const height( line_.height() );
	for ( int r( line_.find_row( start_ ) ); r < height; ++ r ) {
		Row const& row( rows[r] );
		int from( std::max( start_, row.start() ) );
		int to( std::min( end_, row.end() ) );
		int top( line_.top() + r );
		if ( ( from < to ) && ( top >= 0 ) && ( top < _windowHeight ) ) {
			set_cursor_position( line_.width_of( row.start(), from ), top );
			write_span( line_, options_, mask, from, to );
			if ( ( to == row.end() ) && ( r < ( height - 1 ) ) && ( row.width() < _windowWidth ) ) {
				/* wide character did not fit, clear the gap */
				append( ansi::ERASE_TO_END_OF_LINE );
			}
		}
		if ( row.end() >= end_ ) {
			break;
		}
	}
	if ( ! erase_ ) {
		return;
	}
	Row const& last( rows.back() );
	int top( line_.top() + height - 1 );
	if ( ( top < 0 ) || ( top >= _windowHeight ) ) {
		return;
	}
	if ( last.is_empty() && ( height > 1 ) && ( _cursorLeft >= _windowWidth ) && ( _cursorTop == ( top - 1 ) ) ) {
		append( ansi::FORCE_NEW_LINE );
		_cursorLeft = 0;
		_cursorTop = top;
	}
	set_cursor_position( last.width(), top );
	append( ansi::ERASE_TO_END_OF_LINE );
}

/*
 * Paint a row from given position to its end, the row did not change its extent
 * so the only stale cells are those right of its new width.
 */
void Renderer::write_row_tail( Line const& line_, SimpleConsole::ReadLineOptions const& options_, int rowIndex_, int from_ ) {
	Row const& row( line_.rows()[rowIndex_] );
	int top( line_.top() + rowIndex_ );
	if ( ( top < 0 ) || ( top >= _windowHeight ) ) {
		return;
	}
	if ( from_ < row.end() ) {
		std::string mask( options_.maskingCharacter != 0 ? code_point_to_utf8( options_.maskingCharacter ) : std::string() );
		set_cursor_position( line_.width_of( row.start(), from_ ), top );
		write_span( line_, options_, mask, from_, row.end() );
	}
	if ( row.width() < _windowWidth ) {
		set_cursor_position( row.width(), top );
		append( ansi::ERASE_TO_END_OF_LINE );
	}
}

/*
 * Text written above the edit region, cursor is expected at column 0.
 */
void Renderer::write_text( std::string const& text_ ) {
	prompt_lines_t lines( split_prompt( text_ ) );
	for ( UnicodeString const& line : lines ) {
		std::vector<char> widths( static_cast<size_t>( line.length() ) );
		compute_prompt_widths( line.get(), widths.data(), line.length() );
		int width( 0 );
		for ( char w : widths ) {
			width += w;
		}
		_utf8.assign( line.get(), line.length() );
		append( _utf8.get(), _utf8.size() );
		append( ansi::ERASE_TO_END_OF_LINE );
		append( "\r\n" );
		int rows( std::max( 1, ( width + _windowWidth - 1 ) / _windowWidth ) );
		_cursorLeft = 0;
		_cursorTop = std::min( _cursorTop + rows, _windowHeight - 1 );
	}
}

void Renderer::commit( void ) {
	if ( _cursorHidden ) {
		append( ansi::SHOW_CURSOR );
		_cursorHidden = false;
	}
	flush();
}

void Renderer::flush( void ) {
	if ( _buffer.is_empty() ) {
		return;
	}
	try {
		_terminal.write8( _buffer.data(), _buffer.size() );
	} catch ( std::runtime_error const& e ) {
		log_debug( "terminal write failed: %s", e.what() );
		_cursorLeft = -1;
		_cursorTop = -1;
	}
	_buffer.clear();
}

void Renderer::append( char const* str_ ) {
	append( str_, static_cast<int>( strlen( str_ ) ) );
}

void Renderer::append( char const* data_, int size_ ) {
	if ( _buffer.append( data_, size_ ) ) {
		return;
	}
	flush();
	if ( _buffer.append( data_, size_ ) ) {
		return;
	}
	try {
		_terminal.write8( data_, size_ );
	} catch ( std::runtime_error const& e ) {
		log_debug( "terminal write failed: %s", e.what() );
		_cursorLeft = -1;
		_cursorTop = -1;
	}
}

void Renderer::append_repeated( char const* data_, int size_, int count_ ) {
	if ( _buffer.append_repeated( data_, size_, count_ ) ) {
		return;
	}
	for ( int i( 0 ); i < count_; ++ i ) {
		append( data_, size_ );
	}
}

}
