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

#include "location.hxx"
#include "session.hxx"
#include "line.hxx"
#include "renderer.hxx"

namespace simpleprompt {

Location::Location( void )
	: _session( nullptr )
	, _lineIndex( 0 )
	, _rowIndex( 0 )
	, _arrayPosition( 0 )
	, _cursorPosition( 0 ) {
}

void Location::attach( Session* session_ ) {
	_session = session_;
	_lineIndex = 0;
	_rowIndex = 0;
	_arrayPosition = 0;
	_cursorPosition = 0;
}

Line& Location::line( void ) const {
	return ( _session->line( _lineIndex ) );
}

void Location::reset( void ) {
	if ( _session->line_count() == 0 ) {
		return;
	}
	reset( _session->line( _session->first_input_index() ), false );
}

void Location::reset( Line const& line_, bool end_ ) {
	_lineIndex = line_.index();
	_arrayPosition = end_ ? line_.length() : line_.prompt_length();
	locate();
}

void Location::locate( void ) {
	Line const& l( line() );
	_arrayPosition = std::max( l.prompt_length(), std::min( _arrayPosition, l.length() ) );
	_rowIndex = l.find_row( _arrayPosition );
	_cursorPosition = l.width_of( l.rows()[_rowIndex].start(), _arrayPosition );
}

void Location::set_array_position( int pos_ ) {
	_arrayPosition = pos_;
	locate();
}

bool Location::move_left( void ) {
	Line const& l( line() );
	if ( _arrayPosition <= l.prompt_length() ) {
		return ( false );
	}
	set_array_position( _arrayPosition - l.unit_length_before( _arrayPosition ) );
	set_cursor();
	return ( true );
}

bool Location::move_right( void ) {
	Line const& l( line() );
	if ( _arrayPosition >= l.length() ) {
		return ( false );
	}
	set_array_position( _arrayPosition + l.unit_length_at( _arrayPosition ) );
	set_cursor();
	return ( true );
}

void Location::move_first( void ) {
	set_array_position( line().prompt_length() );
	set_cursor();
}

void Location::move_last( void ) {
	set_array_position( line().length() );
	set_cursor();
}

/*
 * Row up/down keeping the column, crossing into neighbor input lines.
 */
bool Location::move_vertical( bool up_ ) {
	Line* l( &line() );
	int lineIndex( _lineIndex );
	int rowIndex( _rowIndex );
	if ( up_ ) {
		if ( rowIndex > l->initial_row_index() ) {
			-- rowIndex;
		} else if ( lineIndex > _session->first_input_index() ) {
			-- lineIndex;
			l = &_session->line( lineIndex );
			rowIndex = l->height() - 1;
		} else {
			return ( false );
		}
	} else {
		if ( rowIndex < ( l->height() - 1 ) ) {
			++ rowIndex;
		} else if ( lineIndex < ( _session->line_count() - 1 ) ) {
			++ lineIndex;
			l = &_session->line( lineIndex );
			rowIndex = l->initial_row_index();
		} else {
			return ( false );
		}
	}
	_lineIndex = lineIndex;
	set_array_position( l->trim_cursor_index( rowIndex, _cursorPosition ) );
	set_cursor();
	return ( true );
}

void Location::change_line( int offset_ ) {
	int next( std::max( _session->first_input_index(), std::min( _lineIndex + offset_, _session->line_count() - 1 ) ) );
	if ( next == _lineIndex ) {
		return;
	}
	reset( _session->line( next ), false );
	set_cursor();
}

void Location::set_cursor( void ) const {
	Line const& l( line() );
	Renderer& renderer( _session->renderer() );
	int row( l.top() + _rowIndex );
	if ( ( row < 0 ) || ( row >= renderer.window_height() ) ) {
		_session->reveal_row( row );
	}
	int left( std::min( _cursorPosition, renderer.window_width() - 1 ) );
	int top( std::max( 0, std::min( l.top() + _rowIndex, renderer.window_height() - 1 ) ) );
	renderer.set_cursor_position( left, top );
}

}
