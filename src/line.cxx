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

#include "line.hxx"
#include "session.hxx"
#include "location.hxx"
#include "prompt.hxx"
#include "util.hxx"

namespace simpleprompt {

typedef SimpleConsole::KEY KEY;

Line::Line( void )
	: _session( nullptr )
	, _buffer()
	, _widths()
	, _rows()
	, _promptLength( 0 )
	, _index( 0 )
	, _top( 0 )
	, _windowWidth( 1 )
	, _isInput( false ) {
}

void Line::initialize( Session* session_, int index_, UnicodeString const& prompt_, bool isInput_, int windowWidth_ ) {
	_session = session_;
	_index = index_;
	_isInput = isInput_;
	_top = 0;
	_windowWidth = std::max( 1, windowWidth_ );
	_buffer = prompt_;
	_promptLength = prompt_.length();
	_widths.assign( static_cast<size_t>( _promptLength ), 0 );
	compute_prompt_widths( _buffer.get(), _widths.data(), _promptLength );
	reset_rows();
}

void Line::release( void ) {
	_session = nullptr;
	_buffer.clear();
	_widths.clear();
	_rows.clear();
	_promptLength = 0;
	_index = 0;
	_top = 0;
	_isInput = false;
}

int Line::width_of( int from_, int to_ ) const {
	int width( 0 );
	for ( int i( from_ ); i < to_; ++ i ) {
		width += _widths[i];
	}
	return ( width );
}

int Line::unit_length_at( int pos_ ) const {
	if (
		( ( pos_ + 1 ) < length() )
		&& is_high_surrogate( _buffer[pos_] )
		&& is_low_surrogate( _buffer[pos_ + 1] )
	) {
		return ( 2 );
	}
	return ( 1 );
}

int Line::unit_length_before( int pos_ ) const {
	if (
		( pos_ >= 2 )
		&& is_low_surrogate( _buffer[pos_ - 1] )
		&& is_high_surrogate( _buffer[pos_ - 2] )
	) {
		return ( 2 );
	}
	return ( 1 );
}

/*
 * Row of given buffer position, a position on a row boundary
 * belongs to the later row.
 */
int Line::find_row( int pos_ ) const {
	int rowIndex( 0 );
	for ( int i( 1 ); i < height(); ++ i ) {
		if ( _rows[i].start() > pos_ ) {
			break;
		}
		rowIndex = i;
	}
	return ( rowIndex );
}

int Line::column_of( int pos_ ) const {
	Row const& row( _rows[find_row( pos_ )] );
	return ( width_of( row.start(), pos_ ) );
}

int Line::initial_row_index( void ) const {
	return ( find_row( _promptLength ) );
}

UnicodeString Line::input( void ) const {
	return ( UnicodeString( _buffer.get() + _promptLength, input_length() ) );
}

bool Line::fits( Row const& row_, int width_ ) const {
	if ( row_.is_empty() ) {
		return ( true );
	}
	return ( ( row_.width() < _windowWidth ) && ( ( row_.width() + width_ ) <= _windowWidth ) );
}

void Line::set_window_width( int windowWidth_ ) {
	_windowWidth = std::max( 1, windowWidth_ );
}

void Line::reset_rows( void ) {
	_rows.clear();
	int const len( length() );
	Row row( 0 );
	int pos( 0 );
	while ( pos < len ) {
		int unitLength( unit_length_at( pos ) );
		int unitWidth( width_of( pos, pos + unitLength ) );
		if ( ! fits( row, unitWidth ) ) {
			_rows.push_back( row );
			row = Row( pos );
		}
		row.add_input( unitLength, unitWidth );
		pos += unitLength;
	}
	_rows.push_back( row );
	if ( row.width() >= _windowWidth ) {
		_rows.push_back( Row( len ) );
	}
	update_input_starts();
}

void Line::update_input_starts( void ) {
	for ( Row& row : _rows ) {
		row.set_input_start( _isInput && ( row.end() >= _promptLength ) ? std::max( row.start(), _promptLength ) : -1 );
	}
}

/*
 * Rewrap rows starting one row above the edited one (it may take over
 * units from the edited row) and stop as soon as a new row boundary
 * coincides with an untouched row past the edit.
 */
void Line::arrange( int rowIndex_, bool& rowCountChanged_, bool& contentMoved_ ) {
	int const first( std::max( 0, rowIndex_ - 1 ) );
	rows_t old( _rows.begin() + first, _rows.end() );
	_rows.resize( static_cast<size_t>( first ) );
	int const len( length() );
	int pos( old.front().start() );
	Row row( pos );
	int k( 0 );
	int const oldCount( static_cast<int>( old.size() ) );
	bool synced( false );
	while ( pos < len ) {
		if ( row.is_empty() ) {
			while ( ( k < oldCount ) && ( ( old[k].start() < pos ) || ( ( first + k ) <= rowIndex_ ) ) ) {
				++ k;
			}
			if ( ( k < oldCount ) && ( old[k].start() == pos ) && ! old[k].is_empty() ) {
				_rows.insert( _rows.end(), old.begin() + k, old.end() );
				synced = true;
				break;
			}
		}
		int unitLength( unit_length_at( pos ) );
		int unitWidth( width_of( pos, pos + unitLength ) );
		if ( ! fits( row, unitWidth ) ) {
			_rows.push_back( row );
			row = Row( pos );
			continue;
		}
		row.add_input( unitLength, unitWidth );
		pos += unitLength;
	}
	if ( ! synced ) {
		_rows.push_back( row );
		if ( row.width() >= _windowWidth ) {
			_rows.push_back( Row( len ) );
		}
	}
	rowCountChanged_ = ( height() != ( first + oldCount ) );
	contentMoved_ = rowCountChanged_;
	for ( int i( 0 ); ! contentMoved_ && ( i < oldCount ); ++ i ) {
		contentMoved_ = ( _rows[first + i] != old[i] );
	}
	update_input_starts();
}

/*
 * Returns index of the row that received the text (before rewrap).
 */
int Line::insert( int pos_, char16_t const* text_, int count_, bool& rowCountChanged_, bool& contentMoved_ ) {
	int rowIndex( find_row( pos_ ) );
	_buffer.insert( pos_, text_, count_ );
	_widths.insert( _widths.begin() + pos_, static_cast<size_t>( count_ ), 0 );
	recompute_character_widths( _buffer.get() + pos_, _widths.data() + pos_, count_ );
	int width( width_of( pos_, pos_ + count_ ) );
	for ( int i( rowIndex + 1 ); i < height(); ++ i ) {
		_rows[i].move_start( count_ );
	}
	_rows[rowIndex].add_input( count_, width );
	arrange( rowIndex, rowCountChanged_, contentMoved_ );
	return ( rowIndex );
}

int Line::remove( int pos_, int count_, int& removedWidth_, bool& rowCountChanged_, bool& contentMoved_ ) {
	int rowIndex( find_row( pos_ ) );
	removedWidth_ = width_of( pos_, pos_ + count_ );
	_buffer.erase( pos_, count_ );
	_widths.erase( _widths.begin() + pos_, _widths.begin() + pos_ + count_ );
	if ( ( pos_ + count_ ) > _rows[rowIndex].end() ) {
		/* span crossed a row boundary, later row starts are meaningless now */
		int oldHeight( height() );
		reset_rows();
		rowCountChanged_ = ( height() != oldHeight );
		contentMoved_ = true;
		return ( rowIndex );
	}
	for ( int i( rowIndex + 1 ); i < height(); ++ i ) {
		_rows[i].move_start( -count_ );
	}
	_rows[rowIndex].add_input( -count_, -removedWidth_ );
	arrange( rowIndex, rowCountChanged_, contentMoved_ );
	return ( rowIndex );
}

void Line::clear_input( void ) {
	_buffer.resize( _promptLength );
	_widths.resize( static_cast<size_t>( _promptLength ) );
	reset_rows();
}

/*
 * Rightmost position on given row whose column does not exceed requested one.
 */
int Line::trim_cursor_index( int rowIndex_, int column_ ) const {
	Row const& row( _rows[rowIndex_] );
	int const inputStart( std::max( row.start(), _promptLength ) );
	int pos( inputStart );
	int column( width_of( row.start(), pos ) );
	while ( pos < row.end() ) {
		int unitLength( unit_length_at( pos ) );
		int unitWidth( width_of( pos, pos + unitLength ) );
		if ( ( column + unitWidth ) > column_ ) {
			break;
		}
		column += unitWidth;
		pos += unitLength;
	}
	if ( ( pos == row.end() ) && ( pos > inputStart ) && ( rowIndex_ < ( height() - 1 ) ) ) {
		pos -= unit_length_before( pos );
	}
	return ( pos );
}

bool Line::process_input( SimpleConsole::KeyEvent const& key_, char16_t const* chars_, int count_ ) {
	if ( count_ > 0 ) {
		int allowed( std::min( count_, _session->remaining_length() ) );
		if ( ( allowed > 0 ) && is_high_surrogate( chars_[allowed - 1] ) ) {
			-- allowed;
		}
		if ( allowed > 0 ) {
			insert_at_caret( chars_, allowed );
		}
	}
	Location& location( _session->location() );
	switch ( key_.key ) {
		case ( KEY::ENTER ): {
			return ( _session->options().allowEmptyLineInput || ! _session->is_empty_input() );
		}
		case ( KEY::BACKSPACE ): backspace(); break;
		case ( KEY::DELETE ):    delete_character(); break;
		case ( KEY::HOME ):      location.move_first(); break;
		case ( KEY::END ):       location.move_last(); break;
		case ( KEY::LEFT ):      location.move_left(); break;
		case ( KEY::RIGHT ):     location.move_right(); break;
		case ( KEY::UP ):
		case ( KEY::DOWN ): {
			if ( _session->mode() != Session::MODE::SINGLELINE ) {
				location.move_vertical( key_.key == KEY::UP );
			}
		} break;
		case ( KEY::CHARACTER ): {
			if ( key_.has( SimpleConsole::MODIFIER::CONTROL ) && ( ( key_.keyChar == 'U' ) || ( key_.keyChar == 'u' ) ) ) {
				kill_input();
			}
		} break;
		default: break;
	}
	return ( false );
}

void Line::insert_at_caret( char16_t const* text_, int count_ ) {
	Location& location( _session->location() );
	int pos( location.array_position() );
	int oldHeight( height() );
	bool rowCountChanged( false );
	bool contentMoved( false );
	int rowIndex( insert( pos, text_, count_, rowCountChanged, contentMoved ) );
	location.set_array_position( pos + count_ );
	repaint( pos, rowIndex, oldHeight, contentMoved );
}

void Line::remove_at( int pos_, int count_ ) {
	int oldHeight( height() );
	int removedWidth( 0 );
	bool rowCountChanged( false );
	bool contentMoved( false );
	int rowIndex( remove( pos_, count_, removedWidth, rowCountChanged, contentMoved ) );
	_session->location().set_array_position( pos_ );
	repaint( pos_, rowIndex, oldHeight, contentMoved );
}

/* The line may be given back to the pool by try_delete_line(), nothing touches it afterwards. */
void Line::backspace( void ) {
	if ( input_length() == 0 ) {
		_session->try_delete_line( _index, true );
		return;
	}
	int pos( _session->location().array_position() );
	if ( pos <= _promptLength ) {
		return;
	}
	int unitLength( unit_length_before( pos ) );
	remove_at( pos - unitLength, unitLength );
}

void Line::delete_character( void ) {
	if ( input_length() == 0 ) {
		_session->try_delete_line( _index, false );
		return;
	}
	int pos( _session->location().array_position() );
	if ( pos >= length() ) {
		return;
	}
	remove_at( pos, unit_length_at( pos ) );
}

void Line::kill_input( void ) {
	if ( input_length() == 0 ) {
		return;
	}
	int oldHeight( height() );
	int start( _rows[initial_row_index()].start() );
	clear_input();
	Location& location( _session->location() );
	location.reset( *this, false );
	if ( height() != oldHeight ) {
		_session->height_changed( _index, height() - oldHeight );
	}
	_session->paint( *this, start, length(), true );
	location.set_cursor();
}

/*
 * Height change goes first so that lines below are moved (and the window
 * scrolled) before this line is painted at its final place.
 */
void Line::repaint( int pos_, int rowIndex_, int oldHeight_, bool moved_ ) {
	if ( height() != oldHeight_ ) {
		_session->height_changed( _index, height() - oldHeight_ );
	}
	if ( moved_ ) {
		int first( std::max( 0, rowIndex_ - 1 ) );
		_session->paint( *this, std::min( pos_, _rows[first].start() ), length(), true );
	} else {
		_session->paint_row_tail( *this, rowIndex_, pos_ );
	}
	_session->location().set_cursor();
}

}
