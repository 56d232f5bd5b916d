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


#include <cstdlib>
#include <cstring>

#include "keydecoder.hxx"
#include "conversion.hxx"

namespace simpleprompt {

typedef SimpleConsole::KEY KEY;
typedef SimpleConsole::MODIFIER MODIFIER;
typedef SimpleConsole::KeyEvent KeyEvent;

namespace {

static char16_t const ESC = 27;
static char16_t const DEL = 127;
/* Shortest recognized escape sequence: ESC [ x */
static int const MINIMAL_SEQUENCE_LENGTH = 3;
static int const SEQUENCE_PREFIX_LENGTH = 2;

inline bool is_ascii_letter( char16_t c ) {
	return ( ( ( c >= 'a' ) && ( c <= 'z' ) ) || ( ( c >= 'A' ) && ( c <= 'Z' ) ) );
}

inline bool is_ascii_upper( char16_t c ) {
	return ( ( c >= 'A' ) && ( c <= 'Z' ) );
}

inline bool is_ascii_digit( char16_t c ) {
	return ( ( c >= '0' ) && ( c <= '9' ) );
}

inline KEY function_key( int n ) {
	return ( static_cast<KEY>( static_cast<int>( KEY::F1 ) + n ) );
}

/*
 * Key identifiers used by xterm in `ESC O x` form, by rxvt in `ESC [ x` form,
 * and as final character of xterm modifier sequences.
 */
bool map_key_id_xterm( char16_t id_, bool rxvt_, KeyEvent& key_ ) {
	switch ( id_ ) {
		case 'A': case 'x': key_ = KeyEvent( KEY::UP ); break;
		case 'a':           key_ = KeyEvent( KEY::UP, MODIFIER::SHIFT ); break;
		case 'B': case 'r': key_ = KeyEvent( KEY::DOWN ); break;
		case 'b':           key_ = KeyEvent( KEY::DOWN, MODIFIER::SHIFT ); break;
		case 'C': case 'v': key_ = KeyEvent( KEY::RIGHT ); break;
		case 'c':           key_ = KeyEvent( KEY::RIGHT, MODIFIER::SHIFT ); break;
		case 'D': case 't': key_ = KeyEvent( KEY::LEFT ); break;
		case 'd':           key_ = KeyEvent( KEY::LEFT, MODIFIER::SHIFT ); break;
		case 'E': case 'u': key_ = KeyEvent( KEY::NONE ); break; /* keypad 5 */
		case 'F': case 'q': key_ = KeyEvent( KEY::END ); break;
		case 'H':           key_ = KeyEvent( KEY::HOME ); break;
		case 'j':           key_ = KeyEvent::character( '*' ); break;
		case 'k':           key_ = KeyEvent::character( '+' ); break;
		case 'm':           key_ = KeyEvent::character( '-' ); break;
		case 'o':           key_ = KeyEvent::character( '/' ); break;
		case 'M':           key_ = KeyEvent( KEY::ENTER ); break;
		case 'n':           key_ = KeyEvent( KEY::DELETE ); break;
		case 'p':           key_ = KeyEvent( KEY::INSERT ); break;
		case 's':           key_ = KeyEvent( KEY::PAGE_DOWN ); break;
		case 'y':           key_ = KeyEvent( KEY::PAGE_UP ); break;
		case 'w':           key_ = KeyEvent( rxvt_ ? KEY::HOME : KEY::END ); break;
		case 'P':           key_ = KeyEvent( KEY::F1 ); break;
		case 'Q':           key_ = KeyEvent( KEY::F2 ); break;
		case 'R':           key_ = KeyEvent( KEY::F3 ); break;
		case 'S':           key_ = KeyEvent( KEY::F4 ); break;
		case 'T':           key_ = KeyEvent( KEY::F5 ); break;
		case 'U':           key_ = KeyEvent( KEY::F6 ); break;
		case 'V':           key_ = KeyEvent( KEY::F7 ); break;
		case 'W':           key_ = KeyEvent( KEY::F8 ); break;
		case 'X':           key_ = KeyEvent( KEY::F9 ); break;
		case 'Y':           key_ = KeyEvent( KEY::F10 ); break;
		case 'Z':           key_ = KeyEvent( KEY::F11 ); break;
		case '[':           key_ = KeyEvent( KEY::F12 ); break;
		default: return ( false );
	}
	return ( true );
}

/*
 * SCO console `ESC [ x` form.
 */
bool map_sco( char16_t id_, KeyEvent& key_ ) {
	int const CTRL_SHIFT( MODIFIER::CONTROL | MODIFIER::SHIFT );
	switch ( id_ ) {
		case 'A': key_ = KeyEvent( KEY::UP ); return ( true );
		case 'B': key_ = KeyEvent( KEY::DOWN ); return ( true );
		case 'C': key_ = KeyEvent( KEY::RIGHT ); return ( true );
		case 'D': key_ = KeyEvent( KEY::LEFT ); return ( true );
		case 'F': key_ = KeyEvent( KEY::END ); return ( true );
		case 'G': key_ = KeyEvent( KEY::PAGE_DOWN ); return ( true );
		case 'H': key_ = KeyEvent( KEY::HOME ); return ( true );
		case 'I': key_ = KeyEvent( KEY::PAGE_UP ); return ( true );
		case '@': key_ = KeyEvent( KEY::F5, CTRL_SHIFT ); return ( true );
		case '[': key_ = KeyEvent( KEY::F6, CTRL_SHIFT ); return ( true );
		case '<':
		case '\\': key_ = KeyEvent( KEY::F7, CTRL_SHIFT ); return ( true );
		case ']': key_ = KeyEvent( KEY::F8, CTRL_SHIFT ); return ( true );
		case '^': key_ = KeyEvent( KEY::F9, CTRL_SHIFT ); return ( true );
		case '_': key_ = KeyEvent( KEY::F10, CTRL_SHIFT ); return ( true );
		case '`': key_ = KeyEvent( KEY::F11, CTRL_SHIFT ); return ( true );
		case '{': key_ = KeyEvent( KEY::F12, CTRL_SHIFT ); return ( true );
		default: break;
	}
	if ( ( id_ >= 'M' ) && ( id_ <= 'X' ) ) {
		key_ = KeyEvent( function_key( id_ - 'M' ) );
	} else if ( ( id_ >= 'Y' ) && ( id_ <= 'Z' ) ) {
		key_ = KeyEvent( function_key( id_ - 'Y' ), MODIFIER::SHIFT );
	} else if ( ( id_ >= 'a' ) && ( id_ <= 'j' ) ) {
		key_ = KeyEvent( function_key( id_ - 'a' + 2 ), MODIFIER::SHIFT );
	} else if ( ( id_ >= 'k' ) && ( id_ <= 'v' ) ) {
		key_ = KeyEvent( function_key( id_ - 'k' ), MODIFIER::CONTROL );
	} else if ( ( id_ >= 'w' ) && ( id_ <= 'z' ) ) {
		key_ = KeyEvent( function_key( id_ - 'w' ), CTRL_SHIFT );
	} else {
		return ( false );
	}
	return ( true );
}

/*
 * Numeric `ESC [ n ~` form.
 */
KEY map_number( int number_ ) {
	switch ( number_ ) {
		case 1: case 7: return ( KEY::HOME );
		case 2:         return ( KEY::INSERT );
		case 3:         return ( KEY::DELETE );
		case 4: case 8: return ( KEY::END );
		case 5:         return ( KEY::PAGE_UP );
		case 6:         return ( KEY::PAGE_DOWN );
		default: break;
	}
	if ( ( number_ >= 11 ) && ( number_ <= 15 ) ) {
		return ( function_key( number_ - 11 ) );
	}
	if ( ( number_ >= 17 ) && ( number_ <= 21 ) ) {
		return ( function_key( number_ - 17 + 5 ) );
	}
	if ( ( number_ >= 23 ) && ( number_ <= 26 ) ) {
		return ( function_key( number_ - 23 + 10 ) );
	}
	if ( ( number_ >= 28 ) && ( number_ <= 29 ) ) {
		return ( function_key( number_ - 28 + 14 ) );
	}
	if ( ( number_ >= 31 ) && ( number_ <= 34 ) ) {
		return ( function_key( number_ - 31 + 16 ) );
	}
	return ( KEY::NONE );
}

int rxvt_modifiers( char16_t tag_ ) {
	switch ( tag_ ) {
		case '^': return ( MODIFIER::CONTROL );
		case '$': return ( MODIFIER::SHIFT );
		case '@': return ( MODIFIER::CONTROL | MODIFIER::SHIFT );
		default: break;
	}
	return ( MODIFIER::NONE );
}

int xterm_modifiers( char16_t param_ ) {
	int bits( param_ - '1' );
	int modifiers( MODIFIER::NONE );
	if ( bits & 1 ) {
		modifiers |= MODIFIER::SHIFT;
	}
	if ( bits & 2 ) {
		modifiers |= MODIFIER::ALT;
	}
	if ( bits & 4 ) {
		modifiers |= MODIFIER::CONTROL;
	}
	return ( modifiers );
}

inline bool is_rxvt_end_tag( char16_t c ) {
	return ( ( c == '^' ) || ( c == '$' ) || ( c == '@' ) );
}

/* Alt is meaningful only for keys that are not plain punctuation. */
bool alt_applies( KeyEvent const& key_ ) {
	if ( key_.key != KEY::CHARACTER ) {
		return ( key_.key != KEY::NONE );
	}
	char16_t c( key_.keyChar );
	return (
		is_ascii_letter( c )
		|| is_ascii_digit( c )
		|| ( c < ' ' )
		|| ( ( c != 0 ) && ( c < 128 ) && ( strchr( " ,.*/-+", static_cast<char>( c ) ) != nullptr ) )
	);
}

bool is_rxvt_terminal( void ) {
	char const* term( getenv( "TERM" ) );
	return ( term && ( strstr( term, "rxvt" ) != nullptr ) );
}

}

KeyDecoder::KeyDecoder( void )
	: _pendingBytes()
	, _units()
	, _consumed( 0 )
	, _eraseChar( 0 )
	, _rxvt( is_rxvt_terminal() ) {
}

void KeyDecoder::feed( char const* data_, int size_ ) {
	_pendingBytes.append( data_, static_cast<size_t>( size_ ) );
	int complete( utf8_complete_length( _pendingBytes.data(), static_cast<int>( _pendingBytes.size() ) ) );
	if ( complete == 0 ) {
		return;
	}
	if ( _consumed > 0 ) {
		_units.erase( 0, _consumed );
		_consumed = 0;
	}
	int oldLength( _units.length() );
	_units.resize( oldLength + complete + 1 );
	int count( 0 );
	copyString8to16( _units.get() + oldLength, complete + 1, count, _pendingBytes.data(), complete );
	_units.resize( oldLength + count );
	_pendingBytes.erase( 0, static_cast<size_t>( complete ) );
}

void KeyDecoder::clear( void ) {
	_pendingBytes.clear();
	_units.clear();
	_consumed = 0;
}

bool KeyDecoder::next( key_event_t& key_ ) {
	int size( _units.length() - _consumed );
	if ( size <= 0 ) {
		_units.clear();
		_consumed = 0;
		return ( false );
	}
	char16_t const* units( _units.get() + _consumed );
	if ( ( _eraseChar != 0 ) && ( units[0] == _eraseChar ) ) {
		key_ = KeyEvent( KEY::BACKSPACE );
		++ _consumed;
		return ( true );
	}
	int length( 0 );
	if ( ( size > MINIMAL_SEQUENCE_LENGTH ) && ( units[0] == ESC ) && ( units[1] == ESC ) ) {
		if ( parse_sequence( units + 1, size - 1, key_, length ) ) {
			key_.modifiers |= MODIFIER::ALT;
			_consumed += ( 1 + length );
			return ( true );
		}
	} else if ( ( size >= MINIMAL_SEQUENCE_LENGTH ) && parse_sequence( units, size, key_, length ) ) {
		_consumed += length;
		return ( true );
	}
	if ( ( size == 2 ) && ( units[0] == ESC ) && ( units[1] != ESC ) ) {
		key_ = parse_single( units[1], true );
		_consumed += 2;
		return ( true );
	}
	key_ = parse_single( units[0], false );
	++ _consumed;
	return ( true );
}

bool KeyDecoder::parse_sequence( char16_t const* seq_, int size_, key_event_t& key_, int& length_ ) const {
	if (
		( size_ < MINIMAL_SEQUENCE_LENGTH )
		|| ( seq_[0] != ESC )
		|| ( ( seq_[1] != '[' ) && ( seq_[1] != 'O' ) )
	) {
		return ( false );
	}
	if ( ( seq_[1] == 'O' ) || is_ascii_letter( seq_[2] ) || ( size_ == MINIMAL_SEQUENCE_LENGTH ) ) {
		bool ok(
			( ( seq_[1] == 'O' ) || _rxvt )
				? map_key_id_xterm( seq_[2], _rxvt, key_ )
				: map_sco( seq_[2], key_ )
		);
		if ( ok ) {
			length_ = MINIMAL_SEQUENCE_LENGTH;
		}
		return ( ok );
	}
	/* Linux console function keys. */
	if ( ( seq_[2] == '[' ) && ( seq_[3] >= 'A' ) && ( seq_[3] <= 'E' ) ) {
		key_ = KeyEvent( function_key( seq_[3] - 'A' ) );
		length_ = 4;
		return ( true );
	}
	int digits( 0 );
	if ( ( seq_[2] >= '1' ) && ( seq_[2] <= '9' ) ) {
		digits = is_ascii_digit( seq_[3] ) ? 2 : 1;
	}
	if ( ( digits == 0 ) || ( ( SEQUENCE_PREFIX_LENGTH + digits ) >= size_ ) ) {
		return ( false );
	}
	int number( seq_[2] - '0' );
	if ( digits == 2 ) {
		number = number * 10 + ( seq_[3] - '0' );
	}
	char16_t endTag( seq_[SEQUENCE_PREFIX_LENGTH + digits] );
	if ( ( endTag == '~' ) || ( _rxvt && is_rxvt_end_tag( endTag ) ) ) {
		KEY key( map_number( number ) );
		if ( key == KEY::NONE ) {
			return ( false );
		}
		key_ = KeyEvent( key, rxvt_modifiers( endTag ) );
		length_ = SEQUENCE_PREFIX_LENGTH + digits + 1;
		return ( true );
	}
	int const modifierPos( SEQUENCE_PREFIX_LENGTH + digits + 1 );
	if (
		( endTag != ';' )
		|| ( ( modifierPos + 1 ) >= size_ )
		|| ( seq_[modifierPos] < '2' )
		|| ( seq_[modifierPos] > '8' )
	) {
		return ( false );
	}
	char16_t keyId( seq_[modifierPos + 1] );
	if ( keyId == '~' ) {
		KEY key( map_number( number ) );
		if ( key == KEY::NONE ) {
			return ( false );
		}
		key_ = KeyEvent( key );
	} else if ( ! is_ascii_upper( keyId ) || ! map_key_id_xterm( keyId, _rxvt, key_ ) ) {
		return ( false );
	}
	key_.modifiers |= xterm_modifiers( seq_[modifierPos] );
	length_ = modifierPos + 2;
	return ( true );
}

KeyDecoder::key_event_t KeyDecoder::parse_single( char16_t char_, bool alt_ ) const {
	KeyEvent key;
	switch ( char_ ) {
		case '\b': key = KeyEvent( KEY::BACKSPACE ); break;
		case '\t': key = KeyEvent( KEY::TAB ); break;
		case '\r':
		case '\n': key = KeyEvent( KEY::ENTER ); break;
		case ESC:  key = KeyEvent( KEY::ESCAPE ); break;
		case DEL:  key = KeyEvent( KEY::BACKSPACE ); break;
		case 0:    key = KeyEvent::control( '2' ); break;
		default: {
			if ( ( char_ >= 1 ) && ( char_ <= 26 ) ) {
				key = KeyEvent::control( static_cast<char16_t>( 'A' + char_ - 1 ) );
			} else if ( ( char_ >= 28 ) && ( char_ <= 31 ) ) {
				key = KeyEvent::control( static_cast<char16_t>( '4' + char_ - 28 ) );
			} else if ( is_ascii_upper( char_ ) ) {
				key = KeyEvent( KEY::CHARACTER, MODIFIER::SHIFT, char_ );
			} else {
				key = KeyEvent::character( char_ );
			}
		}
	}
	if ( alt_ && alt_applies( key ) ) {
		key.modifiers |= MODIFIER::ALT;
	}
	return ( key );
}

}
