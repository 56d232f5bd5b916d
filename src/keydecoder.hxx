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


#ifndef SIMPLEPROMPT_KEYDECODER_HXX_INCLUDED
#define SIMPLEPROMPT_KEYDECODER_HXX_INCLUDED 1

#include <string>

#include "simpleprompt.hxx"
#include "unicodestring.hxx"

namespace simpleprompt {

/*
 * Turns raw terminal bytes into normalized key events.
 *
 * Bytes are buffered until they form complete UTF-8 sequences,
 * decoded units are kept until next() consumes them.
 */
class KeyDecoder {
public:
	typedef SimpleConsole::KeyEvent key_event_t;
private:
	std::string _pendingBytes;
	UnicodeString _units;
	int _consumed;
	char16_t _eraseChar;
	bool _rxvt;
public:
	KeyDecoder( void );
	void feed( char const* data_, int size_ );
	bool next( key_event_t& key_ );
	void clear( void );
	bool has_pending( void ) const {
		return ( _consumed < _units.length() );
	}
	void set_erase_char( char16_t eraseChar_ ) {
		_eraseChar = eraseChar_;
	}
	void set_rxvt( bool rxvt_ ) {
		_rxvt = rxvt_;
	}
private:
	bool parse_sequence( char16_t const* seq_, int size_, key_event_t& key_, int& length_ ) const;
	key_event_t parse_single( char16_t char_, bool alt_ ) const;
	KeyDecoder( KeyDecoder const& ) = delete;
	KeyDecoder& operator = ( KeyDecoder const& ) = delete;
};

}

#endif
