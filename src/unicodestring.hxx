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


#ifndef SIMPLEPROMPT_UNICODESTRING_HXX_INCLUDED
#define SIMPLEPROMPT_UNICODESTRING_HXX_INCLUDED

#include <vector>
#include <string>
#include <algorithm>

#include "conversion.hxx"

namespace simpleprompt {

/*
 * UTF-16 code unit buffer.
 */
class UnicodeString {
private:
	typedef std::vector<char16_t> data_buffer_t;
	data_buffer_t _data;
public:
	UnicodeString()
		: _data() {
	}

	explicit UnicodeString( std::string const& src )
		: _data() {
		assign( src );
	}

	explicit UnicodeString( char16_t const* src, int len )
		: _data( src, src + len ) {
	}

	UnicodeString( UnicodeString const& ) = default;
	UnicodeString& operator = ( UnicodeString const& ) = default;

	UnicodeString& assign( std::string const& src ) {
		_data.resize( src.length() + 1 );
		int len( 0 );
		copyString8to16( _data.data(), static_cast<int>( _data.size() ), len, src.data(), static_cast<int>( src.length() ) );
		_data.resize( len );
		return *this;
	}

	UnicodeString& assign( char16_t const* src, int len ) {
		_data.assign( src, src + len );
		return *this;
	}

	UnicodeString& append( UnicodeString const& other ) {
		_data.insert( _data.end(), other._data.begin(), other._data.end() );
		return *this;
	}

	UnicodeString& append( char16_t const* src, int len ) {
		_data.insert( _data.end(), src, src + len );
		return *this;
	}

	UnicodeString& push_back( char16_t c ) {
		_data.push_back( c );
		return *this;
	}

	UnicodeString& insert( int pos, char16_t const* src, int len ) {
		_data.insert( _data.begin() + pos, src, src + len );
		return *this;
	}

	UnicodeString& erase( int pos, int len ) {
		_data.erase( _data.begin() + pos, _data.begin() + pos + len );
		return *this;
	}

	void resize( int len ) {
		_data.resize( len );
	}

	void clear( void ) {
		_data.clear();
	}

	bool ends_with( UnicodeString const& suffix ) const {
		int len( suffix.length() );
		if ( ( len == 0 ) || ( len > length() ) ) {
			return ( false );
		}
		return ( std::equal( suffix._data.begin(), suffix._data.end(), _data.end() - len ) );
	}

	int count( UnicodeString const& needle ) const {
		int len( needle.length() );
		if ( len == 0 ) {
			return ( 0 );
		}
		int found( 0 );
		data_buffer_t::const_iterator it( _data.begin() );
		while ( true ) {
			it = std::search( it, _data.end(), needle._data.begin(), needle._data.end() );
			if ( it == _data.end() ) {
				break;
			}
			++ found;
			it += len;
		}
		return ( found );
	}

	std::string to_utf8( void ) const {
		std::string utf8;
		if ( _data.empty() ) {
			return ( utf8 );
		}
		utf8.resize( _data.size() * 3 + 1 );
		int count( 0 );
		copyString16to8( &utf8[0], static_cast<int>( utf8.size() ), _data.data(), length(), &count );
		utf8.resize( count );
		return ( utf8 );
	}

	char16_t const* get() const {
		return _data.data();
	}

	char16_t* get() {
		return _data.data();
	}

	int length() const {
		return static_cast<int>( _data.size() );
	}

	bool is_empty() const {
		return ( _data.empty() );
	}

	bool operator == ( UnicodeString const& other ) const {
		return ( _data == other._data );
	}

	const char16_t& operator[]( size_t pos ) const {
		return _data[pos];
	}

	char16_t& operator[]( size_t pos ) {
		return _data[pos];
	}
};

}

#endif

