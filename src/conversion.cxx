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


#include <memory>

#include "conversion.hxx"

using namespace llvm;

namespace simpleprompt {

ConversionResult copyString8to16( char16_t* dst, int dstSize, int& dstCount, char const* src, int srcSize ) {
	UTF8 const* sourceStart( reinterpret_cast<UTF8 const*>( src ) );
	UTF8 const* sourceEnd( sourceStart + srcSize );
	UTF16* targetStart( reinterpret_cast<UTF16*>( dst ) );
	UTF16* targetEnd( targetStart + dstSize );

	ConversionResult res( conversionOK );
	while ( sourceStart < sourceEnd ) {
		ConversionResult r( ConvertUTF8toUTF16( &sourceStart, sourceEnd, &targetStart, targetEnd, lenientConversion ) );
		if ( ( r == conversionOK ) || ( r == targetExhausted ) ) {
			if ( r == targetExhausted ) {
				res = r;
			}
			break;
		}
		/* malformed byte becomes U+FFFD, decoding resumes right after it */
		res = r;
		if ( targetStart == targetEnd ) {
			res = targetExhausted;
			break;
		}
		*targetStart = static_cast<UTF16>( UNI_REPLACEMENT_CHAR );
		++ targetStart;
		++ sourceStart;
	}

	dstCount = static_cast<int>( targetStart - reinterpret_cast<UTF16*>( dst ) );
	return ( res );
}

void copyString16to8( char* dst, int dstSize, char16_t const* src, int srcSize, int* dstCount ) {
	UTF16 const* sourceStart( reinterpret_cast<UTF16 const*>( src ) );
	UTF16 const* sourceEnd( sourceStart + srcSize );
	UTF8* targetStart( reinterpret_cast<UTF8*>( dst ) );
	UTF8* targetEnd( targetStart + dstSize );

	ConversionResult res = ConvertUTF16toUTF8(
		&sourceStart, sourceEnd, &targetStart, targetEnd, lenientConversion
	);

	int count( static_cast<int>( targetStart - reinterpret_cast<UTF8*>( dst ) ) );
	if ( ( res == conversionOK ) && ( count < dstSize ) ) {
		*targetStart = 0;
	}
	if ( dstCount ) {
		*dstCount = count;
	}
}

std::string code_point_to_utf8( char32_t codePoint_ ) {
	char buf[UNI_MAX_UTF8_BYTES_PER_CODE_POINT + 1];
	char* out( buf );
	if ( ! ConvertCodePointToUTF8( static_cast<unsigned>( codePoint_ ), out ) ) {
		return ( std::string() );
	}
	return ( std::string( buf, static_cast<size_t>( out - buf ) ) );
}

/*
 * Length of the longest prefix of given UTF-8 data
 * that does not end in the middle of a multi-byte sequence.
 */
int utf8_complete_length( char const* data_, int size_ ) {
	int lead( size_ - 1 );
	int const limit( size_ - UNI_MAX_UTF8_BYTES_PER_CODE_POINT );
	while ( ( lead >= 0 ) && ( lead > limit ) ) {
		UTF8 c( static_cast<UTF8>( data_[lead] ) );
		if ( ( c & 0xC0 ) != 0x80 ) {
			break;
		}
		-- lead;
	}
	if ( ( lead < 0 ) || ( lead <= limit ) ) {
		return ( size_ );
	}
	UTF8 c( static_cast<UTF8>( data_[lead] ) );
	if ( c < 0x80 ) {
		return ( size_ );
	}
	if ( ( c < 0xC2 ) || ( c > 0xF4 ) ) {
		/* no valid sequence starts here, nothing to wait for */
		return ( size_ );
	}
	int needed( static_cast<int>( getNumBytesForUTF8( c ) ) );
	return ( ( lead + needed ) > size_ ? lead : size_ );
}

}

