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


#ifndef SIMPLEPROMPT_CONVERSION_HXX_INCLUDED
#define SIMPLEPROMPT_CONVERSION_HXX_INCLUDED 1

#include <string>

#include <llvm/Support/ConvertUTF.h>

namespace simpleprompt {

typedef unsigned char char8_t;

llvm::ConversionResult copyString8to16( char16_t* dst, int dstSize, int& dstCount, char const* src, int srcSize );
void copyString16to8( char* dst, int dstSize, char16_t const* src, int srcSize, int* dstCount = nullptr );
std::string code_point_to_utf8( char32_t );
int utf8_complete_length( char const*, int );

inline bool is_high_surrogate( char16_t c ) {
	return ( ( c >= 0xD800 ) && ( c <= 0xDBFF ) );
}

inline bool is_low_surrogate( char16_t c ) {
	return ( ( c >= 0xDC00 ) && ( c <= 0xDFFF ) );
}

inline char32_t combine_surrogates( char16_t high_, char16_t low_ ) {
	return ( 0x10000 + ( ( static_cast<char32_t>( high_ ) - 0xD800 ) << 10 ) + ( static_cast<char32_t>( low_ ) - 0xDC00 ) );
}

}

#endif

