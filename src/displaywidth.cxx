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


#include "util.hxx"

namespace simpleprompt {

namespace {

struct interval {
	char32_t first;
	char32_t last;
};

/* auxiliary function for binary search in interval table */
bool bisearch( char32_t ucs, interval const* table, int max ) {
	int min( 0 );
	if ( ( ucs < table[0].first ) || ( ucs > table[max].last ) ) {
		return ( false );
	}
	while ( max >= min ) {
		int mid( ( min + max ) / 2 );
		if ( ucs > table[mid].last ) {
			min = mid + 1;
		} else if ( ucs < table[mid].first ) {
			max = mid - 1;
		} else {
			return ( true );
		}
	}
	return ( false );
}

/*
 * Non-spacing, enclosing and spacing combining marks (Mn, Me, Mc).
 * Sorted, non-overlapping.
 */
interval const combining[] = {
	{ 0x0300, 0x036F }, { 0x0483, 0x0489 }, { 0x0591, 0x05BD },
	{ 0x05BF, 0x05BF }, { 0x05C1, 0x05C2 }, { 0x05C4, 0x05C5 },
	{ 0x05C7, 0x05C7 }, { 0x0610, 0x061A }, { 0x064B, 0x065F },
	{ 0x0670, 0x0670 }, { 0x06D6, 0x06DC }, { 0x06DF, 0x06E4 },
	{ 0x06E7, 0x06E8 }, { 0x06EA, 0x06ED }, { 0x0711, 0x0711 },
	{ 0x0730, 0x074A }, { 0x07A6, 0x07B0 }, { 0x07EB, 0x07F3 },
	{ 0x07FD, 0x07FD }, { 0x0816, 0x0819 }, { 0x081B, 0x0823 },
	{ 0x0825, 0x0827 }, { 0x0829, 0x082D }, { 0x0859, 0x085B },
	{ 0x0898, 0x089F }, { 0x08CA, 0x08E1 }, { 0x08E3, 0x0903 },
	{ 0x093A, 0x093C }, { 0x093E, 0x094F }, { 0x0951, 0x0957 },
	{ 0x0962, 0x0963 }, { 0x0981, 0x0983 }, { 0x09BC, 0x09BC },
	{ 0x09BE, 0x09C4 }, { 0x09C7, 0x09C8 }, { 0x09CB, 0x09CD },
	{ 0x09D7, 0x09D7 }, { 0x09E2, 0x09E3 }, { 0x09FE, 0x09FE },
	{ 0x0A01, 0x0A03 }, { 0x0A3C, 0x0A3C }, { 0x0A3E, 0x0A42 },
	{ 0x0A47, 0x0A48 }, { 0x0A4B, 0x0A4D }, { 0x0A51, 0x0A51 },
	{ 0x0A70, 0x0A71 }, { 0x0A75, 0x0A75 }, { 0x0A81, 0x0A83 },
	{ 0x0ABC, 0x0ABC }, { 0x0ABE, 0x0AC5 }, { 0x0AC7, 0x0AC9 },
	{ 0x0ACB, 0x0ACD }, { 0x0AE2, 0x0AE3 }, { 0x0AFA, 0x0AFF },
	{ 0x0B01, 0x0B03 }, { 0x0B3C, 0x0B3C }, { 0x0B3E, 0x0B44 },
	{ 0x0B47, 0x0B48 }, { 0x0B4B, 0x0B4D }, { 0x0B55, 0x0B57 },
	{ 0x0B62, 0x0B63 }, { 0x0B82, 0x0B82 }, { 0x0BBE, 0x0BC2 },
	{ 0x0BC6, 0x0BC8 }, { 0x0BCA, 0x0BCD }, { 0x0BD7, 0x0BD7 },
	{ 0x0C00, 0x0C04 }, { 0x0C3C, 0x0C3C }, { 0x0C3E, 0x0C44 },
	{ 0x0C46, 0x0C48 }, { 0x0C4A, 0x0C4D }, { 0x0C55, 0x0C56 },
	{ 0x0C62, 0x0C63 }, { 0x0C81, 0x0C83 }, { 0x0CBC, 0x0CBC },
	{ 0x0CBE, 0x0CC4 }, { 0x0CC6, 0x0CC8 }, { 0x0CCA, 0x0CCD },
	{ 0x0CD5, 0x0CD6 }, { 0x0CE2, 0x0CE3 }, { 0x0D00, 0x0D03 },
	{ 0x0D3B, 0x0D3C }, { 0x0D3E, 0x0D44 }, { 0x0D46, 0x0D48 },
	{ 0x0D4A, 0x0D4D }, { 0x0D57, 0x0D57 }, { 0x0D62, 0x0D63 },
	{ 0x0D81, 0x0D83 }, { 0x0DCA, 0x0DCA }, { 0x0DCF, 0x0DD4 },
	{ 0x0DD6, 0x0DD6 }, { 0x0DD8, 0x0DDF }, { 0x0DF2, 0x0DF3 },
	{ 0x0E31, 0x0E31 }, { 0x0E34, 0x0E3A }, { 0x0E47, 0x0E4E },
	{ 0x0EB1, 0x0EB1 }, { 0x0EB4, 0x0EBC }, { 0x0EC8, 0x0ECD },
	{ 0x0F18, 0x0F19 }, { 0x0F35, 0x0F35 }, { 0x0F37, 0x0F37 },
	{ 0x0F39, 0x0F39 }, { 0x0F3E, 0x0F3F }, { 0x0F71, 0x0F84 },
	{ 0x0F86, 0x0F87 }, { 0x0F8D, 0x0F97 }, { 0x0F99, 0x0FBC },
	{ 0x0FC6, 0x0FC6 }, { 0x102B, 0x103E }, { 0x1056, 0x1059 },
	{ 0x105E, 0x1060 }, { 0x1062, 0x1064 }, { 0x1067, 0x106D },
	{ 0x1071, 0x1074 }, { 0x1082, 0x108D }, { 0x108F, 0x108F },
	{ 0x109A, 0x109D }, { 0x135D, 0x135F }, { 0x1712, 0x1715 },
	{ 0x1732, 0x1734 }, { 0x1752, 0x1753 }, { 0x1772, 0x1773 },
	{ 0x17B4, 0x17D3 }, { 0x17DD, 0x17DD }, { 0x180B, 0x180D },
	{ 0x180F, 0x180F }, { 0x1885, 0x1886 }, { 0x18A9, 0x18A9 },
	{ 0x1920, 0x192B }, { 0x1930, 0x193B }, { 0x1A17, 0x1A1B },
	{ 0x1A55, 0x1A5E }, { 0x1A60, 0x1A7C }, { 0x1A7F, 0x1A7F },
	{ 0x1AB0, 0x1ACE }, { 0x1B00, 0x1B04 }, { 0x1B34, 0x1B44 },
	{ 0x1B6B, 0x1B73 }, { 0x1B80, 0x1B82 }, { 0x1BA1, 0x1BAD },
	{ 0x1BE6, 0x1BF3 }, { 0x1C24, 0x1C37 }, { 0x1CD0, 0x1CD2 },
	{ 0x1CD4, 0x1CE8 }, { 0x1CED, 0x1CED }, { 0x1CF4, 0x1CF4 },
	{ 0x1CF7, 0x1CF9 }, { 0x1DC0, 0x1DFF }, { 0x20D0, 0x20F0 },
	{ 0x2CEF, 0x2CF1 }, { 0x2D7F, 0x2D7F }, { 0x2DE0, 0x2DFF },
	{ 0x302A, 0x302F }, { 0x3099, 0x309A }, { 0xA66F, 0xA672 },
	{ 0xA674, 0xA67D }, { 0xA69E, 0xA69F }, { 0xA6F0, 0xA6F1 },
	{ 0xA802, 0xA802 }, { 0xA806, 0xA806 }, { 0xA80B, 0xA80B },
	{ 0xA823, 0xA827 }, { 0xA82C, 0xA82C }, { 0xA880, 0xA881 },
	{ 0xA8B4, 0xA8C5 }, { 0xA8E0, 0xA8F1 }, { 0xA8FF, 0xA8FF },
	{ 0xA926, 0xA92D }, { 0xA947, 0xA953 }, { 0xA980, 0xA983 },
	{ 0xA9B3, 0xA9C0 }, { 0xA9E5, 0xA9E5 }, { 0xAA29, 0xAA36 },
	{ 0xAA43, 0xAA43 }, { 0xAA4C, 0xAA4D }, { 0xAA7B, 0xAA7D },
	{ 0xAAB0, 0xAAB0 }, { 0xAAB2, 0xAAB4 }, { 0xAAB7, 0xAAB8 },
	{ 0xAABE, 0xAABF }, { 0xAAC1, 0xAAC1 }, { 0xAAEB, 0xAAEF },
	{ 0xAAF5, 0xAAF6 }, { 0xABE3, 0xABEA }, { 0xABEC, 0xABED },
	{ 0xFB1E, 0xFB1E }, { 0xFE00, 0xFE0F }, { 0xFE20, 0xFE2F },
	{ 0x101FD, 0x101FD }, { 0x102E0, 0x102E0 }, { 0x10376, 0x1037A },
	{ 0x10A01, 0x10A03 }, { 0x10A05, 0x10A06 }, { 0x10A0C, 0x10A0F },
	{ 0x10A38, 0x10A3A }, { 0x10A3F, 0x10A3F }, { 0x10AE5, 0x10AE6 },
	{ 0x10D24, 0x10D27 }, { 0x10EAB, 0x10EAC }, { 0x10F46, 0x10F50 },
	{ 0x11000, 0x11002 }, { 0x11038, 0x11046 }, { 0x1107F, 0x11082 },
	{ 0x110B0, 0x110BA }, { 0x11100, 0x11102 }, { 0x11127, 0x11134 },
	{ 0x11145, 0x11146 }, { 0x11173, 0x11173 }, { 0x11180, 0x11182 },
	{ 0x111B3, 0x111C0 }, { 0x1122C, 0x11237 }, { 0x112DF, 0x112EA },
	{ 0x11300, 0x11303 }, { 0x1133B, 0x1133C }, { 0x1133E, 0x1134D },
	{ 0x11357, 0x11357 }, { 0x11362, 0x11374 }, { 0x11435, 0x11446 },
	{ 0x114B0, 0x114C3 }, { 0x115AF, 0x115C0 }, { 0x11630, 0x11640 },
	{ 0x116AB, 0x116B7 }, { 0x1171D, 0x1172B }, { 0x16AF0, 0x16AF4 },
	{ 0x16B30, 0x16B36 }, { 0x16F4F, 0x16F4F }, { 0x16F51, 0x16F92 },
	{ 0x1BC9D, 0x1BC9E }, { 0x1D165, 0x1D169 }, { 0x1D16D, 0x1D172 },
	{ 0x1D17B, 0x1D182 }, { 0x1D185, 0x1D18B }, { 0x1D1AA, 0x1D1AD },
	{ 0x1D242, 0x1D244 }, { 0x1E000, 0x1E02A }, { 0x1E130, 0x1E136 },
	{ 0x1E2EC, 0x1E2EF }, { 0x1E8D0, 0x1E8D6 }, { 0x1E944, 0x1E94A },
	{ 0xE0100, 0xE01EF }
};

/*
 * Double width blocks: CJK ideographs, kana, Hangul, fullwidth forms,
 * East Asian symbols and common emoji.
 * Sorted, overlaps merged.
 */
interval const wide[] = {
	{ 0x1100, 0x11FF },   /* Hangul Jamo */
	{ 0x2600, 0x27BF },   /* Miscellaneous Symbols, Dingbats */
	{ 0x2E80, 0x2FDF },   /* CJK Radicals, Kangxi Radicals */
	{ 0x2FF0, 0x303F },   /* Ideographic Description, CJK Symbols and Punctuation */
	{ 0x3040, 0x30FF },   /* Hiragana, Katakana */
	{ 0x3130, 0x318F },   /* Hangul Compatibility Jamo */
	{ 0x3200, 0x33FF },   /* Enclosed CJK Letters, CJK Compatibility */
	{ 0x3400, 0x4DBF },   /* CJK Extension A */
	{ 0x4E00, 0x9FFF },   /* CJK Unified Ideographs */
	{ 0xA960, 0xA97F },   /* Hangul Jamo Extended-A */
	{ 0xAC00, 0xD7AF },   /* Hangul Syllables */
	{ 0xD7B0, 0xD7FF },   /* Hangul Jamo Extended-B */
	{ 0xF900, 0xFAFF },   /* CJK Compatibility Ideographs */
	{ 0xFE30, 0xFE4F },   /* CJK Compatibility Forms */
	{ 0xFF01, 0xFF60 },   /* Fullwidth Forms */
	{ 0xFFE0, 0xFFE6 },   /* Fullwidth Signs */
	{ 0x1F300, 0x1F9FF }, /* Pictographs, Emoticons, Transport, Supplemental Symbols */
	{ 0x20000, 0x2A6DF }, /* CJK Extension B */
	{ 0x2A700, 0x2EBEF }  /* CJK Extensions C .. F */
};

}

/*
 * Number of terminal columns occupied by given code point.
 * Total function, unknown code points take one column.
 */
int display_width( char32_t ucs ) {
	if ( is_control_code( ucs ) ) {
		return ( 0 );
	}
	if ( bisearch( ucs, combining, sizeof ( combining ) / sizeof ( interval ) - 1 ) ) {
		return ( 0 );
	}
	if ( bisearch( ucs, wide, sizeof ( wide ) / sizeof ( interval ) - 1 ) ) {
		return ( 2 );
	}
	return ( 1 );
}

}

