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


#ifndef SIMPLEPROMPT_LOCATION_HXX_INCLUDED
#define SIMPLEPROMPT_LOCATION_HXX_INCLUDED 1

namespace simpleprompt {

class Session;
class Line;

/*
 * Caret inside the edit region: line, row within the line,
 * buffer position and column within the row.
 */
class Location {
	Session* _session;
	int _lineIndex;
	int _rowIndex;
	int _arrayPosition;
	int _cursorPosition;
public:
	Location( void );
	void attach( Session* session_ );
	void reset( void );
	void reset( Line const& line_, bool end_ );
	void locate( void );
	void set_array_position( int pos_ );
	bool move_left( void );
	bool move_right( void );
	void move_first( void );
	void move_last( void );
	bool move_vertical( bool up_ );
	void change_line( int offset_ );
	void set_cursor( void ) const;
	int line_index( void ) const {
		return ( _lineIndex );
	}
	int row_index( void ) const {
		return ( _rowIndex );
	}
	int array_position( void ) const {
		return ( _arrayPosition );
	}
	int cursor_position( void ) const {
		return ( _cursorPosition );
	}
private:
	Line& line( void ) const;
};

}

#endif
