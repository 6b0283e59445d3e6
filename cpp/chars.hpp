#pragma once

// Character classes shared by the JSON reader and the address parser.

inline bool is_ws(char c)
{
	switch (c)
	{
		case ' ':
		case '\t':
		case '\n':
		case '\r':
			return true;
		default:
			return false;
	}
}

inline bool is_alpha(char ch)
{
	switch (ch)
	{
		case 'a'...'z': return true;
		case 'A'...'Z': return true;
		default: return false;
	}
}

inline bool is_digit(char ch)
{
	switch (ch)
	{
		case '0'...'9': return true;
		default: return false;
	}
}

inline bool is_hex(char ch)
{
	switch (ch)
	{
		case '0'...'9': return true;
		case 'a'...'f': return true;
		case 'A'...'F': return true;
		default: return false;
	}
}

inline bool is_ident_start(char ch)
{
	return is_alpha(ch) or ch == '_';
}

inline bool is_ident(char ch)
{
	return is_ident_start(ch) or is_digit(ch);
}
