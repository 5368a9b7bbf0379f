#include "rdfc_utf8.h"
#include "rdfc_assert.h"


namespace rdfc
{


bool is_scalar_value(char32_t cp)
{
	return cp <= 0x10FFFF && (cp < 0xD800 || cp > 0xDFFF);
}


void append_utf8(std::string& out, char32_t cp)
{
	RDFC_CHECK_PRECOND(is_scalar_value(cp));

	if (cp < 0x80)
	{
		out += static_cast<char>(cp);
	}
	else if (cp < 0x800)
	{
		out += static_cast<char>(0xC0 | (cp >> 6));
		out += static_cast<char>(0x80 | (cp & 0x3F));
	}
	else if (cp < 0x10000)
	{
		out += static_cast<char>(0xE0 | (cp >> 12));
		out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
		out += static_cast<char>(0x80 | (cp & 0x3F));
	}
	else
	{
		out += static_cast<char>(0xF0 | (cp >> 18));
		out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
		out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
		out += static_cast<char>(0x80 | (cp & 0x3F));
	}
}


bool decode_utf8(std::string_view s, size_t pos, char32_t& out_cp, size_t& out_len)
{
	RDFC_CHECK_PRECOND(pos < s.size());

	const unsigned char lead = static_cast<unsigned char>(s[pos]);

	// the length of the sequence, and the smallest code point
	// which may be encoded with that length (to reject overlong forms)
	size_t len;
	char32_t cp, min_cp;
	if (lead < 0x80)
	{
		out_cp = lead;
		out_len = 1;
		return true;
	}
	else if ((lead & 0xE0) == 0xC0)
	{
		len = 2;
		cp = lead & 0x1F;
		min_cp = 0x80;
	}
	else if ((lead & 0xF0) == 0xE0)
	{
		len = 3;
		cp = lead & 0x0F;
		min_cp = 0x800;
	}
	else if ((lead & 0xF8) == 0xF0)
	{
		len = 4;
		cp = lead & 0x07;
		min_cp = 0x10000;
	}
	else
		return false;  // continuation byte or 0xF8..0xFF

	if (pos + len > s.size())
		return false;

	for (size_t i = 1; i < len; ++i)
	{
		const unsigned char c = static_cast<unsigned char>(s[pos + i]);
		if ((c & 0xC0) != 0x80)
			return false;
		cp = (cp << 6) | (c & 0x3F);
	}

	if (cp < min_cp || !is_scalar_value(cp))
		return false;

	out_cp = cp;
	out_len = len;
	return true;
}


}  // namespace rdfc
