#include "wirepack/Rune.h"

#include <utf8proc.h>

#include <cstring>

namespace wirepack
{
	bool Rune::isValid() const
	{
		return utf8proc_codepoint_valid(m_value);
	}

	size_t Rune::size() const
	{
		char bytes[4] = {};
		return encode(*this, bytes);
	}

	size_t Rune::decode(const char* ptr, size_t count, Rune& rune)
	{
		validate(count > 0);

		auto c = (unsigned char)*ptr;
		if (c < 0x80)
		{
			rune = Rune{c};
			return 1;
		}

		utf8proc_int32_t value = -1;
		auto res = utf8proc_iterate((const utf8proc_uint8_t*)ptr, (utf8proc_ssize_t)count, &value);
		if (res <= 0 || value < 0)
		{
			rune = Rune{REPLACEMENT};
			return 1;
		}

		rune = Rune{value};
		return (size_t)res;
	}

	size_t Rune::encode(Rune rune, char* ptr)
	{
		return (size_t)utf8proc_encode_char(rune, (utf8proc_uint8_t*)ptr);
	}

	bool Rune::isValidUtf8(StringView str)
	{
		auto it = str.data();
		auto end = str.end();
		while (it < end)
		{
			if ((unsigned char)*it < 0x80)
			{
				++it;
				continue;
			}

			utf8proc_int32_t value = -1;
			auto res = utf8proc_iterate((const utf8proc_uint8_t*)it, end - it, &value);
			if (res <= 0 || value < 0)
				return false;
			it += res;
		}
		return true;
	}

	size_t Rune::sanitizedCount(StringView str)
	{
		size_t result = 0;
		auto it = str.data();
		auto end = str.end();
		while (it < end)
		{
			if ((unsigned char)*it < 0x80)
			{
				++result;
				++it;
				continue;
			}

			Rune rune;
			auto consumed = decode(it, end - it, rune);
			result += consumed == 1 ? MAX_SANITIZED_EXPANSION : consumed;
			it += consumed;
		}
		return result;
	}

	size_t Rune::sanitize(StringView str, char* out)
	{
		auto begin = out;
		auto it = str.data();
		auto end = str.end();
		while (it < end)
		{
			if ((unsigned char)*it < 0x80)
			{
				*out++ = *it++;
				continue;
			}

			Rune rune;
			auto consumed = decode(it, end - it, rune);
			if (consumed == 1)
			{
				out += encode(rune, out);
			}
			else
			{
				::memcpy(out, it, consumed);
				out += consumed;
			}
			it += consumed;
		}
		return size_t(out - begin);
	}
}
