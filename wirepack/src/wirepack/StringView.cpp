#include "wirepack/StringView.h"

#include <cstring>

namespace wirepack
{
	int StringView::cmp(StringView a, StringView b)
	{
		auto count = a.m_count < b.m_count ? a.m_count : b.m_count;
		if (count > 0)
		{
			auto res = ::memcmp(a.m_begin, b.m_begin, count);
			if (res != 0)
				return res;
		}

		if (a.m_count < b.m_count)
			return -1;
		else if (a.m_count > b.m_count)
			return 1;
		return 0;
	}

	bool StringView::isAscii() const
	{
		for (size_t i = 0; i < m_count; ++i)
			if ((unsigned char)m_begin[i] >= 0x80)
				return false;
		return true;
	}
}
