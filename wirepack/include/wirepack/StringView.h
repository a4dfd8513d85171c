#pragma once

#include "wirepack/Exports.h"
#include "wirepack/Span.h"
#include "wirepack/Assert.h"

#include <fmt/core.h>
#include <fmt/format.h>

#include <cstring>

namespace wirepack
{
	class StringView
	{
		const char* m_begin = nullptr;
		size_t m_count = 0;

	public:
		StringView() = default;

		explicit StringView(const char* ptr)
			: m_begin(ptr),
			  m_count(::strlen(ptr))
		{}

		StringView(const char* begin, size_t count)
			: m_begin(begin),
			  m_count(count)
		{}

		explicit StringView(Span<const std::byte> span)
			: m_begin((const char*)span.data()),
			  m_count(span.count())
		{}

		explicit operator Span<const std::byte>() const
		{
			return Span<const std::byte>{(const std::byte*)m_begin, m_count};
		}

		const char& operator[](size_t i) const
		{
			validate(i < m_count);
			return m_begin[i];
		}

		size_t count() const { return m_count; }
		const char* data() const { return m_begin; }
		const char* begin() const { return m_begin; }
		const char* end() const { return m_begin + m_count; }

		WIREPACK_EXPORT static int cmp(StringView a, StringView b);

		bool operator==(StringView other) const
		{
			if (m_begin == other.m_begin && m_count == other.m_count)
				return true;
			return cmp(*this, other) == 0;
		}
		bool operator!=(StringView other) const { return !operator==(other); }
		bool operator<(StringView other) const { return cmp(*this, other) < 0; }

		StringView slice(size_t start, size_t end) const
		{
			validate(start <= end && end <= m_count);
			return StringView{m_begin + start, end - start};
		}

		bool startsWith(StringView str) const
		{
			if (str.m_count > m_count)
				return false;
			return slice(0, str.m_count) == str;
		}

		// true when every byte is in the 7-bit ascii range
		WIREPACK_EXPORT bool isAscii() const;
	};
}

inline static wirepack::StringView operator""_sv(const char* ptr, size_t len)
{
	return wirepack::StringView(ptr, len);
}

namespace fmt
{
	template<>
	struct formatter<wirepack::StringView>
	{
		template<typename ParseContext>
		constexpr auto parse(ParseContext& ctx)
		{
			return ctx.begin();
		}

		template<typename FormatContext>
		auto format(const wirepack::StringView& str, FormatContext& ctx) const
		{
			return format_to(ctx.out(), "{}", fmt::string_view{str.data(), str.count()});
		}
	};
}
