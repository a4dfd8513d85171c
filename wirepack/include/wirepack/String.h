#pragma once

#include "wirepack/Exports.h"
#include "wirepack/Allocator.h"
#include "wirepack/StringView.h"

#include <fmt/core.h>
#include <fmt/format.h>

#include <iterator>
#include <utility>

namespace wirepack
{
	// owning utf-8 string, always followed by a null terminator in memory
	class String
	{
		Allocator* m_allocator = nullptr;
		Span<char> m_memory;
		size_t m_count = 0;

		WIREPACK_EXPORT void destroy();
		WIREPACK_EXPORT void copyFrom(const String& other);
		WIREPACK_EXPORT void moveFrom(String& other);
		void grow(size_t new_capacity);
		WIREPACK_EXPORT void ensureSpaceExists(size_t count);

	public:
		explicit String(Allocator* allocator)
			: m_allocator(allocator)
		{}

		WIREPACK_EXPORT String(StringView str, Allocator* allocator);

		String(const String& other)
		{
			copyFrom(other);
		}

		String(String&& other) noexcept
		{
			moveFrom(other);
		}

		String& operator=(const String& other)
		{
			if (this == &other)
				return *this;
			destroy();
			copyFrom(other);
			return *this;
		}

		String& operator=(String&& other) noexcept
		{
			destroy();
			moveFrom(other);
			return *this;
		}

		~String()
		{
			destroy();
		}

		const char& operator[](size_t i) const
		{
			validate(i < m_count);
			return m_memory[i];
		}

		operator StringView() const { return StringView{m_memory.data(), m_count}; }

		size_t count() const { return m_count; }
		size_t capacity() const { return m_memory.count(); }
		char* data() { return m_memory.data(); }
		const char* data() const { return m_memory.data(); }
		Allocator* allocator() const { return m_allocator; }

		WIREPACK_EXPORT void resize(size_t new_count);
		void reserve(size_t extra_count) { ensureSpaceExists(extra_count + 1); }

		WIREPACK_EXPORT void push(StringView str);
		WIREPACK_EXPORT void pushByte(char v);

		bool operator==(StringView other) const { return StringView{*this} == other; }
		bool operator!=(StringView other) const { return StringView{*this} != other; }
		bool operator==(const String& other) const { return StringView{*this} == StringView{other}; }
		bool operator!=(const String& other) const { return StringView{*this} != StringView{other}; }
		bool operator<(const String& other) const { return StringView{*this} < StringView{other}; }
	};

	class StringBackInserter
	{
		String* m_str = nullptr;
	public:
		using iterator_category = std::output_iterator_tag;
		using value_type = char;
		using difference_type = ptrdiff_t;
		using pointer = char*;
		using reference = char&;

		explicit StringBackInserter(String* str)
			: m_str(str)
		{}

		StringBackInserter& operator=(char v)
		{
			m_str->pushByte(v);
			return *this;
		}

		StringBackInserter& operator*() { return *this; }
		StringBackInserter& operator++() { return *this; }
		StringBackInserter& operator++(int) { return *this; }
	};

	template<typename ... Args>
	[[nodiscard]] inline String strf(Allocator* allocator, StringView format, Args&& ... args)
	{
		String out{allocator};
		StringBackInserter it{&out};
		fmt::format_to(it, fmt::runtime(fmt::string_view{format.data(), format.count()}), std::forward<Args>(args)...);
		return out;
	}
}

namespace fmt
{
	template<>
	struct formatter<wirepack::String>
	{
		template<typename ParseContext>
		constexpr auto parse(ParseContext& ctx)
		{
			return ctx.begin();
		}

		template<typename FormatContext>
		auto format(const wirepack::String& str, FormatContext& ctx) const
		{
			return format_to(ctx.out(), "{}", fmt::string_view{str.data(), str.count()});
		}
	};
}
