#include "wirepack/String.h"

#include <cstring>

namespace wirepack
{
	void String::destroy()
	{
		if (m_allocator == nullptr || m_memory.empty())
			return;

		m_allocator->releaseT(m_memory);
		m_allocator->freeT(m_memory);
		m_memory = Span<char>{};
		m_count = 0;
	}

	void String::copyFrom(const String& other)
	{
		m_allocator = other.m_allocator;
		m_count = other.m_count;
		m_memory = Span<char>{};

		if (other.m_memory.empty())
			return;

		m_memory = m_allocator->allocT<char>(m_count + 1);
		m_allocator->commitT(m_memory);

		::memcpy(m_memory.data(), other.m_memory.data(), m_count);
		m_memory[m_count] = '\0';
	}

	void String::moveFrom(String& other)
	{
		m_allocator = other.m_allocator;
		m_memory = other.m_memory;
		m_count = other.m_count;

		other.m_memory = Span<char>{};
		other.m_count = 0;
	}

	void String::grow(size_t new_capacity)
	{
		auto new_memory = m_allocator->allocT<char>(new_capacity);
		m_allocator->commitT(new_memory);

		if (m_count > 0)
			::memcpy(new_memory.data(), m_memory.data(), m_count);

		if (m_memory.empty() == false)
		{
			m_allocator->releaseT(m_memory);
			m_allocator->freeT(m_memory);
		}

		m_memory = new_memory;
	}

	void String::ensureSpaceExists(size_t count)
	{
		if (m_count + count > m_memory.count())
		{
			auto new_capacity = m_memory.count() * 2;
			if (new_capacity == 0)
				new_capacity = 8;

			if (new_capacity < m_count + count)
				new_capacity = m_count + count;

			grow(new_capacity);
		}
	}

	String::String(StringView str, Allocator* allocator)
		: m_allocator(allocator)
	{
		if (str.count() != 0)
		{
			m_count = str.count();

			m_memory = m_allocator->allocT<char>(m_count + 1);
			m_allocator->commitT(m_memory);

			::memcpy(m_memory.data(), str.data(), m_count);
			m_memory[m_count] = '\0';
		}
	}

	void String::resize(size_t new_count)
	{
		// +1 for the null terminator
		if (new_count + 1 > m_memory.count())
			grow(new_count + 1);

		m_count = new_count;
		m_memory[m_count] = '\0';
	}

	void String::push(StringView str)
	{
		if (str.count() == 0)
			return;

		ensureSpaceExists(str.count() + 1);
		::memcpy(m_memory.data() + m_count, str.data(), str.count());
		m_count += str.count();
		m_memory[m_count] = '\0';
	}

	void String::pushByte(char v)
	{
		ensureSpaceExists(2);
		m_memory[m_count] = v;
		++m_count;
		m_memory[m_count] = '\0';
	}
}
