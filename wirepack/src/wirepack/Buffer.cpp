#include "wirepack/Buffer.h"

#include <cstring>

namespace wirepack
{
	void Buffer::destroy()
	{
		if (m_allocator == nullptr || m_memory.empty())
			return;

		m_allocator->release(m_memory);
		m_allocator->free(m_memory);
		m_memory = Span<std::byte>{};
		m_count = 0;
	}

	void Buffer::copyFrom(const Buffer& other)
	{
		m_allocator = other.m_allocator;
		m_count = other.m_count;
		m_memory = Span<std::byte>{};

		if (m_count == 0)
			return;

		m_memory = m_allocator->alloc(m_count, alignof(std::byte));
		m_allocator->commit(m_memory);
		::memcpy(m_memory.data(), other.m_memory.data(), m_count);
	}

	void Buffer::moveFrom(Buffer& other)
	{
		m_allocator = other.m_allocator;
		m_memory = other.m_memory;
		m_count = other.m_count;

		other.m_memory = Span<std::byte>{};
		other.m_count = 0;
	}

	void Buffer::grow(size_t new_capacity)
	{
		auto new_memory = m_allocator->alloc(new_capacity, alignof(std::byte));
		m_allocator->commit(new_memory.sliceLeft(m_count));

		if (m_count > 0)
			::memcpy(new_memory.data(), m_memory.data(), m_count);

		if (m_memory.empty() == false)
		{
			m_allocator->release(m_memory);
			m_allocator->free(m_memory);
		}

		m_memory = new_memory;
	}

	void Buffer::ensureSpaceExists(size_t count)
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

	Buffer::Buffer(Span<const std::byte> bytes, Allocator* allocator)
		: m_allocator(allocator)
	{
		push(bytes);
	}

	void Buffer::push(const std::byte* ptr, size_t size)
	{
		if (size == 0)
			return;

		ensureSpaceExists(size);
		m_allocator->commit(m_memory.slice(m_count, m_count + size));
		::memcpy(m_memory.data() + m_count, ptr, size);
		m_count += size;
	}

	Span<std::byte> Buffer::extend(size_t size)
	{
		ensureSpaceExists(size);
		auto res = m_memory.slice(m_count, m_count + size);
		m_allocator->commit(res);
		m_count += size;
		return res;
	}

	void Buffer::resize(size_t new_count)
	{
		if (new_count > m_memory.count())
			grow(new_count);

		if (new_count > m_count)
			m_allocator->commit(m_memory.slice(m_count, new_count));
		else if (new_count < m_count)
			m_allocator->release(m_memory.slice(new_count, m_count));

		m_count = new_count;
	}

	void Buffer::clear()
	{
		if (m_memory.empty() == false)
			m_allocator->release(m_memory.sliceLeft(m_count));
		m_count = 0;
	}

	bool Buffer::operator==(const Buffer& other) const
	{
		if (m_count != other.m_count)
			return false;
		if (m_count == 0)
			return true;
		return ::memcmp(m_memory.data(), other.m_memory.data(), m_count) == 0;
	}
}
