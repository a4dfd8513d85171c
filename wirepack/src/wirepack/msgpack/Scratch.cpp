#include "wirepack/msgpack/Scratch.h"
#include "wirepack/Log.h"

#include <tracy/Tracy.hpp>

namespace wirepack::msgpack
{
	void Scratch::destroy()
	{
		if (m_memory.empty())
			return;

		m_allocator->release(m_memory);
		m_allocator->free(m_memory);
		m_memory = Span<std::byte>{};
	}

	Scratch::Scratch(size_t alloc_min, Allocator* allocator, Log* log)
		: m_allocator(allocator),
		  m_log(log),
		  m_allocMin(alloc_min)
	{
		validate(m_allocator != nullptr);
	}

	Scratch::Scratch(Scratch&& other) noexcept
		: m_allocator(other.m_allocator),
		  m_log(other.m_log),
		  m_memory(other.m_memory),
		  m_allocMin(other.m_allocMin)
	{
		other.m_memory = Span<std::byte>{};
	}

	Scratch& Scratch::operator=(Scratch&& other) noexcept
	{
		if (this == &other)
			return *this;

		destroy();
		m_allocator = other.m_allocator;
		m_log = other.m_log;
		m_memory = other.m_memory;
		m_allocMin = other.m_allocMin;
		other.m_memory = Span<std::byte>{};
		return *this;
	}

	Span<std::byte> Scratch::reserve(size_t length)
	{
		if (length <= m_memory.count())
			return m_memory;

		ZoneScoped;

		auto new_capacity = growthCapacity(m_allocMin, length);
		if (m_log)
			m_log->debug("scratch grows from {} to {} bytes for a {} byte request"_sv, m_memory.count(), new_capacity, length);

		// old content is dead by contract so nothing is copied over
		destroy();
		m_memory = m_allocator->alloc(new_capacity, alignof(std::max_align_t));
		m_allocator->commit(m_memory);
		return m_memory;
	}

	size_t Scratch::growthCapacity(size_t alloc_min, size_t length)
	{
		size_t chunks = (length + 1023) / 1024;
		if (chunks < 2)
			chunks = 2;

		auto res = alloc_min * chunks;
		if (res < length)
			res = length;
		return res;
	}
}
