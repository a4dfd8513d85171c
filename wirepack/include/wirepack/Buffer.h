#pragma once

#include "wirepack/Exports.h"
#include "wirepack/Assert.h"
#include "wirepack/Allocator.h"
#include "wirepack/StringView.h"
#include "wirepack/Span.h"

#include <cstddef>
#include <utility>

namespace wirepack
{
	class Buffer
	{
		Allocator* m_allocator = nullptr;
		Span<std::byte> m_memory;
		size_t m_count = 0;

		WIREPACK_EXPORT void destroy();
		WIREPACK_EXPORT void copyFrom(const Buffer& other);
		WIREPACK_EXPORT void moveFrom(Buffer& other);
		void grow(size_t new_capacity);
		WIREPACK_EXPORT void ensureSpaceExists(size_t count);

	public:
		explicit Buffer(Allocator* allocator)
			: m_allocator(allocator)
		{}

		WIREPACK_EXPORT Buffer(Span<const std::byte> bytes, Allocator* allocator);

		Buffer(const Buffer& other)
		{
			copyFrom(other);
		}

		Buffer(Buffer&& other) noexcept
		{
			moveFrom(other);
		}

		Buffer& operator=(const Buffer& other)
		{
			if (this == &other)
				return *this;
			destroy();
			copyFrom(other);
			return *this;
		}

		Buffer& operator=(Buffer&& other) noexcept
		{
			destroy();
			moveFrom(other);
			return *this;
		}

		~Buffer()
		{
			destroy();
		}

		std::byte& operator[](size_t i)
		{
			validate(i < m_count);
			return m_memory[i];
		}

		const std::byte& operator[](size_t i) const
		{
			validate(i < m_count);
			return m_memory[i];
		}

		operator Span<const std::byte>() const { return Span<const std::byte>{m_memory.data(), m_count}; }

		void push(std::byte b)
		{
			ensureSpaceExists(1);
			m_memory[m_count] = b;
			++m_count;
		}

		void push(uint8_t b)
		{
			push(std::byte{b});
		}

		void push(StringView v)
		{
			push((const std::byte*)v.data(), v.count());
		}

		void push(Span<const std::byte> v)
		{
			push(v.data(), v.count());
		}

		WIREPACK_EXPORT void push(const std::byte* ptr, size_t size);

		// grows the buffer by size bytes and returns the newly added region for the caller to fill
		WIREPACK_EXPORT Span<std::byte> extend(size_t size);

		WIREPACK_EXPORT void resize(size_t new_count);
		void reserve(size_t extra_count) { ensureSpaceExists(extra_count); }
		WIREPACK_EXPORT void clear();

		size_t count() const { return m_count; }
		size_t capacity() const { return m_memory.count(); }
		std::byte* data() { return m_memory.data(); }
		const std::byte* data() const { return m_memory.data(); }
		Allocator* allocator() const { return m_allocator; }

		WIREPACK_EXPORT bool operator==(const Buffer& other) const;
		bool operator!=(const Buffer& other) const { return !operator==(other); }
	};
}
