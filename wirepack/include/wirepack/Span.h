#pragma once

#include "wirepack/Assert.h"

#include <cstddef>

namespace wirepack
{
	template<typename T>
	class Span
	{
		T* m_ptr = nullptr;
		size_t m_count = 0;
	public:
		Span() = default;
		Span(T* ptr, size_t count)
			: m_ptr(ptr),
			  m_count(count)
		{}

		operator Span<const T>() const { return Span<const T>{m_ptr, m_count}; }

		T* begin() const { return m_ptr; }
		T* end() const { return m_ptr + m_count; }

		T& operator[](size_t index) const
		{
			validate(index < m_count);
			return m_ptr[index];
		}

		T* data() const { return m_ptr; }
		size_t count() const { return m_count; }
		size_t sizeInBytes() const { return m_count * sizeof(T); }
		bool empty() const { return m_ptr == nullptr || m_count == 0; }

		Span slice(size_t start, size_t end) const
		{
			validate(start <= end && end <= m_count);
			return Span{m_ptr + start, end - start};
		}

		Span sliceLeft(size_t end) const { return slice(0, end); }
		Span sliceRight(size_t start) const { return slice(start, m_count); }

		Span<const std::byte> asBytes() const
		{
			return Span<const std::byte>{(const std::byte*)m_ptr, sizeInBytes()};
		}
	};

	template<typename T>
	inline Span<std::byte> asWritableBytes(Span<T> span)
	{
		return Span<std::byte>{(std::byte*)span.data(), span.sizeInBytes()};
	}
}
