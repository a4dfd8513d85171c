#pragma once

#include "wirepack/Exports.h"
#include "wirepack/Allocator.h"
#include "wirepack/Span.h"

#include <cstddef>

namespace wirepack
{
	class Log;
}

namespace wirepack::msgpack
{
	// reusable byte region owned by a single encoder, its capacity only grows and its content is only valid until
	// the next reserve call
	class Scratch
	{
		Allocator* m_allocator = nullptr;
		Log* m_log = nullptr;
		Span<std::byte> m_memory;
		size_t m_allocMin = 0;

		void destroy();

	public:
		WIREPACK_EXPORT Scratch(size_t alloc_min, Allocator* allocator, Log* log = nullptr);

		Scratch(const Scratch&) = delete;
		Scratch& operator=(const Scratch&) = delete;

		WIREPACK_EXPORT Scratch(Scratch&& other) noexcept;
		WIREPACK_EXPORT Scratch& operator=(Scratch&& other) noexcept;

		~Scratch() { destroy(); }

		// returns a region of at least length bytes
		WIREPACK_EXPORT Span<std::byte> reserve(size_t length);

		size_t capacity() const { return m_memory.count(); }
		size_t allocMin() const { return m_allocMin; }

		// capacity the scratch grows to when asked for length bytes
		WIREPACK_EXPORT static size_t growthCapacity(size_t alloc_min, size_t length);
	};
}
