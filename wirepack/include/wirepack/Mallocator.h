#pragma once

#include "wirepack/Exports.h"
#include "wirepack/Allocator.h"

namespace wirepack
{
	class Mallocator: public Allocator
	{
	public:
		WIREPACK_EXPORT Span<std::byte> alloc(size_t size, size_t alignment) override;
		WIREPACK_EXPORT void commit(Span<std::byte> bytes) override;
		WIREPACK_EXPORT void release(Span<std::byte> bytes) override;
		WIREPACK_EXPORT void free(Span<std::byte> bytes) override;
	};
}
